// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"

namespace dropnet {
namespace app {

Application::Application(HarnessConfig config) : config_(std::move(config)) {}

Application::~Application() { ShutdownCluster(); }

harness::DriverOutcome Application::Run() {
  config_.drop.Validate();
  config_.driver.Validate();

  if (gate_) {
    throw std::logic_error("Application::Run called twice");
  }

  if (config_.shared_gate_name.empty()) {
    local_gate_ = std::make_unique<harness::LivenessGate>();
    gate_ = local_gate_.get();
  } else {
    shared_gate_ = harness::SharedLivenessGate::Create(config_.shared_gate_name);
    gate_ = &shared_gate_->gate();
  }

  LOG_INFO("{} starting: drop ratio {}, height target {}, timeout {}",
           GetUserAgent(), config_.drop.drop_ratio, config_.drop.height_target,
           util::FormatDurationMillis(config_.driver.timeout.count()));

  auto factory = harness::MakeDropHandlerFactory(*gate_, config_.drop);
  harness::Driver driver(*gate_, &fault_, config_.driver);

  harness::DriverOutcome outcome;
  try {
    outcome = driver.run([this, &factory]() {
      cluster_ = cluster::StartCluster(config_.cluster, factory, fault_);
    });
  } catch (const std::exception &e) {
    LOG_ERROR("harness failed in state {}: {}",
              harness::DriverStateName(driver.state()), e.what());
    ShutdownCluster();
    throw;
  }

  ShutdownCluster();
  return outcome;
}

void Application::ShutdownCluster() {
  if (cluster_) {
    cluster_->Shutdown();
  }
}

} // namespace app
} // namespace dropnet
