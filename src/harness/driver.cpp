// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "harness/driver.hpp"
#include "network/proxy.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <thread>

namespace dropnet {
namespace harness {

const char *DriverStateName(DriverState state) {
  switch (state) {
  case DriverState::STARTING:
    return "STARTING";
  case DriverState::RUNNING:
    return "RUNNING";
  case DriverState::SUCCEEDED:
    return "SUCCEEDED";
  case DriverState::FAILED:
    return "FAILED";
  }
  return "UNKNOWN";
}

void DriverConfig::Validate() const {
  if (timeout.count() <= 0) {
    throw std::invalid_argument("timeout must be positive");
  }
  if (poll_interval.count() <= 0) {
    throw std::invalid_argument("poll interval must be positive");
  }
}

LivenessTimeout::LivenessTimeout(std::chrono::milliseconds elapsed,
                                 uint64_t best_height)
    : std::runtime_error("liveness timeout after " +
                         util::FormatDurationMillis(elapsed.count()) +
                         ", best height " + std::to_string(best_height)),
      elapsed_(elapsed), best_height_(best_height) {}

Driver::Driver(const LivenessGate &gate, const network::InterceptFault *fault,
               DriverConfig config)
    : gate_(gate), fault_(fault), config_(config) {
  config_.Validate();
}

DriverOutcome Driver::run(const StartAction &start) {
  state_ = DriverState::STARTING;
  try {
    if (start) {
      start();
    }
  } catch (const std::exception &e) {
    state_ = DriverState::FAILED;
    LOG_HARNESS_ERROR("cluster start failed: {}", e.what());
    throw;
  }

  state_ = DriverState::RUNNING;
  LOG_HARNESS_INFO("cluster running, waiting up to {} for liveness",
                   util::FormatDurationMillis(config_.timeout.count()));

  const auto started = std::chrono::steady_clock::now();
  for (;;) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (gate_.is_success()) {
      state_ = DriverState::SUCCEEDED;
      DriverOutcome outcome{elapsed, gate_.best_height()};
      LOG_HARNESS_INFO("liveness reached after {} at height {}",
                       util::FormatDurationMillis(elapsed.count()),
                       outcome.best_height);
      return outcome;
    }

    if (fault_ && fault_->has_fault()) {
      state_ = DriverState::FAILED;
      LOG_HARNESS_ERROR("intercept fault after {}",
                        util::FormatDurationMillis(elapsed.count()));
      fault_->rethrow_if_faulted();
    }

    if (elapsed >= config_.timeout) {
      state_ = DriverState::FAILED;
      throw LivenessTimeout(elapsed, gate_.best_height());
    }

    std::this_thread::sleep_for(config_.poll_interval);
  }
}

} // namespace harness
} // namespace dropnet
