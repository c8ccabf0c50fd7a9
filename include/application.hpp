#pragma once

#include "cluster/cluster.hpp"
#include "harness/driver.hpp"
#include "harness/drop_handler.hpp"
#include "harness/liveness_gate.hpp"
#include "network/proxy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dropnet {
namespace app {

// Harness configuration (CLI options map onto these fields)
struct HarnessConfig {
  cluster::ClusterConfig cluster;
  harness::DropPolicyConfig drop;
  harness::DriverConfig driver;

  // Place the liveness gate in this named shared-memory segment (empty =
  // in-process gate)
  std::string shared_gate_name;

  // Logging
  std::string log_level = "info";
  std::vector<std::string> debug_components;
  std::string log_file; // empty = console only
};

// Application - wires gate, drop handlers, cluster and driver for one run
class Application {
public:
  explicit Application(HarnessConfig config);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  /**
   * Run the harness once: start the cluster, poll until liveness.
   * The cluster is shut down before Run() returns or throws.
   *
   * @throws cluster::ClusterStartError, cluster::ConfigError,
   *         harness::LivenessTimeout, network::InterceptError,
   *         std::invalid_argument (bad drop ratio or intervals)
   */
  harness::DriverOutcome Run();

  // Valid once Run() has created the gate
  const harness::LivenessGate *gate() const { return gate_; }

  const HarnessConfig &config() const { return config_; }

private:
  void ShutdownCluster();

  HarnessConfig config_;

  std::unique_ptr<harness::SharedLivenessGate> shared_gate_;
  std::unique_ptr<harness::LivenessGate> local_gate_;
  harness::LivenessGate *gate_{nullptr};

  network::InterceptFault fault_;

  // Declared last: destroyed before the gate its handlers reference
  std::unique_ptr<cluster::Cluster> cluster_;
};

} // namespace app
} // namespace dropnet
