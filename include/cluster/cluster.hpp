// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chainparams.hpp"
#include "cluster/validator_node.hpp"
#include "network/proxy.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

namespace dropnet {
namespace cluster {

using ConfigError = chain::ConfigError;

// Invalid cluster shape, or a node that did not come up in time
class ClusterStartError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ClusterConfig {
  int node_count = 4;
  int shard_count = 0;      // 0 = single shard
  int boot_node_index = 1;

  // Merged into every node's config (null = none)
  nlohmann::json local_config_override;

  // Applied in order to the genesis document
  std::vector<chain::GenesisOverride> genesis_overrides;

  // Node index -> config merged after local_config_override
  std::map<int, nlohmann::json> node_overrides;

  network::ProxyConfig proxy;

  std::chrono::milliseconds start_timeout{5000};
};

/**
 * Cluster - a set of running validator nodes wired through one proxy.
 *
 * Owns the proxy and the nodes. The proxy is declared first so the nodes
 * (which hold proxy links) are destroyed before it.
 */
class Cluster {
public:
  ~Cluster();

  Cluster(const Cluster &) = delete;
  Cluster &operator=(const Cluster &) = delete;

  // Stops the proxy, then the nodes, and logs statistics. Idempotent.
  void Shutdown();

  size_t size() const { return nodes_.size(); }
  ValidatorNode &node(size_t index) { return *nodes_.at(index); }
  const ValidatorNode &node(size_t index) const { return *nodes_.at(index); }

  network::Proxy &proxy() { return *proxy_; }
  const chain::GenesisConfig &genesis() const { return genesis_; }
  chain::Topology topology() const { return topology_; }

  uint64_t max_head_height() const;

private:
  friend std::unique_ptr<Cluster> StartCluster(const ClusterConfig &,
                                               network::ProxyHandlerFactory,
                                               network::InterceptFault &);

  Cluster(chain::GenesisConfig genesis, chain::Topology topology,
          std::unique_ptr<network::Proxy> proxy);

  chain::GenesisConfig genesis_;
  chain::Topology topology_;
  std::unique_ptr<network::Proxy> proxy_;
  std::vector<std::unique_ptr<ValidatorNode>> nodes_;
  std::atomic<bool> shut_down_{false};
};

/**
 * Build, wire and start a cluster. Every inter-node link goes through a
 * proxy link whose handler comes from `factory`.
 *
 * Returns once every node's event loop is running.
 * Throws ClusterStartError for an invalid shape or a node that did not
 * start within config.start_timeout, ConfigError for bad JSON or overrides.
 */
std::unique_ptr<Cluster> StartCluster(const ClusterConfig &config,
                                      network::ProxyHandlerFactory factory,
                                      network::InterceptFault &fault);

} // namespace cluster
} // namespace dropnet
