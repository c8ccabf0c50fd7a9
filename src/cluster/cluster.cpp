// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cluster/cluster.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <thread>

namespace dropnet {
namespace cluster {

namespace {

void ValidateShape(const ClusterConfig &config) {
  if (config.node_count < 1) {
    throw ClusterStartError("cluster needs at least one node, got " +
                            std::to_string(config.node_count));
  }
  if (config.shard_count < 0 ||
      config.shard_count > static_cast<int>(chain::MAX_SHARDS)) {
    throw ClusterStartError("shard count must be within [0, " +
                            std::to_string(chain::MAX_SHARDS) + "], got " +
                            std::to_string(config.shard_count));
  }
  if (config.boot_node_index < 0 || config.boot_node_index >= config.node_count) {
    throw ClusterStartError("boot node index " +
                            std::to_string(config.boot_node_index) +
                            " is outside [0, " + std::to_string(config.node_count) +
                            ")");
  }
  for (const auto &[index, _] : config.node_overrides) {
    if (index < 0 || index >= config.node_count) {
      throw ClusterStartError("config override for unknown node " +
                              std::to_string(index));
    }
  }
  if (config.start_timeout.count() <= 0) {
    throw ClusterStartError("start timeout must be positive");
  }
}

chain::GenesisConfig BuildGenesis(const ClusterConfig &config) {
  auto doc = chain::DefaultGenesisJson(config.node_count, config.shard_count);
  chain::ApplyGenesisOverrides(doc, config.genesis_overrides);
  auto genesis = chain::GenesisConfig::FromJson(doc);

  for (uint32_t v : genesis.validators) {
    if (v >= static_cast<uint32_t>(config.node_count)) {
      throw ClusterStartError("genesis names validator " + std::to_string(v) +
                              " but the cluster has " +
                              std::to_string(config.node_count) + " node(s)");
    }
  }
  return genesis;
}

chain::NodeConfig BuildNodeConfig(const ClusterConfig &config, int index) {
  auto it = config.node_overrides.find(index);
  const nlohmann::json node_override =
      it != config.node_overrides.end() ? it->second : nlohmann::json();
  return chain::NodeConfig::FromJson(
      chain::MergeNodeConfig(config.local_config_override, node_override));
}

bool LinkAllowed(chain::Topology topology, int boot, int from, int to) {
  if (from == to) {
    return false;
  }
  if (topology == chain::Topology::BOOT_STAR) {
    return from == boot || to == boot;
  }
  return true;
}

bool WaitRunning(const ValidatorNode &node,
                 std::chrono::steady_clock::time_point deadline) {
  while (!node.IsRunning()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

} // namespace

Cluster::Cluster(chain::GenesisConfig genesis, chain::Topology topology,
                 std::unique_ptr<network::Proxy> proxy)
    : genesis_(std::move(genesis)), topology_(topology), proxy_(std::move(proxy)) {}

Cluster::~Cluster() { Shutdown(); }

void Cluster::Shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }

  proxy_->stop();
  for (auto &node : nodes_) {
    node->Stop();
  }

  proxy_->log_stats();
  for (const auto &node : nodes_) {
    auto s = node->stats();
    LOG_CLUSTER_INFO("node {}: head={} produced={} received={} relayed={} "
                     "requested={} served={} ignored={}",
                     node->id(), node->head_height(), s.produced, s.received,
                     s.relayed, s.requested, s.served, s.ignored);
  }
}

uint64_t Cluster::max_head_height() const {
  uint64_t best = 0;
  for (const auto &node : nodes_) {
    best = std::max(best, node->head_height());
  }
  return best;
}

std::unique_ptr<Cluster> StartCluster(const ClusterConfig &config,
                                      network::ProxyHandlerFactory factory,
                                      network::InterceptFault &fault) {
  ValidateShape(config);
  if (!factory) {
    throw ClusterStartError("no proxy handler factory");
  }

  auto genesis = BuildGenesis(config);

  std::vector<chain::NodeConfig> node_configs;
  for (int i = 0; i < config.node_count; ++i) {
    node_configs.push_back(BuildNodeConfig(config, i));
  }
  // The boot node's view of the topology decides which links exist
  const chain::Topology topology = node_configs[config.boot_node_index].topology;

  LOG_CLUSTER_INFO("starting cluster: {} node(s), {} shard(s), boot node {}, "
                   "topology {}",
                   config.node_count, genesis.num_shards, config.boot_node_index,
                   chain::TopologyName(topology));

  auto proxy = std::make_unique<network::Proxy>(config.proxy, std::move(factory), fault);
  std::unique_ptr<Cluster> cluster(new Cluster(genesis, topology, std::move(proxy)));

  for (int i = 0; i < config.node_count; ++i) {
    cluster->nodes_.push_back(std::make_unique<ValidatorNode>(
        i, genesis, node_configs[i], config.proxy.magic));
  }

  try {
    for (int from = 0; from < config.node_count; ++from) {
      for (int to = 0; to < config.node_count; ++to) {
        if (!LinkAllowed(topology, config.boot_node_index, from, to)) {
          continue;
        }
        auto link = cluster->proxy_->create_link(from, to);
        ValidatorNode *destination = cluster->nodes_[to].get();
        link->set_receive_callback(
            [destination, from](const std::vector<uint8_t> &frame) {
              destination->Deliver(from, frame);
            });
        cluster->nodes_[from]->AddPeer(link);
      }
    }
  } catch (const std::exception &e) {
    throw ClusterStartError(std::string("cannot create proxy links: ") + e.what());
  }

  cluster->proxy_->start();

  const auto deadline = std::chrono::steady_clock::now() + config.start_timeout;
  auto &boot = *cluster->nodes_[config.boot_node_index];
  boot.Start();
  if (!WaitRunning(boot, deadline)) {
    cluster->Shutdown();
    throw ClusterStartError("boot node " + std::to_string(config.boot_node_index) +
                            " did not start");
  }

  for (auto &node : cluster->nodes_) {
    node->Start();
  }
  for (const auto &node : cluster->nodes_) {
    if (!WaitRunning(*node, deadline)) {
      cluster->Shutdown();
      throw ClusterStartError("node " + std::to_string(node->id()) +
                              " did not start within " +
                              std::to_string(config.start_timeout.count()) + "ms");
    }
  }

  LOG_CLUSTER_INFO("cluster started: {} link(s)", cluster->proxy_->links().size());
  return cluster;
}

} // namespace cluster
} // namespace dropnet
