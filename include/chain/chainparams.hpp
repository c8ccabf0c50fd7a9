// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dropnet {
namespace chain {

// Malformed JSON, bad override path or out-of-range configuration value
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// (JSON pointer, value) pair, e.g. {"/epoch_length", 20}
using GenesisOverride = std::pair<std::string, nlohmann::json>;

enum class Topology {
  FULL_MESH, // every node linked to every other node
  BOOT_STAR  // every node linked only to the boot node
};

std::string TopologyName(Topology topology);
std::optional<Topology> ParseTopology(const std::string &name);

/**
 * Genesis configuration shared by every node of one cluster.
 * Nodes that disagree on it (different genesis hash) refuse each other.
 */
struct GenesisConfig {
  std::string chain_id = "dropnet-local";
  uint32_t num_shards = 1;
  uint64_t epoch_length = 100;
  std::vector<uint32_t> validators; // node indices in proposer order
  int64_t genesis_time_ms = 0;

  nlohmann::json ToJson() const;

  // Throws ConfigError on missing fields, wrong types or invalid values
  static GenesisConfig FromJson(const nlohmann::json &j);

  // Proposer of block `height` (round robin over validators)
  uint32_t ProposerFor(uint64_t height) const;
};

// Default genesis document for node_count validators. shard_count 0 means a
// single shard.
nlohmann::json DefaultGenesisJson(int node_count, int shard_count);

// Applies overrides in order. Each pointer must name an existing field and
// the value must have the same JSON type (any number may replace a number).
void ApplyGenesisOverrides(nlohmann::json &genesis,
                           const std::vector<GenesisOverride> &overrides);

// Height 0, prev_hash 0, producer GENESIS_PRODUCER, one chunk per shard
BlockV1 MakeGenesisBlock(const GenesisConfig &config);

/**
 * Per-node configuration. Built from DefaultJson() merged (RFC 7386) with
 * the cluster-wide override and then with the override for that node.
 */
struct NodeConfig {
  int64_t block_production_interval_ms = 100;
  int64_t status_interval_ms = 250;
  uint32_t max_blocks_per_request = 16;
  Topology topology = Topology::FULL_MESH;

  static nlohmann::json DefaultJson();

  // Throws ConfigError on wrong types or non-positive intervals
  static NodeConfig FromJson(const nlohmann::json &j);
};

// Defaults <- local_override <- node_override; null overrides are skipped
nlohmann::json MergeNodeConfig(const nlohmann::json &local_override,
                               const nlohmann::json &node_override);

// Parse JSON text; source names the origin in error messages
nlohmann::json ParseConfigJson(const std::string &text, const std::string &source);

// Read and parse a JSON file. Throws ConfigError if unreadable or malformed.
nlohmann::json LoadConfigFile(const std::string &path);

} // namespace chain
} // namespace dropnet
