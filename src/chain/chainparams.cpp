// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <limits>
#include <sstream>

namespace dropnet {
namespace chain {

using json = nlohmann::json;

std::string TopologyName(Topology topology) {
  switch (topology) {
  case Topology::FULL_MESH:
    return "full_mesh";
  case Topology::BOOT_STAR:
    return "boot_star";
  }
  return "unknown";
}

std::optional<Topology> ParseTopology(const std::string &name) {
  if (name == "full_mesh")
    return Topology::FULL_MESH;
  if (name == "boot_star")
    return Topology::BOOT_STAR;
  return std::nullopt;
}

namespace {

// Non-negative integer field no larger than max
uint64_t GetUnsigned(const json &j, const char *key, uint64_t max) {
  const auto &v = j.at(key);
  if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
    throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
  }
  const uint64_t value = v.get<uint64_t>();
  if (value > max) {
    throw ConfigError(std::string("'") + key + "' is out of range: " +
                      std::to_string(value));
  }
  return value;
}

int64_t GetPositiveMillis(const json &j, const char *key) {
  const auto &v = j.at(key);
  if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
    throw ConfigError(std::string("'") + key + "' must be a positive integer");
  }
  return v.get<int64_t>();
}

} // namespace

json GenesisConfig::ToJson() const {
  return json{{"chain_id", chain_id},
              {"num_shards", num_shards},
              {"epoch_length", epoch_length},
              {"validators", validators},
              {"genesis_time_ms", genesis_time_ms}};
}

GenesisConfig GenesisConfig::FromJson(const json &j) {
  if (!j.is_object()) {
    throw ConfigError("genesis config must be a JSON object");
  }

  GenesisConfig config;
  try {
    config.chain_id = j.at("chain_id").get<std::string>();
    config.num_shards = static_cast<uint32_t>(GetUnsigned(j, "num_shards", MAX_SHARDS));
    config.epoch_length = GetUnsigned(j, "epoch_length",
                                      std::numeric_limits<uint64_t>::max());
    config.genesis_time_ms = j.at("genesis_time_ms").get<int64_t>();

    const auto &validators = j.at("validators");
    if (!validators.is_array()) {
      throw ConfigError("'validators' must be an array");
    }
    for (const auto &v : validators) {
      if (!v.is_number_unsigned()) {
        throw ConfigError("'validators' entries must be node indices");
      }
      uint64_t index = v.get<uint64_t>();
      if (index > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError("'validators' entry out of range: " +
                          std::to_string(index));
      }
      config.validators.push_back(static_cast<uint32_t>(index));
    }
  } catch (const json::exception &e) {
    throw ConfigError(std::string("invalid genesis config: ") + e.what());
  }

  if (config.chain_id.empty()) {
    throw ConfigError("'chain_id' must not be empty");
  }
  if (config.num_shards == 0) {
    throw ConfigError("'num_shards' must be at least 1");
  }
  if (config.epoch_length == 0) {
    throw ConfigError("'epoch_length' must be at least 1");
  }
  if (config.validators.empty()) {
    throw ConfigError("'validators' must name at least one node");
  }
  return config;
}

uint32_t GenesisConfig::ProposerFor(uint64_t height) const {
  return validators[height % validators.size()];
}

json DefaultGenesisJson(int node_count, int shard_count) {
  GenesisConfig config;
  config.num_shards = shard_count <= 0 ? 1 : static_cast<uint32_t>(shard_count);
  for (int i = 0; i < node_count; ++i) {
    config.validators.push_back(static_cast<uint32_t>(i));
  }
  return config.ToJson();
}

void ApplyGenesisOverrides(json &genesis,
                           const std::vector<GenesisOverride> &overrides) {
  for (const auto &[pointer, value] : overrides) {
    try {
      json::json_pointer ptr(pointer);
      if (!genesis.contains(ptr)) {
        throw ConfigError("genesis override names unknown field '" + pointer + "'");
      }
      const json &current = genesis.at(ptr);
      const bool same_kind = current.type() == value.type() ||
                             (current.is_number() && value.is_number());
      if (!same_kind) {
        throw ConfigError("genesis override '" + pointer + "' expects " +
                          current.type_name() + ", got " + value.type_name());
      }
      genesis[ptr] = value;
      LOG_CHAIN_DEBUG("genesis override {} = {}", pointer, value.dump());
    } catch (const json::exception &e) {
      throw ConfigError("bad genesis override '" + pointer + "': " + e.what());
    }
  }
}

BlockV1 MakeGenesisBlock(const GenesisConfig &config) {
  BlockV1 genesis;
  auto &inner = genesis.header.inner_lite;
  inner.height = 0;
  inner.epoch_id = 0;
  inner.prev_hash = 0;
  inner.timestamp_ms = config.genesis_time_ms;
  inner.producer = GENESIS_PRODUCER;

  genesis.header.num_shards = config.num_shards;
  genesis.header.chunk_mask =
      config.num_shards >= 32 ? 0xffffffffu : ((1u << config.num_shards) - 1);
  for (uint32_t shard = 0; shard < config.num_shards; ++shard) {
    genesis.chunks.push_back(ChunkHeader{shard, 0});
  }
  return genesis;
}

json NodeConfig::DefaultJson() {
  NodeConfig defaults;
  return json{{"consensus",
               {{"block_production_interval_ms", defaults.block_production_interval_ms},
                {"status_interval_ms", defaults.status_interval_ms},
                {"max_blocks_per_request", defaults.max_blocks_per_request}}},
              {"network", {{"topology", TopologyName(defaults.topology)}}}};
}

NodeConfig NodeConfig::FromJson(const json &j) {
  NodeConfig config;
  try {
    const auto &consensus = j.at("consensus");
    config.block_production_interval_ms =
        GetPositiveMillis(consensus, "block_production_interval_ms");
    config.status_interval_ms = GetPositiveMillis(consensus, "status_interval_ms");
    config.max_blocks_per_request = static_cast<uint32_t>(
        GetUnsigned(consensus, "max_blocks_per_request", 1024));

    const auto topology_name = j.at("network").at("topology").get<std::string>();
    auto topology = ParseTopology(topology_name);
    if (!topology) {
      throw ConfigError("unknown topology '" + topology_name + "'");
    }
    config.topology = *topology;
  } catch (const json::exception &e) {
    throw ConfigError(std::string("invalid node config: ") + e.what());
  }

  if (config.max_blocks_per_request == 0) {
    throw ConfigError("'max_blocks_per_request' must be at least 1");
  }
  return config;
}

json MergeNodeConfig(const json &local_override, const json &node_override) {
  json merged = NodeConfig::DefaultJson();
  if (!local_override.is_null()) {
    merged.merge_patch(local_override);
  }
  if (!node_override.is_null()) {
    merged.merge_patch(node_override);
  }
  return merged;
}

json ParseConfigJson(const std::string &text, const std::string &source) {
  try {
    return json::parse(text);
  } catch (const json::parse_error &e) {
    throw ConfigError("malformed JSON in " + source + ": " + e.what());
  }
}

json LoadConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open config file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseConfigJson(buffer.str(), path);
}

} // namespace chain
} // namespace dropnet
