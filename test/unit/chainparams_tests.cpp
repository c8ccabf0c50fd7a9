// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chain/chainparams - genesis and node configuration

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace dropnet::chain;
using json = nlohmann::json;

TEST_CASE("GenesisConfig - defaults", "[chain][chainparams]") {
    SECTION("Single shard when shard count is zero") {
        auto genesis = GenesisConfig::FromJson(DefaultGenesisJson(4, 0));
        REQUIRE(genesis.num_shards == 1);
        REQUIRE(genesis.validators == std::vector<uint32_t>{0, 1, 2, 3});
        REQUIRE(genesis.chain_id == "dropnet-local");
    }

    SECTION("Shard count is carried through") {
        auto genesis = GenesisConfig::FromJson(DefaultGenesisJson(2, 8));
        REQUIRE(genesis.num_shards == 8);
    }

    SECTION("Proposers rotate over the validator list") {
        auto genesis = GenesisConfig::FromJson(DefaultGenesisJson(3, 0));
        REQUIRE(genesis.ProposerFor(0) == 0);
        REQUIRE(genesis.ProposerFor(1) == 1);
        REQUIRE(genesis.ProposerFor(5) == 2);
        REQUIRE(genesis.ProposerFor(6) == 0);
    }
}

TEST_CASE("GenesisConfig - rejects bad documents", "[chain][chainparams]") {
    auto doc = DefaultGenesisJson(4, 0);

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(json::array()), ConfigError);
    }

    SECTION("Missing field") {
        doc.erase("epoch_length");
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Zero shards") {
        doc["num_shards"] = 0;
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Too many shards") {
        doc["num_shards"] = MAX_SHARDS + 1;
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Negative epoch length") {
        doc["epoch_length"] = -5;
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Empty validator list") {
        doc["validators"] = json::array();
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Validator entry is not an index") {
        doc["validators"] = json::array({0, "one"});
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Validator index wider than 32 bits") {
        doc["validators"] = json::array({0, 4294967297ULL});
        REQUIRE_THROWS_AS(GenesisConfig::FromJson(doc), ConfigError);
    }

    SECTION("Largest 32-bit validator index is kept") {
        doc["validators"] = json::array({0, 4294967295ULL});
        auto config = GenesisConfig::FromJson(doc);
        REQUIRE(config.validators.size() == 2);
        REQUIRE(config.validators[1] == 4294967295u);
    }
}

TEST_CASE("ApplyGenesisOverrides", "[chain][chainparams]") {
    auto doc = DefaultGenesisJson(4, 0);

    SECTION("Overrides apply in order") {
        ApplyGenesisOverrides(doc, {{"/epoch_length", 20}, {"/epoch_length", 30}});
        REQUIRE(GenesisConfig::FromJson(doc).epoch_length == 30);
    }

    SECTION("Array element can be replaced") {
        ApplyGenesisOverrides(doc, {{"/validators/0", 3}});
        REQUIRE(GenesisConfig::FromJson(doc).validators[0] == 3);
    }

    SECTION("Unknown field is an error") {
        REQUIRE_THROWS_AS(ApplyGenesisOverrides(doc, {{"/no_such_field", 1}}), ConfigError);
    }

    SECTION("Type mismatch is an error") {
        REQUIRE_THROWS_AS(ApplyGenesisOverrides(doc, {{"/chain_id", 7}}), ConfigError);
    }

    SECTION("Malformed pointer is an error") {
        REQUIRE_THROWS_AS(ApplyGenesisOverrides(doc, {{"epoch_length", 7}}), ConfigError);
    }
}

TEST_CASE("MakeGenesisBlock", "[chain][chainparams]") {
    auto genesis = GenesisConfig::FromJson(DefaultGenesisJson(4, 3));
    auto block = MakeGenesisBlock(genesis);

    REQUIRE(block.height() == 0);
    REQUIRE(block.header.inner_lite.prev_hash == 0);
    REQUIRE(block.header.inner_lite.producer == GENESIS_PRODUCER);
    REQUIRE(block.header.num_shards == 3);
    REQUIRE(block.header.chunk_mask == 0x7);
    REQUIRE(block.chunks.size() == 3);

    SECTION("Same genesis config gives the same hash") {
        REQUIRE(MakeGenesisBlock(genesis).GetHash() == block.GetHash());
    }

    SECTION("Different genesis time gives a different hash") {
        auto other = genesis;
        other.genesis_time_ms = 1;
        REQUIRE(MakeGenesisBlock(other).GetHash() != block.GetHash());
    }
}

TEST_CASE("NodeConfig - merge and parse", "[chain][chainparams]") {
    SECTION("Defaults parse") {
        auto config = NodeConfig::FromJson(MergeNodeConfig(json(), json()));
        REQUIRE(config.block_production_interval_ms == 100);
        REQUIRE(config.status_interval_ms == 250);
        REQUIRE(config.max_blocks_per_request == 16);
        REQUIRE(config.topology == Topology::FULL_MESH);
    }

    SECTION("Node override wins over the local override") {
        json local = {{"consensus", {{"block_production_interval_ms", 50}}}};
        json node = {{"consensus", {{"block_production_interval_ms", 20}}},
                     {"network", {{"topology", "boot_star"}}}};
        auto config = NodeConfig::FromJson(MergeNodeConfig(local, node));
        REQUIRE(config.block_production_interval_ms == 20);
        REQUIRE(config.status_interval_ms == 250);
        REQUIRE(config.topology == Topology::BOOT_STAR);
    }

    SECTION("Null in a patch removes the field") {
        json local = {{"consensus", {{"status_interval_ms", nullptr}}}};
        REQUIRE_THROWS_AS(NodeConfig::FromJson(MergeNodeConfig(local, json())), ConfigError);
    }

    SECTION("Non-positive interval is rejected") {
        json local = {{"consensus", {{"status_interval_ms", 0}}}};
        REQUIRE_THROWS_AS(NodeConfig::FromJson(MergeNodeConfig(local, json())), ConfigError);
    }

    SECTION("Unknown topology is rejected") {
        json local = {{"network", {{"topology", "ring"}}}};
        REQUIRE_THROWS_AS(NodeConfig::FromJson(MergeNodeConfig(local, json())), ConfigError);
    }

    SECTION("Zero blocks per request is rejected") {
        json local = {{"consensus", {{"max_blocks_per_request", 0}}}};
        REQUIRE_THROWS_AS(NodeConfig::FromJson(MergeNodeConfig(local, json())), ConfigError);
    }
}

TEST_CASE("Topology names", "[chain][chainparams]") {
    REQUIRE(TopologyName(Topology::FULL_MESH) == "full_mesh");
    REQUIRE(ParseTopology("boot_star") == Topology::BOOT_STAR);
    REQUIRE_FALSE(ParseTopology("mesh").has_value());
}

TEST_CASE("Config files", "[chain][chainparams]") {
    SECTION("Malformed JSON text") {
        REQUIRE_THROWS_AS(ParseConfigJson("{\"a\":", "test"), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(LoadConfigFile("/nonexistent/dropnet/config.json"), ConfigError);
    }

    SECTION("File round trip") {
        auto path = std::filesystem::temp_directory_path() / "dropnet_chainparams_test.json";
        {
            std::ofstream out(path);
            out << R"({"consensus": {"status_interval_ms": 40}})";
        }
        auto j = LoadConfigFile(path.string());
        std::filesystem::remove(path);
        REQUIRE(j["consensus"]["status_interval_ms"] == 40);
    }
}
