// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chain/block - header layout, hashing and validation

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include "util/endian.hpp"

using namespace dropnet::chain;

namespace {

BlockV1 MakeBlock(uint64_t height, uint32_t shards) {
    BlockV1 block;
    block.header.inner_lite.height = height;
    block.header.inner_lite.epoch_id = height / 10;
    block.header.inner_lite.prev_hash = 0xdeadbeef;
    block.header.inner_lite.timestamp_ms = 1700000000000;
    block.header.inner_lite.producer = 2;
    block.header.num_shards = shards;
    block.header.chunk_mask = shards >= 32 ? 0xffffffffu : ((1u << shards) - 1);
    for (uint32_t s = 0; s < shards; ++s) {
        block.chunks.push_back(ChunkHeader{s, height});
    }
    return block;
}

} // namespace

TEST_CASE("BlockHeaderInnerLite - fixed layout", "[chain][block]") {
    BlockHeaderInnerLite inner;
    inner.height = 0x0102030405060708ULL;
    inner.producer = 7;

    auto bytes = inner.SerializeFixed();
    REQUIRE(bytes.size() == 32);

    SECTION("Height is little-endian at offset 0") {
        REQUIRE(bytes[0] == 0x08);
        REQUIRE(bytes[7] == 0x01);
    }

    SECTION("Producer is the last field") {
        REQUIRE(dropnet::endian::ReadLE32(bytes.data() + BlockHeaderInnerLite::OFF_PRODUCER) == 7);
    }

    SECTION("Wrong size is rejected") {
        BlockHeaderInnerLite out;
        REQUIRE_FALSE(out.Deserialize(bytes.data(), bytes.size() - 1));
        REQUIRE(out.Deserialize(bytes.data(), bytes.size()));
        REQUIRE(out == inner);
    }
}

TEST_CASE("BlockHeaderV2 - hash and validation", "[chain][block]") {
    auto block = MakeBlock(5, 4);
    const auto bytes = block.header.SerializeFixed();
    REQUIRE(bytes.size() == BlockHeaderV2::SERIALIZED_SIZE);
    REQUIRE(bytes[0] == BlockHeaderV2::VERSION);

    SECTION("Hash depends on the height") {
        auto other = MakeBlock(6, 4);
        REQUIRE(block.header.GetHash() != other.header.GetHash());
        REQUIRE(block.header.GetHash() == MakeBlock(5, 4).header.GetHash());
    }

    SECTION("Unknown version tag is rejected") {
        auto bad = bytes;
        bad[0] = 1;
        BlockHeaderV2 out;
        REQUIRE_FALSE(out.Deserialize(bad.data(), bad.size()));
    }

    SECTION("Zero shards is rejected") {
        auto bad = bytes;
        dropnet::endian::WriteLE32(bad.data() + 33, 0);
        BlockHeaderV2 out;
        REQUIRE_FALSE(out.Deserialize(bad.data(), bad.size()));
    }

    SECTION("Mask bits beyond num_shards are rejected") {
        auto bad = bytes;
        dropnet::endian::WriteLE32(bad.data() + 37, 0x1f);
        BlockHeaderV2 out;
        REQUIRE_FALSE(out.Deserialize(bad.data(), bad.size()));
    }

    SECTION("Valid header parses back") {
        BlockHeaderV2 out;
        REQUIRE(out.Deserialize(std::span<const uint8_t>(bytes.data(), bytes.size())));
        REQUIRE(out == block.header);
    }
}

TEST_CASE("BlockV1 - serialization", "[chain][block]") {
    SECTION("Header, chunk count and chunks") {
        auto block = MakeBlock(12, 3);
        auto bytes = block.Serialize();
        REQUIRE(bytes.size() == BlockHeaderV2::SERIALIZED_SIZE + 2 + 3 * ChunkHeader::SERIALIZED_SIZE);

        BlockV1 out;
        REQUIRE(out.Deserialize(bytes.data(), bytes.size()));
        REQUIRE(out == block);
        REQUIRE(out.height() == 12);
    }

    SECTION("Trailing bytes are rejected") {
        auto bytes = MakeBlock(1, 1).Serialize();
        bytes.push_back(0);
        BlockV1 out;
        REQUIRE_FALSE(out.Deserialize(bytes.data(), bytes.size()));
    }

    SECTION("Truncated chunk list is rejected") {
        auto bytes = MakeBlock(1, 2).Serialize();
        bytes.pop_back();
        BlockV1 out;
        REQUIRE_FALSE(out.Deserialize(bytes.data(), bytes.size()));
    }

    SECTION("Chunk for a shard outside the header is rejected") {
        auto block = MakeBlock(1, 2);
        block.chunks[1].shard_id = 5;
        auto bytes = block.Serialize();
        BlockV1 out;
        REQUIRE_FALSE(out.Deserialize(bytes.data(), bytes.size()));
    }

    SECTION("Failed parse leaves the block untouched") {
        auto original = MakeBlock(9, 1);
        BlockV1 out = original;
        std::vector<uint8_t> junk(10, 0xff);
        REQUIRE_FALSE(out.Deserialize(junk.data(), junk.size()));
        REQUIRE(out == original);
    }
}
