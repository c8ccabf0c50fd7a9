// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace dropnet {
namespace chain {

// Maximum number of shards a header's chunk mask can describe
constexpr uint32_t MAX_SHARDS = 32;

// Producer value used by the genesis block (no validator produced it)
constexpr uint32_t GENESIS_PRODUCER = 0xffffffff;

// BlockHeaderInnerLite - the part of the header light clients track.
// Height is what the liveness harness inspects.
struct BlockHeaderInnerLite {
  uint64_t height{0};
  uint64_t epoch_id{0};
  uint32_t prev_hash{0};      // GetHash() of the parent header
  int64_t timestamp_ms{0};
  uint32_t producer{0};       // Validator (node index) that produced the block

  // Serialized size: 8 + 8 + 4 + 8 + 4 = 32 bytes
  static constexpr size_t SERIALIZED_SIZE = 8 + 8 + 4 + 8 + 4;

  static constexpr size_t OFF_HEIGHT    = 0;
  static constexpr size_t OFF_EPOCH     = OFF_HEIGHT + 8;
  static constexpr size_t OFF_PREV      = OFF_EPOCH + 8;
  static constexpr size_t OFF_TIMESTAMP = OFF_PREV + 4;
  static constexpr size_t OFF_PRODUCER  = OFF_TIMESTAMP + 8;

  static_assert(OFF_PRODUCER + 4 == SERIALIZED_SIZE, "offset math must be correct");

  using Bytes = std::array<uint8_t, SERIALIZED_SIZE>;

  [[nodiscard]] Bytes SerializeFixed() const noexcept;
  [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size) noexcept;

  bool operator==(const BlockHeaderInnerLite&) const = default;
};

// BlockHeaderV2 - version tag + inner_lite + shard layout
class BlockHeaderV2 {
public:
  static constexpr uint8_t VERSION = 2;

  BlockHeaderInnerLite inner_lite;
  uint32_t num_shards{1};
  uint32_t chunk_mask{0};     // Bit i set = chunk for shard i included

  // Serialized size: 1 + 32 + 4 + 4 = 41 bytes
  static constexpr size_t SERIALIZED_SIZE = 1 + BlockHeaderInnerLite::SERIALIZED_SIZE + 4 + 4;

  using Bytes = std::array<uint8_t, SERIALIZED_SIZE>;

  // CRC-32 of the serialized header
  [[nodiscard]] uint32_t GetHash() const noexcept;

  [[nodiscard]] Bytes SerializeFixed() const noexcept;

  // Rejects wrong size, wrong version tag, num_shards outside [1, MAX_SHARDS]
  // and mask bits beyond num_shards
  [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size) noexcept;
  [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) noexcept {
    return Deserialize(bytes.data(), bytes.size());
  }

  [[nodiscard]] std::string ToString() const;

  bool operator==(const BlockHeaderV2&) const = default;
};

struct ChunkHeader {
  uint32_t shard_id{0};
  uint64_t height_created{0};

  static constexpr size_t SERIALIZED_SIZE = 4 + 8;

  bool operator==(const ChunkHeader&) const = default;
};

// BlockV1 - header plus one chunk header per included shard
class BlockV1 {
public:
  BlockHeaderV2 header;
  std::vector<ChunkHeader> chunks;

  // Limit on chunks accepted from the wire
  static constexpr size_t MAX_CHUNKS = 1024;

  uint64_t height() const noexcept { return header.inner_lite.height; }
  uint32_t GetHash() const noexcept { return header.GetHash(); }

  // header (41 bytes) | chunk count (u16) | chunks (12 bytes each)
  [[nodiscard]] std::vector<uint8_t> Serialize() const;
  [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size);

  bool operator==(const BlockV1&) const = default;
};

} // namespace chain
} // namespace dropnet
