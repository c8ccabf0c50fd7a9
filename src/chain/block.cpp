// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <boost/crc.hpp>
#include <sstream>

namespace dropnet {
namespace chain {

BlockHeaderInnerLite::Bytes BlockHeaderInnerLite::SerializeFixed() const noexcept {
  Bytes data{};
  endian::WriteLE64(data.data() + OFF_HEIGHT, height);
  endian::WriteLE64(data.data() + OFF_EPOCH, epoch_id);
  endian::WriteLE32(data.data() + OFF_PREV, prev_hash);
  endian::WriteLE64(data.data() + OFF_TIMESTAMP, static_cast<uint64_t>(timestamp_ms));
  endian::WriteLE32(data.data() + OFF_PRODUCER, producer);
  return data;
}

bool BlockHeaderInnerLite::Deserialize(const uint8_t* data, size_t size) noexcept {
  if (size != SERIALIZED_SIZE) {
    return false;
  }
  height = endian::ReadLE64(data + OFF_HEIGHT);
  epoch_id = endian::ReadLE64(data + OFF_EPOCH);
  prev_hash = endian::ReadLE32(data + OFF_PREV);
  timestamp_ms = static_cast<int64_t>(endian::ReadLE64(data + OFF_TIMESTAMP));
  producer = endian::ReadLE32(data + OFF_PRODUCER);
  return true;
}

uint32_t BlockHeaderV2::GetHash() const noexcept {
  const auto bytes = SerializeFixed();
  boost::crc_32_type crc;
  crc.process_bytes(bytes.data(), bytes.size());
  return crc.checksum();
}

BlockHeaderV2::Bytes BlockHeaderV2::SerializeFixed() const noexcept {
  Bytes data{};
  data[0] = VERSION;
  const auto inner = inner_lite.SerializeFixed();
  std::copy(inner.begin(), inner.end(), data.begin() + 1);
  size_t pos = 1 + BlockHeaderInnerLite::SERIALIZED_SIZE;
  endian::WriteLE32(data.data() + pos, num_shards);
  endian::WriteLE32(data.data() + pos + 4, chunk_mask);
  return data;
}

bool BlockHeaderV2::Deserialize(const uint8_t* data, size_t size) noexcept {
  if (size != SERIALIZED_SIZE || data[0] != VERSION) {
    return false;
  }
  BlockHeaderInnerLite inner;
  if (!inner.Deserialize(data + 1, BlockHeaderInnerLite::SERIALIZED_SIZE)) {
    return false;
  }
  size_t pos = 1 + BlockHeaderInnerLite::SERIALIZED_SIZE;
  uint32_t shards = endian::ReadLE32(data + pos);
  uint32_t mask = endian::ReadLE32(data + pos + 4);

  if (shards == 0 || shards > MAX_SHARDS) {
    return false;
  }
  if (shards < 32 && (mask >> shards) != 0) {
    return false;
  }

  inner_lite = inner;
  num_shards = shards;
  chunk_mask = mask;
  return true;
}

std::string BlockHeaderV2::ToString() const {
  std::ostringstream s;
  s << "BlockHeaderV2(height=" << inner_lite.height
    << ", epoch=" << inner_lite.epoch_id
    << ", hash=" << std::hex << GetHash()
    << ", prev=" << inner_lite.prev_hash << std::dec
    << ", producer=" << inner_lite.producer
    << ", shards=" << num_shards << ")";
  return s.str();
}

std::vector<uint8_t> BlockV1::Serialize() const {
  std::vector<uint8_t> out(BlockHeaderV2::SERIALIZED_SIZE + 2 +
                           chunks.size() * ChunkHeader::SERIALIZED_SIZE);
  const auto hdr = header.SerializeFixed();
  std::copy(hdr.begin(), hdr.end(), out.begin());

  size_t pos = BlockHeaderV2::SERIALIZED_SIZE;
  endian::WriteLE16(out.data() + pos, static_cast<uint16_t>(chunks.size()));
  pos += 2;
  for (const auto& chunk : chunks) {
    endian::WriteLE32(out.data() + pos, chunk.shard_id);
    endian::WriteLE64(out.data() + pos + 4, chunk.height_created);
    pos += ChunkHeader::SERIALIZED_SIZE;
  }
  return out;
}

bool BlockV1::Deserialize(const uint8_t* data, size_t size) {
  if (size < BlockHeaderV2::SERIALIZED_SIZE + 2) {
    return false;
  }

  BlockHeaderV2 hdr;
  if (!hdr.Deserialize(data, BlockHeaderV2::SERIALIZED_SIZE)) {
    return false;
  }

  size_t pos = BlockHeaderV2::SERIALIZED_SIZE;
  size_t count = endian::ReadLE16(data + pos);
  pos += 2;

  // Exact size: no trailing bytes accepted
  if (count > MAX_CHUNKS || size != pos + count * ChunkHeader::SERIALIZED_SIZE) {
    return false;
  }

  std::vector<ChunkHeader> parsed;
  parsed.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    ChunkHeader chunk;
    chunk.shard_id = endian::ReadLE32(data + pos);
    chunk.height_created = endian::ReadLE64(data + pos + 4);
    if (chunk.shard_id >= hdr.num_shards) {
      return false;
    }
    parsed.push_back(chunk);
    pos += ChunkHeader::SERIALIZED_SIZE;
  }

  header = hdr;
  chunks = std::move(parsed);
  return true;
}

} // namespace chain
} // namespace dropnet
