#pragma once

#include "network/protocol.hpp"
#include "chain/block.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dropnet {
namespace message {

/**
 * VarInt - Variable length integer encoding (canonical form only)
 */
class VarInt {
public:
  uint64_t value;

  VarInt() : value(0) {}
  explicit VarInt(uint64_t v) : value(v) {}

  size_t encoded_size() const;

  size_t encode(uint8_t *buffer) const;

  // Decode from buffer, returns bytes consumed (0 on truncated or
  // non-canonical input)
  size_t decode(const uint8_t *buffer, size_t available);
};

/**
 * Serialization buffer for building wire-format payloads
 */
class MessageSerializer {
public:
  MessageSerializer();

  void write_uint8(uint8_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);

  void write_varint(uint64_t value);
  void write_string(const std::string &str);
  void write_bytes(const uint8_t *data, size_t len);

  const std::vector<uint8_t> &data() const { return buffer_; }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Deserialization buffer for parsing wire-format payloads.
 * Reads past the end set the error flag and return zero values.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &data);

  uint8_t read_uint8();
  uint32_t read_uint32();
  uint64_t read_uint64();

  uint64_t read_varint();
  std::string read_string(size_t max_length = SIZE_MAX);

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t position_;
  bool error_;

  void check_available(size_t bytes);
};

/**
 * Base class for all message payloads
 */
class Message {
public:
  virtual ~Message() = default;

  virtual std::string command() const = 0;

  virtual std::vector<uint8_t> serialize() const = 0;

  // Deserialize message payload (returns true on success)
  virtual bool deserialize(const uint8_t *data, size_t size) = 0;
};

/**
 * HANDSHAKE message - first message on every link, carries the genesis hash
 * so nodes from different clusters refuse each other
 */
class HandshakeMessage : public Message {
public:
  uint32_t version;
  uint32_t node_id;
  uint32_t genesis_hash;
  uint64_t head_height;
  std::string user_agent;

  HandshakeMessage();

  std::string command() const override { return protocol::commands::HANDSHAKE; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * STATUS message - periodic head announcement used for catch-up
 */
class StatusMessage : public Message {
public:
  uint64_t head_height{0};
  uint32_t head_hash{0};

  StatusMessage() = default;
  StatusMessage(uint64_t height, uint32_t hash) : head_height(height), head_hash(hash) {}

  std::string command() const override { return protocol::commands::STATUS; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * BLOCK message - a full block. The drop harness reads
 * block.header.inner_lite.height from it.
 */
class BlockMessage : public Message {
public:
  chain::BlockV1 block;

  BlockMessage() = default;
  explicit BlockMessage(chain::BlockV1 b) : block(std::move(b)) {}

  std::string command() const override { return protocol::commands::BLOCK; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * BLOCKREQ message - ask a peer for blocks starting at height
 */
class BlockRequestMessage : public Message {
public:
  uint64_t height{0};

  BlockRequestMessage() = default;
  explicit BlockRequestMessage(uint64_t h) : height(h) {}

  std::string command() const override { return protocol::commands::BLOCK_REQUEST; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

class PingMessage : public Message {
public:
  uint64_t nonce;

  PingMessage() : nonce(0) {}
  explicit PingMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PING; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

class PongMessage : public Message {
public:
  uint64_t nonce;

  PongMessage() : nonce(0) {}
  explicit PongMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PONG; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * Any frame whose command is unknown or whose bytes failed to decode.
 * Keeps the raw command and payload; deserialize() accepts anything.
 */
class UnknownMessage : public Message {
public:
  std::string raw_command;
  std::vector<uint8_t> payload;

  UnknownMessage() = default;
  UnknownMessage(std::string cmd, std::vector<uint8_t> data)
      : raw_command(std::move(cmd)), payload(std::move(data)) {}

  std::string command() const override { return raw_command; }
  std::vector<uint8_t> serialize() const override { return payload; }
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * Result of decoding one wire frame. msg is never null: frames that fail
 * any check come back as an UnknownMessage with valid == false.
 */
struct DecodedFrame {
  bool valid{false};
  std::string command;
  std::unique_ptr<Message> msg;
};

// CRC-32 of the payload, little-endian
std::array<uint8_t, 4> compute_checksum(const std::vector<uint8_t> &payload);
std::array<uint8_t, 4> compute_checksum(const uint8_t *data, size_t size);

// Create message header with checksum
protocol::MessageHeader create_header(uint32_t magic,
                                      const std::string &command,
                                      const std::vector<uint8_t> &payload);

std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header);

// Deserialize header from bytes. Rejects short input and commands that are
// not printable ASCII followed by null padding.
bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header);

// Factory function to create message from command name (nullptr if unknown)
std::unique_ptr<Message> create_message(const std::string &command);

// Header + payload for msg
std::vector<uint8_t> encode_frame(uint32_t magic, const Message &msg);

DecodedFrame decode_frame(const std::vector<uint8_t> &frame, uint32_t magic);

} // namespace message
} // namespace dropnet
