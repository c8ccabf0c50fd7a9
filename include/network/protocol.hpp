#pragma once

#include "version.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace dropnet {
namespace protocol {

// Protocol version - increment when the peer protocol changes
constexpr uint32_t PROTOCOL_VERSION = 1;

// Network magic bytes
namespace magic {
constexpr uint32_t LOCALNET = 0x44524F50; // "DROP"
} // namespace magic

// Message types - 12 bytes, null-padded
namespace commands {
// Handshake
constexpr const char *HANDSHAKE = "handshake";

// Chain progress
constexpr const char *STATUS = "status";
constexpr const char *BLOCK = "block";
constexpr const char *BLOCK_REQUEST = "blockreq";

// Keep-alive
constexpr const char *PING = "ping";
constexpr const char *PONG = "pong";
} // namespace commands

// Message header constants
constexpr size_t MESSAGE_HEADER_SIZE = 24;
constexpr size_t COMMAND_SIZE = 12;
constexpr size_t CHECKSUM_SIZE = 4;

// Serialization limits
constexpr uint64_t MAX_SIZE = 0x02000000;                       // 32 MB varint ceiling
constexpr size_t MAX_PROTOCOL_MESSAGE_LENGTH = 4 * 1000 * 1000; // 4 MB per frame
constexpr size_t MAX_USER_AGENT_LENGTH = 256;

// Message header structure (24 bytes):
// magic (4 bytes), command (12 bytes null-padded), length (4 bytes), checksum
// (4 bytes, CRC-32 of the payload)
struct MessageHeader {
  uint32_t magic;
  std::array<char, COMMAND_SIZE> command;
  uint32_t length;
  std::array<uint8_t, CHECKSUM_SIZE> checksum;

  MessageHeader();
  MessageHeader(uint32_t magic, const std::string &cmd, uint32_t len);

  // Get command as string (strips null padding)
  std::string get_command() const;

  // Set command from string (adds null padding, truncates at COMMAND_SIZE)
  void set_command(const std::string &cmd);
};

} // namespace protocol
} // namespace dropnet
