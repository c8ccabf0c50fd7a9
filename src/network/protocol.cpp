#include "network/protocol.hpp"
#include <algorithm>
#include <cstring>

namespace dropnet {
namespace protocol {

MessageHeader::MessageHeader() : magic(0), length(0) {
  command.fill(0);
  checksum.fill(0);
}

MessageHeader::MessageHeader(uint32_t magic, const std::string &cmd,
                             uint32_t len)
    : magic(magic), length(len) {
  set_command(cmd);
  checksum.fill(0); // Checksum set separately
}

std::string MessageHeader::get_command() const {
  auto end = std::find(command.begin(), command.end(), '\0');
  return std::string(command.begin(), end);
}

void MessageHeader::set_command(const std::string &cmd) {
  command.fill(0);
  size_t copy_len = std::min(cmd.length(), COMMAND_SIZE);
  std::memcpy(command.data(), cmd.data(), copy_len);
}

} // namespace protocol
} // namespace dropnet
