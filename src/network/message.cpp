#include "network/message.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <boost/crc.hpp>
#include <cstring>

namespace dropnet {
namespace message {

// VarInt implementation
size_t VarInt::encoded_size() const {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

size_t VarInt::encode(uint8_t *buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  } else if (value <= 0xffff) {
    buffer[0] = 0xfd;
    endian::WriteLE16(buffer + 1, static_cast<uint16_t>(value));
    return 3;
  } else if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    endian::WriteLE32(buffer + 1, static_cast<uint32_t>(value));
    return 5;
  } else {
    buffer[0] = 0xff;
    endian::WriteLE64(buffer + 1, value);
    return 9;
  }
}

size_t VarInt::decode(const uint8_t *buffer, size_t available) {
  if (available < 1)
    return 0;

  uint8_t first = buffer[0];
  if (first < 0xfd) {
    value = first;
    return 1;
  } else if (first == 0xfd) {
    if (available < 3)
      return 0;
    value = endian::ReadLE16(buffer + 1);
    if (value < 0xfd)
      return 0;
    return 3;
  } else if (first == 0xfe) {
    if (available < 5)
      return 0;
    value = endian::ReadLE32(buffer + 1);
    if (value <= 0xffff)
      return 0;
    return 5;
  } else {
    if (available < 9)
      return 0;
    value = endian::ReadLE64(buffer + 1);
    if (value <= 0xffffffff)
      return 0;
    return 9;
  }
}

// MessageSerializer implementation
MessageSerializer::MessageSerializer() { buffer_.reserve(128); }

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_uint32(uint32_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 4);
  endian::WriteLE32(buffer_.data() + pos, value);
}

void MessageSerializer::write_uint64(uint64_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 8);
  endian::WriteLE64(buffer_.data() + pos, value);
}

void MessageSerializer::write_varint(uint64_t value) {
  VarInt vi(value);
  size_t pos = buffer_.size();
  buffer_.resize(pos + vi.encoded_size());
  vi.encode(buffer_.data() + pos);
}

void MessageSerializer::write_string(const std::string &str) {
  write_varint(str.length());
  write_bytes(reinterpret_cast<const uint8_t *>(str.data()), str.length());
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

void MessageDeserializer::check_available(size_t bytes) {
  if (bytes_remaining() < bytes) {
    error_ = true;
  }
}

uint8_t MessageDeserializer::read_uint8() {
  check_available(1);
  if (error_)
    return 0;
  return data_[position_++];
}

uint32_t MessageDeserializer::read_uint32() {
  check_available(4);
  if (error_)
    return 0;
  uint32_t value = endian::ReadLE32(data_ + position_);
  position_ += 4;
  return value;
}

uint64_t MessageDeserializer::read_uint64() {
  check_available(8);
  if (error_)
    return 0;
  uint64_t value = endian::ReadLE64(data_ + position_);
  position_ += 8;
  return value;
}

uint64_t MessageDeserializer::read_varint() {
  VarInt vi;
  check_available(1);
  if (error_)
    return 0;

  size_t consumed = vi.decode(data_ + position_, bytes_remaining());
  if (consumed == 0 || vi.value > protocol::MAX_SIZE) {
    error_ = true;
    return 0;
  }

  position_ += consumed;
  return vi.value;
}

std::string MessageDeserializer::read_string(size_t max_length) {
  uint64_t len = read_varint();

  // Length is checked before allocating
  if (error_ || len > max_length || len > bytes_remaining()) {
    error_ = true;
    return "";
  }

  std::string result(reinterpret_cast<const char *>(data_ + position_), len);
  position_ += len;
  return result;
}

// HandshakeMessage
HandshakeMessage::HandshakeMessage()
    : version(protocol::PROTOCOL_VERSION), node_id(0), genesis_hash(0),
      head_height(0), user_agent(GetUserAgent()) {}

std::vector<uint8_t> HandshakeMessage::serialize() const {
  MessageSerializer s;
  s.write_uint32(version);
  s.write_uint32(node_id);
  s.write_uint32(genesis_hash);
  s.write_uint64(head_height);
  s.write_string(user_agent);
  return s.data();
}

bool HandshakeMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  version = d.read_uint32();
  node_id = d.read_uint32();
  genesis_hash = d.read_uint32();
  head_height = d.read_uint64();
  user_agent = d.read_string(protocol::MAX_USER_AGENT_LENGTH);
  return !d.has_error() && d.bytes_remaining() == 0;
}

// StatusMessage
std::vector<uint8_t> StatusMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(head_height);
  s.write_uint32(head_hash);
  return s.data();
}

bool StatusMessage::deserialize(const uint8_t *data, size_t size) {
  if (size != 12)
    return false;
  MessageDeserializer d(data, size);
  head_height = d.read_uint64();
  head_hash = d.read_uint32();
  return !d.has_error();
}

// BlockMessage
std::vector<uint8_t> BlockMessage::serialize() const { return block.Serialize(); }

bool BlockMessage::deserialize(const uint8_t *data, size_t size) {
  return block.Deserialize(data, size);
}

// BlockRequestMessage
std::vector<uint8_t> BlockRequestMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(height);
  return s.data();
}

bool BlockRequestMessage::deserialize(const uint8_t *data, size_t size) {
  if (size != 8)
    return false;
  height = endian::ReadLE64(data);
  return true;
}

// PingMessage
std::vector<uint8_t> PingMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.data();
}

bool PingMessage::deserialize(const uint8_t *data, size_t size) {
  if (size != 8)
    return false;
  nonce = endian::ReadLE64(data);
  return true;
}

// PongMessage
std::vector<uint8_t> PongMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.data();
}

bool PongMessage::deserialize(const uint8_t *data, size_t size) {
  if (size != 8)
    return false;
  nonce = endian::ReadLE64(data);
  return true;
}

// UnknownMessage
bool UnknownMessage::deserialize(const uint8_t *data, size_t size) {
  payload.assign(data, data + size);
  return true;
}

std::array<uint8_t, 4> compute_checksum(const uint8_t *data, size_t size) {
  boost::crc_32_type crc;
  crc.process_bytes(data, size);
  std::array<uint8_t, 4> checksum;
  endian::WriteLE32(checksum.data(), crc.checksum());
  return checksum;
}

std::array<uint8_t, 4> compute_checksum(const std::vector<uint8_t> &payload) {
  return compute_checksum(payload.data(), payload.size());
}

protocol::MessageHeader create_header(uint32_t magic,
                                      const std::string &command,
                                      const std::vector<uint8_t> &payload) {
  protocol::MessageHeader header(magic, command,
                                 static_cast<uint32_t>(payload.size()));
  header.checksum = compute_checksum(payload);
  return header;
}

std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header) {
  std::vector<uint8_t> buffer(protocol::MESSAGE_HEADER_SIZE);
  size_t pos = 0;

  endian::WriteLE32(buffer.data() + pos, header.magic);
  pos += 4;

  std::memcpy(buffer.data() + pos, header.command.data(),
              protocol::COMMAND_SIZE);
  pos += protocol::COMMAND_SIZE;

  endian::WriteLE32(buffer.data() + pos, header.length);
  pos += 4;

  std::memcpy(buffer.data() + pos, header.checksum.data(),
              protocol::CHECKSUM_SIZE);

  return buffer;
}

bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header) {
  if (size < protocol::MESSAGE_HEADER_SIZE) {
    return false;
  }

  size_t pos = 0;

  header.magic = endian::ReadLE32(data + pos);
  pos += 4;

  std::memcpy(header.command.data(), data + pos, protocol::COMMAND_SIZE);
  pos += protocol::COMMAND_SIZE;

  // Printable ASCII up to the first NUL, NUL padding after it, and at least
  // one NUL within the 12 bytes
  bool found_nul = false;
  for (size_t i = 0; i < protocol::COMMAND_SIZE; ++i) {
    unsigned char c = static_cast<unsigned char>(header.command[i]);
    if (!found_nul) {
      if (c == '\0') {
        found_nul = true;
      } else if (c < 0x20 || c > 0x7e) {
        return false;
      }
    } else if (c != '\0') {
      return false;
    }
  }
  if (!found_nul) {
    return false;
  }

  header.length = endian::ReadLE32(data + pos);
  pos += 4;

  if (header.length > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    return false;
  }

  std::memcpy(header.checksum.data(), data + pos, protocol::CHECKSUM_SIZE);

  return true;
}

std::unique_ptr<Message> create_message(const std::string &command) {
  if (command == protocol::commands::HANDSHAKE)
    return std::make_unique<HandshakeMessage>();
  if (command == protocol::commands::STATUS)
    return std::make_unique<StatusMessage>();
  if (command == protocol::commands::BLOCK)
    return std::make_unique<BlockMessage>();
  if (command == protocol::commands::BLOCK_REQUEST)
    return std::make_unique<BlockRequestMessage>();
  if (command == protocol::commands::PING)
    return std::make_unique<PingMessage>();
  if (command == protocol::commands::PONG)
    return std::make_unique<PongMessage>();
  return nullptr;
}

std::vector<uint8_t> encode_frame(uint32_t magic, const Message &msg) {
  auto payload = msg.serialize();
  auto header = create_header(magic, msg.command(), payload);
  auto frame = serialize_header(header);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

namespace {

DecodedFrame MakeUnknown(std::string command, const uint8_t *payload, size_t size) {
  DecodedFrame out;
  out.valid = false;
  out.command = command;
  out.msg = std::make_unique<UnknownMessage>(
      std::move(command), std::vector<uint8_t>(payload, payload + size));
  return out;
}

} // namespace

DecodedFrame decode_frame(const std::vector<uint8_t> &frame, uint32_t magic) {
  protocol::MessageHeader header;
  if (!deserialize_header(frame.data(), frame.size(), header)) {
    return MakeUnknown("", frame.data(), frame.size());
  }

  const uint8_t *payload = frame.data() + protocol::MESSAGE_HEADER_SIZE;
  const size_t payload_size = frame.size() - protocol::MESSAGE_HEADER_SIZE;
  std::string command = header.get_command();

  if (header.magic != magic || header.length != payload_size ||
      compute_checksum(payload, payload_size) != header.checksum) {
    return MakeUnknown(std::move(command), payload, payload_size);
  }

  auto msg = create_message(command);
  if (!msg || !msg->deserialize(payload, payload_size)) {
    return MakeUnknown(std::move(command), payload, payload_size);
  }

  DecodedFrame out;
  out.valid = true;
  out.command = std::move(command);
  out.msg = std::move(msg);
  return out;
}

} // namespace message
} // namespace dropnet
