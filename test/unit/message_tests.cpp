// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for network/message - primitives, payloads and frame decoding

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"

using namespace dropnet;
using namespace dropnet::message;

namespace {

chain::BlockV1 MakeBlock(uint64_t height) {
    chain::BlockV1 block;
    block.header.inner_lite.height = height;
    block.header.inner_lite.producer = static_cast<uint32_t>(height % 4);
    block.header.num_shards = 1;
    block.header.chunk_mask = 1;
    block.chunks.push_back(chain::ChunkHeader{0, height});
    return block;
}

constexpr uint32_t kMagic = protocol::magic::LOCALNET;

} // namespace

TEST_CASE("VarInt - encoding boundaries", "[network][message]") {
    uint8_t buffer[9];

    SECTION("Sizes") {
        REQUIRE(VarInt(0xfc).encoded_size() == 1);
        REQUIRE(VarInt(0xfd).encoded_size() == 3);
        REQUIRE(VarInt(0x10000).encoded_size() == 5);
        REQUIRE(VarInt(0x100000000ULL).encoded_size() == 9);
    }

    SECTION("Decode what was encoded") {
        for (uint64_t v : {0ULL, 0xfcULL, 0xfdULL, 0xffffULL, 0x10000ULL, 0x100000000ULL}) {
            VarInt in(v);
            size_t n = in.encode(buffer);
            VarInt out;
            REQUIRE(out.decode(buffer, n) == n);
            REQUIRE(out.value == v);
        }
    }

    SECTION("Non-canonical encoding is rejected") {
        buffer[0] = 0xfd;
        endian::WriteLE16(buffer + 1, 0x10);
        VarInt out;
        REQUIRE(out.decode(buffer, 3) == 0);
    }

    SECTION("Truncated input is rejected") {
        buffer[0] = 0xfe;
        VarInt out;
        REQUIRE(out.decode(buffer, 3) == 0);
        REQUIRE(out.decode(buffer, 0) == 0);
    }
}

TEST_CASE("MessageDeserializer - reads past the end set the error flag", "[network][message]") {
    std::vector<uint8_t> data = {1, 2, 3};
    MessageDeserializer d(data);
    REQUIRE(d.read_uint8() == 1);
    REQUIRE(d.read_uint8() == 2);
    REQUIRE_FALSE(d.has_error());
    REQUIRE(d.bytes_remaining() == 1);
    REQUIRE(d.read_uint32() == 0);
    REQUIRE(d.has_error());
    REQUIRE(d.bytes_remaining() == 1);
}

TEST_CASE("MessageDeserializer - string length limit", "[network][message]") {
    MessageSerializer s;
    s.write_string(std::string(300, 'a'));
    MessageDeserializer d(s.data());
    d.read_string(protocol::MAX_USER_AGENT_LENGTH);
    REQUIRE(d.has_error());
}

TEST_CASE("Payloads - fixed sizes", "[network][message]") {
    REQUIRE(StatusMessage(7, 9).serialize().size() == 12);
    REQUIRE(BlockRequestMessage(3).serialize().size() == 8);
    REQUIRE(PingMessage(1).serialize().size() == 8);

    SECTION("Wrong size payloads fail") {
        std::vector<uint8_t> seven(7, 0);
        StatusMessage status;
        REQUIRE_FALSE(status.deserialize(seven.data(), seven.size()));
        PongMessage pong;
        REQUIRE_FALSE(pong.deserialize(seven.data(), seven.size()));
    }

    SECTION("Handshake rejects trailing bytes") {
        HandshakeMessage hs;
        hs.node_id = 3;
        auto bytes = hs.serialize();
        bytes.push_back(0);
        HandshakeMessage out;
        REQUIRE_FALSE(out.deserialize(bytes.data(), bytes.size()));
    }

    SECTION("Handshake carries the user agent") {
        HandshakeMessage hs;
        REQUIRE_FALSE(hs.user_agent.empty());
        REQUIRE(hs.version == protocol::PROTOCOL_VERSION);
    }
}

TEST_CASE("create_message - known commands", "[network][message]") {
    REQUIRE(create_message("handshake") != nullptr);
    REQUIRE(create_message("status") != nullptr);
    REQUIRE(create_message("block") != nullptr);
    REQUIRE(create_message("blockreq") != nullptr);
    REQUIRE(create_message("ping") != nullptr);
    REQUIRE(create_message("pong") != nullptr);
    REQUIRE(create_message("verack") == nullptr);
}

TEST_CASE("Frame header layout", "[network][message]") {
    auto frame = encode_frame(kMagic, PingMessage(42));
    REQUIRE(frame.size() == protocol::MESSAGE_HEADER_SIZE + 8);
    REQUIRE(endian::ReadLE32(frame.data()) == kMagic);
    REQUIRE(std::string(reinterpret_cast<const char *>(frame.data() + 4)) == "ping");
    REQUIRE(endian::ReadLE32(frame.data() + 16) == 8);

    protocol::MessageHeader header;
    REQUIRE(deserialize_header(frame.data(), frame.size(), header));
    REQUIRE(header.get_command() == "ping");
    REQUIRE(header.checksum == compute_checksum(frame.data() + 24, 8));
}

TEST_CASE("decode_frame - valid frames", "[network][message]") {
    SECTION("Block frame exposes the height") {
        auto frame = encode_frame(kMagic, BlockMessage(MakeBlock(11)));
        auto decoded = decode_frame(frame, kMagic);
        REQUIRE(decoded.valid);
        REQUIRE(decoded.command == "block");
        auto *block = dynamic_cast<BlockMessage *>(decoded.msg.get());
        REQUIRE(block != nullptr);
        REQUIRE(block->block.header.inner_lite.height == 11);
        REQUIRE(block->block == MakeBlock(11));
    }

    SECTION("Status frame") {
        auto decoded = decode_frame(encode_frame(kMagic, StatusMessage(5, 0xabcd)), kMagic);
        REQUIRE(decoded.valid);
        auto *status = dynamic_cast<StatusMessage *>(decoded.msg.get());
        REQUIRE(status != nullptr);
        REQUIRE(status->head_height == 5);
        REQUIRE(status->head_hash == 0xabcd);
    }
}

TEST_CASE("decode_frame - rejected frames become unknown messages", "[network][message]") {
    auto frame = encode_frame(kMagic, BlockMessage(MakeBlock(3)));

    auto expect_invalid = [](const DecodedFrame &decoded) {
        REQUIRE_FALSE(decoded.valid);
        REQUIRE(decoded.msg != nullptr);
        REQUIRE(dynamic_cast<UnknownMessage *>(decoded.msg.get()) != nullptr);
    };

    SECTION("Shorter than a header") {
        std::vector<uint8_t> tiny(10, 0);
        auto decoded = decode_frame(tiny, kMagic);
        expect_invalid(decoded);
        REQUIRE(decoded.command.empty());
    }

    SECTION("Wrong magic") {
        auto decoded = decode_frame(frame, kMagic + 1);
        expect_invalid(decoded);
        REQUIRE(decoded.command == "block");
    }

    SECTION("Corrupted payload fails the checksum") {
        frame.back() ^= 0xff;
        expect_invalid(decode_frame(frame, kMagic));
    }

    SECTION("Length field disagrees with the frame") {
        frame.push_back(0);
        expect_invalid(decode_frame(frame, kMagic));
    }

    SECTION("Unprintable command") {
        frame[4] = 0x01;
        auto decoded = decode_frame(frame, kMagic);
        expect_invalid(decoded);
        REQUIRE(decoded.command.empty());
    }

    SECTION("Unknown command keeps its name and payload") {
        UnknownMessage custom("mystery", {1, 2, 3});
        auto decoded = decode_frame(encode_frame(kMagic, custom), kMagic);
        expect_invalid(decoded);
        REQUIRE(decoded.command == "mystery");
        REQUIRE(decoded.msg->serialize() == std::vector<uint8_t>{1, 2, 3});
    }

    SECTION("Known command with an undecodable payload") {
        UnknownMessage bad("block", {1, 2, 3});
        auto decoded = decode_frame(encode_frame(kMagic, bad), kMagic);
        expect_invalid(decoded);
        REQUIRE(decoded.command == "block");
    }
}
