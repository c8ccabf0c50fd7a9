// Fuzz target for proxy frame decoding
// Every frame the proxy intercepts goes through decode_frame, so it must
// accept arbitrary bytes without crashing and always hand back a message

#include "network/message.hpp"
#include "network/protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace dropnet::message;
    using namespace dropnet::protocol;

    std::vector<uint8_t> frame(data, data + size);
    auto decoded = decode_frame(frame, magic::LOCALNET);

    if (!decoded.msg) {
        abort();
    }

    // A valid frame re-encodes to the same bytes
    if (decoded.valid) {
        auto reencoded = encode_frame(magic::LOCALNET, *decoded.msg);
        if (reencoded != frame) {
            abort();
        }
    }

    // Valid header followed by fuzz payload, for every known command
    static const char *kCommands[] = {commands::HANDSHAKE, commands::STATUS,
                                      commands::BLOCK, commands::BLOCK_REQUEST,
                                      commands::PING, commands::PONG};
    if (size > 0) {
        const char *command = kCommands[data[0] % 6];
        std::vector<uint8_t> payload(data + 1, data + size);
        auto header = create_header(magic::LOCALNET, command, payload);
        auto wrapped = serialize_header(header);
        wrapped.insert(wrapped.end(), payload.begin(), payload.end());

        auto inner = decode_frame(wrapped, magic::LOCALNET);
        if (!inner.msg || inner.command != command) {
            abort();
        }
    }

    return 0;
}
