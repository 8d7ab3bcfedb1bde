// Fuzz target for the server-to-client codec. Frames from an untrusted
// server must be rejected, never crash the client.

#include <canvas-sync/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto frame = std::string_view{reinterpret_cast<const char*>(data), size};

    auto msg = canvas_sync::decode_server_message(frame);
    if (msg) {
        auto encoded = canvas_sync::encode(*msg);
        (void)encoded;
    }

    return 0;
}
