// Fuzz target for the client-to-server codec. Decoded messages are
// re-encoded and decoded again; the second decode must agree.

#include <canvas-sync/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto frame = std::string_view{reinterpret_cast<const char*>(data), size};

    auto msg = canvas_sync::decode_client_message(frame);
    if (!msg) return 0;

    auto again = canvas_sync::decode_client_message(canvas_sync::encode(*msg));
    if (!again || canvas_sync::action_name(*again) != canvas_sync::action_name(*msg)) std::abort();

    return 0;
}
