// Fuzz target for snapshot expansion: arbitrary JSON is expanded into
// operations and merged, exercising the register and lifecycle checks.

#include <canvas-sync/document_state.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto elements = nlohmann::json::parse(data, data + size, nullptr, false);
    if (elements.is_discarded()) return 0;

    try {
        auto state = canvas_sync::DocumentState{};
        state.apply(canvas_sync::DocumentState::expand(elements));
        auto view = state.snapshot();
        (void)view;
    } catch (const std::invalid_argument&) {
        return 0;
    }

    return 0;
}
