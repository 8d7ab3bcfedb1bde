/// @file operation.hpp
/// @brief Operation types: OpType, Operation, and construction helpers.

#pragma once

#include <canvas-sync/clock.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace canvas_sync {

/// A property value. Any JSON value: scalar, array, or object.
using Value = nlohmann::json;

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    set,             ///< Overwrite one property of one element.
    del,             ///< Clear one property (value is null).
    add_element,     ///< Create an element; value holds its initial property map.
    remove_element,  ///< Remove an element.
};

/// Convert an OpType to its wire name.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::set:            return "set";
        case OpType::del:            return "delete";
        case OpType::add_element:    return "add_element";
        case OpType::remove_element: return "remove_element";
    }
    return "unknown";
}

/// Parse a wire name into an OpType, or nullopt if it names no operation.
auto parse_op_type(std::string_view name) -> std::optional<OpType>;

/// A single mutation of the shared document.
///
/// All four kinds share one record shape so they travel through the same
/// transport and conflict-resolution path; op_type only changes how the
/// value is interpreted. Element-level operations carry an empty prop.
/// Operations are immutable once created and idempotent when reapplied.
struct Operation {
    OpType op_type{OpType::set};  ///< The kind of mutation.
    std::string element_id;       ///< The target element.
    std::string prop;             ///< The target property (empty for element ops).
    Value value;                  ///< New value; initial props for add_element; null otherwise.
    ClockValue clock;             ///< Causal timestamp assigned when the op was issued.
    std::string origin;           ///< The node (session) that produced this op.

    auto operator==(const Operation&) const -> bool = default;
};

// -- Construction helpers -----------------------------------------------------

/// Build a `set` operation.
auto make_set(std::string element_id, std::string prop, Value value,
              ClockValue clock) -> Operation;

/// Build a `delete` operation.
auto make_delete(std::string element_id, std::string prop, ClockValue clock) -> Operation;

/// Build an `add_element` operation carrying the initial property map.
/// @param initial_props A JSON object; null is treated as an empty map.
auto make_add_element(std::string element_id, Value initial_props,
                      ClockValue clock) -> Operation;

/// Build a `remove_element` operation.
auto make_remove_element(std::string element_id, ClockValue clock) -> Operation;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const OpMessage& m) { ... },
///     [](const auto&) { ... },
/// }, message);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- JSON serialization (ADL) -------------------------------------------------

void to_json(nlohmann::json& j, const ClockValue& c);
void from_json(const nlohmann::json& j, ClockValue& c);

void to_json(nlohmann::json& j, OpType type);
void from_json(const nlohmann::json& j, OpType& type);

/// Encode an operation as `{op_type, element_id, prop, value, clock, origin}`.
void to_json(nlohmann::json& j, const Operation& op);

/// Decode an operation. Missing fields take their defaults (op_type `set`,
/// empty strings, zero clock).
/// @throws std::invalid_argument if a present field has the wrong type or
///   op_type names no operation.
void from_json(const nlohmann::json& j, Operation& op);

}  // namespace canvas_sync
