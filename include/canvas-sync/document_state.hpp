/// @file document_state.hpp
/// @brief Last-writer-wins document state: Register, ElementState, DocumentState.

#pragma once

#include <canvas-sync/clock.hpp>
#include <canvas-sync/operation.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_sync {

/// The currently winning (value, clock) pair for one key.
struct Register {
    Value value;        ///< The winning value (null after a delete).
    ClockValue clock;   ///< The clock of the operation that wrote it.

    auto operator==(const Register&) const -> bool = default;
};

/// The conflict rule: an incoming write wins iff no register exists yet
/// or its clock is strictly greater than the stored one under the
/// (physical, logical, node_id) order.
inline auto lww_wins(const Register* current, const ClockValue& incoming) -> bool {
    return current == nullptr || incoming > current->clock;
}

/// Per-element CRDT state.
///
/// The lifecycle register records element existence: add_element writes
/// `true`, remove_element writes `false`. Each property is an independent
/// register keyed by name.
struct ElementState {
    std::optional<Register> lifecycle;                        ///< Existence register.
    std::map<std::string, Register, std::less<>> properties;  ///< Property registers.

    /// True iff the lifecycle register exists and holds `true`.
    auto alive() const -> bool;

    auto operator==(const ElementState&) const -> bool = default;
};

/// A set of elements, each a map of last-writer-wins registers.
///
/// apply() is commutative, associative and idempotent over any set of
/// operations, so replicas that have applied the same operations hold
/// identical state regardless of delivery order.
class DocumentState {
public:
    DocumentState() = default;

    // -- Mutation -------------------------------------------------------------

    /// Apply one operation under the last-writer-wins rule.
    /// @return True if any register changed.
    auto apply(const Operation& op) -> bool;

    /// Apply a batch in order.
    /// @return The operations that changed state, in input order.
    auto apply(std::span<const Operation> ops) -> std::vector<Operation>;

    // -- Reading --------------------------------------------------------------

    /// The value of a property, or nullopt if unset or deleted.
    auto get(std::string_view element_id, std::string_view prop) const -> std::optional<Value>;

    /// The register for a property, or nullptr if it was never written.
    auto register_at(std::string_view element_id, std::string_view prop) const -> const Register*;

    /// The lifecycle register of an element, or nullptr if none was written.
    auto lifecycle(std::string_view element_id) const -> const Register*;

    /// True if the element is live.
    auto exists(std::string_view element_id) const -> bool;

    /// Ids of all live elements, sorted.
    auto element_ids() const -> std::vector<std::string>;

    /// The non-null properties of a live element as a JSON object,
    /// or nullopt if the element is not live.
    auto properties(std::string_view element_id) const -> std::optional<nlohmann::json>;

    /// Number of element entries tracked (live or not).
    auto size() const -> std::size_t { return elements_.size(); }

    /// Plain view of the live document: `{element_id: {prop: value}}`.
    auto snapshot() const -> nlohmann::json;

    /// Full state including clocks:
    /// `{element_id: {alive, lifecycle, registers: {prop: {value, clock}}}}`.
    auto to_json() const -> nlohmann::json;

    /// Expand a full state (as produced by to_json()) into the operations
    /// that rebuild it.
    /// @throws std::invalid_argument if the structure is malformed.
    static auto expand(const nlohmann::json& elements) -> std::vector<Operation>;

    auto operator==(const DocumentState&) const -> bool = default;

private:
    auto find(std::string_view element_id) const -> const ElementState*;

    std::map<std::string, ElementState, std::less<>> elements_;
};

void to_json(nlohmann::json& j, const Register& r);
void from_json(const nlohmann::json& j, Register& r);

}  // namespace canvas_sync
