#include <canvas-sync/operation.hpp>

#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace canvas_sync {

namespace {

// Read an optional field, keeping `out` at its default when absent or null.
template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) {
            throw std::invalid_argument{std::string{"field '"} + key + "' must be a string"};
        }
    } else if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) {
            throw std::invalid_argument{std::string{"field '"} + key + "' must be a non-negative integer"};
        }
    } else {
        if (!it->is_number_integer()) {
            throw std::invalid_argument{std::string{"field '"} + key + "' must be an integer"};
        }
    }
    out = it->get<T>();
}

}  // anonymous namespace

auto parse_op_type(std::string_view name) -> std::optional<OpType> {
    if (name == "set")            return OpType::set;
    if (name == "delete")         return OpType::del;
    if (name == "add_element")    return OpType::add_element;
    if (name == "remove_element") return OpType::remove_element;
    return std::nullopt;
}

auto make_set(std::string element_id, std::string prop, Value value,
              ClockValue clock) -> Operation {
    auto origin = clock.node_id;
    return Operation{
        .op_type = OpType::set,
        .element_id = std::move(element_id),
        .prop = std::move(prop),
        .value = std::move(value),
        .clock = std::move(clock),
        .origin = std::move(origin),
    };
}

auto make_delete(std::string element_id, std::string prop, ClockValue clock) -> Operation {
    auto origin = clock.node_id;
    return Operation{
        .op_type = OpType::del,
        .element_id = std::move(element_id),
        .prop = std::move(prop),
        .value = nullptr,
        .clock = std::move(clock),
        .origin = std::move(origin),
    };
}

auto make_add_element(std::string element_id, Value initial_props,
                      ClockValue clock) -> Operation {
    if (initial_props.is_null()) initial_props = nlohmann::json::object();
    auto origin = clock.node_id;
    return Operation{
        .op_type = OpType::add_element,
        .element_id = std::move(element_id),
        .prop = {},
        .value = std::move(initial_props),
        .clock = std::move(clock),
        .origin = std::move(origin),
    };
}

auto make_remove_element(std::string element_id, ClockValue clock) -> Operation {
    auto origin = clock.node_id;
    return Operation{
        .op_type = OpType::remove_element,
        .element_id = std::move(element_id),
        .prop = {},
        .value = nullptr,
        .clock = std::move(clock),
        .origin = std::move(origin),
    };
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const ClockValue& c) {
    j = nlohmann::json{
        {"physical", c.physical},
        {"logical", c.logical},
        {"node_id", c.node_id},
    };
}

void from_json(const nlohmann::json& j, ClockValue& c) {
    if (!j.is_object()) throw std::invalid_argument{"clock must be an object"};
    c = ClockValue{};
    read_field(j, "physical", c.physical);
    read_field(j, "logical", c.logical);
    read_field(j, "node_id", c.node_id);
    // An unsigned value above INT64_MAX reads back negative.
    if (c.physical < 0) throw std::invalid_argument{"clock physical time out of range"};
    if (c.logical == std::numeric_limits<std::uint64_t>::max()) {
        throw std::invalid_argument{"clock logical counter out of range"};
    }
}

void to_json(nlohmann::json& j, OpType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const nlohmann::json& j, OpType& type) {
    if (!j.is_string()) throw std::invalid_argument{"op_type must be a string"};
    auto parsed = parse_op_type(j.get_ref<const std::string&>());
    if (!parsed) {
        throw std::invalid_argument{"unknown op_type: " + j.get<std::string>()};
    }
    type = *parsed;
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"op_type", op.op_type},
        {"element_id", op.element_id},
        {"prop", op.prop},
        {"value", op.value},
        {"clock", op.clock},
        {"origin", op.origin},
    };
}

void from_json(const nlohmann::json& j, Operation& op) {
    if (!j.is_object()) throw std::invalid_argument{"operation must be an object"};
    op = Operation{};
    if (auto it = j.find("op_type"); it != j.end() && !it->is_null()) {
        from_json(*it, op.op_type);
    }
    read_field(j, "element_id", op.element_id);
    read_field(j, "prop", op.prop);
    read_field(j, "origin", op.origin);
    if (auto it = j.find("value"); it != j.end()) op.value = *it;
    if (auto it = j.find("clock"); it != j.end() && !it->is_null()) {
        from_json(*it, op.clock);
    }
}

}  // namespace canvas_sync
