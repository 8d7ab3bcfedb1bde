#include <canvas-sync/document_state.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace canvas_sync {

namespace {

auto write_property(ElementState& element, std::string_view prop, const Value& value,
                    const ClockValue& clock) -> bool {
    auto it = element.properties.find(prop);
    if (it == element.properties.end()) {
        element.properties.emplace(std::string{prop}, Register{value, clock});
        return true;
    }
    if (!lww_wins(&it->second, clock)) return false;
    it->second = Register{value, clock};
    return true;
}

auto write_lifecycle(ElementState& element, bool alive, const ClockValue& clock) -> bool {
    const auto* current = element.lifecycle ? &*element.lifecycle : nullptr;
    if (!lww_wins(current, clock)) return false;
    element.lifecycle = Register{alive, clock};
    return true;
}

}  // anonymous namespace

// =============================================================================
// ElementState
// =============================================================================

auto ElementState::alive() const -> bool {
    return lifecycle && lifecycle->value.is_boolean() && lifecycle->value.get<bool>();
}

// =============================================================================
// DocumentState: mutation
// =============================================================================

auto DocumentState::apply(const Operation& op) -> bool {
    auto it = elements_.find(op.element_id);
    if (it == elements_.end()) {
        it = elements_.emplace(op.element_id, ElementState{}).first;
    }
    auto& element = it->second;

    switch (op.op_type) {
        case OpType::set:
            return write_property(element, op.prop, op.value, op.clock);
        case OpType::del:
            return write_property(element, op.prop, nullptr, op.clock);
        case OpType::add_element: {
            auto changed = write_lifecycle(element, true, op.clock);
            // Initial properties are independent registers: each one is
            // merged on its own, whatever the lifecycle outcome.
            if (op.value.is_object()) {
                for (auto prop = op.value.begin(); prop != op.value.end(); ++prop) {
                    changed = write_property(element, prop.key(), prop.value(), op.clock) || changed;
                }
            }
            return changed;
        }
        case OpType::remove_element:
            return write_lifecycle(element, false, op.clock);
    }
    return false;
}

auto DocumentState::apply(std::span<const Operation> ops) -> std::vector<Operation> {
    auto applied = std::vector<Operation>{};
    for (const auto& op : ops) {
        if (apply(op)) applied.push_back(op);
    }
    return applied;
}

// =============================================================================
// DocumentState: reading
// =============================================================================

auto DocumentState::find(std::string_view element_id) const -> const ElementState* {
    auto it = elements_.find(element_id);
    return it != elements_.end() ? &it->second : nullptr;
}

auto DocumentState::get(std::string_view element_id, std::string_view prop) const
    -> std::optional<Value> {
    const auto* reg = register_at(element_id, prop);
    if (!reg || reg->value.is_null()) return std::nullopt;
    return reg->value;
}

auto DocumentState::register_at(std::string_view element_id, std::string_view prop) const
    -> const Register* {
    const auto* element = find(element_id);
    if (!element) return nullptr;
    auto it = element->properties.find(prop);
    return it != element->properties.end() ? &it->second : nullptr;
}

auto DocumentState::lifecycle(std::string_view element_id) const -> const Register* {
    const auto* element = find(element_id);
    if (!element || !element->lifecycle) return nullptr;
    return &*element->lifecycle;
}

auto DocumentState::exists(std::string_view element_id) const -> bool {
    const auto* element = find(element_id);
    return element && element->alive();
}

auto DocumentState::element_ids() const -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    for (const auto& [id, element] : elements_) {
        if (element.alive()) ids.push_back(id);
    }
    return ids;
}

auto DocumentState::properties(std::string_view element_id) const
    -> std::optional<nlohmann::json> {
    const auto* element = find(element_id);
    if (!element || !element->alive()) return std::nullopt;
    auto result = nlohmann::json::object();
    for (const auto& [prop, reg] : element->properties) {
        if (!reg.value.is_null()) result[prop] = reg.value;
    }
    return result;
}

auto DocumentState::snapshot() const -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [id, element] : elements_) {
        if (auto props = properties(id)) result[id] = std::move(*props);
    }
    return result;
}

auto DocumentState::to_json() const -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [id, element] : elements_) {
        auto registers = nlohmann::json::object();
        for (const auto& [prop, reg] : element.properties) {
            registers[prop] = reg;
        }
        result[id] = nlohmann::json{
            {"alive", element.alive()},
            {"lifecycle", element.lifecycle ? nlohmann::json(*element.lifecycle) : nlohmann::json()},
            {"registers", std::move(registers)},
        };
    }
    return result;
}

auto DocumentState::expand(const nlohmann::json& elements) -> std::vector<Operation> {
    if (!elements.is_object()) {
        throw std::invalid_argument{"elements must be an object"};
    }
    auto ops = std::vector<Operation>{};
    for (auto entry = elements.begin(); entry != elements.end(); ++entry) {
        const auto& element_id = entry.key();
        const auto& body = entry.value();
        if (!body.is_object()) {
            throw std::invalid_argument{"element '" + element_id + "' must be an object"};
        }

        if (auto it = body.find("lifecycle"); it != body.end() && !it->is_null()) {
            auto reg = it->get<Register>();
            if (reg.value.is_boolean() && reg.value.get<bool>()) {
                ops.push_back(make_add_element(element_id, nlohmann::json::object(), reg.clock));
            } else {
                ops.push_back(make_remove_element(element_id, reg.clock));
            }
        }

        auto it = body.find("registers");
        if (it == body.end() || it->is_null()) continue;
        if (!it->is_object()) {
            throw std::invalid_argument{"registers of '" + element_id + "' must be an object"};
        }
        for (auto prop = it->begin(); prop != it->end(); ++prop) {
            auto reg = prop.value().get<Register>();
            if (reg.value.is_null()) {
                ops.push_back(make_delete(element_id, prop.key(), std::move(reg.clock)));
            } else {
                ops.push_back(make_set(element_id, prop.key(), std::move(reg.value),
                                       std::move(reg.clock)));
            }
        }
    }
    return ops;
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Register& r) {
    j = nlohmann::json{{"value", r.value}, {"clock", r.clock}};
}

void from_json(const nlohmann::json& j, Register& r) {
    if (!j.is_object()) throw std::invalid_argument{"register must be an object"};
    r = Register{};
    if (auto it = j.find("value"); it != j.end()) r.value = *it;
    if (auto it = j.find("clock"); it != j.end() && !it->is_null()) {
        from_json(*it, r.clock);
    }
}

}  // namespace canvas_sync
