#include <canvas-sync/config.hpp>

#include <canvas-sync/log.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace canvas_sync {

namespace {

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_string()) {
        throw std::invalid_argument{std::string{"'"} + key + "' must be a string"};
    }
    out = it->get<std::string>();
}

void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_boolean()) {
        throw std::invalid_argument{std::string{"'"} + key + "' must be a boolean"};
    }
    out = it->get<bool>();
}

auto read_unsigned(const nlohmann::json& j, const char* key) -> std::optional<std::uint64_t> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument{std::string{"'"} + key + "' must be a non-negative integer"};
    }
    return it->get<std::uint64_t>();
}

template <typename Config>
auto load(const std::string& path) -> Config {
    auto in = std::ifstream{path};
    if (!in) throw std::runtime_error{"cannot open config file: " + path};

    try {
        auto j = nlohmann::json::parse(in);
        if (!j.is_object()) throw std::invalid_argument{"top level must be an object"};
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error{"invalid config " + path + ": " + e.what()};
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error{"invalid config " + path + ": " + e.what()};
    }
}

}  // namespace

auto endpoint_url(std::string_view base, std::string_view document_id) -> std::string {
    auto url = std::string{base};
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/ws/project/";
    url += document_id;
    url += "/crdt/";
    return url;
}

auto generate_node_id() -> std::string {
    return boost::uuids::to_string(boost::uuids::random_generator{}());
}

auto resolve(EngineConfig config) -> EngineConfig {
    if (config.url.empty()) config.url = endpoint_url(config.server, config.document_id);
    if (config.node_id.empty()) {
        config.node_id = generate_node_id();
        logger("engine")->debug("generated node id {}", config.node_id);
    }
    return config;
}

auto load_engine_config(const std::string& path) -> EngineConfig {
    return load<EngineConfig>(path);
}

auto load_server_config(const std::string& path) -> ServerConfig {
    return load<ServerConfig>(path);
}

void from_json(const nlohmann::json& j, EngineConfig& config) {
    config = EngineConfig{};
    read_string(j, "server", config.server);
    read_string(j, "url", config.url);
    read_string(j, "document_id", config.document_id);
    read_string(j, "node_id", config.node_id);
    read_string(j, "log_level", config.log_level);
    if (auto ms = read_unsigned(j, "initial_backoff_ms")) {
        config.initial_backoff = std::chrono::milliseconds{*ms};
    }
    if (auto ms = read_unsigned(j, "max_backoff_ms")) {
        config.max_backoff = std::chrono::milliseconds{*ms};
    }
    if (auto capacity = read_unsigned(j, "pending_capacity")) {
        config.pending_capacity = static_cast<std::size_t>(*capacity);
    }
}

void from_json(const nlohmann::json& j, ServerConfig& config) {
    config = ServerConfig{};
    read_string(j, "address", config.address);
    read_string(j, "log_level", config.log_level);
    if (auto port = read_unsigned(j, "port")) {
        if (*port > std::numeric_limits<std::uint16_t>::max()) {
            throw std::invalid_argument{"'port' is out of range"};
        }
        config.port = static_cast<std::uint16_t>(*port);
    }
    if (auto frames = read_unsigned(j, "max_queued_frames")) {
        config.max_queued_frames = static_cast<std::size_t>(*frames);
    }
    read_bool(j, "release_idle_documents", config.release_idle_documents);
}

}  // namespace canvas_sync
