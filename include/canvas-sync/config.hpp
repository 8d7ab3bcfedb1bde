/// @file config.hpp
/// @brief Engine and server configuration, loaded from JSON files.

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace canvas_sync {

/// Settings for one Engine.
///
/// JSON keys match the member names, with the backoff delays given in
/// milliseconds as `initial_backoff_ms` and `max_backoff_ms`.
struct EngineConfig {
    std::string server{"ws://localhost:8765"};  ///< Base URL used when `url` is empty.
    std::string url;                            ///< Full endpoint; overrides `server`.
    std::string document_id;
    std::string node_id;                        ///< Empty: a random UUID is generated.
    std::chrono::milliseconds initial_backoff{std::chrono::seconds{1}};
    std::chrono::milliseconds max_backoff{std::chrono::seconds{30}};
    std::size_t pending_capacity{10000};        ///< 0 = unbounded.
    std::string log_level{"info"};
};

/// Settings for the sync server.
struct ServerConfig {
    std::string address{"0.0.0.0"};
    std::uint16_t port{8765};
    std::string log_level{"info"};
    std::size_t max_queued_frames{1024};  ///< Per-connection outbound limit.
    bool release_idle_documents{false};   ///< Free a document when its last session leaves.
};

/// The document endpoint under a server base URL:
/// `<base>/ws/project/<document_id>/crdt/`.
auto endpoint_url(std::string_view base, std::string_view document_id) -> std::string;

/// A random node id (UUID string).
auto generate_node_id() -> std::string;

/// Fill in the derived fields: `url` from `server` and `document_id` when
/// empty, `node_id` with a fresh UUID when empty.
auto resolve(EngineConfig config) -> EngineConfig;

/// Load an EngineConfig from a JSON file. Missing keys keep their defaults.
/// @throws std::runtime_error if the file cannot be read or a value has the wrong type.
auto load_engine_config(const std::string& path) -> EngineConfig;

/// Load a ServerConfig from a JSON file. Missing keys keep their defaults.
/// @throws std::runtime_error if the file cannot be read or a value has the wrong type.
auto load_server_config(const std::string& path) -> ServerConfig;

void from_json(const nlohmann::json& j, EngineConfig& config);
void from_json(const nlohmann::json& j, ServerConfig& config);

}  // namespace canvas_sync
