/// @file authoritative_document.hpp
/// @brief The server's copy of one document and its operation log.

#pragma once

#include <canvas-sync/document_state.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace canvas_sync::server {

/// The authoritative replica of a document.
///
/// Operations go through the same last-writer-wins rule as on clients.
/// Every operation that changes the state is appended to the log, and
/// the version is the length of that log, so it only ever grows.
class AuthoritativeDocument {
public:
    explicit AuthoritativeDocument(std::string document_id);

    /// Apply one operation; log it if it changed the state.
    auto apply(const Operation& op) -> bool;

    /// Apply a batch in order.
    /// @return The operations that changed the state.
    auto apply(std::span<const Operation> ops) -> std::vector<Operation>;

    /// Number of state-changing operations applied so far.
    auto version() const -> std::uint64_t { return log_.size(); }

    /// The logged operations after `version` (empty if `version` is current or ahead).
    auto ops_since(std::uint64_t version) const -> std::vector<Operation>;

    /// Full state with clocks, for a `snapshot` frame.
    auto snapshot() const -> SnapshotData;

    /// Version, live element count and a checksum of the live content.
    auto state_vector() const -> StateVector;

    auto document_id() const -> const std::string& { return document_id_; }
    auto state() const -> const DocumentState& { return state_; }

private:
    std::string document_id_;
    DocumentState state_;
    std::vector<Operation> log_;
};

/// First 12 hex digits of the SHA-256 of the compact, key-sorted JSON of `content`.
auto content_checksum(const nlohmann::json& content) -> std::string;

}  // namespace canvas_sync::server
