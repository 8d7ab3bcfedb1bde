/// @file document_store.hpp
/// @brief In-memory registry of authoritative documents.

#pragma once

#include <canvas-sync/server/authoritative_document.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_sync::server {

/// Documents by id, created on first use and kept until removed.
///
/// References returned by open() and find() stay valid until the
/// document is removed.
class DocumentStore {
public:
    /// The document with this id, created empty if it does not exist.
    auto open(std::string_view document_id) -> AuthoritativeDocument&;

    /// The document with this id, or nullptr.
    auto find(std::string_view document_id) -> AuthoritativeDocument*;
    auto find(std::string_view document_id) const -> const AuthoritativeDocument*;

    /// Drop a document. @return True if it existed.
    auto remove(std::string_view document_id) -> bool;

    /// Ids of all documents, sorted.
    auto document_ids() const -> std::vector<std::string>;

    auto size() const -> std::size_t { return documents_.size(); }

private:
    std::map<std::string, std::unique_ptr<AuthoritativeDocument>, std::less<>> documents_;
};

}  // namespace canvas_sync::server
