#include <canvas-sync/server/document_store.hpp>

#include <canvas-sync/log.hpp>

namespace canvas_sync::server {

auto DocumentStore::open(std::string_view document_id) -> AuthoritativeDocument& {
    if (auto it = documents_.find(document_id); it != documents_.end()) return *it->second;

    auto id = std::string{document_id};
    logger("server")->info("created document {}", id);
    auto [it, inserted] = documents_.emplace(id, std::make_unique<AuthoritativeDocument>(id));
    return *it->second;
}

auto DocumentStore::find(std::string_view document_id) -> AuthoritativeDocument* {
    auto it = documents_.find(document_id);
    return it == documents_.end() ? nullptr : it->second.get();
}

auto DocumentStore::find(std::string_view document_id) const -> const AuthoritativeDocument* {
    auto it = documents_.find(document_id);
    return it == documents_.end() ? nullptr : it->second.get();
}

auto DocumentStore::remove(std::string_view document_id) -> bool {
    auto it = documents_.find(document_id);
    if (it == documents_.end()) return false;
    documents_.erase(it);
    return true;
}

auto DocumentStore::document_ids() const -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    ids.reserve(documents_.size());
    for (const auto& [id, doc] : documents_) ids.push_back(id);
    return ids;
}

}  // namespace canvas_sync::server
