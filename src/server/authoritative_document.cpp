#include <canvas-sync/server/authoritative_document.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>

namespace canvas_sync::server {

namespace {

constexpr auto checksum_digits = std::size_t{12};

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

AuthoritativeDocument::AuthoritativeDocument(std::string document_id)
    : document_id_{std::move(document_id)} {}

auto AuthoritativeDocument::apply(const Operation& op) -> bool {
    if (!state_.apply(op)) return false;
    log_.push_back(op);
    return true;
}

auto AuthoritativeDocument::apply(std::span<const Operation> ops) -> std::vector<Operation> {
    auto applied = std::vector<Operation>{};
    for (const auto& op : ops) {
        if (apply(op)) applied.push_back(op);
    }
    return applied;
}

auto AuthoritativeDocument::ops_since(std::uint64_t version) const -> std::vector<Operation> {
    if (version >= log_.size()) return {};
    return {log_.begin() + static_cast<std::ptrdiff_t>(version), log_.end()};
}

auto AuthoritativeDocument::snapshot() const -> SnapshotData {
    return SnapshotData{
        .document_id = document_id_,
        .version = version(),
        .elements = state_.to_json(),
    };
}

auto AuthoritativeDocument::state_vector() const -> StateVector {
    const auto content = state_.snapshot();
    return StateVector{
        .document_id = document_id_,
        .version = version(),
        .element_count = content.size(),
        .checksum = content_checksum(content),
    };
}

auto content_checksum(const nlohmann::json& content) -> std::string {
    // nlohmann::json objects iterate in key order, so dump() is canonical.
    const auto text = content.dump();

    auto ctx = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>{EVP_MD_CTX_new()};
    auto digest = std::array<unsigned char, EVP_MAX_MD_SIZE>{};
    auto length = 0u;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error{"SHA-256 digest failed"};
    }

    static constexpr char hex[] = "0123456789abcdef";
    auto out = std::string{};
    out.reserve(checksum_digits);
    for (auto i = 0u; i < length && out.size() < checksum_digits; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }
    return out;
}

}  // namespace canvas_sync::server
