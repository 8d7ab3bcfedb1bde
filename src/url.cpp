#include <canvas-sync/url.hpp>

#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace canvas_sync {

namespace {

auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto percent_decode(std::string_view in) -> std::string {
    auto out = std::string{};
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size()) {
            const auto hi = hex_digit(in[i + 1]);
            const auto lo = hex_digit(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out += in[i];
                continue;
            }
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

auto fail(std::string_view url, std::string_view why) -> std::runtime_error {
    return std::runtime_error{"invalid url '" + std::string{url} + "': " + std::string{why}};
}

}  // namespace

auto parse_url(std::string_view url) -> Url {
    auto result = Url{};

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) throw fail(url, "missing scheme");
    result.scheme = std::string{url.substr(0, scheme_end)};
    if (result.scheme != "ws" && result.scheme != "wss") {
        throw fail(url, "scheme must be ws or wss");
    }

    auto rest = url.substr(scheme_end + 3);
    const auto target_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, target_start);
    if (target_start != std::string_view::npos) {
        result.target = std::string{rest.substr(target_start)};
        if (result.target.front() == '?') result.target.insert(0, 1, '/');
    }

    auto port_text = std::string_view{};
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) throw fail(url, "unterminated IPv6 address");
        result.host = std::string{authority.substr(1, close - 1)};
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') throw fail(url, "unexpected text after host");
            port_text = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        result.host = std::string{authority.substr(0, colon)};
        if (colon != std::string_view::npos) port_text = authority.substr(colon + 1);
    }
    if (result.host.empty()) throw fail(url, "empty host");

    if (port_text.empty()) {
        result.port = result.secure() ? 443 : 80;
    } else {
        auto port = unsigned{0};
        const auto* end = port_text.data() + port_text.size();
        auto [ptr, ec] = std::from_chars(port_text.data(), end, port);
        if (ec != std::errc{} || ptr != end || port == 0 || port > 65535) {
            throw fail(url, "bad port");
        }
        result.port = static_cast<std::uint16_t>(port);
    }
    return result;
}

auto target_path(std::string_view target) -> std::string_view {
    return target.substr(0, target.find('?'));
}

auto query_parameter(std::string_view target, std::string_view key) -> std::optional<std::string> {
    const auto query_start = target.find('?');
    if (query_start == std::string_view::npos) return std::nullopt;

    auto query = target.substr(query_start + 1);
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        const auto eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
            return eq == std::string_view::npos ? std::string{} : percent_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

}  // namespace canvas_sync
