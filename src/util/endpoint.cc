#include "util/endpoint.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fmt/format.h>

namespace util {
namespace {
constexpr std::array<std::string_view, 5> kSchemes = {"tcp", "ws", "wss", "http", "https"};

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<std::uint16_t> parse_port(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}
} // namespace

std::string Endpoint::to_string() const {
    const bool v6 = host.find(':') != std::string::npos;
    return fmt::format("{}://{}{}{}:{}",
                       scheme.empty() ? "tcp" : scheme,
                       v6 ? "[" : "",
                       host,
                       v6 ? "]" : "",
                       port);
}

std::optional<Endpoint> parse_endpoint(std::string_view url) {
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.front()))) {
        url.remove_prefix(1);
    }
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back()))) {
        url.remove_suffix(1);
    }

    Endpoint endpoint;
    if (const auto sep = url.find("://"); sep != std::string_view::npos) {
        endpoint.scheme = lowercase(url.substr(0, sep));
        if (std::find(kSchemes.begin(), kSchemes.end(), endpoint.scheme) == kSchemes.end()) {
            return std::nullopt;
        }
        url.remove_prefix(sep + 3);
    }

    if (const auto slash = url.find('/'); slash != std::string_view::npos) {
        url = url.substr(0, slash);
    }
    if (url.empty()) {
        return std::nullopt;
    }

    std::string_view host = url;
    std::string_view port;
    if (url.front() == '[') {
        const auto close = url.find(']');
        if (close == std::string_view::npos || close == 1) {
            return std::nullopt;
        }
        host = url.substr(1, close - 1);
        const auto rest = url.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::nullopt;
            }
            port = rest.substr(1);
            if (port.empty()) {
                return std::nullopt;
            }
        }
    } else if (const auto colon = url.rfind(':'); colon != std::string_view::npos) {
        if (url.find(':') != colon) {
            // unbracketed IPv6 literal
            return std::nullopt;
        }
        host = url.substr(0, colon);
        port = url.substr(colon + 1);
        if (port.empty()) {
            return std::nullopt;
        }
    }

    if (host.empty()) {
        return std::nullopt;
    }
    endpoint.host = std::string(host);
    if (!port.empty()) {
        auto parsed = parse_port(port);
        if (!parsed) {
            return std::nullopt;
        }
        endpoint.port = *parsed;
    }
    return endpoint;
}

} // namespace util
