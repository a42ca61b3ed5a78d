#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace util {

constexpr std::uint16_t kDefaultServicePort = 4000;

struct Endpoint {
    std::string scheme;
    std::string host;
    std::uint16_t port = kDefaultServicePort;

    std::string to_string() const;
};

// Accepts "[scheme://]host[:port][/path]" with scheme tcp, ws, wss, http or https.
// IPv6 literals must be bracketed. Returns std::nullopt on malformed input.
std::optional<Endpoint> parse_endpoint(std::string_view url);

} // namespace util
