#include "config/client_config.h"
#include "util/settings.h"
#include <cstdlib>
#include <fmt/format.h>
#include <limits>
#include <spdlog/spdlog.h>
#include <vector>

namespace config {
namespace {

constexpr std::string_view kEnvUrl = "VAULTPUSH_URL";
constexpr std::string_view kEnvToken = "VAULTPUSH_TOKEN";
constexpr std::string_view kEnvVault = "VAULTPUSH_VAULT";

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> read_string(const nlohmann::json& settings, const char* key) {
    const auto it = settings.find(key);
    if (it == settings.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw util::ConfigError(fmt::format("setting '{}' must be a string", key));
    }
    return non_empty(it->get<std::string>());
}

std::uint64_t read_unsigned(const nlohmann::json& settings,
                            const char* key,
                            std::uint64_t fallback,
                            std::uint64_t min,
                            std::uint64_t max) {
    const auto it = settings.find(key);
    if (it == settings.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw util::ConfigError(fmt::format("setting '{}' must be an integer", key));
    }
    if (it->is_number_unsigned() || it->get<std::int64_t>() >= 0) {
        const auto value = it->get<std::uint64_t>();
        if (value >= min && value <= max) {
            return value;
        }
    }
    throw util::ConfigError(
        fmt::format("setting '{}' out of range [{}, {}]: {}", key, min, max, it->dump()));
}

Millis read_millis(const nlohmann::json& settings, const char* key, Millis fallback) {
    constexpr std::uint64_t kOneHourMs = 3600 * 1000;
    return Millis(read_unsigned(settings,
                                key,
                                static_cast<std::uint64_t>(fallback.count()),
                                1,
                                kOneHourMs));
}

bool is_valid_log_level(std::string_view level) {
    static const std::vector<std::string_view> kLevels
        = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    for (const auto candidate : kLevels) {
        if (candidate == level) {
            return true;
        }
    }
    return false;
}
} // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

ClientConfig load_client_config(const nlohmann::json& settings,
                                const EnvLookup& env,
                                const Overrides& overrides) {
    if (!settings.is_object()) {
        throw util::ConfigError("settings must be a JSON object");
    }

    ClientConfig config;
    auto& connection = config.connection;
    auto& policy = config.policy;

    auto url = non_empty(env(std::string(kEnvUrl)));
    if (!url) {
        url = read_string(settings, "endpoint");
    }
    if (!url) {
        throw util::ConfigError(fmt::format("{} is not set", kEnvUrl));
    }
    auto endpoint = util::parse_endpoint(*url);
    if (!endpoint) {
        throw util::ConfigError("malformed endpoint: " + *url);
    }
    connection.endpoint = std::move(*endpoint);

    auto token = non_empty(env(std::string(kEnvToken)));
    if (!token) {
        token = read_string(settings, "token");
    }
    if (!token) {
        throw util::ConfigError(fmt::format("{} is not set", kEnvToken));
    }
    connection.token = std::move(*token);

    if (overrides.vault && !overrides.vault->empty()) {
        connection.vault = *overrides.vault;
    } else if (auto vault = non_empty(env(std::string(kEnvVault)))) {
        connection.vault = std::move(*vault);
    } else if (auto configured = read_string(settings, "vault")) {
        connection.vault = std::move(*configured);
    }

    connection.connect_timeout = read_millis(settings, "connect_timeout_ms", connection.connect_timeout);
    connection.connect_attempts = static_cast<unsigned>(
        read_unsigned(settings, "connect_attempts", connection.connect_attempts, 1, 100));
    connection.keepalive_idle = read_millis(settings, "keepalive_idle_ms", connection.keepalive_idle);

    policy.chunk_size = static_cast<std::size_t>(
        read_unsigned(settings, "chunk_size", policy.chunk_size, 1, kMaxChunkSize));
    policy.chunk_timeout = read_millis(settings, "chunk_timeout_ms", policy.chunk_timeout);
    policy.handshake_timeout = read_millis(settings, "handshake_timeout_ms", policy.handshake_timeout);
    policy.chunk_attempts = static_cast<unsigned>(
        read_unsigned(settings, "chunk_attempts", policy.chunk_attempts, 1, 100));
    policy.retry_backoff = read_millis(settings, "retry_backoff_ms", policy.retry_backoff);
    connection.connect_backoff = policy.retry_backoff;

    config.max_parallel_transfers = static_cast<std::size_t>(
        read_unsigned(settings,
                      "max_parallel_transfers",
                      0,
                      0,
                      std::numeric_limits<std::uint32_t>::max()));
    if (overrides.max_parallel_transfers) {
        config.max_parallel_transfers = *overrides.max_parallel_transfers;
    }

    if (auto level = read_string(settings, "log_level")) {
        config.log_level = std::move(*level);
    }
    if (overrides.log_level) {
        config.log_level = *overrides.log_level;
    }
    if (!is_valid_log_level(config.log_level)) {
        throw util::ConfigError("unknown log level: " + config.log_level);
    }

    spdlog::debug("[config::load_client_config] endpoint={} vault={} chunk_size={} attempts={}",
                  connection.endpoint.to_string(),
                  connection.vault,
                  policy.chunk_size,
                  policy.chunk_attempts);
    return config;
}

bool is_valid_vault_name(std::string_view vault) {
    if (vault.empty() || vault.size() > 255 || vault == "." || vault == "..") {
        return false;
    }
    for (const char c : vault) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || byte < 0x20 || byte == 0x7F) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> resolve_destination(std::string_view prefix, std::string_view basename) {
    while (!prefix.empty() && prefix.front() == '/') {
        prefix.remove_prefix(1);
    }
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    if (basename.empty()) {
        return std::nullopt;
    }

    std::string path = prefix.empty() ? std::string(basename)
                                      : fmt::format("{}/{}", prefix, basename);

    std::string_view rest = path;
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        const auto segment = rest.substr(0, slash);
        if (segment.empty() || segment == "." || segment == "..") {
            return std::nullopt;
        }
        if (segment.find('\\') != std::string_view::npos) {
            return std::nullopt;
        }
        if (slash == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(slash + 1);
    }
    return path;
}

} // namespace config
