#pragma once

#include "util/endpoint.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace config {

using Millis = std::chrono::milliseconds;

constexpr std::size_t kDefaultChunkSize = 1024 * 1024;
constexpr std::size_t kMaxChunkSize = 8 * 1024 * 1024;
constexpr std::string_view kDefaultVault = "Obsidian";

// How the single shared connection is opened and kept alive.
struct ConnectionConfig {
    util::Endpoint endpoint;
    std::string token;
    std::string vault{kDefaultVault};
    std::string client_name{"vaultpush"};
    std::string client_version{"1.0.0"};
    Millis connect_timeout{10000};
    unsigned connect_attempts = 3;
    Millis connect_backoff{500};
    Millis keepalive_idle{30000};
};

// Per-file streaming policy.
struct TransferPolicy {
    std::size_t chunk_size = kDefaultChunkSize;
    Millis chunk_timeout{10000};
    Millis handshake_timeout{10000};
    // total sends of one chunk, the first one included
    unsigned chunk_attempts = 3;
    Millis retry_backoff{500};
};

struct ClientConfig {
    ConnectionConfig connection;
    TransferPolicy policy;
    // 0 means no limit
    std::size_t max_parallel_transfers = 0;
    std::string log_level{"warn"};
};

// Command-line values; they win over environment and settings file.
struct Overrides {
    std::optional<std::string> vault;
    std::optional<std::size_t> max_parallel_transfers;
    std::optional<std::string> log_level;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_environment();

// Builds the typed configuration from the settings document, the environment
// (VAULTPUSH_URL, VAULTPUSH_TOKEN, VAULTPUSH_VAULT) and overrides.
// Throws util::ConfigError on missing credentials or invalid values.
ClientConfig load_client_config(const nlohmann::json& settings,
                                const EnvLookup& env,
                                const Overrides& overrides = {});

bool is_valid_vault_name(std::string_view vault);

// Joins the optional prefix and the file's base name into a vault-relative path.
// Returns std::nullopt when the result would escape the vault root or is empty.
std::optional<std::string> resolve_destination(std::string_view prefix, std::string_view basename);

} // namespace config
