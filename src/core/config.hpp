/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization and environment
 *        overrides.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace lanwake {

struct NetworkConfig {
    std::vector<std::string> default_interfaces;   ///< Empty = all interfaces
    bool enable_per_host_interfaces = false;
    bool readonly_mode = false;
};

struct ProbeConfig {
    uint32_t timeout_seconds = 5;            ///< Overall probe deadline, 1..60
    uint32_t cache_ttl_multiplier = 2;       ///< TTL = timeout * multiplier
    uint32_t icmp_timeout_seconds = 2;       ///< Post-scan ICMP verification
    uint32_t scan_workers = 10;
    uint32_t coalesce_grace_seconds = 5;     ///< Extra wait for coalesced callers
    uint32_t sweep_interval_seconds = 30;
};

struct WakeConfig {
    std::string default_broadcast = "255.255.255.255:9";
    uint32_t history_capacity = 100;
};

struct TelemetryConfig {
    std::string log_output = "stdout";       ///< "stdout", "file", "both"
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 100;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    NetworkConfig network;
    ProbeConfig probe;
    WakeConfig wake;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Does not validate; call
 * validate_config() after applying overrides.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/// Looks up an environment variable by name.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// EnvLookup backed by the process environment.
std::optional<std::string> process_env(std::string_view name);

/**
 * @brief Apply DEFAULT_NETWORK_INTERFACE, ENABLE_PER_HOST_INTERFACES,
 *        READONLY_MODE, PING_TIMEOUT_SECONDS, LOG_LEVEL, LOG_OUTPUT_MODE and
 *        LOG_DIR on top of @p config.
 *
 * @return One warning per override that could not be applied. The prior
 *         value is kept in that case.
 */
std::vector<std::string> apply_env_overrides(Config& config,
                                             const EnvLookup& lookup = process_env);

/**
 * @brief Check ranges and enumerations. Returns ErrorCode::Config on failure.
 */
Result<void> validate_config(const Config& config);

}  // namespace lanwake
