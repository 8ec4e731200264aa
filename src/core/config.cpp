/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "net/address.hpp"

#include <charconv>
#include <cstdlib>

#include <toml++/toml.hpp>

namespace lanwake {

namespace {

/// Accepts either an array of strings or a comma-separated string.
std::vector<std::string> read_interface_list(toml::node_view<toml::node> node) {
    std::vector<std::string> names;
    if (auto* arr = node.as_array()) {
        for (auto& element : *arr) {
            if (auto name = element.value<std::string>()) {
                auto parts = split_interface_list(*name);
                names.insert(names.end(), parts.begin(), parts.end());
            }
        }
    } else if (auto text = node.value<std::string>()) {
        names = split_interface_list(*text);
    }
    return names;
}

bool parse_bool(std::string_view text) {
    return text == "true" || text == "1";
}

std::optional<uint32_t> parse_u32(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [network]
        if (auto network = tbl["network"]; network.is_table()) {
            config.network.default_interfaces = read_interface_list(network["default_interfaces"]);
            config.network.enable_per_host_interfaces =
                network["enable_per_host_interfaces"].value_or(false);
            config.network.readonly_mode = network["readonly_mode"].value_or(false);
        }

        // [probe]
        if (auto probe = tbl["probe"]; probe.is_table()) {
            config.probe.timeout_seconds = static_cast<uint32_t>(
                probe["timeout_seconds"].value_or(int64_t{5}));
            config.probe.cache_ttl_multiplier = static_cast<uint32_t>(
                probe["cache_ttl_multiplier"].value_or(int64_t{2}));
            config.probe.icmp_timeout_seconds = static_cast<uint32_t>(
                probe["icmp_timeout_seconds"].value_or(int64_t{2}));
            config.probe.scan_workers = static_cast<uint32_t>(
                probe["scan_workers"].value_or(int64_t{10}));
            config.probe.coalesce_grace_seconds = static_cast<uint32_t>(
                probe["coalesce_grace_seconds"].value_or(int64_t{5}));
            config.probe.sweep_interval_seconds = static_cast<uint32_t>(
                probe["sweep_interval_seconds"].value_or(int64_t{30}));
        }

        // [wake]
        if (auto wake = tbl["wake"]; wake.is_table()) {
            config.wake.default_broadcast =
                wake["default_broadcast"].value_or(std::string{"255.255.255.255:9"});
            config.wake.history_capacity = static_cast<uint32_t>(
                wake["history_capacity"].value_or(int64_t{100}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_output = telemetry["log_output"].value_or(std::string{"stdout"});
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{100}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

std::optional<std::string> process_env(std::string_view name) {
    const char* value = std::getenv(std::string{name}.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string{value};
}

std::vector<std::string> apply_env_overrides(Config& config, const EnvLookup& lookup) {
    std::vector<std::string> warnings;

    if (auto v = lookup("DEFAULT_NETWORK_INTERFACE")) {
        config.network.default_interfaces = split_interface_list(*v);
    }
    if (auto v = lookup("ENABLE_PER_HOST_INTERFACES")) {
        config.network.enable_per_host_interfaces = parse_bool(*v);
    }
    if (auto v = lookup("READONLY_MODE")) {
        config.network.readonly_mode = parse_bool(*v);
    }
    if (auto v = lookup("PING_TIMEOUT_SECONDS")) {
        if (auto seconds = parse_u32(*v); seconds && *seconds >= 1 && *seconds <= 60) {
            config.probe.timeout_seconds = *seconds;
        } else {
            warnings.push_back("Ignoring PING_TIMEOUT_SECONDS='" + *v
                               + "': expected an integer between 1 and 60");
        }
    }
    if (auto v = lookup("LOG_LEVEL")) {
        if (parse_log_level(*v)) {
            config.telemetry.log_level = *v;
        } else {
            warnings.push_back("Ignoring LOG_LEVEL='" + *v + "'");
        }
    }
    if (auto v = lookup("LOG_OUTPUT_MODE")) {
        if (*v == "stdout" || *v == "file" || *v == "both") {
            config.telemetry.log_output = *v;
        } else {
            warnings.push_back("Ignoring LOG_OUTPUT_MODE='" + *v
                               + "': expected stdout, file or both");
        }
    }
    if (auto v = lookup("LOG_DIR"); v && !v->empty()) {
        config.telemetry.log_dir = *v;
    }

    return warnings;
}

Result<void> validate_config(const Config& config) {
    const auto& probe = config.probe;
    if (probe.timeout_seconds < 1 || probe.timeout_seconds > 60) {
        return Error{ErrorCode::Config, "probe.timeout_seconds must be between 1 and 60"};
    }
    if (probe.cache_ttl_multiplier < 1) {
        return Error{ErrorCode::Config, "probe.cache_ttl_multiplier must be at least 1"};
    }
    if (probe.icmp_timeout_seconds < 1) {
        return Error{ErrorCode::Config, "probe.icmp_timeout_seconds must be at least 1"};
    }
    if (probe.scan_workers < 1) {
        return Error{ErrorCode::Config, "probe.scan_workers must be at least 1"};
    }
    if (probe.sweep_interval_seconds < 1) {
        return Error{ErrorCode::Config, "probe.sweep_interval_seconds must be at least 1"};
    }
    if (config.wake.history_capacity < 1) {
        return Error{ErrorCode::Config, "wake.history_capacity must be at least 1"};
    }
    if (auto target = parse_broadcast_target(config.wake.default_broadcast); !target) {
        return Error{ErrorCode::Config,
                     "wake.default_broadcast: " + target.error().message};
    }

    const auto& telemetry = config.telemetry;
    if (!parse_log_level(telemetry.log_level)) {
        return Error{ErrorCode::Config,
                     "telemetry.log_level must be one of debug, info, warn, error"};
    }
    if (telemetry.log_output != "stdout" && telemetry.log_output != "file"
        && telemetry.log_output != "both") {
        return Error{ErrorCode::Config,
                     "telemetry.log_output must be one of stdout, file, both"};
    }
    if (telemetry.log_output != "stdout" && telemetry.log_dir.empty()) {
        return Error{ErrorCode::Config, "telemetry.log_dir is required for file output"};
    }

    return {};
}

}  // namespace lanwake
