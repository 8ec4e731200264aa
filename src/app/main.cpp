/**
 * @file main.cpp
 * @brief lanwake command-line entry point.
 *
 * Wires the modules together:
 *   Config → Logger → LinuxNetworkBackend → capabilities → LivenessService
 * and runs one of the probe / wake / check-all / capabilities commands.
 */

#include "app/host_file.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "liveness/liveness_service.hpp"
#include "net/address.hpp"
#include "net/linux_backend.hpp"
#include "telemetry/json_sink.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace lanwake;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::string command;
    std::filesystem::path config_path = "config/lanwake.toml";
    bool config_given = false;
    std::string log_level;

    // Host description for probe / wake
    Host host;
    std::string interfaces;

    std::filesystem::path hosts_path;
    uint32_t watch_seconds = 0;
};

void print_usage() {
    std::cout << "Usage: lanwake <command> [OPTIONS]\n"
              << "Commands:\n"
              << "  probe           Check whether one host is online\n"
              << "  wake            Send a Wake-on-LAN magic packet\n"
              << "  check-all       Check every host in a host file\n"
              << "  capabilities    Report which network privileges are available\n"
              << "Options:\n"
              << "  --config <path>        Configuration file (default: config/lanwake.toml)\n"
              << "  --log-level <level>    debug, info, warn or error\n"
              << "  --mac <mac>            Host MAC address (probe, wake)\n"
              << "  --id <id>              Host identifier (default: the MAC)\n"
              << "  --name <name>          Display name used in logs\n"
              << "  --static-ip <ip>       Static IPv4 address\n"
              << "  --fallback             Use the static IP only as a fallback\n"
              << "  --interfaces <list>    Comma-separated interface names\n"
              << "  --broadcast <ip:port>  Wake target (default from config)\n"
              << "  --hosts <path>         Host file for check-all\n"
              << "  --watch <seconds>      Repeat check-all until interrupted\n"
              << "  --help, -h             Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--mac" && i + 1 < argc) {
            args.host.mac_address = argv[++i];
        } else if (arg == "--id" && i + 1 < argc) {
            args.host.id = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            args.host.name = argv[++i];
        } else if (arg == "--static-ip" && i + 1 < argc) {
            args.host.static_ip = argv[++i];
        } else if (arg == "--fallback") {
            args.host.use_as_fallback = true;
        } else if (arg == "--interfaces" && i + 1 < argc) {
            args.interfaces = argv[++i];
        } else if (arg == "--broadcast" && i + 1 < argc) {
            args.host.broadcast_target = argv[++i];
        } else if (arg == "--hosts" && i + 1 < argc) {
            args.hosts_path = argv[++i];
        } else if (arg == "--watch" && i + 1 < argc) {
            args.watch_seconds = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (args.command.empty() && !arg.starts_with("-")) {
            args.command = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }

    args.host.interfaces = split_interface_list(args.interfaces);
    if (args.host.id.empty()) args.host.id = args.host.mac_address;
    if (args.host.name.empty()) args.host.name = args.host.id;
    return args;
}

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry) {
    auto file_sink = [&telemetry] {
        return std::make_unique<JsonFileSink>(telemetry.log_dir, "lanwake",
                                              telemetry.max_file_size_mb, telemetry.rotate_count);
    };
    if (telemetry.log_output == "file") return file_sink();
    if (telemetry.log_output == "both") {
        return std::make_unique<TeeSink>(std::make_unique<StdoutSink>(), file_sink());
    }
    return std::make_unique<StdoutSink>();
}

std::string bool_text(bool value) {
    return value ? "true" : "false";
}

void print_status(const HostStatus& status) {
    std::cout << R"({"host_id":")" << json_escape(status.id)
              << R"(","host_name":")" << json_escape(status.name)
              << R"(","ping_success":)" << bool_text(status.result.ping_success)
              << R"(,"arp_success":)" << bool_text(status.result.arp_success)
              << R"(,"cached":)" << bool_text(status.cached)
              << R"(,"coalesced":)" << bool_text(status.coalesced);
    if (status.error) {
        std::cout << R"(,"error":")" << to_string(status.error->code)
                  << R"(","message":")" << json_escape(status.error->message) << '"';
    }
    std::cout << "}" << std::endl;
}

void print_error(const Error& error) {
    std::cerr << R"({"error":")" << to_string(error.code)
              << R"(","message":")" << json_escape(error.message) << '"';
    if (!error.details.empty()) {
        std::cerr << R"(,"details":[)";
        for (size_t i = 0; i < error.details.size(); ++i) {
            if (i > 0) std::cerr << ',';
            std::cerr << '"' << json_escape(error.details[i]) << '"';
        }
        std::cerr << ']';
    }
    std::cerr << "}" << std::endl;
}

// ── Commands ─────────────────────────────────

int run_probe(LivenessService& service, const Host& host) {
    if (auto valid = service.validate_host(host); !valid) {
        print_error(valid.error());
        return 1;
    }

    auto checked = service.check(host);
    if (!checked) {
        print_error(checked.error());
        return 1;
    }

    print_status(HostStatus{
        .id = host.id,
        .name = host.name,
        .result = checked->result,
        .cached = checked->cached,
        .coalesced = checked->coalesced,
    });
    return 0;
}

int run_wake(LivenessService& service, const Host& host) {
    if (auto valid = service.validate_host(host); !valid) {
        print_error(valid.error());
        return 1;
    }

    auto sent = service.wake(host);
    if (!sent) {
        print_error(sent.error());
        return 1;
    }

    std::cout << R"({"host_id":")" << json_escape(host.id) << R"(","woken":true})" << std::endl;
    return 0;
}

int run_check_all(LivenessService& service, const CLIArgs& args, Logger& logger) {
    auto hosts = load_hosts(args.hosts_path);
    if (!hosts) {
        print_error(hosts.error());
        return 1;
    }

    logger.info("Checking " + std::to_string(hosts->size()) + " hosts from "
                + args.hosts_path.string());

    do {
        service.check_all(*hosts, print_status);
        if (args.watch_seconds == 0) break;

        // Sleep in small increments to respond to shutdown promptly
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(args.watch_seconds);
        while (!g_shutdown_requested && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    } while (!g_shutdown_requested);

    return 0;
}

int run_capabilities(LivenessService& service) {
    auto caps = service.capabilities();
    auto stats = service.cache().stats();
    std::cout << R"({"active_arp":)" << bool_text(caps.active_arp)
              << R"(,"neighbor_flush":)" << bool_text(caps.neighbor_flush)
              << R"(,"icmp":)" << bool_text(caps.icmp)
              << R"(,"cache_ttl_ms":)" << stats.ttl.count()
              << "}" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.command.empty()) {
        print_usage();
        return 2;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result && args.config_given) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 1;
    }
    auto config = config_result ? *config_result : default_config();

    auto env_warnings = apply_env_overrides(config);
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(make_sink(config.telemetry), level);
    for (const auto& warning : env_warnings) logger.warn(warning);
    if (!config_result) {
        logger.debug("No configuration file at " + args.config_path.string() + ", using defaults");
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Network Backend ──────────────────────
    LinuxNetworkBackend backend;
    auto caps = backend.detect_capabilities();
    if (!caps.active_arp) {
        logger.warn("CAP_NET_RAW not available: active ARP and subnet scanning are disabled. "
                    "Run with: sudo setcap cap_net_raw,cap_net_admin+ep lanwake");
    }
    if (!caps.neighbor_flush) {
        logger.warn("CAP_NET_ADMIN not available: stale neighbor entries will not be flushed");
    }

    LivenessService service(backend, logger, LivenessSettings::from_config(config, caps));

    int rc = 2;
    if (args.command == "probe") {
        rc = run_probe(service, args.host);
    } else if (args.command == "wake") {
        rc = run_wake(service, args.host);
    } else if (args.command == "check-all") {
        rc = run_check_all(service, args, logger);
    } else if (args.command == "capabilities") {
        rc = run_capabilities(service);
    } else {
        std::cerr << "Unknown command: " << args.command << "\n";
        print_usage();
    }

    logger.flush();
    return rc;
}
