#include "remote_cli.h"
#include "session_controller.h"
#include "logger.h"
#include "config_manager.h"
#include "telemetry.h"
#include "tvlink_error.h"
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <signal.h>
#include <filesystem>
#include <vector>

using namespace tvlink;

static std::atomic<RemoteCLI*> g_cli{nullptr};

static void handle_termination(int) {
    if (RemoteCLI* cli = g_cli.load()) {
        cli->stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE      Path to configuration file (default: config.json)\n"
              << "  --log-level LVL    Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --scan             Start discovery at startup\n"
              << "  --connect ADDR     Connect to host, host:port or ws(s)://host[:port] at startup\n"
              << "  --reconnect        Reconnect to the last TV at startup\n"
              << "  --daemon           Run without reading stdin (suitable for background/testing)\n"
              << "  --help             Show this help message\n"
              << "\nInteractive CLI (after startup):\n"
              << "  Type 'help' to see commands. Useful ones:\n"
              << "    scan, list, connect <n|address>, send <command> [argument], diag\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);

    std::string config_path = "config.json";
    std::string requested_log_level;
    std::string connect_address;
    bool scan_at_start = false;
    bool reconnect_at_start = false;
    bool daemon_mode = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                requested_log_level = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--connect") {
            if (i + 1 < argc) {
                connect_address = argv[++i];
            } else {
                std::cerr << "Error: --connect requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--scan") {
            scan_at_start = true;
        } else if (arg == "--reconnect") {
            reconnect_at_start = true;
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration with fallbacks (useful when running from build/bin).
    // A missing file is not fatal: every setting has a built-in default.
    auto& config = ConfigManager::getInstance();
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");
    try {
        std::filesystem::path exe_dir = std::filesystem::absolute(argv[0]).parent_path();
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: cannot resolve executable directory: " << e.what() << std::endl;
    }

    std::string chosen_config;
    for (const auto& c : candidates) {
        if (config.loadConfig(c)) {
            chosen_config = c;
            break;
        }
    }

    set_log_level(parse_log_level(requested_log_level.empty() ? config.getLogLevel() : requested_log_level));
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }
    setSessionId(generate_session_id(6));

    Telemetry::Config telemetry_cfg;
    telemetry_cfg.enabled = config.isTelemetryEnabled();
    telemetry_cfg.flush_interval_ms = config.getTelemetryFlushIntervalMs();
    Telemetry::getInstance().initialize("tvlink-desktop", telemetry_cfg);

    SessionController session;
    RemoteCLI cli(session, daemon_mode);
    g_cli.store(&cli);
    signal(SIGINT, handle_termination);
    signal(SIGTERM, handle_termination);

    if (chosen_config.empty()) {
        LOG_WARN("MAIN: No configuration file found, using defaults");
    } else {
        LOG_INFO("MAIN: Loaded configuration from " + chosen_config);
    }

    session.start();

    try {
        if (!connect_address.empty()) {
            session.connect_manual(connect_address);
        } else if (reconnect_at_start) {
            session.reconnect_to_last_device_if_possible();
        }
    } catch (const TvLinkError& e) {
        LOG_ERROR("MAIN: Startup connect failed: " + std::string(e.what()));
    }
    if (scan_at_start) {
        session.begin_scan();
    }

    cli.run();

    g_cli.store(nullptr);
    session.shutdown();
    Telemetry::getInstance().flush("shutdown");
    if (is_async_logging_enabled()) {
        disable_async_logging();
    }
    return 0;
}
