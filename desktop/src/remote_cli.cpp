/**
 * remote_cli.cpp - Line-oriented remote control console
 *
 * All output goes through print() so engine log lines and command results
 * never interleave mid-line.
 */

#include "remote_cli.h"
#include "session_controller.h"
#include "logger.h"
#include "string_utils.h"
#include "telemetry.h"
#include "tvlink_error.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

#define C_RESET      "\033[0m"
#define C_DIM        "\033[2m"
#define C_RED        "\033[31m"
#define C_GREEN      "\033[32m"
#define C_YELLOW     "\033[33m"
#define C_CYAN       "\033[36m"

using tvlink::ConnectionPhase;
using tvlink::ConnectionState;
using tvlink::Device;
using tvlink::TvLinkError;

static std::string rest_of_line(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    return tvlink::trim(rest);
}

static std::string describe_device(const Device& d) {
    std::string line = d.name + "  " + d.host + ":" + std::to_string(d.port);
    if (d.model) {
        line += "  [" + *d.model + "]";
    }
    return line;
}

RemoteCLI::RemoteCLI(tvlink::SessionController& session, bool daemon_mode)
    : session(session), daemon_mode_(daemon_mode), running(true) {
    tvlink::setLogCallback([this](const std::string& line) { on_log_message(line); });
    session.set_state_handler([this](const ConnectionState& state) { on_state_changed(state); });
    session.set_discovered_devices_handler([this](const std::vector<Device>& devices) {
        on_devices_discovered(devices);
    });
}

RemoteCLI::~RemoteCLI() {
    session.set_state_handler(nullptr);
    session.set_discovered_devices_handler(nullptr);
    tvlink::setLogCallback(nullptr);
}

void RemoteCLI::run() {
    if (daemon_mode_) {
        run_daemon();
    } else {
        run_plain();
    }
}

void RemoteCLI::run_plain() {
    print("tvlink remote. Type 'help' for commands. Ctrl-D to exit.");

    std::string line;
    while (running) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "tvlink> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        if (!process_command(line)) {
            break;
        }
    }

    print("Goodbye!");
}

void RemoteCLI::run_daemon() {
    print("tvlink daemon mode started. Use 'kill -TERM " + std::to_string(getpid()) + "' to stop.");
    while (running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        tvlink::Telemetry::getInstance().tick();
    }
    print("Goodbye!");
}

void RemoteCLI::stop() {
    running = false;
}

void RemoteCLI::print(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line << std::endl;
}

void RemoteCLI::on_log_message(const std::string& message) {
    print(C_DIM + message + C_RESET);
}

// Runs with the session lock held: print only.
void RemoteCLI::on_state_changed(const ConnectionState& state) {
    const char* color = C_CYAN;
    if (state.phase == ConnectionPhase::Connected) {
        color = C_GREEN;
    } else if (state.phase == ConnectionPhase::Failed) {
        color = C_RED;
    }
    std::string line = std::string(color) + "[" + tvlink::state_label(state) + "]" + C_RESET;
    if (!state.device_name.empty()) {
        line += " " + state.device_name;
    }
    if (!state.message.empty()) {
        line += " - " + state.message;
    }
    print(line);
}

void RemoteCLI::on_devices_discovered(const std::vector<Device>& devices) {
    if (!devices.empty()) {
        print(C_DIM "Discovered " + std::to_string(devices.size()) + " TV(s); 'list' to show" C_RESET);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// COMMAND PROCESSING
// ═══════════════════════════════════════════════════════════════════════════

bool RemoteCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    try {
        if (cmd == "help" || cmd == "h" || cmd == "?") {
            cmd_help();
        } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            running = false;
            return false;
        } else if (cmd == "scan") {
            cmd_scan();
        } else if (cmd == "stop") {
            cmd_stop();
        } else if (cmd == "list" || cmd == "ls") {
            cmd_list();
        } else if (cmd == "known") {
            cmd_known();
        } else if (cmd == "connect" || cmd == "c") {
            cmd_connect(rest_of_line(iss));
        } else if (cmd == "disconnect" || cmd == "dc") {
            cmd_disconnect();
        } else if (cmd == "send" || cmd == "s") {
            std::string name;
            iss >> name;
            cmd_send(name, rest_of_line(iss));
        } else if (cmd == "apps") {
            cmd_apps();
        } else if (cmd == "inputs") {
            cmd_inputs();
        } else if (cmd == "volume" || cmd == "vol") {
            cmd_volume();
        } else if (cmd == "wake-mac" || cmd == "wol") {
            cmd_wake_mac(rest_of_line(iss));
        } else if (cmd == "diag" || cmd == "status") {
            cmd_diag();
        } else if (cmd == "telemetry") {
            cmd_telemetry();
        } else if (cmd == "log") {
            std::string level;
            iss >> level;
            cmd_log_level(level);
        } else if (!cmd.empty()) {
            print(C_YELLOW "Unknown: " + cmd + " (type 'help')" C_RESET);
        }
    } catch (const TvLinkError& e) {
        print(std::string(C_RED) + tvlink::error_code_name(e.code()) + ": " + e.what() + C_RESET);
    }
    return true;
}

void RemoteCLI::cmd_help() {
    print(C_CYAN "═══════════ COMMANDS ═══════════" C_RESET);
    print(C_GREEN "scan" C_RESET "              Start discovery");
    print(C_GREEN "stop" C_RESET "              Stop discovery");
    print(C_GREEN "list" C_RESET "              Discovered TVs");
    print(C_GREEN "known" C_RESET "             Remembered TVs");
    print(C_GREEN "connect" C_RESET " n|addr    Connect by list index or address");
    print(C_GREEN "disconnect" C_RESET "        Close the session");
    print(C_GREEN "send" C_RESET " cmd [arg]     up|down|left|right|ok|back|home|menu");
    print("                  volumeUp|volumeDown|setVolume n|mute [on|off]");
    print("                  powerOff|powerOn|launch id|input id|text ...");
    print(C_GREEN "apps" C_RESET "              Launchable apps");
    print(C_GREEN "inputs" C_RESET "            External inputs");
    print(C_GREEN "volume" C_RESET "            Volume and mute state");
    print(C_GREEN "wake-mac" C_RESET " mac      Set (or clear) the Wake-on-LAN address");
    print(C_GREEN "diag" C_RESET "              Session diagnostics");
    print(C_GREEN "telemetry" C_RESET "         Counters and histograms");
    print(C_GREEN "log" C_RESET " level         debug|info|warning|error|none");
    print(C_GREEN "quit" C_RESET "              Exit");
}

void RemoteCLI::cmd_scan() {
    session.begin_scan();
    print("Scanning...");
}

void RemoteCLI::cmd_stop() {
    session.stop_scan();
    print("Discovery stopped");
}

void RemoteCLI::cmd_list() {
    listed_devices = session.discovered_devices();
    if (listed_devices.empty()) {
        print(C_DIM "No TVs discovered yet. Try: scan" C_RESET);
        return;
    }
    print(C_CYAN "Found: " + std::to_string(listed_devices.size()) + " TV(s)" C_RESET);
    for (size_t i = 0; i < listed_devices.size(); ++i) {
        print("  " + std::to_string(i + 1) + ") " + describe_device(listed_devices[i]));
    }
}

void RemoteCLI::cmd_known() {
    listed_devices = session.known_devices();
    if (listed_devices.empty()) {
        print(C_DIM "No remembered TVs" C_RESET);
        return;
    }
    for (size_t i = 0; i < listed_devices.size(); ++i) {
        const auto& d = listed_devices[i];
        std::string line = "  " + std::to_string(i + 1) + ") " + describe_device(d);
        if (d.wake_mac) {
            line += "  mac=" + *d.wake_mac;
        }
        if (!d.last_connected_at) {
            line += C_DIM "  (never connected)" C_RESET;
        }
        print(line);
    }
}

void RemoteCLI::cmd_connect(const std::string& target) {
    if (target.empty()) {
        print(C_YELLOW "Usage: connect <index|address>" C_RESET);
        return;
    }

    const bool numeric = target.size() <= 4 && std::all_of(target.begin(), target.end(), [](unsigned char c) { return std::isdigit(c); });
    if (numeric) {
        const size_t index = static_cast<size_t>(std::stoul(target));
        if (index == 0 || index > listed_devices.size()) {
            print(C_YELLOW "No TV #" + target + " (run 'list' or 'known' first)" C_RESET);
            return;
        }
        const Device device = listed_devices[index - 1];
        print("Connecting to " + device.name + "...");
        session.connect(device);
    } else {
        print("Connecting to " + target + "...");
        session.connect_manual(target);
    }
}

void RemoteCLI::cmd_disconnect() {
    session.disconnect();
}

void RemoteCLI::cmd_send(const std::string& name, const std::string& argument) {
    if (name.empty()) {
        print(C_YELLOW "Usage: send <command> [argument]" C_RESET);
        return;
    }
    const auto command = tvlink::parse_command(name, argument);
    if (!command) {
        print(C_YELLOW "Unknown command or missing argument: " + name + C_RESET);
        return;
    }
    session.send(*command);
    print(C_GREEN "ok" C_RESET " " + tvlink::rate_limit_key(*command));
}

void RemoteCLI::cmd_apps() {
    const auto apps = session.fetch_launch_apps();
    if (apps.empty()) {
        print(C_DIM "No apps available" C_RESET);
        return;
    }
    for (const auto& app : apps) {
        print("  " + app.id + "  " + app.title);
    }
}

void RemoteCLI::cmd_inputs() {
    const auto inputs = session.fetch_input_sources();
    if (inputs.empty()) {
        print(C_DIM "No inputs available" C_RESET);
        return;
    }
    for (const auto& input : inputs) {
        print("  " + input.id + "  " + input.label);
    }
}

void RemoteCLI::cmd_volume() {
    const auto volume = session.fetch_volume_state();
    if (!volume) {
        print(C_DIM "Volume unavailable" C_RESET);
        return;
    }
    print("Volume " + std::to_string(volume->level) + (volume->muted ? " (muted)" : ""));
}

void RemoteCLI::cmd_wake_mac(const std::string& mac) {
    session.update_wake_address(mac.empty() ? std::nullopt : std::optional<std::string>(mac));
    print(mac.empty() ? "Wake address cleared" : "Wake address saved");
}

void RemoteCLI::cmd_diag() {
    print(session.diagnostics_json().dump(2));
}

void RemoteCLI::cmd_telemetry() {
    print(tvlink::Telemetry::getInstance().snapshot_json("cli"));
}

void RemoteCLI::cmd_log_level(const std::string& level) {
    if (level.empty()) {
        print(C_YELLOW "Usage: log <debug|info|warning|error|none>" C_RESET);
        return;
    }
    tvlink::set_log_level(tvlink::parse_log_level(level));
    print("Log level: " + level);
}
