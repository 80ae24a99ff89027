/**
 * remote_cli.h - Line-oriented remote control console
 *
 * Reads one command per line from stdin:
 *   scan | stop | list | known | connect <index|address> | disconnect
 *   send <command> [argument] | apps | inputs | volume | wake-mac <mac>
 *   diag | telemetry | log <level> | help | quit
 *
 * State transitions and engine logs are printed as they happen. Daemon mode
 * skips stdin and only reports transitions until stop() is called.
 */

#ifndef REMOTE_CLI_H
#define REMOTE_CLI_H

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "device.h"

namespace tvlink {
class SessionController;
struct ConnectionState;
}

class RemoteCLI {
public:
    RemoteCLI(tvlink::SessionController& session, bool daemon_mode = false);
    ~RemoteCLI();

    void run();
    void stop();

    // Returns false once the user asked to quit.
    bool process_command(const std::string& input);

    // Callbacks from the session
    void on_log_message(const std::string& message);
    void on_state_changed(const tvlink::ConnectionState& state);
    void on_devices_discovered(const std::vector<tvlink::Device>& devices);

private:
    void run_plain();
    void run_daemon();

    void cmd_help();
    void cmd_scan();
    void cmd_stop();
    void cmd_list();
    void cmd_known();
    void cmd_connect(const std::string& target);
    void cmd_disconnect();
    void cmd_send(const std::string& name, const std::string& argument);
    void cmd_apps();
    void cmd_inputs();
    void cmd_volume();
    void cmd_wake_mac(const std::string& mac);
    void cmd_diag();
    void cmd_telemetry();
    void cmd_log_level(const std::string& level);

    void print(const std::string& line);

    tvlink::SessionController& session;
    bool daemon_mode_;
    std::atomic<bool> running;
    std::mutex output_mutex;
    std::vector<tvlink::Device> listed_devices;
};

#endif // REMOTE_CLI_H
