#ifndef TVLINK_COMMAND_H
#define TVLINK_COMMAND_H

#include <optional>
#include <string>

#include "device.h"

namespace tvlink {

enum class CommandKind {
    Up,
    Down,
    Left,
    Right,
    Select,
    Back,
    Home,
    Menu,
    VolumeUp,
    VolumeDown,
    SetVolume,
    Mute,
    PowerOff,
    PowerOn,
    LaunchApp,
    InputSwitch,
    KeyboardText
};

struct Command {
    CommandKind kind = CommandKind::Select;
    int level = 0;                 // SetVolume
    std::optional<bool> mute;      // Mute; empty toggles
    std::string argument;          // app id, input id or text

    static Command simple(CommandKind kind);
    static Command set_volume(int level);
    static Command set_mute(std::optional<bool> muted);
    static Command launch_app(const std::string& app_id);
    static Command input_switch(const std::string& input_id);
    static Command keyboard_text(const std::string& text);
};

const char* command_name(CommandKind kind);

// Key used for rate limiting and latency samples, e.g. "dpad_up", "volume_up".
std::string rate_limit_key(const Command& command);

// "volume", "set_volume", "dpad" or "default"; maps to a configured interval.
std::string rate_limit_class(const Command& command);

// Empty for commands that need no capability (keyboard text).
std::optional<Capability> required_capability(const Command& command);

// Commands whose side effects must not be replayed after an ambiguous failure.
bool is_safe_for_retry(const Command& command);

// Remote button name for directional and navigation input.
std::optional<std::string> button_name(const Command& command);

// CLI form: "up", "volumeUp", "setVolume 20", "mute on", "launch netflix", ...
std::optional<Command> parse_command(const std::string& name, const std::string& argument);

} // namespace tvlink

#endif // TVLINK_COMMAND_H
