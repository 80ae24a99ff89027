#include "command.h"
#include "string_utils.h"

#include <algorithm>

namespace tvlink {

Command Command::simple(CommandKind kind) {
    Command c;
    c.kind = kind;
    return c;
}

Command Command::set_volume(int level) {
    Command c;
    c.kind = CommandKind::SetVolume;
    c.level = std::max(0, std::min(100, level));
    return c;
}

Command Command::set_mute(std::optional<bool> muted) {
    Command c;
    c.kind = CommandKind::Mute;
    c.mute = muted;
    return c;
}

Command Command::launch_app(const std::string& app_id) {
    Command c;
    c.kind = CommandKind::LaunchApp;
    c.argument = app_id;
    return c;
}

Command Command::input_switch(const std::string& input_id) {
    Command c;
    c.kind = CommandKind::InputSwitch;
    c.argument = input_id;
    return c;
}

Command Command::keyboard_text(const std::string& text) {
    Command c;
    c.kind = CommandKind::KeyboardText;
    c.argument = text;
    return c;
}

const char* command_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::Up: return "up";
        case CommandKind::Down: return "down";
        case CommandKind::Left: return "left";
        case CommandKind::Right: return "right";
        case CommandKind::Select: return "select";
        case CommandKind::Back: return "back";
        case CommandKind::Home: return "home";
        case CommandKind::Menu: return "menu";
        case CommandKind::VolumeUp: return "volumeUp";
        case CommandKind::VolumeDown: return "volumeDown";
        case CommandKind::SetVolume: return "setVolume";
        case CommandKind::Mute: return "mute";
        case CommandKind::PowerOff: return "powerOff";
        case CommandKind::PowerOn: return "powerOn";
        case CommandKind::LaunchApp: return "launchApp";
        case CommandKind::InputSwitch: return "inputSwitch";
        case CommandKind::KeyboardText: return "keyboardText";
    }
    return "unknown";
}

std::string rate_limit_key(const Command& command) {
    switch (command.kind) {
        case CommandKind::VolumeUp: return "volume_up";
        case CommandKind::VolumeDown: return "volume_down";
        case CommandKind::SetVolume: return "set_volume";
        case CommandKind::Up: return "dpad_up";
        case CommandKind::Down: return "dpad_down";
        case CommandKind::Left: return "dpad_left";
        case CommandKind::Right: return "dpad_right";
        case CommandKind::Select: return "select";
        case CommandKind::Back: return "back";
        case CommandKind::Home: return "home";
        case CommandKind::Menu: return "menu";
        case CommandKind::Mute: return "mute";
        case CommandKind::PowerOff: return "power_off";
        case CommandKind::PowerOn: return "power_on";
        case CommandKind::LaunchApp: return "launch_app";
        case CommandKind::InputSwitch: return "input_switch";
        case CommandKind::KeyboardText: return "keyboard_text";
    }
    return "default";
}

std::string rate_limit_class(const Command& command) {
    switch (command.kind) {
        case CommandKind::VolumeUp:
        case CommandKind::VolumeDown:
            return "volume";
        case CommandKind::SetVolume:
            return "set_volume";
        case CommandKind::Up:
        case CommandKind::Down:
        case CommandKind::Left:
        case CommandKind::Right:
            return "dpad";
        default:
            return "default";
    }
}

std::optional<Capability> required_capability(const Command& command) {
    switch (command.kind) {
        case CommandKind::Up:
        case CommandKind::Down:
        case CommandKind::Left:
        case CommandKind::Right:
        case CommandKind::Select:
        case CommandKind::Menu:
            return Capability::DirectionalPad;
        case CommandKind::Back:
            return Capability::Back;
        case CommandKind::Home:
            return Capability::Home;
        case CommandKind::VolumeUp:
        case CommandKind::VolumeDown:
        case CommandKind::SetVolume:
            return Capability::Volume;
        case CommandKind::Mute:
            return Capability::Mute;
        case CommandKind::PowerOn:
        case CommandKind::PowerOff:
            return Capability::Power;
        case CommandKind::LaunchApp:
            return Capability::LaunchApp;
        case CommandKind::InputSwitch:
            return Capability::InputSwitch;
        case CommandKind::KeyboardText:
            return std::nullopt;
    }
    return std::nullopt;
}

bool is_safe_for_retry(const Command& command) {
    return command.kind != CommandKind::PowerOff && command.kind != CommandKind::KeyboardText;
}

std::optional<std::string> button_name(const Command& command) {
    switch (command.kind) {
        case CommandKind::Up: return std::string("UP");
        case CommandKind::Down: return std::string("DOWN");
        case CommandKind::Left: return std::string("LEFT");
        case CommandKind::Right: return std::string("RIGHT");
        case CommandKind::Select: return std::string("ENTER");
        case CommandKind::Back: return std::string("BACK");
        case CommandKind::Home: return std::string("HOME");
        case CommandKind::Menu: return std::string("MENU");
        default: return std::nullopt;
    }
}

std::optional<Command> parse_command(const std::string& name, const std::string& argument) {
    const std::string n = to_lower(trim(name));
    const std::string arg = trim(argument);

    static const std::pair<const char*, CommandKind> simple_commands[] = {
        {"up", CommandKind::Up},
        {"down", CommandKind::Down},
        {"left", CommandKind::Left},
        {"right", CommandKind::Right},
        {"select", CommandKind::Select},
        {"ok", CommandKind::Select},
        {"enter", CommandKind::Select},
        {"back", CommandKind::Back},
        {"home", CommandKind::Home},
        {"menu", CommandKind::Menu},
        {"volumeup", CommandKind::VolumeUp},
        {"vol+", CommandKind::VolumeUp},
        {"volumedown", CommandKind::VolumeDown},
        {"vol-", CommandKind::VolumeDown},
        {"poweroff", CommandKind::PowerOff},
        {"off", CommandKind::PowerOff},
        {"poweron", CommandKind::PowerOn},
        {"on", CommandKind::PowerOn},
    };
    for (const auto& entry : simple_commands) {
        if (n == entry.first) {
            return Command::simple(entry.second);
        }
    }

    if (n == "setvolume" || n == "volume") {
        if (arg.empty()) return std::nullopt;
        try {
            return Command::set_volume(std::stoi(arg));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (n == "mute") {
        const std::string a = to_lower(arg);
        if (a.empty() || a == "toggle") return Command::set_mute(std::nullopt);
        if (a == "on" || a == "true" || a == "1") return Command::set_mute(true);
        if (a == "off" || a == "false" || a == "0") return Command::set_mute(false);
        return std::nullopt;
    }
    if ((n == "launch" || n == "launchapp") && !arg.empty()) {
        return Command::launch_app(arg);
    }
    if ((n == "input" || n == "inputswitch") && !arg.empty()) {
        return Command::input_switch(arg);
    }
    if ((n == "text" || n == "keyboardtext") && !arg.empty()) {
        return Command::keyboard_text(arg);
    }
    return std::nullopt;
}

} // namespace tvlink
