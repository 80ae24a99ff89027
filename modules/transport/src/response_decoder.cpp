#include "response_decoder.h"
#include "config_manager.h"
#include "string_utils.h"

#include <algorithm>

namespace tvlink {

namespace {

const json& empty_object() {
    static const json empty = json::object();
    return empty;
}

std::optional<std::string> first_string(const json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string()) {
            std::string value = trim(it->get<std::string>());
            if (!value.empty()) {
                return value;
            }
        }
    }
    return std::nullopt;
}

const json* first_array(const json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_array()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::optional<int> as_int(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_number_float()) {
        return static_cast<int>(value.get<double>());
    }
    if (value.is_string()) {
        try {
            size_t used = 0;
            const std::string text = value.get<std::string>();
            const int parsed = std::stoi(text, &used);
            if (used == text.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

} // namespace

FailureFieldSet FailureFieldSet::from_config() {
    FailureFieldSet fields;
    auto& config = ConfigManager::getInstance();
    fields.text_fields = config.getFailureTextFields();
    fields.code_fields = config.getFailureCodeFields();
    return fields;
}

ResponseDecoder::ResponseDecoder(FailureFieldSet fields) : fields_(std::move(fields)) {}

const json& ResponseDecoder::payload_of(const json& envelope) {
    if (envelope.is_object()) {
        auto it = envelope.find("payload");
        if (it != envelope.end() && it->is_object()) {
            return *it;
        }
    }
    return empty_object();
}

std::optional<int> ResponseDecoder::code_in(const json& object) const {
    if (!object.is_object()) {
        return std::nullopt;
    }
    for (const auto& key : fields_.code_fields) {
        auto it = object.find(key);
        if (it != object.end()) {
            if (auto code = as_int(*it)) {
                return code;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> ResponseDecoder::text_in(const json& object) const {
    if (!object.is_object()) {
        return std::nullopt;
    }
    for (const auto& key : fields_.text_fields) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

bool ResponseDecoder::is_failure(const json& envelope) const {
    if (!envelope.is_object()) {
        return false;
    }
    auto top = envelope.find("returnValue");
    if (top != envelope.end() && top->is_boolean() && !top->get<bool>()) {
        return true;
    }

    const json& payload = payload_of(envelope);
    auto inner = payload.find("returnValue");
    if (inner != payload.end() && inner->is_boolean() && !inner->get<bool>()) {
        return true;
    }
    auto text = payload.find("errorText");
    if (text != payload.end() && text->is_string() && !text->get<std::string>().empty()) {
        return true;
    }
    if (auto code = code_in(payload)) {
        return *code != 0;
    }
    return false;
}

std::optional<ResponseFailure> ResponseDecoder::decode_failure(const json& envelope) const {
    const bool explicit_error = envelope.is_object() && envelope.value("type", std::string()) == "error";
    if (!explicit_error && !is_failure(envelope)) {
        return std::nullopt;
    }
    ResponseFailure failure;
    const json& payload = payload_of(envelope);
    failure.code = code_in(payload);
    if (!failure.code) {
        failure.code = code_in(envelope);
    }
    failure.text = error_message(envelope);
    return failure;
}

std::string ResponseDecoder::error_message(const json& envelope) const {
    if (envelope.is_object()) {
        auto direct = envelope.find("error");
        if (direct != envelope.end() && direct->is_string() && !direct->get<std::string>().empty()) {
            return direct->get<std::string>();
        }
    }

    const json& payload = payload_of(envelope);
    const auto payload_text = text_in(payload);
    const auto payload_code = code_in(payload);
    if (payload_text && payload_code) {
        return std::to_string(*payload_code) + " " + *payload_text;
    }
    if (payload_text) {
        return *payload_text;
    }
    if (payload_code) {
        return std::to_string(*payload_code) + " unsupported request";
    }

    if (auto top_code = code_in(envelope)) {
        return std::to_string(*top_code) + " unsupported request";
    }
    return "TV rejected the request.";
}

std::optional<std::string> ResponseDecoder::client_key(const json& envelope) {
    const json& payload = payload_of(envelope);
    auto it = payload.find("client-key");
    if (it != payload.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

bool ResponseDecoder::is_pairing_prompt(const json& envelope) {
    const json& payload = payload_of(envelope);
    auto it = payload.find("pairingType");
    return it != payload.end() && it->is_string() && equals_ci(it->get<std::string>(), "PROMPT");
}

std::optional<std::string> ResponseDecoder::pointer_socket_path(const json& envelope) {
    return first_string(payload_of(envelope), {"socketPath"});
}

std::set<std::string> ResponseDecoder::service_names(const json& envelope) {
    const json& payload = envelope.contains("payload") ? payload_of(envelope) : envelope;
    std::set<std::string> names;
    const json* entries = first_array(payload, {"services", "serviceList"});
    if (entries == nullptr) {
        return names;
    }
    for (const auto& entry : *entries) {
        if (entry.is_string()) {
            const std::string name = to_lower(trim(entry.get<std::string>()));
            if (!name.empty()) names.insert(name);
            continue;
        }
        if (auto name = first_string(entry, {"name", "service", "serviceName", "uri"})) {
            names.insert(to_lower(*name));
        }
    }
    return names;
}

std::vector<AppShortcut> ResponseDecoder::launch_apps(const json& envelope) {
    std::vector<AppShortcut> apps;
    const json* entries = first_array(payload_of(envelope), {"launchPoints", "apps", "appList"});
    if (entries == nullptr) {
        return apps;
    }
    std::set<std::string> seen;
    for (const auto& entry : *entries) {
        auto id = first_string(entry, {"id", "appId", "appid"});
        if (!id) continue;
        auto title = first_string(entry, {"title", "appName", "visibleName", "name"});
        if (!seen.insert(to_lower(*id)).second) continue;
        apps.push_back(AppShortcut{*id, title ? *title : *id});
    }
    return apps;
}

std::vector<InputSource> ResponseDecoder::input_sources(const json& envelope) {
    std::vector<InputSource> sources;
    const json* entries = first_array(payload_of(envelope), {"devices", "deviceList", "inputs", "inputList"});
    if (entries == nullptr) {
        return sources;
    }
    std::set<std::string> seen;
    for (const auto& entry : *entries) {
        auto id = first_string(entry, {"id", "inputId", "appId"});
        if (!id) continue;
        auto label = first_string(entry, {"label", "name"});
        if (!seen.insert(to_lower(*id)).second) continue;
        sources.push_back(InputSource{*id, label ? *label : *id});
    }
    return sources;
}

std::optional<VolumeState> ResponseDecoder::volume_state(const json& envelope) {
    const json& payload = envelope.contains("payload") ? payload_of(envelope) : envelope;
    const json* status = &payload;
    auto nested = payload.find("volumeStatus");
    if (nested != payload.end() && nested->is_object()) {
        status = &(*nested);
    }

    auto volume = status->find("volume");
    if (volume == status->end()) {
        return std::nullopt;
    }
    auto level = as_int(*volume);
    if (!level) {
        return std::nullopt;
    }

    VolumeState state;
    state.level = std::max(0, std::min(100, *level));
    for (const char* key : {"mute", "muted", "muteStatus"}) {
        auto it = status->find(key);
        if (it != status->end() && it->is_boolean()) {
            state.muted = it->get<bool>();
            break;
        }
    }
    return state;
}

} // namespace tvlink
