#ifndef TVLINK_RESPONSE_DECODER_H
#define TVLINK_RESPONSE_DECODER_H

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tvlink {

using json = nlohmann::json;

// Payload keys consulted when a "response" envelope may carry an implicit error.
// Firmware differs in what it reports, so the set is read from configuration.
struct FailureFieldSet {
    std::vector<std::string> text_fields{"errorText", "message", "errorDescription", "reason"};
    std::vector<std::string> code_fields{"errorCode"};

    static FailureFieldSet from_config();
};

struct ResponseFailure {
    std::optional<int> code;
    std::string text;
};

struct AppShortcut {
    std::string id;
    std::string title;
};

struct InputSource {
    std::string id;
    std::string label;
};

struct VolumeState {
    int level = 0;
    bool muted = false;
};

class ResponseDecoder {
public:
    explicit ResponseDecoder(FailureFieldSet fields = FailureFieldSet::from_config());

    // True when a delivered "response" still signals failure (returnValue false,
    // error text, non-zero error code).
    bool is_failure(const json& envelope) const;

    // Human-readable reason, most specific source first.
    std::string error_message(const json& envelope) const;

    std::optional<ResponseFailure> decode_failure(const json& envelope) const;

    static const json& payload_of(const json& envelope);
    static std::optional<std::string> client_key(const json& envelope);
    static bool is_pairing_prompt(const json& envelope);
    static std::optional<std::string> pointer_socket_path(const json& envelope);

    // Lowercased service names from getServiceList; strings or objects.
    static std::set<std::string> service_names(const json& envelope);

    static std::vector<AppShortcut> launch_apps(const json& envelope);
    static std::vector<InputSource> input_sources(const json& envelope);
    static std::optional<VolumeState> volume_state(const json& envelope);

private:
    std::optional<int> code_in(const json& object) const;
    std::optional<std::string> text_in(const json& object) const;

    FailureFieldSet fields_;
};

} // namespace tvlink

#endif // TVLINK_RESPONSE_DECODER_H
