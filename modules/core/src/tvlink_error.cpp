#include "tvlink_error.h"
#include "string_utils.h"

#include <cctype>

namespace tvlink {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidAddress: return "InvalidAddress";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::RequestTimedOut: return "RequestTimedOut";
        case ErrorCode::RegistrationFailed: return "RegistrationFailed";
        case ErrorCode::CommandUnsupported: return "CommandUnsupported";
        case ErrorCode::InvalidCredential: return "InvalidCredential";
        case ErrorCode::NetworkFailure: return "NetworkFailure";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::NoDeviceSelected: return "NoDeviceSelected";
        case ErrorCode::InvalidWakeAddress: return "InvalidWakeAddress";
        case ErrorCode::LocalNetworkPermissionDenied: return "LocalNetworkPermissionDenied";
        case ErrorCode::PairingFailed: return "PairingFailed";
        case ErrorCode::RequestRejected: return "RequestRejected";
    }
    return "Unknown";
}

std::string user_message(ErrorCode code, const std::string& detail) {
    switch (code) {
        case ErrorCode::InvalidAddress: return "Enter a valid TV IP address.";
        case ErrorCode::NotConnected: return "TV is not connected.";
        case ErrorCode::RequestTimedOut: return "TV did not respond in time.";
        case ErrorCode::CommandUnsupported: return "That command is not supported by this TV.";
        case ErrorCode::InvalidCredential: return "Stored pairing key was rejected by the TV.";
        case ErrorCode::Cancelled: return "Operation cancelled.";
        case ErrorCode::InvalidResponse: return "TV returned an unexpected response.";
        case ErrorCode::NoDeviceSelected: return "Select a TV to connect first.";
        case ErrorCode::InvalidWakeAddress:
            return "Enter a valid TV MAC address (for example AA:BB:CC:DD:EE:FF).";
        case ErrorCode::LocalNetworkPermissionDenied:
            return "Local Network access is required to find your TV.";
        case ErrorCode::RegistrationFailed:
            return detail.empty() ? "TV registration failed." : detail;
        case ErrorCode::PairingFailed:
            return detail.empty() ? "Pairing with the TV failed." : detail;
        case ErrorCode::NetworkFailure:
            return detail.empty() ? "Network failure." : detail;
        case ErrorCode::RequestRejected:
            return detail.empty() ? "TV rejected the request." : detail;
    }
    return detail;
}

TvLinkError::TvLinkError(ErrorCode code, const std::string& detail)
    : std::runtime_error(user_message(code, detail)), code_(code), detail_(detail) {}

bool is_transient_error(const std::string& message) {
    return contains_any(to_lower(message), {
        "timed out", "timeout", "not connected", "connection was lost",
        "socket is not connected", "network failure", "broken pipe", "econnreset",
        "did not respond"});
}

bool is_timeout_error(const std::string& message) {
    return contains_any(to_lower(message), {"timeout", "timed out", "did not respond"});
}

bool is_unsupported_method_error(const std::string& message) {
    return contains_any(to_lower(message), {
        "404", "not found", "no such service", "no such method", "unsupported", "unknown uri"});
}

bool should_fallback_to_pointer(const std::string& message) {
    return is_unsupported_method_error(message) || contains_any(to_lower(message), {"networkinput"});
}

bool should_retry_pairing_without_credential(const std::string& message) {
    return contains_any(to_lower(message), {
        "client-key", "401", "403", "not registered", "not authorized", "authentication"});
}

bool is_explicit_rejection(const std::string& message) {
    return contains_any(to_lower(message), {"denied", "rejected"});
}

bool is_cancellation_error(const std::string& message) {
    return contains_any(to_lower(message), {"cancelled", "canceled"});
}

bool is_permission_denied_error(const std::string& message) {
    return contains_any(to_lower(message), {
        "policy denied", "operation not permitted", "permission denied"});
}

std::optional<int> extract_status_code(const std::string& message) {
    size_t i = 0;
    while (i < message.size()) {
        if (!std::isdigit(static_cast<unsigned char>(message[i]))) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < message.size() && std::isdigit(static_cast<unsigned char>(message[j]))) {
            ++j;
        }
        if (j - i <= 3) {
            const int value = std::stoi(message.substr(i, j - i));
            if (value >= 100 && value <= 599) {
                return value;
            }
        }
        i = j;
    }
    return std::nullopt;
}

} // namespace tvlink
