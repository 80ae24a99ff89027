#ifndef TVLINK_ERROR_H
#define TVLINK_ERROR_H

#include <optional>
#include <stdexcept>
#include <string>

namespace tvlink {

enum class ErrorCode {
    InvalidAddress,
    NotConnected,
    RequestTimedOut,
    RegistrationFailed,
    CommandUnsupported,
    InvalidCredential,
    NetworkFailure,
    Cancelled,
    InvalidResponse,
    NoDeviceSelected,
    InvalidWakeAddress,
    LocalNetworkPermissionDenied,
    PairingFailed,
    RequestRejected
};

const char* error_code_name(ErrorCode code);

// what() is the user-facing message; detail() is the raw reason (may be empty).
class TvLinkError : public std::runtime_error {
public:
    explicit TvLinkError(ErrorCode code, const std::string& detail = "");

    ErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

std::string user_message(ErrorCode code, const std::string& detail);

// Message-token classification. All helpers lowercase their input.
bool is_transient_error(const std::string& message);
bool is_timeout_error(const std::string& message);
bool is_unsupported_method_error(const std::string& message);
bool should_fallback_to_pointer(const std::string& message);
bool should_retry_pairing_without_credential(const std::string& message);
bool is_explicit_rejection(const std::string& message);
bool is_cancellation_error(const std::string& message);
bool is_permission_denied_error(const std::string& message);

// First integer in [100, 599] found in the message.
std::optional<int> extract_status_code(const std::string& message);

} // namespace tvlink

#endif // TVLINK_ERROR_H
