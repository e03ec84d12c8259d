#include <rcs/core/error.hpp>
#include <unordered_map>

namespace rcs::core {

namespace {
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotSupported, "Not supported"},

        // Signaling errors
        {ErrorCode::PayloadError, "Payload error"},
        {ErrorCode::NetworkError, "Network error"},
        {ErrorCode::Timeout, "Timeout"},

        // Session errors
        {ErrorCode::SessionNotFound, "Session not found"},
        {ErrorCode::ServiceNotAvailable, "Service not available"},

        // Content errors
        {ErrorCode::ContentTooLarge, "Content too large"},
        {ErrorCode::ContentExpired, "Content expired"},
        {ErrorCode::InvalidData, "Invalid data"},
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"}
    };

    const std::unordered_map<ErrorCode, std::error_condition> ERROR_CONDITIONS = {
        {ErrorCode::NetworkError, std::errc::network_unreachable},
        {ErrorCode::Timeout, std::errc::timed_out},
        {ErrorCode::ContentTooLarge, std::errc::file_too_large},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? it->second : std::error_condition(ev, *this);
}

} // namespace rcs::core
