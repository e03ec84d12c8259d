#pragma once

#include <string>

namespace rcs::ims {

// Service-level error reported by a collaborator (transfer engine, signaling)
class ImsServiceError {
public:
    // Generic codes
    static constexpr int UNEXPECTED_EXCEPTION = 1;
    static constexpr int SESSION_INITIATION_FAILED = 100;
    static constexpr int SESSION_INITIATION_DECLINED = 101;
    static constexpr int SESSION_INITIATION_CANCELLED = 102;

    ImsServiceError(int code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    virtual ~ImsServiceError() = default;

    int getErrorCode() const { return code_; }
    const std::string& getMessage() const { return message_; }

private:
    int code_;
    std::string message_;
};

// Error delivered to file sharing listeners; keeps the code and message of
// the service error it wraps
class FileSharingError : public ImsServiceError {
public:
    static constexpr int MEDIA_SAVING_FAILED = 120;
    static constexpr int MEDIA_TRANSFER_FAILED = 121;
    static constexpr int MEDIA_SIZE_TOO_BIG = 122;
    static constexpr int NOT_ENOUGH_STORAGE_SPACE = 123;
    static constexpr int MEDIA_UPLOAD_FAILED = 124;
    static constexpr int MEDIA_DOWNLOAD_FAILED = 125;

    FileSharingError(int code, std::string message = "")
        : ImsServiceError(code, std::move(message)) {}

    explicit FileSharingError(const ImsServiceError& error)
        : ImsServiceError(error.getErrorCode(), error.getMessage()) {}
};

} // namespace rcs::ims
