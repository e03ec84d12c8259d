#include "rcs/ims/terminating_http_file_sharing_session.hpp"
#include "rcs/ims/instant_messaging_service.hpp"
#include "rcs/core/logger.hpp"

#include <chrono>

namespace rcs::ims {

namespace {

int64_t currentTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

TerminatingHttpFileSharingSession::TerminatingHttpFileSharingSession(
        InstantMessagingService& im_service,
        content::MmContent content,
        content::ContactId contact,
        std::string remote_uri,
        std::optional<content::MmContent> file_icon,
        std::string chat_contribution_id,
        std::string file_transfer_id,
        int64_t timestamp,
        int64_t file_expiration,
        int64_t icon_expiration)
    : HttpFileTransferSession(im_service, std::move(content), std::move(contact), std::move(remote_uri),
                              std::move(file_icon), std::move(chat_contribution_id),
                              std::move(file_transfer_id), timestamp, file_expiration, icon_expiration),
      clock_(currentTimeMillis) {
    setTransferControl(im_service.getHttpTransferEngine().createDownload(getContent(), getFileicon(), *this));
}

bool TerminatingHttpFileSharingSession::isAccepted() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return accepted_;
}

bool TerminatingHttpFileSharingSession::isFileExpired() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // Zero means the server did not announce an expiration
    return getFileExpiration() > 0 && getFileExpiration() <= clock_();
}

void TerminatingHttpFileSharingSession::setClock(Clock clock) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    clock_ = std::move(clock);
}

core::Result<void> TerminatingHttpFileSharingSession::failExpired() {
    core::Logger::warn("File {} expired on content server at {}", getSessionID(), getFileExpiration());
    handleError(FileSharingError(FileSharingError::MEDIA_DOWNLOAD_FAILED, "File expired on content server"));
    return {core::ErrorCode::ContentExpired, "File " + getSessionID() + " is no longer available"};
}

core::Result<void> TerminatingHttpFileSharingSession::acceptSession() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (isSessionInterrupted()) {
        return {core::ErrorCode::InvalidState, "Session " + getSessionID() + " is terminated"};
    }
    if (accepted_) {
        return {core::ErrorCode::InvalidState, "Invitation " + getSessionID() + " already accepted"};
    }
    // File yang sudah expired tidak bisa di-download lagi
    if (isFileExpired()) {
        return failExpired();
    }

    TransferControl* control = getTransferControl();
    if (!control) {
        return {core::ErrorCode::ServiceNotAvailable, "No download available for " + getSessionID()};
    }

    core::Logger::info("Accept invitation {} from {}", getSessionID(), getRemoteContact());
    auto result = control->start();
    if (result.is_ok()) {
        accepted_ = true;
    }
    return result;
}

core::Result<void> TerminatingHttpFileSharingSession::rejectSession() {
    core::Logger::info("Reject invitation {} from {}", getSessionID(), getRemoteContact());
    return abortSession(TerminationReason::TERMINATION_BY_USER);
}

core::Result<void> TerminatingHttpFileSharingSession::onPause() {
    core::Logger::info("Pause download {}", getSessionID());
    TransferControl* control = getTransferControl();
    if (!control) {
        return {core::ErrorCode::InvalidState, "No download to pause"};
    }
    return control->pause();
}

core::Result<void> TerminatingHttpFileSharingSession::onResume() {
    if (isFileExpired()) {
        return failExpired();
    }

    core::Logger::info("Resume download {}", getSessionID());
    TransferControl* control = getTransferControl();
    if (!control) {
        return {core::ErrorCode::InvalidState, "No download to resume"};
    }
    return control->resume();
}

} // namespace rcs::ims
