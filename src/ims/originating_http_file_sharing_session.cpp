#include "rcs/ims/originating_http_file_sharing_session.hpp"
#include "rcs/ims/instant_messaging_service.hpp"
#include "rcs/core/logger.hpp"

namespace rcs::ims {

OriginatingHttpFileSharingSession::OriginatingHttpFileSharingSession(
        InstantMessagingService& im_service,
        content::MmContent content,
        content::ContactId contact,
        std::string remote_uri,
        std::optional<content::MmContent> file_icon,
        std::string chat_contribution_id,
        std::string file_transfer_id,
        int64_t timestamp)
    // Expirations are assigned by the content server after the upload
    : HttpFileTransferSession(im_service, std::move(content), std::move(contact), std::move(remote_uri),
                              std::move(file_icon), std::move(chat_contribution_id),
                              std::move(file_transfer_id), timestamp, 0, 0) {
    setTransferControl(im_service.getHttpTransferEngine().createUpload(getContent(), getFileicon(), *this));
}

core::Result<void> OriginatingHttpFileSharingSession::startSession() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (isSessionInterrupted()) {
        return {core::ErrorCode::InvalidState, "Session " + getSessionID() + " is terminated"};
    }
    if (upload_started_) {
        return {core::ErrorCode::InvalidState, "Upload " + getSessionID() + " already started"};
    }

    TransferControl* control = getTransferControl();
    if (!control) {
        return {core::ErrorCode::ServiceNotAvailable, "No upload available for " + getSessionID()};
    }

    // Mulai upload ke content server
    core::Logger::info("Start upload {} of {} ({} bytes) to {}",
                       getSessionID(), getContent().getName(), getContent().getSize(), getRemoteContact());
    auto result = control->start();
    if (result.is_ok()) {
        upload_started_ = true;
    }
    return result;
}

core::Result<void> OriginatingHttpFileSharingSession::onPause() {
    core::Logger::info("Pause upload {}", getSessionID());
    TransferControl* control = getTransferControl();
    if (!control) {
        return {core::ErrorCode::InvalidState, "No upload to pause"};
    }
    return control->pause();
}

core::Result<void> OriginatingHttpFileSharingSession::onResume() {
    core::Logger::info("Resume upload {}", getSessionID());
    TransferControl* control = getTransferControl();
    if (!control) {
        return {core::ErrorCode::InvalidState, "No upload to resume"};
    }
    return control->resume();
}

} // namespace rcs::ims
