#include "rcs/ims/http_file_transfer_session.hpp"
#include "rcs/ims/instant_messaging_service.hpp"
#include "rcs/core/logger.hpp"

namespace rcs::ims {

HttpFileTransferSession::HttpFileTransferSession(InstantMessagingService& im_service,
                                                 content::MmContent content,
                                                 content::ContactId contact,
                                                 std::string remote_uri,
                                                 std::optional<content::MmContent> file_icon,
                                                 std::string chat_contribution_id,
                                                 std::string file_transfer_id,
                                                 int64_t timestamp,
                                                 int64_t file_expiration,
                                                 int64_t icon_expiration)
    : FileSharingSession(im_service, std::move(content), std::move(contact), std::move(remote_uri),
                         std::move(file_icon), std::move(file_transfer_id), timestamp)
    , file_expiration_(file_expiration)
    , icon_expiration_(icon_expiration) {
    setContributionID(std::move(chat_contribution_id));
}

HttpFileTransferSession::~HttpFileTransferSession() = default;

void HttpFileTransferSession::setTransferControl(std::unique_ptr<TransferControl> control) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    control_ = std::move(control);
}

core::Result<std::optional<sip::SipMessage>> HttpFileTransferSession::createInvite() {
    // Not used here
    return std::optional<sip::SipMessage>();
}

void HttpFileTransferSession::closeMediaSession() {
    // Not used here
}

bool HttpFileTransferSession::isAcceptingEvents(const std::string& event) const {
    if (isSessionInterrupted()) {
        core::Logger::debug("Session {} is torn down, dropping {}", getSessionID(), event);
        return false;
    }
    return true;
}

bool HttpFileTransferSession::commitTermination(const std::string& event) {
    if (!isAcceptingEvents(event)) {
        return false;
    }
    interruptSession();
    return true;
}

core::Result<void> HttpFileTransferSession::closeHttpSession(TerminationReason reason) {
    auto self = shared_from_this();
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    interruptSession();
    auto result = closeSession(reason);
    if (result.is_error()) {
        core::Logger::warn("Failed to close session {}: {}", getSessionID(), result.error().what());
    }
    removeSession();
    return result;
}

core::Result<void> HttpFileTransferSession::abortSession(TerminationReason reason) {
    auto self = shared_from_this();
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!commitTermination("abort")) {
        return {};
    }
    core::Logger::info("Abort session {} ({})", getSessionID(), terminationReasonToString(reason));

    // Hentikan transfer HTTP yang sedang berjalan
    if (control_) {
        auto cancelled = control_->cancel();
        if (cancelled.is_error()) {
            core::Logger::warn("Failed to cancel transfer {}: {}", getSessionID(), cancelled.error().what());
        }
    }

    // Notify listeners
    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onSessionAborted", [&](FileSharingSessionListener& listener) {
        listener.onSessionAborted(contact, reason);
    });

    return closeHttpSession(reason);
}

void HttpFileTransferSession::handleError(const ImsServiceError& error) {
    auto self = shared_from_this();
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!commitTermination("error")) {
        return;
    }
    core::Logger::info("Transfer error: {}, reason={}", error.getErrorCode(), error.getMessage());

    // Konversi ke error file sharing sebelum dikirim ke listener
    FileSharingError sharing_error(error);
    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onTransferError", [&](FileSharingSessionListener& listener) {
        listener.onTransferError(sharing_error, contact);
    });

    removeSession();
}

void HttpFileTransferSession::handleFileTransferred() {
    auto self = shared_from_this();
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!commitTermination("transferred")) {
        return;
    }
    fileTransfered();
    core::Logger::info("File {} transferred to content server", getSessionID());

    const content::ContactId& contact = getRemoteContact();
    const content::MmContent& content = getContent();
    int64_t file_expiration = getFileExpiration();
    int64_t icon_expiration = getIconExpiration();
    notifyListeners("onFileTransfered", [&](FileSharingSessionListener& listener) {
        listener.onFileTransfered(content, contact, file_expiration, icon_expiration,
                                  content::FileTransferProtocol::HTTP);
    });

    removeSession();
}

core::Result<void> HttpFileTransferSession::receiveBye(const sip::SipMessage& bye) {
    auto self = shared_from_this();
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Another terminal path already won; the BYE is still answered
    if (!commitTermination("BYE")) {
        return ImsServiceSession::receiveBye(bye);
    }

    // Kirim 200 OK untuk BYE
    auto result = ImsServiceSession::receiveBye(bye);
    if (result.is_error()) {
        core::Logger::warn("Failed to answer BYE for session {}: {}", getSessionID(), result.error().what());
    }

    const content::ContactId& remote = getRemoteContact();
    notifyListeners("onSessionAborted", [&](FileSharingSessionListener& listener) {
        listener.onSessionAborted(remote, TerminationReason::TERMINATION_BY_REMOTE);
    });

    // Unregister dulu, baru minta refresh capability
    removeSession();
    requestCapabilityRefresh(remote);
    return result;
}

void HttpFileTransferSession::requestCapabilityRefresh(const content::ContactId& contact) {
    CapabilityService& capabilities = getImsService().getCapabilityService();

    // Runs after teardown on the service event loop; failures stay there
    getImsService().getEventLoop().post([&capabilities, contact]() {
        auto result = capabilities.requestContactCapabilities(contact);
        if (result.is_error()) {
            core::Logger::warn("Capability refresh for {} failed: {}", contact, result.error().what());
        }
    });
}

core::Result<void> HttpFileTransferSession::pauseTransfer() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (isSessionInterrupted()) {
        return {core::ErrorCode::InvalidState, "Session " + getSessionID() + " is terminated"};
    }
    if (state_ != State::ESTABLISHED) {
        return {core::ErrorCode::InvalidState, "Cannot pause transfer " + getSessionID() + " before it started"};
    }
    return onPause();
}

core::Result<void> HttpFileTransferSession::resumeTransfer() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (isSessionInterrupted()) {
        return {core::ErrorCode::InvalidState, "Session " + getSessionID() + " is terminated"};
    }
    if (state_ != State::ESTABLISHED) {
        return {core::ErrorCode::InvalidState, "Cannot resume transfer " + getSessionID() + " before it started"};
    }
    return onResume();
}

void HttpFileTransferSession::onHttpTransferStarted() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!isAcceptingEvents("started")) {
        return;
    }
    if (state_ == State::ESTABLISHED) {
        core::Logger::debug("Session {} already established", getSessionID());
        return;
    }

    // Log state change
    state_ = State::ESTABLISHED;
    core::Logger::info("Session {} state changed: PENDING -> ESTABLISHED", getSessionID());

    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onSessionStarted", [&](FileSharingSessionListener& listener) {
        listener.onSessionStarted(contact);
    });
}

void HttpFileTransferSession::onHttpTransferProgress(uint64_t current_size, uint64_t total_size) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!isAcceptingEvents("progress")) {
        return;
    }

    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onTransferProgress", [&](FileSharingSessionListener& listener) {
        listener.onTransferProgress(contact, current_size, total_size);
    });
}

void HttpFileTransferSession::onHttpTransferNotAllowedToSend() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!isAcceptingEvents("not allowed to send")) {
        return;
    }

    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onTransferNotAllowedToSend", [&](FileSharingSessionListener& listener) {
        listener.onTransferNotAllowedToSend(contact);
    });
}

void HttpFileTransferSession::onHttpTransferPausedByUser() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!isAcceptingEvents("paused by user")) {
        return;
    }

    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onFileTransferPausedByUser", [&](FileSharingSessionListener& listener) {
        listener.onFileTransferPausedByUser(contact);
    });
}

void HttpFileTransferSession::onHttpTransferPausedBySystem() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!isAcceptingEvents("paused by system")) {
        return;
    }

    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onFileTransferPausedBySystem", [&](FileSharingSessionListener& listener) {
        listener.onFileTransferPausedBySystem(contact);
    });
}

void HttpFileTransferSession::onHttpTransferResumed() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!isAcceptingEvents("resumed")) {
        return;
    }

    const content::ContactId& contact = getRemoteContact();
    notifyListeners("onFileTransferResumed", [&](FileSharingSessionListener& listener) {
        listener.onFileTransferResumed(contact);
    });
}

void HttpFileTransferSession::onHttpTransferred() {
    handleFileTransferred();
}

void HttpFileTransferSession::onHttpTransferError(const ImsServiceError& error) {
    handleError(error);
}

std::string sessionStateToString(HttpFileTransferSession::State state) {
    switch (state) {
        case HttpFileTransferSession::State::PENDING: return "PENDING";
        case HttpFileTransferSession::State::ESTABLISHED: return "ESTABLISHED";
    }
    return "UNKNOWN";
}

} // namespace rcs::ims
