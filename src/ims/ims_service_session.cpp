#include "rcs/ims/ims_service_session.hpp"
#include "rcs/ims/instant_messaging_service.hpp"
#include "rcs/core/id_generator.hpp"
#include "rcs/core/logger.hpp"

namespace rcs::ims {

ImsServiceSession::ImsServiceSession(InstantMessagingService& im_service,
                                     content::ContactId contact,
                                     std::string remote_uri,
                                     std::string session_id,
                                     int64_t timestamp)
    : im_service_(im_service)
    , contact_(std::move(contact))
    , remote_uri_(std::move(remote_uri))
    , session_id_(std::move(session_id))
    , timestamp_(timestamp) {
    core::Logger::debug("Created session {} with {}", session_id_, contact_);
}

ImsServiceSession::~ImsServiceSession() {
    core::Logger::debug("Destroyed session {}", session_id_);
}

std::string ImsServiceSession::getCallId() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return dialog_path_ ? dialog_path_->getCallId() : std::string();
}

void ImsServiceSession::setDialogPath(sip::DialogPath dialog_path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    dialog_path_.emplace(std::move(dialog_path));
}

bool ImsServiceSession::hasDialogPath() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return dialog_path_.has_value();
}

void ImsServiceSession::interruptSession() {
    if (!interrupted_.exchange(true)) {
        core::Logger::debug("Session {} interrupted", session_id_);
    }
}

core::Result<void> ImsServiceSession::receiveBye(const sip::SipMessage& bye) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    core::Logger::info("Receive BYE for session {} from {}", session_id_, contact_);

    interruptSession();
    closeMediaSession();

    // Membuat response 200 OK dari dialog yang ada
    sip::SipMessage response = dialog_path_
        ? dialog_path_->createResponse(bye, sip::SipResponseCode::OK)
        : sip::DialogPath::fromIncomingRequest(bye, core::IdGenerator::generateTag())
              .createResponse(bye, sip::SipResponseCode::OK);

    return im_service_.getSipInterface().sendResponse(response);
}

core::Result<void> ImsServiceSession::closeSession(TerminationReason reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    core::Logger::info("Close session {} ({})", session_id_, terminationReasonToString(reason));

    if (!dialog_path_ || !dialog_path_->isSigEstablished()) {
        return {};
    }

    // The remote already ended the dialog
    if (reason == TerminationReason::TERMINATION_BY_REMOTE) {
        return {};
    }

    return im_service_.getSipInterface().sendRequest(dialog_path_->createBye());
}

void ImsServiceSession::removeSession() {
    if (removed_.exchange(true)) {
        return;
    }
    im_service_.removeSession(session_id_);
}

} // namespace rcs::ims
