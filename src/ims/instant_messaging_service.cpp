#include "rcs/ims/instant_messaging_service.hpp"
#include "rcs/core/logger.hpp"

namespace rcs::ims {

InstantMessagingService::InstantMessagingService(sip::SipInterface& sip_interface,
                                                 CapabilityService& capability_service,
                                                 HttpTransferEngine& transfer_engine,
                                                 core::EventLoop& event_loop)
    : sip_interface_(sip_interface)
    , capability_service_(capability_service)
    , transfer_engine_(transfer_engine)
    , event_loop_(event_loop) {
}

InstantMessagingService::~InstantMessagingService() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.empty()) {
        core::Logger::warn("Instant messaging service released with {} active sessions", sessions_.size());
    }
}

core::Result<void> InstantMessagingService::addSession(SessionPtr session) {
    if (!session) {
        return {core::ErrorCode::InvalidArgument, "Cannot register a null session"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& id = session->getSessionID();
    if (sessions_.count(id) != 0) {
        return {core::ErrorCode::InvalidArgument, "Session already registered: " + id};
    }

    // Simpan session baru
    sessions_.emplace(id, std::move(session));
    core::Logger::info("Added session {} ({} active)", id, sessions_.size());
    return {};
}

void InstantMessagingService::removeSession(const std::string& session_id) {
    SessionPtr removed;
    SessionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }

        // Released outside the lock; the session destructor may run here
        removed = std::move(it->second);
        sessions_.erase(it);
        callback = session_removed_callback_;
        core::Logger::info("Removed session {} ({} active)", session_id, sessions_.size());
    }

    if (callback) {
        callback(session_id);
    }
}

InstantMessagingService::SessionPtr InstantMessagingService::getSession(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

InstantMessagingService::SessionPtr InstantMessagingService::findSessionByCallId(const std::string& call_id) const {
    if (call_id.empty()) {
        return nullptr;
    }

    // Copy first: getCallId() takes the session lock
    for (const auto& session : getSessions()) {
        if (session->getCallId() == call_id) {
            return session;
        }
    }
    return nullptr;
}

std::vector<InstantMessagingService::SessionPtr> InstantMessagingService::getSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionPtr> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

std::size_t InstantMessagingService::getSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

core::Result<void> InstantMessagingService::receiveBye(const sip::SipMessage& bye) {
    if (!bye.isRequest() || bye.getMethod() != sip::SipMethod::BYE) {
        return {core::ErrorCode::InvalidArgument, "Not a BYE request"};
    }

    // Mencari session berdasarkan Call-ID
    auto session = findSessionByCallId(bye.getCallId());
    if (!session) {
        core::Logger::warn("BYE for unknown dialog {}", bye.getCallId());

        // Send 481 Call/Transaction Does Not Exist
        sip::SipMessage response(sip::SipResponseCode::CallTransactionDoesNotExist);
        const sip::SipHeaders& in = bye.getHeaders();
        response.getHeaders().setFrom(in.getFrom());
        response.getHeaders().setTo(in.getTo());
        response.getHeaders().setCallId(in.getCallId());
        response.getHeaders().set("CSeq", in.getCSeq());

        auto sent = sip_interface_.sendResponse(response);
        if (sent.is_error()) {
            core::Logger::warn("Failed to answer BYE: {}", sent.error().what());
        }
        return {core::ErrorCode::SessionNotFound, "No session for Call-ID " + bye.getCallId()};
    }

    return session->receiveBye(bye);
}

void InstantMessagingService::setSessionRemovedCallback(SessionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_removed_callback_ = std::move(callback);
}

} // namespace rcs::ims
