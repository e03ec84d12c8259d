#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <rcs/core/error.hpp>
#include <rcs/core/event_loop.hpp>
#include <rcs/ims/capability_service.hpp>
#include <rcs/ims/http_transfer.hpp>
#include <rcs/ims/ims_service_session.hpp>
#include <rcs/sip/message.hpp>
#include <rcs/sip/sip_interface.hpp>

namespace rcs::ims {

// Registry of active sessions and access point to the collaborators they
// share. Collaborators must outlive the service and every session.
class InstantMessagingService {
public:
    using SessionPtr = std::shared_ptr<ImsServiceSession>;
    using SessionCallback = std::function<void(const std::string&)>;

    InstantMessagingService(sip::SipInterface& sip_interface,
                            CapabilityService& capability_service,
                            HttpTransferEngine& transfer_engine,
                            core::EventLoop& event_loop);
    ~InstantMessagingService();

    InstantMessagingService(const InstantMessagingService&) = delete;
    InstantMessagingService& operator=(const InstantMessagingService&) = delete;

    // Session management
    core::Result<void> addSession(SessionPtr session);
    void removeSession(const std::string& session_id);
    SessionPtr getSession(const std::string& session_id) const;
    SessionPtr findSessionByCallId(const std::string& call_id) const;
    std::vector<SessionPtr> getSessions() const;
    std::size_t getSessionCount() const;

    template<typename T>
    std::shared_ptr<T> getSessionAs(const std::string& session_id) const {
        return std::dynamic_pointer_cast<T>(getSession(session_id));
    }

    // Routes a BYE to the session owning its Call-ID. Unknown dialogs are
    // answered 481 and reported as SessionNotFound.
    core::Result<void> receiveBye(const sip::SipMessage& bye);

    void setSessionRemovedCallback(SessionCallback callback);

    sip::SipInterface& getSipInterface() const { return sip_interface_; }
    CapabilityService& getCapabilityService() const { return capability_service_; }
    HttpTransferEngine& getHttpTransferEngine() const { return transfer_engine_; }
    core::EventLoop& getEventLoop() const { return event_loop_; }

private:
    sip::SipInterface& sip_interface_;
    CapabilityService& capability_service_;
    HttpTransferEngine& transfer_engine_;
    core::EventLoop& event_loop_;

    std::unordered_map<std::string, SessionPtr> sessions_;
    SessionCallback session_removed_callback_;

    mutable std::mutex mutex_;
};

} // namespace rcs::ims
