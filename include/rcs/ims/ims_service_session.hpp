#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <rcs/content/contact_id.hpp>
#include <rcs/core/error.hpp>
#include <rcs/ims/termination_reason.hpp>
#include <rcs/sip/dialog_path.hpp>
#include <rcs/sip/message.hpp>

namespace rcs::ims {

class InstantMessagingService;

// Generic session bookkeeping shared by every session type: identity,
// the interrupted flag, the SIP dialog and registration in the service.
//
// Sessions are always owned by a shared_ptr (the service registry keeps
// one); terminal paths hold an extra reference while they unregister.
class ImsServiceSession : public std::enable_shared_from_this<ImsServiceSession> {
public:
    ImsServiceSession(InstantMessagingService& im_service,
                      content::ContactId contact,
                      std::string remote_uri,
                      std::string session_id,
                      int64_t timestamp);
    virtual ~ImsServiceSession();

    ImsServiceSession(const ImsServiceSession&) = delete;
    ImsServiceSession& operator=(const ImsServiceSession&) = delete;

    const std::string& getSessionID() const { return session_id_; }
    const content::ContactId& getRemoteContact() const { return contact_; }
    const std::string& getRemoteUri() const { return remote_uri_; }
    int64_t getTimestamp() const { return timestamp_; }

    // Call-ID of the dialog, empty while no dialog exists
    std::string getCallId() const;

    void setDialogPath(sip::DialogPath dialog_path);
    bool hasDialogPath() const;

    // Interrupted marks the point after which teardown is committed
    bool isSessionInterrupted() const { return interrupted_; }
    void interruptSession();

    bool isSessionRemoved() const { return removed_; }

    InstantMessagingService& getImsService() const { return im_service_; }

    // Builds the INVITE that opens the session, nullopt for sessions that
    // are not negotiated over SIP
    virtual core::Result<std::optional<sip::SipMessage>> createInvite() = 0;

    virtual void closeMediaSession() = 0;

    // Generic handling of a BYE received in the session's dialog: interrupts
    // the session, closes media and answers 200 OK. Listener notification
    // and unregistration are left to subclasses.
    virtual core::Result<void> receiveBye(const sip::SipMessage& bye);

protected:
    // Sends BYE when a SIP dialog is established; no-op otherwise
    core::Result<void> closeSession(TerminationReason reason);

    // Unregisters the session from the service, once
    void removeSession();

    // Serializes every state mutation of the session. Recursive so that a
    // listener callback may query the session it is notified by.
    mutable std::recursive_mutex mutex_;

private:
    InstantMessagingService& im_service_;
    content::ContactId contact_;
    std::string remote_uri_;
    std::string session_id_;
    int64_t timestamp_;

    std::optional<sip::DialogPath> dialog_path_;

    std::atomic<bool> interrupted_{false};
    std::atomic<bool> removed_{false};
};

} // namespace rcs::ims
