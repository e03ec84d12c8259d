#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <rcs/core/error.hpp>
#include <rcs/ims/file_sharing_session.hpp>
#include <rcs/ims/http_transfer.hpp>
#include <rcs/ims/termination_reason.hpp>

namespace rcs::ims {

// File transfer whose content travels over HTTP through a content server,
// while the session itself is announced and torn down on the messaging plane.
//
// Every transfer event and every client request is handled under the session
// lock, and listeners are notified before the lock is released, so the order
// of callbacks matches the order in which events were accepted. Exactly one
// terminal callback (onTransferError, onFileTransfered or onSessionAborted)
// is delivered; the session is unregistered right after it, and any later
// event is dropped.
class HttpFileTransferSession : public FileSharingSession, public HttpTransferEventListener {
public:
    enum class State {
        // Not yet accepted by a final response from the remote
        PENDING,
        // Transfer started
        ESTABLISHED
    };

    HttpFileTransferSession(InstantMessagingService& im_service,
                            content::MmContent content,
                            content::ContactId contact,
                            std::string remote_uri,
                            std::optional<content::MmContent> file_icon,
                            std::string chat_contribution_id,
                            std::string file_transfer_id,
                            int64_t timestamp,
                            int64_t file_expiration,
                            int64_t icon_expiration);
    ~HttpFileTransferSession() override;

    State getSessionState() const { return state_; }

    // Time (ms since epoch) when the file/icon stops being downloadable
    // from the content server
    int64_t getFileExpiration() const { return file_expiration_; }
    int64_t getIconExpiration() const { return icon_expiration_; }

    // Client requests; only valid once the transfer has started
    core::Result<void> pauseTransfer();
    core::Result<void> resumeTransfer();

    // Explicit abort: cancels the transfer, notifies onSessionAborted with
    // the reason and closes the session
    core::Result<void> abortSession(TerminationReason reason);

    // Interrupts, runs the close bookkeeping and unregisters the session.
    // Unregistration happens even when closing fails; the failure is returned.
    core::Result<void> closeHttpSession(TerminationReason reason);

    // Terminal error path; a no-op once the session is interrupted
    void handleError(const ImsServiceError& error);

    // Terminal success path. Over HTTP this means the content server, not
    // the remote, has the file.
    void handleFileTransferred();

    // ImsServiceSession
    core::Result<std::optional<sip::SipMessage>> createInvite() override;
    void closeMediaSession() override;
    core::Result<void> receiveBye(const sip::SipMessage& bye) override;

    // HttpTransferEventListener
    void onHttpTransferStarted() override;
    void onHttpTransferProgress(uint64_t current_size, uint64_t total_size) override;
    void onHttpTransferPausedByUser() override;
    void onHttpTransferPausedBySystem() override;
    void onHttpTransferResumed() override;
    void onHttpTransferNotAllowedToSend() override;
    void onHttpTransferred() override;
    void onHttpTransferError(const ImsServiceError& error) override;

protected:
    // How pause/resume reach the transfer engine depends on the direction
    virtual core::Result<void> onPause() = 0;
    virtual core::Result<void> onResume() = 0;

    void setTransferControl(std::unique_ptr<TransferControl> control);
    TransferControl* getTransferControl() const { return control_.get(); }

    // Claims the single terminal outcome; false if another path got there first
    bool commitTermination(const std::string& event);

private:
    bool isAcceptingEvents(const std::string& event) const;
    void requestCapabilityRefresh(const content::ContactId& contact);

    std::atomic<State> state_{State::PENDING};
    const int64_t file_expiration_;
    const int64_t icon_expiration_;

    std::unique_ptr<TransferControl> control_;
};

std::string sessionStateToString(HttpFileTransferSession::State state);

} // namespace rcs::ims
