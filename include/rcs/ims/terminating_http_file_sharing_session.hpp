#pragma once

#include <rcs/ims/http_file_transfer_session.hpp>

#include <functional>

namespace rcs::ims {

// Incoming transfer: downloads the file announced by the remote from the
// content server, while it is still available there
class TerminatingHttpFileSharingSession : public HttpFileTransferSession {
public:
    // Milliseconds since epoch, compared against the file expiration
    using Clock = std::function<int64_t()>;

    TerminatingHttpFileSharingSession(InstantMessagingService& im_service,
                                      content::MmContent content,
                                      content::ContactId contact,
                                      std::string remote_uri,
                                      std::optional<content::MmContent> file_icon,
                                      std::string chat_contribution_id,
                                      std::string file_transfer_id,
                                      int64_t timestamp,
                                      int64_t file_expiration,
                                      int64_t icon_expiration);

    // Starts the download. An expired file ends the session with
    // MEDIA_DOWNLOAD_FAILED instead.
    core::Result<void> acceptSession();

    // Declines the invitation (aborted by user)
    core::Result<void> rejectSession();

    bool isAccepted() const;

    bool isFileExpired() const;

    void setClock(Clock clock);

protected:
    core::Result<void> onPause() override;
    core::Result<void> onResume() override;

private:
    core::Result<void> failExpired();

    bool accepted_ = false;
    Clock clock_;
};

} // namespace rcs::ims
