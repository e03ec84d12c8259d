#pragma once

#include <rcs/ims/http_file_transfer_session.hpp>

namespace rcs::ims {

// Outgoing transfer: uploads the file to the content server
class OriginatingHttpFileSharingSession : public HttpFileTransferSession {
public:
    OriginatingHttpFileSharingSession(InstantMessagingService& im_service,
                                      content::MmContent content,
                                      content::ContactId contact,
                                      std::string remote_uri,
                                      std::optional<content::MmContent> file_icon,
                                      std::string chat_contribution_id,
                                      std::string file_transfer_id,
                                      int64_t timestamp);

    // Starts the upload; progress is reported through the transfer events
    core::Result<void> startSession();

protected:
    core::Result<void> onPause() override;
    core::Result<void> onResume() override;

private:
    bool upload_started_ = false;
};

} // namespace rcs::ims
