#include "rcs/ims/file_sharing_session.hpp"

namespace rcs::ims {

FileSharingSession::FileSharingSession(InstantMessagingService& im_service,
                                       content::MmContent content,
                                       content::ContactId contact,
                                       std::string remote_uri,
                                       std::optional<content::MmContent> file_icon,
                                       std::string file_transfer_id,
                                       int64_t timestamp)
    : ImsServiceSession(im_service, std::move(contact), std::move(remote_uri),
                        std::move(file_transfer_id), timestamp)
    , content_(std::move(content))
    , file_icon_(std::move(file_icon)) {
}

} // namespace rcs::ims
