#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <rcs/content/contact_id.hpp>
#include <rcs/content/mm_content.hpp>
#include <rcs/core/error.hpp>
#include <rcs/ft/file_transfer_settings.hpp>
#include <rcs/ims/http_file_transfer_session.hpp>
#include <rcs/ims/instant_messaging_service.hpp>
#include <rcs/ims/listener_set.hpp>
#include <rcs/ims/messaging_log.hpp>
#include <rcs/ims/originating_http_file_sharing_session.hpp>
#include <rcs/ims/session_listener.hpp>
#include <rcs/ims/terminating_http_file_sharing_session.hpp>
#include <rcs/sip/dialog_path.hpp>

namespace rcs::ft {

// File announced by a remote through the messaging plane
struct FileTransferInvitation {
    content::ContactId contact;
    // Derived from the contact when empty
    std::string remote_uri;
    content::MmContent content;
    std::optional<content::MmContent> file_icon;
    std::string chat_contribution_id;
    // Generated when empty
    std::string file_transfer_id;
    int64_t timestamp = 0;
    int64_t file_expiration = 0;
    int64_t icon_expiration = 0;
    // Dialog the invitation arrived in, so a BYE can reach the session
    std::optional<sip::DialogPath> dialog_path;
};

// Client-facing API for one-to-one file transfers over HTTP
class FileTransferService {
public:
    using ListenerPtr = std::shared_ptr<ims::FileSharingSessionListener>;
    using SessionPtr = std::shared_ptr<ims::HttpFileTransferSession>;

    FileTransferService(ims::InstantMessagingService& im_service,
                        ims::MessagingLog& messaging_log,
                        FileTransferServiceConfiguration configuration);

    FileTransferService(const FileTransferService&) = delete;
    FileTransferService& operator=(const FileTransferService&) = delete;

    FileTransferServiceConfiguration getConfiguration() const;

    // Sends a file to a contact. The icon is only kept for images and when
    // icons are supported.
    core::Result<std::shared_ptr<ims::OriginatingHttpFileSharingSession>> transferFile(
        const content::ContactId& contact,
        content::MmContent content,
        std::optional<content::MmContent> file_icon = std::nullopt);

    // Registers an incoming transfer; it waits for acceptInvitation or
    // rejectInvitation
    core::Result<std::shared_ptr<ims::TerminatingHttpFileSharingSession>> receiveFileTransferInvitation(
        FileTransferInvitation invitation);

    core::Result<void> acceptInvitation(const std::string& transfer_id);
    core::Result<void> rejectInvitation(const std::string& transfer_id);

    core::Result<void> pauseTransfer(const std::string& transfer_id);
    core::Result<void> resumeTransfer(const std::string& transfer_id);
    core::Result<void> abortTransfer(const std::string& transfer_id);

    core::Result<void> markFileTransferAsRead(const std::string& transfer_id);

    std::vector<SessionPtr> getFileTransfers() const;
    SessionPtr getFileTransfer(const std::string& transfer_id) const;

    // Listeners are attached to current transfers and to every transfer
    // created afterwards
    bool addListener(ListenerPtr listener);
    bool removeListener(const ListenerPtr& listener);

    core::Result<void> setAutoAccept(bool enable);
    core::Result<void> setAutoAcceptInRoaming(bool enable);
    core::Result<void> setImageResizeOption(int64_t option);

private:
    core::Result<void> checkCapacity(const content::MmContent& content) const;
    void attachListeners(ims::HttpFileTransferSession& session) const;
    core::Result<SessionPtr> findTransfer(const std::string& transfer_id) const;

    ims::InstantMessagingService& im_service_;
    ims::MessagingLog& messaging_log_;

    FileTransferServiceConfiguration configuration_;
    mutable std::mutex config_mutex_;

    ims::ListenerSet<ims::FileSharingSessionListener> listeners_;
};

// "sip:" for addresses with a domain, "tel:" for numbers
std::string remoteUriForContact(const content::ContactId& contact);

} // namespace rcs::ft
