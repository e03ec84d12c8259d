#include "rcs/ft/file_transfer_service.hpp"
#include "rcs/core/id_generator.hpp"
#include "rcs/core/logger.hpp"

#include <chrono>

namespace rcs::ft {

namespace {

int64_t currentTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

std::string remoteUriForContact(const content::ContactId& contact) {
    if (contact.toString().find('@') != std::string::npos) {
        return "sip:" + contact.toString();
    }
    return "tel:" + contact.toString();
}

FileTransferService::FileTransferService(ims::InstantMessagingService& im_service,
                                         ims::MessagingLog& messaging_log,
                                         FileTransferServiceConfiguration configuration)
    : im_service_(im_service)
    , messaging_log_(messaging_log)
    , configuration_(configuration) {
}

FileTransferServiceConfiguration FileTransferService::getConfiguration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return configuration_;
}

core::Result<void> FileTransferService::checkCapacity(const content::MmContent& content) const {
    auto config = getConfiguration();

    if (config.max_size > 0 && content.getSize() > config.max_size) {
        return {core::ErrorCode::ContentTooLarge,
                "File " + content.getName() + " exceeds the maximum size of " +
                std::to_string(config.max_size) + " bytes"};
    }
    if (config.warn_size > 0 && content.getSize() > config.warn_size) {
        core::Logger::warn("File {} is larger than the warning size ({} > {})",
                           content.getName(), content.getSize(), config.warn_size);
    }
    if (config.max_sessions > 0 && getFileTransfers().size() >= config.max_sessions) {
        return {core::ErrorCode::ServiceNotAvailable,
                "Maximum number of file transfers reached (" + std::to_string(config.max_sessions) + ")"};
    }
    return {};
}

void FileTransferService::attachListeners(ims::HttpFileTransferSession& session) const {
    for (const auto& listener : listeners_.snapshot()) {
        session.addListener(listener);
    }
}

core::Result<std::shared_ptr<ims::OriginatingHttpFileSharingSession>> FileTransferService::transferFile(
        const content::ContactId& contact,
        content::MmContent content,
        std::optional<content::MmContent> file_icon) {
    if (contact.empty()) {
        return {core::ErrorCode::InvalidArgument, "Contact is required"};
    }

    // Periksa batas ukuran dan jumlah transfer
    auto capacity = checkCapacity(content);
    if (capacity.is_error()) {
        return capacity.error();
    }

    if (file_icon && (!content.isImage() || !getConfiguration().file_icon_supported)) {
        core::Logger::debug("Dropping file icon for {} ({})", content.getName(), content.getEncoding());
        file_icon.reset();
    }

    // Membuat session upload baru
    auto session = std::make_shared<ims::OriginatingHttpFileSharingSession>(
        im_service_, std::move(content), contact, remoteUriForContact(contact), std::move(file_icon),
        "", core::IdGenerator::generateTransferId(), currentTimeMillis());
    attachListeners(*session);

    auto added = im_service_.addSession(session);
    if (added.is_error()) {
        return added.error();
    }

    core::Logger::info("Transfer file {} to {} (transfer {})",
                       session->getContent().getName(), contact, session->getFileTransferId());

    // Start the upload, tear down on failure
    auto started = session->startSession();
    if (started.is_error()) {
        auto closed = session->closeHttpSession(ims::TerminationReason::TERMINATION_BY_SYSTEM);
        if (closed.is_error()) {
            core::Logger::warn("Failed to close transfer {}: {}", session->getFileTransferId(), closed.error().what());
        }
        return started.error();
    }
    return session;
}

core::Result<std::shared_ptr<ims::TerminatingHttpFileSharingSession>>
FileTransferService::receiveFileTransferInvitation(FileTransferInvitation invitation) {
    if (invitation.contact.empty()) {
        return {core::ErrorCode::InvalidArgument, "Invitation without contact"};
    }

    auto capacity = checkCapacity(invitation.content);
    if (capacity.is_error()) {
        core::Logger::warn("Refusing invitation from {}: {}", invitation.contact, capacity.error().what());
        return capacity.error();
    }

    // Lengkapi field yang tidak dikirim oleh remote
    if (invitation.remote_uri.empty()) {
        invitation.remote_uri = remoteUriForContact(invitation.contact);
    }
    if (invitation.file_transfer_id.empty()) {
        invitation.file_transfer_id = core::IdGenerator::generateTransferId();
    }
    if (invitation.timestamp == 0) {
        invitation.timestamp = currentTimeMillis();
    }

    auto session = std::make_shared<ims::TerminatingHttpFileSharingSession>(
        im_service_, std::move(invitation.content), invitation.contact, std::move(invitation.remote_uri),
        std::move(invitation.file_icon), std::move(invitation.chat_contribution_id),
        std::move(invitation.file_transfer_id), invitation.timestamp,
        invitation.file_expiration, invitation.icon_expiration);
    if (invitation.dialog_path) {
        session->setDialogPath(std::move(*invitation.dialog_path));
    }
    attachListeners(*session);

    auto added = im_service_.addSession(session);
    if (added.is_error()) {
        return added.error();
    }

    core::Logger::info("Received file {} from {} (transfer {})",
                       session->getContent().getName(), invitation.contact, session->getFileTransferId());
    return session;
}

core::Result<FileTransferService::SessionPtr> FileTransferService::findTransfer(const std::string& transfer_id) const {
    auto session = getFileTransfer(transfer_id);
    if (!session) {
        return {core::ErrorCode::SessionNotFound, "Unknown file transfer: " + transfer_id};
    }
    return session;
}

core::Result<void> FileTransferService::acceptInvitation(const std::string& transfer_id) {
    auto session = im_service_.getSessionAs<ims::TerminatingHttpFileSharingSession>(transfer_id);
    if (!session) {
        return {core::ErrorCode::SessionNotFound, "No pending invitation: " + transfer_id};
    }
    return session->acceptSession();
}

core::Result<void> FileTransferService::rejectInvitation(const std::string& transfer_id) {
    auto session = im_service_.getSessionAs<ims::TerminatingHttpFileSharingSession>(transfer_id);
    if (!session) {
        return {core::ErrorCode::SessionNotFound, "No pending invitation: " + transfer_id};
    }
    return session->rejectSession();
}

core::Result<void> FileTransferService::pauseTransfer(const std::string& transfer_id) {
    auto session = findTransfer(transfer_id);
    if (session.is_error()) {
        return session.error();
    }
    return session.value()->pauseTransfer();
}

core::Result<void> FileTransferService::resumeTransfer(const std::string& transfer_id) {
    auto session = findTransfer(transfer_id);
    if (session.is_error()) {
        return session.error();
    }
    return session.value()->resumeTransfer();
}

core::Result<void> FileTransferService::abortTransfer(const std::string& transfer_id) {
    auto session = findTransfer(transfer_id);
    if (session.is_error()) {
        return session.error();
    }
    return session.value()->abortSession(ims::TerminationReason::TERMINATION_BY_USER);
}

core::Result<void> FileTransferService::markFileTransferAsRead(const std::string& transfer_id) {
    if (transfer_id.empty()) {
        return {core::ErrorCode::InvalidArgument, "Transfer id is required"};
    }
    return messaging_log_.markFileTransferAsRead(transfer_id);
}

std::vector<FileTransferService::SessionPtr> FileTransferService::getFileTransfers() const {
    std::vector<SessionPtr> transfers;
    for (const auto& session : im_service_.getSessions()) {
        if (auto transfer = std::dynamic_pointer_cast<ims::HttpFileTransferSession>(session)) {
            transfers.push_back(std::move(transfer));
        }
    }
    return transfers;
}

FileTransferService::SessionPtr FileTransferService::getFileTransfer(const std::string& transfer_id) const {
    return im_service_.getSessionAs<ims::HttpFileTransferSession>(transfer_id);
}

bool FileTransferService::addListener(ListenerPtr listener) {
    if (!listeners_.add(listener)) {
        return false;
    }
    // Also attach to transfers already running
    for (const auto& session : getFileTransfers()) {
        session->addListener(listener);
    }
    return true;
}

bool FileTransferService::removeListener(const ListenerPtr& listener) {
    if (!listeners_.remove(listener)) {
        return false;
    }
    for (const auto& session : getFileTransfers()) {
        session->removeListener(listener);
    }
    return true;
}

core::Result<void> FileTransferService::setAutoAccept(bool enable) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (!configuration_.auto_accept_mode_changeable) {
        return {core::ErrorCode::NotSupported, "Auto accept mode is not changeable"};
    }

    configuration_.auto_accept = enable;
    // Roaming mengikuti auto accept
    if (!enable) {
        configuration_.auto_accept_in_roaming = false;
    }
    core::Logger::info("Auto accept {}", enable ? "enabled" : "disabled");
    return {};
}

core::Result<void> FileTransferService::setAutoAcceptInRoaming(bool enable) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (!configuration_.auto_accept_mode_changeable) {
        return {core::ErrorCode::NotSupported, "Auto accept mode is not changeable"};
    }
    if (!configuration_.auto_accept) {
        return {core::ErrorCode::InvalidState, "Auto accept in roaming requires auto accept"};
    }

    configuration_.auto_accept_in_roaming = enable;
    core::Logger::info("Auto accept in roaming {}", enable ? "enabled" : "disabled");
    return {};
}

core::Result<void> FileTransferService::setImageResizeOption(int64_t option) {
    auto resize = imageResizeOptionFromInt(option);
    if (resize.is_error()) {
        return resize.error();
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    configuration_.image_resize_option = resize.value();
    core::Logger::info("Image resize option set to {}", imageResizeOptionToString(resize.value()));
    return {};
}

} // namespace rcs::ft
