#pragma once

#include <cstdint>

#include <rcs/content/contact_id.hpp>
#include <rcs/content/mm_content.hpp>
#include <rcs/ims/service_error.hpp>
#include <rcs/ims/termination_reason.hpp>

namespace rcs::ims {

// Observer of a session's signaling lifecycle
class ImsSessionListener {
public:
    virtual ~ImsSessionListener() = default;

    virtual void onSessionStarted(const content::ContactId& contact) = 0;
    virtual void onSessionAborted(const content::ContactId& contact, TerminationReason reason) = 0;
};

// Observer of a file transfer session.
//
// Callbacks run synchronously on the thread that delivered the underlying
// event (transfer engine worker, SIP dispatcher or client call) while the
// session lock is held. Implementations must return quickly and must not
// block on other sessions.
class FileSharingSessionListener : public ImsSessionListener {
public:
    virtual void onTransferProgress(const content::ContactId& contact,
                                    uint64_t current_size, uint64_t total_size) = 0;

    virtual void onTransferNotAllowedToSend(const content::ContactId& contact) = 0;

    virtual void onFileTransferPausedByUser(const content::ContactId& contact) = 0;

    virtual void onFileTransferPausedBySystem(const content::ContactId& contact) = 0;

    virtual void onFileTransferResumed(const content::ContactId& contact) = 0;

    virtual void onFileTransfered(const content::MmContent& content,
                                  const content::ContactId& contact,
                                  int64_t file_expiration,
                                  int64_t icon_expiration,
                                  content::FileTransferProtocol protocol) = 0;

    virtual void onTransferError(const FileSharingError& error, const content::ContactId& contact) = 0;
};

} // namespace rcs::ims
