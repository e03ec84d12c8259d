#pragma once

#include <string>

#include <rcs/core/error.hpp>

namespace rcs::ims {

// Persistent history of messages and file transfers
class MessagingLog {
public:
    virtual ~MessagingLog() = default;

    virtual core::Result<void> markFileTransferAsRead(const std::string& file_transfer_id) = 0;
};

} // namespace rcs::ims
