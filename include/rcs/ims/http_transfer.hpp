#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <rcs/content/mm_content.hpp>
#include <rcs/core/error.hpp>
#include <rcs/ims/service_error.hpp>

namespace rcs::ims {

// Lifecycle events emitted by the HTTP transfer engine for one transfer
class HttpTransferEventListener {
public:
    virtual ~HttpTransferEventListener() = default;

    virtual void onHttpTransferStarted() = 0;
    virtual void onHttpTransferProgress(uint64_t current_size, uint64_t total_size) = 0;
    virtual void onHttpTransferPausedByUser() = 0;
    virtual void onHttpTransferPausedBySystem() = 0;
    virtual void onHttpTransferResumed() = 0;
    virtual void onHttpTransferNotAllowedToSend() = 0;
    virtual void onHttpTransferred() = 0;
    virtual void onHttpTransferError(const ImsServiceError& error) = 0;
};

// Handle on one upload or download running in the transfer engine
class TransferControl {
public:
    virtual ~TransferControl() = default;

    virtual core::Result<void> start() = 0;
    virtual core::Result<void> pause() = 0;
    virtual core::Result<void> resume() = 0;
    virtual core::Result<void> cancel() = 0;
};

// Factory for transfers. The returned control reports to the given listener,
// which must outlive it.
class HttpTransferEngine {
public:
    virtual ~HttpTransferEngine() = default;

    virtual std::unique_ptr<TransferControl> createUpload(
        const content::MmContent& content,
        const std::optional<content::MmContent>& file_icon,
        HttpTransferEventListener& listener) = 0;

    virtual std::unique_ptr<TransferControl> createDownload(
        const content::MmContent& content,
        const std::optional<content::MmContent>& file_icon,
        HttpTransferEventListener& listener) = 0;
};

} // namespace rcs::ims
