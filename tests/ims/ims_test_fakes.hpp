#pragma once

#include <rcs/content/contact_id.hpp>
#include <rcs/content/mm_content.hpp>
#include <rcs/core/error.hpp>
#include <rcs/ims/capability_service.hpp>
#include <rcs/ims/http_transfer.hpp>
#include <rcs/ims/messaging_log.hpp>
#include <rcs/ims/session_listener.hpp>
#include <rcs/sip/message.hpp>
#include <rcs/sip/sip_interface.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rcs::ims::test {

inline content::ContactId makeContact(const std::string& value = "+33612345678") {
    return content::ContactId::create(value).value();
}

inline content::MmContent makeContent(const std::string& name = "photo.jpg",
                                      const std::string& encoding = "image/jpeg",
                                      uint64_t size = 4096) {
    return content::MmContent("file:///sdcard/" + name, encoding, size, name);
}

class RecordingSipInterface : public sip::SipInterface {
public:
    core::Result<void> sendRequest(const sip::SipMessage& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (fail_requests_) {
            return {core::ErrorCode::NetworkError, "Request not delivered"};
        }
        return {};
    }

    core::Result<void> sendResponse(const sip::SipMessage& response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(response);
        if (fail_responses_) {
            return {core::ErrorCode::NetworkError, "Response not delivered"};
        }
        return {};
    }

    void failRequests(bool fail) { fail_requests_ = fail; }
    void failResponses(bool fail) { fail_responses_ = fail; }

    std::vector<sip::SipMessage> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<sip::SipMessage> responses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return responses_;
    }

private:
    std::vector<sip::SipMessage> requests_;
    std::vector<sip::SipMessage> responses_;
    bool fail_requests_ = false;
    bool fail_responses_ = false;
    mutable std::mutex mutex_;
};

class RecordingCapabilityService : public CapabilityService {
public:
    core::Result<void> requestContactCapabilities(const content::ContactId& contact) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.push_back(contact);
        if (fail_) {
            return {core::ErrorCode::ServiceNotAvailable, "Capability service down"};
        }
        return {};
    }

    void fail(bool fail) { fail_ = fail; }

    std::vector<content::ContactId> requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

private:
    std::vector<content::ContactId> requested_;
    bool fail_ = false;
    mutable std::mutex mutex_;
};

// Calls received by one transfer, kept alive after the control is released
struct TransferLog {
    bool upload = true;
    content::MmContent content;
    bool has_icon = false;
    int starts = 0;
    int pauses = 0;
    int resumes = 0;
    int cancels = 0;
    bool fail_start = false;
    bool fail_cancel = false;
};

class FakeTransferControl : public TransferControl {
public:
    explicit FakeTransferControl(std::shared_ptr<TransferLog> log) : log_(std::move(log)) {}

    core::Result<void> start() override {
        log_->starts++;
        if (log_->fail_start) {
            return {core::ErrorCode::NetworkError, "Content server unreachable"};
        }
        return {};
    }

    core::Result<void> pause() override {
        log_->pauses++;
        return {};
    }

    core::Result<void> resume() override {
        log_->resumes++;
        return {};
    }

    core::Result<void> cancel() override {
        log_->cancels++;
        if (log_->fail_cancel) {
            return {core::ErrorCode::NetworkError, "Cancel not delivered"};
        }
        return {};
    }

private:
    std::shared_ptr<TransferLog> log_;
};

class FakeTransferEngine : public HttpTransferEngine {
public:
    std::unique_ptr<TransferControl> createUpload(const content::MmContent& content,
                                                  const std::optional<content::MmContent>& file_icon,
                                                  HttpTransferEventListener& listener) override {
        return create(true, content, file_icon, listener);
    }

    std::unique_ptr<TransferControl> createDownload(const content::MmContent& content,
                                                    const std::optional<content::MmContent>& file_icon,
                                                    HttpTransferEventListener& listener) override {
        return create(false, content, file_icon, listener);
    }

    // Applied to transfers created afterwards
    void failStart(bool fail) { fail_start_ = fail; }

    std::size_t transferCount() const { return transfers_.size(); }
    TransferLog& transfer(std::size_t index) { return *transfers_.at(index); }
    TransferLog& lastTransfer() { return *transfers_.back(); }
    HttpTransferEventListener& lastListener() { return *listeners_.back(); }

private:
    std::unique_ptr<TransferControl> create(bool upload,
                                            const content::MmContent& content,
                                            const std::optional<content::MmContent>& file_icon,
                                            HttpTransferEventListener& listener) {
        auto log = std::make_shared<TransferLog>();
        log->upload = upload;
        log->content = content;
        log->has_icon = file_icon.has_value();
        log->fail_start = fail_start_;
        transfers_.push_back(log);
        listeners_.push_back(&listener);
        return std::make_unique<FakeTransferControl>(log);
    }

    std::vector<std::shared_ptr<TransferLog>> transfers_;
    std::vector<HttpTransferEventListener*> listeners_;
    bool fail_start_ = false;
};

class RecordingMessagingLog : public MessagingLog {
public:
    core::Result<void> markFileTransferAsRead(const std::string& file_transfer_id) override {
        read_.push_back(file_transfer_id);
        return {};
    }

    std::vector<std::string> read_;
};

// Records every callback as a short event string, e.g. "progress:10/100"
class RecordingListener : public FileSharingSessionListener {
public:
    using Hook = std::function<void(const std::string&)>;

    void onSessionStarted(const content::ContactId&) override {
        record("started");
    }

    void onSessionAborted(const content::ContactId&, TerminationReason reason) override {
        record("aborted:" + terminationReasonToString(reason));
    }

    void onTransferProgress(const content::ContactId&, uint64_t current_size, uint64_t total_size) override {
        record("progress:" + std::to_string(current_size) + "/" + std::to_string(total_size));
    }

    void onTransferNotAllowedToSend(const content::ContactId&) override {
        record("notAllowedToSend");
    }

    void onFileTransferPausedByUser(const content::ContactId&) override {
        record("pausedByUser");
    }

    void onFileTransferPausedBySystem(const content::ContactId&) override {
        record("pausedBySystem");
    }

    void onFileTransferResumed(const content::ContactId&) override {
        record("resumed");
    }

    void onFileTransfered(const content::MmContent& content,
                          const content::ContactId& contact,
                          int64_t file_expiration,
                          int64_t icon_expiration,
                          content::FileTransferProtocol protocol) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transfered_content_ = content;
            transfered_contact_ = contact;
            transfered_file_expiration_ = file_expiration;
            transfered_icon_expiration_ = icon_expiration;
            transfered_protocol_ = protocol;
        }
        record("transfered");
    }

    void onTransferError(const FileSharingError& error, const content::ContactId&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            error_code_ = error.getErrorCode();
            error_message_ = error.getMessage();
        }
        record("error:" + std::to_string(error.getErrorCode()));
    }

    void setHook(Hook hook) { hook_ = std::move(hook); }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::size_t count(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            if (e == event) ++n;
        }
        return n;
    }

    // Number of terminal callbacks received
    std::size_t terminalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            if (e == "transfered" || e.rfind("error:", 0) == 0 || e.rfind("aborted:", 0) == 0) ++n;
        }
        return n;
    }

    content::MmContent transfered_content_;
    content::ContactId transfered_contact_;
    int64_t transfered_file_expiration_ = -1;
    int64_t transfered_icon_expiration_ = -1;
    content::FileTransferProtocol transfered_protocol_ = content::FileTransferProtocol::MSRP;
    int error_code_ = 0;
    std::string error_message_;

private:
    void record(const std::string& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        if (hook_) {
            hook_(event);
        }
    }

    std::vector<std::string> events_;
    Hook hook_;
    mutable std::mutex mutex_;
};

class ThrowingListener : public RecordingListener {
public:
    ThrowingListener() {
        setHook([](const std::string& event) {
            throw std::runtime_error("listener failed on " + event);
        });
    }
};

} // namespace rcs::ims::test
