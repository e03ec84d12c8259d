#include <rcs/core/config.hpp>
#include <rcs/core/event_loop.hpp>
#include <rcs/core/logger.hpp>
#include <rcs/ft/file_transfer_service.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace rcs;

// Signaling plane that only logs what would go on the wire
class ConsoleSipInterface : public sip::SipInterface {
public:
    core::Result<void> sendRequest(const sip::SipMessage& request) override {
        core::Logger::info("SIP request out:\n{}", request.toString());
        return {};
    }

    core::Result<void> sendResponse(const sip::SipMessage& response) override {
        core::Logger::info("SIP response out:\n{}", response.toString());
        return {};
    }
};

class ConsoleCapabilityService : public ims::CapabilityService {
public:
    core::Result<void> requestContactCapabilities(const content::ContactId& contact) override {
        core::Logger::info("Refreshing capabilities of {}", contact);
        return {};
    }
};

class ConsoleMessagingLog : public ims::MessagingLog {
public:
    core::Result<void> markFileTransferAsRead(const std::string& file_transfer_id) override {
        core::Logger::info("Transfer {} marked as read", file_transfer_id);
        return {};
    }
};

// Transfer that pretends to upload in chunks on its own thread
class SimulatedTransfer : public ims::TransferControl {
public:
    SimulatedTransfer(uint64_t size, ims::HttpTransferEventListener& listener)
        : size_(size), listener_(listener) {}

    ~SimulatedTransfer() override {
        cancelled_ = true;
        if (!worker_.joinable()) {
            return;
        }
        // The last session reference may be released by the worker itself
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }

    core::Result<void> start() override {
        if (worker_.joinable()) {
            return {core::ErrorCode::InvalidState, "Transfer already started"};
        }
        worker_ = std::thread(&SimulatedTransfer::run, this);
        return {};
    }

    core::Result<void> pause() override {
        paused_ = true;
        listener_.onHttpTransferPausedByUser();
        return {};
    }

    core::Result<void> resume() override {
        paused_ = false;
        listener_.onHttpTransferResumed();
        return {};
    }

    core::Result<void> cancel() override {
        cancelled_ = true;
        return {};
    }

private:
    void run() {
        listener_.onHttpTransferStarted();

        const uint64_t chunk = size_ / 4 + 1;
        uint64_t sent = 0;
        while (sent < size_ && !cancelled_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (paused_) {
                continue;
            }
            sent = std::min(size_, sent + chunk);
            listener_.onHttpTransferProgress(sent, size_);
        }

        if (!cancelled_) {
            listener_.onHttpTransferred();
        }
    }

    uint64_t size_;
    ims::HttpTransferEventListener& listener_;
    std::thread worker_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> cancelled_{false};
};

class SimulatedTransferEngine : public ims::HttpTransferEngine {
public:
    std::unique_ptr<ims::TransferControl> createUpload(const content::MmContent& content,
                                                       const std::optional<content::MmContent>&,
                                                       ims::HttpTransferEventListener& listener) override {
        return std::make_unique<SimulatedTransfer>(content.getSize(), listener);
    }

    std::unique_ptr<ims::TransferControl> createDownload(const content::MmContent& content,
                                                         const std::optional<content::MmContent>&,
                                                         ims::HttpTransferEventListener& listener) override {
        return std::make_unique<SimulatedTransfer>(content.getSize(), listener);
    }
};

// Prints transfer events and wakes main once the transfer is over
class ConsoleListener : public ims::FileSharingSessionListener {
public:
    void onSessionStarted(const content::ContactId& contact) override {
        std::cout << "Transfer to " << contact << " started" << std::endl;
    }

    void onSessionAborted(const content::ContactId& contact, ims::TerminationReason reason) override {
        std::cout << "Transfer to " << contact << " aborted: " << ims::terminationReasonToString(reason) << std::endl;
        finish();
    }

    void onTransferProgress(const content::ContactId&, uint64_t current_size, uint64_t total_size) override {
        std::cout << "Progress " << current_size << "/" << total_size << std::endl;
    }

    void onTransferNotAllowedToSend(const content::ContactId&) override {
        std::cout << "Not allowed to send" << std::endl;
    }

    void onFileTransferPausedByUser(const content::ContactId&) override {
        std::cout << "Paused" << std::endl;
    }

    void onFileTransferPausedBySystem(const content::ContactId&) override {
        std::cout << "Paused by system" << std::endl;
    }

    void onFileTransferResumed(const content::ContactId&) override {
        std::cout << "Resumed" << std::endl;
    }

    void onFileTransfered(const content::MmContent& content, const content::ContactId& contact,
                          int64_t, int64_t, content::FileTransferProtocol protocol) override {
        std::cout << content.getName() << " delivered to " << contact
                  << " over " << content::protocolToString(protocol) << std::endl;
        finish();
    }

    void onTransferError(const ims::FileSharingError& error, const content::ContactId&) override {
        std::cout << "Transfer failed: " << error.getErrorCode() << " " << error.getMessage() << std::endl;
        finish();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

private:
    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
};

int main(int argc, char* argv[]) {
    if (argc > 1) {
        auto loaded = core::config().loadFromFile(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Cannot load " << argv[1] << ": " << loaded.error().what() << std::endl;
            return 1;
        }
    }

    auto level = ft::FileTransferSettings::loadLogLevel(core::config());
    auto settings = ft::FileTransferSettings::load(core::config());
    if (level.is_error() || settings.is_error()) {
        std::cerr << "Invalid configuration" << std::endl;
        return 1;
    }
    core::Logger::setLevel(level.value());

    ConsoleSipInterface sip_interface;
    ConsoleCapabilityService capabilities;
    ConsoleMessagingLog messaging_log;
    SimulatedTransferEngine engine;
    core::EventLoop loop;
    loop.start();

    ims::InstantMessagingService im_service(sip_interface, capabilities, engine, loop);
    ft::FileTransferService service(im_service, messaging_log, settings.value());

    auto listener = std::make_shared<ConsoleListener>();
    service.addListener(listener);

    auto contact = content::ContactId::create("+33 6 12 34 56 78");
    if (contact.is_error()) {
        std::cerr << contact.error().what() << std::endl;
        return 1;
    }

    content::MmContent photo("file:///tmp/holiday.jpg", "image/jpeg", 200000, "holiday.jpg");
    auto transfer = service.transferFile(contact.value(), photo);
    if (transfer.is_error()) {
        std::cerr << "Transfer refused: " << transfer.error().what() << std::endl;
        return 1;
    }

    listener->wait();

    auto read = service.markFileTransferAsRead(transfer.value()->getFileTransferId());
    if (read.is_error()) {
        std::cerr << read.error().what() << std::endl;
    }

    loop.stop();
    return 0;
}
