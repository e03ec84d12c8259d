#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <rcs/content/mm_content.hpp>
#include <rcs/ims/ims_service_session.hpp>
#include <rcs/ims/listener_set.hpp>
#include <rcs/ims/session_listener.hpp>

namespace rcs::ims {

// Session sharing one file, optionally with an icon (thumbnail)
class FileSharingSession : public ImsServiceSession {
public:
    using ListenerPtr = std::shared_ptr<FileSharingSessionListener>;

    FileSharingSession(InstantMessagingService& im_service,
                       content::MmContent content,
                       content::ContactId contact,
                       std::string remote_uri,
                       std::optional<content::MmContent> file_icon,
                       std::string file_transfer_id,
                       int64_t timestamp);

    const content::MmContent& getContent() const { return content_; }
    const std::optional<content::MmContent>& getFileicon() const { return file_icon_; }
    const std::string& getFileTransferId() const { return getSessionID(); }

    const std::string& getContributionID() const { return contribution_id_; }

    // True once the content has been delivered (to the content server for
    // HTTP transfers)
    bool isFileTransfered() const { return file_transfered_; }

    bool addListener(ListenerPtr listener) { return listeners_.add(std::move(listener)); }
    bool removeListener(const ListenerPtr& listener) { return listeners_.remove(listener); }
    std::size_t getListenerCount() const { return listeners_.size(); }

protected:
    void setContributionID(std::string contribution_id) { contribution_id_ = std::move(contribution_id); }
    void fileTransfered() { file_transfered_ = true; }

    template<typename F>
    void notifyListeners(const std::string& event, F&& fn) const {
        listeners_.forEach(event, std::forward<F>(fn));
    }

private:
    content::MmContent content_;
    std::optional<content::MmContent> file_icon_;
    std::string contribution_id_;
    std::atomic<bool> file_transfered_{false};

    ListenerSet<FileSharingSessionListener> listeners_;
};

} // namespace rcs::ims
