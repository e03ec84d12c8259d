#include <gtest/gtest.h>
#include <rcs/core/event_loop.hpp>
#include <rcs/ims/instant_messaging_service.hpp>
#include <rcs/ims/originating_http_file_sharing_session.hpp>
#include <rcs/ims/terminating_http_file_sharing_session.hpp>

#include "ims_test_fakes.hpp"

#include <chrono>

namespace rcs::ims::test {

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

class TransferDirectionTest : public ::testing::Test {
protected:
    TransferDirectionTest()
        : service_(sip_, capabilities_, engine_, loop_) {}

    std::shared_ptr<OriginatingHttpFileSharingSession> createUpload() {
        auto session = std::make_shared<OriginatingHttpFileSharingSession>(
            service_, makeContent(), makeContact(), "tel:+33612345678",
            makeContent("thumb.jpg", "image/jpeg", 128), "", "upload-1", nowMillis());
        session->addListener(listener_);
        EXPECT_TRUE(service_.addSession(session).is_ok());
        return session;
    }

    std::shared_ptr<TerminatingHttpFileSharingSession> createDownload(int64_t file_expiration) {
        auto session = std::make_shared<TerminatingHttpFileSharingSession>(
            service_, makeContent("song.mp3", "audio/mpeg", 500000), makeContact(), "tel:+33612345678",
            std::nullopt, "chat-7", "download-1", nowMillis(), file_expiration, 0);
        session->addListener(listener_);
        EXPECT_TRUE(service_.addSession(session).is_ok());
        return session;
    }

    RecordingSipInterface sip_;
    RecordingCapabilityService capabilities_;
    FakeTransferEngine engine_;
    core::EventLoop loop_;
    InstantMessagingService service_;
    std::shared_ptr<RecordingListener> listener_ = std::make_shared<RecordingListener>();
};

TEST_F(TransferDirectionTest, OriginatingCreatesUpload) {
    auto session = createUpload();

    ASSERT_EQ(engine_.transferCount(), 1u);
    EXPECT_TRUE(engine_.lastTransfer().upload);
    EXPECT_TRUE(engine_.lastTransfer().has_icon);
    EXPECT_EQ(&engine_.lastListener(), static_cast<HttpTransferEventListener*>(session.get()));
    EXPECT_EQ(session->getFileExpiration(), 0);
}

TEST_F(TransferDirectionTest, OriginatingStartsOnce) {
    auto session = createUpload();

    EXPECT_TRUE(session->startSession().is_ok());
    auto again = session->startSession();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code(), core::ErrorCode::InvalidState);
    EXPECT_EQ(engine_.lastTransfer().starts, 1);
}

TEST_F(TransferDirectionTest, OriginatingStartFailureCanBeRetried) {
    auto session = createUpload();
    engine_.lastTransfer().fail_start = true;

    EXPECT_TRUE(session->startSession().is_error());
    engine_.lastTransfer().fail_start = false;
    EXPECT_TRUE(session->startSession().is_ok());
    EXPECT_EQ(engine_.lastTransfer().starts, 2);
}

TEST_F(TransferDirectionTest, OriginatingPauseResumeDriveUpload) {
    auto session = createUpload();
    ASSERT_TRUE(session->startSession().is_ok());
    session->onHttpTransferStarted();

    EXPECT_TRUE(session->pauseTransfer().is_ok());
    EXPECT_TRUE(session->resumeTransfer().is_ok());
    EXPECT_EQ(engine_.lastTransfer().pauses, 1);
    EXPECT_EQ(engine_.lastTransfer().resumes, 1);
}

TEST_F(TransferDirectionTest, OriginatingCannotStartAfterAbort) {
    auto session = createUpload();
    ASSERT_TRUE(session->abortSession(TerminationReason::TERMINATION_BY_USER).is_ok());

    EXPECT_TRUE(session->startSession().is_error());
    EXPECT_EQ(engine_.lastTransfer().starts, 0);
    EXPECT_EQ(engine_.lastTransfer().cancels, 1);
}

TEST_F(TransferDirectionTest, TerminatingAcceptStartsDownload) {
    auto session = createDownload(nowMillis() + 3600 * 1000);

    ASSERT_EQ(engine_.transferCount(), 1u);
    EXPECT_FALSE(engine_.lastTransfer().upload);
    EXPECT_FALSE(session->isFileExpired());

    EXPECT_TRUE(session->acceptSession().is_ok());
    EXPECT_TRUE(session->isAccepted());
    EXPECT_EQ(engine_.lastTransfer().starts, 1);
    EXPECT_TRUE(session->acceptSession().is_error());
    EXPECT_EQ(session->getContributionID(), "chat-7");
}

TEST_F(TransferDirectionTest, TerminatingWithoutExpirationNeverExpires) {
    auto session = createDownload(0);
    EXPECT_FALSE(session->isFileExpired());
    EXPECT_TRUE(session->acceptSession().is_ok());
}

TEST_F(TransferDirectionTest, TerminatingAcceptOfExpiredFileFails) {
    auto session = createDownload(nowMillis() - 1000);

    auto result = session->acceptSession();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ContentExpired);

    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"error:125"}));
    EXPECT_EQ(listener_->error_code_, FileSharingError::MEDIA_DOWNLOAD_FAILED);
    EXPECT_EQ(engine_.lastTransfer().starts, 0);
    EXPECT_EQ(service_.getSessionCount(), 0u);
}

TEST_F(TransferDirectionTest, TerminatingRejectAbortsByUser) {
    auto session = createDownload(0);

    EXPECT_TRUE(session->rejectSession().is_ok());

    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"aborted:TERMINATION_BY_USER"}));
    EXPECT_EQ(engine_.lastTransfer().cancels, 1);
    EXPECT_EQ(service_.getSessionCount(), 0u);
    EXPECT_TRUE(session->acceptSession().is_error());
}

TEST_F(TransferDirectionTest, TerminatingResumeOfExpiredFileFails) {
    int64_t now = 1700000000000;
    auto session = createDownload(now + 200);
    session->setClock([&now]() { return now; });
    ASSERT_TRUE(session->acceptSession().is_ok());
    session->onHttpTransferStarted();
    ASSERT_TRUE(session->pauseTransfer().is_ok());

    now += 300;

    auto result = session->resumeTransfer();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ContentExpired);
    EXPECT_EQ(engine_.lastTransfer().resumes, 0);
    EXPECT_EQ(listener_->count("error:125"), 1u);
    EXPECT_TRUE(session->isSessionRemoved());
}

TEST_F(TransferDirectionTest, TerminatingDownloadCompletes) {
    auto session = createDownload(nowMillis() + 60000);
    ASSERT_TRUE(session->acceptSession().is_ok());

    session->onHttpTransferStarted();
    session->onHttpTransferProgress(250000, 500000);
    session->onHttpTransferred();

    std::vector<std::string> expected{"started", "progress:250000/500000", "transfered"};
    EXPECT_EQ(listener_->events(), expected);
    EXPECT_EQ(listener_->transfered_content_.getName(), "song.mp3");
    EXPECT_TRUE(session->isFileTransfered());
}

} // namespace rcs::ims::test
