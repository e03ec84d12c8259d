#include <gtest/gtest.h>
#include <rcs/core/event_loop.hpp>
#include <rcs/ims/instant_messaging_service.hpp>
#include <rcs/ims/listener_set.hpp>
#include <rcs/ims/originating_http_file_sharing_session.hpp>

#include "ims_test_fakes.hpp"

#include <string>
#include <vector>

namespace rcs::ims::test {

class InstantMessagingServiceTest : public ::testing::Test {
protected:
    InstantMessagingServiceTest()
        : service_(sip_, capabilities_, engine_, loop_) {}

    std::shared_ptr<OriginatingHttpFileSharingSession> makeSession(const std::string& id) {
        return std::make_shared<OriginatingHttpFileSharingSession>(
            service_, makeContent(), makeContact(), "tel:+33612345678", std::nullopt, "", id, 0);
    }

    RecordingSipInterface sip_;
    RecordingCapabilityService capabilities_;
    FakeTransferEngine engine_;
    core::EventLoop loop_;
    InstantMessagingService service_;
};

TEST_F(InstantMessagingServiceTest, AddAndFindSessions) {
    auto first = makeSession("a");
    auto second = makeSession("b");
    second->setDialogPath(sip::DialogPath("call-b", "sip:me@x", "sip:you@x", "l", "r"));

    ASSERT_TRUE(service_.addSession(first).is_ok());
    ASSERT_TRUE(service_.addSession(second).is_ok());

    EXPECT_EQ(service_.getSessionCount(), 2u);
    EXPECT_EQ(service_.getSession("a"), first);
    EXPECT_EQ(service_.getSession("missing"), nullptr);
    EXPECT_EQ(service_.findSessionByCallId("call-b"), second);
    EXPECT_EQ(service_.findSessionByCallId(""), nullptr);
    EXPECT_EQ(service_.getSessionAs<OriginatingHttpFileSharingSession>("a"), first);
    EXPECT_EQ(service_.getSessions().size(), 2u);
}

TEST_F(InstantMessagingServiceTest, RejectsNullAndDuplicates) {
    auto null_result = service_.addSession(nullptr);
    ASSERT_TRUE(null_result.is_error());
    EXPECT_EQ(null_result.error().code(), core::ErrorCode::InvalidArgument);

    ASSERT_TRUE(service_.addSession(makeSession("dup")).is_ok());
    auto duplicate = service_.addSession(makeSession("dup"));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code(), core::ErrorCode::InvalidArgument);
    EXPECT_EQ(service_.getSessionCount(), 1u);
}

TEST_F(InstantMessagingServiceTest, RemovalCallback) {
    std::vector<std::string> removed;
    service_.setSessionRemovedCallback([&removed](const std::string& id) { removed.push_back(id); });

    auto session = makeSession("x");
    ASSERT_TRUE(service_.addSession(session).is_ok());

    service_.removeSession("unknown");
    EXPECT_TRUE(removed.empty());

    ASSERT_TRUE(session->closeHttpSession(TerminationReason::TERMINATION_BY_SYSTEM).is_ok());
    ASSERT_TRUE(session->closeHttpSession(TerminationReason::TERMINATION_BY_SYSTEM).is_ok());
    EXPECT_EQ(removed, (std::vector<std::string>{"x"}));
}

TEST_F(InstantMessagingServiceTest, ReceiveByeRejectsOtherMessages) {
    sip::SipMessage invite(sip::SipMethod::INVITE, "sip:me@x");
    EXPECT_EQ(service_.receiveBye(invite).error().code(), core::ErrorCode::InvalidArgument);

    sip::SipMessage response(sip::SipResponseCode::OK);
    EXPECT_EQ(service_.receiveBye(response).error().code(), core::ErrorCode::InvalidArgument);
    EXPECT_TRUE(sip_.responses().empty());
}

TEST_F(InstantMessagingServiceTest, UnknownDialogGets481) {
    sip::SipMessage bye(sip::SipMethod::BYE, "sip:me@x");
    bye.getHeaders().setCallId("nobody");
    bye.getHeaders().setFrom("<sip:you@x>;tag=r");
    bye.getHeaders().setTo("<sip:me@x>;tag=l");
    bye.getHeaders().setCSeq(4, "BYE");

    auto result = service_.receiveBye(bye);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::SessionNotFound);

    auto responses = sip_.responses();
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].getResponseCode(), sip::SipResponseCode::CallTransactionDoesNotExist);
    EXPECT_EQ(responses[0].getCallId(), "nobody");
    EXPECT_EQ(responses[0].getHeaders().getCSeq(), "4 BYE");
}

TEST(ListenerSetTest, AddRemoveAndOrder) {
    ListenerSet<RecordingListener> listeners;
    auto first = std::make_shared<RecordingListener>();
    auto second = std::make_shared<RecordingListener>();

    EXPECT_TRUE(listeners.add(first));
    EXPECT_TRUE(listeners.add(second));
    EXPECT_FALSE(listeners.add(first));
    EXPECT_FALSE(listeners.add(nullptr));
    EXPECT_EQ(listeners.size(), 2u);

    std::vector<RecordingListener*> visited;
    listeners.forEach("visit", [&visited](RecordingListener& listener) { visited.push_back(&listener); });
    EXPECT_EQ(visited, (std::vector<RecordingListener*>{first.get(), second.get()}));

    EXPECT_TRUE(listeners.remove(first));
    EXPECT_FALSE(listeners.remove(first));
    EXPECT_EQ(listeners.snapshot().size(), 1u);

    listeners.clear();
    EXPECT_EQ(listeners.size(), 0u);
}

TEST(ListenerSetTest, ThrowingCallbackIsIsolated) {
    ListenerSet<RecordingListener> listeners;
    listeners.add(std::make_shared<RecordingListener>());
    listeners.add(std::make_shared<RecordingListener>());

    int calls = 0;
    EXPECT_NO_THROW(listeners.forEach("boom", [&calls](RecordingListener&) {
        ++calls;
        throw std::runtime_error("boom");
    }));
    EXPECT_EQ(calls, 2);
}

TEST(ServiceErrorTest, FileSharingErrorWrapsServiceError) {
    ImsServiceError error(ImsServiceError::SESSION_INITIATION_DECLINED, "declined");
    FileSharingError wrapped(error);
    EXPECT_EQ(wrapped.getErrorCode(), ImsServiceError::SESSION_INITIATION_DECLINED);
    EXPECT_EQ(wrapped.getMessage(), "declined");
    EXPECT_EQ(terminationReasonToString(TerminationReason::TERMINATION_BY_REMOTE), "TERMINATION_BY_REMOTE");
}

} // namespace rcs::ims::test
