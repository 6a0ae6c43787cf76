/**
 * @file transfer_session_test.cpp
 * @brief Tests for the session state machine and counters.
 */

#include "smsbridge/TransferSession.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace SmsBridge;

TEST(TransferSessionTest, StartsIdleWithZeroProgress) {
    TransferSession s("sess_1", TransferMode::SENDER);
    EXPECT_EQ(s.status(), SessionStatus::IDLE);
    EXPECT_EQ(s.sessionId(), "sess_1");
    EXPECT_DOUBLE_EQ(s.progress(), 0.0);
    EXPECT_FALSE(s.isTerminal());
}

TEST(TransferSessionTest, HappyPathTransitions) {
    TransferSession s("sess_1", TransferMode::RECEIVER);
    EXPECT_TRUE(s.transitionTo(SessionStatus::PREPARING));
    EXPECT_TRUE(s.transitionTo(SessionStatus::TRANSFERRING));
    EXPECT_TRUE(s.transitionTo(SessionStatus::COMPLETED));
    EXPECT_TRUE(s.isTerminal());
}

TEST(TransferSessionTest, IllegalTransitionsLeaveStateUnchanged) {
    TransferSession s("sess_1", TransferMode::SENDER);
    EXPECT_FALSE(s.transitionTo(SessionStatus::TRANSFERRING));
    EXPECT_FALSE(s.transitionTo(SessionStatus::COMPLETED));
    EXPECT_EQ(s.status(), SessionStatus::IDLE);

    ASSERT_TRUE(s.transitionTo(SessionStatus::PREPARING));
    EXPECT_FALSE(s.transitionTo(SessionStatus::IDLE));
    EXPECT_FALSE(s.transitionTo(SessionStatus::COMPLETED));
    EXPECT_EQ(s.status(), SessionStatus::PREPARING);
}

TEST(TransferSessionTest, TerminalStatesAreFinal) {
    TransferSession done("a", TransferMode::SENDER);
    done.transitionTo(SessionStatus::PREPARING);
    done.transitionTo(SessionStatus::TRANSFERRING);
    done.transitionTo(SessionStatus::COMPLETED);
    EXPECT_FALSE(done.transitionTo(SessionStatus::ERROR));
    EXPECT_FALSE(done.fail("late"));
    EXPECT_EQ(done.status(), SessionStatus::COMPLETED);

    TransferSession failed("b", TransferMode::SENDER);
    EXPECT_TRUE(failed.fail("boom"));
    EXPECT_EQ(failed.errorMessage(), "boom");
    EXPECT_FALSE(failed.transitionTo(SessionStatus::PREPARING));
    EXPECT_FALSE(failed.addTransferred(1));
}

TEST(TransferSessionTest, ErrorReachableFromEveryLiveState) {
    for (SessionStatus from : {SessionStatus::IDLE, SessionStatus::PREPARING, SessionStatus::TRANSFERRING}) {
        EXPECT_TRUE(TransferSession::isTransitionAllowed(from, SessionStatus::ERROR));
    }
}

TEST(TransferSessionTest, ProgressIsMonotoneAndClamped) {
    TransferSession s("sess_1", TransferMode::SENDER);
    s.transitionTo(SessionStatus::PREPARING);
    ASSERT_TRUE(s.setTotalRecords(250));
    s.transitionTo(SessionStatus::TRANSFERRING);

    double last = s.progress();
    for (int i = 0; i < 25; ++i) {
        ASSERT_TRUE(s.addTransferred(10));
        EXPECT_GE(s.progress(), last);
        EXPECT_LE(s.progress(), 1.0);
        last = s.progress();
    }
    EXPECT_DOUBLE_EQ(s.progress(), 1.0);
    EXPECT_EQ(s.transferredRecords(), 250u);
}

TEST(TransferSessionTest, CountersNeverExceedTotal) {
    TransferSession s("sess_1", TransferMode::RECEIVER);
    ASSERT_TRUE(s.setTotalRecords(100));
    EXPECT_TRUE(s.addTransferred(60));
    EXPECT_FALSE(s.addTransferred(41));
    EXPECT_EQ(s.transferredRecords(), 60u);
    EXPECT_FALSE(s.setTotalRecords(50));
    EXPECT_EQ(s.totalRecords(), 100u);
}

TEST(TransferSessionTest, PeerAndJsonSnapshot) {
    TransferSession s("sess_1", TransferMode::RECEIVER);
    s.setPeer(SmsBridge::Test::makeIdentity("dev-a", "192.168.1.20", 8080));
    EXPECT_EQ(s.peerIp(), "192.168.1.20");
    EXPECT_EQ(s.peerPort(), 8080);

    const auto j = s.toJson();
    EXPECT_EQ(j["status"], "idle");
    EXPECT_EQ(j["mode"], "receiver");
    EXPECT_EQ(j["peer_device_name"], "Device dev-a");
    EXPECT_FALSE(j.contains("error_message"));
}
