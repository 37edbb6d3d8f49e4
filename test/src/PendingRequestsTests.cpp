/**
 * @file PendingRequestsTests.cpp
 *
 * This module contains the unit tests of the
 * Accord::PendingRequests class.
 *
 * © 2020 by Richard Walters
 */

#include "../../src/PendingRequests.hpp"
#include "../../src/RetryCache.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct PendingRequestsTests
    : public ::testing::Test
{
    // Properties

    Accord::RetryCache retryCache;
    Accord::PendingRequests pendingRequests{retryCache};

    // Methods

    /**
     * Register a new call from the given client as pending at the
     * given log index, and return the future reply to the call.
     */
    std::shared_future< Accord::ClientReply > AddCall(
        const std::string& clientId,
        uint64_t callId,
        size_t index
    ) {
        Accord::ClientInvocationId invocationId;
        invocationId.clientId = clientId;
        invocationId.callId = callId;
        const auto entry = retryCache.QueryOrCreate(invocationId).entry;
        const auto completion = std::make_shared< Accord::CompletionHandle >();
        retryCache.AddWaiter(entry, completion);
        pendingRequests.Add(index, entry);
        return completion->GetFuture();
    }

    bool IsReady(const std::shared_future< Accord::ClientReply >& future) {
        return (
            future.wait_for(std::chrono::milliseconds(0))
            == std::future_status::ready
        );
    }
};

TEST_F(PendingRequestsTests, Resolve_Completes_Matching_Call) {
    // Arrange
    const auto future = AddCall("alice", 1, 5);
    Accord::ClientInvocationId applied;
    applied.clientId = "alice";
    applied.callId = 1;
    Accord::ClientReply reply;
    reply.status = Accord::ClientReply::Status::Success;
    reply.result = "done";
    reply.logIndex = 5;

    // Act
    const auto resolved = pendingRequests.Resolve(5, applied, reply, 1.0);

    // Assert
    EXPECT_TRUE(resolved);
    ASSERT_TRUE(IsReady(future));
    EXPECT_EQ(Accord::ClientReply::Status::Success, future.get().status);
    EXPECT_EQ("done", future.get().result);
    EXPECT_EQ(5, future.get().logIndex);
    EXPECT_EQ(0, pendingRequests.GetSize());
}

TEST_F(PendingRequestsTests, Resolve_Unknown_Index_Does_Nothing) {
    // Arrange
    const auto future = AddCall("alice", 1, 5);
    Accord::ClientInvocationId applied;
    applied.clientId = "alice";
    applied.callId = 1;

    // Act
    const auto resolved = pendingRequests.Resolve(6, applied, Accord::ClientReply(), 1.0);

    // Assert
    EXPECT_FALSE(resolved);
    EXPECT_FALSE(IsReady(future));
    EXPECT_EQ(1, pendingRequests.GetSize());
}

TEST_F(PendingRequestsTests, Resolve_With_Different_Call_At_Index_Fails_Request) {
    // Arrange
    const auto future = AddCall("alice", 1, 5);
    Accord::ClientInvocationId applied;
    applied.clientId = "bob";
    applied.callId = 1;

    // Act
    const auto resolved = pendingRequests.Resolve(5, applied, Accord::ClientReply(), 1.0);

    // Assert
    EXPECT_TRUE(resolved);
    ASSERT_TRUE(IsReady(future));
    EXPECT_EQ(Accord::ClientReply::Status::NotLeader, future.get().status);
    EXPECT_EQ(0, pendingRequests.GetSize());
}

TEST_F(PendingRequestsTests, Fail_From_Index) {
    // Arrange
    const auto first = AddCall("alice", 1, 3);
    const auto second = AddCall("alice", 2, 4);
    const auto third = AddCall("bob", 1, 5);
    Accord::ClientReply failure;
    failure.status = Accord::ClientReply::Status::NotLeader;
    failure.leaderId = 7;

    // Act
    pendingRequests.FailFrom(4, failure, 1.0);

    // Assert
    EXPECT_FALSE(IsReady(first));
    ASSERT_TRUE(IsReady(second));
    ASSERT_TRUE(IsReady(third));
    EXPECT_EQ(Accord::ClientReply::Status::NotLeader, second.get().status);
    EXPECT_EQ(7, third.get().leaderId);
    EXPECT_EQ(1, pendingRequests.GetSize());
}

TEST_F(PendingRequestsTests, Fail_All) {
    // Arrange
    const auto first = AddCall("alice", 1, 3);
    const auto second = AddCall("bob", 1, 4);
    Accord::ClientReply failure;
    failure.status = Accord::ClientReply::Status::NotLeader;

    // Act
    pendingRequests.FailAll(failure, 1.0);

    // Assert
    ASSERT_TRUE(IsReady(first));
    ASSERT_TRUE(IsReady(second));
    EXPECT_EQ(0, pendingRequests.GetSize());
    Accord::ClientInvocationId invocationId;
    invocationId.clientId = "alice";
    invocationId.callId = 1;
    EXPECT_TRUE(retryCache.QueryOrCreate(invocationId).isNew);
}
