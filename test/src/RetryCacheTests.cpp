/**
 * @file RetryCacheTests.cpp
 *
 * This module contains the unit tests of the
 * Accord::RetryCache class.
 *
 * © 2020 by Richard Walters
 */

#include "../../src/RetryCache.hpp"

#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace {

    Accord::ClientInvocationId MakeInvocationId(
        const std::string& clientId,
        uint64_t callId
    ) {
        Accord::ClientInvocationId invocationId;
        invocationId.clientId = clientId;
        invocationId.callId = callId;
        return invocationId;
    }

    Accord::ClientReply MakeReply(
        Accord::ClientReply::Status status,
        const std::string& result = ""
    ) {
        Accord::ClientReply reply;
        reply.status = status;
        reply.result = result;
        return reply;
    }

    bool IsReady(const std::shared_future< Accord::ClientReply >& future) {
        return (
            future.wait_for(std::chrono::milliseconds(0))
            == std::future_status::ready
        );
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct RetryCacheTests
    : public ::testing::Test
{
    // Properties

    Accord::RetryCache cache;
    std::vector< std::string > diagnosticMessages;
    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;

    // ::testing::Test

    virtual void SetUp() override {
        diagnosticsUnsubscribeDelegate = cache.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                diagnosticMessages.push_back(message);
            },
            0
        );
        cache.SetLimits(10.0, 3);
    }

    virtual void TearDown() override {
        diagnosticsUnsubscribeDelegate();
    }
};

TEST_F(RetryCacheTests, First_Query_Creates_Pending_Entry) {
    // Arrange
    const auto invocationId = MakeInvocationId("alice", 1);

    // Act
    const auto first = cache.QueryOrCreate(invocationId);
    const auto second = cache.QueryOrCreate(invocationId);

    // Assert
    EXPECT_TRUE(first.isNew);
    EXPECT_FALSE(second.isNew);
    EXPECT_EQ(first.entry, second.entry);
    EXPECT_EQ(Accord::RetryCache::CacheEntry::State::Pending, cache.GetState(first.entry));
    EXPECT_EQ(1, cache.GetSize());
}

TEST_F(RetryCacheTests, Waiters_Get_Reply_When_Completed) {
    // Arrange
    const auto entry = cache.QueryOrCreate(MakeInvocationId("alice", 1)).entry;
    const auto firstWaiter = std::make_shared< Accord::CompletionHandle >();
    const auto secondWaiter = std::make_shared< Accord::CompletionHandle >();
    cache.AddWaiter(entry, firstWaiter);
    cache.AddWaiter(entry, secondWaiter);
    const auto firstFuture = firstWaiter->GetFuture();
    const auto secondFuture = secondWaiter->GetFuture();
    EXPECT_FALSE(IsReady(firstFuture));

    // Act
    cache.Complete(entry, MakeReply(Accord::ClientReply::Status::Success, "ok"), 1.0);

    // Assert
    ASSERT_TRUE(IsReady(firstFuture));
    ASSERT_TRUE(IsReady(secondFuture));
    EXPECT_EQ("ok", firstFuture.get().result);
    EXPECT_EQ("ok", secondFuture.get().result);
    EXPECT_EQ(Accord::RetryCache::CacheEntry::State::Completed, cache.GetState(entry));
}

TEST_F(RetryCacheTests, Waiter_Added_After_Completion_Gets_Cached_Reply) {
    // Arrange
    const auto entry = cache.QueryOrCreate(MakeInvocationId("alice", 1)).entry;
    cache.Complete(entry, MakeReply(Accord::ClientReply::Status::Success, "first"), 1.0);
    const auto retry = cache.QueryOrCreate(MakeInvocationId("alice", 1));
    const auto waiter = std::make_shared< Accord::CompletionHandle >();

    // Act
    cache.AddWaiter(retry.entry, waiter);

    // Assert
    EXPECT_FALSE(retry.isNew);
    const auto future = waiter->GetFuture();
    ASSERT_TRUE(IsReady(future));
    EXPECT_EQ("first", future.get().result);
}

TEST_F(RetryCacheTests, Completed_Entry_Not_Completed_Twice) {
    // Arrange
    const auto entry = cache.QueryOrCreate(MakeInvocationId("alice", 1)).entry;
    cache.Complete(entry, MakeReply(Accord::ClientReply::Status::Success, "first"), 1.0);

    // Act
    cache.Complete(entry, MakeReply(Accord::ClientReply::Status::Success, "second"), 2.0);
    cache.Fail(entry, MakeReply(Accord::ClientReply::Status::NotLeader), 3.0);

    // Assert
    EXPECT_EQ(Accord::RetryCache::CacheEntry::State::Completed, cache.GetState(entry));
    EXPECT_EQ("first", entry->reply.result);
}

TEST_F(RetryCacheTests, Failed_Entry_Replaced_By_Retry) {
    // Arrange
    const auto invocationId = MakeInvocationId("alice", 1);
    const auto original = cache.QueryOrCreate(invocationId).entry;
    const auto waiter = std::make_shared< Accord::CompletionHandle >();
    cache.AddWaiter(original, waiter);
    cache.Fail(original, MakeReply(Accord::ClientReply::Status::NotLeader), 1.0);

    // Act
    const auto retry = cache.QueryOrCreate(invocationId);

    // Assert
    const auto future = waiter->GetFuture();
    ASSERT_TRUE(IsReady(future));
    EXPECT_EQ(Accord::ClientReply::Status::NotLeader, future.get().status);
    EXPECT_TRUE(retry.isNew);
    EXPECT_NE(original, retry.entry);
    EXPECT_EQ(Accord::RetryCache::CacheEntry::State::Pending, cache.GetState(retry.entry));
}

TEST_F(RetryCacheTests, Failed_Entry_Completed_When_Applied_Anyway) {
    // Arrange
    const auto entry = cache.QueryOrCreate(MakeInvocationId("alice", 1)).entry;
    cache.Fail(entry, MakeReply(Accord::ClientReply::Status::NotLeader), 1.0);

    // Act
    cache.Complete(entry, MakeReply(Accord::ClientReply::Status::Success, "late"), 2.0);

    // Assert
    EXPECT_EQ(Accord::RetryCache::CacheEntry::State::Completed, cache.GetState(entry));
    const auto retry = cache.QueryOrCreate(MakeInvocationId("alice", 1));
    EXPECT_FALSE(retry.isNew);
}

TEST_F(RetryCacheTests, Truncated_Entry_Fails_With_Leader_Hint) {
    // Arrange
    const auto entry = cache.QueryOrCreate(MakeInvocationId("bob", 7)).entry;
    const auto waiter = std::make_shared< Accord::CompletionHandle >();
    cache.AddWaiter(entry, waiter);

    // Act
    cache.NotifyTruncatedEntry(MakeInvocationId("bob", 7), 11, 1.0);
    cache.NotifyTruncatedEntry(MakeInvocationId("nobody", 1), 11, 1.0);

    // Assert
    const auto future = waiter->GetFuture();
    ASSERT_TRUE(IsReady(future));
    EXPECT_EQ(Accord::ClientReply::Status::NotLeader, future.get().status);
    EXPECT_EQ(11, future.get().leaderId);
    EXPECT_EQ(Accord::RetryCache::CacheEntry::State::Failed, cache.GetState(entry));
    EXPECT_EQ(1, cache.GetSize());
}

TEST_F(RetryCacheTests, Truncated_Entry_Reported_With_Full_Call_Id) {
    // Arrange
    (void)cache.QueryOrCreate(MakeInvocationId("bob", 5000000000));

    // Act
    cache.NotifyTruncatedEntry(MakeInvocationId("bob", 5000000000), 11, 1.0);

    // Assert
    EXPECT_NE(
        diagnosticMessages.end(),
        std::find(
            diagnosticMessages.begin(),
            diagnosticMessages.end(),
            "Call bob:5000000000 removed from log before commit"
        )
    );
}

TEST_F(RetryCacheTests, Evict_Expired_Entries) {
    // Arrange
    const auto older = cache.QueryOrCreate(MakeInvocationId("alice", 1)).entry;
    const auto newer = cache.QueryOrCreate(MakeInvocationId("alice", 2)).entry;
    const auto pending = cache.QueryOrCreate(MakeInvocationId("alice", 3)).entry;
    cache.Complete(older, MakeReply(Accord::ClientReply::Status::Success), 1.0);
    cache.Complete(newer, MakeReply(Accord::ClientReply::Status::Success), 5.0);

    // Act
    const auto evictedEarly = cache.EvictExpired(10.0);
    const auto evictedLater = cache.EvictExpired(11.0);

    // Assert
    EXPECT_EQ(0, evictedEarly);
    EXPECT_EQ(1, evictedLater);
    EXPECT_EQ(2, cache.GetSize());
    EXPECT_TRUE(cache.GetIfPresent(MakeInvocationId("alice", 1)) == nullptr);
    EXPECT_FALSE(cache.GetIfPresent(MakeInvocationId("alice", 2)) == nullptr);
    EXPECT_FALSE(cache.GetIfPresent(MakeInvocationId("alice", 3)) == nullptr);
}

TEST_F(RetryCacheTests, Evict_Oldest_When_Over_Maximum_Size) {
    // Arrange
    for (uint64_t callId = 1; callId <= 5; ++callId) {
        const auto entry = cache.QueryOrCreate(MakeInvocationId("carol", callId)).entry;
        cache.Complete(entry, MakeReply(Accord::ClientReply::Status::Success), (double)callId);
    }

    // Act
    const auto evicted = cache.EvictExpired(5.0);

    // Assert
    EXPECT_EQ(2, evicted);
    EXPECT_EQ(3, cache.GetSize());
    EXPECT_TRUE(cache.GetIfPresent(MakeInvocationId("carol", 1)) == nullptr);
    EXPECT_TRUE(cache.GetIfPresent(MakeInvocationId("carol", 2)) == nullptr);
    EXPECT_FALSE(cache.GetIfPresent(MakeInvocationId("carol", 3)) == nullptr);
}

TEST_F(RetryCacheTests, Pending_Entries_Never_Evicted) {
    // Arrange
    for (uint64_t callId = 1; callId <= 5; ++callId) {
        (void)cache.QueryOrCreate(MakeInvocationId("dave", callId));
    }

    // Act
    const auto evicted = cache.EvictExpired(1000.0);

    // Assert
    EXPECT_EQ(0, evicted);
    EXPECT_EQ(5, cache.GetSize());
}

TEST_F(RetryCacheTests, Replaced_Failed_Entry_Not_Evicted_By_Stale_Record) {
    // Arrange
    const auto invocationId = MakeInvocationId("erin", 1);
    const auto original = cache.QueryOrCreate(invocationId).entry;
    cache.Fail(original, MakeReply(Accord::ClientReply::Status::NotLeader), 1.0);
    const auto retry = cache.QueryOrCreate(invocationId).entry;

    // Act
    const auto evicted = cache.EvictExpired(100.0);

    // Assert
    EXPECT_EQ(0, evicted);
    EXPECT_EQ(retry, cache.GetIfPresent(invocationId));
}
