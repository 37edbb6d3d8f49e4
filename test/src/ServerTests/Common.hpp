#pragma once

/**
 * @file Common.hpp
 *
 * This module declares the base fixture used to test the Accord::Server
 * class.  The fixture is subclassed to test various aspects of the class,
 * including:
 * - Elections: the process of selecting a cluster leader
 * - Replication: getting each server in the cluster to have the same log
 * - Reconfiguration: adding or removing servers in the cluster
 * - ClientRequests: commands, reads, and watches submitted by clients
 *
 * © 2019-2020 by Richard Walters
 */

#include "../../../src/Message.hpp"
#include "../../../src/ServerIntrospection.hpp"

#include <Accord/ILog.hpp>
#include <Accord/IPersistentState.hpp>
#include <Accord/IStateMachine.hpp>
#include <Accord/LogEntry.hpp>
#include <Accord/RaftConfiguration.hpp>
#include <Accord/Server.hpp>
#include <condition_variable>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <Json/Value.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <Timekeeping/Scheduler.hpp>
#include <utility>
#include <vector>

namespace ServerTests {

    /**
     * This is a fake time-keeper which is used to test the server.
     */
    struct MockTimeKeeper
        : public Timekeeping::Clock
    {
        // Properties

        std::mutex mutex;
        double currentTime = 0.0;
        std::vector< std::function< void() > > destructionDelegates;

        // Lifecycle

        ~MockTimeKeeper();
        MockTimeKeeper(const MockTimeKeeper&) = delete;
        MockTimeKeeper(MockTimeKeeper&&) = delete;
        MockTimeKeeper& operator=(const MockTimeKeeper&) = delete;
        MockTimeKeeper& operator=(MockTimeKeeper&&) = delete;

        // Methods

        MockTimeKeeper() = default;

        void RegisterDestructionDelegate(std::function< void() > destructionDelegate);

        void SetTime(double newTime);

        // Timekeeping::Clock

        virtual double GetCurrentTime() override;
    };

    /**
     * This is a fake log keeper which is used to test the server.
     */
    struct MockLog
        : public Accord::ILog
    {
        // Properties

        std::vector< Accord::LogEntry > entries;
        bool invalidEntryIndexed = false;
        size_t baseIndex = 0;
        uint64_t baseTerm = 0;
        size_t commitIndex = 0;
        size_t commitCount = 0;
        size_t flushCount = 0;
        Json::Value snapshot;
        std::vector< std::function< void() > > destructionDelegates;

        // Lifecycle

        ~MockLog();
        MockLog(const MockLog&) = delete;
        MockLog(MockLog&&) = delete;
        MockLog& operator=(const MockLog&) = delete;
        MockLog& operator=(MockLog&&) = delete;

        // Methods

        MockLog() = default;

        void RegisterDestructionDelegate(std::function< void() > destructionDelegate);

        /**
         * Add an entry with the given term and command to the end of
         * the log, as if it had been there before the server started.
         */
        void AppendEntry(
            uint64_t term,
            std::shared_ptr< Accord::Command > command = nullptr
        );

        // Accord::ILog

        virtual size_t GetBaseIndex() override;
        virtual const Json::Value& GetSnapshot() override;
        virtual void InstallSnapshot(
            const Json::Value& snapshot,
            size_t lastIncludedIndex,
            uint64_t lastIncludedTerm
        ) override;
        virtual size_t GetLastIndex() override;
        virtual uint64_t GetTerm(size_t index) override;
        virtual const Accord::LogEntry& operator[](size_t index) override;
        virtual void Truncate(size_t fromIndex) override;
        virtual void Append(const std::vector< Accord::LogEntry >& newEntries) override;
        virtual void Commit(size_t index) override;
        virtual void Flush() override;
    };

    /**
     * This is a fake persistent state keeper which is used to test the server.
     */
    struct MockPersistentState
        : public Accord::IPersistentState
    {
        // Properties

        Accord::IPersistentState::Variables variables;
        std::vector< std::function< void() > > destructionDelegates;
        size_t saveCount = 0;

        // Lifecycle

        ~MockPersistentState();
        MockPersistentState(const MockPersistentState&) = delete;
        MockPersistentState(MockPersistentState&&) = delete;
        MockPersistentState& operator=(const MockPersistentState&) = delete;
        MockPersistentState& operator=(MockPersistentState&&) = delete;

        // Methods

        MockPersistentState() = default;

        void RegisterDestructionDelegate(std::function< void() > destructionDelegate);

        // Accord::IPersistentState

        virtual Variables Load() override;
        virtual void Save(const Variables& newVariables) override;
    };

    /**
     * This is a fake state machine which is used to test the server.
     * Commands have the form "key=value" and queries name a key.
     */
    struct MockStateMachine
        : public Accord::IStateMachine
    {
        // Properties

        std::mutex mutex;
        std::map< std::string, std::string > values;
        std::vector< size_t > appliedIndices;
        bool failApply = false;
        size_t snapshotsInstalled = 0;
        size_t lastSnapshotIndexInstalled = 0;

        // Methods

        std::map< std::string, std::string > GetValues();

        std::vector< size_t > GetAppliedIndices();

        // Accord::IStateMachine

        virtual bool Apply(
            const Accord::LogEntry& entry,
            Result& result
        ) override;
        virtual bool Query(
            const std::string& query,
            Result& result
        ) override;
        virtual Json::Value TakeSnapshot() override;
        virtual void InstallSnapshot(
            const Json::Value& snapshot,
            size_t lastIncludedIndex
        ) override;
    };

    /**
     * This holds information about a message received from the unit under
     * test.
     */
    struct MessageInfo {
        int receiverInstanceNumber;
        Accord::Message message;
    };

    /**
     * This is the base class for the concrete ServerTests test fixtures,
     * providing common setup and teardown for each test.
     */
    struct Common
        : public ::testing::Test
    {
        // Properties

        Accord::ClusterConfiguration clusterConfiguration;
        std::vector< Accord::RaftConfiguration > configurationsApplied;
        std::vector< Accord::RaftConfiguration > configurationsCommitted;
        std::mutex diagnosticsMutex;
        std::vector< std::string > diagnosticMessages;
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;
        std::vector< Json::Value > electionStateChanges;
        std::condition_variable eventsReceived;
        Accord::IServer::EventsUnsubscribeDelegate eventsUnsubscribeDelegate;
        std::vector< std::string > haltReasons;
        size_t lastIncludedIndexInSnapshot = 0;
        uint64_t lastIncludedTermInSnapshot = 0;
        std::vector< std::pair< int, uint64_t > > leadershipChanges;
        std::vector< MessageInfo > messagesSent;
        std::shared_ptr< MockLog > mockLog = std::make_shared< MockLog >();
        std::shared_ptr< MockPersistentState > mockPersistentState = std::make_shared< MockPersistentState >();
        std::shared_ptr< MockStateMachine > mockStateMachine = std::make_shared< MockStateMachine >();
        std::shared_ptr< MockTimeKeeper > mockTimeKeeper = std::make_shared< MockTimeKeeper >();
        std::mutex mutex;
        std::vector< std::pair< int, bool > > reachabilityChanges;
        std::shared_ptr< Timekeeping::Scheduler > scheduler = std::make_shared< Timekeeping::Scheduler >();
        Accord::Server server;
        Accord::ServerIntrospection introspection{server};
        Accord::IServer::ServerConfiguration serverConfiguration;
        Json::Value snapshotInstalled;

        // Methods

        /**
         * Wait up to a second for the given condition to hold.  The
         * condition is checked with the fixture's mutex held.
         */
        bool Await(std::function< bool() > condition);

        /**
         * Return a copy of the given property, which is one updated by
         * the server's events and so is protected by the fixture's mutex.
         */
        template< typename T > T Sample(const T& property) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            return property;
        }

        template< typename T > bool IsReady(const std::shared_future< T >& future) {
            return (
                future.wait_for(
                    std::chrono::milliseconds(0)
                ) == std::future_status::ready
            );
        }

        template< typename T > bool AwaitFuture(const std::shared_future< T >& future) {
            return (
                future.wait_for(
                    std::chrono::seconds(1)
                ) == std::future_status::ready
            );
        }

        bool AwaitMessagesSent(size_t numMessages);
        bool AwaitElectionStateChanges(size_t numElectionStateChanges);
        std::vector< MessageInfo > TakeMessagesSent();
        void ClearMessagesSent();
        size_t CountMessagesSent(Accord::Message::Type type);
        bool MobilizeServer();
        void AdvanceTime(double delta);
        void AdvanceTimeToJustBeforeElectionTimeout();
        void CastVote(
            int instance,
            uint64_t term,
            bool granted = true
        );
        void CastVotes(
            uint64_t term,
            bool granted = true
        );
        void RequestVote(
            int instance,
            uint64_t term,
            size_t lastLogIndex,
            uint64_t lastLogTerm
        );
        void ReceiveAppendEntriesFromMockLeader(
            int leaderId,
            uint64_t term,
            size_t leaderCommit,
            size_t prevLogIndex,
            uint64_t prevLogTerm,
            const std::vector< Accord::LogEntry >& entries
        );
        void ReceiveHeartBeatFromMockLeader(
            int leaderId,
            uint64_t term,
            size_t leaderCommit = 0
        );
        void ReceiveAppendEntriesResults(
            int instance,
            uint64_t term,
            size_t matchIndex,
            bool success = true,
            int seq = 0,
            size_t followerCommit = 0
        );
        void ReceiveInstallSnapshotFromMockLeader(
            int leaderId,
            uint64_t term,
            const Json::Value& snapshot,
            size_t lastIncludedIndex,
            uint64_t lastIncludedTerm
        );
        void AcknowledgeLastEntry(
            uint64_t term,
            int exceptInstance = 0
        );
        bool AwaitElectionTimeout(size_t messagesExpected = 4);
        void BecomeLeader(
            uint64_t term = 1,
            bool acknowledgeInitialHeartbeats = true
        );
        void BecomeCandidate(uint64_t term = 1);
        void SetServerDelegates();
        void SetUpSnapshot(
            size_t baseIndex,
            uint64_t baseTerm,
            const Json::Value& state = Json::Array({})
        );
        static Accord::LogEntry MakeClientEntry(
            uint64_t term,
            const std::string& clientId,
            uint64_t callId,
            const std::string& content
        );

        // ::testing::Test

        virtual void SetUp() override;
        virtual void TearDown() override;
    };
}
