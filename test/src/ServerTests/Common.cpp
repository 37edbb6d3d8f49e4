/**
 * @file Common.cpp
 *
 * This module provides the implementation of the base fixture used to test the
 * Accord::Server class.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Common.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <Accord/ILog.hpp>
#include <Accord/IPersistentState.hpp>
#include <Accord/LogEntry.hpp>
#include <Accord/Server.hpp>
#include <map>
#include <set>
#include <stddef.h>
#include <string>
#include <StringExtensions/StringExtensions.hpp>
#include <vector>

namespace ServerTests {

    MockTimeKeeper::~MockTimeKeeper() {
        for (const auto& destructionDelegate: destructionDelegates) {
            destructionDelegate();
        }
    }

    void MockTimeKeeper::RegisterDestructionDelegate(std::function< void() > destructionDelegate) {
        destructionDelegates.push_back(destructionDelegate);
    }

    void MockTimeKeeper::SetTime(double newTime) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        currentTime = newTime;
    }

    double MockTimeKeeper::GetCurrentTime() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return currentTime;
    }

    MockLog::~MockLog() {
        for (const auto& destructionDelegate: destructionDelegates) {
            destructionDelegate();
        }
    }

    void MockLog::RegisterDestructionDelegate(std::function< void() > destructionDelegate) {
        destructionDelegates.push_back(destructionDelegate);
    }

    void MockLog::AppendEntry(
        uint64_t term,
        std::shared_ptr< Accord::Command > command
    ) {
        Accord::LogEntry entry;
        entry.term = term;
        entry.index = GetLastIndex() + 1;
        entry.command = std::move(command);
        entries.push_back(std::move(entry));
    }

    size_t MockLog::GetBaseIndex() {
        return baseIndex;
    }

    const Json::Value& MockLog::GetSnapshot() {
        return snapshot;
    }

    void MockLog::InstallSnapshot(
        const Json::Value& newSnapshot,
        size_t lastIncludedIndex,
        uint64_t lastIncludedTerm
    ) {
        snapshot = newSnapshot;
        if (
            (lastIncludedIndex <= GetLastIndex())
            && (GetTerm(lastIncludedIndex) == lastIncludedTerm)
        ) {
            entries.erase(
                entries.begin(),
                entries.begin() + (lastIncludedIndex - baseIndex)
            );
        } else {
            entries.clear();
        }
        baseIndex = lastIncludedIndex;
        baseTerm = lastIncludedTerm;
        commitIndex = std::max(commitIndex, lastIncludedIndex);
    }

    size_t MockLog::GetLastIndex() {
        return baseIndex + entries.size();
    }

    uint64_t MockLog::GetTerm(size_t index) {
        if (
            (index == 0)
            || (index < baseIndex)
            || (index > baseIndex + entries.size())
        ) {
            return 0;
        }
        return (
            (index == baseIndex)
            ? baseTerm
            : entries[index - baseIndex - 1].term
        );
    }

    const Accord::LogEntry& MockLog::operator[](size_t index) {
        if (
            (index <= baseIndex)
            || (index > baseIndex + entries.size())
        ) {
            invalidEntryIndexed = true;
            static Accord::LogEntry outOfRangeReturnValue;
            return outOfRangeReturnValue;
        }
        return entries[index - baseIndex - 1];
    }

    void MockLog::Truncate(size_t fromIndex) {
        if (fromIndex <= baseIndex) {
            entries.clear();
        } else if (fromIndex <= GetLastIndex()) {
            entries.resize(fromIndex - baseIndex - 1);
        }
    }

    void MockLog::Append(const std::vector< Accord::LogEntry >& newEntries) {
        std::copy(
            newEntries.begin(),
            newEntries.end(),
            std::back_inserter(entries)
        );
    }

    void MockLog::Commit(size_t index) {
        commitIndex = std::max(commitIndex, index);
        ++commitCount;
    }

    void MockLog::Flush() {
        ++flushCount;
    }

    MockPersistentState::~MockPersistentState() {
        for (const auto& destructionDelegate: destructionDelegates) {
            destructionDelegate();
        }
    }

    void MockPersistentState::RegisterDestructionDelegate(std::function< void() > destructionDelegate) {
        destructionDelegates.push_back(destructionDelegate);
    }

    auto MockPersistentState::Load() -> Variables {
        return variables;
    }

    void MockPersistentState::Save(const Variables& newVariables) {
        variables = newVariables;
        ++saveCount;
    }

    std::map< std::string, std::string > MockStateMachine::GetValues() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return values;
    }

    std::vector< size_t > MockStateMachine::GetAppliedIndices() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return appliedIndices;
    }

    bool MockStateMachine::Apply(
        const Accord::LogEntry& entry,
        Result& result
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        if (failApply) {
            return false;
        }
        appliedIndices.push_back(entry.index);
        const auto command = std::static_pointer_cast< Accord::ClientCommand >(entry.command);
        const auto delimiter = command->content.find('=');
        if (delimiter == std::string::npos) {
            result.error = true;
            result.value = "malformed command";
            return true;
        }
        values[command->content.substr(0, delimiter)] = command->content.substr(delimiter + 1);
        result.value = "ok";
        return true;
    }

    bool MockStateMachine::Query(
        const std::string& query,
        Result& result
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        const auto valuesEntry = values.find(query);
        if (valuesEntry == values.end()) {
            result.error = true;
            result.value = "no such key";
        } else {
            result.value = valuesEntry->second;
        }
        return true;
    }

    Json::Value MockStateMachine::TakeSnapshot() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        auto snapshot = Json::Array({});
        for (const auto& valuesEntry: values) {
            snapshot.Add(Json::Array({valuesEntry.first, valuesEntry.second}));
        }
        return snapshot;
    }

    void MockStateMachine::InstallSnapshot(
        const Json::Value& snapshot,
        size_t lastIncludedIndex
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        values.clear();
        for (size_t i = 0; i < snapshot.GetSize(); ++i) {
            values[(std::string)snapshot[i][0]] = (std::string)snapshot[i][1];
        }
        ++snapshotsInstalled;
        lastSnapshotIndexInstalled = lastIncludedIndex;
    }

    bool Common::Await(std::function< bool() > condition) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        const auto deadline = (
            std::chrono::steady_clock::now()
            + std::chrono::seconds(1)
        );
        while (!condition()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            (void)eventsReceived.wait_for(
                lock,
                std::chrono::milliseconds(5)
            );
        }
        return true;
    }

    bool Common::AwaitMessagesSent(size_t numMessages) {
        return Await(
            [this, numMessages]{
                return messagesSent.size() >= numMessages;
            }
        );
    }

    bool Common::AwaitElectionStateChanges(size_t numElectionStateChanges) {
        return Await(
            [this, numElectionStateChanges]{
                return electionStateChanges.size() >= numElectionStateChanges;
            }
        );
    }

    std::vector< MessageInfo > Common::TakeMessagesSent() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        std::vector< MessageInfo > messages;
        messages.swap(messagesSent);
        return messages;
    }

    void Common::ClearMessagesSent() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        messagesSent.clear();
    }

    size_t Common::CountMessagesSent(Accord::Message::Type type) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        size_t count = 0;
        for (const auto& messageSent: messagesSent) {
            if (messageSent.message.type == type) {
                ++count;
            }
        }
        return count;
    }

    bool Common::MobilizeServer() {
        return server.Mobilize(
            mockLog,
            mockPersistentState,
            mockStateMachine,
            scheduler,
            clusterConfiguration,
            serverConfiguration
        );
    }

    void Common::AdvanceTime(double delta) {
        mockTimeKeeper->SetTime(mockTimeKeeper->GetCurrentTime() + delta);
        scheduler->WakeUp();
    }

    void Common::AdvanceTimeToJustBeforeElectionTimeout() {
        AdvanceTime(serverConfiguration.minimumElectionTimeout - 0.001);
    }

    void Common::CastVote(
        int instance,
        uint64_t term,
        bool granted
    ) {
        if (instance != serverConfiguration.selfInstanceId) {
            Accord::Message message;
            message.type = Accord::Message::Type::RequestVoteResults;
            message.term = term;
            message.requestVoteResults.voteGranted = granted;
            server.ReceiveMessage(message.Serialize(), instance);
        }
    }

    void Common::CastVotes(
        uint64_t term,
        bool granted
    ) {
        for (auto instance: clusterConfiguration.instanceIds) {
            CastVote(instance, term, granted);
        }
    }

    void Common::RequestVote(
        int instance,
        uint64_t term,
        size_t lastLogIndex,
        uint64_t lastLogTerm
    ) {
        Accord::Message message;
        message.type = Accord::Message::Type::RequestVote;
        message.term = term;
        message.requestVote.candidateId = instance;
        message.requestVote.lastLogTerm = lastLogTerm;
        message.requestVote.lastLogIndex = lastLogIndex;
        server.ReceiveMessage(message.Serialize(), instance);
    }

    void Common::ReceiveAppendEntriesFromMockLeader(
        int leaderId,
        uint64_t term,
        size_t leaderCommit,
        size_t prevLogIndex,
        uint64_t prevLogTerm,
        const std::vector< Accord::LogEntry >& entries
    ) {
        Accord::Message message;
        message.type = Accord::Message::Type::AppendEntries;
        message.term = term;
        message.appendEntries.leaderCommit = leaderCommit;
        message.appendEntries.prevLogIndex = prevLogIndex;
        message.appendEntries.prevLogTerm = prevLogTerm;
        message.log = entries;
        server.ReceiveMessage(message.Serialize(), leaderId);
    }

    void Common::ReceiveHeartBeatFromMockLeader(
        int leaderId,
        uint64_t term,
        size_t leaderCommit
    ) {
        const auto prevLogIndex = introspection.GetLastIndex();
        ReceiveAppendEntriesFromMockLeader(
            leaderId,
            term,
            leaderCommit,
            prevLogIndex,
            mockLog->GetTerm(prevLogIndex),
            {}
        );
    }

    void Common::ReceiveAppendEntriesResults(
        int instance,
        uint64_t term,
        size_t matchIndex,
        bool success,
        int seq,
        size_t followerCommit
    ) {
        Accord::Message message;
        message.type = Accord::Message::Type::AppendEntriesResults;
        message.term = term;
        message.seq = seq;
        message.appendEntriesResults.success = success;
        message.appendEntriesResults.matchIndex = matchIndex;
        message.appendEntriesResults.followerCommit = followerCommit;
        server.ReceiveMessage(message.Serialize(), instance);
    }

    void Common::ReceiveInstallSnapshotFromMockLeader(
        int leaderId,
        uint64_t term,
        const Json::Value& snapshot,
        size_t lastIncludedIndex,
        uint64_t lastIncludedTerm
    ) {
        Accord::Message message;
        message.type = Accord::Message::Type::InstallSnapshot;
        message.term = term;
        message.snapshot = snapshot;
        message.installSnapshot.lastIncludedIndex = lastIncludedIndex;
        message.installSnapshot.lastIncludedTerm = lastIncludedTerm;
        server.ReceiveMessage(message.Serialize(), leaderId);
    }

    void Common::AcknowledgeLastEntry(
        uint64_t term,
        int exceptInstance
    ) {
        const auto lastIndex = introspection.GetLastIndex();
        for (auto instance: clusterConfiguration.instanceIds) {
            if (
                (instance != serverConfiguration.selfInstanceId)
                && (instance != exceptInstance)
            ) {
                ReceiveAppendEntriesResults(instance, term, lastIndex);
            }
        }
    }

    bool Common::AwaitElectionTimeout(size_t messagesExpected) {
        ClearMessagesSent();
        AdvanceTime(serverConfiguration.maximumElectionTimeout);
        return AwaitMessagesSent(messagesExpected);
    }

    void Common::BecomeLeader(
        uint64_t term,
        bool acknowledgeInitialHeartbeats
    ) {
        mockPersistentState->variables.currentTerm = term - 1;
        (void)MobilizeServer();
        (void)AwaitElectionTimeout();
        CastVotes(term);
        (void)AwaitMessagesSent(4);
        ClearMessagesSent();
        if (acknowledgeInitialHeartbeats) {
            AcknowledgeLastEntry(term);
            (void)Await(
                [this]{
                    return introspection.IsLeaderReady();
                }
            );
            ClearMessagesSent();
        }
    }

    void Common::BecomeCandidate(uint64_t term) {
        mockPersistentState->variables.currentTerm = term - 1;
        (void)MobilizeServer();
        (void)AwaitElectionTimeout();
        ClearMessagesSent();
    }

    void Common::SetServerDelegates() {
        scheduler->SetClock(mockTimeKeeper);
        diagnosticsUnsubscribeDelegate = server.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                std::lock_guard< decltype(diagnosticsMutex) > lock(diagnosticsMutex);
                diagnosticMessages.push_back(
                    StringExtensions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
        eventsUnsubscribeDelegate = server.SubscribeToEvents(
            [this](
                const Accord::IServer::Event& baseEvent
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                switch (baseEvent.type) {
                    case Accord::IServer::Event::Type::SendMessage: {
                        const auto& event = static_cast< const Accord::IServer::SendMessageEvent& >(baseEvent);
                        MessageInfo messageInfo;
                        messageInfo.message = event.serializedMessage;
                        messageInfo.receiverInstanceNumber = event.receiverInstanceNumber;
                        messagesSent.push_back(std::move(messageInfo));
                    } break;

                    case Accord::IServer::Event::Type::LeadershipChange: {
                        const auto& event = static_cast< const Accord::IServer::LeadershipChangeEvent& >(baseEvent);
                        leadershipChanges.emplace_back(event.leaderId, event.term);
                    } break;

                    case Accord::IServer::Event::Type::ElectionState: {
                        const auto& event = static_cast< const Accord::IServer::ElectionStateEvent& >(baseEvent);
                        std::string electionStateAsString;
                        switch (event.electionState) {
                            case Accord::IServer::ElectionState::Follower: {
                                electionStateAsString = "follower";
                            } break;
                            case Accord::IServer::ElectionState::Candidate: {
                                electionStateAsString = "candidate";
                            } break;
                            case Accord::IServer::ElectionState::Leader: {
                                electionStateAsString = "leader";
                            } break;
                            default: {
                                electionStateAsString = "???";
                            } break;
                        }
                        electionStateChanges.push_back(
                            Json::Object({
                                {"term", (int)event.term},
                                {"electionState", electionStateAsString},
                                {"didVote", event.didVote},
                                {"votedFor", event.votedFor},
                            })
                        );
                    } break;

                    case Accord::IServer::Event::Type::ApplyConfiguration: {
                        const auto& event = static_cast< const Accord::IServer::ApplyConfigurationEvent& >(baseEvent);
                        configurationsApplied.push_back(event.configuration);
                    } break;

                    case Accord::IServer::Event::Type::CommitConfiguration: {
                        const auto& event = static_cast< const Accord::IServer::CommitConfigurationEvent& >(baseEvent);
                        configurationsCommitted.push_back(event.configuration);
                    } break;

                    case Accord::IServer::Event::Type::SnapshotInstalled: {
                        const auto& event = static_cast< const Accord::IServer::SnapshotInstalledEvent& >(baseEvent);
                        snapshotInstalled = event.snapshot;
                        lastIncludedIndexInSnapshot = event.lastIncludedIndex;
                        lastIncludedTermInSnapshot = event.lastIncludedTerm;
                    } break;

                    case Accord::IServer::Event::Type::PeerReachability: {
                        const auto& event = static_cast< const Accord::IServer::PeerReachabilityEvent& >(baseEvent);
                        reachabilityChanges.emplace_back(event.instanceId, event.reachable);
                    } break;

                    case Accord::IServer::Event::Type::Halted: {
                        const auto& event = static_cast< const Accord::IServer::HaltedEvent& >(baseEvent);
                        haltReasons.push_back(event.reason);
                    } break;

                    default: break;
                }
                eventsReceived.notify_all();
            }
        );
    }

    Accord::LogEntry Common::MakeClientEntry(
        uint64_t term,
        const std::string& clientId,
        uint64_t callId,
        const std::string& content
    ) {
        Accord::LogEntry entry;
        entry.term = term;
        const auto command = std::make_shared< Accord::ClientCommand >();
        command->clientId = clientId;
        command->callId = callId;
        command->content = content;
        entry.command = std::move(command);
        return entry;
    }

    void Common::SetUpSnapshot(
        size_t baseIndex,
        uint64_t baseTerm,
        const Json::Value& state
    ) {
        Accord::RaftConfiguration configuration;
        configuration.configuration = clusterConfiguration;
        mockLog->entries.clear();
        mockLog->baseIndex = baseIndex;
        mockLog->baseTerm = baseTerm;
        mockLog->commitIndex = baseIndex;
        mockLog->snapshot = Json::Object({
            {"state", state},
            {"configuration", configuration.Encode()},
        });
    }

    void Common::SetUp() {
        SetServerDelegates();
        clusterConfiguration.instanceIds = {2, 5, 6, 7, 11};
        serverConfiguration.selfInstanceId = 5;
        serverConfiguration.minimumElectionTimeout = 0.1;
        serverConfiguration.maximumElectionTimeout = 0.2;
        serverConfiguration.heartbeatInterval = 0.05;
        serverConfiguration.rpcTimeout = 0.01;
        mockPersistentState->variables.currentTerm = 0;
        mockPersistentState->variables.votedThisTerm = false;
    }

    void Common::TearDown() {
        server.Demobilize();
        eventsUnsubscribeDelegate();
        diagnosticsUnsubscribeDelegate();
    }

    /**
     * This is the test fixture for these tests, providing common
     * setup and teardown for each test.
     */
    struct ServerTests
        : public Common
    {
    };

    TEST_F(ServerTests, Mobilize_Twice_Does_Not_Crash) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());

        // Act
        const auto mobilizedAgain = MobilizeServer();

        // Assert
        EXPECT_TRUE(mobilizedAgain);
    }

    TEST_F(ServerTests, Log_Keeper_Released_On_Demobilize) {
        // Arrange
        bool logDestroyed = false;
        const auto onLogDestroyed = [&logDestroyed]{
            logDestroyed = true;
        };
        mockLog->RegisterDestructionDelegate(onLogDestroyed);
        (void)MobilizeServer();
        mockLog = nullptr;

        // Act
        server.Demobilize();

        // Assert
        EXPECT_TRUE(logDestroyed);
    }

    TEST_F(ServerTests, Persistent_State_Released_On_Demobilize) {
        // Arrange
        bool persistentStateDestroyed = false;
        const auto onPersistentStateDestroyed = [&persistentStateDestroyed]{
            persistentStateDestroyed = true;
        };
        mockPersistentState->RegisterDestructionDelegate(onPersistentStateDestroyed);
        (void)MobilizeServer();
        mockPersistentState = nullptr;

        // Act
        server.Demobilize();

        // Assert
        EXPECT_TRUE(persistentStateDestroyed);
    }

    TEST_F(ServerTests, Scheduler_Released_On_Demobilize) {
        // Arrange
        bool timeKeeperDestroyed = false;
        const auto onTimeKeeperDestroyed = [&timeKeeperDestroyed]{
            timeKeeperDestroyed = true;
        };
        mockTimeKeeper->RegisterDestructionDelegate(onTimeKeeperDestroyed);
        (void)MobilizeServer();
        scheduler = nullptr;
        mockTimeKeeper = nullptr;

        // Act
        server.Demobilize();

        // Assert
        EXPECT_TRUE(timeKeeperDestroyed);
    }

    TEST_F(ServerTests, Mobilize_Fails_With_Log_Entries_Out_Of_Order) {
        // Arrange
        mockPersistentState->variables.currentTerm = 3;
        mockLog->AppendEntry(2);
        mockLog->AppendEntry(1);

        // Act
        const auto mobilized = MobilizeServer();

        // Assert
        EXPECT_FALSE(mobilized);
        EXPECT_TRUE(introspection.IsHalted());
        ASSERT_TRUE(
            Await(
                [this]{
                    return !haltReasons.empty();
                }
            )
        );
        EXPECT_EQ("log unusable (term decreases at index 2)", haltReasons[0]);
    }

    TEST_F(ServerTests, Mobilize_Fails_With_Log_Entry_From_Future_Term) {
        // Arrange
        mockPersistentState->variables.currentTerm = 1;
        mockLog->AppendEntry(1);
        mockLog->AppendEntry(2);

        // Act
        const auto mobilized = MobilizeServer();

        // Assert
        EXPECT_FALSE(mobilized);
        EXPECT_TRUE(introspection.IsHalted());
        ASSERT_TRUE(
            Await(
                [this]{
                    return !haltReasons.empty();
                }
            )
        );
        EXPECT_EQ(
            "log unusable (entry at index 2 has term 2 beyond current term 1)",
            haltReasons[0]
        );
    }

    TEST_F(ServerTests, Mobilize_Fails_With_Log_Entry_Holding_Wrong_Index) {
        // Arrange
        mockPersistentState->variables.currentTerm = 1;
        mockLog->AppendEntry(1);
        mockLog->AppendEntry(1);
        mockLog->entries[1].index = 7;

        // Act
        const auto mobilized = MobilizeServer();

        // Assert
        EXPECT_FALSE(mobilized);
        ASSERT_TRUE(
            Await(
                [this]{
                    return !haltReasons.empty();
                }
            )
        );
        EXPECT_EQ("log unusable (entry at index 2 claims index 7)", haltReasons[0]);
    }

    TEST_F(ServerTests, Halted_Server_Ignores_Messages_And_Does_Not_Start_Elections) {
        // Arrange
        mockPersistentState->variables.currentTerm = 1;
        mockLog->AppendEntry(2);
        (void)MobilizeServer();

        // Act
        RequestVote(2, 3, 0, 0);
        AdvanceTime(serverConfiguration.maximumElectionTimeout);

        // Assert
        EXPECT_FALSE(AwaitMessagesSent(1));
        EXPECT_EQ(1, introspection.GetCurrentTerm());
    }

    TEST_F(ServerTests, Mobilize_Recovers_Configuration_From_Snapshot) {
        // Arrange
        Accord::RaftConfiguration snapshotConfiguration;
        snapshotConfiguration.configuration.instanceIds = {2, 5, 6};
        snapshotConfiguration.logIndex = 3;
        mockLog->baseIndex = 4;
        mockLog->baseTerm = 2;
        mockLog->snapshot = Json::Object({
            {"state", Json::Array({Json::Array({"x", "7"})})},
            {"configuration", snapshotConfiguration.Encode()},
        });
        mockPersistentState->variables.currentTerm = 2;

        // Act
        const auto mobilized = MobilizeServer();

        // Assert
        EXPECT_TRUE(mobilized);
        EXPECT_EQ(snapshotConfiguration, introspection.GetEffectiveConfiguration());
        EXPECT_EQ(4, introspection.GetCommitIndex());
        ASSERT_TRUE(
            Await(
                [this]{
                    return !mockStateMachine->GetValues().empty();
                }
            )
        );
        EXPECT_EQ(
            (std::map< std::string, std::string >{{"x", "7"}}),
            mockStateMachine->GetValues()
        );
    }

    TEST_F(ServerTests, Mobilize_Takes_Configuration_From_Uncommitted_Log_Entries) {
        // Arrange
        const auto command = std::make_shared< Accord::SingleConfigurationCommand >();
        command->oldConfiguration.instanceIds = {2, 5, 6, 7, 11};
        command->configuration.instanceIds = {2, 5, 6};
        mockPersistentState->variables.currentTerm = 1;
        mockLog->AppendEntry(1);
        mockLog->AppendEntry(1, command);

        // Act
        (void)MobilizeServer();

        // Assert
        const auto effectiveConfiguration = introspection.GetEffectiveConfiguration();
        EXPECT_EQ(
            std::set< int >({2, 5, 6}),
            effectiveConfiguration.configuration.instanceIds
        );
        EXPECT_EQ(2, effectiveConfiguration.logIndex);
        EXPECT_EQ(
            clusterConfiguration,
            introspection.GetCommittedConfiguration().configuration
        );
    }

    TEST_F(ServerTests, Server_Does_Not_Retransmit_Too_Quickly) {
        // Arrange
        //
        // In this scenario, server 5 is a candidate, and receives
        // one less than the minimum number of votes required to
        // be leader.  One server (2) has not yet cast their vote.
        //
        // Server 5 will retransmit a vote request to server 2, but it should
        // not do so until the retransmission time (rpcTimeout) has elapsed.
        //
        // server IDs:     {2, 5, 6, 7, 11}
        // candidate:          ^
        // voting for:                  ^
        // voting against:        ^  ^
        // didn't vote:     ^
        (void)MobilizeServer();
        ASSERT_TRUE(AwaitElectionTimeout());
        CastVote(6, 1, false);
        CastVote(7, 1, false);
        CastVote(11, 1, true);
        ClearMessagesSent();

        // Act
        AdvanceTime(serverConfiguration.rpcTimeout - 0.0001);

        // Assert
        EXPECT_FALSE(AwaitMessagesSent(1));
    }

    TEST_F(ServerTests, Server_Regular_Retransmissions) {
        // Arrange
        //
        // In this scenario, server 5 is a candidate, and receives
        // one less than the minimum number of votes required to
        // be leader.  One server (2) has not yet cast their vote.
        //
        // Server 5 should retransmit a vote request to server 2 every time the
        // retransmission time (rpcTimeout) has elapsed.
        (void)MobilizeServer();
        ASSERT_TRUE(AwaitElectionTimeout());
        CastVote(6, 1, false);
        CastVote(7, 1, false);
        CastVote(11, 1, true);
        ClearMessagesSent();

        // Act
        AdvanceTime(serverConfiguration.rpcTimeout);
        const auto firstRetransmissionSent = AwaitMessagesSent(1);
        AdvanceTime(serverConfiguration.rpcTimeout);
        const auto secondRetransmissionSent = AwaitMessagesSent(2);

        // Assert
        EXPECT_TRUE(firstRetransmissionSent);
        EXPECT_TRUE(secondRetransmissionSent);
        const auto messages = TakeMessagesSent();
        ASSERT_EQ(2, messages.size());
        for (const auto& messageInfo: messages) {
            EXPECT_EQ(2, messageInfo.receiverInstanceNumber);
            EXPECT_EQ(Accord::Message::Type::RequestVote, messageInfo.message.type);
            EXPECT_EQ(1, messageInfo.message.term);
        }
    }

    TEST_F(ServerTests, Leader_Sends_Heart_Beats_At_Regular_Intervals) {
        // Arrange
        BecomeLeader();

        // Act
        AdvanceTime(serverConfiguration.heartbeatInterval + 0.001);

        // Assert
        ASSERT_TRUE(AwaitMessagesSent(4));
        const auto messages = TakeMessagesSent();
        std::set< int > receivers;
        for (const auto& messageInfo: messages) {
            EXPECT_EQ(Accord::Message::Type::AppendEntries, messageInfo.message.type);
            EXPECT_TRUE(messageInfo.message.log.empty());
            EXPECT_EQ(1, messageInfo.message.appendEntries.prevLogIndex);
            EXPECT_EQ(1, messageInfo.message.appendEntries.leaderCommit);
            (void)receivers.insert(messageInfo.receiverInstanceNumber);
        }
        EXPECT_EQ(std::set< int >({2, 6, 7, 11}), receivers);
    }

    TEST_F(ServerTests, Diagnostics_From_Components_Forwarded_At_Configured_Level) {
        // Arrange
        serverConfiguration.logAppenderDiagnosticsLevel = 0;

        // Act
        BecomeLeader();

        // Assert
        std::lock_guard< decltype(diagnosticsMutex) > lock(diagnosticsMutex);
        const auto forwarded = std::find_if(
            diagnosticMessages.begin(),
            diagnosticMessages.end(),
            [](const std::string& message){
                return message.find("Accord::LogAppender: ") != std::string::npos;
            }
        );
        EXPECT_NE(diagnosticMessages.end(), forwarded);
    }

}
