/**
 * @file ServerImpl.cpp
 *
 * This module contains the implementation of the Accord::Server::Impl
 * structure methods to do with timers, events, elections, commitment,
 * and membership changes.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "Utilities.hpp"

#include <algorithm>
#include <Accord/LogEntry.hpp>
#include <Accord/ILog.hpp>
#include <Accord/Server.hpp>
#include <inttypes.h>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Accord {

    Server::Impl::Impl()
        : diagnosticsSender("Accord::Server")
        , appenderDiagnosticsSender("Accord::LogAppender")
        , pendingRequests(retryCache)
        , updater(retryCache, pendingRequests)
    {
    }

    double Server::Impl::GetCurrentTime() const {
        return scheduler->GetClock()->GetCurrentTime();
    }

    std::set< int > Server::Impl::GetReplicationTargets() const {
        auto targets = state.GetEffectiveConfiguration().GetAllInstanceIds();
        for (auto instanceId: state.configurationManager.GetCurrent().GetAllInstanceIds()) {
            (void)targets.insert(instanceId);
        }
        if (
            role.leader.configChangePending
            || (role.leader.configChangeCompletion != nullptr)
        ) {
            for (auto instanceId: role.leader.targetConfiguration.instanceIds) {
                (void)targets.insert(instanceId);
            }
        }
        (void)targets.erase(serverConfiguration.selfInstanceId);
        return targets;
    }

    size_t Server::Impl::GetMatchIndex(int instanceId) const {
        if (instanceId == serverConfiguration.selfInstanceId) {
            return state.GetLastIndex();
        }
        const auto appendersEntry = role.leader.appenders.find(instanceId);
        if (appendersEntry == role.leader.appenders.end()) {
            return 0;
        }
        return appendersEntry->second->GetProgress().matchIndex;
    }

    size_t Server::Impl::GetFollowerCommitIndex(int instanceId) const {
        if (instanceId == serverConfiguration.selfInstanceId) {
            return state.commitIndex;
        }
        const auto appendersEntry = role.leader.appenders.find(instanceId);
        if (appendersEntry == role.leader.appenders.end()) {
            return 0;
        }
        return appendersEntry->second->GetProgress().followerCommit;
    }

    void Server::Impl::ResetElectionTimer() {
        if (electionTimeoutToken) {
            scheduler->Cancel(electionTimeoutToken);
        }
        double timeout;
        if (lostMajorityHeartbeatsRecently) {
            timeout = serverConfiguration.maximumElectionTimeout;
        } else {
            timeout = std::uniform_real_distribution<>(
                serverConfiguration.minimumElectionTimeout,
                serverConfiguration.maximumElectionTimeout
            )(rng);
        }
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        electionTimeoutToken = scheduler->Schedule(
            [weakImpl, thisGeneration]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                    || impl->halted
                ) {
                    return;
                }
                impl->electionTimeoutToken = 0;
                if (
                    !impl->role.IsLeader()
                    && impl->isVotingMember
                ) {
                    impl->StartElection();
                }
            },
            GetCurrentTime() + timeout
        );
    }

    void Server::Impl::ResetHeartbeatTimer() {
        if (heartbeatTimeoutToken) {
            scheduler->Cancel(heartbeatTimeoutToken);
        }
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        heartbeatTimeoutToken = scheduler->Schedule(
            [weakImpl, thisGeneration]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                    || impl->halted
                ) {
                    return;
                }
                impl->heartbeatTimeoutToken = 0;
                if (impl->role.IsLeader()) {
                    impl->CheckLostMajority();
                }
                if (impl->role.IsLeader()) {
                    impl->SendHeartBeats();
                }
            },
            GetCurrentTime() + serverConfiguration.heartbeatInterval
        );
    }

    void Server::Impl::CancelAllCallbacks() {
        if (electionTimeoutToken) {
            scheduler->Cancel(electionTimeoutToken);
            electionTimeoutToken = 0;
        }
        if (heartbeatTimeoutToken) {
            scheduler->Cancel(heartbeatTimeoutToken);
            heartbeatTimeoutToken = 0;
        }
        for (const auto& voteRetransmitToken: role.candidate.voteRetransmitTokens) {
            scheduler->Cancel(voteRetransmitToken.second);
        }
        role.candidate.voteRetransmitTokens.clear();
        for (auto& appender: role.leader.appenders) {
            appender.second->Cancel();
        }
    }

    int Server::Impl::ScheduleRequestTimeout(
        std::function< void(Impl& impl) > callback,
        double dueTime
    ) {
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        const auto token = std::make_shared< int >(0);
        *token = scheduler->Schedule(
            [weakImpl, thisGeneration, callback, token]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                ) {
                    return;
                }
                (void)impl->requestTimeoutTokens.erase(*token);
                callback(*impl);
            },
            dueTime
        );
        (void)requestTimeoutTokens.insert(*token);
        return *token;
    }

    void Server::Impl::AddToEventQueue(
        std::shared_ptr< IServer::Event >&& event
    ) {
        std::lock_guard< decltype(eventQueueMutex) > lock(eventQueueMutex);
        eventQueue.Add(std::move(event));
        eventQueueWorkerWakeCondition.notify_one();
    }

    void Server::Impl::ProcessEventQueue(
        std::unique_lock< decltype(eventQueueMutex) >& lock
    ) {
        auto eventSubscribersSample = eventSubscribers;
        lock.unlock();
        while (!eventQueue.IsEmpty()) {
            const auto event = eventQueue.Remove();
            for (auto eventSubscriber: eventSubscribersSample) {
                eventSubscriber.second(*event);
            }
        }
        lock.lock();
    }

    void Server::Impl::EventQueueWorker() {
        std::unique_lock< decltype(eventQueueMutex) > lock(eventQueueMutex);
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Event queue worker thread started"
        );
        while (!stopEventQueueWorker) {
            eventQueueWorkerWakeCondition.wait(
                lock,
                [this]{
                    return (
                        stopEventQueueWorker
                        || !eventQueue.IsEmpty()
                    );
                }
            );
            ProcessEventQueue(lock);
        }
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Event queue worker thread stopping"
        );
    }

    void Server::Impl::QueueLeadershipChangeAnnouncement(
        int leaderId,
        uint64_t term
    ) {
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Server %d is now the leader in term %" PRIu64,
            leaderId,
            term
        );
        const auto leadershipChangeEvent = std::make_shared< LeadershipChangeEvent >();
        leadershipChangeEvent->leaderId = leaderId;
        leadershipChangeEvent->term = term;
        AddToEventQueue(std::move(leadershipChangeEvent));
    }

    void Server::Impl::QueueElectionStateChangeAnnouncement() {
        const auto electionStateEvent = std::make_shared< ElectionStateEvent >();
        electionStateEvent->term = state.persistentStateCache.currentTerm;
        electionStateEvent->electionState = role.electionState;
        electionStateEvent->didVote = state.persistentStateCache.votedThisTerm;
        electionStateEvent->votedFor = state.persistentStateCache.votedFor;
        AddToEventQueue(std::move(electionStateEvent));
    }

    void Server::Impl::QueueConfigAppliedAnnouncement() {
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Effective configuration now %s",
            effectiveConfiguration.ToString().c_str()
        );
        const auto applyConfigurationEvent = std::make_shared< ApplyConfigurationEvent >();
        applyConfigurationEvent->configuration = effectiveConfiguration;
        AddToEventQueue(std::move(applyConfigurationEvent));
    }

    void Server::Impl::QueueConfigCommittedAnnouncement(const RaftConfiguration& configuration) {
        const auto commitConfigurationEvent = std::make_shared< CommitConfigurationEvent >();
        commitConfigurationEvent->configuration = configuration;
        commitConfigurationEvent->logIndex = configuration.logIndex;
        AddToEventQueue(std::move(commitConfigurationEvent));
    }

    void Server::Impl::QueueSnapshotAnnouncement(
        const Json::Value& snapshot,
        size_t lastIncludedIndex,
        uint64_t lastIncludedTerm
    ) {
        const auto snapshotInstalledEvent = std::make_shared< SnapshotInstalledEvent >();
        snapshotInstalledEvent->snapshot = snapshot;
        snapshotInstalledEvent->lastIncludedIndex = lastIncludedIndex;
        snapshotInstalledEvent->lastIncludedTerm = lastIncludedTerm;
        AddToEventQueue(std::move(snapshotInstalledEvent));
    }

    void Server::Impl::SerializeAndQueueMessageToBeSent(
        Message& message,
        int instanceNumber
    ) {
        SendMessage(message.Serialize(), instanceNumber);
    }

    void Server::Impl::UpdateCurrentTerm(uint64_t newTerm) {
        if (state.persistentStateCache.currentTerm == newTerm) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Updating term (was %" PRIu64 ", now %" PRIu64 ")",
            state.persistentStateCache.currentTerm,
            newTerm
        );
        role.follower.thisTermLeaderAnnounced = false;
        leaderId = 0;
        state.UpdateCurrentTerm(newTerm);
    }

    void Server::Impl::RevertToFollower() {
        if (role.electionState != IServer::ElectionState::Follower) {
            const auto wasLeader = role.IsLeader();
            const auto configChangeCompletion = role.leader.configChangeCompletion;
            CancelAllCallbacks();
            role.TransitionTo(IServer::ElectionState::Follower);
            if (leaderId == serverConfiguration.selfInstanceId) {
                leaderId = 0;
            }
            diagnosticsSender.SendDiagnosticInformationString(
                2,
                "Reverted to follower"
            );
            if (wasLeader) {
                FailOutstandingRequests();
                if (configChangeCompletion != nullptr) {
                    (void)configChangeCompletion->Resolve(MakeNotLeaderReply());
                }
            }
        }
        ResetElectionTimer();
    }

    void Server::Impl::AssumeLeadership() {
        CancelAllCallbacks();
        role.TransitionTo(IServer::ElectionState::Leader);
        lostMajorityHeartbeatsRecently = false;
        leaderId = serverConfiguration.selfInstanceId;
        diagnosticsSender.SendDiagnosticInformationString(
            3,
            "Received majority vote -- assuming leadership"
        );
        QueueElectionStateChangeAnnouncement();
        QueueLeadershipChangeAnnouncement(
            serverConfiguration.selfInstanceId,
            state.persistentStateCache.currentTerm
        );
        SyncAppenders();
        role.leader.startupIndex = AppendCommand(nullptr);
    }

    void Server::Impl::StepUpAsCandidate() {
        CancelAllCallbacks();
        role.TransitionTo(IServer::ElectionState::Candidate);
        state.VoteFor(serverConfiguration.selfInstanceId);
        (void)role.candidate.votesForUs.insert(serverConfiguration.selfInstanceId);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Timeout -- starting new election (term %" PRIu64 ")",
            state.persistentStateCache.currentTerm
        );
    }

    void Server::Impl::SendVoteRequest(int instanceId) {
        Message message;
        message.type = Message::Type::RequestVote;
        message.term = state.persistentStateCache.currentTerm;
        message.requestVote.candidateId = serverConfiguration.selfInstanceId;
        message.requestVote.lastLogIndex = state.GetLastIndex();
        message.requestVote.lastLogTerm = state.GetLastTerm();
        SerializeAndQueueMessageToBeSent(message, instanceId);
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        const auto term = message.term;
        role.candidate.voteRetransmitTokens[instanceId] = scheduler->Schedule(
            [weakImpl, thisGeneration, term, instanceId]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                    || impl->halted
                    || (impl->role.electionState != IServer::ElectionState::Candidate)
                    || (impl->state.persistentStateCache.currentTerm != term)
                ) {
                    return;
                }
                auto& voteRetransmitTokens = impl->role.candidate.voteRetransmitTokens;
                if (voteRetransmitTokens.erase(instanceId) == 0) {
                    return;
                }
                impl->SendVoteRequest(instanceId);
            },
            GetCurrentTime() + serverConfiguration.rpcTimeout
        );
    }

    void Server::Impl::StartElection() {
        UpdateCurrentTerm(state.persistentStateCache.currentTerm + 1);
        StepUpAsCandidate();
        QueueElectionStateChangeAnnouncement();
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        for (auto instanceId: effectiveConfiguration.GetAllInstanceIds()) {
            if (instanceId == serverConfiguration.selfInstanceId) {
                continue;
            }
            SendVoteRequest(instanceId);
        }
        ResetElectionTimer();
        if (effectiveConfiguration.HasMajority(role.candidate.votesForUs)) {
            AssumeLeadership();
        }
    }

    void Server::Impl::SendHeartBeats() {
        const auto now = GetCurrentTime();
        timeOfLastLeaderMessage = now;
        for (auto& appender: role.leader.appenders) {
            appender.second->CheckReachability(now);
            appender.second->Replicate(now);
        }
        ResetHeartbeatTimer();
    }

    void Server::Impl::CheckLostMajority() {
        if (!serverConfiguration.stepDownOnLostMajority) {
            return;
        }
        const auto now = GetCurrentTime();
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        std::set< int > responders{serverConfiguration.selfInstanceId};
        for (const auto& appender: role.leader.appenders) {
            const auto& progress = appender.second->GetProgress();
            if (now - progress.lastResponseTime < serverConfiguration.maximumElectionTimeout) {
                (void)responders.insert(appender.first);
            }
        }
        if (effectiveConfiguration.HasMajority(responders)) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
            "No response from a majority of %s -- stepping down (term %" PRIu64 ")",
            effectiveConfiguration.ToString().c_str(),
            state.persistentStateCache.currentTerm
        );
        lostMajorityHeartbeatsRecently = true;
        RevertToFollower();
        QueueElectionStateChangeAnnouncement();
    }

    void Server::Impl::FailOutstandingRequests() {
        const auto reply = MakeNotLeaderReply();
        pendingRequests.FailAll(reply, GetCurrentTime());
        watchRequests.FailAll(reply);
    }

    void Server::Impl::Halt(const std::string& reason) {
        if (halted) {
            return;
        }
        halted = true;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            SystemAbstractions::DiagnosticsSender::Levels::ERROR,
            "Halted: %s",
            reason.c_str()
        );
        const auto configChangeCompletion = role.leader.configChangeCompletion;
        CancelAllCallbacks();
        for (auto token: requestTimeoutTokens) {
            scheduler->Cancel(token);
        }
        requestTimeoutTokens.clear();
        role.TransitionTo(IServer::ElectionState::Follower);
        leaderId = 0;
        ClientReply reply;
        reply.status = ClientReply::Status::NotLeader;
        pendingRequests.FailAll(reply, GetCurrentTime());
        watchRequests.FailAll(reply);
        if (configChangeCompletion != nullptr) {
            (void)configChangeCompletion->Resolve(reply);
        }
        const auto haltedEvent = std::make_shared< HaltedEvent >();
        haltedEvent->reason = reason;
        AddToEventQueue(std::move(haltedEvent));
    }

    void Server::Impl::SyncAppenders() {
        if (!role.IsLeader()) {
            return;
        }
        const auto targets = GetReplicationTargets();
        const auto now = GetCurrentTime();
        for (auto instanceId: targets) {
            auto& appender = role.leader.appenders[instanceId];
            if (appender == nullptr) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    2,
                    "Starting to replicate log to server %d",
                    instanceId
                );
                appender.reset(
                    new LogAppender(
                        *this,
                        appenderDiagnosticsSender,
                        instanceId,
                        now
                    )
                );
            }
        }
        auto appendersEntry = role.leader.appenders.begin();
        while (appendersEntry != role.leader.appenders.end()) {
            if (targets.find(appendersEntry->first) != targets.end()) {
                ++appendersEntry;
                continue;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "Sending last entries to server %d and no longer replicating to it",
                appendersEntry->first
            );
            appendersEntry->second->Restart();
            appendersEntry->second->Replicate(now);
            appendersEntry = role.leader.appenders.erase(appendersEntry);
        }
    }

    void Server::Impl::OnEffectiveConfigurationChanged() {
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        isVotingMember = effectiveConfiguration.Contains(serverConfiguration.selfInstanceId);
        QueueConfigAppliedAnnouncement();
        SyncAppenders();
    }

    size_t Server::Impl::AppendCommand(std::shared_ptr< Command > command) {
        LogEntry entry;
        entry.term = state.persistentStateCache.currentTerm;
        entry.index = state.GetLastIndex() + 1;
        entry.command = std::move(command);
        if (state.AppendEntries({entry})) {
            OnEffectiveConfigurationChanged();
        }
        const auto now = GetCurrentTime();
        timeOfLastLeaderMessage = now;
        for (auto& appender: role.leader.appenders) {
            appender.second->Replicate(now);
        }
        ResetHeartbeatTimer();
        LeaderAdvanceCommitIndex();
        return entry.index;
    }

    bool Server::Impl::RollBackLog(size_t fromIndex) {
        const auto lastIndex = state.GetLastIndex();
        if (fromIndex > lastIndex) {
            return false;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Removing log entries %zu through %zu",
            fromIndex,
            lastIndex
        );
        const auto now = GetCurrentTime();
        for (size_t index = fromIndex; index <= lastIndex; ++index) {
            const auto& entry = (*state.log)[index];
            if (
                (entry.command == nullptr)
                || (entry.command->GetType() != "Client")
            ) {
                continue;
            }
            const auto command = std::static_pointer_cast< ClientCommand >(entry.command);
            ClientInvocationId invocationId;
            invocationId.clientId = command->clientId;
            invocationId.callId = command->callId;
            retryCache.NotifyTruncatedEntry(invocationId, leaderId, now);
        }
        pendingRequests.FailFrom(fromIndex, MakeNotLeaderReply(), now);
        return state.TruncateLog(fromIndex);
    }

    void Server::Impl::AdvanceCommitIndex(size_t newCommitIndex) {
        newCommitIndex = std::min(newCommitIndex, state.GetLastIndex());
        if (newCommitIndex <= state.commitIndex) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Advancing commit index %zu -> %zu",
            state.commitIndex,
            newCommitIndex
        );
        state.commitIndex = newCommitIndex;
        state.log->Commit(newCommitIndex);
        updater.NotifyCommitIndex(newCommitIndex);
        UpdateWatches();
    }

    void Server::Impl::LeaderAdvanceCommitIndex() {
        if (!role.IsLeader()) {
            return;
        }
        const auto majorityIndex = state.GetEffectiveConfiguration().GetMajorityIndex(
            [this](int instanceId){ return GetMatchIndex(instanceId); }
        );
        if (
            (majorityIndex > state.commitIndex)
            && (state.log->GetTerm(majorityIndex) == state.persistentStateCache.currentTerm)
        ) {
            AdvanceCommitIndex(majorityIndex);
        }
    }

    void Server::Impl::UpdateWatches() {
        if (!role.IsLeader()) {
            return;
        }
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        const auto matchIndexOf = [this](int instanceId){ return GetMatchIndex(instanceId); };
        const auto commitIndexOf = [this](int instanceId){ return GetFollowerCommitIndex(instanceId); };
        WatchRequests::Progress progress;
        progress.majorityIndex = effectiveConfiguration.GetMajorityIndex(matchIndexOf);
        progress.allIndex = effectiveConfiguration.GetMinimumIndex(matchIndexOf);
        progress.majorityCommitIndex = effectiveConfiguration.GetMajorityIndex(commitIndexOf);
        progress.allCommitIndex = effectiveConfiguration.GetMinimumIndex(commitIndexOf);
        watchRequests.UpdateProgress(progress);
        watchRequests.ConfirmLeadership(
            state.persistentStateCache.currentTerm,
            [this, &effectiveConfiguration](double since){
                std::set< int > responders{serverConfiguration.selfInstanceId};
                for (const auto& appender: role.leader.appenders) {
                    if (appender.second->GetProgress().lastAckedRequestTime >= since) {
                        (void)responders.insert(appender.first);
                    }
                }
                return effectiveConfiguration.HasMajority(responders);
            }
        );
    }

    void Server::Impl::StartConfigChangeIfNewServersHaveCaughtUp() {
        if (
            !role.IsLeader()
            || !role.leader.configChangePending
        ) {
            return;
        }
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        for (auto instanceId: role.leader.targetConfiguration.instanceIds) {
            if (effectiveConfiguration.Contains(instanceId)) {
                continue;
            }
            if (GetMatchIndex(instanceId) < role.leader.newServerCatchUpIndex) {
                return;
            }
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Applying joint configuration (from %s to %s)",
            FormatSet(effectiveConfiguration.configuration.instanceIds).c_str(),
            FormatSet(role.leader.targetConfiguration.instanceIds).c_str()
        );
        role.leader.configChangePending = false;
        const auto command = std::make_shared< JointConfigurationCommand >();
        command->oldConfiguration = effectiveConfiguration.configuration;
        command->newConfiguration = role.leader.targetConfiguration;
        (void)AppendCommand(command);
    }

    void Server::Impl::AbandonConfigChange(std::shared_ptr< CompletionHandle > completion) {
        if (
            !role.IsLeader()
            || !role.leader.configChangePending
            || (role.leader.configChangeCompletion != completion)
        ) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
            "New servers did not catch up -- abandoning configuration change to %s",
            FormatSet(role.leader.targetConfiguration.instanceIds).c_str()
        );
        role.leader.configChangePending = false;
        role.leader.newServerCatchUpIndex = 0;
        role.leader.targetConfiguration = ClusterConfiguration();
        role.leader.configChangeCompletion = nullptr;
        SyncAppenders();
        ClientReply reply;
        reply.status = ClientReply::Status::Timeout;
        reply.leaderId = leaderId;
        (void)completion->Resolve(reply);
    }

    void Server::Impl::FinishJointConfiguration() {
        if (!role.IsLeader()) {
            return;
        }
        const auto effectiveConfiguration = state.GetEffectiveConfiguration();
        if (
            effectiveConfiguration.IsStable()
            || !state.uncommittedConfigurations.empty()
        ) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Joint configuration committed -- applying new configuration %s",
            FormatSet(effectiveConfiguration.configuration.instanceIds).c_str()
        );
        const auto command = std::make_shared< SingleConfigurationCommand >();
        command->configuration = effectiveConfiguration.configuration;
        command->oldConfiguration = effectiveConfiguration.oldConfiguration;
        const auto index = AppendCommand(command);
        if (role.leader.configChangeCompletion != nullptr) {
            role.leader.targetConfigurationIndex = index;
        }
    }

    Json::Value Server::Impl::BuildLogSnapshot(
        const Json::Value& stateMachineSnapshot,
        size_t lastIncludedIndex
    ) {
        return Json::Object({
            {"state", stateMachineSnapshot},
            {"configuration", state.configurationManager.GetConfiguration(lastIncludedIndex).Encode()},
        });
    }

    bool Server::Impl::GetEntry(
        size_t index,
        LogEntry& entry
    ) {
        if (
            (index <= state.log->GetBaseIndex())
            || (index > state.GetLastIndex())
            || (index > state.commitIndex)
        ) {
            return false;
        }
        entry = (*state.log)[index];
        return true;
    }

    void Server::Impl::OnEntryApplied(size_t index) {
        if (
            role.IsLeader()
            && !role.leader.ready
            && (index >= role.leader.startupIndex)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "Leader ready for requests (applied index %zu)",
                index
            );
            role.leader.ready = true;
            FinishJointConfiguration();
        }
    }

    void Server::Impl::OnConfigurationApplied(const LogEntry& entry) {
        const auto configuration = ServerState::ConfigurationFromEntry(entry);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Configuration committed at index %zu: %s",
            configuration.logIndex,
            configuration.ToString().c_str()
        );
        state.CommitConfiguration(configuration);
        QueueConfigCommittedAnnouncement(configuration);
        if (!role.IsLeader()) {
            return;
        }
        if (!configuration.IsStable()) {
            FinishJointConfiguration();
            return;
        }
        if (
            (role.leader.configChangeCompletion != nullptr)
            && (role.leader.targetConfigurationIndex != 0)
            && (configuration.logIndex >= role.leader.targetConfigurationIndex)
        ) {
            ClientReply reply;
            reply.status = ClientReply::Status::Success;
            reply.leaderId = serverConfiguration.selfInstanceId;
            reply.logIndex = configuration.logIndex;
            const auto configChangeCompletion = role.leader.configChangeCompletion;
            role.leader.configChangeCompletion = nullptr;
            role.leader.targetConfigurationIndex = 0;
            (void)configChangeCompletion->Resolve(reply);
        }
        SyncAppenders();
        if (!configuration.Contains(serverConfiguration.selfInstanceId)) {
            diagnosticsSender.SendDiagnosticInformationString(
                3,
                "Not a member of the new configuration -- stepping down"
            );
            RevertToFollower();
            QueueElectionStateChangeAnnouncement();
        }
    }

    void Server::Impl::OnSnapshotTaken(
        const Json::Value& stateMachineSnapshot,
        size_t lastIncludedIndex
    ) {
        if (lastIncludedIndex <= state.log->GetBaseIndex()) {
            return;
        }
        const auto lastIncludedTerm = state.log->GetTerm(lastIncludedIndex);
        state.log->InstallSnapshot(
            BuildLogSnapshot(stateMachineSnapshot, lastIncludedIndex),
            lastIncludedIndex,
            lastIncludedTerm
        );
        state.configurationManager.PruneBefore(lastIncludedIndex);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Log compacted through index %zu (term %" PRIu64 ")",
            lastIncludedIndex,
            lastIncludedTerm
        );
    }

    StateMachineUpdater::Delegates Server::Impl::MakeUpdaterDelegates() {
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        const auto isCurrent = [thisGeneration](const Impl& impl){
            return (
                impl.mobilized
                && (impl.generation == thisGeneration)
                && !impl.halted
            );
        };
        StateMachineUpdater::Delegates delegates;
        delegates.getEntry = [weakImpl, isCurrent](size_t index, LogEntry& entry){
            auto impl = weakImpl.lock();
            if (impl == nullptr) {
                return false;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            if (!isCurrent(*impl)) {
                return false;
            }
            return impl->GetEntry(index, entry);
        };
        delegates.onConfigurationApplied = [weakImpl, isCurrent](const LogEntry& entry){
            auto impl = weakImpl.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            if (!isCurrent(*impl)) {
                return;
            }
            impl->OnConfigurationApplied(entry);
        };
        delegates.onApplied = [weakImpl, isCurrent](size_t index){
            auto impl = weakImpl.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            if (!isCurrent(*impl)) {
                return;
            }
            impl->OnEntryApplied(index);
        };
        delegates.onSnapshotTaken = [weakImpl, isCurrent](
            const Json::Value& snapshot,
            size_t lastIncludedIndex
        ){
            auto impl = weakImpl.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            if (!isCurrent(*impl)) {
                return;
            }
            impl->OnSnapshotTaken(snapshot, lastIncludedIndex);
        };
        delegates.onFatalError = [weakImpl, isCurrent](const std::string& reason){
            auto impl = weakImpl.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            if (!isCurrent(*impl)) {
                return;
            }
            impl->Halt(reason);
        };
        std::weak_ptr< Timekeeping::Scheduler > weakScheduler(scheduler);
        delegates.getCurrentTime = [weakScheduler]{
            const auto scheduler = weakScheduler.lock();
            if (scheduler == nullptr) {
                return 0.0;
            }
            return scheduler->GetClock()->GetCurrentTime();
        };
        return delegates;
    }

    void Server::Impl::OnReceiveRequestVote(
        Message&& message,
        int senderInstanceNumber
    ) {
        const auto now = GetCurrentTime();
        const auto termBeforeMessageProcessed = state.persistentStateCache.currentTerm;
        if (
            (leaderId != 0)
            && (
                now - timeOfLastLeaderMessage
                < serverConfiguration.minimumElectionTimeout
            )
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Ignoring vote for server %d for term %" PRIu64 " (we were in term %" PRIu64 "; vote requested before minimum election timeout)",
                senderInstanceNumber,
                message.term,
                termBeforeMessageProcessed
            );
            return;
        }
        if (message.term > state.persistentStateCache.currentTerm) {
            UpdateCurrentTerm(message.term);
            RevertToFollower();
        }
        if (!isVotingMember) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Ignoring vote for server %d for term %" PRIu64 " (we were in term %" PRIu64 ", but non-voting member)",
                senderInstanceNumber,
                message.term,
                termBeforeMessageProcessed
            );
            QueueElectionStateChangeAnnouncement();
            return;
        }
        Message response;
        response.type = Message::Type::RequestVoteResults;
        response.term = state.persistentStateCache.currentTerm;
        response.seq = message.seq;
        if (state.persistentStateCache.currentTerm > message.term) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Rejecting vote for server %d (old term %" PRIu64 " < %" PRIu64 ")",
                senderInstanceNumber,
                message.term,
                state.persistentStateCache.currentTerm
            );
            response.requestVoteResults.voteGranted = false;
        } else if (
            state.persistentStateCache.votedThisTerm
            && (state.persistentStateCache.votedFor != senderInstanceNumber)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Rejecting vote for server %d (already voted for %d for term %" PRIu64 " -- we were in term %" PRIu64 ")",
                senderInstanceNumber,
                state.persistentStateCache.votedFor,
                message.term,
                termBeforeMessageProcessed
            );
            response.requestVoteResults.voteGranted = false;
        } else if (
            !state.IsLogAsUpToDate(
                message.requestVote.lastLogTerm,
                message.requestVote.lastLogIndex
            )
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Rejecting vote for server %d (our log at %zu:%" PRIu64 " is more up to date than theirs at %zu:%" PRIu64 ")",
                senderInstanceNumber,
                state.GetLastIndex(),
                state.GetLastTerm(),
                message.requestVote.lastLogIndex,
                message.requestVote.lastLogTerm
            );
            response.requestVoteResults.voteGranted = false;
        } else {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Voting for server %d for term %" PRIu64 " (we were in term %" PRIu64 ")",
                senderInstanceNumber,
                message.term,
                termBeforeMessageProcessed
            );
            response.requestVoteResults.voteGranted = true;
            state.VoteFor(senderInstanceNumber);
            ResetElectionTimer();
        }
        QueueElectionStateChangeAnnouncement();
        SerializeAndQueueMessageToBeSent(response, senderInstanceNumber);
    }

    void Server::Impl::OnReceiveRequestVoteResults(
        Message&& message,
        int senderInstanceNumber
    ) {
        if (message.term > state.persistentStateCache.currentTerm) {
            UpdateCurrentTerm(message.term);
            RevertToFollower();
            QueueElectionStateChangeAnnouncement();
            return;
        }
        if (
            (role.electionState != IServer::ElectionState::Candidate)
            || (message.term < state.persistentStateCache.currentTerm)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Stale vote from server %d in term %" PRIu64 " ignored",
                senderInstanceNumber,
                message.term
            );
            return;
        }
        auto& voteRetransmitTokens = role.candidate.voteRetransmitTokens;
        const auto voteRetransmitTokensEntry = voteRetransmitTokens.find(senderInstanceNumber);
        if (voteRetransmitTokensEntry == voteRetransmitTokens.end()) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Unexpected vote from server %d in term %" PRIu64 " ignored",
                senderInstanceNumber,
                message.term
            );
            return;
        }
        scheduler->Cancel(voteRetransmitTokensEntry->second);
        (void)voteRetransmitTokens.erase(voteRetransmitTokensEntry);
        if (!message.requestVoteResults.voteGranted) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Server %d refused to vote for us in term %" PRIu64,
                senderInstanceNumber,
                message.term
            );
            return;
        }
        (void)role.candidate.votesForUs.insert(senderInstanceNumber);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Server %d voted for us in term %" PRIu64 " (%zu votes)",
            senderInstanceNumber,
            message.term,
            role.candidate.votesForUs.size()
        );
        if (state.GetEffectiveConfiguration().HasMajority(role.candidate.votesForUs)) {
            AssumeLeadership();
        }
    }

    const IServer::ServerConfiguration& Server::Impl::GetServerConfiguration() {
        return serverConfiguration;
    }

    uint64_t Server::Impl::GetCurrentTerm() {
        return state.persistentStateCache.currentTerm;
    }

    size_t Server::Impl::GetCommitIndex() {
        return state.commitIndex;
    }

    ILog& Server::Impl::GetLog() {
        return *state.log;
    }

    void Server::Impl::SendMessage(
        const std::string& serializedMessage,
        int receiverInstanceNumber
    ) {
        const auto messageToBeSent = std::make_shared< SendMessageEvent >();
        messageToBeSent->serializedMessage = serializedMessage;
        messageToBeSent->receiverInstanceNumber = receiverInstanceNumber;
        AddToEventQueue(std::move(messageToBeSent));
    }

    int Server::Impl::ScheduleRetransmission(
        int instanceId,
        double dueTime
    ) {
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        const auto token = std::make_shared< int >(0);
        *token = scheduler->Schedule(
            [weakImpl, thisGeneration, instanceId, token]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                    || impl->halted
                    || !impl->role.IsLeader()
                ) {
                    return;
                }
                const auto appendersEntry = impl->role.leader.appenders.find(instanceId);
                if (appendersEntry == impl->role.leader.appenders.end()) {
                    return;
                }
                appendersEntry->second->OnRetransmitTimeout(*token, impl->GetCurrentTime());
            },
            dueTime
        );
        return *token;
    }

    void Server::Impl::CancelScheduled(int token) {
        scheduler->Cancel(token);
    }

    void Server::Impl::OnPeerReachabilityChanged(
        int instanceId,
        bool reachable
    ) {
        const auto peerReachabilityEvent = std::make_shared< PeerReachabilityEvent >();
        peerReachabilityEvent->instanceId = instanceId;
        peerReachabilityEvent->reachable = reachable;
        AddToEventQueue(std::move(peerReachabilityEvent));
    }

}
