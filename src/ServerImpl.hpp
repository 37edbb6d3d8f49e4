#pragma once

/**
 * @file ServerImpl.hpp
 *
 * This module contains the declaration of the Accord::Server::Impl structure.
 *
 * © 2019-2020 by Richard Walters
 */

#include "CompletionHandle.hpp"
#include "LogAppender.hpp"
#include "Message.hpp"
#include "PendingRequests.hpp"
#include "RetryCache.hpp"
#include "RoleState.hpp"
#include "ServerState.hpp"
#include "StateMachineUpdater.hpp"
#include "WatchRequests.hpp"

#include <Accord/ILog.hpp>
#include <Accord/IStateMachine.hpp>
#include <Accord/LogEntry.hpp>
#include <Accord/Server.hpp>
#include <AsyncData/MultiProducerSingleConsumerQueue.hpp>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <thread>
#include <vector>

namespace Accord {

    /**
     * This contains the private properties of a Server class instance.
     */
    struct Server::Impl
        : public std::enable_shared_from_this< Impl >
        , public LogAppender::Host
    {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used by the log appenders to publish diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender appenderDiagnosticsSender;

        /**
         * These are used to end the forwarding of diagnostic messages
         * from the components of the server.
         */
        std::vector< SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate > componentDiagnosticsUnsubscribers;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::recursive_mutex mutex;

        /**
         * This indicates whether or not the server is running.
         */
        bool mobilized = false;

        /**
         * This indicates whether or not the server has stopped serving
         * because of a fatal condition.
         */
        bool halted = false;

        /**
         * This is incremented each time the server is mobilized, so that
         * callbacks scheduled in an earlier mobilization are ignored.
         */
        size_t generation = 0;

        /**
         * This is used to generate unique identifiers for event subscribers.
         */
        int nextEventSubscriberId = 0;

        /**
         * These are the current subscriptions to server events.
         */
        std::map< int, EventDelegate > eventSubscribers;

        /**
         * This holds all configuration items for the server.
         */
        IServer::ServerConfiguration serverConfiguration;

        /**
         * This holds the term, vote, commit index, log and configurations.
         */
        ServerState state;

        /**
         * This holds the role of the server and the state of that role.
         */
        RoleState role;

        /**
         * This is the unique identifier of the leader of the current term,
         * or zero if no leader is known.
         */
        int leaderId = 0;

        /**
         * This indicates whether or not the server is a member of its
         * effective configuration, and so may vote and run for election.
         */
        bool isVotingMember = true;

        /**
         * This indicates whether or not the server recently stepped down
         * as leader because it stopped hearing from a majority of the
         * cluster.
         */
        bool lostMajorityHeartbeatsRecently = false;

        /**
         * This is the time, according to the scheduler's clock, that a
         * message was last received from or sent as the leader.
         */
        double timeOfLastLeaderMessage = 0.0;

        /**
         * This is used to pick random election timeouts.
         */
        std::mt19937 rng;

        int electionTimeoutToken = 0;

        int heartbeatTimeoutToken = 0;

        /**
         * These are the tokens of scheduled client request and watch
         * timeouts.
         */
        std::set< int > requestTimeoutTokens;

        /**
         * This is used to schedule every timed action of the server.
         */
        std::shared_ptr< Timekeeping::Scheduler > scheduler;

        /**
         * This is the object to which committed commands are applied.
         */
        std::shared_ptr< IStateMachine > stateMachine;

        /**
         * This remembers the replies to client commands so that retried
         * commands are not carried out twice.
         */
        RetryCache retryCache;

        /**
         * This tracks the client commands appended by the leader and
         * awaiting application.
         */
        PendingRequests pendingRequests;

        /**
         * This tracks the callers waiting for entries to be replicated
         * or for leadership to be confirmed.
         */
        WatchRequests watchRequests;

        /**
         * This applies committed entries to the state machine.
         */
        StateMachineUpdater updater;

        /**
         * This holds events to be published by the event queue worker.
         */
        AsyncData::MultiProducerSingleConsumerQueue<
            std::shared_ptr< IServer::Event >
        > eventQueue;

        std::thread eventQueueWorker;

        std::condition_variable eventQueueWorkerWakeCondition;

        std::mutex eventQueueMutex;

        bool stopEventQueueWorker = false;

        // Methods

        Impl();

        double GetCurrentTime() const;

        /**
         * Return the unique identifiers of every server to which the
         * leader replicates its log.
         */
        std::set< int > GetReplicationTargets() const;

        /**
         * Return the index of the highest log entry known to be replicated
         * on the given server.
         */
        size_t GetMatchIndex(int instanceId) const;

        /**
         * Return the commit index the given server reported most recently.
         */
        size_t GetFollowerCommitIndex(int instanceId) const;

        void ResetElectionTimer();

        void ResetHeartbeatTimer();

        /**
         * Cancel every timed action to do with elections and replication.
         */
        void CancelAllCallbacks();

        /**
         * Schedule a call to the given function at the given time, for as
         * long as the server stays mobilized in this generation.
         *
         * @return
         *     The token of the scheduled call is returned.
         */
        int ScheduleRequestTimeout(
            std::function< void(Impl& impl) > callback,
            double dueTime
        );

        void AddToEventQueue(std::shared_ptr< IServer::Event >&& event);

        void ProcessEventQueue(
            std::unique_lock< decltype(eventQueueMutex) >& lock
        );

        void EventQueueWorker();

        void QueueLeadershipChangeAnnouncement(
            int leaderId,
            uint64_t term
        );

        void QueueElectionStateChangeAnnouncement();

        void QueueConfigAppliedAnnouncement();

        void QueueConfigCommittedAnnouncement(const RaftConfiguration& configuration);

        void QueueSnapshotAnnouncement(
            const Json::Value& snapshot,
            size_t lastIncludedIndex,
            uint64_t lastIncludedTerm
        );

        void SerializeAndQueueMessageToBeSent(
            Message& message,
            int instanceNumber
        );

        void UpdateCurrentTerm(uint64_t newTerm);

        void RevertToFollower();

        void AssumeLeadership();

        void StepUpAsCandidate();

        void SendVoteRequest(int instanceId);

        void StartElection();

        void SendHeartBeats();

        /**
         * Step down as leader if a majority of the cluster has not answered
         * within the maximum election timeout.
         */
        void CheckLostMajority();

        /**
         * Fail every outstanding client request with a NotLeader reply.
         */
        void FailOutstandingRequests();

        /**
         * Stop serving because of a fatal condition.
         *
         * @param[in] reason
         *     This describes the condition.
         */
        void Halt(const std::string& reason);

        /**
         * Bring the set of log appenders in line with the servers to which
         * the leader replicates its log.
         */
        void SyncAppenders();

        void OnEffectiveConfigurationChanged();

        /**
         * Append a new entry holding the given command, in the current term,
         * and replicate it.
         *
         * @return
         *     The index of the new entry is returned.
         */
        size_t AppendCommand(std::shared_ptr< Command > command);

        /**
         * Remove every log entry from the given index on, failing any
         * client requests waiting on them.
         *
         * @param[in] fromIndex
         *     This is the index of the first entry to remove.
         *
         * @return
         *     An indication of whether or not the effective configuration
         *     changed is returned.
         */
        bool RollBackLog(size_t fromIndex);

        void AdvanceCommitIndex(size_t newCommitIndex);

        /**
         * Advance the commit index to the highest entry of the current
         * term which a majority of the effective configuration has.
         */
        void LeaderAdvanceCommitIndex();

        /**
         * Pass along the replication progress of the cluster to the watch
         * requests, and confirm leadership for any waiting on it.
         */
        void UpdateWatches();

        void StartConfigChangeIfNewServersHaveCaughtUp();

        /**
         * Give up on the given configuration change if the servers being
         * added still haven't caught up, so that the joint configuration
         * was never appended.
         *
         * @param[in] completion
         *     This is the completion of the configuration change request.
         */
        void AbandonConfigChange(std::shared_ptr< CompletionHandle > completion);

        /**
         * Append the stable configuration which ends the joint configuration
         * now in effect, if it hasn't been appended already.
         */
        void FinishJointConfiguration();

        Json::Value BuildLogSnapshot(
            const Json::Value& stateMachineSnapshot,
            size_t lastIncludedIndex
        );

        bool GetEntry(
            size_t index,
            LogEntry& entry
        );

        void OnEntryApplied(size_t index);

        void OnConfigurationApplied(const LogEntry& entry);

        void OnSnapshotTaken(
            const Json::Value& stateMachineSnapshot,
            size_t lastIncludedIndex
        );

        StateMachineUpdater::Delegates MakeUpdaterDelegates();

        void OnReceiveRequestVote(
            Message&& message,
            int senderInstanceNumber
        );

        void OnReceiveRequestVoteResults(
            Message&& message,
            int senderInstanceNumber
        );

        void OnReceiveAppendEntries(
            Message&& message,
            int senderInstanceNumber
        );

        void OnReceiveAppendEntriesResults(
            Message&& message,
            int senderInstanceNumber
        );

        void OnReceiveInstallSnapshot(
            Message&& message,
            int senderInstanceNumber
        );

        void OnReceiveInstallSnapshotResults(
            Message&& message,
            int senderInstanceNumber
        );

        /**
         * Give the leader hint a client needs to find the leader.
         */
        ClientReply MakeNotLeaderReply() const;

        bool IsReadyLeader() const;

        std::shared_future< ClientReply > Submit(
            const std::string& clientId,
            uint64_t callId,
            const std::string& content
        );

        std::shared_future< ClientReply > Read(
            const std::string& query,
            bool linearizable
        );

        std::shared_future< ClientReply > Watch(
            size_t index,
            ReplicationLevel level
        );

        std::shared_future< ClientReply > ChangeConfiguration(
            const ClusterConfiguration& newConfiguration
        );

        // LogAppender::Host

        virtual const IServer::ServerConfiguration& GetServerConfiguration() override;
        virtual uint64_t GetCurrentTerm() override;
        virtual size_t GetCommitIndex() override;
        virtual ILog& GetLog() override;
        virtual void SendMessage(
            const std::string& serializedMessage,
            int receiverInstanceNumber
        ) override;
        virtual int ScheduleRetransmission(
            int instanceId,
            double dueTime
        ) override;
        virtual void CancelScheduled(int token) override;
        virtual void OnPeerReachabilityChanged(
            int instanceId,
            bool reachable
        ) override;
    };

}
