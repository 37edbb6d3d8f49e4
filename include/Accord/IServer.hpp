#ifndef ACCORD_I_SERVER_HPP
#define ACCORD_I_SERVER_HPP

/**
 * @file IServer.hpp
 *
 * This module declares the Accord::IServer interface.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ClientReply.hpp"
#include "ClusterConfiguration.hpp"
#include "ILog.hpp"
#include "IPersistentState.hpp"
#include "IStateMachine.hpp"
#include "LogEntry.hpp"
#include "RaftConfiguration.hpp"

#include <functional>
#include <future>
#include <Json/Value.hpp>
#include <memory>
#include <ostream>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <Timekeeping/Scheduler.hpp>

namespace Accord {

    /**
     * This is the interface to the Server component, which represents one
     * member of the server cluster.
     */
    class IServer {
        // Types
    public:
        /**
         * This is used to indicate whether the server is a currently a leader,
         * candidate, or follower in the current election term of the cluster.
         */
        enum class ElectionState {
            /**
             * In this state, the server is neither a leader, or is running for
             * election in the current term.  It is awaiting heartbeat messages
             * from the leader, and if none is received before the election
             * timeout, it will start a new election.
             */
            Follower,

            /**
             * In this state, the server is running for election in the current
             * term, awaiting vote responses.  If it receives a majority vote,
             * it will immediately become the leader.  If it receives a
             * heartbeat, it will immediately become a follower.  Otherwise, it
             * will start a new election once the election timeout occurs.
             */
            Candidate,

            /**
             * In this state, the server is the leader of the cluster in the
             * current term, and will send out heartbeats to all the other
             * servers.  It reverts to a follower if it receives a heartbeat or
             * vote request in a newer term.
             */
            Leader,
        };

        /**
         * These are the ways in which the delay before retransmitting
         * an unanswered replication request grows with each attempt.
         */
        enum class RetryPolicy {
            /**
             * Every retransmission waits the RPC timeout.
             */
            Fixed,

            /**
             * The wait grows by the RPC timeout with each attempt.
             */
            Linear,

            /**
             * The wait doubles with each attempt.
             */
            Exponential,
        };

        /**
         * These are the levels of replication for which a caller may
         * watch a log index.
         */
        enum class ReplicationLevel {
            /**
             * The entry is stored on a majority of the cluster.
             */
            Majority,

            /**
             * The entry is stored on every server of the cluster.
             */
            All,

            /**
             * A majority of the cluster knows the entry is committed.
             */
            MajorityCommitted,

            /**
             * Every server of the cluster knows the entry is committed.
             */
            AllCommitted,
        };

        /**
         * This holds the properties which make up the configuration for just
         * this server and not any other servers in the cluster.
         */
        struct ServerConfiguration {
            /**
             * This is the unique identifier of this server, amongst all the
             * servers in the cluster.
             */
            int selfInstanceId = 0;

            /**
             * This is the lower bound of the range of time, starting from the
             * last time the server either started or received a message from
             * the cluster leader, within which to trigger an election.
             */
            double minimumElectionTimeout = 0.15;

            /**
             * This is the upper bound of the range of time, starting from the
             * last time the server either started or received a message from
             * the cluster leader, within which to trigger an election.
             */
            double maximumElectionTimeout = 0.3;

            /**
             * This is the amount of time that the leader will not send any
             * messages before it decides to send out a "heartbeat" message
             * to all followers in order to maintain leadership.
             *
             * It should be greater than the RPC timeout and less than
             * the minimum election timeout.
             */
            double heartbeatInterval = 0.075;

            /**
             * This is the maximum amount of time to wait for a response to an
             * RPC request, before retransmitting the request.
             */
            double rpcTimeout = 0.015;

            /**
             * This is the maximum amount of time to wait for a response to an
             * InstallSnapshot request, before retransmitting the request.
             */
            double installSnapshotTimeout = 0.5;

            /**
             * This selects how the delay before retransmitting an unanswered
             * AppendEntries request grows with each attempt.
             */
            RetryPolicy appenderRetryPolicy = RetryPolicy::Exponential;

            /**
             * This is the longest delay before retransmitting an unanswered
             * AppendEntries request.
             */
            double maximumRetransmitDelay = 0.12;

            /**
             * If not zero, this is the number of entries a follower may lag
             * behind the leader beyond which the leader sends the follower
             * its snapshot rather than entries, if the snapshot covers
             * entries the follower lacks.  If zero, the snapshot is sent only
             * when the entries the follower lacks are no longer kept.
             */
            size_t snapshotTransferThreshold = 0;

            /**
             * This indicates whether or not the leader steps down once it
             * hasn't heard from a majority of the cluster within the
             * maximum election timeout.
             */
            bool stepDownOnLostMajority = false;

            /**
             * If not zero, this is the number of entries applied since the
             * last snapshot at which the state machine is snapshotted and
             * the log compacted.
             */
            size_t autoSnapshotThreshold = 0;

            /**
             * This is how long a submitted command or read may wait for
             * its reply before the caller is given a Timeout reply.
             */
            double clientRequestTimeout = 1.0;

            /**
             * This is how long a watch may wait before the caller is given
             * a Timeout reply.
             */
            double watchTimeout = 1.0;

            /**
             * This is how long the leader waits for the servers being added
             * to the cluster to catch up, before giving up on the
             * configuration change and giving the caller a Timeout reply.
             */
            double newServerCatchUpTimeout = 2.0;

            /**
             * This is how long, in seconds, the retry cache remembers
             * completed requests.
             */
            double retryCacheExpiryTime = 60.0;

            /**
             * This is the number of completed requests beyond which the retry
             * cache forgets the oldest.
             */
            size_t retryCacheMaximumSize = 4096;

            /**
             * These are the minimum levels of the diagnostic messages of each
             * component which are passed along through the server.
             */
            size_t logAppenderDiagnosticsLevel = 0;
            size_t stateMachineUpdaterDiagnosticsLevel = 0;
            size_t retryCacheDiagnosticsLevel = 0;
            size_t pendingRequestsDiagnosticsLevel = 0;
            size_t watchRequestsDiagnosticsLevel = 0;
        };

        /**
         * This is the base type of any event published by the server.
         * All events will subclass this type and set the appropriate value
         * for the type field.
         */
        struct Event {
            /**
             * This is used to identify the subclass of the concrete event.
             */
            const enum class Type {
                /**
                 * This indicates the event is a request that a message be sent
                 * to another server in the cluster.
                 */
                SendMessage,

                /**
                 * This indicates the event announces leadership
                 * changes in the server cluster.
                 */
                LeadershipChange,

                /**
                 * This indicates the event announces the server's
                 * election state changes.
                 */
                ElectionState,

                /**
                 * This indicates the event announces that the configuration
                 * in effect at the server has changed, because a
                 * configuration entry was added to or removed from its log.
                 */
                ApplyConfiguration,

                /**
                 * This indicates the event announces that a cluster
                 * configuration has been committed by the cluster.
                 */
                CommitConfiguration,

                /**
                 * This indicates the event announces that the server has
                 * received a message installing a snapshot to set the server's
                 * state.
                 */
                SnapshotInstalled,

                /**
                 * This indicates the event announces that the leader has
                 * stopped or started hearing from another server.
                 */
                PeerReachability,

                /**
                 * This indicates the event announces that the server
                 * has stopped serving because of a fatal condition.
                 */
                Halted,
            } type;

            /**
             * This is the constructor of the event.
             *
             * @param[in] type
             *     This is used to identify the subclass of the concrete event.
             */
            explicit Event(Type type) : type(type) {}

            virtual ~Event() = default;
        };

        /**
         * This is an event published by the server.  It requests that a
         * message be sent to another server in the cluster.
         */
        struct SendMessageEvent : public Event {
            /**
             * This is the serialized message to send.
             */
            std::string serializedMessage;

            /**
             * This is the unique identifier of the server to whom to send the
             * message.
             */
            int receiverInstanceNumber = 0;

            /**
             * This is the default constructor.
             */
            SendMessageEvent()
                : Event(Type::SendMessage)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces leadership
         * changes in the server cluster.
         */
        struct LeadershipChangeEvent : public Event {
            /**
             * This is the unique identifier of the server which has become the
             * leader of the cluster.
             */
            int leaderId = 0;

            /**
             * This is the generation number of the server cluster leadership,
             * which is incremented whenever a new election is started.
             */
            uint64_t term = 0;

            /**
             * This is the default constructor.
             */
            LeadershipChangeEvent()
                : Event(Type::LeadershipChange)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces the server's
         * election state changes.
         */
        struct ElectionStateEvent : public Event {
            /**
             * This is the generation number of the server cluster leadership,
             * which is incremented whenever a new election is started.
             */
            uint64_t term = 0;

            /**
             * This indicates whether the server is currently a follower,
             * candidate, or leader.
             */
            ElectionState electionState = ElectionState::Follower;

            /**
             * This indicates whether or not the server voted for a candidate
             * in this term.
             */
            bool didVote = false;

            /**
             * This is the unique identifier of the server for which this
             * server voted in this term, if a vote was indeed cast.  It will
             * be zero if the server did not vote for a candidate in this term.
             */
            int votedFor = 0;

            /**
             * This is the default constructor.
             */
            ElectionStateEvent()
                : Event(Type::ElectionState)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces that the
         * configuration in effect at the server has changed.
         */
        struct ApplyConfigurationEvent : public Event {
            /**
             * This is the configuration now in effect at the server.
             */
            RaftConfiguration configuration;

            /**
             * This is the default constructor.
             */
            ApplyConfigurationEvent()
                : Event(Type::ApplyConfiguration)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces that a
         * cluster configuration has been committed by the cluster.
         */
        struct CommitConfigurationEvent : public Event {
            /**
             * This is the cluster configuration committed by the cluster.
             */
            RaftConfiguration configuration;

            /**
             * This is the index of the log at the point where the cluster
             * configuration was committed.
             */
            size_t logIndex = 0;

            /**
             * This is the default constructor.
             */
            CommitConfigurationEvent()
                : Event(Type::CommitConfiguration)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces that the
         * server has received a message installing a snapshot to set the
         * server's state.
         */
        struct SnapshotInstalledEvent : public Event {
            /**
             * This contains a complete copy of the server state, built from
             * the first log entry up to and including the entry at the given
             * last included index.
             */
            Json::Value snapshot;

            /**
             * This is the index of the last log entry that was used to
             * assemble the snapshot.
             */
            size_t lastIncludedIndex = 0;

            /**
             * This is the term of the last log entry that was used to
             * assemble the snapshot.
             */
            uint64_t lastIncludedTerm = 0;

            /**
             * This is the default constructor.
             */
            SnapshotInstalledEvent()
                : Event(Type::SnapshotInstalled)
            {
            }
        };

        /**
         * This is an event published by the leader.  It announces that the
         * leader has stopped or started hearing from another server.
         */
        struct PeerReachabilityEvent : public Event {
            /**
             * This is the unique identifier of the other server.
             */
            int instanceId = 0;

            /**
             * This indicates whether or not the other server is answering.
             */
            bool reachable = true;

            /**
             * This is the default constructor.
             */
            PeerReachabilityEvent()
                : Event(Type::PeerReachability)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces that the
         * server has stopped serving because of a fatal condition.
         */
        struct HaltedEvent : public Event {
            /**
             * This describes the condition which stopped the server.
             */
            std::string reason;

            /**
             * This is the default constructor.
             */
            HaltedEvent()
                : Event(Type::Halted)
            {
            }
        };

        /**
         * Declare the type of delegate used to deliver events published by the
         * server.
         *
         * @param[in] baseEvent
         *     This is a reference to the base of the event that was published.
         *     The delegate should look at the event's type and downcast
         *     the reference to the matching subtype for more details.
         */
        using EventDelegate = std::function<
            void(
                const Accord::IServer::Event& baseEvent
            )
        >;

        /**
         * Declare the type of delegate returned when a subscriber subscribes
         * to server events.  When called, this delegate cancels the
         * subscription.
         */
        using EventsUnsubscribeDelegate = std::function< void() >;

        // Lifecycle Methods
    public:
        virtual ~IServer() = default;

        // Methods
    public:
        /**
         * Subscribe to events published by the server.
         *
         * @param[in] eventDelegate
         *     This is the delegate to be called whenever an event
         *     is published by the server.
         *
         * @return
         *     A delegate that can be called to cancel the subscription
         *     is returned.
         */
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) = 0;

        /**
         * This method starts the server.  The persistent state is loaded
         * first, and then the log is checked.  If the log is found to be
         * unusable, the server halts.
         *
         * @param[in] logKeeper
         *     This is the object which is responsible for keeping
         *     the actual log and making it persistent.
         *
         * @param[in] persistentStateKeeper
         *     This is the object which is responsible for keeping
         *     the server state variables which need to be persistent.
         *
         * @param[in] stateMachine
         *     This is the object to which committed commands are applied.
         *
         * @param[in] scheduler
         *     This is used to schedule every timed action of the server.
         *
         * @param[in] clusterConfiguration
         *     This holds the configuration items for the cluster, in effect
         *     before any configuration entry in the log.
         *
         * @param[in] serverConfiguration
         *     This holds the configuration items for the server.
         *
         * @return
         *     An indication of whether or not the server started
         *     is returned.
         */
        virtual bool Mobilize(
            std::shared_ptr< ILog > logKeeper,
            std::shared_ptr< IPersistentState > persistentStateKeeper,
            std::shared_ptr< IStateMachine > stateMachine,
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const ClusterConfiguration& clusterConfiguration,
            const ServerConfiguration& serverConfiguration
        ) = 0;

        /**
         * This method stops the server.  Every outstanding client request
         * is given a NotLeader reply.
         */
        virtual void Demobilize() = 0;

        /**
         * This method is called whenever the server receives a message
         * from another server in the cluster.
         *
         * @param[in] serializedMessage
         *     This is the serialized message received from another server
         *     in the cluster.
         *
         * @param[in] senderInstanceNumber
         *     This is the unique identifier of the server that sent the
         *     message.
         */
        virtual void ReceiveMessage(
            const std::string& serializedMessage,
            int senderInstanceNumber
        ) = 0;

        /**
         * This method returns an indication of whether the server is currently
         * the leader, a candidate, or a follower in the current term of the
         * cluster.
         *
         * @return
         *     An indication of whether the server is currently the leader,
         *     a candidate, or a follower in the current term of the cluster
         *     is returned.
         */
        virtual ElectionState GetElectionState() = 0;

        /**
         * Return the unique identifier of the server believed to be the
         * leader of the cluster in the current term.
         *
         * @return
         *     The unique identifier of the cluster leader is returned,
         *     or zero if no leader is known in the current term.
         */
        virtual int GetClusterLeaderId() = 0;

        /**
         * Submit a command from a client to be replicated and applied to
         * the state machine.  A command retried with the same client and
         * call identifiers is carried out only once, and every attempt is
         * given the same reply.
         *
         * @param[in] clientId
         *     This identifies the client submitting the command.
         *
         * @param[in] callId
         *     This distinguishes the command from every other command
         *     submitted by the same client.
         *
         * @param[in] content
         *     This is the command to apply to the state machine.
         *
         * @return
         *     The future reply to the command is returned.
         */
        virtual std::shared_future< ClientReply > Submit(
            const std::string& clientId,
            uint64_t callId,
            const std::string& content
        ) = 0;

        /**
         * Evaluate a read-only query against the state machine.
         *
         * @param[in] query
         *     This is the query to evaluate.
         *
         * @param[in] linearizable
         *     If true, the query is evaluated only by the leader, once it
         *     has confirmed its leadership and applied every command
         *     committed before the query was made.  Otherwise the query is
         *     evaluated against whatever state the server has.
         *
         * @return
         *     The future reply to the query is returned.
         */
        virtual std::shared_future< ClientReply > Read(
            const std::string& query,
            bool linearizable
        ) = 0;

        /**
         * Wait for the log entry at the given index to reach the given
         * level of replication.
         *
         * @param[in] index
         *     This is the index of the log entry to watch.
         *
         * @param[in] level
         *     This is the level of replication to wait for.
         *
         * @return
         *     The future reply to the watch is returned.
         */
        virtual std::shared_future< ClientReply > Watch(
            size_t index,
            ReplicationLevel level
        ) = 0;

        /**
         * Begin the process of reconfiguring the server cluster.  The server
         * is expected to start sending log entries to the union of servers in
         * both the current and new configurations.  Once all "new servers"
         * have "caught up", the server will go through the joint configuration
         * process to transition to the new configuration.
         *
         * @param[in] newConfiguration
         *     This represents the cluster shape to which we want to
         *     transition.
         *
         * @return
         *     The future reply to the request is returned.  It is given
         *     once the new configuration is committed and applied.
         */
        virtual std::shared_future< ClientReply > ChangeConfiguration(
            const ClusterConfiguration& newConfiguration
        ) = 0;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Accord::IServer::ElectionState class.
     *
     * @param[in] electionState
     *     This is the election state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     election state value.
     */
    void PrintTo(
        const Accord::IServer::ElectionState& electionState,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Accord::ClientReply::Status class.
     *
     * @param[in] status
     *     This is the client reply status value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     client reply status value.
     */
    void PrintTo(
        const Accord::ClientReply::Status& status,
        std::ostream* os
    );

}

#endif /* ACCORD_I_SERVER_HPP */
