#ifndef ACCORD_STATE_MACHINE_UPDATER_HPP
#define ACCORD_STATE_MACHINE_UPDATER_HPP

/**
 * @file StateMachineUpdater.hpp
 *
 * This module declares the Accord::StateMachineUpdater class.
 *
 * © 2020 by Richard Walters
 */

#include "CompletionHandle.hpp"
#include "PendingRequests.hpp"
#include "RetryCache.hpp"

#include <Accord/IStateMachine.hpp>
#include <Accord/LogEntry.hpp>
#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Accord {

    /**
     * This applies committed log entries to the state machine, one at a
     * time and strictly in log order, on a worker thread of its own.
     * Read-only queries are evaluated on the same thread, ordered with
     * the entries applied.
     */
    class StateMachineUpdater {
        // Types
    public:
        /**
         * These are the functions the updater calls to reach the server.
         * They are called from the worker thread, without any lock of the
         * updater held.
         */
        struct Delegates {
            /**
             * This is used to fetch the log entry at the given index.
             * It returns false if the entry is no longer in the log.
             */
            std::function< bool(size_t index, LogEntry& entry) > getEntry;

            /**
             * This is called whenever a configuration entry is applied.
             */
            std::function< void(const LogEntry& entry) > onConfigurationApplied;

            /**
             * This is called after each entry is applied.
             */
            std::function< void(size_t index) > onApplied;

            /**
             * This is called with each snapshot the updater takes of the
             * state machine, and the index of the last entry it covers.
             */
            std::function< void(const Json::Value& snapshot, size_t lastIncludedIndex) > onSnapshotTaken;

            /**
             * This is called if the state machine fails to apply an entry.
             * The updater stops applying entries afterwards.
             */
            std::function< void(const std::string& reason) > onFatalError;

            /**
             * This is used to get the current time.
             */
            std::function< double() > getCurrentTime;
        };

        // Lifecycle Methods
    public:
        ~StateMachineUpdater() noexcept;
        StateMachineUpdater(const StateMachineUpdater&) = delete;
        StateMachineUpdater(StateMachineUpdater&&) noexcept = delete;
        StateMachineUpdater& operator=(const StateMachineUpdater&) = delete;
        StateMachineUpdater& operator=(StateMachineUpdater&&) noexcept = delete;

        // Public Methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] retryCache
         *     This is where the replies of applied client commands
         *     are recorded.
         *
         * @param[in] pendingRequests
         *     This tracks the client commands the leader is waiting
         *     to have applied.
         */
        StateMachineUpdater(
            RetryCache& retryCache,
            PendingRequests& pendingRequests
        );

        /**
         * Form a new subscription to diagnostic messages published
         * by the updater.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * Start the worker thread.
         *
         * @param[in] stateMachine
         *     This is the state machine to which to apply entries.
         *
         * @param[in] delegates
         *     These are the functions the updater calls to reach the server.
         *
         * @param[in] lastAppliedIndex
         *     This is the index of the last entry already reflected
         *     in the state machine.
         *
         * @param[in] autoSnapshotThreshold
         *     If not zero, this is the number of entries applied since
         *     the last snapshot at which to take a new snapshot.
         */
        void Start(
            std::shared_ptr< IStateMachine > stateMachine,
            const Delegates& delegates,
            size_t lastAppliedIndex,
            size_t autoSnapshotThreshold
        );

        /**
         * Stop the worker thread and wait for it to finish.  Queries
         * not yet evaluated are given a NotLeader reply.  If called from
         * the worker thread itself, the thread is only told to stop.
         */
        void Stop();

        /**
         * Let the updater know that the commit index has advanced.
         *
         * @param[in] commitIndex
         *     This is the new commit index.
         */
        void NotifyCommitIndex(size_t commitIndex);

        /**
         * Have the state machine replace its state with the given snapshot.
         * Entries covered by the snapshot are not applied.
         *
         * @param[in] snapshot
         *     This is the state machine snapshot to install.
         *
         * @param[in] lastIncludedIndex
         *     This is the index of the last entry covered by the snapshot.
         */
        void InstallSnapshot(
            const Json::Value& snapshot,
            size_t lastIncludedIndex
        );

        /**
         * Evaluate the given query once every entry up to the given
         * index has been applied.
         *
         * @param[in] minAppliedIndex
         *     This is the index of the last entry to apply before
         *     evaluating the query.
         *
         * @param[in] query
         *     This is the query to evaluate.
         *
         * @param[in] completion
         *     This is used to give the reply to the query.
         */
        void SubmitRead(
            size_t minAppliedIndex,
            const std::string& query,
            const std::shared_ptr< CompletionHandle >& completion
        );

        /**
         * Return the index of the last entry applied.
         *
         * @return
         *     The index of the last entry applied is returned.
         */
        size_t GetLastAppliedIndex();

        /**
         * Return the index of the last entry covered by the latest
         * snapshot taken or installed.
         *
         * @return
         *     The index of the last entry covered by the latest
         *     snapshot is returned.
         */
        size_t GetLastSnapshotIndex();

        /**
         * Wait until the entry at the given index has been applied.
         *
         * @param[in] index
         *     This is the index of the entry to wait for.
         *
         * @param[in] timeout
         *     This is the longest time, in seconds, to wait.
         *
         * @return
         *     An indication of whether or not the entry was applied
         *     in time is returned.
         */
        bool AwaitApplied(
            size_t index,
            double timeout
        );

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;
    };

}

#endif /* ACCORD_STATE_MACHINE_UPDATER_HPP */
