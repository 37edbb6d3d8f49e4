#ifndef ACCORD_WATCH_REQUESTS_HPP
#define ACCORD_WATCH_REQUESTS_HPP

/**
 * @file WatchRequests.hpp
 *
 * This module declares the Accord::WatchRequests class.
 *
 * © 2020 by Richard Walters
 */

#include "CompletionHandle.hpp"

#include <Accord/ClientReply.hpp>
#include <Accord/IServer.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>

namespace Accord {

    /**
     * This keeps track of callers waiting for a log index to reach a
     * given level of replication, or for the leadership of the server to
     * be confirmed by a majority of the cluster.  It may be used from
     * any thread.
     */
    class WatchRequests {
        // Types
    public:
        /**
         * This holds how far the log is known to be replicated.
         */
        struct Progress {
            /**
             * This is the highest index stored on a majority of the cluster.
             */
            size_t majorityIndex = 0;

            /**
             * This is the highest index stored on every server of
             * the cluster.
             */
            size_t allIndex = 0;

            /**
             * This is the highest index known committed by a majority
             * of the cluster.
             */
            size_t majorityCommitIndex = 0;

            /**
             * This is the highest index known committed by every server
             * of the cluster.
             */
            size_t allCommitIndex = 0;
        };

        /**
         * This is the type of function used to check whether or not
         * a majority of the cluster has acknowledged the leadership of the
         * server in messages sent at or after the given time.
         */
        using LeadershipCheck = std::function< bool(double since) >;

        // Lifecycle Methods
    public:
        ~WatchRequests() noexcept;
        WatchRequests(const WatchRequests&) = delete;
        WatchRequests(WatchRequests&&) noexcept = delete;
        WatchRequests& operator=(const WatchRequests&) = delete;
        WatchRequests& operator=(WatchRequests&&) noexcept = delete;

        // Public Methods
    public:
        /**
         * This is the default constructor.
         */
        WatchRequests();

        /**
         * Form a new subscription to diagnostic messages published
         * by the tracker.
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
         * Add a caller waiting for the given log index to reach the given
         * level of replication.  If the index has already reached that
         * level, the caller is given its reply right away.
         *
         * @param[in] index
         *     This is the log index to watch.
         *
         * @param[in] level
         *     This is the level of replication to wait for.
         *
         * @param[in] deadline
         *     This is the time at which to give up waiting.
         *
         * @param[in] completion
         *     This represents the caller which is waiting.
         */
        void AddIndexWatch(
            size_t index,
            IServer::ReplicationLevel level,
            double deadline,
            const std::shared_ptr< CompletionHandle >& completion
        );

        /**
         * Add a caller waiting for the leadership of the server in the
         * given term to be confirmed by a majority of the cluster in
         * messages sent at or after the given time.
         *
         * @param[in] term
         *     This is the term in which the server is leader.
         *
         * @param[in] since
         *     This is the earliest time of the messages which may confirm
         *     the leadership.
         *
         * @param[in] deadline
         *     This is the time at which to give up waiting.
         *
         * @param[in] completion
         *     This represents the caller which is waiting.  It is given
         *     a reply only if the leadership can't be confirmed.
         *
         * @param[in] onConfirmed
         *     This is the function to call once the leadership is confirmed.
         */
        void AddLeadershipWatch(
            uint64_t term,
            double since,
            double deadline,
            const std::shared_ptr< CompletionHandle >& completion,
            std::function< void() > onConfirmed
        );

        /**
         * Let the tracker know how far the log is now known to
         * be replicated, completing the index watches which are satisfied.
         *
         * @param[in] progress
         *     This holds how far the log is known to be replicated.
         */
        void UpdateProgress(const Progress& progress);

        /**
         * Complete the leadership watches of the given term which are
         * confirmed by the given check.
         *
         * @param[in] term
         *     This is the term in which the server is leader.
         *
         * @param[in] isConfirmedSince
         *     This is used to check whether or not the leadership has been
         *     confirmed in messages sent at or after a given time.
         */
        void ConfirmLeadership(
            uint64_t term,
            const LeadershipCheck& isConfirmedSince
        );

        /**
         * Give a Timeout reply to every caller whose deadline has passed.
         *
         * @param[in] now
         *     This is the current time.
         */
        void ExpireDeadlines(double now);

        /**
         * Give the given reply to every caller waiting.
         *
         * @param[in] reply
         *     This is the reply to give to every caller.
         */
        void FailAll(const ClientReply& reply);

        /**
         * Return the number of callers waiting.
         *
         * @return
         *     The number of callers waiting is returned.
         */
        size_t GetSize();

        /**
         * Return an indication of whether or not any caller is waiting
         * for leadership to be confirmed.
         *
         * @return
         *     An indication of whether or not any caller is waiting
         *     for leadership to be confirmed is returned.
         */
        bool HasLeadershipWatches();

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
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* ACCORD_WATCH_REQUESTS_HPP */
