#ifndef ACCORD_PENDING_REQUESTS_HPP
#define ACCORD_PENDING_REQUESTS_HPP

/**
 * @file PendingRequests.hpp
 *
 * This module declares the Accord::PendingRequests class.
 *
 * © 2020 by Richard Walters
 */

#include "RetryCache.hpp"

#include <Accord/ClientReply.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Accord {

    /**
     * This keeps track of the client commands which the leader has
     * appended to its log and which are awaiting being applied to the
     * state machine.  Each is keyed by the index of its log entry.
     */
    class PendingRequests {
        // Public Methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] retryCache
         *     This is the cache which holds the entries of the pending
         *     requests, through which the requests are completed.
         */
        explicit PendingRequests(RetryCache& retryCache);

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
         * Start tracking the given request.
         *
         * @param[in] index
         *     This is the index of the log entry carrying the request.
         *
         * @param[in] cacheEntry
         *     This is the retry cache entry of the request.
         */
        void Add(
            size_t index,
            const std::shared_ptr< RetryCache::CacheEntry >& cacheEntry
        );

        /**
         * Handle the log entry at the given index having been applied.
         * If the request tracked at that index is the one which was
         * applied, it is completed with the given reply.  Otherwise, the
         * tracked request lost its place in the log, and is failed.
         *
         * @param[in] index
         *     This is the index of the log entry which was applied.
         *
         * @param[in] appliedInvocationId
         *     This identifies the request carried by the log entry which
         *     was applied.
         *
         * @param[in] reply
         *     This is the reply to the request which was applied.
         *
         * @param[in] now
         *     This is the current time.
         *
         * @return
         *     An indication of whether or not a request was tracked at the
         *     given index is returned.
         */
        bool Resolve(
            size_t index,
            const ClientInvocationId& appliedInvocationId,
            const ClientReply& reply,
            double now
        );

        /**
         * Fail every request tracked at or after the given index.
         *
         * @param[in] fromIndex
         *     This is the first index at which to fail requests.
         *
         * @param[in] reply
         *     This is the reply to give to the requests.
         *
         * @param[in] now
         *     This is the current time.
         */
        void FailFrom(
            size_t fromIndex,
            const ClientReply& reply,
            double now
        );

        /**
         * Fail every request tracked.
         *
         * @param[in] reply
         *     This is the reply to give to the requests.
         *
         * @param[in] now
         *     This is the current time.
         */
        void FailAll(
            const ClientReply& reply,
            double now
        );

        /**
         * Return the number of requests tracked.
         *
         * @return
         *     The number of requests tracked is returned.
         */
        size_t GetSize();

        // Private properties
    private:
        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender_;

        /**
         * This is the cache which holds the entries of the pending requests.
         */
        RetryCache& retryCache_;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::mutex mutex_;

        /**
         * These are the requests being tracked, keyed by log index.
         */
        std::map< size_t, std::shared_ptr< RetryCache::CacheEntry > > requests_;
    };

}

#endif /* ACCORD_PENDING_REQUESTS_HPP */
