#ifndef ACCORD_RETRY_CACHE_HPP
#define ACCORD_RETRY_CACHE_HPP

/**
 * @file RetryCache.hpp
 *
 * This module declares the Accord::RetryCache class.
 *
 * © 2020 by Richard Walters
 */

#include "CompletionHandle.hpp"

#include <Accord/ClientReply.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>

namespace Accord {

    /**
     * This remembers the outcome of client requests, keyed by the identity
     * of each request, so that a request retried by a client is carried
     * out at most once.  It may be used from any thread.
     */
    class RetryCache {
        // Types
    public:
        /**
         * This holds what is known about one client request.
         */
        struct CacheEntry {
            /**
             * These are the stages through which a cached request passes.
             */
            enum class State {
                /**
                 * The request is being carried out.
                 */
                Pending,

                /**
                 * The request was carried out, and the reply is cached.
                 */
                Completed,

                /**
                 * The request was abandoned before it could be carried out.
                 * A retry of the request will carry it out anew.
                 */
                Failed,
            };

            ClientInvocationId invocationId;
            State state = State::Pending;

            /**
             * This is the reply given for the request, once it
             * is no longer pending.
             */
            ClientReply reply;

            /**
             * This is the time at which the request was completed
             * or failed.
             */
            double completionTime = 0.0;

            /**
             * These are the callers waiting for the request to be
             * completed or failed.
             */
            std::vector< std::shared_ptr< CompletionHandle > > waiters;
        };

        /**
         * This is the outcome of looking up a request in the cache.
         */
        struct QueryResult {
            /**
             * This is the cache entry for the request.
             */
            std::shared_ptr< CacheEntry > entry;

            /**
             * This indicates whether or not the entry was created by
             * the lookup, meaning the request should now be carried out.
             */
            bool isNew = false;
        };

        // Lifecycle Methods
    public:
        ~RetryCache() noexcept;
        RetryCache(const RetryCache&) = delete;
        RetryCache(RetryCache&&) noexcept = delete;
        RetryCache& operator=(const RetryCache&) = delete;
        RetryCache& operator=(RetryCache&&) noexcept = delete;

        // Public Methods
    public:
        /**
         * This is the default constructor.
         */
        RetryCache();

        /**
         * Form a new subscription to diagnostic messages published
         * by the cache.
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
         * Set how long, in seconds, completed requests are remembered,
         * and how many completed requests are remembered at most.
         *
         * @param[in] expiryTime
         *     This is how long to remember completed requests.
         *
         * @param[in] maximumSize
         *     This is the number of completed requests beyond which
         *     the oldest are forgotten.
         */
        void SetLimits(
            double expiryTime,
            size_t maximumSize
        );

        /**
         * Look up the given request, creating a pending entry for it if
         * it isn't cached or if the cached entry was failed.  Creation
         * and lookup are a single atomic step, so that only one caller
         * learns that the request is new.
         *
         * @param[in] invocationId
         *     This identifies the request to look up.
         *
         * @return
         *     The cache entry for the request is returned, along with an
         *     indication of whether or not it was created by this call.
         */
        QueryResult QueryOrCreate(const ClientInvocationId& invocationId);

        /**
         * Look up the given request, creating a pending entry for it if
         * it isn't cached.  Failed entries are returned as they are.
         *
         * @param[in] invocationId
         *     This identifies the request to look up.
         *
         * @return
         *     The cache entry for the request is returned.
         */
        std::shared_ptr< CacheEntry > GetOrCreateEntry(const ClientInvocationId& invocationId);

        /**
         * Look up the given request.
         *
         * @param[in] invocationId
         *     This identifies the request to look up.
         *
         * @return
         *     The cache entry for the request is returned, or nullptr
         *     if the request isn't cached.
         */
        std::shared_ptr< CacheEntry > GetIfPresent(const ClientInvocationId& invocationId);

        /**
         * Return the stage of the given cache entry.
         *
         * @param[in] entry
         *     This is the cache entry to examine.
         *
         * @return
         *     The stage of the given cache entry is returned.
         */
        CacheEntry::State GetState(const std::shared_ptr< CacheEntry >& entry);

        /**
         * Add the given caller to those waiting on the given cache entry.
         * If the entry is no longer pending, the caller is given its
         * reply right away.
         *
         * @param[in] entry
         *     This is the cache entry on which to wait.
         *
         * @param[in] waiter
         *     This represents the caller which is waiting.
         */
        void AddWaiter(
            const std::shared_ptr< CacheEntry >& entry,
            const std::shared_ptr< CompletionHandle >& waiter
        );

        /**
         * Record the reply to the request of the given cache entry,
         * and give it to every caller waiting on the entry.  This has no
         * effect on an entry which was already completed.
         *
         * @param[in] entry
         *     This is the cache entry of the request which was carried out.
         *
         * @param[in] reply
         *     This is the reply to the request.
         *
         * @param[in] now
         *     This is the current time.
         */
        void Complete(
            const std::shared_ptr< CacheEntry >& entry,
            const ClientReply& reply,
            double now
        );

        /**
         * Mark the given pending cache entry as failed, and give the
         * given reply to every caller waiting on the entry.
         *
         * @param[in] entry
         *     This is the cache entry of the request which was abandoned.
         *
         * @param[in] reply
         *     This is the reply to give to callers waiting on the entry.
         *
         * @param[in] now
         *     This is the current time.
         */
        void Fail(
            const std::shared_ptr< CacheEntry >& entry,
            const ClientReply& reply,
            double now
        );

        /**
         * Let the cache know that the log entry carrying the given
         * request was removed before it was committed.  If the request
         * is still pending, it is failed, so that a retry carries it
         * out anew.
         *
         * @param[in] invocationId
         *     This identifies the request whose log entry was removed.
         *
         * @param[in] leaderId
         *     This is the identifier of the server believed to be the
         *     leader, given to waiting callers as a hint.
         *
         * @param[in] now
         *     This is the current time.
         */
        void NotifyTruncatedEntry(
            const ClientInvocationId& invocationId,
            int leaderId,
            double now
        );

        /**
         * Forget completed and failed requests which are older than
         * the expiry time, and then the oldest ones beyond the maximum
         * size.  Pending requests are never forgotten.
         *
         * @param[in] now
         *     This is the current time.
         *
         * @return
         *     The number of requests forgotten is returned.
         */
        size_t EvictExpired(double now);

        /**
         * Return the number of requests in the cache.
         *
         * @return
         *     The number of requests in the cache is returned.
         */
        size_t GetSize();

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

#endif /* ACCORD_RETRY_CACHE_HPP */
