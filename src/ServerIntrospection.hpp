#ifndef ACCORD_SERVER_INTROSPECTION_HPP
#define ACCORD_SERVER_INTROSPECTION_HPP

/**
 * @file ServerIntrospection.hpp
 *
 * This module declares the Accord::ServerIntrospection structure.
 *
 * © 2020 by Richard Walters
 */

#include "RetryCache.hpp"

#include <Accord/RaftConfiguration.hpp>
#include <Accord/Server.hpp>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace Accord {

    /**
     * This gives access to the internal state of a server, for use
     * only by tests of the server.  It is not part of the public
     * interface of the library.
     */
    struct ServerIntrospection {
        // Public Methods

        /**
         * This is the constructor of the structure.
         *
         * @param[in] server
         *     This is the server whose state to examine.
         */
        explicit ServerIntrospection(Server& server);

        uint64_t GetCurrentTerm();

        size_t GetCommitIndex();

        size_t GetLastAppliedIndex();

        size_t GetLastIndex();

        /**
         * Return the term of the log entry at the given index, or zero
         * if the log has no such entry.
         */
        uint64_t GetLogTerm(size_t index);

        /**
         * Return the configuration which governs elections and commitment
         * at the moment, which may not yet be committed.
         */
        RaftConfiguration GetEffectiveConfiguration();

        /**
         * Return the last configuration applied by the server.
         */
        RaftConfiguration GetCommittedConfiguration();

        bool IsVotingMember();

        size_t GetNextIndex(int instanceId);

        size_t GetMatchIndex(int instanceId);

        size_t GetRetryCacheSize();

        /**
         * Look up the stage of the given client request in the retry cache.
         *
         * @param[in] clientId
         *     This identifies the client which made the request.
         *
         * @param[in] callId
         *     This identifies the request among those of the client.
         *
         * @param[out] state
         *     This is where to store the stage of the request.
         *
         * @return
         *     An indication of whether or not the request is in the
         *     retry cache is returned.
         */
        bool GetRetryCacheEntryState(
            const std::string& clientId,
            uint64_t callId,
            RetryCache::CacheEntry::State& state
        );

        /**
         * Return the last index included by the latest snapshot of the
         * state machine, whether taken or installed.
         */
        size_t GetLatestSnapshotIndex();

        bool LostMajorityHeartbeatsRecently();

        size_t GetNumPendingRequests();

        bool IsHalted();

        /**
         * Tell whether the server is a leader which has applied the entry
         * it appended upon taking office, and so serves client requests.
         */
        bool IsLeaderReady();

        /**
         * Reset the outstanding requests and backoff of every log appender
         * of the leader, and resume replication at once.
         */
        void RestartAppenders();

        /**
         * Wait for the state machine to have applied the entry at the given
         * index.
         *
         * @param[in] index
         *     This is the index of the entry to wait for.
         *
         * @param[in] timeout
         *     This is the longest time, in seconds, to wait.
         *
         * @return
         *     An indication of whether or not the entry was applied in time
         *     is returned.
         */
        bool AwaitApplied(
            size_t index,
            double timeout
        );

        // Private properties
    private:
        std::shared_ptr< Server::Impl > impl_;
    };

}

#endif /* ACCORD_SERVER_INTROSPECTION_HPP */
