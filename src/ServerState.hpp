#ifndef ACCORD_SERVER_STATE_HPP
#define ACCORD_SERVER_STATE_HPP

/**
 * @file ServerState.hpp
 *
 * This module declares the Accord::ServerState structure.
 *
 * © 2020 by Richard Walters
 */

#include "ConfigurationManager.hpp"

#include <Accord/ILog.hpp>
#include <Accord/IPersistentState.hpp>
#include <Accord/LogEntry.hpp>
#include <Accord/RaftConfiguration.hpp>
#include <map>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace Accord {

    /**
     * This holds the state of a server which outlives any one role:
     * the persistent term and vote, the commit index, the log, and
     * the configurations in the log.  It is only touched while the
     * server's lock is held.
     */
    struct ServerState {
        // Properties

        /**
         * This is the keeper of the log.
         */
        std::shared_ptr< ILog > log;

        /**
         * This is the keeper of the term and vote.
         */
        std::shared_ptr< IPersistentState > persistentStateKeeper;

        /**
         * This is a copy of the persistent state last saved.
         */
        IPersistentState::Variables persistentStateCache;

        /**
         * This is the index of the last log entry known to be committed.
         */
        size_t commitIndex = 0;

        /**
         * This holds the configurations which have been applied.
         */
        ConfigurationManager configurationManager;

        /**
         * These are the configurations in the log which have not yet
         * been applied, keyed by log index.
         */
        std::map< size_t, RaftConfiguration > uncommittedConfigurations;

        // Methods

        /**
         * Return the configuration which governs elections and commitment,
         * which is the configuration of the last configuration entry in
         * the log, or the last configuration applied if there is none.
         */
        const RaftConfiguration& GetEffectiveConfiguration() const;

        /**
         * Return the index of the last entry in the log.
         */
        size_t GetLastIndex() const;

        /**
         * Return the term of the last entry in the log.
         */
        uint64_t GetLastTerm() const;

        /**
         * Set the current term, forgetting any vote cast, and save
         * the persistent state.
         *
         * @param[in] newTerm
         *     This is the new current term.
         */
        void UpdateCurrentTerm(uint64_t newTerm);

        /**
         * Record a vote for the given server in the current term, and save
         * the persistent state.
         *
         * @param[in] instanceId
         *     This is the unique identifier of the server voted for.
         */
        void VoteFor(int instanceId);

        /**
         * Determine whether or not a log with the given last entry
         * is at least as up to date as ours.
         */
        bool IsLogAsUpToDate(
            uint64_t lastLogTerm,
            size_t lastLogIndex
        ) const;

        /**
         * Add the given entries to the end of the log, keeping track of
         * any configurations among them.
         *
         * @param[in] entries
         *     These are the entries to append.
         *
         * @return
         *     An indication of whether or not the effective configuration
         *     changed is returned.
         */
        bool AppendEntries(const std::vector< LogEntry >& entries);

        /**
         * Remove every log entry from the given index on, discarding any
         * configurations among them, whether applied or not.
         *
         * @param[in] fromIndex
         *     This is the index of the first entry to remove.
         *
         * @return
         *     An indication of whether or not the effective configuration
         *     changed is returned.
         */
        bool TruncateLog(size_t fromIndex);

        /**
         * Record that the configuration entry at the given index has been
         * applied.
         *
         * @param[in] configuration
         *     This is the configuration applied.
         */
        void CommitConfiguration(const RaftConfiguration& configuration);

        /**
         * Check that the log is usable: indices are contiguous, terms
         * never decrease, and no term is beyond the current term.
         *
         * @param[out] reason
         *     This is where to put a description of what is wrong,
         *     if anything.
         *
         * @return
         *     An indication of whether or not the log is usable
         *     is returned.
         */
        bool ValidateLog(std::string& reason);

        /**
         * Return the configuration held by the given configuration entry.
         *
         * @param[in] entry
         *     This is the configuration entry.
         *
         * @return
         *     The configuration held by the entry is returned.
         */
        static RaftConfiguration ConfigurationFromEntry(const LogEntry& entry);
    };

}

#endif /* ACCORD_SERVER_STATE_HPP */
