#ifndef ACCORD_I_LOG_HPP
#define ACCORD_I_LOG_HPP

/**
 * @file ILog.hpp
 *
 * This module declares the Accord::ILog interface.
 *
 * © 2018-2020 by Richard Walters
 */

#include "LogEntry.hpp"

#include <Json/Value.hpp>
#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace Accord {

    /**
     * This is the interface that a Server needs in order to access the log
     * entries which are replicated across the server cluster.
     *
     * The log is made up of an optional snapshot, standing in for all
     * entries up to and including the base index, followed by individual
     * entries from the base index plus one through the last index.
     */
    class ILog {
    public:
        // Lifecycle Methods

        virtual ~ILog() = default;

        // Methods

        /**
         * Return the last index represented by the snapshot upon which this
         * log is based.
         *
         * @return
         *     The last index represented by the snapshot upon which this
         *     log is based is returned.
         */
        virtual size_t GetBaseIndex() = 0;

        /**
         * Return the snapshot upon which this log is based.
         *
         * @return
         *     The snapshot upon which this log is based is returned.
         */
        virtual const Json::Value& GetSnapshot() = 0;

        /**
         * Replace the snapshot upon which this log is based.  Entries
         * up to and including the last included index are discarded.
         * Entries after it are kept only if the log holds the entry at
         * the last included index and its term matches the given term;
         * otherwise the log is left with no individual entries.
         *
         * @param[in] snapshot
         *     This is the new snapshot upon which to base the log.
         *
         * @param[in] lastIncludedIndex
         *     This is the index of the last log entry represented by
         *     the snapshot.
         *
         * @param[in] lastIncludedTerm
         *     This is the term of the last log entry represented by
         *     the snapshot.
         */
        virtual void InstallSnapshot(
            const Json::Value& snapshot,
            size_t lastIncludedIndex,
            uint64_t lastIncludedTerm
        ) = 0;

        /**
         * Return the index of the last entry in the log, or in the snapshot
         * upon which this log is based, if the log is empty.
         *
         * @return
         *     The index of the last entry in the log, or in the snapshot
         *     upon which this log is based, if the log is empty, is returned.
         */
        virtual size_t GetLastIndex() = 0;

        /**
         * Return the term of the log entry at the given index.  The base
         * index is answered with the term of the last entry represented
         * by the snapshot.  Index zero is answered with zero.
         *
         * @param[in] index
         *     This is the index of the log entry for which to return the term.
         *
         * @return
         *     The term of the log entry at the given index is returned.
         */
        virtual uint64_t GetTerm(size_t index) = 0;

        /**
         * Return the log entry at the given index, which must be after
         * the base index and no later than the last index.
         *
         * @param[in] index
         *     This is the index of the log entry to return.
         *
         * @return
         *     The requested log entry is returned.
         */
        virtual const LogEntry& operator[](size_t index) = 0;

        /**
         * Discard the log entry at the given index and all entries after it.
         *
         * @param[in] fromIndex
         *     This is the index of the first log entry to discard.
         */
        virtual void Truncate(size_t fromIndex) = 0;

        /**
         * Append the given entries to the log.
         *
         * @param[in] entries
         *     These are the entries to append to the log.
         */
        virtual void Append(const std::vector< LogEntry >& entries) = 0;

        /**
         * Let the log know that all entries up to and including the given
         * entry have been replicated to a majority of servers in the cluster,
         * and so can be applied to the server state.
         *
         * It's possible the given index, and/or indices beyond this, may
         * already be committed.  In this case, the log is expected to handle
         * this by doing nothing.
         *
         * @param[in] index
         *     This is the index of the last entry in the log that a majority
         *     of servers in the cluster have successfully stored.
         */
        virtual void Commit(size_t index) = 0;

        /**
         * Block until every change made to the log so far is durable.
         */
        virtual void Flush() = 0;
    };

}

#endif /* ACCORD_I_LOG_HPP */
