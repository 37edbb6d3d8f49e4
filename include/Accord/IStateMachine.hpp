#pragma once

/**
 * @file IStateMachine.hpp
 *
 * This module declares the Accord::IStateMachine interface.
 *
 * © 2020 by Richard Walters
 */

#include "LogEntry.hpp"

#include <Json/Value.hpp>
#include <stddef.h>
#include <string>

namespace Accord {

    /**
     * This is the interface that a Server needs in order to apply committed
     * log entries to the deterministic state which the cluster replicates.
     *
     * Every method is called from a single worker thread, in log order.
     */
    class IStateMachine {
    public:
        // Types

        /**
         * This holds what the state machine returned for a command
         * or query.
         */
        struct Result {
            /**
             * This indicates whether or not the state machine declared
             * the command or query to be in error.  This is a normal,
             * deterministic outcome which is replicated like any other.
             */
            bool error = false;

            /**
             * This is the value returned by the state machine.
             */
            std::string value;
        };

        // Lifecycle Methods

        virtual ~IStateMachine() = default;

        // Methods

        /**
         * Apply the given client command to the state.
         *
         * @param[in] entry
         *     This is the committed log entry to apply.  Its command is
         *     a ClientCommand.
         *
         * @param[out] result
         *     This is where to store what the command returned.
         *
         * @return
         *     An indication of whether or not the command could be applied
         *     is returned.  Returning false means the state has diverged
         *     and the server must stop.
         */
        virtual bool Apply(
            const LogEntry& entry,
            Result& result
        ) = 0;

        /**
         * Evaluate the given read-only query against the state.
         *
         * @param[in] query
         *     This is the query to evaluate.
         *
         * @param[out] result
         *     This is where to store what the query returned.
         *
         * @return
         *     An indication of whether or not the query could be evaluated
         *     is returned.
         */
        virtual bool Query(
            const std::string& query,
            Result& result
        ) = 0;

        /**
         * Return a condensed form of the state as built from every
         * command applied so far.
         *
         * @return
         *     A snapshot of the state is returned.
         */
        virtual Json::Value TakeSnapshot() = 0;

        /**
         * Replace the state with the one held in the given snapshot.
         *
         * @param[in] snapshot
         *     This is the snapshot from which to restore the state.
         *
         * @param[in] lastIncludedIndex
         *     This is the index of the last log entry represented by
         *     the snapshot.
         */
        virtual void InstallSnapshot(
            const Json::Value& snapshot,
            size_t lastIncludedIndex
        ) = 0;
    };

}
