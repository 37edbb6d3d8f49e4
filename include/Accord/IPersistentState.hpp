#pragma once

/**
 * @file IPersistentState.hpp
 *
 * This module declares the Accord::IPersistentState interface.
 *
 * © 2018-2020 by Richard Walters
 */

#include <stdint.h>

namespace Accord {

    /**
     * This is the interface that a Server needs in order to make some of its
     * state variables persistent.
     */
    class IPersistentState {
    public:
        // Types

        /**
         * This holds the state variables of the server that need to be
         * persistent.
         */
        struct Variables {
            /**
             * This is the last term the server has seen.
             */
            uint64_t currentTerm = 0;

            /**
             * If the server has voted for another server to be the leader this
             * term, this is the unique identifier of the server for whom we
             * voted.
             */
            int votedFor = 0;

            /**
             * This indicates whether or not the server has voted for another
             * server to be the leader this term.
             */
            bool votedThisTerm = false;
        };

        // Lifecycle Methods

        virtual ~IPersistentState() = default;

        // Methods

        /**
         * Load the state variables from persistent storage.
         *
         * @return
         *     The persistent state variables of the server are returned.
         *
         * @retval Variables()
         *     A default Variables object is returned if no state variables
         *     could be loaded from persistent storage.
         *
         */
        virtual Variables Load() = 0;

        /**
         * Save the state variables to persistent storage.  The variables
         * must be durable by the time this returns.
         *
         * @param[in] variables
         *     This contains the server state variables to save in persistent
         *     storage.
         */
        virtual void Save(const Variables& variables) = 0;
    };

}
