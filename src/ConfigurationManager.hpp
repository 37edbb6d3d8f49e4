#ifndef ACCORD_CONFIGURATION_MANAGER_HPP
#define ACCORD_CONFIGURATION_MANAGER_HPP

/**
 * @file ConfigurationManager.hpp
 *
 * This module declares the Accord::ConfigurationManager class.
 *
 * © 2020 by Richard Walters
 */

#include <Accord/RaftConfiguration.hpp>
#include <map>
#include <stddef.h>

namespace Accord {

    /**
     * This keeps the history of committed cluster configurations, each
     * keyed by the log index at which it took effect.  Exactly one
     * configuration is in effect as of any log index at or after the
     * earliest one kept.
     */
    class ConfigurationManager {
        // Public Methods
    public:
        /**
         * Add the given configuration to the history.  Any configurations
         * which took effect at or after the index of the given one are
         * replaced.
         *
         * @param[in] configuration
         *     This is the configuration to add.  Its log index tells
         *     when it took effect.
         */
        void AddConfiguration(const RaftConfiguration& configuration);

        /**
         * Return the latest configuration in the history.
         *
         * @return
         *     The latest configuration in the history is returned.
         */
        const RaftConfiguration& GetCurrent() const;

        /**
         * Return the configuration which was in effect as of the given
         * log index.
         *
         * @param[in] asOf
         *     This is the log index for which to look up the configuration.
         *
         * @return
         *     The configuration in effect as of the given log index
         *     is returned.  If the index precedes every configuration kept,
         *     the earliest one kept is returned.
         */
        const RaftConfiguration& GetConfiguration(size_t asOf) const;

        /**
         * Discard every configuration which took effect at or after the
         * given log index.  The earliest configuration is always kept.
         *
         * @param[in] fromIndex
         *     This is the first log index from which to discard
         *     configurations.
         *
         * @return
         *     An indication of whether or not any configuration
         *     was discarded is returned.
         */
        bool RemoveConfigurations(size_t fromIndex);

        /**
         * Discard every configuration which is no longer in effect as of
         * the given log index, because a later one took effect at or
         * before that index.
         *
         * @param[in] index
         *     This is the log index before which history is no longer needed.
         */
        void PruneBefore(size_t index);

        /**
         * Discard the whole history, replacing it with the given
         * configuration.
         *
         * @param[in] configuration
         *     This is the configuration with which to start over.
         */
        void Reset(const RaftConfiguration& configuration);

        /**
         * Return the number of configurations in the history.
         *
         * @return
         *     The number of configurations in the history is returned.
         */
        size_t GetNumConfigurations() const;

        // Private properties
    private:
        /**
         * This holds the history of configurations, keyed by the log index
         * at which each took effect.
         */
        std::map< size_t, RaftConfiguration > configurations_;

        /**
         * This is returned when the history is empty.
         */
        RaftConfiguration emptyConfiguration_;
    };

}

#endif /* ACCORD_CONFIGURATION_MANAGER_HPP */
