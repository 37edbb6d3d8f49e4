#ifndef ACCORD_RAFT_CONFIGURATION_HPP
#define ACCORD_RAFT_CONFIGURATION_HPP

/**
 * @file RaftConfiguration.hpp
 *
 * This module declares the Accord::RaftConfiguration structure.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ClusterConfiguration.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <set>
#include <stddef.h>
#include <string>

namespace Accord {

    /**
     * This represents the membership of the cluster as it took effect at a
     * particular log index.  It is either a single stable set of servers,
     * or a transitional (joint) configuration in which decisions require
     * separate majorities of both the old and the new sets of servers.
     */
    struct RaftConfiguration {
        // Types

        /**
         * This is the type of function used to look up how far the log of
         * the server with the given identifier is known to extend.
         */
        using IndexLookup = std::function< size_t(int instanceId) >;

        // Properties

        /**
         * This is the set of servers in the configuration.  In a
         * transitional configuration, it is the new set of servers.
         */
        ClusterConfiguration configuration;

        /**
         * In a transitional configuration, this is the set of servers
         * being transitioned away from.
         */
        ClusterConfiguration oldConfiguration;

        /**
         * This indicates whether or not the configuration is transitional.
         */
        bool transitional = false;

        /**
         * This is the index of the log entry at which the configuration
         * took effect.  The bootstrap configuration has index 0.
         */
        size_t logIndex = 0;

        // Methods

        /**
         * Return an indication of whether or not the configuration is
         * a single stable set of servers.
         *
         * @return
         *     An indication of whether or not the configuration is
         *     a single stable set of servers is returned.
         */
        bool IsStable() const;

        /**
         * Return an indication of whether or not the server with the given
         * identifier is a member of the configuration, in either the new or
         * (for a transitional configuration) the old set.
         *
         * @param[in] instanceId
         *     This is the unique identifier of the server to look up.
         *
         * @return
         *     An indication of whether or not the server with the given
         *     identifier is a member of the configuration is returned.
         */
        bool Contains(int instanceId) const;

        /**
         * Return the identifiers of all servers in the configuration,
         * including both sets of a transitional configuration.
         *
         * @return
         *     The identifiers of all servers in the configuration
         *     are returned.
         */
        std::set< int > GetAllInstanceIds() const;

        /**
         * Determine whether or not the given set of servers makes up a
         * majority of the configuration.  For a transitional configuration,
         * the set must make up a majority of both the old and new sets.
         *
         * @param[in] instanceIds
         *     These are the servers to count (e.g. those which voted for
         *     a candidate).
         *
         * @return
         *     An indication of whether or not the given set of servers
         *     makes up a majority of the configuration is returned.
         */
        bool HasMajority(const std::set< int >& instanceIds) const;

        /**
         * Return the highest log index known to be present on a majority of
         * the configuration (on majorities of both sets, for a transitional
         * configuration).
         *
         * @param[in] indexOf
         *     This is used to look up how far the log of each server is
         *     known to extend.
         *
         * @return
         *     The highest log index known to be present on a majority of
         *     the configuration is returned.
         */
        size_t GetMajorityIndex(const IndexLookup& indexOf) const;

        /**
         * Return the highest log index known to be present on every server
         * of the configuration.
         *
         * @param[in] indexOf
         *     This is used to look up how far the log of each server is
         *     known to extend.
         *
         * @return
         *     The highest log index known to be present on every server
         *     of the configuration is returned.
         */
        size_t GetMinimumIndex(const IndexLookup& indexOf) const;

        /**
         * Return a JSON encoding of the configuration.
         *
         * @return
         *     A JSON encoding of the configuration is returned.
         */
        Json::Value Encode() const;

        /**
         * Build a configuration from its JSON encoding.
         *
         * @param[in] json
         *     This is the JSON encoding of the configuration.
         *
         * @return
         *     The decoded configuration is returned.
         */
        static RaftConfiguration Decode(const Json::Value& json);

        /**
         * Return a human-readable rendering of the configuration.
         *
         * @return
         *     A human-readable rendering of the configuration is returned.
         */
        std::string ToString() const;

        /**
         * Compare this configuration with the given other configuration.
         * The log index is not compared.
         *
         * @param[in] other
         *     This is the other configuration with which to compare this
         *     configuration.
         *
         * @return
         *     An indication of whether or not the two configurations have
         *     the same membership is returned.
         */
        bool operator==(const RaftConfiguration& other) const;

        /**
         * Compare this configuration with the given other configuration.
         * The log index is not compared.
         *
         * @param[in] other
         *     This is the other configuration with which to compare this
         *     configuration.
         *
         * @return
         *     An indication of whether or not the two configurations have
         *     different membership is returned.
         */
        bool operator!=(const RaftConfiguration& other) const;
    };

}

#endif /* ACCORD_RAFT_CONFIGURATION_HPP */
