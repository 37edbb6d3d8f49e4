#ifndef ACCORD_CLUSTER_CONFIGURATION_HPP
#define ACCORD_CLUSTER_CONFIGURATION_HPP

/**
 * @file ClusterConfiguration.hpp
 *
 * This module declares the Accord::ClusterConfiguration structure.
 *
 * © 2018-2020 by Richard Walters
 */

#include <set>

namespace Accord {

    /**
     * This holds the properties which make up the configuration of the
     * overall server cluster.
     */
    struct ClusterConfiguration {
        /**
         * This holds the unique identifiers of all servers in the cluster.
         */
        std::set< int > instanceIds;

        /**
         * Compare this configuration with the given other configuration.
         *
         * @param[in] other
         *     This is the other configuration with which to compare this
         *     configuration.
         *
         * @return
         *     An indication of whether or not the two configurations
         *     are equal is returned.
         */
        bool operator==(const ClusterConfiguration& other) const {
            return instanceIds == other.instanceIds;
        }

        /**
         * Compare this configuration with the given other configuration.
         *
         * @param[in] other
         *     This is the other configuration with which to compare this
         *     configuration.
         *
         * @return
         *     An indication of whether or not the two configurations
         *     are not equal is returned.
         */
        bool operator!=(const ClusterConfiguration& other) const {
            return instanceIds != other.instanceIds;
        }
    };

}

#endif /* ACCORD_CLUSTER_CONFIGURATION_HPP */
