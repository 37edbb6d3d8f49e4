#ifndef ACCORD_UTILITIES_HPP
#define ACCORD_UTILITIES_HPP

/**
 * @file Utilities.hpp
 *
 * This module contains the declaration of free functions used by other parts
 * of the library implementation.
 *
 * © 2019-2020 by Richard Walters
 */

#include <Accord/IServer.hpp>
#include <set>
#include <string>
#include <sstream>

namespace Accord {

    /**
     * Return a human-readable string representation of the given server
     * election state.
     *
     * @param[in] electionState
     *     This is the election state to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given server
     *     election state is returned.
     */
    std::string ElectionStateToString(IServer::ElectionState electionState);

    /**
     * Return a human-readable string representation of the given client
     * reply status.
     *
     * @param[in] status
     *     This is the client reply status to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given client
     *     reply status is returned.
     */
    std::string ClientReplyStatusToString(ClientReply::Status status);

    /**
     * This is the template for a function which builds and returns a
     * human-readable string representation of a set of elements.
     *
     * @param[in] s
     *     This is the set of elements to format as a string.
     *
     * @return
     *     A human-readable representation of the given set is returned.
     */
    template< typename T > std::string FormatSet(const std::set< T >& s) {
        std::ostringstream builder;
        builder << '{';
        bool first = true;
        for (const auto& element: s) {
            if (!first) {
                builder << ", ";
            }
            first = false;
            builder << element;
        }
        builder << '}';
        return builder.str();
    }

}

#endif /* ACCORD_UTILITIES_HPP */
