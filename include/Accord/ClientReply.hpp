#ifndef ACCORD_CLIENT_REPLY_HPP
#define ACCORD_CLIENT_REPLY_HPP

/**
 * @file ClientReply.hpp
 *
 * This module declares the Accord::ClientInvocationId and
 * Accord::ClientReply structures.
 *
 * © 2018-2020 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace Accord {

    /**
     * This identifies one logical request made by a client, across all
     * the times the client may retry it.
     */
    struct ClientInvocationId {
        std::string clientId;
        uint64_t callId = 0;

        bool operator<(const ClientInvocationId& other) const {
            if (clientId != other.clientId) {
                return clientId < other.clientId;
            }
            return callId < other.callId;
        }

        bool operator==(const ClientInvocationId& other) const {
            return (
                (clientId == other.clientId)
                && (callId == other.callId)
            );
        }
    };

    /**
     * This is the outcome of a request made through the client
     * surface of a server.
     */
    struct ClientReply {
        // Types

        /**
         * These are the possible outcomes of a client request.
         */
        enum class Status {
            /**
             * The request was carried out.  For submitted commands
             * and reads, the result holds what the state machine returned.
             */
            Success,

            /**
             * The server is not able to carry out the request because it
             * is not the ready leader of the cluster.  If another server
             * is known to be the leader, its identifier is given so that
             * the client may retry there.
             */
            NotLeader,

            /**
             * The request was not completed in the time allowed.
             */
            Timeout,

            /**
             * A configuration change was requested while another one
             * was still in progress.
             */
            ConfigurationChangeInProgress,

            /**
             * The requested configuration has no servers in it.
             */
            InvalidConfiguration,

            /**
             * The state machine declared an error when it applied the
             * command.  The result holds what the state machine returned.
             */
            StateMachineError,
        };

        // Properties

        /**
         * This indicates the outcome of the request.
         */
        Status status = Status::Success;

        /**
         * This is the value returned by the state machine, if any.
         */
        std::string result;

        /**
         * For NotLeader replies, this is the identifier of the server
         * believed to be the cluster leader, or zero if no leader is known.
         */
        int leaderId = 0;

        /**
         * This is the index of the log entry through which the request
         * was carried out, if any.
         */
        size_t logIndex = 0;
    };

}

#endif /* ACCORD_CLIENT_REPLY_HPP */
