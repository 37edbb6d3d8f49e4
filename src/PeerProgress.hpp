#ifndef ACCORD_PEER_PROGRESS_HPP
#define ACCORD_PEER_PROGRESS_HPP

/**
 * @file PeerProgress.hpp
 *
 * This module contains the declaration of the Accord::PeerProgress and
 * Accord::RpcState structures.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Message.hpp"

#include <stddef.h>
#include <string>

namespace Accord {

    /**
     * This holds what the leader knows about how far another server has
     * come in replicating the log.
     */
    struct PeerProgress {
        /**
         * This is the index of the next log entry to send to this server.
         */
        size_t nextIndex = 0;

        /**
         * This is the index of the highest log entry known to be replicated
         * on this server.
         */
        size_t matchIndex = 0;

        /**
         * This is the commit index the server reported most recently.
         */
        size_t followerCommit = 0;

        /**
         * This is the time, according to the scheduler's clock, that a
         * response was last received from the server.
         */
        double lastResponseTime = 0.0;

        /**
         * This is the time the most recently acknowledged request was
         * first sent to the server.
         */
        double lastAckedRequestTime = 0.0;

        /**
         * This indicates whether or not the server is believed to be
         * answering requests.
         */
        bool reachable = true;
    };

    /**
     * This holds the state of the request currently outstanding
     * to another server.
     */
    struct RpcState {
        /**
         * This indicates whether or not we're awaiting a response to the
         * last RPC call message sent to this instance.
         */
        bool awaitingResponse = false;

        /**
         * This is the serial number of the last request sent.
         */
        int lastSerialNumber = 0;

        /**
         * This is the type of the last request sent.
         */
        Message::Type lastRequestType = Message::Type::Unknown;

        /**
         * This is the last request sent to the instance.
         */
        std::string lastRequest;

        /**
         * This is the time the last request was first sent.
         */
        double timeRequestFirstSent = 0.0;

        /**
         * This is the number of times the last request has been
         * retransmitted.
         */
        size_t retransmissions = 0;

        /**
         * This is the token of the scheduled retransmission, or zero
         * if none is scheduled.
         */
        int retransmitSchedulerToken = 0;
    };

}

#endif /* ACCORD_PEER_PROGRESS_HPP */
