#ifndef ACCORD_COMPLETION_HANDLE_HPP
#define ACCORD_COMPLETION_HANDLE_HPP

/**
 * @file CompletionHandle.hpp
 *
 * This module declares the Accord::CompletionHandle class.
 *
 * © 2020 by Richard Walters
 */

#include <Accord/ClientReply.hpp>
#include <future>
#include <mutex>

namespace Accord {

    /**
     * This represents a client request which is awaiting its reply.
     * The reply can be given only once; later attempts are ignored.
     */
    class CompletionHandle {
        // Lifecycle Methods
    public:
        CompletionHandle();

        // Public Methods
    public:
        /**
         * Give the reply to the request, if it hasn't been given already.
         *
         * @param[in] reply
         *     This is the reply to give to the request.
         *
         * @return
         *     An indication of whether or not this call gave the reply
         *     is returned.
         */
        bool Resolve(const ClientReply& reply);

        /**
         * Return the future through which the reply will be received.
         *
         * @return
         *     The future through which the reply will be received
         *     is returned.
         */
        std::shared_future< ClientReply > GetFuture() const;

        /**
         * Return an indication of whether or not the reply has been given.
         *
         * @return
         *     An indication of whether or not the reply has been given
         *     is returned.
         */
        bool IsResolved();

        // Private properties
    private:
        /**
         * This is used to synchronize access to the properties below.
         */
        std::mutex mutex_;

        /**
         * This indicates whether or not the reply has been given.
         */
        bool resolved_ = false;

        /**
         * This is used to give the reply.
         */
        std::promise< ClientReply > promise_;

        /**
         * This is used to receive the reply.
         */
        std::shared_future< ClientReply > future_;
    };

}

#endif /* ACCORD_COMPLETION_HANDLE_HPP */
