#ifndef ACCORD_SERVER_HPP
#define ACCORD_SERVER_HPP

/**
 * @file Server.hpp
 *
 * This module declares the Accord::Server implementation.
 *
 * © 2018-2020 by Richard Walters
 */

#include "IServer.hpp"

#include <memory>
#include <stddef.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Accord {

    /**
     * This class represents one member of the server cluster.
     */
    class Server
        : public IServer
    {
        // Lifecycle Methods
    public:
        ~Server() noexcept;
        Server(const Server&) = delete;
        Server(Server&&) noexcept;
        Server& operator=(const Server&) = delete;
        Server& operator=(Server&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         */
        Server();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        // IServer
    public:
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) override;
        virtual bool Mobilize(
            std::shared_ptr< ILog > logKeeper,
            std::shared_ptr< IPersistentState > persistentStateKeeper,
            std::shared_ptr< IStateMachine > stateMachine,
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const ClusterConfiguration& clusterConfiguration,
            const ServerConfiguration& serverConfiguration
        ) override;
        virtual void Demobilize() override;
        virtual void ReceiveMessage(
            const std::string& serializedMessage,
            int senderInstanceNumber
        ) override;
        virtual ElectionState GetElectionState() override;
        virtual int GetClusterLeaderId() override;
        virtual std::shared_future< ClientReply > Submit(
            const std::string& clientId,
            uint64_t callId,
            const std::string& content
        ) override;
        virtual std::shared_future< ClientReply > Read(
            const std::string& query,
            bool linearizable
        ) override;
        virtual std::shared_future< ClientReply > Watch(
            size_t index,
            ReplicationLevel level
        ) override;
        virtual std::shared_future< ClientReply > ChangeConfiguration(
            const ClusterConfiguration& newConfiguration
        ) override;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;

        /**
         * This is the library-internal view of the instance used
         * by the tests.
         */
        friend struct ServerIntrospection;
    };

}

#endif /* ACCORD_SERVER_HPP */
