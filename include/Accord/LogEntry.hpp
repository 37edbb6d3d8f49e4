#ifndef ACCORD_LOG_ENTRY_HPP
#define ACCORD_LOG_ENTRY_HPP

/**
 * @file LogEntry.hpp
 *
 * This module declares the Accord::LogEntry implementation.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ClusterConfiguration.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/IFile.hpp>

namespace Accord {

    /**
     * This is the base class for the payload carried by a log entry.
     */
    class Command {
    public:
        // Lifecycle Methods

        virtual ~Command() = default;

        // Methods

        /**
         * Return the name which identifies the kind of command this is.
         *
         * @return
         *     The name which identifies the kind of command this is
         *     is returned.
         */
        virtual std::string GetType() const = 0;

        /**
         * Return a JSON encoding of the command's properties.
         *
         * @return
         *     A JSON encoding of the command's properties is returned.
         */
        virtual Json::Value Encode() const = 0;
    };

    /**
     * This command marks a change of the cluster to a single stable
     * configuration.
     */
    struct SingleConfigurationCommand
        : public Command
    {
        // Properties

        ClusterConfiguration configuration;
        ClusterConfiguration oldConfiguration;

        // Methods

        SingleConfigurationCommand(const Json::Value& json = nullptr);

        // Command

        virtual std::string GetType() const override;
        virtual Json::Value Encode() const override;
    };

    /**
     * This command marks a change of the cluster to a transitional
     * configuration, in which both the old and new sets of servers
     * take part in elections and commitment.
     */
    struct JointConfigurationCommand
        : public Command
    {
        // Properties

        ClusterConfiguration oldConfiguration;
        ClusterConfiguration newConfiguration;

        // Methods

        JointConfigurationCommand(const Json::Value& json = nullptr);

        // Command

        virtual std::string GetType() const override;
        virtual Json::Value Encode() const override;
    };

    /**
     * This command carries an operation submitted by a client, to be
     * applied to the state machine.
     */
    struct ClientCommand
        : public Command
    {
        // Properties

        /**
         * This identifies the client which submitted the command.
         */
        std::string clientId;

        /**
         * This distinguishes the command from every other command
         * submitted by the same client.  Retries of the same command
         * carry the same value.
         */
        uint64_t callId = 0;

        /**
         * This is the opaque operation to hand to the state machine.
         */
        std::string content;

        // Methods

        ClientCommand(const Json::Value& json = nullptr);

        // Command

        virtual std::string GetType() const override;
        virtual Json::Value Encode() const override;
    };

    /**
     * This is a single entry in the replicated log.  An entry with no
     * command is a no-op, such as the one a new leader appends at the
     * start of its term.
     */
    struct LogEntry {
        // Types

        /**
         * This is the type of function used to build a command from its
         * JSON encoding.
         */
        using CommandFactory = std::function<
            std::shared_ptr< Command >(
                const Json::Value& commandAsJson
            )
        >;

        // Properties

        /**
         * This is the term when the entry was received by the leader.
         */
        uint64_t term = 0;

        /**
         * This is the position of the entry in the log.
         */
        size_t index = 0;

        /**
         * This represents the change to be made to the server state when
         * this log entry is applied.
         */
        std::shared_ptr< Command > command;

        // Methods

        /**
         * Register a factory used to build commands of the given type
         * when log entries are deserialized.
         *
         * @param[in] type
         *     This is the name of the type of command built by the factory.
         *
         * @param[in] factory
         *     This is the function used to build commands of the
         *     given type.
         */
        static void RegisterCommandType(
            const std::string& type,
            CommandFactory factory
        );

        /**
         * Return an indication of whether or not the entry marks a change
         * in the cluster configuration.
         *
         * @return
         *     An indication of whether or not the entry marks a change
         *     in the cluster configuration is returned.
         */
        bool IsConfiguration() const;

        /**
         * Write the log entry to the given file.
         *
         * @param[in] file
         *     This is the file to which to write the log entry.
         *
         * @param[in] serializationVersion
         *     This is the version of the serialization format to use,
         *     or zero to use the latest version.
         *
         * @return
         *     An indication of whether or not the log entry was
         *     written successfully is returned.
         */
        bool Serialize(
            SystemAbstractions::IFile* file,
            unsigned int serializationVersion = 0
        ) const;

        /**
         * Read the log entry from the given file.
         *
         * @param[in] file
         *     This is the file from which to read the log entry.
         *
         * @return
         *     An indication of whether or not the log entry was
         *     read successfully is returned.
         */
        bool Deserialize(SystemAbstractions::IFile* file);

        /**
         * Compare this log entry with the given other log entry.
         *
         * @param[in] other
         *     This is the other log entry with which to compare this
         *     log entry.
         *
         * @return
         *     An indication of whether or not the two log entries are equal
         *     is returned.
         */
        bool operator==(const LogEntry& other) const;

        /**
         * Compare this log entry with the given other log entry.
         *
         * @param[in] other
         *     This is the other log entry with which to compare this
         *     log entry.
         *
         * @return
         *     An indication of whether or not the two log entries are
         *     not equal is returned.
         */
        bool operator!=(const LogEntry& other) const;
    };

}

#endif /* ACCORD_LOG_ENTRY_HPP */
