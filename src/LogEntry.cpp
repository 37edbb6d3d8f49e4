/**
 * @file LogEntry.cpp
 *
 * This module contains the implementation of the Accord::LogEntry structure
 * methods.
 *
 * © 2018-2020 by Richard Walters
 */

#include <Accord/LogEntry.hpp>
#include <Json/Value.hpp>
#include <map>
#include <mutex>
#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedString.hpp>
#include <Serialization/SerializedUnsignedInteger.hpp>

namespace {

    constexpr int CURRENT_SERIALIZATION_VERSION = 1;

    /**
     * Build a JSON array holding the given server identifiers.
     *
     * @param[in] instanceIds
     *     These are the server identifiers to put in the array.
     *
     * @return
     *     The JSON array holding the given server identifiers is returned.
     */
    Json::Value EncodeInstanceIds(const std::set< int >& instanceIds) {
        auto instanceIdsArray = Json::Array({});
        for (const auto& instanceId: instanceIds) {
            instanceIdsArray.Add(instanceId);
        }
        return Json::Object({
            {"instanceIds", std::move(instanceIdsArray)},
        });
    }

    void DecodeInstanceIds(
        const Json::Value& json,
        std::set< int >& instanceIds
    ) {
        const auto& instanceIdsArray = json["instanceIds"];
        for (size_t i = 0; i < instanceIdsArray.GetSize(); ++i) {
            (void)instanceIds.insert(instanceIdsArray[i]);
        }
    }

    struct CommandFactories {
        // Properties

        /**
         * This is used to synchronize access to the registry.
         */
        std::mutex mutex;

        /**
         * This holds all registered command factories, keyed by command type.
         */
        std::map< std::string, Accord::LogEntry::CommandFactory > factoriesByType;

        // Methods

        /**
         * This is the default constructor.
         */
        CommandFactories() {
            factoriesByType["SingleConfiguration"] = [](
                const Json::Value& commandAsJson
            ) {
                return std::make_shared< Accord::SingleConfigurationCommand >(commandAsJson);
            };
            factoriesByType["JointConfiguration"] = [](
                const Json::Value& commandAsJson
            ) {
                return std::make_shared< Accord::JointConfigurationCommand >(commandAsJson);
            };
            factoriesByType["Client"] = [](
                const Json::Value& commandAsJson
            ) {
                return std::make_shared< Accord::ClientCommand >(commandAsJson);
            };
        }

        std::shared_ptr< Accord::Command > Build(
            const std::string& type,
            const Json::Value& commandAsJson
        ) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            const auto factory = factoriesByType.find(type);
            if (factory == factoriesByType.end()) {
                return nullptr;
            }
            return factory->second(commandAsJson);
        }
    } COMMAND_FACTORIES;

}

namespace Accord {

    SingleConfigurationCommand::SingleConfigurationCommand(const Json::Value& json) {
        DecodeInstanceIds(json["configuration"], configuration.instanceIds);
        DecodeInstanceIds(json["oldConfiguration"], oldConfiguration.instanceIds);
    }

    std::string SingleConfigurationCommand::GetType() const {
        return "SingleConfiguration";
    }

    Json::Value SingleConfigurationCommand::Encode() const {
        return Json::Object({
            {"configuration", EncodeInstanceIds(configuration.instanceIds)},
            {"oldConfiguration", EncodeInstanceIds(oldConfiguration.instanceIds)},
        });
    }

    JointConfigurationCommand::JointConfigurationCommand(const Json::Value& json) {
        DecodeInstanceIds(json["oldConfiguration"], oldConfiguration.instanceIds);
        DecodeInstanceIds(json["newConfiguration"], newConfiguration.instanceIds);
    }

    std::string JointConfigurationCommand::GetType() const {
        return "JointConfiguration";
    }

    Json::Value JointConfigurationCommand::Encode() const {
        return Json::Object({
            {"oldConfiguration", EncodeInstanceIds(oldConfiguration.instanceIds)},
            {"newConfiguration", EncodeInstanceIds(newConfiguration.instanceIds)},
        });
    }

    ClientCommand::ClientCommand(const Json::Value& json) {
        clientId = (std::string)json["clientId"];
        callId = (uint64_t)(size_t)json["callId"];
        content = (std::string)json["content"];
    }

    std::string ClientCommand::GetType() const {
        return "Client";
    }

    Json::Value ClientCommand::Encode() const {
        return Json::Object({
            {"clientId", clientId},
            {"callId", (size_t)callId},
            {"content", content},
        });
    }

    void LogEntry::RegisterCommandType(
        const std::string& type,
        CommandFactory factory
    ) {
        std::lock_guard< decltype(COMMAND_FACTORIES.mutex) > lock(COMMAND_FACTORIES.mutex);
        COMMAND_FACTORIES.factoriesByType[type] = factory;
    }

    bool LogEntry::IsConfiguration() const {
        if (command == nullptr) {
            return false;
        }
        const auto type = command->GetType();
        return (
            (type == "SingleConfiguration")
            || (type == "JointConfiguration")
        );
    }

    bool LogEntry::Serialize(
        SystemAbstractions::IFile* file,
        unsigned int serializationVersion
    ) const {
        if (serializationVersion > CURRENT_SERIALIZATION_VERSION) {
            return false;
        } else if (serializationVersion == 0) {
            serializationVersion = CURRENT_SERIALIZATION_VERSION;
        }
        Serialization::SerializedInteger intField(serializationVersion);
        if (!intField.Serialize(file)) {
            return false;
        }
        Serialization::SerializedUnsignedInteger unsignedField(term);
        if (!unsignedField.Serialize(file)) {
            return false;
        }
        unsignedField = index;
        if (!unsignedField.Serialize(file)) {
            return false;
        }
        Serialization::SerializedString stringField(
            (command == nullptr)
            ? ""
            : command->GetType()
        );
        if (!stringField.Serialize(file)) {
            return false;
        }
        if (command != nullptr) {
            stringField = command->Encode().ToEncoding();
            if (!stringField.Serialize(file)) {
                return false;
            }
        }
        return true;
    }

    bool LogEntry::Deserialize(SystemAbstractions::IFile* file) {
        Serialization::SerializedInteger intField;
        if (!intField.Deserialize(file)) {
            return false;
        }
        const auto version = (int)intField;
        if (
            (version < 1)
            || (version > CURRENT_SERIALIZATION_VERSION)
        ) {
            return false;
        }
        Serialization::SerializedUnsignedInteger unsignedField;
        if (!unsignedField.Deserialize(file)) {
            return false;
        }
        term = (uint64_t)unsignedField;
        if (!unsignedField.Deserialize(file)) {
            return false;
        }
        index = (size_t)unsignedField;
        Serialization::SerializedString stringField;
        if (!stringField.Deserialize(file)) {
            return false;
        }
        const std::string typeAsString = stringField;
        if (typeAsString.empty()) {
            command = nullptr;
        } else {
            if (!stringField.Deserialize(file)) {
                return false;
            }
            const auto encodedCommand = Json::Value::FromEncoding(stringField);
            command = COMMAND_FACTORIES.Build(typeAsString, encodedCommand);
            if (command == nullptr) {
                return false;
            }
        }
        return true;
    }

    bool LogEntry::operator==(const LogEntry& other) const {
        if (
            (term != other.term)
            || (index != other.index)
        ) {
            return false;
        }
        if (command == nullptr) {
            return (other.command == nullptr);
        } else if (other.command == nullptr) {
            return false;
        }
        if (command->GetType() != other.command->GetType()) {
            return false;
        }
        return (command->Encode() == other.command->Encode());
    }

    bool LogEntry::operator!=(const LogEntry& other) const {
        return !(*this == other);
    }

}
