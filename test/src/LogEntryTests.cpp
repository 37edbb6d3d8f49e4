/**
 * @file LogEntryTests.cpp
 *
 * This module contains the unit tests of the
 * Accord::LogEntry class.
 *
 * © 2018-2020 by Richard Walters
 */

#include <Accord/LogEntry.hpp>
#include <gtest/gtest.h>
#include <Json/Value.hpp>
#include <memory>
#include <string>
#include <SystemAbstractions/StringFile.hpp>

namespace {

    /**
     * Serialize the given entry into a buffer and return the buffer
     * contents.
     */
    std::string SerializeEntry(const Accord::LogEntry& entry) {
        SystemAbstractions::StringFile buffer;
        EXPECT_TRUE(entry.Serialize(&buffer));
        return buffer;
    }

    /**
     * Attempt to deserialize a log entry from the given buffer contents.
     */
    bool DeserializeEntry(
        const std::string& serialization,
        Accord::LogEntry& entry
    ) {
        SystemAbstractions::StringFile buffer(serialization);
        return entry.Deserialize(&buffer);
    }

}

TEST(LogEntryTests, Serialize_Client_Command) {
    // Arrange
    auto command = std::make_shared< Accord::ClientCommand >();
    command->clientId = "alice";
    command->callId = 17;
    command->content = "x=1";
    Accord::LogEntry entryIn;
    entryIn.term = 9;
    entryIn.index = 12;
    entryIn.command = std::move(command);

    // Act
    const auto serialization = SerializeEntry(entryIn);
    Accord::LogEntry entryOut;
    const auto deserialized = DeserializeEntry(serialization, entryOut);

    // Assert
    ASSERT_TRUE(deserialized);
    EXPECT_EQ(9, entryOut.term);
    EXPECT_EQ(12, entryOut.index);
    ASSERT_FALSE(entryOut.command == nullptr);
    EXPECT_EQ("Client", entryOut.command->GetType());
    const auto commandOut = std::static_pointer_cast< Accord::ClientCommand >(entryOut.command);
    EXPECT_EQ("alice", commandOut->clientId);
    EXPECT_EQ(17, commandOut->callId);
    EXPECT_EQ("x=1", commandOut->content);
    EXPECT_FALSE(entryOut.IsConfiguration());
}

TEST(LogEntryTests, Serialize_Joint_Configuration_Command) {
    // Arrange
    auto command = std::make_shared< Accord::JointConfigurationCommand >();
    command->oldConfiguration.instanceIds = {42, 85, 13531, 8354};
    command->newConfiguration.instanceIds = {10, 42, 85, 13531, 8354};
    Accord::LogEntry entryIn;
    entryIn.term = 9;
    entryIn.index = 3;
    entryIn.command = std::move(command);

    // Act
    Accord::LogEntry entryOut;
    const auto deserialized = DeserializeEntry(SerializeEntry(entryIn), entryOut);

    // Assert
    ASSERT_TRUE(deserialized);
    EXPECT_EQ(entryIn, entryOut);
    EXPECT_TRUE(entryOut.IsConfiguration());
    const auto commandOut = std::static_pointer_cast< Accord::JointConfigurationCommand >(entryOut.command);
    EXPECT_EQ(
        std::set< int >({42, 85, 13531, 8354}),
        commandOut->oldConfiguration.instanceIds
    );
    EXPECT_EQ(
        std::set< int >({10, 42, 85, 13531, 8354}),
        commandOut->newConfiguration.instanceIds
    );
}

TEST(LogEntryTests, Encode_Single_Configuration_Command) {
    // Arrange
    Accord::SingleConfigurationCommand command;
    command.oldConfiguration.instanceIds = {5, 42, 85, 13531, 8354};
    command.configuration.instanceIds = {42, 85, 13531, 8354};

    // Act
    const auto encoding = command.Encode();

    // Assert
    EXPECT_EQ(
        Json::Object({
            {"oldConfiguration", Json::Object({
                {"instanceIds", Json::Array({5, 42, 85, 8354, 13531})},
            })},
            {"configuration", Json::Object({
                {"instanceIds", Json::Array({42, 85, 8354, 13531})},
            })},
        }),
        encoding
    );
    const Accord::SingleConfigurationCommand decoded(encoding);
    EXPECT_EQ(command.configuration, decoded.configuration);
    EXPECT_EQ(command.oldConfiguration, decoded.oldConfiguration);
}

TEST(LogEntryTests, Serialize_Entry_Without_Command) {
    // Arrange
    Accord::LogEntry entryIn;
    entryIn.term = 4;
    entryIn.index = 1;

    // Act
    Accord::LogEntry entryOut;
    entryOut.command = std::make_shared< Accord::ClientCommand >();
    const auto deserialized = DeserializeEntry(SerializeEntry(entryIn), entryOut);

    // Assert
    ASSERT_TRUE(deserialized);
    EXPECT_EQ(4, entryOut.term);
    EXPECT_EQ(1, entryOut.index);
    EXPECT_TRUE(entryOut.command == nullptr);
    EXPECT_FALSE(entryOut.IsConfiguration());
}

TEST(LogEntryTests, Deserialize_Truncated_Entry_Fails) {
    // Arrange
    auto command = std::make_shared< Accord::ClientCommand >();
    command->clientId = "bob";
    command->callId = 1;
    command->content = "y=2";
    Accord::LogEntry entryIn;
    entryIn.term = 2;
    entryIn.index = 7;
    entryIn.command = std::move(command);
    const auto serialization = SerializeEntry(entryIn);

    // Act
    Accord::LogEntry entryOut;
    const auto deserialized = DeserializeEntry(
        serialization.substr(0, serialization.length() / 2),
        entryOut
    );

    // Assert
    EXPECT_FALSE(deserialized);
}

TEST(LogEntryTests, Deserialize_Unregistered_Command_Type_Fails) {
    // Arrange
    struct Mystery : public Accord::Command {
        virtual std::string GetType() const override { return "Mystery"; }
        virtual Json::Value Encode() const override {
            return Json::Object({});
        }
    };
    Accord::LogEntry entryIn;
    entryIn.term = 1;
    entryIn.index = 1;
    entryIn.command = std::make_shared< Mystery >();

    // Act
    Accord::LogEntry entryOut;
    const auto deserialized = DeserializeEntry(SerializeEntry(entryIn), entryOut);

    // Assert
    EXPECT_FALSE(deserialized);
}

TEST(LogEntryTests, Compare_Equal) {
    // Arrange
    const auto makeClientEntry = [](
        uint64_t term,
        const std::string& content
    ){
        auto command = std::make_shared< Accord::ClientCommand >();
        command->clientId = "carol";
        command->callId = 3;
        command->content = content;
        Accord::LogEntry entry;
        entry.term = term;
        entry.index = 1;
        entry.command = std::move(command);
        return entry;
    };
    Accord::LogEntry noOpTerm8;
    noOpTerm8.term = 8;
    noOpTerm8.index = 1;
    Accord::LogEntry noOpTerm9;
    noOpTerm9.term = 9;
    noOpTerm9.index = 1;
    std::vector< Accord::LogEntry > examples{
        makeClientEntry(9, "a"),
        makeClientEntry(8, "a"),
        makeClientEntry(9, "b"),
        noOpTerm8,
        noOpTerm9,
    };

    // Act
    const size_t numExamples = examples.size();
    for (size_t i = 0; i < numExamples; ++i) {
        for (size_t j = 0; j < numExamples; ++j) {
            if (i == j) {
                EXPECT_EQ(examples[i], examples[j]);
            } else {
                EXPECT_NE(examples[i], examples[j]);
            }
        }
    }
}

TEST(LogEntryTests, Custom_Command) {
    // Arrange
    struct PogChamp : public Accord::Command {
        int payload = 0;
        virtual std::string GetType() const override { return "PogChamp"; }
        virtual Json::Value Encode() const override {
            return Json::Object({
                {"payload", payload},
            });
        }
    };
    const auto pogChampFactory = [](
        const Json::Value& commandAsJson
    ) {
        const auto pogChamp = std::make_shared< PogChamp >();
        pogChamp->payload = commandAsJson["payload"];
        return pogChamp;
    };

    // Act
    Accord::LogEntry::RegisterCommandType(
        "PogChamp",
        pogChampFactory
    );
    const auto pogChamp = std::make_shared< PogChamp >();
    pogChamp->payload = 42;
    Accord::LogEntry pogChampEntry;
    pogChampEntry.term = 8;
    pogChampEntry.index = 2;
    pogChampEntry.command = pogChamp;
    Accord::LogEntry entryOut;
    const auto deserialized = DeserializeEntry(SerializeEntry(pogChampEntry), entryOut);

    // Assert
    ASSERT_TRUE(deserialized);
    EXPECT_EQ(8, entryOut.term);
    ASSERT_FALSE(entryOut.command == nullptr);
    EXPECT_EQ("PogChamp", entryOut.command->GetType());
    const auto command = std::static_pointer_cast< PogChamp >(entryOut.command);
    EXPECT_EQ(42, command->payload);
}
