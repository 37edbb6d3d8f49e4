/**
 * @file Message.cpp
 *
 * This module contains the implementation of the Accord::Message class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Message.hpp"

#include <Json/Value.hpp>
#include <Serialization/SerializedBoolean.hpp>
#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedString.hpp>
#include <Serialization/SerializedUnsignedInteger.hpp>
#include <SystemAbstractions/StringFile.hpp>

namespace {

    constexpr int CURRENT_SERIALIZATION_VERSION = 1;

    template< typename T > bool ReadUnsigned(
        SystemAbstractions::IFile* file,
        T& value
    ) {
        Serialization::SerializedUnsignedInteger field;
        if (!field.Deserialize(file)) {
            return false;
        }
        value = (T)(uintmax_t)field;
        return true;
    }

    bool WriteUnsigned(
        SystemAbstractions::IFile* file,
        uintmax_t value
    ) {
        Serialization::SerializedUnsignedInteger field(value);
        return field.Serialize(file);
    }

    bool ReadBoolean(
        SystemAbstractions::IFile* file,
        bool& value
    ) {
        Serialization::SerializedBoolean field;
        if (!field.Deserialize(file)) {
            return false;
        }
        value = field;
        return true;
    }

    bool WriteBoolean(
        SystemAbstractions::IFile* file,
        bool value
    ) {
        Serialization::SerializedBoolean field(value);
        return field.Serialize(file);
    }

    /**
     * Decode the properties specific to the type of the given message.
     *
     * @param[in] file
     *     This is the buffer holding the rest of the serialized message.
     *
     * @param[in,out] message
     *     This is the message to fill in.  Its type has already been decoded.
     *
     * @return
     *     An indication of whether or not the properties were decoded
     *     successfully is returned.
     */
    bool DeserializeDetails(
        SystemAbstractions::IFile* file,
        Accord::Message& message
    ) {
        switch (message.type) {
            case Accord::Message::Type::RequestVote: {
                Serialization::SerializedInteger intField;
                if (!intField.Deserialize(file)) {
                    return false;
                }
                message.requestVote.candidateId = intField;
                return (
                    ReadUnsigned(file, message.requestVote.lastLogIndex)
                    && ReadUnsigned(file, message.requestVote.lastLogTerm)
                );
            }

            case Accord::Message::Type::RequestVoteResults: {
                return ReadBoolean(file, message.requestVoteResults.voteGranted);
            }

            case Accord::Message::Type::AppendEntries: {
                size_t numLogEntries = 0;
                if (
                    !ReadUnsigned(file, message.appendEntries.leaderCommit)
                    || !ReadUnsigned(file, message.appendEntries.prevLogIndex)
                    || !ReadUnsigned(file, message.appendEntries.prevLogTerm)
                    || !ReadUnsigned(file, numLogEntries)
                ) {
                    return false;
                }
                for (size_t i = 0; i < numLogEntries; ++i) {
                    Accord::LogEntry logEntry;
                    if (!logEntry.Deserialize(file)) {
                        return false;
                    }
                    message.log.push_back(std::move(logEntry));
                }
                return true;
            }

            case Accord::Message::Type::AppendEntriesResults: {
                return (
                    ReadBoolean(file, message.appendEntriesResults.success)
                    && ReadUnsigned(file, message.appendEntriesResults.matchIndex)
                    && ReadUnsigned(file, message.appendEntriesResults.followerCommit)
                );
            }

            case Accord::Message::Type::InstallSnapshot: {
                if (
                    !ReadUnsigned(file, message.installSnapshot.lastIncludedIndex)
                    || !ReadUnsigned(file, message.installSnapshot.lastIncludedTerm)
                ) {
                    return false;
                }
                Serialization::SerializedString stringField;
                if (!stringField.Deserialize(file)) {
                    return false;
                }
                message.snapshot = Json::Value::FromEncoding(stringField);
                return true;
            }

            case Accord::Message::Type::InstallSnapshotResults: {
                return (
                    ReadBoolean(file, message.installSnapshotResults.success)
                    && ReadUnsigned(file, message.installSnapshotResults.matchIndex)
                );
            }

            default: return false;
        }
    }

}

namespace Accord {

    Message::Message(const std::string& serialization) {
        if (serialization.empty()) {
            return;
        }
        SystemAbstractions::StringFile buffer(serialization);
        Serialization::SerializedUnsignedInteger version;
        if (!version.Deserialize(&buffer)) {
            return;
        }
        if (
            (version < 1)
            || (version > CURRENT_SERIALIZATION_VERSION)
        ) {
            return;
        }
        Serialization::SerializedInteger intField;
        if (!intField.Deserialize(&buffer)) {
            return;
        }
        const auto decodedType = (Message::Type)(int)intField;
        if (!ReadUnsigned(&buffer, term)) {
            return;
        }
        if (!intField.Deserialize(&buffer)) {
            return;
        }
        seq = intField;
        type = decodedType;
        if (!DeserializeDetails(&buffer, *this)) {
            type = Message::Type::Unknown;
        }
    }

    std::string Message::Serialize() const {
        SystemAbstractions::StringFile buffer;
        if (!WriteUnsigned(&buffer, CURRENT_SERIALIZATION_VERSION)) {
            return "";
        }
        Serialization::SerializedInteger intField((int)type);
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        if (!WriteUnsigned(&buffer, term)) {
            return "";
        }
        intField = seq;
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        switch (type) {
            case Message::Type::RequestVote: {
                intField = requestVote.candidateId;
                if (
                    !intField.Serialize(&buffer)
                    || !WriteUnsigned(&buffer, requestVote.lastLogIndex)
                    || !WriteUnsigned(&buffer, requestVote.lastLogTerm)
                ) {
                    return "";
                }
            } break;

            case Message::Type::RequestVoteResults: {
                if (!WriteBoolean(&buffer, requestVoteResults.voteGranted)) {
                    return "";
                }
            } break;

            case Message::Type::AppendEntries: {
                if (
                    !WriteUnsigned(&buffer, appendEntries.leaderCommit)
                    || !WriteUnsigned(&buffer, appendEntries.prevLogIndex)
                    || !WriteUnsigned(&buffer, appendEntries.prevLogTerm)
                    || !WriteUnsigned(&buffer, log.size())
                ) {
                    return "";
                }
                for (const auto& logEntry: log) {
                    if (!logEntry.Serialize(&buffer)) {
                        return "";
                    }
                }
            } break;

            case Message::Type::AppendEntriesResults: {
                if (
                    !WriteBoolean(&buffer, appendEntriesResults.success)
                    || !WriteUnsigned(&buffer, appendEntriesResults.matchIndex)
                    || !WriteUnsigned(&buffer, appendEntriesResults.followerCommit)
                ) {
                    return "";
                }
            } break;

            case Message::Type::InstallSnapshot: {
                if (
                    !WriteUnsigned(&buffer, installSnapshot.lastIncludedIndex)
                    || !WriteUnsigned(&buffer, installSnapshot.lastIncludedTerm)
                ) {
                    return "";
                }
                Serialization::SerializedString stringField(snapshot.ToEncoding());
                if (!stringField.Serialize(&buffer)) {
                    return "";
                }
            } break;

            case Message::Type::InstallSnapshotResults: {
                if (
                    !WriteBoolean(&buffer, installSnapshotResults.success)
                    || !WriteUnsigned(&buffer, installSnapshotResults.matchIndex)
                ) {
                    return "";
                }
            } break;

            default: return "";
        }
        return buffer;
    }

}
