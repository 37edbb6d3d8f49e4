/**
 * @file Utilities.cpp
 *
 * This module contains the implementation of free functions used by other
 * parts of the library implementation.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Utilities.hpp"

namespace Accord {

    void PrintTo(
        const IServer::ElectionState& electionState,
        std::ostream* os
    ) {
        *os << ElectionStateToString(electionState);
    }

    void PrintTo(
        const ClientReply::Status& status,
        std::ostream* os
    ) {
        *os << ClientReplyStatusToString(status);
    }

    std::string ElectionStateToString(IServer::ElectionState electionState) {
        switch (electionState) {
            case IServer::ElectionState::Follower: return "Follower";
            case IServer::ElectionState::Candidate: return "Candidate";
            case IServer::ElectionState::Leader: return "Leader";
            default: return "???";
        }
    }

    std::string ClientReplyStatusToString(ClientReply::Status status) {
        switch (status) {
            case ClientReply::Status::Success: return "Success";
            case ClientReply::Status::NotLeader: return "NotLeader";
            case ClientReply::Status::Timeout: return "Timeout";
            case ClientReply::Status::ConfigurationChangeInProgress: return "ConfigurationChangeInProgress";
            case ClientReply::Status::InvalidConfiguration: return "InvalidConfiguration";
            case ClientReply::Status::StateMachineError: return "StateMachineError";
            default: return "???";
        }
    }

}
