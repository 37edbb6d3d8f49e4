/**
 * @file ServerReplication.cpp
 *
 * This module contains the implementation of the Accord::Server::Impl
 * structure methods which handle the messages used to replicate the log.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ServerImpl.hpp"

#include <algorithm>
#include <inttypes.h>
#include <vector>

namespace Accord {

    void Server::Impl::OnReceiveAppendEntries(
        Message&& message,
        int senderInstanceNumber
    ) {
        const auto now = GetCurrentTime();
        Message response;
        response.type = Message::Type::AppendEntriesResults;
        response.seq = message.seq;
        if (message.term < state.persistentStateCache.currentTerm) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Rejecting entries from server %d (old term %" PRIu64 " < %" PRIu64 ")",
                senderInstanceNumber,
                message.term,
                state.persistentStateCache.currentTerm
            );
            response.term = state.persistentStateCache.currentTerm;
            response.appendEntriesResults.success = false;
            response.appendEntriesResults.matchIndex = 0;
            response.appendEntriesResults.followerCommit = state.commitIndex;
            SerializeAndQueueMessageToBeSent(response, senderInstanceNumber);
            return;
        }
        if (
            role.IsLeader()
            && (message.term == state.persistentStateCache.currentTerm)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Server %d claims to also be leader in term %" PRIu64,
                senderInstanceNumber,
                message.term
            );
            return;
        }
        const auto electionStateChanged = (
            (role.electionState != IServer::ElectionState::Follower)
            || (message.term > state.persistentStateCache.currentTerm)
        );
        UpdateCurrentTerm(message.term);
        RevertToFollower();
        if (!role.follower.thisTermLeaderAnnounced) {
            role.follower.thisTermLeaderAnnounced = true;
            leaderId = senderInstanceNumber;
            QueueLeadershipChangeAnnouncement(
                senderInstanceNumber,
                state.persistentStateCache.currentTerm
            );
        }
        if (electionStateChanged) {
            QueueElectionStateChangeAnnouncement();
        }
        lostMajorityHeartbeatsRecently = false;
        timeOfLastLeaderMessage = now;
        response.term = state.persistentStateCache.currentTerm;
        const auto prevLogIndex = message.appendEntries.prevLogIndex;
        const auto lastIndex = state.GetLastIndex();
        const auto baseIndex = state.log->GetBaseIndex();
        if (prevLogIndex > lastIndex) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Mismatch in entries from server %d (we have up to %zu, they start after %zu)",
                senderInstanceNumber,
                lastIndex,
                prevLogIndex
            );
            response.appendEntriesResults.success = false;
            response.appendEntriesResults.matchIndex = lastIndex;
        } else if (
            (prevLogIndex > baseIndex)
            && (state.log->GetTerm(prevLogIndex) != message.appendEntries.prevLogTerm)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Mismatch in entries from server %d (our term at %zu is %" PRIu64 ", theirs is %" PRIu64 ")",
                senderInstanceNumber,
                prevLogIndex,
                state.log->GetTerm(prevLogIndex),
                message.appendEntries.prevLogTerm
            );
            response.appendEntriesResults.success = false;
            response.appendEntriesResults.matchIndex = prevLogIndex - 1;
        } else {
            std::vector< LogEntry > entriesToAppend;
            auto configurationChanged = false;
            auto conflictFound = false;
            for (size_t i = 0; i < message.log.size(); ++i) {
                const auto logIndex = prevLogIndex + i + 1;
                auto& newEntry = message.log[i];
                newEntry.index = logIndex;
                if (logIndex <= baseIndex) {
                    continue;
                }
                if (
                    !conflictFound
                    && (logIndex <= state.GetLastIndex())
                ) {
                    if (state.log->GetTerm(logIndex) == newEntry.term) {
                        continue;
                    }
                    if (logIndex <= state.commitIndex) {
                        diagnosticsSender.SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                            "Server %d sent entry %zu conflicting with our committed entry",
                            senderInstanceNumber,
                            logIndex
                        );
                        return;
                    }
                    conflictFound = true;
                    if (RollBackLog(logIndex)) {
                        configurationChanged = true;
                    }
                }
                entriesToAppend.push_back(std::move(newEntry));
            }
            if (!entriesToAppend.empty()) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    1,
                    "Appending %zu entries from server %d starting at %zu",
                    entriesToAppend.size(),
                    senderInstanceNumber,
                    entriesToAppend.front().index
                );
            }
            if (state.AppendEntries(entriesToAppend)) {
                configurationChanged = true;
            }
            if (configurationChanged) {
                OnEffectiveConfigurationChanged();
            }
            const auto matchIndex = prevLogIndex + message.log.size();
            response.appendEntriesResults.success = true;
            response.appendEntriesResults.matchIndex = matchIndex;
            AdvanceCommitIndex(
                std::min(
                    message.appendEntries.leaderCommit,
                    matchIndex
                )
            );
        }
        response.appendEntriesResults.followerCommit = state.commitIndex;
        SerializeAndQueueMessageToBeSent(response, senderInstanceNumber);
    }

    void Server::Impl::OnReceiveAppendEntriesResults(
        Message&& message,
        int senderInstanceNumber
    ) {
        if (message.term > state.persistentStateCache.currentTerm) {
            UpdateCurrentTerm(message.term);
            RevertToFollower();
            QueueElectionStateChangeAnnouncement();
            return;
        }
        if (
            !role.IsLeader()
            || (message.term < state.persistentStateCache.currentTerm)
        ) {
            return;
        }
        const auto appendersEntry = role.leader.appenders.find(senderInstanceNumber);
        if (appendersEntry == role.leader.appenders.end()) {
            return;
        }
        const auto now = GetCurrentTime();
        if (!appendersEntry->second->OnAppendEntriesResults(message, now)) {
            return;
        }
        LeaderAdvanceCommitIndex();
        StartConfigChangeIfNewServersHaveCaughtUp();
        UpdateWatches();
        if (
            role.IsLeader()
            && watchRequests.HasLeadershipWatches()
        ) {
            const auto senderAppendersEntry = role.leader.appenders.find(senderInstanceNumber);
            if (senderAppendersEntry != role.leader.appenders.end()) {
                senderAppendersEntry->second->Replicate(now);
            }
        }
    }

    void Server::Impl::OnReceiveInstallSnapshot(
        Message&& message,
        int senderInstanceNumber
    ) {
        const auto now = GetCurrentTime();
        Message response;
        response.type = Message::Type::InstallSnapshotResults;
        response.seq = message.seq;
        if (message.term < state.persistentStateCache.currentTerm) {
            response.term = state.persistentStateCache.currentTerm;
            response.installSnapshotResults.success = false;
            SerializeAndQueueMessageToBeSent(response, senderInstanceNumber);
            return;
        }
        if (
            role.IsLeader()
            && (message.term == state.persistentStateCache.currentTerm)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Server %d claims to also be leader in term %" PRIu64,
                senderInstanceNumber,
                message.term
            );
            return;
        }
        const auto electionStateChanged = (
            (role.electionState != IServer::ElectionState::Follower)
            || (message.term > state.persistentStateCache.currentTerm)
        );
        UpdateCurrentTerm(message.term);
        RevertToFollower();
        if (!role.follower.thisTermLeaderAnnounced) {
            role.follower.thisTermLeaderAnnounced = true;
            leaderId = senderInstanceNumber;
            QueueLeadershipChangeAnnouncement(
                senderInstanceNumber,
                state.persistentStateCache.currentTerm
            );
        }
        if (electionStateChanged) {
            QueueElectionStateChangeAnnouncement();
        }
        lostMajorityHeartbeatsRecently = false;
        timeOfLastLeaderMessage = now;
        response.term = state.persistentStateCache.currentTerm;
        const auto lastIncludedIndex = message.installSnapshot.lastIncludedIndex;
        const auto lastIncludedTerm = message.installSnapshot.lastIncludedTerm;
        if (lastIncludedIndex > state.commitIndex) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                3,
                "Installing snapshot from server %d through index %zu (term %" PRIu64 ")",
                senderInstanceNumber,
                lastIncludedIndex,
                lastIncludedTerm
            );
            if (
                (lastIncludedIndex > state.GetLastIndex())
                || (state.log->GetTerm(lastIncludedIndex) != lastIncludedTerm)
            ) {
                (void)RollBackLog(state.commitIndex + 1);
            }
            state.log->InstallSnapshot(
                message.snapshot,
                lastIncludedIndex,
                lastIncludedTerm
            );
            auto configuration = RaftConfiguration::Decode(message.snapshot["configuration"]);
            state.configurationManager.Reset(configuration);
            (void)state.uncommittedConfigurations.erase(
                state.uncommittedConfigurations.begin(),
                state.uncommittedConfigurations.upper_bound(lastIncludedIndex)
            );
            OnEffectiveConfigurationChanged();
            state.commitIndex = lastIncludedIndex;
            state.log->Commit(lastIncludedIndex);
            updater.InstallSnapshot(message.snapshot["state"], lastIncludedIndex);
            QueueSnapshotAnnouncement(
                message.snapshot,
                lastIncludedIndex,
                lastIncludedTerm
            );
        }
        response.installSnapshotResults.success = true;
        response.installSnapshotResults.matchIndex = lastIncludedIndex;
        SerializeAndQueueMessageToBeSent(response, senderInstanceNumber);
    }

    void Server::Impl::OnReceiveInstallSnapshotResults(
        Message&& message,
        int senderInstanceNumber
    ) {
        if (message.term > state.persistentStateCache.currentTerm) {
            UpdateCurrentTerm(message.term);
            RevertToFollower();
            QueueElectionStateChangeAnnouncement();
            return;
        }
        if (
            !role.IsLeader()
            || (message.term < state.persistentStateCache.currentTerm)
        ) {
            return;
        }
        const auto appendersEntry = role.leader.appenders.find(senderInstanceNumber);
        if (appendersEntry == role.leader.appenders.end()) {
            return;
        }
        if (!appendersEntry->second->OnInstallSnapshotResults(message, GetCurrentTime())) {
            return;
        }
        LeaderAdvanceCommitIndex();
        StartConfigChangeIfNewServersHaveCaughtUp();
        UpdateWatches();
    }

}
