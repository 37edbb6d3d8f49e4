/**
 * @file LogAppender.cpp
 *
 * This module contains the implementation of the Accord::LogAppender class.
 *
 * © 2020 by Richard Walters
 */

#include "LogAppender.hpp"

#include <algorithm>
#include <inttypes.h>

namespace Accord {

    LogAppender::~LogAppender() noexcept {
        Cancel();
    }

    LogAppender::LogAppender(
        Host& host,
        SystemAbstractions::DiagnosticsSender& diagnosticsSender,
        int instanceId,
        double now
    )
        : host_(host)
        , diagnosticsSender_(diagnosticsSender)
        , instanceId_(instanceId)
    {
        progress_.nextIndex = host_.GetLog().GetLastIndex() + 1;
        progress_.lastResponseTime = now;
    }

    int LogAppender::GetInstanceId() const {
        return instanceId_;
    }

    const PeerProgress& LogAppender::GetProgress() const {
        return progress_;
    }

    void LogAppender::Replicate(double now) {
        if (rpc_.awaitingResponse) {
            return;
        }
        auto& log = host_.GetLog();
        Message message;
        message.term = host_.GetCurrentTerm();
        if (ShouldSendSnapshot(log)) {
            message.type = Message::Type::InstallSnapshot;
            message.installSnapshot.lastIncludedIndex = log.GetBaseIndex();
            message.installSnapshot.lastIncludedTerm = log.GetTerm(
                message.installSnapshot.lastIncludedIndex
            );
            message.snapshot = log.GetSnapshot();
            diagnosticsSender_.SendDiagnosticInformationFormatted(
                3,
                "Installing snapshot on server %d (%zu entries, term %" PRIu64 ")",
                instanceId_,
                message.installSnapshot.lastIncludedIndex,
                message.installSnapshot.lastIncludedTerm
            );
        } else {
            const auto lastIndex = log.GetLastIndex();
            message.type = Message::Type::AppendEntries;
            message.appendEntries.leaderCommit = host_.GetCommitIndex();
            message.appendEntries.prevLogIndex = progress_.nextIndex - 1;
            message.appendEntries.prevLogTerm = log.GetTerm(
                message.appendEntries.prevLogIndex
            );
            for (size_t i = progress_.nextIndex; i <= lastIndex; ++i) {
                message.log.push_back(log[i]);
            }
            if (!message.log.empty()) {
                diagnosticsSender_.SendDiagnosticInformationFormatted(
                    1,
                    "Replicating log to server %d (%zu entries starting at %zu, term %" PRIu64 ")",
                    instanceId_,
                    message.log.size(),
                    progress_.nextIndex,
                    message.term
                );
            }
        }
        SendRequest(message, now);
    }

    void LogAppender::OnRetransmitTimeout(
        int token,
        double now
    ) {
        if (token != rpc_.retransmitSchedulerToken) {
            return;
        }
        rpc_.retransmitSchedulerToken = 0;
        if (!rpc_.awaitingResponse) {
            return;
        }
        ++rpc_.retransmissions;
        diagnosticsSender_.SendDiagnosticInformationFormatted(
            0,
            "Retransmitting last message to server %d (attempt %zu)",
            instanceId_,
            rpc_.retransmissions
        );
        host_.SendMessage(rpc_.lastRequest, instanceId_);
        ScheduleRetransmission(now);
    }

    bool LogAppender::OnAppendEntriesResults(
        const Message& message,
        double now
    ) {
        if (
            (rpc_.lastRequestType != Message::Type::AppendEntries)
            || !AcceptResponse(message, now)
        ) {
            return false;
        }
        const auto lastIndex = host_.GetLog().GetLastIndex();
        progress_.followerCommit = std::max(
            progress_.followerCommit,
            message.appendEntriesResults.followerCommit
        );
        if (message.appendEntriesResults.success) {
            progress_.matchIndex = message.appendEntriesResults.matchIndex;
            if (progress_.matchIndex > lastIndex) {
                diagnosticsSender_.SendDiagnosticInformationFormatted(
                    3,
                    "Received AppendEntriesResults with match index %zu which is beyond our last index %zu",
                    progress_.matchIndex,
                    lastIndex
                );
                progress_.matchIndex = lastIndex;
            }
            progress_.nextIndex = progress_.matchIndex + 1;
            if (progress_.nextIndex <= lastIndex) {
                Replicate(now);
            }
        } else {
            const auto hintedNextIndex = message.appendEntriesResults.matchIndex + 1;
            progress_.nextIndex = std::max(
                std::min(progress_.nextIndex - 1, hintedNextIndex),
                (size_t)1
            );
            diagnosticsSender_.SendDiagnosticInformationFormatted(
                1,
                "Server %d log mismatch; backing up to index %zu",
                instanceId_,
                progress_.nextIndex
            );
            Replicate(now);
        }
        return true;
    }

    bool LogAppender::OnInstallSnapshotResults(
        const Message& message,
        double now
    ) {
        if (
            (rpc_.lastRequestType != Message::Type::InstallSnapshot)
            || !AcceptResponse(message, now)
        ) {
            return false;
        }
        if (message.installSnapshotResults.success) {
            progress_.matchIndex = std::max(
                progress_.matchIndex,
                message.installSnapshotResults.matchIndex
            );
            progress_.nextIndex = progress_.matchIndex + 1;
            if (progress_.nextIndex <= host_.GetLog().GetLastIndex()) {
                Replicate(now);
            }
        }
        return true;
    }

    void LogAppender::Restart() {
        Cancel();
        rpc_.retransmissions = 0;
    }

    void LogAppender::Cancel() {
        if (rpc_.retransmitSchedulerToken != 0) {
            host_.CancelScheduled(rpc_.retransmitSchedulerToken);
            rpc_.retransmitSchedulerToken = 0;
        }
        rpc_.awaitingResponse = false;
    }

    void LogAppender::CheckReachability(double now) {
        if (
            progress_.reachable
            && (
                now - progress_.lastResponseTime
                > host_.GetServerConfiguration().maximumElectionTimeout
            )
        ) {
            progress_.reachable = false;
            diagnosticsSender_.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Server %d is not answering",
                instanceId_
            );
            host_.OnPeerReachabilityChanged(instanceId_, false);
        }
    }

    double LogAppender::GetRetransmitDelay(
        const IServer::ServerConfiguration& serverConfiguration,
        Message::Type requestType,
        size_t retransmissions
    ) {
        if (requestType == Message::Type::InstallSnapshot) {
            return serverConfiguration.installSnapshotTimeout;
        }
        double delay = serverConfiguration.rpcTimeout;
        switch (serverConfiguration.appenderRetryPolicy) {
            case IServer::RetryPolicy::Linear: {
                delay *= (double)(retransmissions + 1);
            } break;

            case IServer::RetryPolicy::Exponential: {
                for (
                    size_t i = 0;
                    (i < retransmissions)
                    && (delay < serverConfiguration.maximumRetransmitDelay);
                    ++i
                ) {
                    delay *= 2.0;
                }
            } break;

            case IServer::RetryPolicy::Fixed:
            default: {
            } break;
        }
        return std::min(delay, serverConfiguration.maximumRetransmitDelay);
    }

    bool LogAppender::ShouldSendSnapshot(ILog& log) const {
        const auto baseIndex = log.GetBaseIndex();
        if (progress_.nextIndex <= baseIndex) {
            return true;
        }
        const auto threshold = host_.GetServerConfiguration().snapshotTransferThreshold;
        return (
            (threshold > 0)
            && (log.GetLastIndex() - progress_.matchIndex > threshold)
            && (baseIndex > progress_.matchIndex)
        );
    }

    void LogAppender::SendRequest(
        Message& message,
        double now
    ) {
        rpc_.awaitingResponse = true;
        if (++rpc_.lastSerialNumber >= 0x7F) {
            rpc_.lastSerialNumber = 1;
        }
        message.seq = rpc_.lastSerialNumber;
        rpc_.lastRequestType = message.type;
        rpc_.lastRequest = message.Serialize();
        rpc_.timeRequestFirstSent = now;
        rpc_.retransmissions = 0;
        host_.SendMessage(rpc_.lastRequest, instanceId_);
        ScheduleRetransmission(now);
    }

    void LogAppender::ScheduleRetransmission(double now) {
        if (rpc_.retransmitSchedulerToken != 0) {
            host_.CancelScheduled(rpc_.retransmitSchedulerToken);
        }
        rpc_.retransmitSchedulerToken = host_.ScheduleRetransmission(
            instanceId_,
            now + GetRetransmitDelay(
                host_.GetServerConfiguration(),
                rpc_.lastRequestType,
                rpc_.retransmissions
            )
        );
    }

    bool LogAppender::AcceptResponse(
        const Message& message,
        double now
    ) {
        if (
            !rpc_.awaitingResponse
            || (
                (message.seq != 0)
                && (message.seq != rpc_.lastSerialNumber)
            )
        ) {
            return false;
        }
        Cancel();
        rpc_.retransmissions = 0;
        progress_.lastResponseTime = now;
        progress_.lastAckedRequestTime = rpc_.timeRequestFirstSent;
        if (!progress_.reachable) {
            progress_.reachable = true;
            diagnosticsSender_.SendDiagnosticInformationFormatted(
                2,
                "Server %d is answering again",
                instanceId_
            );
            host_.OnPeerReachabilityChanged(instanceId_, true);
        }
        return true;
    }

}
