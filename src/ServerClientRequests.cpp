/**
 * @file ServerClientRequests.cpp
 *
 * This module contains the implementation of the Accord::Server::Impl
 * structure methods which handle requests made by clients.
 *
 * © 2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "Utilities.hpp"

#include <inttypes.h>
#include <stdint.h>

namespace Accord {

    ClientReply Server::Impl::MakeNotLeaderReply() const {
        ClientReply reply;
        reply.status = ClientReply::Status::NotLeader;
        reply.leaderId = leaderId;
        return reply;
    }

    bool Server::Impl::IsReadyLeader() const {
        return (
            !halted
            && role.IsLeader()
            && role.leader.ready
        );
    }

    std::shared_future< ClientReply > Server::Impl::Submit(
        const std::string& clientId,
        uint64_t callId,
        const std::string& content
    ) {
        const auto completion = std::make_shared< CompletionHandle >();
        const auto future = completion->GetFuture();
        if (!IsReadyLeader()) {
            (void)completion->Resolve(MakeNotLeaderReply());
            return future;
        }
        ClientInvocationId invocationId;
        invocationId.clientId = clientId;
        invocationId.callId = callId;
        const auto query = retryCache.QueryOrCreate(invocationId);
        retryCache.AddWaiter(query.entry, completion);
        if (query.isNew) {
            const auto command = std::make_shared< ClientCommand >();
            command->clientId = clientId;
            command->callId = callId;
            command->content = content;
            const auto index = state.GetLastIndex() + 1;
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Call %s:%" PRIu64 " appended at index %zu",
                clientId.c_str(),
                callId,
                index
            );
            pendingRequests.Add(index, query.entry);
            (void)AppendCommand(command);
        } else {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Call %s:%" PRIu64 " is a retry",
                clientId.c_str(),
                callId
            );
        }
        (void)ScheduleRequestTimeout(
            [completion](Impl& impl){
                ClientReply reply;
                reply.status = ClientReply::Status::Timeout;
                reply.leaderId = impl.leaderId;
                (void)completion->Resolve(reply);
            },
            GetCurrentTime() + serverConfiguration.clientRequestTimeout
        );
        return future;
    }

    std::shared_future< ClientReply > Server::Impl::Read(
        const std::string& query,
        bool linearizable
    ) {
        const auto completion = std::make_shared< CompletionHandle >();
        const auto future = completion->GetFuture();
        if (halted) {
            ClientReply reply;
            reply.status = ClientReply::Status::NotLeader;
            (void)completion->Resolve(reply);
            return future;
        }
        if (!linearizable) {
            updater.SubmitRead(0, query, completion);
            return future;
        }
        if (!IsReadyLeader()) {
            (void)completion->Resolve(MakeNotLeaderReply());
            return future;
        }
        const auto readIndex = state.commitIndex;
        const auto now = GetCurrentTime();
        const auto deadline = now + serverConfiguration.clientRequestTimeout;
        watchRequests.AddLeadershipWatch(
            state.persistentStateCache.currentTerm,
            now,
            deadline,
            completion,
            [this, readIndex, query, completion]{
                updater.SubmitRead(readIndex, query, completion);
            }
        );
        (void)ScheduleRequestTimeout(
            [completion](Impl& impl){
                impl.watchRequests.ExpireDeadlines(impl.GetCurrentTime());
                ClientReply reply;
                reply.status = ClientReply::Status::Timeout;
                reply.leaderId = impl.leaderId;
                (void)completion->Resolve(reply);
            },
            deadline
        );
        SendHeartBeats();
        UpdateWatches();
        return future;
    }

    std::shared_future< ClientReply > Server::Impl::Watch(
        size_t index,
        ReplicationLevel level
    ) {
        const auto completion = std::make_shared< CompletionHandle >();
        const auto future = completion->GetFuture();
        if (!IsReadyLeader()) {
            (void)completion->Resolve(MakeNotLeaderReply());
            return future;
        }
        const auto deadline = GetCurrentTime() + serverConfiguration.watchTimeout;
        watchRequests.AddIndexWatch(index, level, deadline, completion);
        (void)ScheduleRequestTimeout(
            [](Impl& impl){
                impl.watchRequests.ExpireDeadlines(impl.GetCurrentTime());
            },
            deadline
        );
        UpdateWatches();
        return future;
    }

    std::shared_future< ClientReply > Server::Impl::ChangeConfiguration(
        const ClusterConfiguration& newConfiguration
    ) {
        const auto completion = std::make_shared< CompletionHandle >();
        const auto future = completion->GetFuture();
        if (!IsReadyLeader()) {
            (void)completion->Resolve(MakeNotLeaderReply());
            return future;
        }
        if (newConfiguration.instanceIds.empty()) {
            diagnosticsSender.SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Configuration change to an empty cluster rejected"
            );
            ClientReply reply;
            reply.status = ClientReply::Status::InvalidConfiguration;
            reply.leaderId = leaderId;
            (void)completion->Resolve(reply);
            return future;
        }
        const auto& effectiveConfiguration = state.GetEffectiveConfiguration();
        if (
            role.leader.configChangePending
            || (role.leader.configChangeCompletion != nullptr)
            || !effectiveConfiguration.IsStable()
            || !state.uncommittedConfigurations.empty()
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Configuration change to %s rejected; another is in progress",
                FormatSet(newConfiguration.instanceIds).c_str()
            );
            ClientReply reply;
            reply.status = ClientReply::Status::ConfigurationChangeInProgress;
            reply.leaderId = leaderId;
            (void)completion->Resolve(reply);
            return future;
        }
        if (newConfiguration == effectiveConfiguration.configuration) {
            ClientReply reply;
            reply.status = ClientReply::Status::Success;
            reply.leaderId = leaderId;
            reply.logIndex = effectiveConfiguration.logIndex;
            (void)completion->Resolve(reply);
            return future;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Configuration change requested (from %s to %s)",
            FormatSet(effectiveConfiguration.configuration.instanceIds).c_str(),
            FormatSet(newConfiguration.instanceIds).c_str()
        );
        role.leader.configChangePending = true;
        role.leader.newServerCatchUpIndex = state.commitIndex;
        role.leader.targetConfiguration = newConfiguration;
        role.leader.configChangeCompletion = completion;
        (void)ScheduleRequestTimeout(
            [completion](Impl& impl){
                impl.AbandonConfigChange(completion);
            },
            GetCurrentTime() + serverConfiguration.newServerCatchUpTimeout
        );
        SyncAppenders();
        const auto now = GetCurrentTime();
        for (auto& appender: role.leader.appenders) {
            appender.second->Replicate(now);
        }
        StartConfigChangeIfNewServersHaveCaughtUp();
        return future;
    }

}
