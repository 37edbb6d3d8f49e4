/**
 * @file Server.cpp
 *
 * This module contains the implementation of the Accord::Server class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "CompletionHandle.hpp"
#include "Message.hpp"
#include "ServerImpl.hpp"

#include <Accord/ILog.hpp>
#include <Accord/LogEntry.hpp>
#include <Accord/Server.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <SystemAbstractions/CryptoRandom.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <thread>

namespace {

    /**
     * Return a future which already holds a reply indicating that the
     * server is not in a position to handle client requests.
     */
    std::shared_future< Accord::ClientReply > MakeNotLeaderFuture() {
        Accord::CompletionHandle completion;
        Accord::ClientReply reply;
        reply.status = Accord::ClientReply::Status::NotLeader;
        (void)completion.Resolve(reply);
        return completion.GetFuture();
    }

}

namespace Accord {

    Server::~Server() noexcept {
        if (impl_ != nullptr) {
            Demobilize();
        }
    }
    Server::Server(Server&&) noexcept = default;
    Server& Server::operator=(Server&&) noexcept = default;

    Server::Server()
        : impl_(new Impl())
    {
        SystemAbstractions::CryptoRandom jim;
        int seed;
        jim.Generate(&seed, sizeof(seed));
        impl_->rng.seed(seed);
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Server::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    auto Server::SubscribeToEvents(EventDelegate eventDelegate) -> EventsUnsubscribeDelegate {
        std::lock_guard< decltype(impl_->eventQueueMutex) > lock(impl_->eventQueueMutex);
        const auto eventSubscriberId = impl_->nextEventSubscriberId++;
        impl_->eventSubscribers[eventSubscriberId] = eventDelegate;
        const std::weak_ptr< Impl > implWeak = impl_;
        return [implWeak, eventSubscriberId]{
            const auto impl = implWeak.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->eventQueueMutex) > lock(impl->eventQueueMutex);
            (void)impl->eventSubscribers.erase(eventSubscriberId);
        };
    }

    bool Server::Mobilize(
        std::shared_ptr< ILog > logKeeper,
        std::shared_ptr< IPersistentState > persistentStateKeeper,
        std::shared_ptr< IStateMachine > stateMachine,
        std::shared_ptr< Timekeeping::Scheduler > scheduler,
        const ClusterConfiguration& clusterConfiguration,
        const ServerConfiguration& serverConfiguration
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->mobilized) {
            return !impl_->halted;
        }
        ++impl_->generation;
        impl_->mobilized = true;
        impl_->halted = false;
        impl_->serverConfiguration = serverConfiguration;
        impl_->scheduler = scheduler;
        impl_->stateMachine = stateMachine;
        impl_->state.log = logKeeper;
        impl_->state.persistentStateKeeper = persistentStateKeeper;
        impl_->state.persistentStateCache = persistentStateKeeper->Load();
        impl_->role.TransitionTo(IServer::ElectionState::Follower);
        impl_->leaderId = 0;
        impl_->lostMajorityHeartbeatsRecently = false;
        impl_->timeOfLastLeaderMessage = 0.0;
        impl_->requestTimeoutTokens.clear();

        // Forward diagnostics from the components of the server.
        std::weak_ptr< Impl > weakImpl(impl_);
        const auto forwardDiagnostics = [weakImpl](
            std::string senderName,
            size_t level,
            std::string message
        ){
            const auto impl = weakImpl.lock();
            if (impl == nullptr) {
                return;
            }
            impl->diagnosticsSender.SendDiagnosticInformationString(
                level,
                senderName + ": " + message
            );
        };
        impl_->componentDiagnosticsUnsubscribers = {
            impl_->appenderDiagnosticsSender.SubscribeToDiagnostics(
                forwardDiagnostics,
                serverConfiguration.logAppenderDiagnosticsLevel
            ),
            impl_->updater.SubscribeToDiagnostics(
                forwardDiagnostics,
                serverConfiguration.stateMachineUpdaterDiagnosticsLevel
            ),
            impl_->retryCache.SubscribeToDiagnostics(
                forwardDiagnostics,
                serverConfiguration.retryCacheDiagnosticsLevel
            ),
            impl_->pendingRequests.SubscribeToDiagnostics(
                forwardDiagnostics,
                serverConfiguration.pendingRequestsDiagnosticsLevel
            ),
            impl_->watchRequests.SubscribeToDiagnostics(
                forwardDiagnostics,
                serverConfiguration.watchRequestsDiagnosticsLevel
            ),
        };
        impl_->stopEventQueueWorker = false;
        impl_->eventQueueWorker = std::thread(&Impl::EventQueueWorker, impl_.get());

        // Check the log before taking part in the cluster.
        std::string reason;
        if (!impl_->state.ValidateLog(reason)) {
            impl_->Halt("log unusable (" + reason + ")");
            return false;
        }

        // Recover the configurations and the commit index.
        const auto baseIndex = logKeeper->GetBaseIndex();
        impl_->state.commitIndex = baseIndex;
        impl_->state.uncommittedConfigurations.clear();
        if (baseIndex == 0) {
            RaftConfiguration bootstrapConfiguration;
            bootstrapConfiguration.configuration = clusterConfiguration;
            impl_->state.configurationManager.Reset(bootstrapConfiguration);
        } else {
            impl_->state.configurationManager.Reset(
                RaftConfiguration::Decode(logKeeper->GetSnapshot()["configuration"])
            );
        }
        const auto lastIndex = logKeeper->GetLastIndex();
        for (size_t index = baseIndex + 1; index <= lastIndex; ++index) {
            const auto& entry = (*logKeeper)[index];
            if (entry.IsConfiguration()) {
                impl_->state.uncommittedConfigurations[index] = ServerState::ConfigurationFromEntry(entry);
            }
        }
        impl_->isVotingMember = impl_->state.GetEffectiveConfiguration().Contains(
            serverConfiguration.selfInstanceId
        );

        // Start applying committed entries.
        impl_->retryCache.SetLimits(
            serverConfiguration.retryCacheExpiryTime,
            serverConfiguration.retryCacheMaximumSize
        );
        impl_->updater.Start(
            stateMachine,
            impl_->MakeUpdaterDelegates(),
            baseIndex,
            serverConfiguration.autoSnapshotThreshold
        );
        if (baseIndex > 0) {
            impl_->updater.InstallSnapshot(
                logKeeper->GetSnapshot()["state"],
                baseIndex
            );
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Mobilized with log %zu..%zu in configuration %s",
            baseIndex,
            lastIndex,
            impl_->state.GetEffectiveConfiguration().ToString().c_str()
        );
        impl_->ResetElectionTimer();
        return true;
    }

    void Server::Demobilize() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return;
        }
        impl_->mobilized = false;
        const auto configChangeCompletion = impl_->role.leader.configChangeCompletion;
        impl_->CancelAllCallbacks();
        for (auto token: impl_->requestTimeoutTokens) {
            impl_->scheduler->Cancel(token);
        }
        impl_->requestTimeoutTokens.clear();
        impl_->role.TransitionTo(IServer::ElectionState::Follower);
        impl_->FailOutstandingRequests();
        if (configChangeCompletion != nullptr) {
            (void)configChangeCompletion->Resolve(impl_->MakeNotLeaderReply());
        }
        lock.unlock();
        impl_->updater.Stop();
        if (impl_->eventQueueWorker.joinable()) {
            std::unique_lock< decltype(impl_->eventQueueMutex) > eventQueueLock(impl_->eventQueueMutex);
            impl_->stopEventQueueWorker = true;
            impl_->eventQueueWorkerWakeCondition.notify_one();
            eventQueueLock.unlock();
            impl_->eventQueueWorker.join();
        }
        lock.lock();
        for (const auto& unsubscribe: impl_->componentDiagnosticsUnsubscribers) {
            unsubscribe();
        }
        impl_->componentDiagnosticsUnsubscribers.clear();
        impl_->scheduler = nullptr;
        impl_->stateMachine = nullptr;
        impl_->state.persistentStateKeeper = nullptr;
        impl_->state.log = nullptr;
    }

    void Server::ReceiveMessage(
        const std::string& serializedMessage,
        int senderInstanceNumber
    ) {
        Message message(serializedMessage);
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (
            !impl_->mobilized
            || impl_->halted
        ) {
            return;
        }
        switch (message.type) {
            case Message::Type::RequestVote: {
                impl_->OnReceiveRequestVote(
                    std::move(message),
                    senderInstanceNumber
                );
            } break;

            case Message::Type::RequestVoteResults: {
                impl_->OnReceiveRequestVoteResults(
                    std::move(message),
                    senderInstanceNumber
                );
            } break;

            case Message::Type::AppendEntries: {
                impl_->OnReceiveAppendEntries(
                    std::move(message),
                    senderInstanceNumber
                );
            } break;

            case Message::Type::AppendEntriesResults: {
                impl_->OnReceiveAppendEntriesResults(
                    std::move(message),
                    senderInstanceNumber
                );
            } break;

            case Message::Type::InstallSnapshot: {
                impl_->OnReceiveInstallSnapshot(
                    std::move(message),
                    senderInstanceNumber
                );
            } break;

            case Message::Type::InstallSnapshotResults: {
                impl_->OnReceiveInstallSnapshotResults(
                    std::move(message),
                    senderInstanceNumber
                );
            } break;

            default: {
            } break;
        }
    }

    auto Server::GetElectionState() -> ElectionState {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->role.electionState;
    }

    int Server::GetClusterLeaderId() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->leaderId;
    }

    std::shared_future< ClientReply > Server::Submit(
        const std::string& clientId,
        uint64_t callId,
        const std::string& content
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return MakeNotLeaderFuture();
        }
        return impl_->Submit(clientId, callId, content);
    }

    std::shared_future< ClientReply > Server::Read(
        const std::string& query,
        bool linearizable
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return MakeNotLeaderFuture();
        }
        return impl_->Read(query, linearizable);
    }

    std::shared_future< ClientReply > Server::Watch(
        size_t index,
        ReplicationLevel level
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return MakeNotLeaderFuture();
        }
        return impl_->Watch(index, level);
    }

    std::shared_future< ClientReply > Server::ChangeConfiguration(
        const ClusterConfiguration& newConfiguration
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return MakeNotLeaderFuture();
        }
        return impl_->ChangeConfiguration(newConfiguration);
    }

}
