/**
 * @file ServerIntrospection.cpp
 *
 * This module contains the implementation of the
 * Accord::ServerIntrospection structure.
 *
 * © 2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "ServerIntrospection.hpp"

#include <mutex>

namespace Accord {

    ServerIntrospection::ServerIntrospection(Server& server)
        : impl_(server.impl_)
    {
    }

    uint64_t ServerIntrospection::GetCurrentTerm() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->state.persistentStateCache.currentTerm;
    }

    size_t ServerIntrospection::GetCommitIndex() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->state.commitIndex;
    }

    size_t ServerIntrospection::GetLastAppliedIndex() {
        return impl_->updater.GetLastAppliedIndex();
    }

    size_t ServerIntrospection::GetLastIndex() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state.log == nullptr) {
            return 0;
        }
        return impl_->state.GetLastIndex();
    }

    uint64_t ServerIntrospection::GetLogTerm(size_t index) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state.log == nullptr) {
            return 0;
        }
        return impl_->state.log->GetTerm(index);
    }

    RaftConfiguration ServerIntrospection::GetEffectiveConfiguration() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->state.GetEffectiveConfiguration();
    }

    RaftConfiguration ServerIntrospection::GetCommittedConfiguration() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->state.configurationManager.GetCurrent();
    }

    bool ServerIntrospection::IsVotingMember() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->isVotingMember;
    }

    size_t ServerIntrospection::GetNextIndex(int instanceId) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto appendersEntry = impl_->role.leader.appenders.find(instanceId);
        if (appendersEntry == impl_->role.leader.appenders.end()) {
            return 0;
        }
        return appendersEntry->second->GetProgress().nextIndex;
    }

    size_t ServerIntrospection::GetMatchIndex(int instanceId) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state.log == nullptr) {
            return 0;
        }
        return impl_->GetMatchIndex(instanceId);
    }

    size_t ServerIntrospection::GetRetryCacheSize() {
        return impl_->retryCache.GetSize();
    }

    bool ServerIntrospection::GetRetryCacheEntryState(
        const std::string& clientId,
        uint64_t callId,
        RetryCache::CacheEntry::State& state
    ) {
        ClientInvocationId invocationId;
        invocationId.clientId = clientId;
        invocationId.callId = callId;
        const auto entry = impl_->retryCache.GetIfPresent(invocationId);
        if (entry == nullptr) {
            return false;
        }
        state = impl_->retryCache.GetState(entry);
        return true;
    }

    size_t ServerIntrospection::GetLatestSnapshotIndex() {
        return impl_->updater.GetLastSnapshotIndex();
    }

    bool ServerIntrospection::LostMajorityHeartbeatsRecently() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->lostMajorityHeartbeatsRecently;
    }

    size_t ServerIntrospection::GetNumPendingRequests() {
        return impl_->pendingRequests.GetSize();
    }

    bool ServerIntrospection::IsHalted() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->halted;
    }

    bool ServerIntrospection::IsLeaderReady() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->IsReadyLeader();
    }

    void ServerIntrospection::RestartAppenders() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->role.IsLeader()) {
            return;
        }
        impl_->diagnosticsSender.SendDiagnosticInformationString(
            2,
            "Restarting log appenders"
        );
        const auto now = impl_->GetCurrentTime();
        for (auto& appender: impl_->role.leader.appenders) {
            appender.second->Restart();
            appender.second->Replicate(now);
        }
    }

    bool ServerIntrospection::AwaitApplied(
        size_t index,
        double timeout
    ) {
        return impl_->updater.AwaitApplied(index, timeout);
    }

}
