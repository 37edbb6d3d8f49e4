/**
 * @file PendingRequests.cpp
 *
 * This module contains the implementation of the Accord::PendingRequests
 * class.
 *
 * © 2020 by Richard Walters
 */

#include "PendingRequests.hpp"

#include <inttypes.h>
#include <stdint.h>
#include <vector>

namespace Accord {

    PendingRequests::PendingRequests(RetryCache& retryCache)
        : diagnosticsSender_("Accord::PendingRequests")
        , retryCache_(retryCache)
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate PendingRequests::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return diagnosticsSender_.SubscribeToDiagnostics(delegate, minLevel);
    }

    void PendingRequests::Add(
        size_t index,
        const std::shared_ptr< RetryCache::CacheEntry >& cacheEntry
    ) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        requests_[index] = cacheEntry;
        diagnosticsSender_.SendDiagnosticInformationFormatted(
            0, "Call %s:%" PRIu64 " pending at index %zu",
            cacheEntry->invocationId.clientId.c_str(),
            cacheEntry->invocationId.callId,
            index
        );
    }

    bool PendingRequests::Resolve(
        size_t index,
        const ClientInvocationId& appliedInvocationId,
        const ClientReply& reply,
        double now
    ) {
        std::unique_lock< decltype(mutex_) > lock(mutex_);
        const auto requestsEntry = requests_.find(index);
        if (requestsEntry == requests_.end()) {
            return false;
        }
        const auto cacheEntry = requestsEntry->second;
        (void)requests_.erase(requestsEntry);
        lock.unlock();
        if (cacheEntry->invocationId == appliedInvocationId) {
            retryCache_.Complete(cacheEntry, reply, now);
        } else {
            diagnosticsSender_.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Call %s:%" PRIu64 " was replaced at index %zu",
                cacheEntry->invocationId.clientId.c_str(),
                cacheEntry->invocationId.callId,
                index
            );
            ClientReply failure;
            failure.status = ClientReply::Status::NotLeader;
            retryCache_.Fail(cacheEntry, failure, now);
        }
        return true;
    }

    void PendingRequests::FailFrom(
        size_t fromIndex,
        const ClientReply& reply,
        double now
    ) {
        std::vector< std::shared_ptr< RetryCache::CacheEntry > > failed;
        {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            const auto first = requests_.lower_bound(fromIndex);
            for (auto requestsEntry = first; requestsEntry != requests_.end(); ++requestsEntry) {
                failed.push_back(requestsEntry->second);
            }
            (void)requests_.erase(first, requests_.end());
        }
        if (!failed.empty()) {
            diagnosticsSender_.SendDiagnosticInformationFormatted(
                2, "Failing %zu pending requests from index %zu",
                failed.size(),
                fromIndex
            );
        }
        for (const auto& cacheEntry: failed) {
            retryCache_.Fail(cacheEntry, reply, now);
        }
    }

    void PendingRequests::FailAll(
        const ClientReply& reply,
        double now
    ) {
        FailFrom(0, reply, now);
    }

    size_t PendingRequests::GetSize() {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        return requests_.size();
    }

}
