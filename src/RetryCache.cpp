/**
 * @file RetryCache.cpp
 *
 * This module contains the implementation of the Accord::RetryCache class.
 *
 * © 2020 by Richard Walters
 */

#include "RetryCache.hpp"

#include <inttypes.h>
#include <stdint.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Accord {

    /**
     * This contains the private properties of a RetryCache instance.
     */
    struct RetryCache::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to synchronize access to the properties below
         * and to the cache entries.
         */
        std::mutex mutex;

        /**
         * This is how long, in seconds, completed requests are remembered.
         */
        double expiryTime = 60.0;

        /**
         * This is the number of completed requests beyond which the
         * oldest are forgotten.
         */
        size_t maximumSize = 4096;

        /**
         * This holds the cache entries, keyed by request identity.
         */
        std::map< ClientInvocationId, std::shared_ptr< CacheEntry > > entries;

        /**
         * This orders the requests which are no longer pending by the
         * time they stopped being pending.
         */
        std::multimap< double, ClientInvocationId > completionOrder;

        // Methods

        Impl()
            : diagnosticsSender("Accord::RetryCache")
        {
        }

        /**
         * Take the callers waiting on the given entry, so they can be
         * given their reply once the mutex is released.
         *
         * @param[in,out] entry
         *     This is the entry whose waiters to take.
         *
         * @return
         *     The callers which were waiting on the entry are returned.
         */
        std::vector< std::shared_ptr< CompletionHandle > > TakeWaiters(CacheEntry& entry) {
            std::vector< std::shared_ptr< CompletionHandle > > waiters;
            waiters.swap(entry.waiters);
            return waiters;
        }

        /**
         * Move the given entry out of the pending stage.
         *
         * @param[in,out] entry
         *     This is the entry to finish.
         *
         * @param[in] state
         *     This is the stage to which to move the entry.
         *
         * @param[in] reply
         *     This is the reply to record in the entry.
         *
         * @param[in] now
         *     This is the current time.
         */
        void Finish(
            CacheEntry& entry,
            CacheEntry::State state,
            const ClientReply& reply,
            double now
        ) {
            entry.state = state;
            entry.reply = reply;
            entry.completionTime = now;
            (void)completionOrder.insert({now, entry.invocationId});
        }

        /**
         * Forget the request with the given identity, if it is cached,
         * no longer pending, and finished at the given time.
         */
        bool Forget(
            const ClientInvocationId& invocationId,
            double completionTime
        ) {
            const auto entriesEntry = entries.find(invocationId);
            if (entriesEntry == entries.end()) {
                return false;
            }
            const auto& entry = entriesEntry->second;
            if (
                (entry->state == CacheEntry::State::Pending)
                || (entry->completionTime != completionTime)
            ) {
                return false;
            }
            (void)entries.erase(entriesEntry);
            return true;
        }
    };

    RetryCache::~RetryCache() noexcept = default;

    RetryCache::RetryCache()
        : impl_(new Impl())
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate RetryCache::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void RetryCache::SetLimits(
        double expiryTime,
        size_t maximumSize
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->expiryTime = expiryTime;
        impl_->maximumSize = maximumSize;
    }

    auto RetryCache::QueryOrCreate(const ClientInvocationId& invocationId) -> QueryResult {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        QueryResult result;
        auto& entry = impl_->entries[invocationId];
        if (
            (entry == nullptr)
            || (entry->state == CacheEntry::State::Failed)
        ) {
            if (entry != nullptr) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    1, "Replacing failed entry for call %s:%" PRIu64,
                    invocationId.clientId.c_str(),
                    invocationId.callId
                );
            }
            entry = std::make_shared< CacheEntry >();
            entry->invocationId = invocationId;
            result.isNew = true;
        }
        result.entry = entry;
        return result;
    }

    auto RetryCache::GetOrCreateEntry(const ClientInvocationId& invocationId) -> std::shared_ptr< CacheEntry > {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto& entry = impl_->entries[invocationId];
        if (entry == nullptr) {
            entry = std::make_shared< CacheEntry >();
            entry->invocationId = invocationId;
        }
        return entry;
    }

    auto RetryCache::GetIfPresent(const ClientInvocationId& invocationId) -> std::shared_ptr< CacheEntry > {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto entriesEntry = impl_->entries.find(invocationId);
        if (entriesEntry == impl_->entries.end()) {
            return nullptr;
        }
        return entriesEntry->second;
    }

    auto RetryCache::GetState(const std::shared_ptr< CacheEntry >& entry) -> CacheEntry::State {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return entry->state;
    }

    void RetryCache::AddWaiter(
        const std::shared_ptr< CacheEntry >& entry,
        const std::shared_ptr< CompletionHandle >& waiter
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (entry->state == CacheEntry::State::Pending) {
            entry->waiters.push_back(waiter);
            return;
        }
        const auto reply = entry->reply;
        lock.unlock();
        (void)waiter->Resolve(reply);
    }

    void RetryCache::Complete(
        const std::shared_ptr< CacheEntry >& entry,
        const ClientReply& reply,
        double now
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (entry->state == CacheEntry::State::Completed) {
            return;
        }
        impl_->Finish(*entry, CacheEntry::State::Completed, reply, now);
        const auto waiters = impl_->TakeWaiters(*entry);
        lock.unlock();
        for (const auto& waiter: waiters) {
            (void)waiter->Resolve(reply);
        }
    }

    void RetryCache::Fail(
        const std::shared_ptr< CacheEntry >& entry,
        const ClientReply& reply,
        double now
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (entry->state != CacheEntry::State::Pending) {
            return;
        }
        impl_->Finish(*entry, CacheEntry::State::Failed, reply, now);
        const auto waiters = impl_->TakeWaiters(*entry);
        lock.unlock();
        for (const auto& waiter: waiters) {
            (void)waiter->Resolve(reply);
        }
    }

    void RetryCache::NotifyTruncatedEntry(
        const ClientInvocationId& invocationId,
        int leaderId,
        double now
    ) {
        const auto entry = GetIfPresent(invocationId);
        if (entry == nullptr) {
            return;
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            2, "Call %s:%" PRIu64 " removed from log before commit",
            invocationId.clientId.c_str(),
            invocationId.callId
        );
        ClientReply reply;
        reply.status = ClientReply::Status::NotLeader;
        reply.leaderId = leaderId;
        Fail(entry, reply, now);
    }

    size_t RetryCache::EvictExpired(double now) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        size_t numEvicted = 0;
        while (!impl_->completionOrder.empty()) {
            const auto oldest = impl_->completionOrder.begin();
            const auto expired = (now - oldest->first >= impl_->expiryTime);
            const auto overflowing = (impl_->entries.size() > impl_->maximumSize);
            if (
                !expired
                && !overflowing
            ) {
                break;
            }
            if (impl_->Forget(oldest->second, oldest->first)) {
                ++numEvicted;
            }
            (void)impl_->completionOrder.erase(oldest);
        }
        if (numEvicted > 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                0, "Evicted %zu entries (%zu remain)",
                numEvicted,
                impl_->entries.size()
            );
        }
        return numEvicted;
    }

    size_t RetryCache::GetSize() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->entries.size();
    }

}
