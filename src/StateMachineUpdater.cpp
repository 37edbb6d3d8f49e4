/**
 * @file StateMachineUpdater.cpp
 *
 * This module contains the implementation of the
 * Accord::StateMachineUpdater class.
 *
 * © 2020 by Richard Walters
 */

#include "StateMachineUpdater.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdint.h>
#include <thread>
#include <vector>

namespace {

    /**
     * This holds a query waiting to be evaluated.
     */
    struct ReadRequest {
        size_t minAppliedIndex = 0;
        std::string query;
        std::shared_ptr< Accord::CompletionHandle > completion;
    };

    /**
     * This holds a snapshot waiting to be installed.
     */
    struct SnapshotInstallation {
        Json::Value snapshot;
        size_t lastIncludedIndex = 0;
    };

}

namespace Accord {

    /**
     * This contains the private properties of a StateMachineUpdater instance.
     */
    struct StateMachineUpdater::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        RetryCache& retryCache;

        PendingRequests& pendingRequests;

        std::shared_ptr< IStateMachine > stateMachine;

        Delegates delegates;

        size_t autoSnapshotThreshold = 0;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::mutex mutex;

        /**
         * This is used to wake the worker thread.
         */
        std::condition_variable workerWakeCondition;

        /**
         * This is used to wake callers waiting for entries to be applied.
         */
        std::condition_variable appliedCondition;

        std::thread worker;

        bool stopWorker = false;

        /**
         * This is incremented whenever the worker is given something new
         * to do, so that it can tell when to look again.
         */
        size_t workGeneration = 0;

        size_t commitIndex = 0;

        size_t lastAppliedIndex = 0;

        size_t lastSnapshotIndex = 0;

        std::deque< ReadRequest > reads;

        std::unique_ptr< SnapshotInstallation > snapshotInstallation;

        // Methods

        Impl(
            RetryCache& newRetryCache,
            PendingRequests& newPendingRequests
        )
            : diagnosticsSender("Accord::StateMachineUpdater")
            , retryCache(newRetryCache)
            , pendingRequests(newPendingRequests)
        {
        }

        /**
         * Give a NotLeader reply to every query waiting.
         *
         * @param[in,out] lock
         *     This is the lock held on the mutex, which is released while
         *     replies are given.
         */
        void FailReads(std::unique_lock< decltype(mutex) >& lock) {
            std::deque< ReadRequest > failed;
            failed.swap(reads);
            lock.unlock();
            ClientReply reply;
            reply.status = ClientReply::Status::NotLeader;
            for (const auto& read: failed) {
                (void)read.completion->Resolve(reply);
            }
            lock.lock();
        }

        /**
         * Evaluate every query whose entries have been applied.
         *
         * @param[in,out] lock
         *     This is the lock held on the mutex, which is released while
         *     queries are evaluated.
         *
         * @return
         *     An indication of whether or not any query was evaluated
         *     is returned.
         */
        bool RunReadyReads(std::unique_lock< decltype(mutex) >& lock) {
            std::vector< ReadRequest > ready;
            auto read = reads.begin();
            while (read != reads.end()) {
                if (read->minAppliedIndex <= lastAppliedIndex) {
                    ready.push_back(std::move(*read));
                    read = reads.erase(read);
                } else {
                    ++read;
                }
            }
            if (ready.empty()) {
                return false;
            }
            const auto appliedIndex = lastAppliedIndex;
            lock.unlock();
            for (const auto& readyRead: ready) {
                IStateMachine::Result result;
                ClientReply reply;
                reply.logIndex = appliedIndex;
                if (stateMachine->Query(readyRead.query, result)) {
                    reply.status = (
                        result.error
                        ? ClientReply::Status::StateMachineError
                        : ClientReply::Status::Success
                    );
                } else {
                    reply.status = ClientReply::Status::StateMachineError;
                }
                reply.result = std::move(result.value);
                (void)readyRead.completion->Resolve(reply);
            }
            lock.lock();
            return true;
        }

        /**
         * Apply the given entry to the state machine, and complete any
         * client request waiting on it.
         *
         * @param[in] entry
         *     This is the entry to apply.
         *
         * @return
         *     An indication of whether or not the entry was applied
         *     is returned.
         */
        bool Apply(const LogEntry& entry) {
            if (entry.command == nullptr) {
                return true;
            }
            if (entry.IsConfiguration()) {
                delegates.onConfigurationApplied(entry);
                return true;
            }
            IStateMachine::Result result;
            if (!stateMachine->Apply(entry, result)) {
                return false;
            }
            if (entry.command->GetType() != "Client") {
                return true;
            }
            const auto command = std::static_pointer_cast< ClientCommand >(entry.command);
            ClientInvocationId invocationId;
            invocationId.clientId = command->clientId;
            invocationId.callId = command->callId;
            ClientReply reply;
            reply.status = (
                result.error
                ? ClientReply::Status::StateMachineError
                : ClientReply::Status::Success
            );
            reply.result = std::move(result.value);
            reply.logIndex = entry.index;
            const auto now = delegates.getCurrentTime();
            (void)pendingRequests.Resolve(entry.index, invocationId, reply, now);
            retryCache.Complete(
                retryCache.GetOrCreateEntry(invocationId),
                reply,
                now
            );
            return true;
        }

        /**
         * Take a snapshot of the state machine, if enough entries have
         * been applied since the last one.
         */
        void TakeSnapshotIfDue(size_t appliedIndex) {
            if (autoSnapshotThreshold == 0) {
                return;
            }
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                if (appliedIndex - lastSnapshotIndex < autoSnapshotThreshold) {
                    return;
                }
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                3, "Taking snapshot at index %zu",
                appliedIndex
            );
            const auto snapshot = stateMachine->TakeSnapshot();
            delegates.onSnapshotTaken(snapshot, appliedIndex);
            std::lock_guard< decltype(mutex) > lock(mutex);
            lastSnapshotIndex = appliedIndex;
        }

        /**
         * This is the body of the worker thread.
         */
        void Worker() {
            std::unique_lock< decltype(mutex) > lock(mutex);
            diagnosticsSender.SendDiagnosticInformationString(
                0,
                "State machine updater thread started"
            );
            while (!stopWorker) {
                if (snapshotInstallation != nullptr) {
                    std::unique_ptr< SnapshotInstallation > installation;
                    installation.swap(snapshotInstallation);
                    lock.unlock();
                    stateMachine->InstallSnapshot(
                        installation->snapshot,
                        installation->lastIncludedIndex
                    );
                    lock.lock();
                    if (installation->lastIncludedIndex > lastAppliedIndex) {
                        lastAppliedIndex = installation->lastIncludedIndex;
                    }
                    lastSnapshotIndex = installation->lastIncludedIndex;
                    appliedCondition.notify_all();
                    continue;
                }
                if (RunReadyReads(lock)) {
                    continue;
                }
                if (lastAppliedIndex < commitIndex) {
                    const auto index = lastAppliedIndex + 1;
                    const auto generationBeforeFetch = workGeneration;
                    lock.unlock();
                    LogEntry entry;
                    const auto fetched = delegates.getEntry(index, entry);
                    lock.lock();
                    if (
                        !fetched
                        || (snapshotInstallation != nullptr)
                        || (lastAppliedIndex >= index)
                    ) {
                        if (!fetched) {
                            workerWakeCondition.wait(
                                lock,
                                [this, generationBeforeFetch]{
                                    return (
                                        stopWorker
                                        || (workGeneration != generationBeforeFetch)
                                    );
                                }
                            );
                        }
                        continue;
                    }
                    lock.unlock();
                    if (!Apply(entry)) {
                        diagnosticsSender.SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                            "State machine failed to apply entry %zu",
                            index
                        );
                        delegates.onFatalError("state machine failed to apply entry");
                        lock.lock();
                        stopWorker = true;
                        break;
                    }
                    lock.lock();
                    lastAppliedIndex = index;
                    appliedCondition.notify_all();
                    lock.unlock();
                    delegates.onApplied(index);
                    TakeSnapshotIfDue(index);
                    (void)retryCache.EvictExpired(delegates.getCurrentTime());
                    lock.lock();
                    continue;
                }
                const auto generationBeforeWait = workGeneration;
                workerWakeCondition.wait(
                    lock,
                    [this, generationBeforeWait]{
                        return (
                            stopWorker
                            || (workGeneration != generationBeforeWait)
                        );
                    }
                );
            }
            FailReads(lock);
            diagnosticsSender.SendDiagnosticInformationString(
                0,
                "State machine updater thread stopping"
            );
        }
    };

    StateMachineUpdater::~StateMachineUpdater() noexcept {
        Stop();
    }

    StateMachineUpdater::StateMachineUpdater(
        RetryCache& retryCache,
        PendingRequests& pendingRequests
    )
        : impl_(new Impl(retryCache, pendingRequests))
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate StateMachineUpdater::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void StateMachineUpdater::Start(
        std::shared_ptr< IStateMachine > stateMachine,
        const Delegates& delegates,
        size_t lastAppliedIndex,
        size_t autoSnapshotThreshold
    ) {
        Stop();
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->stateMachine = stateMachine;
        impl_->delegates = delegates;
        impl_->autoSnapshotThreshold = autoSnapshotThreshold;
        impl_->lastAppliedIndex = lastAppliedIndex;
        impl_->lastSnapshotIndex = lastAppliedIndex;
        impl_->commitIndex = std::max(impl_->commitIndex, lastAppliedIndex);
        impl_->stopWorker = false;
        impl_->worker = std::thread(&Impl::Worker, impl_.get());
    }

    void StateMachineUpdater::Stop() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->worker.joinable()) {
            return;
        }
        impl_->stopWorker = true;
        impl_->workerWakeCondition.notify_all();
        if (impl_->worker.get_id() == std::this_thread::get_id()) {
            return;
        }
        lock.unlock();
        impl_->worker.join();
        lock.lock();
        impl_->worker = std::thread();
        impl_->snapshotInstallation.reset();
        impl_->commitIndex = 0;
        impl_->FailReads(lock);
    }

    void StateMachineUpdater::NotifyCommitIndex(size_t commitIndex) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (commitIndex <= impl_->commitIndex) {
            return;
        }
        impl_->commitIndex = commitIndex;
        ++impl_->workGeneration;
        impl_->workerWakeCondition.notify_all();
    }

    void StateMachineUpdater::InstallSnapshot(
        const Json::Value& snapshot,
        size_t lastIncludedIndex
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3, "Installing snapshot covering entries through %zu",
            lastIncludedIndex
        );
        impl_->snapshotInstallation.reset(new SnapshotInstallation());
        impl_->snapshotInstallation->snapshot = snapshot;
        impl_->snapshotInstallation->lastIncludedIndex = lastIncludedIndex;
        if (lastIncludedIndex > impl_->commitIndex) {
            impl_->commitIndex = lastIncludedIndex;
        }
        ++impl_->workGeneration;
        impl_->workerWakeCondition.notify_all();
    }

    void StateMachineUpdater::SubmitRead(
        size_t minAppliedIndex,
        const std::string& query,
        const std::shared_ptr< CompletionHandle >& completion
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->worker.joinable() || impl_->stopWorker) {
            lock.unlock();
            ClientReply reply;
            reply.status = ClientReply::Status::NotLeader;
            (void)completion->Resolve(reply);
            return;
        }
        ReadRequest read;
        read.minAppliedIndex = minAppliedIndex;
        read.query = query;
        read.completion = completion;
        impl_->reads.push_back(std::move(read));
        ++impl_->workGeneration;
        impl_->workerWakeCondition.notify_all();
    }

    size_t StateMachineUpdater::GetLastAppliedIndex() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->lastAppliedIndex;
    }

    size_t StateMachineUpdater::GetLastSnapshotIndex() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->lastSnapshotIndex;
    }

    bool StateMachineUpdater::AwaitApplied(
        size_t index,
        double timeout
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->appliedCondition.wait_for(
            lock,
            std::chrono::milliseconds((int)(timeout * 1000.0)),
            [this, index]{
                return (impl_->lastAppliedIndex >= index);
            }
        );
    }

}
