/**
 * @file WatchRequests.cpp
 *
 * This module contains the implementation of the Accord::WatchRequests
 * class.
 *
 * © 2020 by Richard Walters
 */

#include "WatchRequests.hpp"

#include <inttypes.h>
#include <list>

namespace {

    /**
     * This holds what is known about a caller waiting for a log index to
     * reach a level of replication.
     */
    struct IndexWatch {
        size_t index = 0;
        Accord::IServer::ReplicationLevel level = Accord::IServer::ReplicationLevel::Majority;
        double deadline = 0.0;
        std::shared_ptr< Accord::CompletionHandle > completion;
    };

    /**
     * This holds what is known about a caller waiting for the leadership
     * of the server to be confirmed.
     */
    struct LeadershipWatch {
        uint64_t term = 0;
        double since = 0.0;
        double deadline = 0.0;
        std::shared_ptr< Accord::CompletionHandle > completion;
        std::function< void() > onConfirmed;
    };

    /**
     * Return the highest index which has reached the given level of
     * replication, according to the given progress.
     */
    size_t IndexAtLevel(
        const Accord::WatchRequests::Progress& progress,
        Accord::IServer::ReplicationLevel level
    ) {
        switch (level) {
            case Accord::IServer::ReplicationLevel::Majority: return progress.majorityIndex;
            case Accord::IServer::ReplicationLevel::All: return progress.allIndex;
            case Accord::IServer::ReplicationLevel::MajorityCommitted: return progress.majorityCommitIndex;
            case Accord::IServer::ReplicationLevel::AllCommitted: return progress.allCommitIndex;
            default: return 0;
        }
    }

    Accord::ClientReply MakeWatchReply(size_t index) {
        Accord::ClientReply reply;
        reply.status = Accord::ClientReply::Status::Success;
        reply.logIndex = index;
        return reply;
    }

}

namespace Accord {

    /**
     * This contains the private properties of a WatchRequests instance.
     */
    struct WatchRequests::Impl {
        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::mutex mutex;

        /**
         * This holds how far the log was last known to be replicated.
         */
        Progress progress;

        std::list< IndexWatch > indexWatches;

        std::list< LeadershipWatch > leadershipWatches;

        Impl()
            : diagnosticsSender("Accord::WatchRequests")
        {
        }
    };

    WatchRequests::~WatchRequests() noexcept = default;

    WatchRequests::WatchRequests()
        : impl_(new Impl())
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate WatchRequests::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void WatchRequests::AddIndexWatch(
        size_t index,
        IServer::ReplicationLevel level,
        double deadline,
        const std::shared_ptr< CompletionHandle >& completion
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (IndexAtLevel(impl_->progress, level) >= index) {
            lock.unlock();
            (void)completion->Resolve(MakeWatchReply(index));
            return;
        }
        IndexWatch watch;
        watch.index = index;
        watch.level = level;
        watch.deadline = deadline;
        watch.completion = completion;
        impl_->indexWatches.push_back(std::move(watch));
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            1, "Watching index %zu (level %d)",
            index,
            (int)level
        );
    }

    void WatchRequests::AddLeadershipWatch(
        uint64_t term,
        double since,
        double deadline,
        const std::shared_ptr< CompletionHandle >& completion,
        std::function< void() > onConfirmed
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        LeadershipWatch watch;
        watch.term = term;
        watch.since = since;
        watch.deadline = deadline;
        watch.completion = completion;
        watch.onConfirmed = onConfirmed;
        impl_->leadershipWatches.push_back(std::move(watch));
    }

    void WatchRequests::UpdateProgress(const Progress& progress) {
        std::vector< IndexWatch > satisfied;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->progress = progress;
            auto watch = impl_->indexWatches.begin();
            while (watch != impl_->indexWatches.end()) {
                if (IndexAtLevel(progress, watch->level) >= watch->index) {
                    satisfied.push_back(std::move(*watch));
                    watch = impl_->indexWatches.erase(watch);
                } else {
                    ++watch;
                }
            }
        }
        for (const auto& watch: satisfied) {
            (void)watch.completion->Resolve(MakeWatchReply(watch.index));
        }
    }

    void WatchRequests::ConfirmLeadership(
        uint64_t term,
        const LeadershipCheck& isConfirmedSince
    ) {
        std::vector< LeadershipWatch > confirmed;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            auto watch = impl_->leadershipWatches.begin();
            while (watch != impl_->leadershipWatches.end()) {
                if (
                    (watch->term == term)
                    && isConfirmedSince(watch->since)
                ) {
                    confirmed.push_back(std::move(*watch));
                    watch = impl_->leadershipWatches.erase(watch);
                } else {
                    ++watch;
                }
            }
        }
        if (!confirmed.empty()) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                1, "Leadership confirmed for %zu watches in term %" PRIu64,
                confirmed.size(),
                term
            );
        }
        for (const auto& watch: confirmed) {
            watch.onConfirmed();
        }
    }

    void WatchRequests::ExpireDeadlines(double now) {
        std::vector< std::shared_ptr< CompletionHandle > > expired;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            auto indexWatch = impl_->indexWatches.begin();
            while (indexWatch != impl_->indexWatches.end()) {
                if (now >= indexWatch->deadline) {
                    expired.push_back(indexWatch->completion);
                    indexWatch = impl_->indexWatches.erase(indexWatch);
                } else {
                    ++indexWatch;
                }
            }
            auto leadershipWatch = impl_->leadershipWatches.begin();
            while (leadershipWatch != impl_->leadershipWatches.end()) {
                if (now >= leadershipWatch->deadline) {
                    expired.push_back(leadershipWatch->completion);
                    leadershipWatch = impl_->leadershipWatches.erase(leadershipWatch);
                } else {
                    ++leadershipWatch;
                }
            }
        }
        if (!expired.empty()) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "%zu watches timed out",
                expired.size()
            );
        }
        ClientReply reply;
        reply.status = ClientReply::Status::Timeout;
        for (const auto& completion: expired) {
            (void)completion->Resolve(reply);
        }
    }

    void WatchRequests::FailAll(const ClientReply& reply) {
        std::vector< std::shared_ptr< CompletionHandle > > failed;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            for (const auto& watch: impl_->indexWatches) {
                failed.push_back(watch.completion);
            }
            for (const auto& watch: impl_->leadershipWatches) {
                failed.push_back(watch.completion);
            }
            impl_->indexWatches.clear();
            impl_->leadershipWatches.clear();
            impl_->progress = Progress();
        }
        for (const auto& completion: failed) {
            (void)completion->Resolve(reply);
        }
    }

    size_t WatchRequests::GetSize() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->indexWatches.size() + impl_->leadershipWatches.size();
    }

    bool WatchRequests::HasLeadershipWatches() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return !impl_->leadershipWatches.empty();
    }

}
