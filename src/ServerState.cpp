/**
 * @file ServerState.cpp
 *
 * This module contains the implementation of the Accord::ServerState
 * structure methods.
 *
 * © 2020 by Richard Walters
 */

#include "ServerState.hpp"

#include <string>

namespace Accord {

    const RaftConfiguration& ServerState::GetEffectiveConfiguration() const {
        if (uncommittedConfigurations.empty()) {
            return configurationManager.GetCurrent();
        }
        return uncommittedConfigurations.rbegin()->second;
    }

    size_t ServerState::GetLastIndex() const {
        return log->GetLastIndex();
    }

    uint64_t ServerState::GetLastTerm() const {
        return log->GetTerm(log->GetLastIndex());
    }

    void ServerState::UpdateCurrentTerm(uint64_t newTerm) {
        persistentStateCache.currentTerm = newTerm;
        persistentStateCache.votedThisTerm = false;
        persistentStateCache.votedFor = 0;
        persistentStateKeeper->Save(persistentStateCache);
    }

    void ServerState::VoteFor(int instanceId) {
        persistentStateCache.votedThisTerm = true;
        persistentStateCache.votedFor = instanceId;
        persistentStateKeeper->Save(persistentStateCache);
    }

    bool ServerState::IsLogAsUpToDate(
        uint64_t lastLogTerm,
        size_t lastLogIndex
    ) const {
        const auto ourLastTerm = GetLastTerm();
        if (lastLogTerm != ourLastTerm) {
            return (lastLogTerm > ourLastTerm);
        }
        return (lastLogIndex >= GetLastIndex());
    }

    bool ServerState::AppendEntries(const std::vector< LogEntry >& entries) {
        if (entries.empty()) {
            return false;
        }
        log->Append(entries);
        log->Flush();
        bool configurationChanged = false;
        for (const auto& entry: entries) {
            if (entry.IsConfiguration()) {
                uncommittedConfigurations[entry.index] = ConfigurationFromEntry(entry);
                configurationChanged = true;
            }
        }
        return configurationChanged;
    }

    bool ServerState::TruncateLog(size_t fromIndex) {
        log->Truncate(fromIndex);
        bool configurationChanged = configurationManager.RemoveConfigurations(fromIndex);
        const auto firstRemoved = uncommittedConfigurations.lower_bound(fromIndex);
        if (firstRemoved != uncommittedConfigurations.end()) {
            uncommittedConfigurations.erase(firstRemoved, uncommittedConfigurations.end());
            configurationChanged = true;
        }
        return configurationChanged;
    }

    void ServerState::CommitConfiguration(const RaftConfiguration& configuration) {
        configurationManager.AddConfiguration(configuration);
        (void)uncommittedConfigurations.erase(
            uncommittedConfigurations.begin(),
            uncommittedConfigurations.upper_bound(configuration.logIndex)
        );
    }

    bool ServerState::ValidateLog(std::string& reason) {
        const auto baseIndex = log->GetBaseIndex();
        const auto lastIndex = log->GetLastIndex();
        if (lastIndex < baseIndex) {
            reason = "last index precedes snapshot";
            return false;
        }
        uint64_t previousTerm = log->GetTerm(baseIndex);
        for (size_t index = baseIndex + 1; index <= lastIndex; ++index) {
            const auto& entry = (*log)[index];
            if (entry.index != index) {
                reason = (
                    "entry at index " + std::to_string(index)
                    + " claims index " + std::to_string(entry.index)
                );
                return false;
            }
            if (entry.term < previousTerm) {
                reason = "term decreases at index " + std::to_string(index);
                return false;
            }
            if (entry.term > persistentStateCache.currentTerm) {
                reason = (
                    "entry at index " + std::to_string(index)
                    + " has term " + std::to_string(entry.term)
                    + " beyond current term " + std::to_string(persistentStateCache.currentTerm)
                );
                return false;
            }
            previousTerm = entry.term;
        }
        return true;
    }

    RaftConfiguration ServerState::ConfigurationFromEntry(const LogEntry& entry) {
        RaftConfiguration configuration;
        configuration.logIndex = entry.index;
        if (entry.command->GetType() == "JointConfiguration") {
            const auto command = std::static_pointer_cast< JointConfigurationCommand >(entry.command);
            configuration.configuration = command->newConfiguration;
            configuration.oldConfiguration = command->oldConfiguration;
            configuration.transitional = true;
        } else {
            const auto command = std::static_pointer_cast< SingleConfigurationCommand >(entry.command);
            configuration.configuration = command->configuration;
        }
        return configuration;
    }

}
