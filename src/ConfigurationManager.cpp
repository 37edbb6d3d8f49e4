/**
 * @file ConfigurationManager.cpp
 *
 * This module contains the implementation of the
 * Accord::ConfigurationManager class.
 *
 * © 2020 by Richard Walters
 */

#include "ConfigurationManager.hpp"

namespace Accord {

    void ConfigurationManager::AddConfiguration(const RaftConfiguration& configuration) {
        (void)configurations_.erase(
            configurations_.lower_bound(configuration.logIndex),
            configurations_.end()
        );
        configurations_[configuration.logIndex] = configuration;
    }

    const RaftConfiguration& ConfigurationManager::GetCurrent() const {
        if (configurations_.empty()) {
            return emptyConfiguration_;
        }
        return configurations_.rbegin()->second;
    }

    const RaftConfiguration& ConfigurationManager::GetConfiguration(size_t asOf) const {
        if (configurations_.empty()) {
            return emptyConfiguration_;
        }
        auto configuration = configurations_.upper_bound(asOf);
        if (configuration == configurations_.begin()) {
            return configuration->second;
        }
        --configuration;
        return configuration->second;
    }

    bool ConfigurationManager::RemoveConfigurations(size_t fromIndex) {
        if (configurations_.size() < 2) {
            return false;
        }
        auto first = configurations_.lower_bound(fromIndex);
        if (first == configurations_.begin()) {
            ++first;
        }
        if (first == configurations_.end()) {
            return false;
        }
        (void)configurations_.erase(first, configurations_.end());
        return true;
    }

    void ConfigurationManager::PruneBefore(size_t index) {
        auto inEffect = configurations_.upper_bound(index);
        if (inEffect == configurations_.begin()) {
            return;
        }
        --inEffect;
        (void)configurations_.erase(configurations_.begin(), inEffect);
    }

    void ConfigurationManager::Reset(const RaftConfiguration& configuration) {
        configurations_.clear();
        configurations_[configuration.logIndex] = configuration;
    }

    size_t ConfigurationManager::GetNumConfigurations() const {
        return configurations_.size();
    }

}
