/**
 * @file RaftConfiguration.cpp
 *
 * This module contains the implementation of the Accord::RaftConfiguration
 * structure methods.
 *
 * © 2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <Accord/RaftConfiguration.hpp>
#include <algorithm>
#include <sstream>
#include <vector>

namespace {

    bool HasMajorityOf(
        const std::set< int >& members,
        const std::set< int >& instanceIds
    ) {
        if (members.empty()) {
            return false;
        }
        size_t count = 0;
        for (auto instanceId: instanceIds) {
            if (members.find(instanceId) != members.end()) {
                ++count;
            }
        }
        return (count > members.size() / 2);
    }

    /**
     * Return the highest index which at least a majority of the given
     * members have reached.
     */
    size_t MajorityIndexOf(
        const std::set< int >& members,
        const Accord::RaftConfiguration::IndexLookup& indexOf
    ) {
        if (members.empty()) {
            return 0;
        }
        std::vector< size_t > indices;
        indices.reserve(members.size());
        for (auto instanceId: members) {
            indices.push_back(indexOf(instanceId));
        }
        std::sort(indices.begin(), indices.end());
        return indices[(indices.size() - 1) / 2];
    }

    Json::Value EncodeInstanceIds(const std::set< int >& instanceIds) {
        auto instanceIdsArray = Json::Array({});
        for (auto instanceId: instanceIds) {
            instanceIdsArray.Add(instanceId);
        }
        return instanceIdsArray;
    }

    std::set< int > DecodeInstanceIds(const Json::Value& instanceIdsArray) {
        std::set< int > instanceIds;
        for (size_t i = 0; i < instanceIdsArray.GetSize(); ++i) {
            (void)instanceIds.insert(instanceIdsArray[i]);
        }
        return instanceIds;
    }

}

namespace Accord {

    bool RaftConfiguration::IsStable() const {
        return !transitional;
    }

    bool RaftConfiguration::Contains(int instanceId) const {
        if (configuration.instanceIds.find(instanceId) != configuration.instanceIds.end()) {
            return true;
        }
        return (
            transitional
            && (oldConfiguration.instanceIds.find(instanceId) != oldConfiguration.instanceIds.end())
        );
    }

    std::set< int > RaftConfiguration::GetAllInstanceIds() const {
        auto instanceIds = configuration.instanceIds;
        if (transitional) {
            instanceIds.insert(
                oldConfiguration.instanceIds.begin(),
                oldConfiguration.instanceIds.end()
            );
        }
        return instanceIds;
    }

    bool RaftConfiguration::HasMajority(const std::set< int >& instanceIds) const {
        if (!HasMajorityOf(configuration.instanceIds, instanceIds)) {
            return false;
        }
        return (
            !transitional
            || HasMajorityOf(oldConfiguration.instanceIds, instanceIds)
        );
    }

    size_t RaftConfiguration::GetMajorityIndex(const IndexLookup& indexOf) const {
        auto majorityIndex = MajorityIndexOf(configuration.instanceIds, indexOf);
        if (transitional) {
            majorityIndex = std::min(
                majorityIndex,
                MajorityIndexOf(oldConfiguration.instanceIds, indexOf)
            );
        }
        return majorityIndex;
    }

    size_t RaftConfiguration::GetMinimumIndex(const IndexLookup& indexOf) const {
        const auto instanceIds = GetAllInstanceIds();
        if (instanceIds.empty()) {
            return 0;
        }
        size_t minimumIndex = ~(size_t)0;
        for (auto instanceId: instanceIds) {
            minimumIndex = std::min(minimumIndex, indexOf(instanceId));
        }
        return minimumIndex;
    }

    Json::Value RaftConfiguration::Encode() const {
        auto json = Json::Object({
            {"instanceIds", EncodeInstanceIds(configuration.instanceIds)},
            {"transitional", transitional},
            {"logIndex", logIndex},
        });
        if (transitional) {
            json["oldInstanceIds"] = EncodeInstanceIds(oldConfiguration.instanceIds);
        }
        return json;
    }

    RaftConfiguration RaftConfiguration::Decode(const Json::Value& json) {
        RaftConfiguration decoded;
        decoded.configuration.instanceIds = DecodeInstanceIds(json["instanceIds"]);
        decoded.transitional = json["transitional"];
        decoded.logIndex = json["logIndex"];
        if (decoded.transitional) {
            decoded.oldConfiguration.instanceIds = DecodeInstanceIds(json["oldInstanceIds"]);
        }
        return decoded;
    }

    std::string RaftConfiguration::ToString() const {
        std::ostringstream rendering;
        if (transitional) {
            rendering << FormatSet(oldConfiguration.instanceIds) << " -> ";
        }
        rendering << FormatSet(configuration.instanceIds) << " @" << logIndex;
        return rendering.str();
    }

    bool RaftConfiguration::operator==(const RaftConfiguration& other) const {
        if (
            (transitional != other.transitional)
            || (configuration != other.configuration)
        ) {
            return false;
        }
        return (
            !transitional
            || (oldConfiguration == other.oldConfiguration)
        );
    }

    bool RaftConfiguration::operator!=(const RaftConfiguration& other) const {
        return !(*this == other);
    }

}
