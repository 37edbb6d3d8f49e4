#ifndef ACCORD_ROLE_STATE_HPP
#define ACCORD_ROLE_STATE_HPP

/**
 * @file RoleState.hpp
 *
 * This module declares the Accord::RoleState structure and the
 * role-specific state it carries.
 *
 * © 2020 by Richard Walters
 */

#include "CompletionHandle.hpp"
#include "LogAppender.hpp"

#include <Accord/ClusterConfiguration.hpp>
#include <Accord/IServer.hpp>
#include <map>
#include <memory>
#include <set>
#include <stddef.h>

namespace Accord {

    /**
     * This is the state a server keeps only while it is a follower.
     */
    struct FollowerState {
        /**
         * This indicates whether or not the leader of the current term
         * has been announced.
         */
        bool thisTermLeaderAnnounced = false;
    };

    /**
     * This is the state a server keeps only while it is a candidate.
     */
    struct CandidateState {
        /**
         * These are the unique identifiers of the servers which have
         * voted for us in the current term, including ourselves.
         */
        std::set< int > votesForUs;

        /**
         * These are the tokens of the scheduled retransmissions of vote
         * requests, keyed by the unique identifiers of the servers which
         * have not yet answered.
         */
        std::map< int, int > voteRetransmitTokens;
    };

    /**
     * This is the state a server keeps only while it is the leader.
     */
    struct LeaderState {
        /**
         * These are the appenders replicating the log to every other
         * server in the effective configuration, and to any server
         * being brought in by a configuration change.
         */
        std::map< int, std::unique_ptr< LogAppender > > appenders;

        /**
         * This is the index of the empty entry appended at the start
         * of the term.
         */
        size_t startupIndex = 0;

        /**
         * This indicates whether or not the empty entry appended at the
         * start of the term has been applied, so that client requests
         * may be handled.
         */
        bool ready = false;

        /**
         * This indicates whether or not new servers are being brought
         * up to date before a configuration change.
         */
        bool configChangePending = false;

        /**
         * This is the index new servers must reach before the joint
         * configuration is appended.
         */
        size_t newServerCatchUpIndex = 0;

        /**
         * This is the configuration to which the cluster is being changed.
         */
        ClusterConfiguration targetConfiguration;

        /**
         * This is the index of the new stable configuration entry, once it
         * has been appended.
         */
        size_t targetConfigurationIndex = 0;

        /**
         * This is used to give the reply to the configuration change
         * request in progress, if any.
         */
        std::shared_ptr< CompletionHandle > configChangeCompletion;
    };

    /**
     * This holds which role the server has, along with the state that
     * goes with that role.  Only the state of the current role is
     * meaningful; the state of the other roles is reset on each
     * transition.
     */
    struct RoleState {
        // Properties

        IServer::ElectionState electionState = IServer::ElectionState::Follower;

        FollowerState follower;

        CandidateState candidate;

        LeaderState leader;

        // Methods

        /**
         * Change to the given role, starting it with fresh state.
         *
         * @param[in] newElectionState
         *     This is the role to which to change.
         */
        void TransitionTo(IServer::ElectionState newElectionState) {
            electionState = newElectionState;
            follower = FollowerState();
            candidate = CandidateState();
            for (auto& appender: leader.appenders) {
                appender.second->Cancel();
            }
            leader = LeaderState();
        }

        bool IsLeader() const {
            return (electionState == IServer::ElectionState::Leader);
        }
    };

}

#endif /* ACCORD_ROLE_STATE_HPP */
