/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file ConflictResolver.h
 * @brief Arbitration between competing writes to the same versioned entity
 *
 * The optimistic lock manager tells a writer that it lost. The resolver
 * decides who wins when several writers show up for the same entity in the
 * same resolution window, so the winner is chosen by policy instead of by
 * whichever thread happened to reach the slot mutex first.
 */

#pragma once

#include "CoordinationErrors.h"
#include "../Core/CircularBuffer.h"
#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief One contender's bid for an entity
     */
    struct ConflictClaim {
        AgentId agentId;
        uint64_t requestedVersion = 0;   ///< Version the claimant based its write on
        TimePoint timestamp = Clock::now();
        int priority = 0;                ///< Priority of the task behind the claim
    };

    /**
     * @brief Two or more claims on one entity in one resolution window
     */
    struct ConflictRecord {
        std::string subjectId;
        std::vector<ConflictClaim> claims;
        std::string strategy;
        std::optional<ConflictClaim> winner;
        /// Voter agent → agent it voted for
        std::map<AgentId, AgentId> votes;
        TimePoint createdAt = Clock::now();
    };

    /**
     * @brief Policy that picks the winning claim
     *
     * Implementations must be deterministic for a given record so every
     * observer agrees on the outcome.
     */
    class IConflictResolutionStrategy {
    public:
        virtual ~IConflictResolutionStrategy() = default;

        /// Index of the winning claim; record.claims is never empty
        virtual size_t selectWinner(const ConflictRecord& record) const = 0;
        virtual const char* getName() const = 0;
    };

    /**
     * @brief Higher priority wins, then earlier timestamp, then lower agent id
     */
    class PriorityResolutionStrategy : public IConflictResolutionStrategy {
    public:
        size_t selectWinner(const ConflictRecord& record) const override;
        const char* getName() const override { return "priority"; }
    };

    /**
     * @brief Earliest claim wins, then higher priority, then lower agent id
     */
    class TimestampResolutionStrategy : public IConflictResolutionStrategy {
    public:
        size_t selectWinner(const ConflictRecord& record) const override;
        const char* getName() const override { return "timestamp"; }
    };

    /**
     * @brief Majority vote among the agents that hold a claim
     *
     * Quorum: the electorate is exactly the set of distinct agents with a
     * claim in the record. Each of them gets one vote, recorded in
     * ConflictRecord::votes; votes from agents outside the electorate and
     * votes for agents without a claim are ignored, and a claimant that did
     * not vote abstains. A candidate wins outright when its votes are strictly
     * greater than quorum × electorate size. Without such a winner, or when the
     * top vote count is shared, the decision falls back to the priority rule
     * among the tied leaders (all claims if nobody voted).
     */
    class VotingResolutionStrategy : public IConflictResolutionStrategy {
    public:
        struct Config {
            double quorum = 0.5;   ///< Fraction of the electorate a winner must exceed
        };

        VotingResolutionStrategy() = default;
        explicit VotingResolutionStrategy(Config config) : _config(config) {}

        size_t selectWinner(const ConflictRecord& record) const override;
        const char* getName() const override { return "voting"; }

    private:
        Config _config;
    };

    enum class ConflictStrategyKind : uint8_t {
        Priority,
        Timestamp,
        Voting
    };

    std::unique_ptr<IConflictResolutionStrategy> makeConflictStrategy(ConflictStrategyKind kind,
                                                                       double votingQuorum = 0.5);

    enum class ClaimOutcome : uint8_t {
        Pending,    ///< Window not resolved yet
        Won,        ///< Chosen and applied
        Rejected,   ///< Lost to another claim; resubmit against the new version
        Stale,      ///< Chosen, but the entity had already moved on
        Failed      ///< Chosen, and the write threw something other than a version conflict
    };

    const char* claimOutcomeToString(ClaimOutcome outcome);

    /**
     * @brief Arbitrates concurrent writes and applies the winner
     *
     * A Proposal pairs a claim with the write that realises it. The write is
     * expected to be an OptimisticLockManager::tryUpdate() against
     * claim.requestedVersion, so a stale winner surfaces as a
     * VersionConflictError and is reported as ClaimOutcome::Stale.
     *
     * Two ways to use it:
     * - arbitrate(): the caller already holds every competing proposal.
     * - submit() + resolvePending(): proposals arrive from different threads
     *   and collect in a per-subject window until the next resolution pass
     *   (the scheduler runs one at the start of every scheduling pass).
     *
     * @code
     * ConflictResolver resolver(makeConflictStrategy(ConflictStrategyKind::Priority));
     *
     * auto snap = tasks.get("deploy");
     * resolver.submit("deploy", {{"agent-1", snap.version, Clock::now(), 5},
     *                            [&] { tasks.tryUpdate("deploy", snap.version, claimFor("agent-1")); }});
     * resolver.submit("deploy", {{"agent-2", snap.version, Clock::now(), 9},
     *                            [&] { tasks.tryUpdate("deploy", snap.version, claimFor("agent-2")); }});
     * resolver.resolvePending();   // agent-2 wins on priority, agent-1 is rejected
     * @endcode
     */
    class ConflictResolver {
    public:
        using Ticket = uint64_t;

        struct Proposal {
            ConflictClaim claim;
            std::function<void()> apply;
            std::function<void(ClaimOutcome)> onResolved;   ///< Optional
        };

        struct ArbitrationResult {
            std::optional<size_t> winner;                ///< Index into the proposals
            std::vector<ClaimOutcome> outcomes;          ///< One per proposal
            std::optional<ConflictRecord> conflict;      ///< Set when there was more than one proposal
            std::exception_ptr error;                    ///< Non-conflict failure of the winning write

            bool applied() const {
                return winner && outcomes[*winner] == ClaimOutcome::Won;
            }
        };

        struct Stats {
            uint64_t arbitrations = 0;   ///< Windows resolved, contested or not
            uint64_t conflicts = 0;      ///< Windows with more than one claim
            uint64_t rejected = 0;
            uint64_t stale = 0;
            uint64_t failed = 0;
        };

        explicit ConflictResolver(std::unique_ptr<IConflictResolutionStrategy> strategy = nullptr,
                                  size_t historyCapacity = 256);

        ConflictResolver(const ConflictResolver&) = delete;
        ConflictResolver& operator=(const ConflictResolver&) = delete;

        /**
         * @brief Pick and record the winner without applying anything
         * @throws std::invalid_argument for a record without claims
         */
        const ConflictClaim& resolve(ConflictRecord& record) const;

        /// Resolve a complete set of competing proposals now
        ArbitrationResult arbitrate(const std::string& subjectId, std::vector<Proposal> proposals);

        /// Queue a proposal in the subject's open window
        Ticket submit(const std::string& subjectId, Proposal proposal);

        /// Whether the subject has proposals waiting for resolution
        bool hasPending(const std::string& subjectId) const;
        size_t pendingCount() const;

        /// Resolve every open window; returns the number of windows resolved
        size_t resolvePending();

        /// Outcome of a submitted proposal; Pending until its window resolves
        ClaimOutcome outcome(Ticket ticket) const;

        /**
         * @brief Record a vote for the subject's next resolution
         *
         * Votes are consumed by the voting strategy and cleared once the
         * subject's window resolves.
         */
        void castVote(const std::string& subjectId, const AgentId& voter, const AgentId& candidate);

        void setStrategy(std::unique_ptr<IConflictResolutionStrategy> strategy);
        std::string strategyName() const;

        /// Most recent contested resolutions, oldest first
        std::vector<ConflictRecord> recentConflicts() const;
        Stats getStats() const;

    private:
        struct PendingProposal {
            Ticket ticket;
            Proposal proposal;
        };

        ArbitrationResult arbitrateWith(const std::string& subjectId, std::vector<Proposal>& proposals,
                                        std::map<AgentId, AgentId> votes);

        mutable std::mutex _strategyMutex;
        std::shared_ptr<IConflictResolutionStrategy> _strategy;

        mutable std::mutex _windowMutex;
        std::unordered_map<std::string, std::vector<PendingProposal>> _windows;
        std::unordered_map<std::string, std::map<AgentId, AgentId>> _votes;
        std::map<Ticket, ClaimOutcome> _outcomes;   ///< Bounded, oldest tickets dropped first
        Ticket _nextTicket = 1;

        mutable std::mutex _historyMutex;
        CircularBuffer<ConflictRecord> _history;
        Stats _stats;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
