/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "ConflictResolver.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>
#include <set>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    namespace {
        constexpr size_t kMaxRetainedOutcomes = 4096;

        // Strict "a beats b" under the priority rule
        bool beatsByPriority(const ConflictClaim& a, const ConflictClaim& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
            return a.agentId < b.agentId;
        }

        bool beatsByTimestamp(const ConflictClaim& a, const ConflictClaim& b) {
            if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.agentId < b.agentId;
        }

        template<typename Beats, typename Filter>
        size_t bestClaim(const std::vector<ConflictClaim>& claims, Beats beats, Filter include) {
            std::optional<size_t> best;
            for (size_t i = 0; i < claims.size(); ++i) {
                if (!include(claims[i])) continue;
                if (!best || beats(claims[i], claims[*best])) {
                    best = i;
                }
            }
            return best.value_or(0);
        }
    }

    size_t PriorityResolutionStrategy::selectWinner(const ConflictRecord& record) const {
        return bestClaim(record.claims, beatsByPriority, [](const ConflictClaim&) { return true; });
    }

    size_t TimestampResolutionStrategy::selectWinner(const ConflictRecord& record) const {
        return bestClaim(record.claims, beatsByTimestamp, [](const ConflictClaim&) { return true; });
    }

    size_t VotingResolutionStrategy::selectWinner(const ConflictRecord& record) const {
        std::set<AgentId> electorate;
        for (const auto& claim : record.claims) {
            electorate.insert(claim.agentId);
        }

        std::map<AgentId, size_t> tally;
        for (const auto& [voter, candidate] : record.votes) {
            if (electorate.count(voter) && electorate.count(candidate)) {
                ++tally[candidate];
            }
        }

        size_t top = 0;
        for (const auto& [candidate, votes] : tally) {
            top = std::max(top, votes);
        }

        std::set<AgentId> leaders;
        for (const auto& [candidate, votes] : tally) {
            if (votes == top && top > 0) {
                leaders.insert(candidate);
            }
        }

        double threshold = _config.quorum * static_cast<double>(electorate.size());
        bool decisive = leaders.size() == 1 && static_cast<double>(top) > threshold;
        if (decisive) {
            const AgentId& elected = *leaders.begin();
            return bestClaim(record.claims, beatsByPriority,
                             [&elected](const ConflictClaim& c) { return c.agentId == elected; });
        }

        if (leaders.empty()) {
            return bestClaim(record.claims, beatsByPriority, [](const ConflictClaim&) { return true; });
        }
        return bestClaim(record.claims, beatsByPriority,
                         [&leaders](const ConflictClaim& c) { return leaders.count(c.agentId) > 0; });
    }

    std::unique_ptr<IConflictResolutionStrategy> makeConflictStrategy(ConflictStrategyKind kind, double votingQuorum) {
        switch (kind) {
            case ConflictStrategyKind::Timestamp:
                return std::make_unique<TimestampResolutionStrategy>();
            case ConflictStrategyKind::Voting:
                return std::make_unique<VotingResolutionStrategy>(VotingResolutionStrategy::Config{votingQuorum});
            case ConflictStrategyKind::Priority:
                break;
        }
        return std::make_unique<PriorityResolutionStrategy>();
    }

    const char* claimOutcomeToString(ClaimOutcome outcome) {
        switch (outcome) {
            case ClaimOutcome::Pending:  return "pending";
            case ClaimOutcome::Won:      return "won";
            case ClaimOutcome::Rejected: return "rejected";
            case ClaimOutcome::Stale:    return "stale";
            case ClaimOutcome::Failed:   return "failed";
        }
        return "unknown";
    }

    ConflictResolver::ConflictResolver(std::unique_ptr<IConflictResolutionStrategy> strategy, size_t historyCapacity)
        : _strategy(strategy ? std::move(strategy)
                             : std::unique_ptr<IConflictResolutionStrategy>(std::make_unique<PriorityResolutionStrategy>()))
        , _history(historyCapacity) {}

    const ConflictClaim& ConflictResolver::resolve(ConflictRecord& record) const {
        if (record.claims.empty()) {
            throw std::invalid_argument("conflict on " + record.subjectId + " has no claims");
        }

        std::shared_ptr<IConflictResolutionStrategy> strategy;
        {
            std::lock_guard<std::mutex> lock(_strategyMutex);
            strategy = _strategy;
        }

        size_t index = strategy->selectWinner(record);
        record.strategy = strategy->getName();
        record.winner = record.claims.at(index);
        return record.claims[index];
    }

    ConflictResolver::ArbitrationResult ConflictResolver::arbitrate(const std::string& subjectId,
                                                                   std::vector<Proposal> proposals) {
        std::map<AgentId, AgentId> votes;
        {
            std::lock_guard<std::mutex> lock(_windowMutex);
            auto it = _votes.find(subjectId);
            if (it != _votes.end()) {
                votes = std::move(it->second);
                _votes.erase(it);
            }
        }
        return arbitrateWith(subjectId, proposals, std::move(votes));
    }

    ConflictResolver::ArbitrationResult ConflictResolver::arbitrateWith(const std::string& subjectId,
                                                                       std::vector<Proposal>& proposals,
                                                                       std::map<AgentId, AgentId> votes) {
        SWARM_PROFILE_ZONE_NC("ConflictResolver::arbitrate", Debug::ProfileColors::Scheduling);
        ArbitrationResult result;
        if (proposals.empty()) {
            return result;
        }

        result.outcomes.assign(proposals.size(), ClaimOutcome::Rejected);

        ConflictRecord record;
        record.subjectId = subjectId;
        record.votes = std::move(votes);
        record.claims.reserve(proposals.size());
        for (const auto& proposal : proposals) {
            record.claims.push_back(proposal.claim);
        }

        size_t winner = 0;
        if (proposals.size() > 1) {
            std::shared_ptr<IConflictResolutionStrategy> strategy;
            {
                std::lock_guard<std::mutex> lock(_strategyMutex);
                strategy = _strategy;
            }
            winner = std::min(strategy->selectWinner(record), record.claims.size() - 1);
            record.strategy = strategy->getName();
            record.winner = record.claims[winner];
        }
        result.winner = winner;

        try {
            if (proposals[winner].apply) {
                proposals[winner].apply();
            }
            result.outcomes[winner] = ClaimOutcome::Won;
        } catch (const VersionConflictError& e) {
            result.outcomes[winner] = ClaimOutcome::Stale;
            SWARM_LOG_DEBUG_CAT("ConflictResolver", "Winning claim on {} was stale: {}", subjectId, e.what());
        } catch (const std::exception& e) {
            result.outcomes[winner] = ClaimOutcome::Failed;
            result.error = std::current_exception();
            SWARM_LOG_WARNING_CAT("ConflictResolver", "Winning write on {} failed: {}", subjectId, e.what());
        } catch (...) {
            // Kept in the result so the caller can rethrow it
            result.outcomes[winner] = ClaimOutcome::Failed;
            result.error = std::current_exception();
            SWARM_LOG_WARNING_CAT("ConflictResolver", "Winning write on {} failed: unknown exception", subjectId);
        }

        {
            std::lock_guard<std::mutex> lock(_historyMutex);
            ++_stats.arbitrations;
            _stats.rejected += proposals.size() - 1;
            if (result.outcomes[winner] == ClaimOutcome::Stale) ++_stats.stale;
            if (result.outcomes[winner] == ClaimOutcome::Failed) ++_stats.failed;
            if (proposals.size() > 1) {
                ++_stats.conflicts;
                _history.push(record);
            }
        }

        if (proposals.size() > 1) {
            SWARM_LOG_DEBUG_CAT("ConflictResolver", "Resolved {} competing claims on {} by {}: {} {}",
                                proposals.size(), subjectId, record.strategy, record.claims[winner].agentId,
                                claimOutcomeToString(result.outcomes[winner]));
            result.conflict = std::move(record);
        }

        for (size_t i = 0; i < proposals.size(); ++i) {
            if (proposals[i].onResolved) {
                proposals[i].onResolved(result.outcomes[i]);
            }
        }
        return result;
    }

    ConflictResolver::Ticket ConflictResolver::submit(const std::string& subjectId, Proposal proposal) {
        std::lock_guard<std::mutex> lock(_windowMutex);
        Ticket ticket = _nextTicket++;
        _windows[subjectId].push_back({ticket, std::move(proposal)});
        _outcomes[ticket] = ClaimOutcome::Pending;
        while (_outcomes.size() > kMaxRetainedOutcomes) {
            _outcomes.erase(_outcomes.begin());
        }
        return ticket;
    }

    bool ConflictResolver::hasPending(const std::string& subjectId) const {
        std::lock_guard<std::mutex> lock(_windowMutex);
        return _windows.count(subjectId) > 0;
    }

    size_t ConflictResolver::pendingCount() const {
        std::lock_guard<std::mutex> lock(_windowMutex);
        size_t count = 0;
        for (const auto& [subject, window] : _windows) {
            count += window.size();
        }
        return count;
    }

    size_t ConflictResolver::resolvePending() {
        std::unordered_map<std::string, std::vector<PendingProposal>> windows;
        std::unordered_map<std::string, std::map<AgentId, AgentId>> votes;
        {
            std::lock_guard<std::mutex> lock(_windowMutex);
            windows.swap(_windows);
            for (const auto& [subject, window] : windows) {
                auto it = _votes.find(subject);
                if (it != _votes.end()) {
                    votes[subject] = std::move(it->second);
                    _votes.erase(it);
                }
            }
        }

        for (auto& [subject, window] : windows) {
            std::vector<Proposal> proposals;
            proposals.reserve(window.size());
            for (auto& pending : window) {
                proposals.push_back(std::move(pending.proposal));
            }

            auto result = arbitrateWith(subject, proposals, std::move(votes[subject]));

            std::lock_guard<std::mutex> lock(_windowMutex);
            for (size_t i = 0; i < window.size(); ++i) {
                auto it = _outcomes.find(window[i].ticket);
                if (it != _outcomes.end()) {
                    it->second = result.outcomes[i];
                }
            }
        }
        return windows.size();
    }

    ClaimOutcome ConflictResolver::outcome(Ticket ticket) const {
        std::lock_guard<std::mutex> lock(_windowMutex);
        auto it = _outcomes.find(ticket);
        return it == _outcomes.end() ? ClaimOutcome::Pending : it->second;
    }

    void ConflictResolver::castVote(const std::string& subjectId, const AgentId& voter, const AgentId& candidate) {
        std::lock_guard<std::mutex> lock(_windowMutex);
        _votes[subjectId][voter] = candidate;
    }

    void ConflictResolver::setStrategy(std::unique_ptr<IConflictResolutionStrategy> strategy) {
        if (!strategy) {
            return;
        }
        std::lock_guard<std::mutex> lock(_strategyMutex);
        _strategy = std::move(strategy);
    }

    std::string ConflictResolver::strategyName() const {
        std::lock_guard<std::mutex> lock(_strategyMutex);
        return _strategy->getName();
    }

    std::vector<ConflictRecord> ConflictResolver::recentConflicts() const {
        std::lock_guard<std::mutex> lock(_historyMutex);
        return _history.toVector();
    }

    ConflictResolver::Stats ConflictResolver::getStats() const {
        std::lock_guard<std::mutex> lock(_historyMutex);
        return _stats;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
