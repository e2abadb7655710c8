/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "WorkStealingCoordinator.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>
#include <set>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    namespace {
        class ReceiverUnavailableError : public std::runtime_error {
        public:
            explicit ReceiverUnavailableError(const AgentId& agentId)
                : std::runtime_error("receiver " + agentId + " has no free slot") {}
        };
    }

    WorkStealingCoordinator::WorkStealingCoordinator(CoordinationState& state, MessageRouter* router)
        : WorkStealingCoordinator(state, router, Config{}) {}

    WorkStealingCoordinator::WorkStealingCoordinator(CoordinationState& state, MessageRouter* router,
                                                     const Config& config)
        : _state(state)
        , _router(router)
        , _config(config) {}

    WorkStealingCoordinator::~WorkStealingCoordinator() {
        stop();
    }

    void WorkStealingCoordinator::start() {
        if (_running.exchange(true)) {
            return;
        }
        _thread = std::jthread([this](const std::stop_token& token) { run(token); });
        SWARM_LOG_DEBUG_CAT("WorkStealing", "Balancing every {}ms, threshold {}",
                            _config.interval.count(), _config.threshold);
    }

    void WorkStealingCoordinator::stop() {
        if (!_running.exchange(false)) {
            return;
        }
        _thread.request_stop();
        _wake.notify_all();
        if (_thread.joinable()) {
            _thread.join();
        }
    }

    bool WorkStealingCoordinator::isRunning() const {
        return _running.load();
    }

    void WorkStealingCoordinator::notifyLoadChanged() {
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            _loadChanged = true;
        }
        _wake.notify_all();
    }

    void WorkStealingCoordinator::run(const std::stop_token& token) {
        while (!token.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(_wakeMutex);
                _wake.wait_for(lock, token, _config.interval, [this] { return _loadChanged; });
                if (token.stop_requested()) {
                    return;
                }
                _loadChanged = false;
            }

            try {
                rebalance();
            } catch (const std::exception& e) {
                SWARM_LOG_ERROR_CAT("WorkStealing", "Balancing cycle failed: {}", e.what());
            }
        }
    }

    std::vector<StealResult> WorkStealingCoordinator::rebalance() {
        SWARM_PROFILE_ZONE_NC("WorkStealing::rebalance", Debug::ProfileColors::Stealing);
        std::lock_guard<std::mutex> cycleLock(_rebalanceMutex);
        _cycles.fetch_add(1, std::memory_order_relaxed);

        std::vector<AgentLoad> agents;
        for (auto& snapshot : _state.agents.snapshotAll()) {
            if (snapshot.value.status == AgentStatus::Offline) {
                continue;
            }
            size_t load = snapshot.value.load();
            agents.push_back({std::move(snapshot.value), load});
        }
        if (agents.size() < 2) {
            return {};
        }

        double total = 0.0;
        for (const auto& agent : agents) {
            total += static_cast<double>(agent.load);
        }
        // Moves keep the total, so the mean holds for the whole cycle
        const double mean = total / static_cast<double>(agents.size());
        const double donorLine = mean + _config.threshold;
        const double receiverLine = mean - _config.threshold;

        std::vector<StealResult> results;
        std::set<AgentId> exhausted;

        while (results.size() < _config.maxStealsPerCycle) {
            AgentLoad* donor = nullptr;
            for (auto& agent : agents) {
                if (exhausted.count(agent.info.id) || static_cast<double>(agent.load) <= donorLine) {
                    continue;
                }
                if (!donor || agent.load > donor->load || (agent.load == donor->load && agent.info.id < donor->info.id)) {
                    donor = &agent;
                }
            }
            if (!donor) {
                break;
            }

            std::vector<AgentLoad*> receivers;
            for (auto& agent : agents) {
                bool hasSlot = agent.info.maxConcurrentTasks == 0 || agent.load < agent.info.maxConcurrentTasks;
                if (agent.info.acceptsWork() && hasSlot && static_cast<double>(agent.load) < receiverLine) {
                    receivers.push_back(&agent);
                }
            }
            if (receivers.empty()) {
                break;
            }
            std::sort(receivers.begin(), receivers.end(), [](const AgentLoad* a, const AgentLoad* b) {
                return a->load != b->load ? a->load < b->load : a->info.id < b->info.id;
            });

            auto result = steal(*donor, receivers);
            if (result.status != StealStatus::Stolen) {
                // Nothing movable, or a lost race; either way this donor waits for the next cycle
                exhausted.insert(donor->info.id);
            }
            if (result.status != StealStatus::Balanced) {
                results.push_back(std::move(result));
            }
        }

        SWARM_PROFILE_PLOT_I("StealsPerCycle", results.size());
        return results;
    }

    StealResult WorkStealingCoordinator::steal(AgentLoad& donor, std::vector<AgentLoad*>& receivers) {
        const auto& queued = donor.info.queuedTasks;
        for (auto it = queued.rbegin(); it != queued.rend(); ++it) {
            auto task = _state.tasks.read(*it);
            if (!task || task->value.status != TaskStatus::Assigned || task->value.assignedAgent != donor.info.id) {
                continue;
            }
            TaskId taskId = *it;
            for (auto* receiver : receivers) {
                if (receiver->info.hasCapabilities(task->value.requiredCapabilities)) {
                    return migrate(taskId, task->version, donor, *receiver);
                }
            }
        }
        StealResult result;
        result.fromAgent = donor.info.id;
        return result;
    }

    StealResult WorkStealingCoordinator::migrate(const TaskId& taskId, uint64_t taskVersion,
                                                 AgentLoad& donor, AgentLoad& receiver) {
        _attempts.fetch_add(1, std::memory_order_relaxed);

        StealResult result;
        result.status = StealStatus::Conflict;
        result.taskId = taskId;
        result.fromAgent = donor.info.id;
        result.toAgent = receiver.info.id;

        const AgentId& from = donor.info.id;
        const AgentId& to = receiver.info.id;

        try {
            _state.tasks.tryUpdate(taskId, taskVersion, [&to](Task& t) {
                t.assignedAgent = to;
                ++t.stealCount;
            });
        } catch (const VersionConflictError& e) {
            _conflicts.fetch_add(1, std::memory_order_relaxed);
            SWARM_LOG_TRACE_CAT("WorkStealing", "Steal of {} lost a race: {}", taskId, e.what());
            return result;
        }

        try {
            _state.agents.update(to, [&taskId, &to](AgentInfo& agent) {
                if (!agent.acceptsWork() || !agent.hasCapacity()) {
                    throw ReceiverUnavailableError(to);
                }
                agent.queuedTasks.push_back(taskId);
                agent.status = AgentStatus::Busy;
                agent.lastActivity = Clock::now();
            });
        } catch (const std::runtime_error& e) {
            _conflicts.fetch_add(1, std::memory_order_relaxed);
            try {
                _state.tasks.update(taskId, [&from, &to](Task& t) {
                    if (t.status == TaskStatus::Assigned && t.assignedAgent == to) {
                        t.assignedAgent = from;
                        if (t.stealCount > 0) --t.stealCount;
                    }
                });
            } catch (const CoordinationError& undo) {
                SWARM_LOG_WARNING_CAT("WorkStealing", "Could not hand {} back to {}: {}", taskId, from, undo.what());
            }
            SWARM_LOG_TRACE_CAT("WorkStealing", "Steal of {} abandoned: {}", taskId, e.what());
            return result;
        }

        try {
            _state.agents.update(from, [&taskId](AgentInfo& agent) {
                auto& queued = agent.queuedTasks;
                queued.erase(std::remove(queued.begin(), queued.end(), taskId), queued.end());
                if (agent.status == AgentStatus::Busy && agent.load() == 0) {
                    agent.status = AgentStatus::Idle;
                }
            });
        } catch (const CoordinationError& e) {
            SWARM_LOG_WARNING_CAT("WorkStealing", "Donor {} still lists {}: {}", from, taskId, e.what());
        }

        auto& donorQueue = donor.info.queuedTasks;
        donorQueue.erase(std::remove(donorQueue.begin(), donorQueue.end(), taskId), donorQueue.end());
        receiver.info.queuedTasks.push_back(taskId);
        --donor.load;
        ++receiver.load;

        _successes.fetch_add(1, std::memory_order_relaxed);
        result.status = StealStatus::Stolen;

        SWARM_LOG_TASK(Logging::LogLevel::Debug, "WorkStealing", taskId, to,
                       "Moved {} from {} to {}", taskId, from, to);

        if (_router) {
            TaskStolenEvent event;
            event.taskId = taskId;
            event.fromAgent = from;
            event.toAgent = to;
            _router->publish(event);
        }
        return result;
    }

    WorkStealingCoordinator::Stats WorkStealingCoordinator::getStats() const {
        Stats stats;
        stats.cycles = _cycles.load(std::memory_order_relaxed);
        stats.attempts = _attempts.load(std::memory_order_relaxed);
        stats.successes = _successes.load(std::memory_order_relaxed);
        stats.conflicts = _conflicts.load(std::memory_order_relaxed);
        return stats;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
