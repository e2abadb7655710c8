/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file WorkStealingCoordinator.h
 * @brief Moves queued, unstarted work from overloaded agents to idle ones
 */

#pragma once

#include "CoordinationState.h"
#include "MessageRouter.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    enum class StealStatus : uint8_t {
        Stolen,      ///< Task now belongs to the receiver
        Conflict,    ///< Lost a race on the task or an agent record; task stays put
        Balanced     ///< Nothing worth moving
    };

    struct StealResult {
        StealStatus status = StealStatus::Balanced;
        TaskId taskId;
        AgentId fromAgent;
        AgentId toAgent;

        bool stolen() const { return status == StealStatus::Stolen; }
    };

    /**
     * @brief Best-effort load balancer over the agents' queued tasks
     *
     * Every cycle computes the mean load over agents that are not offline. An
     * agent more than Config::threshold above the mean is a donor, an agent
     * accepting work more than threshold below it is a receiver. For each
     * donor the most recently queued task that is still Assigned (never
     * Running) moves to the least-loaded receiver that has the capabilities
     * and a free slot.
     *
     * The move is a version-checked update of the task record. Losing that
     * race (the agent started the task, it was cancelled, someone else moved
     * it) is counted and otherwise ignored: the task stays where it was. Task
     * resource claims are held per task, so they follow the task without
     * being touched.
     *
     * Cycles run on a background thread every Config::interval, or earlier
     * after notifyLoadChanged(); rebalance() runs one synchronously.
     *
     * @code
     * WorkStealingCoordinator stealer(state, &router);
     * stealer.start();
     * ...
     * stealer.notifyLoadChanged();   // after a burst of assignments
     * ...
     * stealer.stop();
     * @endcode
     */
    class WorkStealingCoordinator {
    public:
        struct Config {
            std::chrono::milliseconds interval{1000};
            /// Distance from the mean load, in tasks, that makes a donor or receiver
            double threshold = 1.0;
            size_t maxStealsPerCycle = 8;
        };

        struct Stats {
            uint64_t cycles = 0;
            uint64_t attempts = 0;
            uint64_t successes = 0;
            uint64_t conflicts = 0;
        };

        explicit WorkStealingCoordinator(CoordinationState& state, MessageRouter* router = nullptr);
        WorkStealingCoordinator(CoordinationState& state, MessageRouter* router, const Config& config);
        ~WorkStealingCoordinator();

        WorkStealingCoordinator(const WorkStealingCoordinator&) = delete;
        WorkStealingCoordinator& operator=(const WorkStealingCoordinator&) = delete;

        /// Start the periodic balancing thread; no-op if running
        void start();

        /// Stop the balancing thread and wait for it
        void stop();

        bool isRunning() const;

        /**
         * @brief Run one balancing cycle now
         * @return One entry per attempted move
         */
        std::vector<StealResult> rebalance();

        /// Wake the balancing thread ahead of its interval
        void notifyLoadChanged();

        Stats getStats() const;
        const Config& getConfig() const { return _config; }

    private:
        struct AgentLoad {
            AgentInfo info;
            size_t load = 0;
        };

        StealResult steal(AgentLoad& donor, std::vector<AgentLoad*>& receivers);
        StealResult migrate(const TaskId& taskId, uint64_t taskVersion, AgentLoad& donor, AgentLoad& receiver);
        void run(const std::stop_token& token);

        CoordinationState& _state;
        MessageRouter* _router;
        Config _config;

        std::mutex _rebalanceMutex;

        std::mutex _wakeMutex;
        std::condition_variable_any _wake;
        bool _loadChanged = false;
        std::atomic<bool> _running{false};
        std::jthread _thread;

        std::atomic<uint64_t> _cycles{0};
        std::atomic<uint64_t> _attempts{0};
        std::atomic<uint64_t> _successes{0};
        std::atomic<uint64_t> _conflicts{0};
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
