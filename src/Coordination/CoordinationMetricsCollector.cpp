/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "CoordinationMetricsCollector.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    CoordinationMetricsCollector::CoordinationMetricsCollector(const Sources& sources)
        : CoordinationMetricsCollector(sources, Config{}) {}

    CoordinationMetricsCollector::CoordinationMetricsCollector(const Sources& sources, const Config& config)
        : _sources(sources)
        , _config(config)
        , _history(config.historyCapacity) {
        _lastTotals = currentTotals();

        if (_sources.router) {
            MessageRouter::SubscriberConfig subscriber;
            subscriber.overflow = OverflowPolicy::DropOldest;
            subscriber.maxDeliveryAttempts = 1;
            subscriber.filter = {CoordinationEventType::Completed, CoordinationEventType::Failed,
                                 CoordinationEventType::Retried, CoordinationEventType::Cancelled};
            _subscription = _sources.router->subscribe(
                "metrics", [this](const EventEnvelope& envelope) { onEvent(envelope); }, subscriber);
        }
    }

    CoordinationMetricsCollector::~CoordinationMetricsCollector() {
        if (_running.exchange(false)) {
            _thread.request_stop();
            _wake.notify_all();
            if (_thread.joinable()) {
                _thread.join();
            }
        }
        if (_subscription && _sources.router) {
            _sources.router->unsubscribe(*_subscription);
        }
    }

    void CoordinationMetricsCollector::onEvent(const EventEnvelope& envelope) {
        switch (envelope.type()) {
            case CoordinationEventType::Completed:
                _completed.fetch_add(1, std::memory_order_relaxed);
                break;
            case CoordinationEventType::Failed:
                if (!std::get<TaskFailedEvent>(envelope.event).willRetry) {
                    _failed.fetch_add(1, std::memory_order_relaxed);
                }
                break;
            case CoordinationEventType::Retried:
                _retried.fetch_add(1, std::memory_order_relaxed);
                break;
            case CoordinationEventType::Cancelled:
                _cancelled.fetch_add(1, std::memory_order_relaxed);
                break;
            default:
                break;
        }
    }

    void CoordinationMetricsCollector::start() {
        if (_running.exchange(true)) {
            return;
        }
        _thread = std::jthread([this](const std::stop_token& token) { run(token); });
    }

    void CoordinationMetricsCollector::stop() {
        if (!_running.exchange(false)) {
            return;
        }
        _thread.request_stop();
        _wake.notify_all();
        if (_thread.joinable()) {
            _thread.join();
        }
        sample();
    }

    bool CoordinationMetricsCollector::isRunning() const {
        return _running.load();
    }

    void CoordinationMetricsCollector::run(const std::stop_token& token) {
        while (!token.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(_wakeMutex);
                _wake.wait_for(lock, token, _config.interval, [] { return false; });
            }
            if (token.stop_requested()) {
                return;
            }
            try {
                sample();
            } catch (const std::exception& e) {
                SWARM_LOG_ERROR_CAT("Metrics", "Sampling failed: {}", e.what());
            }
        }
    }

    CoordinationMetricsCollector::Totals CoordinationMetricsCollector::currentTotals() const {
        Totals totals;
        if (_sources.scheduler) {
            auto stats = _sources.scheduler->getStats();
            totals.assignments = stats.assigned;
            totals.conflicts = stats.versionConflicts;
        }
        if (_sources.resolver) {
            totals.conflicts += _sources.resolver->getStats().conflicts;
        }
        if (_sources.stealer) {
            totals.steals = _sources.stealer->getStats().successes;
        }
        return totals;
    }

    CoordinationMetricsSample CoordinationMetricsCollector::sample() {
        SWARM_PROFILE_ZONE_NC("Metrics::sample", Debug::ProfileColors::Metrics);

        CoordinationMetricsSample sample;
        sample.timestamp = Clock::now();

        if (_sources.scheduler) {
            sample.queueDepth = _sources.scheduler->queueDepth();
        }

        if (_sources.state) {
            for (const auto& snapshot : _sources.state->agents.snapshotAll()) {
                AgentLoadSample agent;
                agent.agentId = snapshot.value.id;
                agent.status = snapshot.value.status;
                agent.queued = snapshot.value.queuedTasks.size();
                agent.running = snapshot.value.runningTasks.size();
                sample.agents.push_back(std::move(agent));
            }
            std::sort(sample.agents.begin(), sample.agents.end(),
                      [](const AgentLoadSample& a, const AgentLoadSample& b) { return a.agentId < b.agentId; });
        }

        if (_sources.breakers) {
            for (const auto& metrics : _sources.breakers->getAllMetrics()) {
                EndpointSample endpoint;
                endpoint.endpoint = metrics.endpoint;
                endpoint.state = metrics.state;
                endpoint.consecutiveFailures = metrics.consecutiveFailures;
                endpoint.failureRate = metrics.failureRate();
                sample.endpoints.push_back(std::move(endpoint));
            }
        }

        if (_sources.resources) {
            sample.resources = _sources.resources->snapshot();
        }

        if (_sources.pool) {
            sample.pool = _sources.pool->getStats();
            sample.poolUtilization = sample.pool->utilization();
        }

        sample.tasksCompleted = _completed.load(std::memory_order_relaxed);
        sample.tasksFailed = _failed.load(std::memory_order_relaxed);
        sample.tasksRetried = _retried.load(std::memory_order_relaxed);
        sample.tasksCancelled = _cancelled.load(std::memory_order_relaxed);

        auto totals = currentTotals();
        {
            std::lock_guard<std::mutex> lock(_historyMutex);
            sample.interval = std::chrono::duration_cast<std::chrono::milliseconds>(sample.timestamp - _lastSampleAt);
            sample.assignments = totals.assignments - std::min(totals.assignments, _lastTotals.assignments);
            sample.conflicts = totals.conflicts - std::min(totals.conflicts, _lastTotals.conflicts);
            sample.steals = totals.steals - std::min(totals.steals, _lastTotals.steals);
            if (sample.assignments > 0) {
                sample.conflictRate = static_cast<double>(sample.conflicts) / static_cast<double>(sample.assignments);
                sample.stealRate = static_cast<double>(sample.steals) / static_cast<double>(sample.assignments);
            }
            _lastTotals = totals;
            _lastSampleAt = sample.timestamp;
            _history.push(sample);
        }

        SWARM_PROFILE_PLOT_I("QueueDepth", sample.queueDepth);
        SWARM_PROFILE_PLOT_F("PoolUtilization", sample.poolUtilization);
        SWARM_PROFILE_PLOT_F("ConflictRate", sample.conflictRate);
        return sample;
    }

    std::optional<CoordinationMetricsSample> CoordinationMetricsCollector::latest() const {
        std::lock_guard<std::mutex> lock(_historyMutex);
        return _history.back();
    }

    std::vector<CoordinationMetricsSample> CoordinationMetricsCollector::history() const {
        std::lock_guard<std::mutex> lock(_historyMutex);
        return _history.toVector();
    }

    size_t CoordinationMetricsCollector::evictedCount() const {
        std::lock_guard<std::mutex> lock(_historyMutex);
        return _history.evictedCount();
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
