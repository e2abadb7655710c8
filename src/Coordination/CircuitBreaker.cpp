/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "CircuitBreaker.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    const char* circuitStateToString(CircuitState state) {
        switch (state) {
            case CircuitState::Closed:   return "closed";
            case CircuitState::Open:     return "open";
            case CircuitState::HalfOpen: return "half-open";
        }
        return "unknown";
    }

    CircuitBreaker::CircuitBreaker(EndpointId endpoint, Config config)
        : _endpoint(std::move(endpoint))
        , _config(config) {
        if (_config.failureThreshold == 0) {
            _config.failureThreshold = 1;
        }
    }

    CircuitBreaker::StateChangeCallback CircuitBreaker::transitionLocked(CircuitState to, CircuitState& from) {
        from = _state;
        if (from == to) {
            return {};
        }
        _state = to;
        _stateChangedAt = Clock::now();
        return _onStateChange;
    }

    CircuitBreaker::Permit CircuitBreaker::admit() {
        StateChangeCallback callback;
        CircuitState from = CircuitState::Closed;
        Admission admission = Admission::Rejected;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            generation = _generation;
            switch (_state) {
                case CircuitState::Closed:
                    admission = Admission::Normal;
                    break;
                case CircuitState::Open:
                    if (Clock::now() - _stateChangedAt >= _config.coolDown) {
                        callback = transitionLocked(CircuitState::HalfOpen, from);
                        _probeInFlight = true;
                        admission = Admission::Probe;
                    }
                    break;
                case CircuitState::HalfOpen:
                    if (!_probeInFlight) {
                        _probeInFlight = true;
                        admission = Admission::Probe;
                    }
                    break;
            }

            if (admission == Admission::Rejected) {
                ++_totalRejections;
            } else {
                ++_totalCalls;
            }
        }

        if (callback) {
            callback(_endpoint, from, CircuitState::HalfOpen);
        }
        if (admission == Admission::Probe) {
            SWARM_LOG_DEBUG_CAT("CircuitBreaker", "Endpoint {} admitting half-open probe", _endpoint);
        }
        return Permit{admission, generation};
    }

    void CircuitBreaker::recordSuccess(const Permit& permit) {
        StateChangeCallback callback;
        CircuitState from = CircuitState::Closed;
        bool closed = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            const Admission admission = permit.generation == _generation ? permit.admission : Admission::Rejected;
            if (admission == Admission::Probe) {
                _probeInFlight = false;
                _consecutiveFailures = 0;
                callback = transitionLocked(CircuitState::Closed, from);
                closed = true;
            } else if (admission == Admission::Normal && _state == CircuitState::Closed) {
                _consecutiveFailures = 0;
            }
        }

        if (closed) {
            SWARM_LOG_INFO_CAT("CircuitBreaker", "Endpoint {} recovered, circuit closed", _endpoint);
        }
        if (callback) {
            callback(_endpoint, from, CircuitState::Closed);
        }
    }

    void CircuitBreaker::recordFailure(const Permit& permit) {
        StateChangeCallback callback;
        CircuitState from = CircuitState::Closed;
        bool opened = false;
        uint32_t failures = 0;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_totalFailures;
            // Stale results from before a reset() only count in the totals
            const Admission admission = permit.generation == _generation ? permit.admission : Admission::Rejected;
            if (admission == Admission::Probe) {
                _probeInFlight = false;
                callback = transitionLocked(CircuitState::Open, from);
                // Restart the cool-down even if the state did not change
                _stateChangedAt = Clock::now();
                opened = true;
            } else if (admission == Admission::Normal && _state == CircuitState::Closed) {
                ++_consecutiveFailures;
                if (_consecutiveFailures >= _config.failureThreshold) {
                    callback = transitionLocked(CircuitState::Open, from);
                    opened = true;
                }
            }
            failures = _consecutiveFailures;
        }

        if (opened) {
            SWARM_LOG_WARNING_CAT("CircuitBreaker", "Endpoint {} circuit opened after {} consecutive failure(s)",
                                  _endpoint, failures);
            SWARM_PROFILE_MESSAGE_L("circuit opened");
        }
        if (callback) {
            callback(_endpoint, from, CircuitState::Open);
        }
    }

    void CircuitBreaker::reset() {
        StateChangeCallback callback;
        CircuitState from = CircuitState::Closed;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _consecutiveFailures = 0;
            _probeInFlight = false;
            ++_generation;
            callback = transitionLocked(CircuitState::Closed, from);
        }
        if (callback) {
            callback(_endpoint, from, CircuitState::Closed);
        }
    }

    CircuitState CircuitBreaker::getState() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state;
    }

    CircuitBreaker::Metrics CircuitBreaker::getMetrics() const {
        std::lock_guard<std::mutex> lock(_mutex);
        Metrics m;
        m.endpoint = _endpoint;
        m.state = _state;
        m.consecutiveFailures = _consecutiveFailures;
        m.timeInState = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - _stateChangedAt);
        m.totalCalls = _totalCalls;
        m.totalFailures = _totalFailures;
        m.totalRejections = _totalRejections;
        return m;
    }

    void CircuitBreaker::setStateChangeCallback(StateChangeCallback callback) {
        std::lock_guard<std::mutex> lock(_mutex);
        _onStateChange = std::move(callback);
    }

    CircuitBreakerManager::CircuitBreakerManager(CircuitBreaker::Config defaults)
        : _defaults(defaults) {}

    CircuitBreaker& CircuitBreakerManager::getBreaker(const EndpointId& endpoint) {
        {
            std::shared_lock<std::shared_mutex> lock(_mutex);
            auto it = _breakers.find(endpoint);
            if (it != _breakers.end()) {
                return *it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto it = _breakers.find(endpoint);
        if (it != _breakers.end()) {
            return *it->second;
        }

        auto overrideIt = _overrides.find(endpoint);
        auto config = overrideIt != _overrides.end() ? overrideIt->second : _defaults;
        auto breaker = std::make_unique<CircuitBreaker>(endpoint, config);
        if (_onStateChange) {
            breaker->setStateChangeCallback(_onStateChange);
        }
        SWARM_LOG_DEBUG_CAT("CircuitBreaker", "Created breaker for endpoint {} (threshold {}, cool-down {}ms)",
                            endpoint, config.failureThreshold, config.coolDown.count());
        return *_breakers.emplace(endpoint, std::move(breaker)).first->second;
    }

    void CircuitBreakerManager::configureEndpoint(const EndpointId& endpoint, CircuitBreaker::Config config) {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        _overrides[endpoint] = config;
        if (_breakers.count(endpoint)) {
            SWARM_LOG_WARNING_CAT("CircuitBreaker", "Endpoint {} already has a breaker, new config applies after restart",
                                  endpoint);
        }
    }

    std::optional<CircuitBreaker::Metrics> CircuitBreakerManager::getMetrics(const EndpointId& endpoint) const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        auto it = _breakers.find(endpoint);
        if (it == _breakers.end()) {
            return std::nullopt;
        }
        return it->second->getMetrics();
    }

    std::vector<CircuitBreaker::Metrics> CircuitBreakerManager::getAllMetrics() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        std::vector<CircuitBreaker::Metrics> out;
        out.reserve(_breakers.size());
        for (const auto& [endpoint, breaker] : _breakers) {
            out.push_back(breaker->getMetrics());
        }
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.endpoint < b.endpoint; });
        return out;
    }

    bool CircuitBreakerManager::reset(const EndpointId& endpoint) {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        auto it = _breakers.find(endpoint);
        if (it == _breakers.end()) {
            return false;
        }
        it->second->reset();
        return true;
    }

    void CircuitBreakerManager::resetAll() {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        for (auto& [endpoint, breaker] : _breakers) {
            breaker->reset();
        }
    }

    void CircuitBreakerManager::setStateChangeCallback(CircuitBreaker::StateChangeCallback callback) {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        _onStateChange = std::move(callback);
        for (auto& [endpoint, breaker] : _breakers) {
            breaker->setStateChangeCallback(_onStateChange);
        }
    }

    size_t CircuitBreakerManager::size() const {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        return _breakers.size();
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
