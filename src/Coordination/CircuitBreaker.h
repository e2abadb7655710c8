/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CircuitBreaker.h
 * @brief Per-endpoint failure isolation for calls into the execution backend
 */

#pragma once

#include "CoordinationErrors.h"
#include "../CoreCommon.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    enum class CircuitState : uint8_t {
        Closed,    ///< Calls pass through
        Open,      ///< Calls are rejected until the cool-down elapses
        HalfOpen   ///< One probe call is in flight
    };

    const char* circuitStateToString(CircuitState state);

    /**
     * @brief Failure-isolation state machine for one endpoint
     *
     * - Closed: each failure bumps a consecutive-failure counter, a success
     *   resets it. Reaching the threshold opens the circuit.
     * - Open: calls are rejected with CircuitOpenError and never reach the
     *   backend. Once the cool-down has elapsed the next caller becomes the
     *   half-open probe.
     * - HalfOpen: exactly one probe is in flight. Everyone else is rejected
     *   until it resolves. Probe success closes, probe failure reopens and
     *   restarts the cool-down.
     *
     * The mutex only covers the state bookkeeping; the guarded operation runs
     * outside it.
     *
     * @code
     * CircuitBreaker breaker("llm-primary", {.failureThreshold = 3,
     *                                        .coolDown = std::chrono::seconds(10)});
     * try {
     *     auto reply = breaker.execute([&] { return conn.invoke("llm-primary", payload); });
     * } catch (const CircuitOpenError&) {
     *     // backend isolated, defer
     * }
     * @endcode
     */
    class CircuitBreaker {
    public:
        struct Config {
            uint32_t failureThreshold = 5;                      ///< Consecutive failures before opening
            std::chrono::milliseconds coolDown{30000};          ///< Time spent open before a probe is admitted
        };

        struct Metrics {
            EndpointId endpoint;
            CircuitState state = CircuitState::Closed;
            uint32_t consecutiveFailures = 0;
            std::chrono::milliseconds timeInState{0};
            uint64_t totalCalls = 0;          ///< Admitted calls
            uint64_t totalFailures = 0;
            uint64_t totalRejections = 0;

            double failureRate() const {
                return totalCalls > 0 ? static_cast<double>(totalFailures) / static_cast<double>(totalCalls) : 0.0;
            }
        };

        /// How a call was let through
        enum class Admission : uint8_t {
            Rejected,
            Normal,
            Probe
        };

        /// Admission plus the reset generation it was granted in
        struct Permit {
            Admission admission = Admission::Rejected;
            uint64_t generation = 0;
        };

        using StateChangeCallback = std::function<void(const EndpointId&, CircuitState from, CircuitState to)>;

        CircuitBreaker(EndpointId endpoint, Config config);

        CircuitBreaker(const CircuitBreaker&) = delete;
        CircuitBreaker& operator=(const CircuitBreaker&) = delete;

        /**
         * @brief Decide whether a call may proceed
         *
         * A Probe or Normal permit must be followed by exactly one
         * recordSuccess() or recordFailure() with the same permit. Results
         * of permits granted before the last reset() are counted in the
         * totals but no longer move the state.
         */
        Permit admit();
        void recordSuccess(const Permit& permit);
        void recordFailure(const Permit& permit);

        /**
         * @brief Run an operation through the breaker
         *
         * Any exception from the operation counts as a failure and is rethrown.
         * @throws CircuitOpenError when rejected; the operation is not called
         */
        template<typename Operation>
        auto execute(Operation&& operation) -> std::invoke_result_t<Operation> {
            Permit permit = admit();
            if (permit.admission == Admission::Rejected) {
                throw CircuitOpenError(_endpoint);
            }

            try {
                if constexpr (std::is_void_v<std::invoke_result_t<Operation>>) {
                    std::forward<Operation>(operation)();
                    recordSuccess(permit);
                } else {
                    auto result = std::forward<Operation>(operation)();
                    recordSuccess(permit);
                    return result;
                }
            } catch (...) {
                recordFailure(permit);
                throw;
            }
        }

        /// Back to Closed with the counter cleared; totals are kept
        void reset();

        CircuitState getState() const;
        Metrics getMetrics() const;
        const EndpointId& endpoint() const { return _endpoint; }
        const Config& config() const { return _config; }

        void setStateChangeCallback(StateChangeCallback callback);

    private:
        // Caller holds _mutex; returns the callback to fire after unlocking
        StateChangeCallback transitionLocked(CircuitState to, CircuitState& from);

        EndpointId _endpoint;
        Config _config;

        mutable std::mutex _mutex;
        CircuitState _state = CircuitState::Closed;
        uint32_t _consecutiveFailures = 0;
        TimePoint _stateChangedAt = Clock::now();
        bool _probeInFlight = false;
        uint64_t _generation = 0;

        uint64_t _totalCalls = 0;
        uint64_t _totalFailures = 0;
        uint64_t _totalRejections = 0;

        StateChangeCallback _onStateChange;
    };

    /**
     * @brief Owns one CircuitBreaker per endpoint, created on first use
     *
     * @code
     * CircuitBreakerManager breakers({.failureThreshold = 3});
     * breakers.execute("search", [&] { return backend.invoke("search", query); });
     *
     * if (auto m = breakers.getMetrics("search"); m && m->state == CircuitState::Open) {
     *     ...
     * }
     * @endcode
     */
    class CircuitBreakerManager {
    public:
        explicit CircuitBreakerManager(CircuitBreaker::Config defaults = {});

        CircuitBreakerManager(const CircuitBreakerManager&) = delete;
        CircuitBreakerManager& operator=(const CircuitBreakerManager&) = delete;

        template<typename Operation>
        auto execute(const EndpointId& endpoint, Operation&& operation) -> std::invoke_result_t<Operation> {
            return getBreaker(endpoint).execute(std::forward<Operation>(operation));
        }

        /// Breaker for the endpoint, created with the endpoint's config if new
        CircuitBreaker& getBreaker(const EndpointId& endpoint);

        /**
         * @brief Override the config for one endpoint
         *
         * Takes effect when the endpoint's breaker is created. Breakers are
         * handed out by reference, so an existing one is never replaced.
         */
        void configureEndpoint(const EndpointId& endpoint, CircuitBreaker::Config config);

        std::optional<CircuitBreaker::Metrics> getMetrics(const EndpointId& endpoint) const;
        std::vector<CircuitBreaker::Metrics> getAllMetrics() const;

        bool reset(const EndpointId& endpoint);
        void resetAll();

        /// Applied to every breaker, current and future
        void setStateChangeCallback(CircuitBreaker::StateChangeCallback callback);

        size_t size() const;

    private:
        CircuitBreaker::Config _defaults;
        std::unordered_map<EndpointId, CircuitBreaker::Config> _overrides;

        mutable std::shared_mutex _mutex;
        std::unordered_map<EndpointId, std::unique_ptr<CircuitBreaker>> _breakers;
        CircuitBreaker::StateChangeCallback _onStateChange;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
