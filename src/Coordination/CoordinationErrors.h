/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationErrors.h
 * @brief Exception taxonomy of the coordination engine
 *
 * Graph integrity errors are always thrown to the caller. Contention errors
 * (VersionConflictError, PoolExhaustedError) are caught by the scheduler and
 * the work-stealing coordinator and retried or deferred. Capability and
 * capacity errors leave the task ready and only show up in metrics until the
 * grace period runs out.
 */

#pragma once

#include "../CoreCommon.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    enum class CoordinationErrorCode : uint8_t {
        Cycle,
        HasDependents,
        DuplicateTask,
        UnknownEntity,
        CircuitOpen,
        PoolExhausted,
        InsufficientResource,
        VersionConflict,
        NoCapableAgent,
        TaskTimeout,
        Backend
    };

    inline constexpr const char* errorCodeToString(CoordinationErrorCode code) {
        switch (code) {
            case CoordinationErrorCode::Cycle:                return "Cycle";
            case CoordinationErrorCode::HasDependents:        return "HasDependents";
            case CoordinationErrorCode::DuplicateTask:        return "DuplicateTask";
            case CoordinationErrorCode::UnknownEntity:        return "UnknownEntity";
            case CoordinationErrorCode::CircuitOpen:          return "CircuitOpen";
            case CoordinationErrorCode::PoolExhausted:        return "PoolExhausted";
            case CoordinationErrorCode::InsufficientResource: return "InsufficientResource";
            case CoordinationErrorCode::VersionConflict:      return "VersionConflict";
            case CoordinationErrorCode::NoCapableAgent:       return "NoCapableAgent";
            case CoordinationErrorCode::TaskTimeout:          return "TaskTimeout";
            case CoordinationErrorCode::Backend:              return "Backend";
        }
        return "Unknown";
    }

    /**
     * @brief Base of every error raised by the engine
     *
     * Carries a code so callers holding a generic reference can branch without
     * a dynamic_cast chain.
     */
    class CoordinationError : public std::runtime_error {
    public:
        CoordinationError(CoordinationErrorCode code, const std::string& message)
            : std::runtime_error(message)
            , _code(code) {}

        CoordinationErrorCode code() const noexcept { return _code; }

        /// Contention errors are retried by the component that hit them
        bool isRecoverable() const noexcept {
            return _code == CoordinationErrorCode::VersionConflict ||
                   _code == CoordinationErrorCode::PoolExhausted;
        }

    private:
        CoordinationErrorCode _code;
    };

    /// Adding the task or edge would close a dependency cycle
    class CycleError : public CoordinationError {
    public:
        CycleError(const TaskId& taskId, const TaskId& dependency)
            : CoordinationError(CoordinationErrorCode::Cycle,
                                "dependency " + dependency + " -> " + taskId + " would create a cycle")
            , _taskId(taskId)
            , _dependency(dependency) {}

        const TaskId& taskId() const noexcept { return _taskId; }
        const TaskId& dependency() const noexcept { return _dependency; }

    private:
        TaskId _taskId;
        TaskId _dependency;
    };

    /// Non-forced removal of a task other tasks still depend on
    class HasDependentsError : public CoordinationError {
    public:
        HasDependentsError(const TaskId& taskId, size_t dependentCount)
            : CoordinationError(CoordinationErrorCode::HasDependents,
                                "task " + taskId + " has " + std::to_string(dependentCount) + " dependent(s)")
            , _taskId(taskId) {}

        const TaskId& taskId() const noexcept { return _taskId; }

    private:
        TaskId _taskId;
    };

    class DuplicateTaskError : public CoordinationError {
    public:
        explicit DuplicateTaskError(const TaskId& taskId)
            : CoordinationError(CoordinationErrorCode::DuplicateTask, "task " + taskId + " already exists") {}
    };

    /// Lookup of a task, agent, resource or endpoint that is not registered
    class UnknownEntityError : public CoordinationError {
    public:
        UnknownEntityError(const std::string& kind, const std::string& id)
            : CoordinationError(CoordinationErrorCode::UnknownEntity, "unknown " + kind + " " + id) {}
    };

    /// Call rejected without reaching the backend
    class CircuitOpenError : public CoordinationError {
    public:
        explicit CircuitOpenError(const EndpointId& endpoint)
            : CoordinationError(CoordinationErrorCode::CircuitOpen, "circuit open for endpoint " + endpoint)
            , _endpoint(endpoint) {}

        const EndpointId& endpoint() const noexcept { return _endpoint; }

    private:
        EndpointId _endpoint;
    };

    class PoolExhaustedError : public CoordinationError {
    public:
        explicit PoolExhaustedError(const std::string& reason)
            : CoordinationError(CoordinationErrorCode::PoolExhausted, "connection pool exhausted: " + reason) {}
    };

    class InsufficientResourceError : public CoordinationError {
    public:
        InsufficientResourceError(const ResourceName& resource, double requested, double available)
            : CoordinationError(CoordinationErrorCode::InsufficientResource,
                                "resource " + resource + ": requested " + std::to_string(requested) +
                                ", available " + std::to_string(available))
            , _resource(resource) {}

        const ResourceName& resource() const noexcept { return _resource; }

    private:
        ResourceName _resource;
    };

    /// Optimistic update lost the race; re-read and retry
    class VersionConflictError : public CoordinationError {
    public:
        VersionConflictError(const std::string& entityId, uint64_t expected, uint64_t actual)
            : CoordinationError(CoordinationErrorCode::VersionConflict,
                                "version conflict on " + entityId + ": expected " + std::to_string(expected) +
                                ", found " + std::to_string(actual))
            , _entityId(entityId)
            , _expected(expected)
            , _actual(actual) {}

        const std::string& entityId() const noexcept { return _entityId; }
        uint64_t expectedVersion() const noexcept { return _expected; }
        uint64_t actualVersion() const noexcept { return _actual; }

    private:
        std::string _entityId;
        uint64_t _expected;
        uint64_t _actual;
    };

    class NoCapableAgentError : public CoordinationError {
    public:
        explicit NoCapableAgentError(const TaskId& taskId)
            : CoordinationError(CoordinationErrorCode::NoCapableAgent, "no capable agent for task " + taskId) {}
    };

    class TaskTimeoutError : public CoordinationError {
    public:
        explicit TaskTimeoutError(const TaskId& taskId)
            : CoordinationError(CoordinationErrorCode::TaskTimeout, "task " + taskId + " exceeded its deadline") {}
    };

    /// Failure reported by the external execution backend
    class BackendError : public CoordinationError {
    public:
        explicit BackendError(const std::string& message)
            : CoordinationError(CoordinationErrorCode::Backend, message) {}
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
