/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationEvents.h
 * @brief Events the engine emits about task progress
 *
 * Every event concerns exactly one task. The MessageRouter guarantees that a
 * subscriber sees the events of one task in the order they were published.
 */

#pragma once

#include "../CoreCommon.h"
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

/**
 * @brief Common part of every coordination event
 */
struct TaskEvent {
    TaskId taskId;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief Scheduler assigned a ready task to an agent
 */
struct TaskAssignedEvent : TaskEvent {
    AgentId agentId;
    std::string strategy;       ///< Strategy that picked the agent
};

struct TaskStartedEvent : TaskEvent {
    AgentId agentId;
};

struct TaskCompletedEvent : TaskEvent {
    AgentId agentId;
    std::chrono::milliseconds runTime{0};
};

/**
 * @brief Execution failed; willRetry tells whether the task went back to ready
 */
struct TaskFailedEvent : TaskEvent {
    AgentId agentId;
    std::string reason;
    bool willRetry = false;
};

/**
 * @brief Work stealing moved a queued task between agents
 */
struct TaskStolenEvent : TaskEvent {
    AgentId fromAgent;
    AgentId toAgent;
};

struct TaskCancelledEvent : TaskEvent {
    std::optional<TaskId> cascadedFrom;   ///< Set when cancelled because an upstream task went away
    std::string reason;
};

struct TaskRetriedEvent : TaskEvent {
    uint32_t attempt = 0;
    std::chrono::milliseconds backoff{0};
};

using CoordinationEvent = std::variant<TaskAssignedEvent,
                                       TaskStartedEvent,
                                       TaskCompletedEvent,
                                       TaskFailedEvent,
                                       TaskStolenEvent,
                                       TaskCancelledEvent,
                                       TaskRetriedEvent>;

/// Index into CoordinationEvent, used for subscription filters
enum class CoordinationEventType : uint8_t {
    Assigned  = 0,
    Started   = 1,
    Completed = 2,
    Failed    = 3,
    Stolen    = 4,
    Cancelled = 5,
    Retried   = 6
};

inline CoordinationEventType eventType(const CoordinationEvent& event) {
    return static_cast<CoordinationEventType>(event.index());
}

inline const TaskId& eventTaskId(const CoordinationEvent& event) {
    return std::visit([](const auto& e) -> const TaskId& { return e.taskId; }, event);
}

inline const char* eventTypeToString(CoordinationEventType type) {
    switch (type) {
        case CoordinationEventType::Assigned:  return "assigned";
        case CoordinationEventType::Started:   return "started";
        case CoordinationEventType::Completed: return "completed";
        case CoordinationEventType::Failed:    return "failed";
        case CoordinationEventType::Stolen:    return "stolen";
        case CoordinationEventType::Cancelled: return "cancelled";
        case CoordinationEventType::Retried:   return "retried";
    }
    return "unknown";
}

/**
 * @brief An event as delivered to a subscriber
 */
struct EventEnvelope {
    uint64_t sequence = 0;          ///< Router-wide publish order
    uint32_t deliveryAttempt = 1;   ///< Greater than 1 when redelivered after a handler failure
    CoordinationEvent event;

    CoordinationEventType type() const { return eventType(event); }
    const TaskId& taskId() const { return eventTaskId(event); }
};

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
