/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "CoordinationTypes.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

std::set<std::string> Task::affinityKeys() const {
    std::set<std::string> keys = tags;
    if (!ns.empty()) {
        keys.insert("ns:" + ns);
    }
    return keys;
}

bool AgentInfo::hasCapabilities(const std::set<std::string>& required) const {
    return std::includes(capabilities.begin(), capabilities.end(),
                         required.begin(), required.end());
}

const char* taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Ready:     return "ready";
        case TaskStatus::Assigned:  return "assigned";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* agentStatusToString(AgentStatus status) {
    switch (status) {
        case AgentStatus::Idle:     return "idle";
        case AgentStatus::Busy:     return "busy";
        case AgentStatus::Draining: return "draining";
        case AgentStatus::Offline:  return "offline";
    }
    return "unknown";
}

std::optional<TaskStatus> stringToTaskStatus(std::string_view name) {
    for (auto status : {TaskStatus::Pending, TaskStatus::Ready, TaskStatus::Assigned, TaskStatus::Running,
                        TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Cancelled}) {
        if (name == taskStatusToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<AgentStatus> stringToAgentStatus(std::string_view name) {
    for (auto status : {AgentStatus::Idle, AgentStatus::Busy, AgentStatus::Draining, AgentStatus::Offline}) {
        if (name == agentStatusToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool isValidTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::Pending:
            return to == TaskStatus::Ready || to == TaskStatus::Cancelled;
        case TaskStatus::Ready:
            return to == TaskStatus::Assigned || to == TaskStatus::Cancelled ||
                   to == TaskStatus::Failed;
        case TaskStatus::Assigned:
            return to == TaskStatus::Running || to == TaskStatus::Ready ||
                   to == TaskStatus::Cancelled;
        case TaskStatus::Running:
            return to == TaskStatus::Completed || to == TaskStatus::Failed;
        case TaskStatus::Failed:
            return to == TaskStatus::Ready;
        case TaskStatus::Completed:
        case TaskStatus::Cancelled:
            return false;
    }
    return false;
}

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
