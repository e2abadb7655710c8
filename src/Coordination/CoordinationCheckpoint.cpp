/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "CoordinationCheckpoint.h"
#include <stdexcept>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    namespace {
        void checkFormat(const nlohmann::json& json) {
            int format = json.value("format", 0);
            if (format != kCheckpointFormatVersion) {
                throw std::invalid_argument("unsupported checkpoint format " + std::to_string(format));
            }
        }
    }

    nlohmann::json taskToJson(const Task& task, uint64_t version) {
        nlohmann::json j;
        j["format"] = kCheckpointFormatVersion;
        j["id"] = task.id;
        j["version"] = version;
        j["dependencies"] = task.dependencies;
        j["priority"] = task.priority;
        j["capabilities"] = task.requiredCapabilities;
        j["status"] = taskStatusToString(task.status);
        j["assignedAgent"] = task.assignedAgent ? nlohmann::json(*task.assignedAgent) : nlohmann::json(nullptr);
        j["retryCount"] = task.retryCount;
        j["maxRetries"] = task.maxRetries;
        j["namespace"] = task.ns;
        j["tags"] = task.tags;

        auto resources = nlohmann::json::array();
        for (const auto& requirement : task.resources) {
            resources.push_back({{"name", requirement.name}, {"amount", requirement.amount}});
        }
        j["resources"] = std::move(resources);

        j["timeoutMs"] = task.timeout.count();
        j["failureReason"] = task.failureReason;
        j["stealCount"] = task.stealCount;
        j["cancelRequested"] = task.cancelRequested;
        return j;
    }

    Task taskFromJson(const nlohmann::json& json) {
        checkFormat(json);

        Task task;
        task.id = json.at("id").get<std::string>();
        task.dependencies = json.value("dependencies", std::vector<TaskId>{});
        task.priority = json.value("priority", 0);
        task.requiredCapabilities = json.value("capabilities", std::set<std::string>{});

        auto statusName = json.at("status").get<std::string>();
        auto status = stringToTaskStatus(statusName);
        if (!status) {
            throw std::invalid_argument("unknown task status '" + statusName + "' for " + task.id);
        }
        task.status = *status;

        if (json.contains("assignedAgent") && json["assignedAgent"].is_string()) {
            task.assignedAgent = json["assignedAgent"].get<std::string>();
        }
        task.retryCount = json.value("retryCount", 0u);
        task.maxRetries = json.value("maxRetries", 3u);
        task.ns = json.value("namespace", std::string{});
        task.tags = json.value("tags", std::set<std::string>{});

        if (json.contains("resources")) {
            for (const auto& entry : json["resources"]) {
                ResourceRequirement requirement;
                requirement.name = entry.at("name").get<std::string>();
                requirement.amount = entry.value("amount", 1.0);
                task.resources.push_back(std::move(requirement));
            }
        }

        task.timeout = std::chrono::milliseconds(json.value("timeoutMs", int64_t{0}));
        task.failureReason = json.value("failureReason", std::string{});
        task.stealCount = json.value("stealCount", 0u);
        task.cancelRequested = json.value("cancelRequested", false);
        return task;
    }

    nlohmann::json agentToJson(const AgentInfo& agent, uint64_t version) {
        nlohmann::json j;
        j["format"] = kCheckpointFormatVersion;
        j["id"] = agent.id;
        j["version"] = version;
        j["capabilities"] = agent.capabilities;
        j["status"] = agentStatusToString(agent.status);
        j["maxConcurrentTasks"] = agent.maxConcurrentTasks;
        j["queuedTasks"] = agent.queuedTasks;
        j["runningTasks"] = agent.runningTasks;
        j["completedCount"] = agent.completedCount;
        j["failedCount"] = agent.failedCount;
        return j;
    }

    AgentInfo agentFromJson(const nlohmann::json& json) {
        checkFormat(json);

        AgentInfo agent;
        agent.id = json.at("id").get<std::string>();
        agent.capabilities = json.value("capabilities", std::set<std::string>{});

        auto statusName = json.value("status", std::string("offline"));
        auto status = stringToAgentStatus(statusName);
        if (!status) {
            throw std::invalid_argument("unknown agent status '" + statusName + "' for " + agent.id);
        }
        agent.status = *status;
        agent.maxConcurrentTasks = json.value("maxConcurrentTasks", size_t{0});
        agent.queuedTasks = json.value("queuedTasks", std::vector<TaskId>{});
        agent.runningTasks = json.value("runningTasks", std::vector<TaskId>{});
        agent.completedCount = json.value("completedCount", uint64_t{0});
        agent.failedCount = json.value("failedCount", uint64_t{0});
        return agent;
    }

    std::string taskCheckpointKey(const TaskId& id) {
        return kTaskKeyPrefix + id;
    }

    std::string agentCheckpointKey(const AgentId& id) {
        return kAgentKeyPrefix + id;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
