/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationCheckpoint.h
 * @brief JSON form of task and agent records written to the memory store
 *
 * Timestamps are not persisted: they come from the steady clock and mean
 * nothing to another process. Records read back get fresh ones.
 */

#pragma once

#include "CoordinationTypes.h"
#include <nlohmann/json.hpp>
#include <string>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /// Bumped when the record layout changes incompatibly
    inline constexpr int kCheckpointFormatVersion = 1;

    nlohmann::json taskToJson(const Task& task, uint64_t version);

    /**
     * @brief Rebuild a task record
     * @throws nlohmann::json::exception on missing or mistyped required fields
     * @throws std::invalid_argument on an unknown status or format version
     */
    Task taskFromJson(const nlohmann::json& json);

    nlohmann::json agentToJson(const AgentInfo& agent, uint64_t version);
    AgentInfo agentFromJson(const nlohmann::json& json);

    /// Store keys, "task/<id>" and "agent/<id>"
    std::string taskCheckpointKey(const TaskId& id);
    std::string agentCheckpointKey(const AgentId& id);
    inline constexpr const char* kTaskKeyPrefix = "task/";
    inline constexpr const char* kAgentKeyPrefix = "agent/";

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
