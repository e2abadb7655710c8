/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CoordinationState.h
 * @brief The task and agent tables shared by the coordination components
 */

#pragma once

#include "CoordinationTypes.h"
#include "OptimisticLockManager.h"
#include <optional>
#include <string>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    class MessageRouter;

    /**
     * @brief Owned aggregate of the mutable coordination state
     *
     * The CoordinationManager owns exactly one of these and hands it by
     * reference to the scheduler and the work-stealing coordinator. Nothing
     * reaches it through a global. Every write goes through the tables'
     * optimistic tryUpdate()/update().
     */
    struct CoordinationState {
        OptimisticLockManager<Task> tasks{"task"};
        OptimisticLockManager<AgentInfo> agents{"agent"};
    };

    /**
     * @brief Mirror cancellations decided by the DependencyGraph into the task table
     *
     * Each id that is not already terminal becomes Cancelled with the given
     * reason, and a TaskCancelledEvent is published when a router is supplied.
     *
     * @param origin Task whose failure or cancellation caused the cascade
     * @return The ids actually moved to Cancelled
     */
    std::vector<TaskId> recordCancellations(CoordinationState& state,
                                            MessageRouter* router,
                                            const std::vector<TaskId>& ids,
                                            const std::optional<TaskId>& origin,
                                            const std::string& reason);

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
