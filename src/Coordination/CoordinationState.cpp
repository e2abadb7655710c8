/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "CoordinationState.h"
#include "MessageRouter.h"
#include "../Logging/Logger.h"

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    std::vector<TaskId> recordCancellations(CoordinationState& state,
                                            MessageRouter* router,
                                            const std::vector<TaskId>& ids,
                                            const std::optional<TaskId>& origin,
                                            const std::string& reason) {
        std::vector<TaskId> cancelled;
        cancelled.reserve(ids.size());

        for (const auto& id : ids) {
            if (!state.tasks.contains(id)) {
                continue;
            }

            bool changed = false;
            try {
                state.tasks.update(id, [&](Task& task) {
                    changed = false;
                    if (task.isTerminal() || !isValidTransition(task.status, TaskStatus::Cancelled)) {
                        return;
                    }
                    task.status = TaskStatus::Cancelled;
                    task.failureReason = reason;
                    task.finishedAt = Clock::now();
                    changed = true;
                });
            } catch (const VersionConflictError& e) {
                SWARM_LOG_WARNING_CAT("Coordination", "Could not record cancellation of {}: {}", id, e.what());
                continue;
            }

            if (!changed) {
                continue;
            }
            cancelled.push_back(id);

            if (router) {
                TaskCancelledEvent event;
                event.taskId = id;
                event.cascadedFrom = origin;
                event.reason = reason;
                router->publish(event);
            }
        }
        return cancelled;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
