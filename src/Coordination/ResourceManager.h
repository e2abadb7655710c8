/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file ResourceManager.h
 * @brief Capacity accounting for named resources claimed by in-flight tasks
 */

#pragma once

#include "CoordinationErrors.h"
#include "CoordinationTypes.h"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief Tracks capacity and per-task claims for named resources
     *
     * Shared resources hand out capacity by amount. Exclusive resources have a
     * capacity of one holder: a single task owns them regardless of the amount
     * it asks for. Claims are all-or-nothing across every requirement of a task
     * and are counted per task, so a task that claims twice holds both amounts
     * until release().
     *
     * Thread Safety: claim() locks the involved resources in name order, so
     * concurrent claims on overlapping sets cannot deadlock and the sum of
     * active claims never exceeds capacity. Unrelated resources do not contend.
     *
     * @code
     * ResourceManager resources;
     * resources.registerResource("gpu", 2.0);
     * resources.registerResource("repo-lock", 1.0, ResourceMode::Exclusive);
     *
     * resources.claim("train", {{"gpu", 1.5}, {"repo-lock", 1.0}});
     * resources.availability("gpu");   // 0.5
     * resources.release("train");
     * @endcode
     */
    class ResourceManager {
    public:
        struct ResourceSnapshot {
            ResourceName name;
            ResourceMode mode = ResourceMode::Shared;
            double capacity = 0.0;
            double claimed = 0.0;
            size_t holders = 0;

            double available() const { return capacity - claimed; }
            double utilization() const { return capacity > 0.0 ? claimed / capacity : 0.0; }
        };

        ResourceManager() = default;
        ResourceManager(const ResourceManager&) = delete;
        ResourceManager& operator=(const ResourceManager&) = delete;

        /**
         * @brief Declare a resource or change the capacity of an existing one
         *
         * Shrinking below what is currently claimed is allowed; no new claims
         * succeed until enough is released.
         */
        void registerResource(const ResourceName& name, double capacity,
                              ResourceMode mode = ResourceMode::Shared);

        bool hasResource(const ResourceName& name) const;

        /**
         * @brief Claim every requirement for a task, or nothing
         * @throws InsufficientResourceError on the first requirement that does not fit
         * @throws UnknownEntityError if a requirement names an unregistered resource
         */
        void claim(const TaskId& taskId, const std::vector<ResourceRequirement>& requirements);

        /**
         * @brief claim() without exceptions for capacity shortfalls
         * @return false if any requirement does not fit; nothing is claimed then
         */
        bool tryClaim(const TaskId& taskId, const std::vector<ResourceRequirement>& requirements);

        /**
         * @brief Return everything the task holds
         * @return Number of resources released
         */
        size_t release(const TaskId& taskId);

        /// Remaining capacity, zero for unknown resources
        double availability(const ResourceName& name) const;

        /// Whether the requirements would fit right now (no reservation)
        bool canSatisfy(const std::vector<ResourceRequirement>& requirements) const;

        std::vector<ResourceRequirement> claimsFor(const TaskId& taskId) const;
        std::vector<ResourceSnapshot> snapshot() const;

    private:
        struct Resource {
            ResourceName name;
            ResourceMode mode = ResourceMode::Shared;
            double capacity = 0.0;
            double claimed = 0.0;
            std::map<TaskId, double> claims;
            mutable std::mutex mutex;

            bool fits(double amount) const;
            double available() const;
        };

        std::shared_ptr<Resource> findResource(const ResourceName& name) const;

        // Folds repeated names together and sorts by name for lock ordering
        static std::map<ResourceName, double> normalize(const std::vector<ResourceRequirement>& requirements);

        mutable std::shared_mutex _resourcesMutex;
        std::unordered_map<ResourceName, std::shared_ptr<Resource>> _resources;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
