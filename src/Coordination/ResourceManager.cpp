/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "ResourceManager.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    namespace {
        constexpr double kEpsilon = 1e-9;
    }

    bool ResourceManager::Resource::fits(double amount) const {
        if (mode == ResourceMode::Exclusive) {
            return claims.empty();
        }
        return claimed + amount <= capacity + kEpsilon;
    }

    double ResourceManager::Resource::available() const {
        return std::max(0.0, capacity - claimed);
    }

    void ResourceManager::registerResource(const ResourceName& name, double capacity, ResourceMode mode) {
        if (capacity < 0.0) {
            throw std::invalid_argument("resource " + name + " declared with negative capacity");
        }

        std::unique_lock<std::shared_mutex> lock(_resourcesMutex);
        auto it = _resources.find(name);
        if (it == _resources.end()) {
            auto resource = std::make_shared<Resource>();
            resource->name = name;
            resource->mode = mode;
            resource->capacity = mode == ResourceMode::Exclusive ? 1.0 : capacity;
            _resources.emplace(name, std::move(resource));
            SWARM_LOG_DEBUG_CAT("Resources", "Registered resource {} capacity {}", name, capacity);
            return;
        }

        std::lock_guard<std::mutex> resourceLock(it->second->mutex);
        it->second->mode = mode;
        it->second->capacity = mode == ResourceMode::Exclusive ? 1.0 : capacity;
    }

    bool ResourceManager::hasResource(const ResourceName& name) const {
        return findResource(name) != nullptr;
    }

    std::shared_ptr<ResourceManager::Resource> ResourceManager::findResource(const ResourceName& name) const {
        std::shared_lock<std::shared_mutex> lock(_resourcesMutex);
        auto it = _resources.find(name);
        return it == _resources.end() ? nullptr : it->second;
    }

    std::map<ResourceName, double> ResourceManager::normalize(const std::vector<ResourceRequirement>& requirements) {
        std::map<ResourceName, double> merged;
        for (const auto& req : requirements) {
            if (req.amount < 0.0) {
                throw std::invalid_argument("negative amount requested for resource " + req.name);
            }
            merged[req.name] += req.amount;
        }
        return merged;
    }

    void ResourceManager::claim(const TaskId& taskId, const std::vector<ResourceRequirement>& requirements) {
        SWARM_PROFILE_ZONE_N("ResourceManager::claim");
        auto merged = normalize(requirements);
        if (merged.empty()) {
            return;
        }

        // Resolve and lock in name order (std::map iteration order)
        std::vector<std::shared_ptr<Resource>> resources;
        resources.reserve(merged.size());
        for (const auto& [name, amount] : merged) {
            auto resource = findResource(name);
            if (!resource) {
                throw UnknownEntityError("resource", name);
            }
            resources.push_back(std::move(resource));
        }

        std::vector<std::unique_lock<std::mutex>> locks;
        locks.reserve(resources.size());
        for (auto& resource : resources) {
            locks.emplace_back(resource->mutex);
        }

        size_t index = 0;
        for (const auto& [name, amount] : merged) {
            const auto& resource = resources[index++];
            if (!resource->fits(amount)) {
                throw InsufficientResourceError(name, amount, resource->available());
            }
        }

        index = 0;
        for (const auto& [name, amount] : merged) {
            auto& resource = resources[index++];
            double charged = resource->mode == ResourceMode::Exclusive ? resource->capacity : amount;
            resource->claims[taskId] += charged;
            resource->claimed += charged;
        }

        SWARM_LOG_TRACE_CAT("Resources", "Task {} claimed {} resource(s)", taskId, merged.size());
    }

    bool ResourceManager::tryClaim(const TaskId& taskId, const std::vector<ResourceRequirement>& requirements) {
        try {
            claim(taskId, requirements);
            return true;
        } catch (const InsufficientResourceError&) {
            return false;
        }
    }

    size_t ResourceManager::release(const TaskId& taskId) {
        std::vector<std::shared_ptr<Resource>> resources;
        {
            std::shared_lock<std::shared_mutex> lock(_resourcesMutex);
            resources.reserve(_resources.size());
            for (const auto& [name, resource] : _resources) {
                resources.push_back(resource);
            }
        }

        size_t released = 0;
        for (auto& resource : resources) {
            std::lock_guard<std::mutex> lock(resource->mutex);
            auto it = resource->claims.find(taskId);
            if (it == resource->claims.end()) {
                continue;
            }
            resource->claimed = std::max(0.0, resource->claimed - it->second);
            resource->claims.erase(it);
            ++released;
        }

        if (released > 0) {
            SWARM_LOG_TRACE_CAT("Resources", "Task {} released {} resource(s)", taskId, released);
        }
        return released;
    }

    double ResourceManager::availability(const ResourceName& name) const {
        auto resource = findResource(name);
        if (!resource) {
            return 0.0;
        }
        std::lock_guard<std::mutex> lock(resource->mutex);
        if (resource->mode == ResourceMode::Exclusive) {
            return resource->claims.empty() ? 1.0 : 0.0;
        }
        return resource->available();
    }

    bool ResourceManager::canSatisfy(const std::vector<ResourceRequirement>& requirements) const {
        for (const auto& [name, amount] : normalize(requirements)) {
            auto resource = findResource(name);
            if (!resource) {
                return false;
            }
            std::lock_guard<std::mutex> lock(resource->mutex);
            if (!resource->fits(amount)) {
                return false;
            }
        }
        return true;
    }

    std::vector<ResourceRequirement> ResourceManager::claimsFor(const TaskId& taskId) const {
        std::vector<ResourceRequirement> out;
        std::shared_lock<std::shared_mutex> lock(_resourcesMutex);
        for (const auto& [name, resource] : _resources) {
            std::lock_guard<std::mutex> resourceLock(resource->mutex);
            auto it = resource->claims.find(taskId);
            if (it != resource->claims.end()) {
                out.push_back({name, it->second});
            }
        }
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
        return out;
    }

    std::vector<ResourceManager::ResourceSnapshot> ResourceManager::snapshot() const {
        std::vector<ResourceSnapshot> out;
        std::shared_lock<std::shared_mutex> lock(_resourcesMutex);
        out.reserve(_resources.size());
        for (const auto& [name, resource] : _resources) {
            std::lock_guard<std::mutex> resourceLock(resource->mutex);
            out.push_back({name, resource->mode, resource->capacity, resource->claimed, resource->claims.size()});
        }
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
        return out;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
