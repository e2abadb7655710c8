/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file OptimisticLockManager.h
 * @brief Versioned entity table with compare-and-swap updates
 *
 * Tasks and agents are stored as immutable snapshots tagged with a version.
 * Writers hand in the version they read; the update is applied to a copy and
 * published only if nobody else got there first.
 */

#pragma once

#include "CoordinationErrors.h"
#include "../CoreCommon.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief An immutable value plus the version it was published at
     */
    template<typename T>
    struct Versioned {
        T value;
        uint64_t version = 0;
        TimePoint updatedAt = Clock::now();
    };

    /**
     * @brief Per-entity optimistic locking over a table of values
     *
     * Each entity has its own slot; the slot mutex is held only for the
     * duration of a single compare-check-publish, so updates to unrelated
     * entities never contend. The table-level shared mutex guards insertion
     * and removal of slots, not their contents.
     *
     * Contract of tryUpdate(): at most one of several concurrent callers that
     * read the same version succeeds; every other caller gets a
     * VersionConflictError and must re-read. The mutation runs on a private
     * copy, so a mutation that throws leaves the entity untouched.
     *
     * @code
     * OptimisticLockManager<Task> tasks("task");
     * tasks.insert("build", Task{...});
     *
     * auto snap = tasks.get("build");
     * try {
     *     tasks.tryUpdate("build", snap.version, [](Task& t) { t.priority = 10; });
     * } catch (const VersionConflictError&) {
     *     // someone else won, re-read and decide again
     * }
     * @endcode
     */
    template<typename T>
    class OptimisticLockManager {
    public:
        using Snapshot = Versioned<T>;
        using SnapshotPtr = std::shared_ptr<const Snapshot>;
        using Mutation = std::function<void(T&)>;

        explicit OptimisticLockManager(std::string entityKind = "entity")
            : _entityKind(std::move(entityKind)) {}

        OptimisticLockManager(const OptimisticLockManager&) = delete;
        OptimisticLockManager& operator=(const OptimisticLockManager&) = delete;

        /**
         * @brief Add a new entity at version 1
         * @return false if the id is already present
         */
        bool insert(const std::string& id, T value) {
            auto slot = std::make_shared<Slot>();
            slot->current = std::make_shared<const Snapshot>(Snapshot{std::move(value), 1, Clock::now()});

            std::unique_lock<std::shared_mutex> lock(_slotsMutex);
            return _slots.emplace(id, std::move(slot)).second;
        }

        /**
         * @brief Replace the whole entity regardless of version
         *
         * Only for recovery and initial seeding; normal writers use tryUpdate().
         * The version still advances so stale readers will conflict.
         */
        Snapshot upsert(const std::string& id, T value) {
            auto slot = findSlot(id);
            if (!slot) {
                if (insert(id, value)) {
                    return get(id);
                }
                slot = findSlot(id);
            }
            std::lock_guard<std::mutex> lock(slot->mutex);
            uint64_t next = slot->current ? slot->current->version + 1 : 1;
            slot->current = std::make_shared<const Snapshot>(Snapshot{std::move(value), next, Clock::now()});
            return *slot->current;
        }

        std::optional<Snapshot> read(const std::string& id) const {
            auto slot = findSlot(id);
            if (!slot) {
                return std::nullopt;
            }
            std::lock_guard<std::mutex> lock(slot->mutex);
            return *slot->current;
        }

        /**
         * @brief Read an entity, throwing UnknownEntityError if absent
         */
        Snapshot get(const std::string& id) const {
            auto snapshot = read(id);
            if (!snapshot) {
                throw UnknownEntityError(_entityKind, id);
            }
            return *snapshot;
        }

        bool contains(const std::string& id) const {
            std::shared_lock<std::shared_mutex> lock(_slotsMutex);
            return _slots.find(id) != _slots.end();
        }

        /**
         * @brief Apply a mutation if the entity is still at expectedVersion
         *
         * @param id Entity id
         * @param expectedVersion The version the caller based its decision on
         * @param mutation Changes to apply to a copy of the current value
         * @return The newly published snapshot
         * @throws VersionConflictError if the version moved on
         * @throws UnknownEntityError if the entity does not exist
         */
        Snapshot tryUpdate(const std::string& id, uint64_t expectedVersion, const Mutation& mutation) {
            auto slot = findSlot(id);
            if (!slot) {
                throw UnknownEntityError(_entityKind, id);
            }

            std::lock_guard<std::mutex> lock(slot->mutex);
            uint64_t actual = slot->current->version;
            if (actual != expectedVersion) {
                _conflicts.fetch_add(1, std::memory_order_relaxed);
                throw VersionConflictError(id, expectedVersion, actual);
            }

            T copy = slot->current->value;
            mutation(copy);
            slot->current = std::make_shared<const Snapshot>(Snapshot{std::move(copy), actual + 1, Clock::now()});
            _updates.fetch_add(1, std::memory_order_relaxed);
            return *slot->current;
        }

        /**
         * @brief Read-modify-write loop that retries on version conflicts
         *
         * For single-field bookkeeping (agent load counters) where the mutation
         * is valid against whatever the latest value is. The decision callback
         * may throw to abort.
         *
         * @throws VersionConflictError after maxAttempts lost races
         */
        Snapshot update(const std::string& id, const Mutation& mutation, size_t maxAttempts = 8) {
            for (size_t attempt = 1;; ++attempt) {
                Snapshot current = get(id);
                try {
                    return tryUpdate(id, current.version, mutation);
                } catch (const VersionConflictError&) {
                    if (attempt >= maxAttempts) {
                        throw;
                    }
                }
            }
        }

        bool remove(const std::string& id) {
            std::unique_lock<std::shared_mutex> lock(_slotsMutex);
            return _slots.erase(id) > 0;
        }

        /**
         * @brief Copy of every entity, each individually consistent
         */
        std::vector<Snapshot> snapshotAll() const {
            std::vector<std::shared_ptr<Slot>> slots;
            {
                std::shared_lock<std::shared_mutex> lock(_slotsMutex);
                slots.reserve(_slots.size());
                for (const auto& [id, slot] : _slots) {
                    slots.push_back(slot);
                }
            }

            std::vector<Snapshot> out;
            out.reserve(slots.size());
            for (const auto& slot : slots) {
                std::lock_guard<std::mutex> lock(slot->mutex);
                out.push_back(*slot->current);
            }
            return out;
        }

        std::vector<std::string> ids() const {
            std::shared_lock<std::shared_mutex> lock(_slotsMutex);
            std::vector<std::string> out;
            out.reserve(_slots.size());
            for (const auto& [id, slot] : _slots) {
                out.push_back(id);
            }
            return out;
        }

        size_t size() const {
            std::shared_lock<std::shared_mutex> lock(_slotsMutex);
            return _slots.size();
        }

        uint64_t conflictCount() const { return _conflicts.load(std::memory_order_relaxed); }
        uint64_t updateCount() const { return _updates.load(std::memory_order_relaxed); }

        const std::string& entityKind() const { return _entityKind; }

    private:
        struct Slot {
            mutable std::mutex mutex;
            SnapshotPtr current;
        };

        std::shared_ptr<Slot> findSlot(const std::string& id) const {
            std::shared_lock<std::shared_mutex> lock(_slotsMutex);
            auto it = _slots.find(id);
            return it == _slots.end() ? nullptr : it->second;
        }

        std::string _entityKind;
        mutable std::shared_mutex _slotsMutex;
        std::unordered_map<std::string, std::shared_ptr<Slot>> _slots;

        std::atomic<uint64_t> _conflicts{0};
        std::atomic<uint64_t> _updates{0};
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
