/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file InMemoryStore.h
 * @brief Process-local IMemoryStore with namespaces and TTL expiry
 */

#pragma once

#include "IMemoryStore.h"
#include "../CoreCommon.h"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace SwarmEngine {
namespace Core {
namespace Memory {

/**
 * @brief A stored value with its bookkeeping
 */
struct MemoryEntry {
    std::string ns;
    std::string key;
    std::string value;
    TimePoint createdAt;
    TimePoint updatedAt;
    TimePoint accessedAt;
    uint64_t accessCount = 0;
    std::optional<TimePoint> expiresAt;

    bool isExpired(TimePoint now) const { return expiresAt && *expiresAt <= now; }
};

/**
 * @brief Map-backed store for tests and single-process deployments
 *
 * Nothing survives the process. Expired entries are invisible immediately
 * and physically removed on access or by cleanup(), which an optional
 * background thread runs every Config::cleanupInterval.
 *
 * @code
 * InMemoryStore store;
 * store.put("session", "token", "abc", std::chrono::minutes(5));
 * auto token = store.get("session", "token");
 * for (const auto& entry : store.search("session", "tok")) { ... }
 * @endcode
 */
class InMemoryStore : public IMemoryStore {
public:
    struct Config {
        /// Run cleanup() periodically on a background thread
        bool backgroundCleanup = false;
        std::chrono::milliseconds cleanupInterval{60000};
    };

    struct Stats {
        size_t entries = 0;
        size_t namespaces = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t expired = 0;   ///< Entries dropped because their TTL ran out
    };

    InMemoryStore();
    explicit InMemoryStore(const Config& config);
    ~InMemoryStore() override;

    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;

    std::optional<std::string> get(const std::string& ns, const std::string& key) override;
    void put(const std::string& ns, const std::string& key, std::string value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    bool remove(const std::string& ns, const std::string& key) override;
    std::vector<std::string> keys(const std::string& ns, const std::string& prefix = {}) override;

    /// Live entries of a namespace, most recently updated first
    std::vector<MemoryEntry> list(const std::string& ns, size_t limit = 100);

    /// Case-insensitive substring match on key or value
    std::vector<MemoryEntry> search(const std::string& ns, const std::string& pattern, size_t limit = 50);

    /// Drop every entry in a namespace; returns how many there were
    size_t clear(const std::string& ns);

    std::vector<std::string> namespaces() const;

    /// Remove expired entries now; returns how many were removed
    size_t cleanup();

    Stats getStats() const;

private:
    using Namespace = std::map<std::string, MemoryEntry>;

    void run(const std::stop_token& token);

    Config _config;
    mutable std::mutex _mutex;
    std::map<std::string, Namespace> _data;
    uint64_t _hits = 0;
    uint64_t _misses = 0;
    uint64_t _expired = 0;

    std::mutex _wakeMutex;
    std::condition_variable_any _wake;
    std::jthread _cleanupThread;
};

} // namespace Memory
} // namespace Core
} // namespace SwarmEngine
