/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "InMemoryStore.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cctype>

namespace SwarmEngine {
namespace Core {
namespace Memory {

namespace {
    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }
}

InMemoryStore::InMemoryStore()
    : InMemoryStore(Config{}) {}

InMemoryStore::InMemoryStore(const Config& config)
    : _config(config) {
    if (_config.backgroundCleanup) {
        _cleanupThread = std::jthread([this](const std::stop_token& token) { run(token); });
    }
}

InMemoryStore::~InMemoryStore() {
    if (_cleanupThread.joinable()) {
        _cleanupThread.request_stop();
        _wake.notify_all();
        _cleanupThread.join();
    }
}

void InMemoryStore::run(const std::stop_token& token) {
    while (!token.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wake.wait_for(lock, token, _config.cleanupInterval, [] { return false; });
        }
        if (token.stop_requested()) {
            return;
        }
        size_t removed = cleanup();
        if (removed > 0) {
            SWARM_LOG_DEBUG_CAT("MemoryStore", "Expired {} entries", removed);
        }
    }
}

std::optional<std::string> InMemoryStore::get(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto space = _data.find(ns);
    if (space == _data.end()) {
        ++_misses;
        return std::nullopt;
    }
    auto it = space->second.find(key);
    if (it == space->second.end()) {
        ++_misses;
        return std::nullopt;
    }

    auto now = Clock::now();
    if (it->second.isExpired(now)) {
        space->second.erase(it);
        ++_expired;
        ++_misses;
        return std::nullopt;
    }

    it->second.accessedAt = now;
    ++it->second.accessCount;
    ++_hits;
    return it->second.value;
}

void InMemoryStore::put(const std::string& ns, const std::string& key, std::string value,
                        std::optional<std::chrono::milliseconds> ttl) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(_mutex);
    auto& space = _data[ns];
    auto [it, inserted] = space.try_emplace(key);
    MemoryEntry& entry = it->second;
    if (inserted) {
        entry.ns = ns;
        entry.key = key;
        entry.createdAt = now;
        entry.accessCount = 0;
    }
    entry.value = std::move(value);
    entry.updatedAt = now;
    entry.accessedAt = now;
    ++entry.accessCount;
    entry.expiresAt = ttl ? std::optional<TimePoint>(now + *ttl) : std::nullopt;
}

bool InMemoryStore::remove(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto space = _data.find(ns);
    return space != _data.end() && space->second.erase(key) > 0;
}

std::vector<std::string> InMemoryStore::keys(const std::string& ns, const std::string& prefix) {
    std::vector<std::string> out;
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(_mutex);
    auto space = _data.find(ns);
    if (space == _data.end()) {
        return out;
    }
    for (auto it = space->second.lower_bound(prefix); it != space->second.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (!it->second.isExpired(now)) {
            out.push_back(it->first);
        }
    }
    return out;
}

std::vector<MemoryEntry> InMemoryStore::list(const std::string& ns, size_t limit) {
    std::vector<MemoryEntry> out;
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto space = _data.find(ns);
        if (space == _data.end()) {
            return out;
        }
        for (const auto& [key, entry] : space->second) {
            if (!entry.isExpired(now)) {
                out.push_back(entry);
            }
        }
    }
    std::sort(out.begin(), out.end(),
              [](const MemoryEntry& a, const MemoryEntry& b) { return a.updatedAt > b.updatedAt; });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

std::vector<MemoryEntry> InMemoryStore::search(const std::string& ns, const std::string& pattern, size_t limit) {
    std::vector<MemoryEntry> out;
    auto needle = toLower(pattern);
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(_mutex);
    auto space = _data.find(ns);
    if (space == _data.end()) {
        return out;
    }
    for (const auto& [key, entry] : space->second) {
        if (out.size() >= limit) {
            break;
        }
        if (entry.isExpired(now)) {
            continue;
        }
        if (toLower(key).find(needle) != std::string::npos ||
            toLower(entry.value).find(needle) != std::string::npos) {
            out.push_back(entry);
        }
    }
    return out;
}

size_t InMemoryStore::clear(const std::string& ns) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto space = _data.find(ns);
    if (space == _data.end()) {
        return 0;
    }
    size_t count = space->second.size();
    _data.erase(space);
    return count;
}

std::vector<std::string> InMemoryStore::namespaces() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> out;
    out.reserve(_data.size());
    for (const auto& [ns, space] : _data) {
        out.push_back(ns);
    }
    return out;
}

size_t InMemoryStore::cleanup() {
    auto now = Clock::now();
    size_t removed = 0;
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto& [ns, space] : _data) {
        for (auto it = space.begin(); it != space.end();) {
            if (it->second.isExpired(now)) {
                it = space.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    _expired += removed;
    return removed;
}

InMemoryStore::Stats InMemoryStore::getStats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    Stats stats;
    stats.namespaces = _data.size();
    for (const auto& [ns, space] : _data) {
        stats.entries += space.size();
    }
    stats.hits = _hits;
    stats.misses = _misses;
    stats.expired = _expired;
    return stats;
}

} // namespace Memory
} // namespace Core
} // namespace SwarmEngine
