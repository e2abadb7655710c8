/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file IMemoryStore.h
 * @brief Key-value store the engine checkpoints into
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Memory {

/**
 * @brief Durable key-value store, partitioned by namespace
 *
 * Values are opaque strings. The coordination engine treats the store as best
 * effort: a missing key is never an error, and a store that throws only costs
 * a checkpoint.
 *
 * Thread Safety: implementations MUST be thread-safe.
 */
class IMemoryStore {
public:
    virtual ~IMemoryStore() = default;

    /// Value under key, or nullopt if absent or expired
    virtual std::optional<std::string> get(const std::string& ns, const std::string& key) = 0;

    /**
     * @brief Store a value, replacing any previous one
     * @param ttl Time to live; nullopt keeps the value until removed
     */
    virtual void put(const std::string& ns, const std::string& key, std::string value,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    /// @return false if nothing was stored under key
    virtual bool remove(const std::string& ns, const std::string& key) = 0;

    /// Live keys in the namespace starting with prefix, sorted
    virtual std::vector<std::string> keys(const std::string& ns, const std::string& prefix = {}) = 0;
};

} // namespace Memory
} // namespace Core
} // namespace SwarmEngine
