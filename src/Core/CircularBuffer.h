/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file CircularBuffer.h
 * @brief Fixed-capacity ring that overwrites its oldest element
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace SwarmEngine {
namespace Core {

/**
 * @brief Bounded history buffer
 *
 * Storage is allocated once. push() never fails: when full, the oldest element
 * is overwritten and counted as evicted. Not thread-safe; owners wrap it in
 * their own lock.
 *
 * @code
 * CircularBuffer<MetricsSample> history(120);
 * history.push(sample);
 * auto newest = history.back();
 * for (const auto& s : history.toVector()) { ... }   // oldest first
 * @endcode
 */
template<typename T>
class CircularBuffer {
public:
    explicit CircularBuffer(size_t capacity)
        : _storage(capacity == 0 ? 1 : capacity) {}

    void push(T value) {
        _storage[_head] = std::move(value);
        _head = (_head + 1) % _storage.size();
        if (_size < _storage.size()) {
            ++_size;
        } else {
            ++_evicted;
        }
    }

    /// Element i counting from the oldest
    const T& at(size_t index) const {
        if (index >= _size) {
            throw std::out_of_range("CircularBuffer index out of range");
        }
        return _storage[(start() + index) % _storage.size()];
    }

    std::optional<T> back() const {
        if (_size == 0) {
            return std::nullopt;
        }
        return _storage[(_head + _storage.size() - 1) % _storage.size()];
    }

    /// Oldest first
    std::vector<T> toVector() const {
        std::vector<T> out;
        out.reserve(_size);
        for (size_t i = 0; i < _size; ++i) {
            out.push_back(_storage[(start() + i) % _storage.size()]);
        }
        return out;
    }

    /// The newest n elements, oldest first
    std::vector<T> newest(size_t n) const {
        n = n < _size ? n : _size;
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = _size - n; i < _size; ++i) {
            out.push_back(_storage[(start() + i) % _storage.size()]);
        }
        return out;
    }

    void clear() {
        _head = 0;
        _size = 0;
    }

    size_t size() const { return _size; }
    size_t capacity() const { return _storage.size(); }
    bool empty() const { return _size == 0; }
    bool full() const { return _size == _storage.size(); }
    size_t evictedCount() const { return _evicted; }

private:
    size_t start() const {
        return (_head + _storage.size() - _size) % _storage.size();
    }

    std::vector<T> _storage;
    size_t _head = 0;     ///< Next write position
    size_t _size = 0;
    size_t _evicted = 0;
};

} // namespace Core
} // namespace SwarmEngine
