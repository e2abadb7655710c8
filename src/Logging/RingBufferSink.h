/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file RingBufferSink.h
 * @brief In-memory sink keeping the most recent entries
 */

#pragma once

#include "ILogSink.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Keeps the last N entries for post-mortem inspection
     *
     * Attach one next to the console sink to dump the recent history of a
     * coordinator after a stuck task is detected, or in tests to assert on what
     * a component reported.
     *
     * @code
     * auto recent = std::make_shared<RingBufferSink>(256);
     * Logger::global().addSink(recent);
     * ...
     * for (const auto& e : recent->entries()) {
     *     if (e.level >= LogLevel::Warning) report(e);
     * }
     * @endcode
     */
    class RingBufferSink : public ILogSink {
    public:
        explicit RingBufferSink(size_t capacity = 1024)
            : _capacity(capacity == 0 ? 1 : capacity) {}

        void write(const LogEntry& entry) override {
            if (!shouldLog(entry.level)) return;
            std::lock_guard<std::mutex> lock(_mutex);
            if (_entries.size() == _capacity) {
                _entries.pop_front();
            }
            _entries.push_back(entry);
        }

        void flush() override {}

        bool shouldLog(LogLevel level) const override {
            return level >= _minLevel.load(std::memory_order_relaxed);
        }

        void setMinLevel(LogLevel level) override {
            _minLevel.store(level, std::memory_order_relaxed);
        }

        std::vector<LogEntry> entries() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return {_entries.begin(), _entries.end()};
        }

        /**
         * @brief Entries whose message or category contains the needle
         */
        std::vector<LogEntry> find(std::string_view needle) const {
            std::lock_guard<std::mutex> lock(_mutex);
            std::vector<LogEntry> out;
            for (const auto& e : _entries) {
                if (e.message.find(needle) != std::string::npos ||
                    e.category.find(needle) != std::string::npos) {
                    out.push_back(e);
                }
            }
            return out;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _entries.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(_mutex);
            _entries.clear();
        }

    private:
        mutable std::mutex _mutex;
        std::deque<LogEntry> _entries;
        size_t _capacity;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
