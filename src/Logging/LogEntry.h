/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file LogEntry.h
 * @brief A single log record with coordination context
 */

#pragma once

#include "LogLevel.h"
#include <chrono>
#include <source_location>
#include <string>
#include <thread>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Raw log record handed to every sink
     *
     * Besides the usual timestamp/thread/location data an entry can carry the
     * task and agent it concerns. Sinks decide how (and whether) to render them;
     * the console sink appends them as `task=<id> agent=<id>`.
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        std::thread::id threadId;
        LogLevel level;
        std::string category;
        std::string message;
        std::source_location location;

        /// Task the message is about, empty when not task-specific
        std::string taskId;
        /// Agent the message is about, empty when not agent-specific
        std::string agentId;

        LogEntry(LogLevel lvl,
                 std::string_view cat,
                 std::string msg,
                 const std::source_location& loc = std::source_location::current())
            : timestamp(std::chrono::system_clock::now())
            , threadId(std::this_thread::get_id())
            , level(lvl)
            , category(cat)
            , message(std::move(msg))
            , location(loc) {}
    };

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
