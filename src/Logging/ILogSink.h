/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file ILogSink.h
 * @brief Output destination interface for log entries
 */

#pragma once

#include "LogEntry.h"
#include <memory>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Implementations must be thread-safe: the scheduler, the background sweeps
     * and every router delivery thread log concurrently. Each sink filters by
     * its own minimum level independently of the logger.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        /**
         * @brief Write one entry
         * @param entry The entry to output
         */
        virtual void write(const LogEntry& entry) = 0;

        /**
         * @brief Push buffered output to its destination
         */
        virtual void flush() = 0;

        virtual bool shouldLog(LogLevel level) const = 0;
        virtual void setMinLevel(LogLevel level) = 0;
    };

    using LogSinkPtr = std::shared_ptr<ILogSink>;

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
