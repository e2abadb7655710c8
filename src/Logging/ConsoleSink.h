/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file ConsoleSink.h
 * @brief Coloured terminal sink
 */

#pragma once

#include "ILogSink.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries to stdout, or stderr for Error and Fatal
     *
     * Line format:
     * `[HH:MM:SS.mmm] [LEVEL] [thread] [Category] message task=<id> agent=<id> (file:line)`
     * where the thread, context and location parts are optional.
     */
    class ConsoleSink : public ILogSink {
    private:
        mutable std::mutex _mutex;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
        bool _useColor = true;
        bool _showThreadId = true;
        bool _showLocation = false;

        static constexpr const char* RESET = "\033[0m";
        static constexpr const char* RED = "\033[31m";
        static constexpr const char* YELLOW = "\033[33m";
        static constexpr const char* GREEN = "\033[32m";
        static constexpr const char* CYAN = "\033[36m";
        static constexpr const char* MAGENTA = "\033[35m";
        static constexpr const char* GRAY = "\033[90m";

    public:
        explicit ConsoleSink(bool useColor = true, bool showThreadId = true)
            : _useColor(useColor)
            , _showThreadId(showThreadId) {}

        void write(const LogEntry& entry) override;
        void flush() override;
        bool shouldLog(LogLevel level) const override;
        void setMinLevel(LogLevel level) override;

        void setUseColor(bool useColor) { _useColor = useColor; }
        void setShowThreadId(bool show) { _showThreadId = show; }
        void setShowLocation(bool show) { _showLocation = show; }

        /**
         * @brief Render an entry exactly as write() would, without colour
         *
         * Exposed so the format can be checked without capturing std::cout.
         */
        std::string format(const LogEntry& entry) const;

    private:
        const char* getColorForLevel(LogLevel level) const;
        void formatInto(std::ostream& stream, const LogEntry& entry, bool color) const;
    };

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
