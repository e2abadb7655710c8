/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "ConsoleSink.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    void ConsoleSink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = (entry.level >= LogLevel::Error) ? std::cerr : std::cout;
        formatInto(stream, entry, _useColor);
        stream << '\n';
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

    bool ConsoleSink::shouldLog(LogLevel level) const {
        return level >= _minLevel.load(std::memory_order_relaxed);
    }

    void ConsoleSink::setMinLevel(LogLevel level) {
        _minLevel.store(level, std::memory_order_relaxed);
    }

    std::string ConsoleSink::format(const LogEntry& entry) const {
        std::ostringstream oss;
        formatInto(oss, entry, false);
        return oss.str();
    }

    const char* ConsoleSink::getColorForLevel(LogLevel level) const {
        switch (level) {
            case LogLevel::Trace:   return GRAY;
            case LogLevel::Debug:   return CYAN;
            case LogLevel::Info:    return GREEN;
            case LogLevel::Warning: return YELLOW;
            case LogLevel::Error:   return RED;
            case LogLevel::Fatal:   return MAGENTA;
            default:                return RESET;
        }
    }

    void ConsoleSink::formatInto(std::ostream& stream, const LogEntry& entry, bool color) const {
        auto timeT = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()) % 1000;
        std::tm localTime{};
        localtime_r(&timeT, &localTime);

        stream << "[" << std::put_time(&localTime, "%H:%M:%S")
               << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        if (color) stream << getColorForLevel(entry.level);
        stream << "[" << logLevelToString(entry.level) << "]";
        if (color) stream << RESET;
        stream << " ";

        if (_showThreadId) {
            std::ostringstream threadStr;
            threadStr << entry.threadId;
            auto threadIdStr = threadStr.str();
            if (threadIdStr.length() > 4) {
                threadIdStr = threadIdStr.substr(threadIdStr.length() - 4);
            }
            stream << "[" << std::setfill(' ') << std::setw(4) << threadIdStr << "] ";
        }

        if (!entry.category.empty()) {
            stream << "[" << entry.category << "] ";
        }

        stream << entry.message;

        if (!entry.taskId.empty()) {
            stream << " task=" << entry.taskId;
        }
        if (!entry.agentId.empty()) {
            stream << " agent=" << entry.agentId;
        }

        if (_showLocation && entry.location.line() != 0) {
            stream << " (" << entry.location.file_name()
                   << ":" << entry.location.line() << ")";
        }
    }

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
