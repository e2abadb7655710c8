/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "Logger.h"
#include "ConsoleSink.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    std::unique_ptr<Logger> Logger::s_globalLogger;
    std::mutex Logger::s_globalMutex;

    Logger& Logger::global() {
        std::lock_guard<std::mutex> lock(s_globalMutex);
        if (!s_globalLogger) {
            auto logger = std::make_unique<Logger>("Swarm");
            logger->addSink(std::make_shared<ConsoleSink>());
            s_globalLogger = std::move(logger);
        }
        return *s_globalLogger;
    }

    void Logger::setGlobal(std::unique_ptr<Logger> logger) {
        std::lock_guard<std::mutex> lock(s_globalMutex);
        s_globalLogger = std::move(logger);
    }

    void Logger::addSink(LogSinkPtr sink) {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.push_back(std::move(sink));
    }

    void Logger::removeSink(const LogSinkPtr& sink) {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
    }

    void Logger::clearSinks() {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        return _sinks.size();
    }

    void Logger::flush() {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        for (auto& sink : _sinks) {
            sink->flush();
        }
    }

    void Logger::writeToSinks(const LogEntry& entry) {
        // Errors usually precede a task failure or shutdown, so the sinks
        // that accepted one are flushed right away
        const bool urgent = entry.level >= LogLevel::Error;
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        for (auto& sink : _sinks) {
            if (!sink->shouldLog(entry.level)) continue;
            sink->write(entry);
            if (urgent) sink->flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
