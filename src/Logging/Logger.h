/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file Logger.h
 * @brief Central logger that fans entries out to sinks
 *
 * Every coordination component logs through the global Logger using the
 * SWARM_LOG_* macros, with its component name as category ("Scheduler",
 * "WorkStealing", "CircuitBreaker", ...).
 */

#pragma once

#include "LogEntry.h"
#include "ILogSink.h"
#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <source_location>
#include <type_traits>
#include <vector>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Format string that remembers where it was written
     *
     * Lets the variadic logging calls capture std::source_location without a
     * trailing defaulted parameter after the argument pack.
     */
    template<typename... Args>
    struct LocatedFormat {
        std::format_string<Args...> fmt;
        std::source_location location;

        template<typename S>
        consteval LocatedFormat(const S& s, const std::source_location& loc = std::source_location::current())
            : fmt(s), location(loc) {}
    };

    template<typename... Args>
    using LocatedFormatFor = LocatedFormat<std::type_identity_t<Args>...>;

    /**
     * @brief Thread-safe logger distributing entries to its sinks
     *
     * Sinks are held by shared ownership and can be added or removed while
     * other threads are logging. Messages below the logger's minimum level are
     * dropped before any formatting happens.
     *
     * @code
     * Logger::global().info("Scheduler", "assigned {} to {}", taskId, agentId);
     * SWARM_LOG_WARNING_CAT("CircuitBreaker", "endpoint {} opened", endpoint);
     * @endcode
     */
    class Logger {
    private:
        std::string _name;
        std::vector<LogSinkPtr> _sinks;
        mutable std::shared_mutex _sinkMutex;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};

        static std::unique_ptr<Logger> s_globalLogger;
        static std::mutex s_globalMutex;

    public:
        explicit Logger(std::string name) : _name(std::move(name)) {}

        /**
         * @brief Process-wide logger, created with a ConsoleSink on first use
         */
        static Logger& global();

        /**
         * @brief Replace the process-wide logger
         * @param logger New logger; ownership is taken
         */
        static void setGlobal(std::unique_ptr<Logger> logger);

        const std::string& getName() const { return _name; }

        void addSink(LogSinkPtr sink);
        void removeSink(const LogSinkPtr& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel getMinLevel() const { return _minLevel.load(std::memory_order_relaxed); }

        bool isEnabled(LogLevel level) const { return level >= getMinLevel(); }

        void log(LogLevel level,
                 std::string_view category,
                 const std::string& message,
                 const std::source_location& location = std::source_location::current()) {
            if (!isEnabled(level)) return;
            writeToSinks(LogEntry(level, category, message, location));
        }

        template<typename... Args>
        void log(LogLevel level, std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            if (!isEnabled(level)) return;
            writeToSinks(LogEntry(level, category,
                                  std::format(fmt.fmt, std::forward<Args>(args)...),
                                  fmt.location));
        }

        /**
         * @brief Log a message about a specific task and/or agent
         *
         * The ids travel in the entry's context fields so sinks can filter or
         * render them separately from the message text.
         */
        void logTask(LogLevel level,
                     std::string_view category,
                     std::string_view taskId,
                     std::string_view agentId,
                     const std::string& message,
                     const std::source_location& location = std::source_location::current()) {
            if (!isEnabled(level)) return;
            LogEntry entry(level, category, message, location);
            entry.taskId = taskId;
            entry.agentId = agentId;
            writeToSinks(entry);
        }

        template<typename... Args>
        void trace(std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            log<Args...>(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
        }
        void trace(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Trace, category, message, loc);
        }

        template<typename... Args>
        void debug(std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            log<Args...>(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
        }
        void debug(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Debug, category, message, loc);
        }

        template<typename... Args>
        void info(std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            log<Args...>(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
        }
        void info(std::string_view category, const std::string& message,
                  const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Info, category, message, loc);
        }

        template<typename... Args>
        void warning(std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            log<Args...>(LogLevel::Warning, category, fmt, std::forward<Args>(args)...);
        }
        void warning(std::string_view category, const std::string& message,
                     const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Warning, category, message, loc);
        }

        template<typename... Args>
        void error(std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            log<Args...>(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
        }
        void error(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Error, category, message, loc);
        }

        template<typename... Args>
        void fatal(std::string_view category, LocatedFormatFor<Args...> fmt, Args&&... args) {
            log<Args...>(LogLevel::Fatal, category, fmt, std::forward<Args>(args)...);
            flush();
        }
        void fatal(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Fatal, category, message, loc);
            flush();
        }

        void flush();

    private:
        void writeToSinks(const LogEntry& entry);
    };

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine

/**
 * @brief Logging macros bound to the global logger
 *
 * SWARM_LOG_XXX uses the calling function's name as category,
 * SWARM_LOG_XXX_CAT takes an explicit category and SWARM_LOG_TASK attaches
 * task/agent context.
 */
#define SWARM_LOG_TRACE(fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().trace(__func__, fmt, ##__VA_ARGS__)
#define SWARM_LOG_DEBUG(fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().debug(__func__, fmt, ##__VA_ARGS__)
#define SWARM_LOG_INFO(fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().info(__func__, fmt, ##__VA_ARGS__)
#define SWARM_LOG_WARNING(fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().warning(__func__, fmt, ##__VA_ARGS__)
#define SWARM_LOG_ERROR(fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().error(__func__, fmt, ##__VA_ARGS__)

#define SWARM_LOG_TRACE_CAT(category, fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().trace(category, fmt, ##__VA_ARGS__)
#define SWARM_LOG_DEBUG_CAT(category, fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().debug(category, fmt, ##__VA_ARGS__)
#define SWARM_LOG_INFO_CAT(category, fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().info(category, fmt, ##__VA_ARGS__)
#define SWARM_LOG_WARNING_CAT(category, fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().warning(category, fmt, ##__VA_ARGS__)
#define SWARM_LOG_ERROR_CAT(category, fmt, ...) \
    ::SwarmEngine::Core::Logging::Logger::global().error(category, fmt, ##__VA_ARGS__)

#define SWARM_LOG_TASK(level, category, taskId, agentId, fmt, ...) \
    do { \
        auto& swarmLogger_ = ::SwarmEngine::Core::Logging::Logger::global(); \
        if (swarmLogger_.isEnabled(level)) { \
            swarmLogger_.logTask(level, category, taskId, agentId, std::format(fmt, ##__VA_ARGS__)); \
        } \
    } while (0)
