/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file LogLevel.h
 * @brief Severity levels for coordination logging
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace SwarmEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Log severity, least to most severe
     *
     * The scheduler logs individual assignments at Trace, recoverable contention
     * (version conflicts, exhausted pools) at Debug, lifecycle at Info, isolated
     * endpoints and cascaded cancellations at Warning and terminal task failures
     * at Error.
     */
    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5,
        Off = 6
    };

    /**
     * @brief Fixed-width (5 character) level name for aligned output
     */
    inline constexpr std::string_view logLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            case LogLevel::Off:     return "OFF  ";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Parse a level name from configuration
     *
     * Case-insensitive; "warn" is accepted for Warning. Unknown strings map to
     * Info so a typo in a config file never silences the engine.
     *
     * @code
     * logger.setMinLevel(stringToLogLevel(config.logLevel));
     * @endcode
     */
    inline LogLevel stringToLogLevel(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (str == "trace") return LogLevel::Trace;
        if (str == "debug") return LogLevel::Debug;
        if (str == "info") return LogLevel::Info;
        if (str == "warning" || str == "warn") return LogLevel::Warning;
        if (str == "error") return LogLevel::Error;
        if (str == "fatal") return LogLevel::Fatal;
        if (str == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

} // namespace Logging
} // namespace Core
} // namespace SwarmEngine
