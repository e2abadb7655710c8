/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file Profiling.h
 * @brief Tracy profiler hooks for the coordination engine
 *
 * Zones, plots and lock annotations used by the scheduler, the work-stealing
 * sweep and the connection pool. With TRACY_ENABLE undefined every macro
 * compiles to nothing.
 */

#pragma once

#include <tracy/Tracy.hpp>
#include <cstdint>

namespace SwarmEngine {
namespace Core {
namespace Debug {

    /**
     * @brief Profiling macros wrapping Tracy
     *
     * @code
     * AssignmentResult TaskScheduler::assign(const TaskId& id) {
     *     SWARM_PROFILE_ZONE_NC("Scheduler::assign", ProfileColors::Scheduling);
     *     ...
     *     SWARM_PROFILE_PLOT_I("ReadyQueueDepth", static_cast<int64_t>(queueDepth()));
     * }
     * @endcode
     */
    #ifdef TRACY_ENABLE
        #define SWARM_PROFILE_ZONE() ZoneScoped
        #define SWARM_PROFILE_ZONE_N(name) ZoneScopedN(name)
        #define SWARM_PROFILE_ZONE_NC(name, color) ZoneScopedNC(name, color)
        #define SWARM_PROFILE_ZONE_TEXT(text, size) ZoneText(text, size)

        #define SWARM_PROFILE_LOCKABLE(type, varname) TracyLockable(type, varname)
        #define SWARM_PROFILE_SHARED_LOCKABLE(type, varname) TracySharedLockable(type, varname)

        #define SWARM_PROFILE_PLOT_I(name, val) TracyPlot(name, static_cast<int64_t>(val))
        #define SWARM_PROFILE_PLOT_F(name, val) TracyPlot(name, static_cast<double>(val))

        #define SWARM_PROFILE_MESSAGE_L(txt) TracyMessageL(txt)
    #else
        #define SWARM_PROFILE_ZONE()
        #define SWARM_PROFILE_ZONE_N(name)
        #define SWARM_PROFILE_ZONE_NC(name, color)
        #define SWARM_PROFILE_ZONE_TEXT(text, size)

        #define SWARM_PROFILE_LOCKABLE(type, varname) type varname
        #define SWARM_PROFILE_SHARED_LOCKABLE(type, varname) type varname

        #define SWARM_PROFILE_PLOT_I(name, val)
        #define SWARM_PROFILE_PLOT_F(name, val)

        #define SWARM_PROFILE_MESSAGE_L(txt)
    #endif

    /**
     * @brief Timeline colours per subsystem
     */
    namespace ProfileColors {
        constexpr uint32_t Scheduling = 0x4444FF;   // Blue
        constexpr uint32_t Stealing = 0xFF8844;     // Orange
        constexpr uint32_t Backend = 0xFF4444;      // Red
        constexpr uint32_t Messaging = 0xFF44FF;    // Magenta
        constexpr uint32_t Metrics = 0x44FFFF;      // Cyan
        constexpr uint32_t Graph = 0x44FF44;        // Green
    }

} // namespace Debug
} // namespace Core
} // namespace SwarmEngine
