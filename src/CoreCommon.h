/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Debug assertions and shared aliases for SwarmCore
 *
 * Everything in the coordination engine identifies tasks, agents, endpoints and
 * resources by string id, and measures time on the steady clock. Those aliases
 * live here so every component agrees on them.
 */

#include <cassert>
#include <chrono>
#include <string>

#ifdef SwarmDebug
#define SWARM_DEBUG_BLOCK(code) do { code } while(0)
#undef NDEBUG
#define SWARM_ASSERT(condition, message) assert(condition)
#else
#define SWARM_DEBUG_BLOCK(code) ((void)0)
#define SWARM_ASSERT(condition, message) ((void)0)
#endif

namespace SwarmEngine {
namespace Core {

    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    using TaskId = std::string;
    using AgentId = std::string;
    using EndpointId = std::string;
    using ResourceName = std::string;

} // namespace Core
} // namespace SwarmEngine
