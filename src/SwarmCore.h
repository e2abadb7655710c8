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
 * @file SwarmCore.h
 * @brief Single header that includes all SwarmCore components
 */

// Core common utilities
#include "CoreCommon.h"
#include "Core/CircularBuffer.h"

// Debug
#include "Debug/Profiling.h"

// Logging
#include "Logging/LogLevel.h"
#include "Logging/LogEntry.h"
#include "Logging/ILogSink.h"
#include "Logging/ConsoleSink.h"
#include "Logging/RingBufferSink.h"
#include "Logging/Logger.h"

// Memory store
#include "Memory/IMemoryStore.h"
#include "Memory/InMemoryStore.h"

// Coordination
#include "Coordination/CoordinationErrors.h"
#include "Coordination/CoordinationTypes.h"
#include "Coordination/CoordinationEvents.h"
#include "Coordination/OptimisticLockManager.h"
#include "Coordination/CoordinationState.h"
#include "Coordination/DependencyGraph.h"
#include "Coordination/ResourceManager.h"
#include "Coordination/CircuitBreaker.h"
#include "Coordination/IBackendConnection.h"
#include "Coordination/ConnectionPool.h"
#include "Coordination/ConflictResolver.h"
#include "Coordination/MessageRouter.h"
#include "Coordination/ISchedulingStrategy.h"
#include "Coordination/SchedulingStrategies.h"
#include "Coordination/TaskScheduler.h"
#include "Coordination/WorkStealingCoordinator.h"
#include "Coordination/CoordinationMetricsCollector.h"
#include "Coordination/CoordinationCheckpoint.h"
#include "Coordination/CoordinationConfig.h"
#include "Coordination/CoordinationManager.h"
