/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file IBackendConnection.h
 * @brief Boundary to the external execution backend
 */

#pragma once

#include "../CoreCommon.h"
#include <functional>
#include <memory>
#include <string>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    /**
     * @brief One handle to the execution backend
     *
     * The engine never looks inside payloads or results. Implementations throw
     * BackendError (or anything else) on failure; the circuit breaker counts
     * every exception as a failed call.
     *
     * A connection is used by one caller at a time; the pool guarantees that.
     */
    class IBackendConnection {
    public:
        virtual ~IBackendConnection() = default;

        virtual std::string invoke(const EndpointId& endpoint, const std::string& payload) = 0;

        /// False once the connection should not be reused
        virtual bool isHealthy() const = 0;

        /// Called when the pool discards the connection
        virtual void close() {}
    };

    using ConnectionFactory = std::function<std::unique_ptr<IBackendConnection>()>;

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
