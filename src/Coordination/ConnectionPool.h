/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

/**
 * @file ConnectionPool.h
 * @brief Bounded, reusable set of backend connections
 */

#pragma once

#include "IBackendConnection.h"
#include "CoordinationErrors.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    class ConnectionPool;

    /**
     * @brief Pool-owned connection record
     *
     * Only the pool creates these. A caller sees one through a Lease while it
     * is checked out.
     */
    struct PooledConnection {
        uint64_t id = 0;
        std::unique_ptr<IBackendConnection> handle;
        bool inUse = false;
        bool healthy = true;
        TimePoint lastUsed = Clock::now();
    };

    /**
     * @brief Exclusive loan of a connection, returned to the pool on destruction
     *
     * @code
     * {
     *     auto lease = pool.acquire();
     *     try {
     *         result = lease->invoke("search", payload);
     *     } catch (const BackendError&) {
     *         lease.invalidate();   // discarded instead of reused
     *         throw;
     *     }
     * }   // released here
     * @endcode
     *
     * A lease points into its pool, so the pool must outlive every lease it
     * handed out. drain() without a timeout before destroying a pool whose
     * leases may still be held by other threads.
     */
    class ConnectionLease {
    public:
        ConnectionLease() = default;
        ~ConnectionLease() { release(); }

        ConnectionLease(const ConnectionLease&) = delete;
        ConnectionLease& operator=(const ConnectionLease&) = delete;
        ConnectionLease(ConnectionLease&& other) noexcept;
        ConnectionLease& operator=(ConnectionLease&& other) noexcept;

        IBackendConnection* operator->() const { return _connection->handle.get(); }
        IBackendConnection& operator*() const { return *_connection->handle; }

        explicit operator bool() const { return _connection != nullptr; }

        uint64_t id() const { return _connection ? _connection->id : 0; }

        /// Mark unhealthy so release() discards it
        void invalidate();

        /// Return early; no-op on an empty lease
        void release();

    private:
        friend class ConnectionPool;
        ConnectionLease(ConnectionPool* pool, PooledConnection* connection)
            : _pool(pool), _connection(connection) {}

        ConnectionPool* _pool = nullptr;
        PooledConnection* _connection = nullptr;
        bool _invalidated = false;
    };

    /**
     * @brief Bounded pool of backend connections with idle eviction
     *
     * acquire() hands out an idle healthy connection (most recently used
     * first), creates one while below maxSize, or blocks until a release. It
     * throws PoolExhaustedError when the wait times out or the pool is
     * draining. A background sweep evicts connections idle for longer than
     * idleTimeout, keeping at least minIdle warm.
     *
     * drain() is the shutdown path: new acquisitions fail immediately and the
     * call blocks until every lease has been returned.
     *
     * Thread Safety: all methods are thread-safe. The factory runs outside the
     * pool lock, with a slot reserved so maxSize is never exceeded.
     */
    class ConnectionPool {
    public:
        struct Config {
            size_t maxSize = 8;
            size_t minIdle = 0;                                   ///< Connections kept warm by the sweeper
            std::chrono::milliseconds idleTimeout{60000};         ///< Idle age after which a connection is evicted
            std::chrono::milliseconds acquireTimeout{5000};       ///< Default wait in acquire()
            std::chrono::milliseconds sweepInterval{1000};
        };

        struct Stats {
            size_t size = 0;            ///< Open connections, including ones being created
            size_t inUse = 0;
            size_t idle = 0;
            size_t waiters = 0;
            uint64_t created = 0;
            uint64_t evicted = 0;       ///< Closed by the idle sweep
            uint64_t discarded = 0;     ///< Closed because they were unhealthy
            uint64_t acquisitions = 0;
            uint64_t timeouts = 0;
            size_t maxSize = 0;

            double utilization() const {
                return maxSize > 0 ? static_cast<double>(inUse) / static_cast<double>(maxSize) : 0.0;
            }
        };

        ConnectionPool(ConnectionFactory factory, Config config);
        ~ConnectionPool();

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /// Start the idle sweep thread and warm minIdle connections
        void start();
        /// Stop the sweep thread; outstanding leases stay valid
        void stop();

        /**
         * @brief Borrow a connection, waiting up to the configured timeout
         * @throws PoolExhaustedError on timeout or while draining
         */
        ConnectionLease acquire();
        ConnectionLease acquire(std::chrono::milliseconds timeout);

        /**
         * @brief Refuse new acquisitions and wait for outstanding leases
         *
         * Idle connections are closed once everything is back.
         * @return false if the timeout elapsed first
         */
        bool drain(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

        bool isDraining() const { return _draining.load(std::memory_order_acquire); }

        /// Evict connections idle longer than idleTimeout; returns the number evicted
        size_t sweepIdle();

        Stats getStats() const;
        const Config& config() const { return _config; }

    private:
        friend class ConnectionLease;

        void release(PooledConnection* connection, bool healthy);
        void closeLocked(uint64_t id);
        void warmUp();
        void sweepLoop(const std::stop_token& token);

        ConnectionFactory _factory;
        Config _config;

        mutable std::mutex _mutex;
        std::condition_variable_any _released;
        std::unordered_map<uint64_t, std::unique_ptr<PooledConnection>> _connections;
        std::deque<PooledConnection*> _idle;   ///< Front is most recently used
        size_t _creating = 0;
        size_t _inUse = 0;
        size_t _waiters = 0;
        uint64_t _nextId = 1;

        uint64_t _created = 0;
        uint64_t _evicted = 0;
        uint64_t _discarded = 0;
        uint64_t _acquisitions = 0;
        uint64_t _timeouts = 0;

        std::atomic<bool> _draining{false};
        std::jthread _sweeper;
    };

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
