/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the SwarmCore project.
 */

#include "ConnectionPool.h"
#include "../Logging/Logger.h"
#include "../Debug/Profiling.h"
#include <algorithm>

namespace SwarmEngine {
namespace Core {
namespace Coordination {

    ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
        : _pool(other._pool)
        , _connection(other._connection)
        , _invalidated(other._invalidated) {
        other._pool = nullptr;
        other._connection = nullptr;
        other._invalidated = false;
    }

    ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
        if (this != &other) {
            release();
            _pool = other._pool;
            _connection = other._connection;
            _invalidated = other._invalidated;
            other._pool = nullptr;
            other._connection = nullptr;
            other._invalidated = false;
        }
        return *this;
    }

    void ConnectionLease::invalidate() {
        _invalidated = true;
    }

    void ConnectionLease::release() {
        if (_pool && _connection) {
            _pool->release(_connection, !_invalidated);
        }
        _pool = nullptr;
        _connection = nullptr;
        _invalidated = false;
    }

    ConnectionPool::ConnectionPool(ConnectionFactory factory, Config config)
        : _factory(std::move(factory))
        , _config(config) {
        if (!_factory) {
            throw std::invalid_argument("ConnectionPool requires a connection factory");
        }
        if (_config.maxSize == 0) {
            _config.maxSize = 1;
        }
        _config.minIdle = std::min(_config.minIdle, _config.maxSize);
    }

    ConnectionPool::~ConnectionPool() {
        stop();
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto& [id, connection] : _connections) {
            connection->handle->close();
        }
    }

    void ConnectionPool::start() {
        if (_sweeper.joinable()) {
            return;
        }
        warmUp();
        _sweeper = std::jthread([this](const std::stop_token& token) {
            sweepLoop(token);
        });
    }

    void ConnectionPool::stop() {
        if (_sweeper.joinable()) {
            _sweeper.request_stop();
            _released.notify_all();
            _sweeper.join();
        }
    }

    void ConnectionPool::sweepLoop(const std::stop_token& token) {
        while (!token.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _released.wait_for(lock, token, _config.sweepInterval, [] { return false; });
            }
            if (token.stop_requested()) {
                break;
            }
            sweepIdle();
            if (!isDraining()) {
                warmUp();
            }
        }
    }

    void ConnectionPool::warmUp() {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(_mutex);
                size_t open = _connections.size() + _creating;
                if (_draining || _idle.size() + _creating >= _config.minIdle || open >= _config.maxSize) {
                    return;
                }
                ++_creating;
            }

            std::unique_ptr<IBackendConnection> handle;
            try {
                handle = _factory();
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(_mutex);
                --_creating;
                SWARM_LOG_WARNING_CAT("ConnectionPool", "Warm-up connection failed: {}", e.what());
                return;
            }

            std::lock_guard<std::mutex> lock(_mutex);
            --_creating;
            auto connection = std::make_unique<PooledConnection>();
            connection->id = _nextId++;
            connection->handle = std::move(handle);
            _idle.push_back(connection.get());
            _connections.emplace(connection->id, std::move(connection));
            ++_created;
            _released.notify_one();
        }
    }

    ConnectionLease ConnectionPool::acquire() {
        return acquire(_config.acquireTimeout);
    }

    ConnectionLease ConnectionPool::acquire(std::chrono::milliseconds timeout) {
        SWARM_PROFILE_ZONE_NC("ConnectionPool::acquire", Debug::ProfileColors::Backend);
        // Timeouts too long to add to now() wait without a deadline
        const auto now = Clock::now();
        const bool bounded = timeout < std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now);
        const auto deadline = bounded ? now + timeout : TimePoint::max();

        std::unique_lock<std::mutex> lock(_mutex);
        while (true) {
            if (_draining) {
                throw PoolExhaustedError("pool is draining");
            }

            while (!_idle.empty()) {
                PooledConnection* connection = _idle.front();
                _idle.pop_front();
                if (!connection->healthy || !connection->handle->isHealthy()) {
                    ++_discarded;
                    closeLocked(connection->id);
                    continue;
                }
                connection->inUse = true;
                connection->lastUsed = Clock::now();
                ++_inUse;
                ++_acquisitions;
                return ConnectionLease(this, connection);
            }

            if (_connections.size() + _creating < _config.maxSize) {
                ++_creating;
                lock.unlock();

                std::unique_ptr<IBackendConnection> handle;
                try {
                    handle = _factory();
                } catch (...) {
                    lock.lock();
                    --_creating;
                    _released.notify_one();
                    throw;
                }

                lock.lock();
                --_creating;
                auto connection = std::make_unique<PooledConnection>();
                connection->id = _nextId++;
                connection->handle = std::move(handle);
                connection->inUse = true;
                PooledConnection* raw = connection.get();
                _connections.emplace(raw->id, std::move(connection));
                ++_created;
                ++_inUse;
                ++_acquisitions;
                SWARM_LOG_TRACE_CAT("ConnectionPool", "Opened connection {} ({} open)", raw->id, _connections.size());
                return ConnectionLease(this, raw);
            }

            auto available = [this] {
                return _draining.load() || !_idle.empty() || _connections.size() + _creating < _config.maxSize;
            };
            ++_waiters;
            bool woke = true;
            if (bounded) {
                woke = _released.wait_until(lock, deadline, available);
            } else {
                _released.wait(lock, available);
            }
            --_waiters;
            if (!woke) {
                ++_timeouts;
                SWARM_LOG_DEBUG_CAT("ConnectionPool", "Acquire timed out after {}ms", timeout.count());
                throw PoolExhaustedError("timed out after " + std::to_string(timeout.count()) + "ms");
            }
        }
    }

    void ConnectionPool::release(PooledConnection* connection, bool healthy) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            connection->inUse = false;
            connection->lastUsed = Clock::now();
            --_inUse;

            if (!healthy || !connection->handle->isHealthy()) {
                connection->healthy = false;
                ++_discarded;
                SWARM_LOG_DEBUG_CAT("ConnectionPool", "Discarding unhealthy connection {}", connection->id);
                closeLocked(connection->id);
            } else if (_draining) {
                closeLocked(connection->id);
            } else {
                _idle.push_front(connection);
            }
        }
        _released.notify_all();
    }

    void ConnectionPool::closeLocked(uint64_t id) {
        auto it = _connections.find(id);
        if (it == _connections.end()) {
            return;
        }
        _idle.erase(std::remove(_idle.begin(), _idle.end(), it->second.get()), _idle.end());
        it->second->handle->close();
        _connections.erase(it);
    }

    bool ConnectionPool::drain(std::chrono::milliseconds timeout) {
        SWARM_PROFILE_ZONE_NC("ConnectionPool::drain", Debug::ProfileColors::Backend);
        _draining.store(true, std::memory_order_release);

        std::unique_lock<std::mutex> lock(_mutex);
        _released.notify_all();
        SWARM_LOG_INFO_CAT("ConnectionPool", "Draining pool, {} connection(s) outstanding", _inUse);

        auto done = [this] { return _inUse == 0 && _creating == 0; };
        bool drained = true;
        if (timeout == std::chrono::milliseconds::max()) {
            _released.wait(lock, done);
        } else {
            drained = _released.wait_for(lock, timeout, done);
        }

        if (drained) {
            std::vector<uint64_t> ids;
            for (const auto& [id, connection] : _connections) {
                ids.push_back(id);
            }
            for (auto id : ids) {
                closeLocked(id);
            }
        }
        return drained;
    }

    size_t ConnectionPool::sweepIdle() {
        SWARM_PROFILE_ZONE_NC("ConnectionPool::sweepIdle", Debug::ProfileColors::Backend);
        std::lock_guard<std::mutex> lock(_mutex);
        auto now = Clock::now();

        // Oldest idle connections sit at the back
        size_t evicted = 0;
        while (_idle.size() > _config.minIdle) {
            PooledConnection* oldest = _idle.back();
            if (now - oldest->lastUsed < _config.idleTimeout) {
                break;
            }
            closeLocked(oldest->id);
            ++evicted;
        }

        _evicted += evicted;
        if (evicted > 0) {
            SWARM_LOG_DEBUG_CAT("ConnectionPool", "Evicted {} idle connection(s)", evicted);
            _released.notify_all();
        }
        return evicted;
    }

    ConnectionPool::Stats ConnectionPool::getStats() const {
        std::lock_guard<std::mutex> lock(_mutex);
        Stats stats;
        stats.size = _connections.size() + _creating;
        stats.inUse = _inUse;
        stats.idle = _idle.size();
        stats.waiters = _waiters;
        stats.created = _created;
        stats.evicted = _evicted;
        stats.discarded = _discarded;
        stats.acquisitions = _acquisitions;
        stats.timeouts = _timeouts;
        stats.maxSize = _config.maxSize;
        return stats;
    }

} // namespace Coordination
} // namespace Core
} // namespace SwarmEngine
