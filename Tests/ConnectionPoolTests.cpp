/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#include <catch2/catch_test_macros.hpp>
#include <Coordination/ConnectionPool.h>
#include "TestHelpers.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace SwarmEngine::Core::Coordination;
using namespace std::chrono_literals;
using SwarmTest::BackendScript;

namespace {
    ConnectionPool::Config smallPool(size_t maxSize) {
        ConnectionPool::Config config;
        config.maxSize = maxSize;
        config.acquireTimeout = 100ms;
        return config;
    }
}

TEST_CASE("ConnectionPool leases", "[coordination][pool]") {
    auto script = std::make_shared<BackendScript>();
    ConnectionPool pool(SwarmTest::flakyFactory(script), smallPool(2));

    SECTION("Connections are created lazily and reused") {
        uint64_t firstId = 0;
        {
            auto lease = pool.acquire();
            REQUIRE(lease);
            firstId = lease.id();
            CHECK(lease->invoke("echo", "hi") == "echo:hi");
            CHECK(pool.getStats().inUse == 1);
        }
        CHECK(pool.getStats().idle == 1);

        auto again = pool.acquire();
        CHECK(again.id() == firstId);
        CHECK(script->connectionsCreated.load() == 1);
    }

    SECTION("The pool never exceeds its maximum size") {
        auto a = pool.acquire();
        auto b = pool.acquire();
        CHECK(pool.getStats().size == 2);

        CHECK_THROWS_AS(pool.acquire(20ms), PoolExhaustedError);
        CHECK(pool.getStats().timeouts == 1);
    }

    SECTION("A waiter gets the next released connection") {
        auto a = pool.acquire();
        auto b = pool.acquire();
        uint64_t releasedId = b.id();

        std::thread releaser([&b] {
            std::this_thread::sleep_for(20ms);
            b.release();
        });
        auto c = pool.acquire(1000ms);
        releaser.join();

        CHECK(c.id() == releasedId);
        CHECK(script->connectionsCreated.load() == 2);
    }

    SECTION("An unbounded wait still wakes on release") {
        auto a = pool.acquire();
        auto b = pool.acquire();
        uint64_t releasedId = a.id();

        std::thread releaser([&a] {
            std::this_thread::sleep_for(20ms);
            a.release();
        });
        auto c = pool.acquire(std::chrono::milliseconds::max());
        releaser.join();

        CHECK(c.id() == releasedId);
        CHECK(pool.getStats().timeouts == 0);
    }

    SECTION("Invalidated connections are discarded") {
        {
            auto lease = pool.acquire();
            lease.invalidate();
        }
        auto stats = pool.getStats();
        CHECK(stats.discarded == 1);
        CHECK(stats.size == 0);
        CHECK(script->connectionsClosed.load() == 1);
    }

    SECTION("Connections that report themselves unhealthy are not reused") {
        script->unhealthyAfterFailure = true;
        script->failNext = 1;
        {
            auto lease = pool.acquire();
            CHECK_THROWS_AS(lease->invoke("echo", "x"), BackendError);
        }
        CHECK(pool.getStats().idle == 0);

        auto fresh = pool.acquire();
        CHECK(fresh->isHealthy());
        CHECK(script->connectionsCreated.load() == 2);
    }

    SECTION("Moved leases release exactly once") {
        auto lease = pool.acquire();
        ConnectionLease moved = std::move(lease);
        CHECK_FALSE(lease);
        CHECK(moved);
        moved.release();
        moved.release();
        CHECK(pool.getStats().inUse == 0);
    }
}

TEST_CASE("ConnectionPool idle eviction", "[coordination][pool]") {
    auto script = std::make_shared<BackendScript>();
    auto config = smallPool(4);
    config.idleTimeout = 10ms;
    ConnectionPool pool(SwarmTest::flakyFactory(script), config);

    {
        auto a = pool.acquire();
        auto b = pool.acquire();
    }
    REQUIRE(pool.getStats().idle == 2);

    std::this_thread::sleep_for(20ms);
    CHECK(pool.sweepIdle() == 2);
    CHECK(pool.getStats().evicted == 2);
    CHECK(pool.getStats().size == 0);
}

TEST_CASE("ConnectionPool warm-up keeps minIdle connections", "[coordination][pool]") {
    auto script = std::make_shared<BackendScript>();
    auto config = smallPool(4);
    config.minIdle = 2;
    config.sweepInterval = 10ms;
    ConnectionPool pool(SwarmTest::flakyFactory(script), config);

    pool.start();
    CHECK(pool.getStats().idle == 2);
    pool.stop();
}

TEST_CASE("ConnectionPool drain", "[coordination][pool]") {
    auto script = std::make_shared<BackendScript>();
    ConnectionPool pool(SwarmTest::flakyFactory(script), smallPool(2));

    SECTION("Drain waits for outstanding leases then closes everything") {
        auto lease = pool.acquire();
        {
            auto idle = pool.acquire();
        }

        std::thread holder([lease = std::move(lease)]() mutable {
            std::this_thread::sleep_for(20ms);
            lease.release();
        });
        CHECK(pool.drain(1000ms));
        holder.join();

        CHECK(pool.isDraining());
        CHECK(pool.getStats().size == 0);
        CHECK_THROWS_AS(pool.acquire(), PoolExhaustedError);
    }

    SECTION("Drain reports a timeout when leases are held") {
        auto lease = pool.acquire();
        CHECK_FALSE(pool.drain(10ms));
        lease.release();
        CHECK(pool.getStats().inUse == 0);
    }
}

TEST_CASE("ConnectionPool under concurrent load", "[coordination][pool][concurrency]") {
    auto script = std::make_shared<BackendScript>();
    auto config = smallPool(3);
    config.acquireTimeout = 2000ms;
    ConnectionPool pool(SwarmTest::flakyFactory(script), config);

    std::atomic<int> concurrent{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 20; ++j) {
                auto lease = pool.acquire();
                int now = ++concurrent;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                lease->invoke("work", "x");
                --concurrent;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(peak.load() <= 3);
    CHECK(script->connectionsCreated.load() <= 3);
    CHECK(pool.getStats().acquisitions == 160);
}

TEST_CASE("A second acquire on a single-connection pool waits for the first release", "[coordination][pool]") {
    auto script = std::make_shared<BackendScript>();
    auto config = smallPool(1);
    config.acquireTimeout = 2000ms;
    ConnectionPool pool(SwarmTest::flakyFactory(script), config);

    auto first = pool.acquire();
    std::atomic<bool> acquired{false};
    std::thread second([&] {
        auto lease = pool.acquire();
        acquired = true;
    });

    std::this_thread::sleep_for(30ms);
    CHECK_FALSE(acquired.load());
    CHECK(pool.getStats().waiters == 1);

    first.release();
    second.join();
    CHECK(acquired.load());
    CHECK(script->connectionsCreated.load() == 1);
}
