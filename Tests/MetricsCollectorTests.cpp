/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <Coordination/CoordinationMetricsCollector.h>
#include "TestHelpers.h"
#include <chrono>
#include <stdexcept>
#include <string>

using namespace SwarmEngine::Core::Coordination;
using namespace std::chrono_literals;
using SwarmTest::makeAgent;
using SwarmTest::makeTask;

namespace {
    struct MetricsFixture {
        CoordinationState state;
        DependencyGraph graph;
        ResourceManager resources;
        MessageRouter router;
        ConflictResolver resolver;
        CircuitBreakerManager breakers{CircuitBreaker::Config{2, 60000ms}};
        TaskScheduler scheduler{state, graph, resources, &router};
        WorkStealingCoordinator stealer{state, &router};

        CoordinationMetricsCollector::Sources sources() {
            CoordinationMetricsCollector::Sources s;
            s.state = &state;
            s.scheduler = &scheduler;
            s.stealer = &stealer;
            s.breakers = &breakers;
            s.resources = &resources;
            s.resolver = &resolver;
            s.router = &router;
            return s;
        }

        void submit(const TaskId& id) {
            graph.addTask(id, {});
            auto task = makeTask(id);
            task.status = TaskStatus::Ready;
            state.tasks.insert(id, task);
            scheduler.enqueue(id);
        }
    };
}

TEST_CASE("Metrics samples reflect component state", "[coordination][metrics]") {
    MetricsFixture fx;
    fx.resources.registerResource("gpu", 2.0);
    CoordinationMetricsCollector collector(fx.sources());

    fx.state.agents.insert("b", makeAgent("b"));
    fx.state.agents.insert("a", makeAgent("a"));
    fx.submit("t1");
    fx.submit("t2");
    fx.submit("t3");
    REQUIRE(fx.scheduler.assign("t1").assigned());

    for (int i = 0; i < 2; ++i) {
        CHECK_THROWS(fx.breakers.execute("search", []() -> int { throw std::runtime_error("down"); }));
    }

    auto sample = collector.sample();
    CHECK(sample.queueDepth == 2);

    REQUIRE(sample.agents.size() == 2);
    CHECK(sample.agents[0].agentId == "a");
    CHECK(sample.agents[0].load() + sample.agents[1].load() == 1);

    REQUIRE(sample.endpoints.size() == 1);
    CHECK(sample.endpoints[0].endpoint == "search");
    CHECK(sample.endpoints[0].state == CircuitState::Open);
    CHECK(sample.endpoints[0].failureRate == Catch::Approx(1.0));

    REQUIRE(sample.resources.size() == 1);
    CHECK(sample.resources[0].name == "gpu");
    CHECK_FALSE(sample.pool.has_value());

    CHECK(sample.assignments == 1);
    CHECK(sample.conflicts == 0);
    CHECK(sample.conflictRate == Catch::Approx(0.0));
}

TEST_CASE("Metrics rates are computed per interval", "[coordination][metrics]") {
    MetricsFixture fx;
    CoordinationMetricsCollector collector(fx.sources());
    fx.state.agents.insert("a", makeAgent("a"));

    fx.submit("t1");
    fx.submit("t2");
    fx.scheduler.schedule();
    auto first = collector.sample();
    CHECK(first.assignments == 2);

    fx.submit("t3");
    fx.scheduler.schedule();
    fx.resolver.arbitrate("t9", {{ConflictClaim{"x", 1, Clock::now(), 0}, nullptr, nullptr},
                                 {ConflictClaim{"y", 0, Clock::now(), 0}, nullptr, nullptr}});
    auto second = collector.sample();
    CHECK(second.assignments == 1);
    CHECK(second.conflicts == 1);
    CHECK(second.conflictRate == Catch::Approx(1.0));

    auto idle = collector.sample();
    CHECK(idle.assignments == 0);
    CHECK(idle.conflictRate == Catch::Approx(0.0));
}

TEST_CASE("Metrics count task outcomes from the event stream", "[coordination][metrics]") {
    MetricsFixture fx;
    CoordinationMetricsCollector collector(fx.sources());

    TaskCompletedEvent completed;
    completed.taskId = "a";
    fx.router.publish(completed);

    TaskFailedEvent retrying;
    retrying.taskId = "b";
    retrying.willRetry = true;
    fx.router.publish(retrying);

    TaskFailedEvent failed;
    failed.taskId = "b";
    fx.router.publish(failed);

    TaskRetriedEvent retried;
    retried.taskId = "b";
    fx.router.publish(retried);

    TaskCancelledEvent cancelled;
    cancelled.taskId = "c";
    fx.router.publish(cancelled);

    REQUIRE(fx.router.flush(2s));
    auto sample = collector.sample();
    CHECK(sample.tasksCompleted == 1);
    CHECK(sample.tasksFailed == 1);
    CHECK(sample.tasksRetried == 1);
    CHECK(sample.tasksCancelled == 1);
}

TEST_CASE("Metrics history is bounded", "[coordination][metrics]") {
    MetricsFixture fx;
    CoordinationMetricsCollector::Config config;
    config.historyCapacity = 3;
    CoordinationMetricsCollector collector(fx.sources(), config);

    CHECK_FALSE(collector.latest().has_value());
    for (int i = 0; i < 5; ++i) {
        fx.submit("t" + std::to_string(i));
        collector.sample();
    }

    auto history = collector.history();
    REQUIRE(history.size() == 3);
    CHECK(history.front().queueDepth == 3);
    CHECK(history.back().queueDepth == 5);
    CHECK(collector.evictedCount() == 2);
    REQUIRE(collector.latest().has_value());
    CHECK(collector.latest()->queueDepth == 5);
}

TEST_CASE("Metrics background sampling", "[coordination][metrics]") {
    MetricsFixture fx;
    CoordinationMetricsCollector::Config config;
    config.interval = 10ms;
    CoordinationMetricsCollector collector(fx.sources(), config);

    collector.start();
    CHECK(collector.isRunning());
    CHECK(SwarmTest::waitFor([&collector] { return collector.history().size() >= 2; }));

    fx.submit("late");
    collector.stop();
    CHECK_FALSE(collector.isRunning());
    REQUIRE(collector.latest().has_value());
    CHECK(collector.latest()->queueDepth == 1);
}
