/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#include <catch2/catch_test_macros.hpp>
#include <Coordination/CoordinationManager.h>
#include <Memory/InMemoryStore.h>
#include "TestHelpers.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace SwarmEngine::Core;
using namespace SwarmEngine::Core::Coordination;
using namespace std::chrono_literals;
using SwarmTest::makeTask;

namespace {
    // Deterministic engine: no background balancing or sampling, immediate retries
    CoordinationConfig testConfig() {
        CoordinationConfig config;
        config.enableWorkStealing = false;
        config.enableMetrics = false;
        config.retryBackoffBase = 0ms;
        config.backendRetry.baseDelay = 1ms;
        config.backendRetry.maxDelay = 5ms;
        return config;
    }

    struct EventLog {
        std::mutex mutex;
        std::vector<EventEnvelope> events;

        MessageRouter::Handler handler() {
            return [this](const EventEnvelope& envelope) {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back(envelope);
            };
        }

        size_t count(CoordinationEventType type) {
            std::lock_guard<std::mutex> lock(mutex);
            size_t n = 0;
            for (const auto& e : events) {
                if (e.type() == type) {
                    ++n;
                }
            }
            return n;
        }
    };

    TaskStatus statusOf(const CoordinationManager& manager, const TaskId& id) {
        auto snapshot = manager.getStatus(id);
        REQUIRE(snapshot.has_value());
        return snapshot->value.status;
    }

    // Schedule and start the task on the agent it lands on
    AgentId runTask(CoordinationManager& manager, const TaskId& id) {
        manager.scheduleReadyTasks();
        auto snapshot = manager.getStatus(id);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->value.status == TaskStatus::Assigned);
        AgentId agent = *snapshot->value.assignedAgent;
        manager.startTask(agent, id);
        return agent;
    }
}

TEST_CASE("CoordinationManager lifecycle", "[manager][coordination]") {
    CoordinationManager manager(testConfig());

    CHECK_FALSE(manager.isRunning());
    CHECK_THROWS_AS(manager.submit(makeTask("early")), std::logic_error);
    CHECK_THROWS_AS(manager.graph(), std::logic_error);

    manager.initialize();
    CHECK(manager.isRunning());
    CHECK_NOTHROW(manager.initialize());
    CHECK(manager.scheduler().strategyName() == std::string("capability"));
    CHECK(manager.connectionPool() == nullptr);

    manager.shutdown();
    CHECK_FALSE(manager.isRunning());
    CHECK_THROWS_AS(manager.submit(makeTask("late")), std::logic_error);
    CHECK_THROWS_AS(manager.initialize(), std::logic_error);
    CHECK_NOTHROW(manager.shutdown());

    // Components stay readable and shutdown took a final sample
    CHECK(manager.graph().size() == 0);
    CHECK(manager.metrics().history().size() == 1);
}

TEST_CASE("CoordinationManager submission", "[manager][coordination]") {
    CoordinationManager manager(testConfig());
    manager.initialize();

    CHECK(manager.submit(makeTask("a")) == TaskStatus::Ready);
    CHECK(manager.submit(makeTask("b", {"a"})) == TaskStatus::Pending);
    CHECK(manager.scheduler().isQueued("a"));
    CHECK_FALSE(manager.scheduler().isQueued("b"));

    SECTION("Invalid submissions are rejected") {
        CHECK_THROWS_AS(manager.submit(makeTask("a")), DuplicateTaskError);
        CHECK_THROWS_AS(manager.submit(makeTask("")), std::invalid_argument);
    }

    SECTION("Dependencies may name tasks submitted later, but not close a cycle") {
        CHECK(manager.submit(makeTask("x", {"y"})) == TaskStatus::Pending);
        CHECK_THROWS_AS(manager.submit(makeTask("y", {"x"})), CycleError);
        CHECK_FALSE(manager.getStatus("y").has_value());
    }

    SECTION("Submitted fields owned by the engine are reset") {
        auto task = makeTask("c");
        task.status = TaskStatus::Completed;
        task.assignedAgent = "somebody";
        task.stealCount = 4;
        CHECK(manager.submit(task) == TaskStatus::Ready);
        auto stored = manager.getStatus("c")->value;
        CHECK_FALSE(stored.assignedAgent.has_value());
        CHECK(stored.stealCount == 0);
    }

    SECTION("A task whose dependency was cancelled starts cancelled") {
        manager.cancel("a");
        CHECK(manager.submit(makeTask("after", {"a"})) == TaskStatus::Cancelled);
    }
}

TEST_CASE("Completing a task releases its dependents", "[manager][coordination]") {
    CoordinationManager manager(testConfig());
    manager.initialize();
    manager.registerAgent("worker", {"build"});

    manager.submit(makeTask("A"));
    manager.submit(makeTask("B", {"A"}));
    manager.submit(makeTask("C", {"A"}));

    auto agent = runTask(manager, "A");
    CHECK(agent == "worker");
    CHECK(statusOf(manager, "A") == TaskStatus::Running);
    manager.completeTask("worker", "A");

    CHECK(manager.graph().getReadyTasks() == std::vector<TaskId>{"B", "C"});
    CHECK(statusOf(manager, "A") == TaskStatus::Completed);
    CHECK(statusOf(manager, "B") == TaskStatus::Ready);
    CHECK(statusOf(manager, "C") == TaskStatus::Ready);
    CHECK(manager.scheduler().isQueued("B"));
    CHECK(manager.scheduler().isQueued("C"));

    auto worker = manager.getAgent("worker")->value;
    CHECK(worker.completedCount == 1);
    CHECK(worker.load() == 0);
    CHECK(worker.status == AgentStatus::Idle);

    SECTION("Only the holder may report on a task") {
        manager.registerAgent("other", {});
        runTask(manager, "B");
        auto holder = *manager.getStatus("B")->value.assignedAgent;
        AgentId stranger = holder == "worker" ? "other" : "worker";
        CHECK_THROWS_AS(manager.completeTask(stranger, "B"), std::logic_error);
        CHECK_THROWS_AS(manager.startTask(holder, "B"), std::logic_error);
    }
}

TEST_CASE("Failed tasks are retried with backoff", "[manager][coordination]") {
    auto config = testConfig();
    config.retryBackoffBase = 30ms;
    EventLog log;
    CoordinationManager manager(config);
    manager.initialize();
    manager.subscribe("log", log.handler());
    manager.registerAgent("worker", {});

    manager.submit(makeTask("t"));
    runTask(manager, "t");
    CHECK(manager.failTask("worker", "t", "boom"));

    auto task = manager.getStatus("t")->value;
    CHECK(task.status == TaskStatus::Ready);
    CHECK(task.retryCount == 1);
    CHECK(task.failureReason == "boom");
    CHECK_FALSE(task.assignedAgent.has_value());
    CHECK(manager.getAgent("worker")->value.failedCount == 1);

    // The backoff has not elapsed yet
    manager.scheduleReadyTasks();
    CHECK_FALSE(manager.scheduler().isQueued("t"));
    CHECK(statusOf(manager, "t") == TaskStatus::Ready);

    std::this_thread::sleep_for(40ms);
    CHECK(manager.processRetries() == 1);
    CHECK(manager.scheduler().isQueued("t"));
    manager.scheduleReadyTasks();
    CHECK(statusOf(manager, "t") == TaskStatus::Assigned);

    REQUIRE(manager.flushEvents(2s));
    CHECK(log.count(CoordinationEventType::Failed) == 1);
    CHECK(log.count(CoordinationEventType::Retried) == 1);
}

TEST_CASE("Exhausted retries fail the task and cancel its dependents", "[manager][coordination]") {
    EventLog log;
    CoordinationManager manager(testConfig());
    manager.initialize();
    manager.subscribe("log", log.handler());
    manager.registerAgent("worker", {});

    auto task = makeTask("t");
    task.maxRetries = 1;
    manager.submit(task);
    manager.submit(makeTask("child", {"t"}));
    manager.submit(makeTask("grandchild", {"child"}));

    runTask(manager, "t");
    SwarmTest::CapturingSink logs(Logging::LogLevel::Warning);
    CHECK(manager.failTask("worker", "t", "first"));
    CHECK(logs.contains("retry 1/1"));

    runTask(manager, "t");
    CHECK_FALSE(manager.failTask("worker", "t", "second"));

    CHECK(statusOf(manager, "t") == TaskStatus::Failed);
    CHECK(manager.getStatus("t")->value.failureReason == "second");
    CHECK(statusOf(manager, "child") == TaskStatus::Cancelled);
    CHECK(statusOf(manager, "grandchild") == TaskStatus::Cancelled);
    CHECK(manager.getStatus("child")->value.failureReason.find("failed") != std::string::npos);

    bool taggedError = false;
    for (const auto& entry : logs.entries()) {
        if (entry.level == Logging::LogLevel::Error && entry.taskId == "t" && entry.agentId == "worker") {
            taggedError = true;
        }
    }
    CHECK(taggedError);

    REQUIRE(manager.flushEvents(2s));
    CHECK(log.count(CoordinationEventType::Failed) == 2);
    CHECK(log.count(CoordinationEventType::Cancelled) == 2);
}

TEST_CASE("Cancellation", "[manager][coordination]") {
    CoordinationManager manager(testConfig());
    manager.initialize();
    manager.registerAgent("worker", {});

    SECTION("Cancelling cascades downstream") {
        manager.submit(makeTask("a"));
        manager.submit(makeTask("b", {"a"}));
        manager.submit(makeTask("c", {"b"}));
        manager.submit(makeTask("other"));

        auto cancelled = manager.cancel("a");
        REQUIRE(cancelled.size() == 3);
        CHECK(cancelled.front() == "a");
        for (const auto& id : {"a", "b", "c"}) {
            CHECK(statusOf(manager, id) == TaskStatus::Cancelled);
        }
        CHECK(statusOf(manager, "other") == TaskStatus::Ready);
        CHECK_FALSE(manager.scheduler().isQueued("a"));
        CHECK(manager.cancel("a").empty());
    }

    SECTION("Cancelling an assigned task frees the agent") {
        manager.submit(makeTask("a"));
        manager.scheduleReadyTasks();
        REQUIRE(manager.getAgent("worker")->value.load() == 1);

        CHECK(manager.cancel("a") == std::vector<TaskId>{"a"});
        CHECK(manager.getAgent("worker")->value.load() == 0);
        CHECK_FALSE(manager.getStatus("a")->value.assignedAgent.has_value());
    }

    SECTION("A running task is only flagged and its failure is final") {
        manager.submit(makeTask("a"));
        runTask(manager, "a");

        CHECK(manager.cancel("a").empty());
        auto task = manager.getStatus("a")->value;
        CHECK(task.status == TaskStatus::Running);
        CHECK(task.cancelRequested);

        CHECK_FALSE(manager.failTask("worker", "a", "stopped"));
        task = manager.getStatus("a")->value;
        CHECK(task.status == TaskStatus::Failed);
        CHECK(task.failureReason == "cancelled while running: stopped");
    }

    SECTION("Unknown tasks are reported") {
        CHECK_THROWS_AS(manager.cancel("ghost"), UnknownEntityError);
    }
}

TEST_CASE("Running tasks past their deadline fail", "[manager][coordination]") {
    CoordinationManager manager(testConfig());
    manager.initialize();
    manager.registerAgent("worker", {});

    auto slow = makeTask("slow");
    slow.timeout = 10ms;
    slow.maxRetries = 0;
    manager.submit(slow);
    manager.submit(makeTask("fast"));

    runTask(manager, "slow");
    runTask(manager, "fast");
    CHECK(manager.checkDeadlines().empty());

    std::this_thread::sleep_for(30ms);
    CHECK(manager.checkDeadlines() == std::vector<TaskId>{"slow"});
    auto task = manager.getStatus("slow")->value;
    CHECK(task.status == TaskStatus::Failed);
    CHECK(task.failureReason == TaskTimeoutError("slow").what());
    CHECK(statusOf(manager, "fast") == TaskStatus::Running);
    CHECK(manager.getAgent("worker")->value.load() == 1);
}

TEST_CASE("Executing tasks against a backend", "[manager][coordination][backend]") {
    auto script = std::make_shared<SwarmTest::BackendScript>();
    auto config = testConfig();
    config.circuitBreaker.failureThreshold = 2;
    config.circuitBreaker.coolDown = 60000ms;
    config.backendRetry.maxAttempts = 3;
    config.pool.maxSize = 2;
    config.pool.acquireTimeout = 10ms;
    CoordinationManager manager(config, SwarmTest::flakyFactory(script));
    manager.initialize();
    manager.registerAgent("worker", {});
    REQUIRE(manager.connectionPool() != nullptr);

    manager.submit(makeTask("t"));
    manager.scheduleReadyTasks();

    SECTION("A successful call completes the task") {
        auto result = manager.executeTask("worker", "t", "llm", "hello");
        CHECK(result.succeeded);
        CHECK(result.output == "llm:hello");
        CHECK(result.attempts == 1);
        CHECK(statusOf(manager, "t") == TaskStatus::Completed);
        CHECK(manager.connectionPool()->getStats().inUse == 0);
    }

    SECTION("Transient backend failures are retried within the call") {
        script->failNext = 1;
        auto result = manager.executeTask("worker", "t", "llm", "hello");
        CHECK(result.succeeded);
        CHECK(result.attempts == 2);
        CHECK(script->calls.load() == 2);
        CHECK(statusOf(manager, "t") == TaskStatus::Completed);
    }

    SECTION("An open circuit stops the attempts and fails the task") {
        script->alwaysFail = true;
        auto result = manager.executeTask("worker", "t", "llm", "hello");
        CHECK_FALSE(result.succeeded);
        CHECK(result.attempts == 3);
        CHECK(script->calls.load() == 2);
        CHECK(result.willRetry);
        REQUIRE(result.error);
        CHECK_THROWS_AS(std::rethrow_exception(result.error), CircuitOpenError);

        auto task = manager.getStatus("t")->value;
        CHECK(task.status == TaskStatus::Ready);
        CHECK(task.failureReason.find("circuit open") != std::string::npos);
        CHECK(manager.circuitBreakers().getBreaker("llm").getState() == CircuitState::Open);
    }

    SECTION("An exhausted pool defers the task instead of failing it") {
        auto first = manager.connectionPool()->acquire();
        auto second = manager.connectionPool()->acquire();

        auto result = manager.executeTask("worker", "t", "llm", "hello");
        CHECK_FALSE(result.succeeded);
        CHECK(result.deferred);
        CHECK_FALSE(result.willRetry);
        CHECK(result.attempts == 0);
        CHECK(script->calls.load() == 0);
        REQUIRE(result.error);
        CHECK_THROWS_AS(std::rethrow_exception(result.error), PoolExhaustedError);

        auto task = manager.getStatus("t")->value;
        CHECK(task.status == TaskStatus::Running);
        CHECK(task.retryCount == 0);
        CHECK(task.assignedAgent == AgentId("worker"));

        first.release();
        second.release();
        auto resumed = manager.executeTask("worker", "t", "llm", "again");
        CHECK(resumed.succeeded);
        CHECK(resumed.attempts == 1);
        CHECK(statusOf(manager, "t") == TaskStatus::Completed);
    }

    SECTION("Only the holder may execute") {
        manager.registerAgent("stranger", {});
        CHECK_THROWS_AS(manager.executeTask("stranger", "t", "llm", "hello"), std::logic_error);
    }
}

TEST_CASE("Executing without a backend is an error", "[manager][coordination][backend]") {
    CoordinationManager manager(testConfig());
    manager.initialize();
    manager.registerAgent("worker", {});
    manager.submit(makeTask("t"));
    manager.scheduleReadyTasks();
    CHECK_THROWS_AS(manager.executeTask("worker", "t", "llm", "hello"), std::logic_error);
}

TEST_CASE("Claiming tasks", "[manager][coordination][conflict]") {
    SECTION("The priority strategy picks the highest priority claim") {
        CoordinationManager manager(testConfig());
        manager.initialize();
        manager.registerAgent("a", {"gpu"});
        manager.registerAgent("b", {"gpu"});
        manager.submit(makeTask("t", {}, {"gpu"}));

        auto low = manager.claimTask("a", "t", 1);
        auto high = manager.claimTask("b", "t", 5);
        CHECK(manager.claimOutcome(low) == ClaimOutcome::Pending);

        manager.scheduleReadyTasks();
        CHECK(manager.claimOutcome(low) == ClaimOutcome::Rejected);
        CHECK(manager.claimOutcome(high) == ClaimOutcome::Won);
        auto task = manager.getStatus("t")->value;
        CHECK(task.status == TaskStatus::Assigned);
        CHECK(task.assignedAgent == AgentId("b"));
    }

    SECTION("The voting strategy follows the claimants' votes") {
        auto config = testConfig();
        config.conflictStrategy = ConflictStrategyKind::Voting;
        CoordinationManager manager(config);
        manager.initialize();
        manager.registerAgent("a", {});
        manager.registerAgent("b", {});
        manager.submit(makeTask("t"));

        auto first = manager.claimTask("a", "t", 5);
        auto second = manager.claimTask("b", "t", 1);
        manager.voteOnClaim("t", "a", "b");
        manager.voteOnClaim("t", "b", "b");

        manager.scheduleReadyTasks();
        CHECK(manager.claimOutcome(first) == ClaimOutcome::Rejected);
        CHECK(manager.claimOutcome(second) == ClaimOutcome::Won);
        CHECK(manager.getStatus("t")->value.assignedAgent == AgentId("b"));
    }

    SECTION("An incapable winner is not assigned") {
        CoordinationManager manager(testConfig());
        manager.initialize();
        manager.registerAgent("cpu", {"build"});
        manager.submit(makeTask("t", {}, {"gpu"}));

        auto ticket = manager.claimTask("cpu", "t");
        manager.scheduleReadyTasks();
        CHECK(manager.claimOutcome(ticket) == ClaimOutcome::Failed);
        CHECK(statusOf(manager, "t") == TaskStatus::Ready);
    }

    SECTION("Claims name known tasks and agents") {
        CoordinationManager manager(testConfig());
        manager.initialize();
        manager.registerAgent("a", {});
        manager.submit(makeTask("t"));
        CHECK_THROWS_AS(manager.claimTask("ghost", "t"), UnknownEntityError);
        CHECK_THROWS_AS(manager.claimTask("a", "ghost"), UnknownEntityError);
    }
}

TEST_CASE("Agents leaving and returning", "[manager][coordination]") {
    CoordinationManager manager(testConfig());
    manager.initialize();
    manager.registerAgent("a", {});
    manager.submit(makeTask("running"));
    manager.submit(makeTask("queued"));
    manager.scheduleReadyTasks();
    manager.startTask("a", "running");

    CHECK(manager.unregisterAgent("a") == 1);
    auto agent = manager.getAgent("a")->value;
    CHECK(agent.status == AgentStatus::Draining);
    CHECK(agent.queuedTasks.empty());
    CHECK(statusOf(manager, "queued") == TaskStatus::Ready);
    CHECK(manager.scheduler().isQueued("queued"));

    // Draining agents receive nothing new
    manager.scheduleReadyTasks();
    CHECK(statusOf(manager, "queued") == TaskStatus::Ready);

    manager.completeTask("a", "running");
    CHECK(manager.getAgent("a")->value.status == AgentStatus::Offline);

    manager.registerAgent("a", {"build"});
    agent = manager.getAgent("a")->value;
    CHECK(agent.status == AgentStatus::Idle);
    CHECK(agent.capabilities == std::set<std::string>{"build"});

    manager.scheduleReadyTasks();
    CHECK(statusOf(manager, "queued") == TaskStatus::Assigned);

    CHECK_THROWS_AS(manager.registerAgent("a", {}), std::invalid_argument);
    CHECK_THROWS_AS(manager.unregisterAgent("ghost"), UnknownEntityError);
}

TEST_CASE("Checkpoints survive a restart", "[manager][coordination][recovery]") {
    auto store = std::make_shared<Memory::InMemoryStore>();

    {
        CoordinationManager first(testConfig(), nullptr, store);
        first.initialize();
        first.registerAgent("worker", {});
        first.submit(makeTask("a"));
        first.submit(makeTask("b", {"a"}));
        first.submit(makeTask("c", {"b"}));

        runTask(first, "a");
        first.completeTask("worker", "a");
        runTask(first, "b");
        REQUIRE(first.flushEvents(2s));

        CHECK(store->keys("swarm", "task/").size() == 3);
        CHECK(store->keys("swarm", "agent/") == std::vector<std::string>{"agent/worker"});
        first.shutdown();
    }

    CoordinationManager second(testConfig(), nullptr, store);
    second.initialize();
    auto report = second.recover();
    CHECK(report.tasks == 3);
    CHECK(report.agents == 1);
    CHECK(report.requeued == 1);
    CHECK(report.skipped == 0);

    CHECK(statusOf(second, "a") == TaskStatus::Completed);
    auto b = second.getStatus("b")->value;
    CHECK(b.status == TaskStatus::Ready);
    CHECK_FALSE(b.assignedAgent.has_value());
    CHECK(statusOf(second, "c") == TaskStatus::Pending);
    CHECK(second.graph().getStatus("a") == GraphNodeState::Completed);

    auto worker = second.getAgent("worker")->value;
    CHECK(worker.status == AgentStatus::Offline);
    CHECK(worker.load() == 0);

    second.registerAgent("worker", {});
    second.scheduleReadyTasks();
    CHECK(second.getStatus("b")->value.assignedAgent == AgentId("worker"));

    SECTION("Recovering again skips what is already loaded") {
        auto again = second.recover();
        CHECK(again.tasks == 0);
        CHECK(again.agents == 0);
        CHECK(again.skipped == 4);
    }
}

TEST_CASE("Recovery tolerates missing and damaged checkpoints", "[manager][coordination][recovery]") {
    SECTION("No store") {
        CoordinationManager manager(testConfig());
        manager.initialize();
        auto report = manager.recover();
        CHECK(report.tasks == 0);
        CHECK(report.agents == 0);
    }

    SECTION("Unreadable records are skipped") {
        auto store = std::make_shared<Memory::InMemoryStore>();
        store->put("swarm", "task/bad", "{not json");
        CoordinationManager manager(testConfig(), nullptr, store);
        manager.initialize();
        auto report = manager.recover();
        CHECK(report.tasks == 0);
        CHECK(report.skipped == 1);
    }
}

TEST_CASE("Observing the engine", "[manager][coordination]") {
    auto config = testConfig();
    config.enableMetrics = true;
    config.metrics.interval = 1h;
    EventLog log;
    CoordinationManager manager(config);
    manager.initialize();

    auto id = manager.subscribe("log", log.handler());
    manager.registerAgent("worker", {});
    manager.submit(makeTask("a"));
    manager.submit(makeTask("b"));
    manager.scheduleReadyTasks();

    auto sample = manager.getMetricsSnapshot();
    CHECK(sample.assignments == 2);
    CHECK(sample.queueDepth == 0);
    REQUIRE(sample.agents.size() == 1);
    CHECK(sample.agents[0].load() == 2);

    REQUIRE(manager.flushEvents(2s));
    CHECK(log.count(CoordinationEventType::Assigned) == 2);

    CHECK(manager.unsubscribe(id));
    manager.cancel("a");
    REQUIRE(manager.flushEvents(2s));
    CHECK(log.count(CoordinationEventType::Cancelled) == 0);
}

TEST_CASE("Automatic scheduling", "[manager][coordination]") {
    auto config = testConfig();
    config.autoSchedule = true;
    config.maintenanceInterval = 5ms;
    CoordinationManager manager(config);
    manager.initialize();
    manager.registerAgent("worker", {});

    manager.submit(makeTask("t"));
    CHECK(SwarmTest::waitFor([&manager] {
        return manager.getStatus("t")->value.status == TaskStatus::Assigned;
    }));
    manager.shutdown();
}
