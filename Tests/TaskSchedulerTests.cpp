/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#include <catch2/catch_test_macros.hpp>
#include <Coordination/TaskScheduler.h>
#include <Coordination/SchedulingStrategies.h>
#include "TestHelpers.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace SwarmEngine::Core::Coordination;
using namespace std::chrono_literals;
using SwarmTest::makeAgent;
using SwarmTest::makeTask;

namespace {
    struct SchedulerFixture {
        std::mutex eventsMutex;
        std::vector<EventEnvelope> events;

        CoordinationState state;
        DependencyGraph graph;
        ResourceManager resources;
        MessageRouter router;
        ConflictResolver resolver;
        AdvancedTaskScheduler scheduler;

        explicit SchedulerFixture(TaskScheduler::Config config = {},
                                  SchedulingStrategyKind kind = SchedulingStrategyKind::Capability)
            : scheduler(state, graph, resources, makeSchedulingStrategy(kind), &router, &resolver, config) {
            router.subscribe("recorder", [this](const EventEnvelope& envelope) {
                std::lock_guard<std::mutex> lock(eventsMutex);
                events.push_back(envelope);
            });
        }

        void submit(Task task) {
            auto initial = graph.addTask(task.id, task.dependencies);
            task.status = initial == GraphNodeState::Ready ? TaskStatus::Ready : TaskStatus::Pending;
            TaskId id = task.id;
            state.tasks.insert(id, std::move(task));
            scheduler.enqueue(id);
        }

        void addAgent(AgentInfo agent) {
            AgentId id = agent.id;
            state.agents.insert(id, std::move(agent));
        }

        TaskStatus status(const TaskId& id) const { return state.tasks.get(id).value.status; }

        size_t eventsOfType(CoordinationEventType type) {
            router.flush(2s);
            std::lock_guard<std::mutex> lock(eventsMutex);
            size_t n = 0;
            for (const auto& e : events) {
                if (e.type() == type) {
                    ++n;
                }
            }
            return n;
        }
    };
}

TEST_CASE("Capability scheduling prefers the capable agent over the idle one", "[scheduler][coordination]") {
    SchedulerFixture fx;
    fx.addAgent(makeAgent("agent-1", {"build"}));
    auto busy = makeAgent("agent-2", {"build", "gpu"});
    busy.queuedTasks = {"other-1", "other-2"};
    busy.status = AgentStatus::Busy;
    fx.addAgent(busy);

    fx.submit(makeTask("render", {}, {"gpu"}));
    auto result = fx.scheduler.assign("render");

    REQUIRE(result.assigned());
    CHECK(result.agentId == AgentId("agent-2"));
    CHECK(result.strategy == "capability");

    auto task = fx.state.tasks.get("render").value;
    CHECK(task.status == TaskStatus::Assigned);
    CHECK(task.assignedAgent == AgentId("agent-2"));
    CHECK(fx.state.agents.get("agent-2").value.queuedTasks.back() == "render");
    CHECK(fx.graph.getStatus("render") == GraphNodeState::Dispatched);
    CHECK_FALSE(fx.scheduler.isQueued("render"));
    CHECK(fx.eventsOfType(CoordinationEventType::Assigned) == 1);
}

TEST_CASE("Ready queue ordering", "[scheduler][coordination]") {
    SchedulerFixture fx;
    fx.submit(makeTask("low", {}, {}, 1));
    fx.submit(makeTask("high", {}, {}, 10));
    fx.submit(makeTask("low-2", {}, {}, 1));
    fx.submit(makeTask("waiting", {"low"}, {}, 100));

    CHECK(fx.scheduler.readyQueue() == std::vector<TaskId>{"high", "low", "low-2"});
    CHECK_FALSE(fx.scheduler.enqueue("waiting"));
    CHECK_FALSE(fx.scheduler.enqueue("high"));

    SECTION("Requeue moves a task to the back of its priority band") {
        CHECK(fx.scheduler.requeue("low"));
        CHECK(fx.scheduler.readyQueue() == std::vector<TaskId>{"high", "low-2", "low"});
    }

    SECTION("Schedule assigns in queue order and honors the cap") {
        fx.addAgent(makeAgent("a"));
        auto results = fx.scheduler.schedule(2);
        REQUIRE(results.size() == 2);
        CHECK(results[0].taskId == "high");
        CHECK(results[1].taskId == "low");
        CHECK(fx.scheduler.queueDepth() == 1);
    }

    SECTION("Tasks that stopped being ready leave the queue") {
        fx.state.tasks.update("low", [](Task& t) { t.status = TaskStatus::Cancelled; });
        auto result = fx.scheduler.assign("low");
        CHECK(result.status == AssignmentStatus::NotReady);
        CHECK_FALSE(fx.scheduler.isQueued("low"));
    }
}

TEST_CASE("Unassignable tasks", "[scheduler][coordination]") {
    SECTION("Tasks wait in the queue during the grace period") {
        SchedulerFixture fx;
        fx.addAgent(makeAgent("cpu", {"build"}));
        fx.submit(makeTask("t", {}, {"gpu"}));

        auto result = fx.scheduler.assign("t");
        CHECK(result.status == AssignmentStatus::NoCapableAgent);
        CHECK(fx.scheduler.isQueued("t"));
        CHECK(fx.status("t") == TaskStatus::Ready);

        fx.addAgent(makeAgent("gpu", {"gpu"}));
        CHECK(fx.scheduler.assign("t").assigned());
    }

    SECTION("Tasks fail once the grace period runs out and dependents are cancelled") {
        TaskScheduler::Config config;
        config.gracePeriod = 0ms;
        SchedulerFixture fx(config);
        fx.submit(makeTask("t", {}, {"gpu"}));
        fx.submit(makeTask("after", {"t"}));

        auto result = fx.scheduler.assign("t");
        CHECK(result.status == AssignmentStatus::Expired);
        CHECK(fx.status("t") == TaskStatus::Failed);
        CHECK(fx.status("after") == TaskStatus::Cancelled);
        CHECK(fx.graph.getStatus("t") == GraphNodeState::Failed);
        CHECK_FALSE(fx.scheduler.isQueued("t"));
        CHECK(fx.eventsOfType(CoordinationEventType::Failed) == 1);
        CHECK(fx.eventsOfType(CoordinationEventType::Cancelled) == 1);
        CHECK(fx.scheduler.getStats().expired == 1);
    }

    SECTION("Full agents are not candidates") {
        SchedulerFixture fx;
        fx.addAgent(makeAgent("solo", {}, 1));
        fx.submit(makeTask("a"));
        fx.submit(makeTask("b"));

        auto results = fx.scheduler.schedule();
        REQUIRE(results.size() == 2);
        CHECK(results[0].assigned());
        CHECK(results[1].status == AssignmentStatus::NoCapableAgent);
    }

    SECTION("Draining agents take no new work") {
        SchedulerFixture fx;
        auto agent = makeAgent("leaving");
        agent.status = AgentStatus::Draining;
        fx.addAgent(agent);
        fx.submit(makeTask("a"));
        CHECK(fx.scheduler.assign("a").status == AssignmentStatus::NoCapableAgent);
    }
}

TEST_CASE("Resource-gated assignment", "[scheduler][coordination]") {
    SchedulerFixture fx;
    fx.resources.registerResource("gpu", 1.0, ResourceMode::Exclusive);
    fx.addAgent(makeAgent("a"));
    fx.addAgent(makeAgent("b"));

    auto first = makeTask("first");
    first.resources.push_back({"gpu", 1.0});
    auto second = makeTask("second");
    second.resources.push_back({"gpu", 1.0});
    fx.submit(first);
    fx.submit(second);

    CHECK(fx.scheduler.assign("first").assigned());
    CHECK(fx.scheduler.assign("second").status == AssignmentStatus::InsufficientResources);
    CHECK(fx.resources.claimsFor("second").empty());

    fx.resources.release("first");
    CHECK(fx.scheduler.assign("second").assigned());

    SECTION("An undeclared resource fails the task immediately") {
        auto odd = makeTask("odd");
        odd.resources.push_back({"fpga", 1.0});
        fx.submit(odd);
        CHECK(fx.scheduler.assign("odd").status == AssignmentStatus::Expired);
        CHECK(fx.status("odd") == TaskStatus::Failed);
    }
}

TEST_CASE("Claimed assignment", "[scheduler][coordination]") {
    SchedulerFixture fx;
    fx.addAgent(makeAgent("cpu", {"build"}));
    fx.addAgent(makeAgent("gpu", {"build", "gpu"}));
    fx.submit(makeTask("t", {}, {"gpu"}));

    SECTION("A capable claimant gets the task") {
        auto result = fx.scheduler.assignTo("t", "gpu");
        REQUIRE(result.assigned());
        CHECK(result.strategy == "claim");
    }

    SECTION("An incapable claimant is refused without starting the grace clock") {
        auto result = fx.scheduler.assignTo("t", "cpu");
        CHECK(result.status == AssignmentStatus::NoCapableAgent);
        CHECK(fx.status("t") == TaskStatus::Ready);
        CHECK(fx.scheduler.isQueued("t"));
    }

    SECTION("Pending claims defer regular scheduling") {
        fx.resolver.submit("t", {ConflictClaim{"gpu", 1, Clock::now(), 0}, nullptr, nullptr});
        CHECK(fx.scheduler.assign("t").status == AssignmentStatus::Deferred);
        fx.resolver.resolvePending();
        CHECK(fx.scheduler.assign("t").assigned());
    }
}

TEST_CASE("Base scheduler uses first fit", "[scheduler][coordination]") {
    CoordinationState state;
    DependencyGraph graph;
    ResourceManager resources;
    TaskScheduler scheduler(state, graph, resources);

    state.agents.insert("b", makeAgent("b", {"x"}));
    state.agents.insert("a", makeAgent("a", {"x"}));
    graph.addTask("t", {});
    auto task = makeTask("t", {}, {"x"});
    task.status = TaskStatus::Ready;
    state.tasks.insert("t", task);

    REQUIRE(scheduler.enqueue("t"));
    auto result = scheduler.assign("t");
    REQUIRE(result.assigned());
    CHECK(result.agentId == AgentId("a"));
    CHECK(result.strategy == "first-fit");
    CHECK(scheduler.getStrategyStats()["first-fit"].assigned == 1);
}

TEST_CASE("Concurrent scheduling passes never double-assign", "[scheduler][coordination][concurrency]") {
    SchedulerFixture fx({}, SchedulingStrategyKind::LeastLoaded);
    for (int i = 0; i < 4; ++i) {
        fx.addAgent(makeAgent("agent-" + std::to_string(i), {}, 5));
    }
    const int taskCount = 40;
    for (int i = 0; i < taskCount; ++i) {
        fx.submit(makeTask("t" + std::to_string(i)));
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&fx] {
            for (int pass = 0; pass < 5; ++pass) {
                fx.scheduler.schedule();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::map<TaskId, int> owners;
    size_t totalQueued = 0;
    for (const auto& snapshot : fx.state.agents.snapshotAll()) {
        CHECK(snapshot.value.load() <= 5);
        totalQueued += snapshot.value.queuedTasks.size();
        for (const auto& id : snapshot.value.queuedTasks) {
            ++owners[id];
        }
    }
    for (const auto& [id, count] : owners) {
        CHECK(count == 1);
        CHECK(fx.status(id) == TaskStatus::Assigned);
    }
    CHECK(totalQueued == 20);
    CHECK(fx.scheduler.getStats().assigned == 20);
    CHECK(fx.eventsOfType(CoordinationEventType::Assigned) == 20);
}
