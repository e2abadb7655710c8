/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#include <catch2/catch_test_macros.hpp>
#include <Coordination/SchedulingStrategies.h>
#include "TestHelpers.h"
#include <string>
#include <vector>

using namespace SwarmEngine::Core::Coordination;
using SwarmTest::makeAgent;
using SwarmTest::makeTask;

namespace {
    AgentInfo loaded(AgentInfo agent, size_t queued) {
        for (size_t i = 0; i < queued; ++i) {
            agent.queuedTasks.push_back(agent.id + "-q" + std::to_string(i));
        }
        return agent;
    }
}

TEST_CASE("Task and agent records", "[coordination][types]") {
    SECTION("Lifecycle transitions") {
        CHECK(isValidTransition(TaskStatus::Pending, TaskStatus::Ready));
        CHECK(isValidTransition(TaskStatus::Ready, TaskStatus::Assigned));
        CHECK(isValidTransition(TaskStatus::Assigned, TaskStatus::Running));
        CHECK(isValidTransition(TaskStatus::Assigned, TaskStatus::Ready));
        CHECK(isValidTransition(TaskStatus::Running, TaskStatus::Completed));
        CHECK(isValidTransition(TaskStatus::Failed, TaskStatus::Ready));
        CHECK_FALSE(isValidTransition(TaskStatus::Running, TaskStatus::Cancelled));
        CHECK_FALSE(isValidTransition(TaskStatus::Completed, TaskStatus::Ready));
        CHECK_FALSE(isValidTransition(TaskStatus::Pending, TaskStatus::Running));
    }

    SECTION("Status names round-trip") {
        CHECK(stringToTaskStatus(taskStatusToString(TaskStatus::Cancelled)) == TaskStatus::Cancelled);
        CHECK(stringToAgentStatus(agentStatusToString(AgentStatus::Draining)) == AgentStatus::Draining);
        CHECK_FALSE(stringToTaskStatus("bogus").has_value());
    }

    SECTION("Capacity and capabilities") {
        auto agent = makeAgent("a", {"build", "test"}, 1);
        CHECK(agent.hasCapabilities({"build"}));
        CHECK(agent.hasCapabilities({}));
        CHECK_FALSE(agent.hasCapabilities({"build", "gpu"}));
        CHECK(agent.hasCapacity());
        agent.queuedTasks.push_back("t");
        CHECK_FALSE(agent.hasCapacity());
    }

    SECTION("Affinity keys combine namespace and tags") {
        auto task = makeTask("t");
        task.ns = "build";
        task.tags = {"linux"};
        CHECK(task.affinityKeys() == std::set<std::string>{"linux", "ns:build"});
    }
}

TEST_CASE("Capability strategy", "[coordination][strategy]") {
    CapabilityStrategy strategy;

    SECTION("Only agents with every required capability qualify") {
        std::vector<AgentInfo> agents{makeAgent("cpu", {"build"}), makeAgent("gpu", {"build", "cuda"})};
        CHECK(strategy.selectAgent(makeTask("t", {}, {"cuda"}), agents) == "gpu");
    }

    SECTION("Ties prefer the narrower agent") {
        std::vector<AgentInfo> agents{makeAgent("wide", {"build", "cuda", "test"}), makeAgent("narrow", {"build"})};
        CHECK(strategy.selectAgent(makeTask("t", {}, {"build"}), agents) == "narrow");
    }

    SECTION("Lower load wins before specialization") {
        std::vector<AgentInfo> agents{loaded(makeAgent("narrow", {"build"}), 2), makeAgent("wide", {"build", "x"})};
        CHECK(strategy.selectAgent(makeTask("t", {}, {"build"}), agents) == "wide");
    }

    SECTION("Full, draining and offline agents are skipped") {
        auto full = loaded(makeAgent("full", {}, 1), 1);
        auto draining = makeAgent("draining");
        draining.status = AgentStatus::Draining;
        auto offline = makeAgent("offline");
        offline.status = AgentStatus::Offline;
        std::vector<AgentInfo> agents{full, draining, offline};
        CHECK_THROWS_AS(strategy.selectAgent(makeTask("t"), agents), NoCapableAgentError);
    }
}

TEST_CASE("Round-robin strategy", "[coordination][strategy]") {
    RoundRobinStrategy strategy;
    std::vector<AgentInfo> agents{makeAgent("c"), makeAgent("a"), makeAgent("b")};
    auto task = makeTask("t");

    CHECK(strategy.selectAgent(task, agents) == "a");
    CHECK(strategy.selectAgent(task, agents) == "b");
    CHECK(strategy.selectAgent(task, agents) == "c");
    CHECK(strategy.selectAgent(task, agents) == "a");

    SECTION("Rotation continues past agents that left") {
        std::vector<AgentInfo> fewer{makeAgent("a"), makeAgent("c")};
        CHECK(strategy.selectAgent(task, fewer) == "c");
    }

    SECTION("Reset starts from the first agent again") {
        strategy.reset();
        CHECK(strategy.selectAgent(task, agents) == "a");
    }
}

TEST_CASE("Least-loaded strategy", "[coordination][strategy]") {
    LeastLoadedStrategy strategy;
    std::vector<AgentInfo> agents{loaded(makeAgent("a"), 3), loaded(makeAgent("b"), 1), loaded(makeAgent("c"), 1)};
    CHECK(strategy.selectAgent(makeTask("t"), agents) == "b");
}

TEST_CASE("Affinity strategy", "[coordination][strategy]") {
    AffinityStrategy strategy;
    auto task = makeTask("t");
    task.ns = "frontend";
    std::vector<AgentInfo> agents{makeAgent("a"), loaded(makeAgent("b"), 2)};

    SECTION("Falls back to least-loaded without history") {
        CHECK(strategy.selectAgent(task, agents) == "a");
    }

    SECTION("Prefers the agent that last completed work in the namespace") {
        strategy.notifyTaskCompleted(task, "b");
        CHECK(strategy.lastCompleter("ns:frontend") == AgentId("b"));
        CHECK(strategy.selectAgent(task, agents) == "b");
    }

    SECTION("Forgets removed agents") {
        strategy.notifyTaskCompleted(task, "b");
        strategy.notifyAgentRemoved("b");
        CHECK_FALSE(strategy.lastCompleter("ns:frontend").has_value());
        CHECK(strategy.selectAgent(task, agents) == "a");
    }

    SECTION("Ignores a preferred agent that cannot take the task") {
        strategy.notifyTaskCompleted(task, "b");
        agents[1].maxConcurrentTasks = 2;
        CHECK(strategy.selectAgent(task, agents) == "a");
    }
}

TEST_CASE("Strategy factory", "[coordination][strategy]") {
    for (auto kind : {SchedulingStrategyKind::Capability, SchedulingStrategyKind::RoundRobin,
                      SchedulingStrategyKind::LeastLoaded, SchedulingStrategyKind::Affinity}) {
        auto strategy = makeSchedulingStrategy(kind);
        CHECK(std::string(strategy->getName()) == schedulingStrategyKindToString(kind));
        CHECK(stringToSchedulingStrategyKind(strategy->getName()) == kind);
    }
    CHECK_FALSE(stringToSchedulingStrategyKind("random").has_value());
}
