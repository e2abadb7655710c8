/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 */

#include <catch2/catch_test_macros.hpp>
#include <Coordination/DependencyGraph.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace SwarmEngine::Core::Coordination;

namespace {
    bool contains(const std::vector<TaskId>& ids, const TaskId& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    size_t indexOf(const std::vector<TaskId>& ids, const TaskId& id) {
        return static_cast<size_t>(std::find(ids.begin(), ids.end(), id) - ids.begin());
    }
}

TEST_CASE("DependencyGraph readiness", "[graph][coordination]") {
    DependencyGraph graph;

    SECTION("Tasks without dependencies start ready") {
        CHECK(graph.addTask("a", {}) == GraphNodeState::Ready);
        CHECK(graph.getReadyTasks() == std::vector<TaskId>{"a"});
    }

    SECTION("A task becomes ready once every dependency completes") {
        graph.addTask("a", {});
        graph.addTask("b", {});
        CHECK(graph.addTask("c", {"a", "b"}) == GraphNodeState::Pending);

        CHECK(graph.markCompleted("a").empty());
        CHECK(graph.getStatus("c") == GraphNodeState::Pending);

        auto promoted = graph.markCompleted("b");
        CHECK(promoted == std::vector<TaskId>{"c"});
        CHECK(graph.getStatus("c") == GraphNodeState::Ready);
    }

    SECTION("Dispatched tasks leave the ready set and can return to it") {
        graph.addTask("a", {});
        graph.markDispatched("a");
        CHECK(graph.getReadyTasks().empty());
        CHECK(graph.countInState(GraphNodeState::Dispatched) == 1);

        graph.markReady("a");
        CHECK(graph.getReadyTasks() == std::vector<TaskId>{"a"});
    }

    SECTION("Only ready tasks can be dispatched") {
        graph.addTask("a", {});
        graph.addTask("b", {"a"});
        CHECK_THROWS_AS(graph.markDispatched("b"), std::logic_error);
    }

    SECTION("Completing a terminal task is rejected") {
        graph.addTask("a", {});
        graph.markCompleted("a");
        CHECK_THROWS_AS(graph.markCompleted("a"), std::logic_error);
    }

    SECTION("A task still waiting on dependencies cannot complete") {
        graph.addTask("a", {});
        graph.addTask("b", {"a"});
        graph.addTask("c", {"b"});
        CHECK_THROWS_AS(graph.markCompleted("b"), std::logic_error);
        CHECK(graph.getStatus("b") == GraphNodeState::Pending);
        CHECK(graph.getStatus("c") == GraphNodeState::Pending);

        graph.markDispatched("a");
        CHECK(graph.markCompleted("a") == std::vector<TaskId>{"b"});
    }

    SECTION("Unknown ids are reported") {
        CHECK_FALSE(graph.getStatus("missing").has_value());
        CHECK_THROWS_AS(graph.markCompleted("missing"), UnknownEntityError);
    }

    SECTION("Duplicate ids are rejected") {
        graph.addTask("a", {});
        CHECK_THROWS_AS(graph.addTask("a", {}), DuplicateTaskError);
    }
}

TEST_CASE("DependencyGraph forward references", "[graph][coordination]") {
    DependencyGraph graph;

    SECTION("A dependency may be submitted after its dependent") {
        CHECK(graph.addTask("b", {"a"}) == GraphNodeState::Pending);
        CHECK(graph.getUnresolvedDependencies("b") == std::vector<TaskId>{"a"});

        CHECK(graph.addTask("a", {}) == GraphNodeState::Ready);
        CHECK(graph.getUnresolvedDependencies("b").empty());
        CHECK(graph.getDependents("a") == std::vector<TaskId>{"b"});

        graph.markCompleted("a");
        CHECK(graph.getStatus("b") == GraphNodeState::Ready);
    }

    SECTION("Closing a cycle through a forward reference is rejected") {
        graph.addTask("b", {"a"});
        graph.addTask("c", {"b"});
        CHECK_THROWS_AS(graph.addTask("a", {"c"}), CycleError);
        CHECK_FALSE(graph.contains("a"));
        CHECK(graph.getUnresolvedDependencies("b") == std::vector<TaskId>{"a"});
    }
}

TEST_CASE("DependencyGraph cycle detection", "[graph][coordination]") {
    DependencyGraph graph;
    graph.addTask("a", {});
    graph.addTask("b", {"a"});
    graph.addTask("c", {"b"});

    SECTION("Self dependency") {
        CHECK_THROWS_AS(graph.addTask("d", {"d"}), CycleError);
        CHECK_THROWS_AS(graph.addDependency("a", "a"), CycleError);
    }

    SECTION("Back edge leaves the graph unchanged") {
        auto before = graph.getDependencies("a");
        try {
            graph.addDependency("a", "c");
            FAIL("expected a cycle");
        } catch (const CycleError& e) {
            CHECK(e.code() == CoordinationErrorCode::Cycle);
            CHECK(e.taskId() == "a");
            CHECK(e.dependency() == "c");
        }
        CHECK(graph.getDependencies("a") == before);
        CHECK(graph.getDependents("c").empty());
        CHECK(graph.getStatus("a") == GraphNodeState::Ready);
    }

    SECTION("Redundant edges are accepted") {
        graph.addDependency("c", "a");
        CHECK(graph.getDependencies("c") == std::vector<TaskId>{"a", "b"});
        graph.addDependency("c", "a");
        CHECK(graph.getDependencies("c").size() == 2);
    }

    SECTION("A ready task only takes edges to completed tasks") {
        graph.addTask("d", {});
        CHECK_THROWS_AS(graph.addDependency("d", "c"), std::logic_error);
        CHECK_THROWS_AS(graph.addDependency("d", "later"), std::logic_error);
        CHECK(graph.getStatus("d") == GraphNodeState::Ready);
        CHECK(graph.getDependencies("d").empty());

        graph.markCompleted("a");
        graph.addDependency("d", "a");
        CHECK(graph.getStatus("d") == GraphNodeState::Ready);
        CHECK(graph.getDependencies("d") == std::vector<TaskId>{"a"});
    }

    SECTION("A pending task accepts edges to tasks not yet submitted") {
        graph.addDependency("c", "later");
        CHECK(graph.getStatus("c") == GraphNodeState::Pending);
        CHECK(graph.getUnresolvedDependencies("c") == std::vector<TaskId>{"later"});
    }
}

TEST_CASE("DependencyGraph failure cascade", "[graph][coordination]") {
    DependencyGraph graph;
    graph.addTask("root", {});
    graph.addTask("mid", {"root"});
    graph.addTask("leaf", {"mid"});
    graph.addTask("other", {});

    SECTION("Failure cancels every downstream task") {
        graph.markDispatched("root");
        auto cancelled = graph.markFailed("root");
        CHECK(cancelled.size() == 2);
        CHECK(contains(cancelled, "mid"));
        CHECK(contains(cancelled, "leaf"));
        CHECK(graph.getStatus("root") == GraphNodeState::Failed);
        CHECK(graph.getStatus("leaf") == GraphNodeState::Cancelled);
        CHECK(graph.getStatus("other") == GraphNodeState::Ready);
    }

    SECTION("Cancel includes the task itself") {
        auto cancelled = graph.cancel("mid");
        CHECK(cancelled == std::vector<TaskId>{"mid", "leaf"});
        CHECK(graph.getStatus("root") == GraphNodeState::Ready);
    }

    SECTION("A failed task may be made ready again") {
        graph.markDispatched("other");
        graph.markFailed("other");
        graph.markReady("other");
        CHECK(graph.getStatus("other") == GraphNodeState::Ready);
    }

    SECTION("New tasks depending on a failed task start cancelled") {
        graph.markFailed("root");
        CHECK(graph.addTask("late", {"root"}) == GraphNodeState::Cancelled);
    }
}

TEST_CASE("DependencyGraph removal", "[graph][coordination]") {
    DependencyGraph graph;
    graph.addTask("a", {});
    graph.addTask("b", {"a"});

    SECTION("Removal with live dependents requires force") {
        CHECK_THROWS_AS(graph.removeTask("a"), HasDependentsError);
        CHECK(graph.contains("a"));

        auto cancelled = graph.removeTask("a", true);
        CHECK(cancelled == std::vector<TaskId>{"b"});
        CHECK_FALSE(graph.contains("a"));
        CHECK(graph.getDependencies("b").empty());
    }

    SECTION("Terminal dependents do not block removal") {
        graph.cancel("b");
        CHECK(graph.removeTask("a").empty());
        CHECK(graph.size() == 1);
    }
}

TEST_CASE("DependencyGraph ordering", "[graph][coordination]") {
    DependencyGraph graph;
    graph.addTask("fetch", {});
    graph.addTask("compile", {"fetch"});
    graph.addTask("lint", {"fetch"});
    graph.addTask("test", {"compile"});
    graph.addTask("package", {"test", "lint"});

    SECTION("Topological order respects every edge") {
        auto order = graph.topologicalOrder();
        REQUIRE(order.size() == 5);
        CHECK(indexOf(order, "fetch") < indexOf(order, "compile"));
        CHECK(indexOf(order, "compile") < indexOf(order, "test"));
        CHECK(indexOf(order, "test") < indexOf(order, "package"));
        CHECK(indexOf(order, "lint") < indexOf(order, "package"));
    }

    SECTION("Critical path follows the longest chain") {
        CHECK(graph.criticalPathLength("fetch") == 4);
        CHECK(graph.criticalPathLength("lint") == 2);
        CHECK(graph.criticalPath() == std::vector<TaskId>{"fetch", "compile", "test", "package"});
    }
}
