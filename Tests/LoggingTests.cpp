//
// LoggingTests.cpp - Logger, sinks and task-context entries
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <Logging/Logger.h>
#include <Logging/ConsoleSink.h>
#include <Logging/LogLevel.h>
#include <Logging/RingBufferSink.h>
#include "TestHelpers.h"
#include <algorithm>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace SwarmEngine::Core::Logging;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

namespace {
    std::shared_ptr<RingBufferSink> attachRing(Logger& logger, size_t capacity = 256) {
        auto ring = std::make_shared<RingBufferSink>(capacity);
        logger.addSink(ring);
        return ring;
    }
}

TEST_CASE("Level names parse from configuration strings", "[logging]") {
    CHECK(stringToLogLevel("debug") == LogLevel::Debug);
    CHECK(stringToLogLevel("WARN") == LogLevel::Warning);
    CHECK(stringToLogLevel("Warning") == LogLevel::Warning);
    CHECK(stringToLogLevel("error") == LogLevel::Error);
    CHECK(stringToLogLevel("off") == LogLevel::Off);
    CHECK(stringToLogLevel("verbose") == LogLevel::Info);
    CHECK(stringToLogLevel("") == LogLevel::Info);

    CHECK(logLevelToString(LogLevel::Info) == "INFO ");
    CHECK(logLevelToString(LogLevel::Warning).size() == logLevelToString(LogLevel::Fatal).size());
}

TEST_CASE("Logger routes entries by component category", "[logging]") {
    Logger logger("Swarm");
    auto ring = attachRing(logger);

    logger.info("Scheduler", "assigned {} to {}", "build", "agent-1");
    logger.warning("CircuitBreaker", "endpoint {} opened after {} failures", "llm", 3);
    logger.debug("MessageRouter", std::string("queue drained"));

    auto entries = ring->entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].category == "Scheduler");
    CHECK(entries[0].message == "assigned build to agent-1");
    CHECK(entries[1].level == LogLevel::Warning);
    CHECK(entries[1].message == "endpoint llm opened after 3 failures");
    CHECK(entries[2].taskId.empty());

    CHECK(ring->find("CircuitBreaker").size() == 1);
    CHECK(ring->find("agent-1").size() == 1);
    CHECK(ring->find("Stealer").empty());
}

TEST_CASE("Task context travels outside the message", "[logging]") {
    Logger logger("Swarm");
    auto ring = attachRing(logger);

    logger.logTask(LogLevel::Error, "Manager", "t-42", "worker-7", "attempt 2 failed");
    logger.logTask(LogLevel::Info, "Manager", "t-43", "", "queued");

    auto entries = ring->entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].taskId == "t-42");
    CHECK(entries[0].agentId == "worker-7");
    CHECK(entries[0].message == "attempt 2 failed");
    CHECK(entries[1].agentId.empty());
    CHECK(entries[0].location.line() != 0);
}

TEST_CASE("Minimum levels gate at logger and sink", "[logging]") {
    Logger logger("Swarm");
    auto everything = attachRing(logger);
    auto problems = attachRing(logger);
    problems->setMinLevel(LogLevel::Warning);

    logger.setMinLevel(LogLevel::Debug);
    logger.trace("Scheduler", std::string("tick"));
    logger.debug("Scheduler", std::string("queue depth 4"));
    logger.error("Scheduler", std::string("agent vanished"));
    logger.logTask(LogLevel::Trace, "Scheduler", "t1", "a1", "skipped");

    CHECK(everything->size() == 2);
    CHECK(problems->size() == 1);
    CHECK(problems->entries()[0].message == "agent vanished");

    logger.setMinLevel(LogLevel::Off);
    logger.fatal("Manager", std::string("unreachable"));
    CHECK(everything->size() == 2);
    CHECK_FALSE(logger.isEnabled(LogLevel::Fatal));
}

TEST_CASE("Sinks can be attached and detached at runtime", "[logging]") {
    Logger logger("Swarm");
    auto first = attachRing(logger);
    auto second = attachRing(logger);
    CHECK(logger.sinkCount() == 2);

    logger.info("Manager", std::string("initialized"));
    logger.removeSink(first);
    logger.info("Manager", std::string("running"));

    CHECK(first->size() == 1);
    CHECK(second->size() == 2);

    logger.clearSinks();
    logger.info("Manager", std::string("shutdown"));
    CHECK(logger.sinkCount() == 0);
    CHECK(second->size() == 2);
}

TEST_CASE("Ring buffer keeps the newest entries", "[logging]") {
    Logger logger("Swarm");
    auto ring = attachRing(logger, 3);

    for (int i = 0; i < 5; ++i) {
        logger.info("Metrics", "sample {}", i);
    }

    auto entries = ring->entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries.front().message == "sample 2");
    CHECK(entries.back().message == "sample 4");

    ring->clear();
    CHECK(ring->size() == 0);
}

TEST_CASE("Concurrent workers do not lose entries", "[logging]") {
    Logger logger("Swarm");
    auto ring = attachRing(logger, 10000);

    constexpr int workers = 6;
    constexpr int perWorker = 200;
    std::vector<std::thread> threads;
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&logger, w]() {
            auto agent = "agent-" + std::to_string(w);
            for (int i = 0; i < perWorker; ++i) {
                logger.logTask(LogLevel::Info, "Worker", "t" + std::to_string(i), agent, "done");
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto entries = ring->entries();
    REQUIRE(entries.size() == static_cast<size_t>(workers * perWorker));

    std::set<std::string> agents;
    std::set<std::thread::id> threadIds;
    for (const auto& entry : entries) {
        agents.insert(entry.agentId);
        threadIds.insert(entry.threadId);
    }
    CHECK(agents.size() == static_cast<size_t>(workers));
    CHECK(threadIds.size() == static_cast<size_t>(workers));
}

TEST_CASE("Global macros reach attached sinks", "[logging]") {
    SwarmTest::CapturingSink capture(LogLevel::Debug);

    SWARM_LOG_INFO_CAT("Stealer", "moved {} tasks", 2);
    SWARM_LOG_DEBUG("plain {}", "entry");
    SWARM_LOG_TASK(LogLevel::Warning, "Manager", "t9", "a3", "deadline in {}ms", 50);
    SWARM_LOG_TRACE_CAT("Stealer", "below threshold");

    CHECK(capture.contains("moved 2 tasks"));
    CHECK(capture.contains("plain entry"));
    CHECK_FALSE(capture.contains("below threshold"));

    auto entries = capture.entries();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [](const LogEntry& e) { return e.taskId == "t9"; });
    REQUIRE(it != entries.end());
    CHECK(it->agentId == "a3");
    CHECK(it->message == "deadline in 50ms");
    CHECK(capture.count(LogLevel::Warning) == 1);
}

TEST_CASE("Console format carries category, context and location", "[logging]") {
    ConsoleSink sink(false, false);

    LogEntry entry(LogLevel::Warning, "Scheduler", "no capable agent");
    entry.taskId = "render";
    entry.agentId = "gpu-1";

    auto line = sink.format(entry);
    CHECK_THAT(line, StartsWith("["));
    CHECK_THAT(line, ContainsSubstring("[WARN ] [Scheduler] no capable agent"));
    CHECK_THAT(line, EndsWith("task=render agent=gpu-1"));

    sink.setShowLocation(true);
    CHECK_THAT(sink.format(entry), ContainsSubstring("LoggingTests.cpp:"));

    sink.setShowThreadId(true);
    LogEntry bare(LogLevel::Info, "", "idle");
    auto bareLine = sink.format(bare);
    CHECK_THAT(bareLine, EndsWith(")"));
    CHECK_THAT(bareLine, !ContainsSubstring("task="));
    CHECK(sink.shouldLog(LogLevel::Trace));

    sink.setMinLevel(LogLevel::Error);
    CHECK_FALSE(sink.shouldLog(LogLevel::Warning));
    CHECK(sink.shouldLog(LogLevel::Fatal));
}
