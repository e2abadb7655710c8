//
// Small end-to-end run: a build pipeline on three agents with a flaky backend.
//

#include "../src/SwarmCore.h"
#include <atomic>
#include <cstdio>
#include <memory>
#include <thread>
#include <vector>

using namespace SwarmEngine;
using namespace Core;
using namespace Coordination;

namespace {

    // Fails every fifth call
    class SimulatedBackend : public IBackendConnection {
    public:
        explicit SimulatedBackend(std::atomic<int>& calls) : _calls(calls) {}

        std::string invoke(const EndpointId& endpoint, const std::string& payload) override {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            if (++_calls % 5 == 0) {
                throw BackendError(endpoint + " timed out");
            }
            return "ok:" + payload;
        }

        bool isHealthy() const override { return true; }

    private:
        std::atomic<int>& _calls;
    };

    Task makeTask(const TaskId& id, std::vector<TaskId> dependencies, std::set<std::string> capabilities,
                  int priority = 0) {
        Task task;
        task.id = id;
        task.dependencies = std::move(dependencies);
        task.requiredCapabilities = std::move(capabilities);
        task.priority = priority;
        return task;
    }

}

int main() {
    std::atomic<int> backendCalls{0};

    CoordinationConfig config;
    config.strategy = SchedulingStrategyKind::LeastLoaded;
    config.pool.maxSize = 2;
    config.circuitBreaker.failureThreshold = 3;
    config.retryBackoffBase = std::chrono::milliseconds(10);
    config.resources.push_back({"gpu", 1.0, ResourceMode::Exclusive});

    auto store = std::make_shared<Memory::InMemoryStore>();
    CoordinationManager manager(config,
                                [&backendCalls] { return std::make_unique<SimulatedBackend>(backendCalls); },
                                store);
    manager.initialize();

    std::atomic<int> finished{0};
    manager.subscribe("printer", [&finished](const EventEnvelope& envelope) {
        std::printf("[%llu] %-9s %s\n", static_cast<unsigned long long>(envelope.sequence),
                    eventTypeToString(envelope.type()), envelope.taskId().c_str());
        if (envelope.type() == CoordinationEventType::Completed ||
            envelope.type() == CoordinationEventType::Cancelled ||
            (envelope.type() == CoordinationEventType::Failed &&
             !std::get<TaskFailedEvent>(envelope.event).willRetry)) {
            ++finished;
        }
    });

    manager.registerAgent("agent-1", {"compile", "test"});
    manager.registerAgent("agent-2", {"compile"});
    manager.registerAgent("agent-3", {"compile", "test", "gpu"});

    manager.submit(makeTask("fetch", {}, {"compile"}, 10));
    manager.submit(makeTask("compile-core", {"fetch"}, {"compile"}, 5));
    manager.submit(makeTask("compile-ui", {"fetch"}, {"compile"}, 5));
    manager.submit(makeTask("unit-tests", {"compile-core"}, {"test"}));
    auto render = makeTask("render-tests", {"compile-ui"}, {"gpu"});
    render.resources.push_back({"gpu", 1.0});
    manager.submit(render);
    manager.submit(makeTask("package", {"unit-tests", "render-tests"}, {"compile"}));

    const int total = static_cast<int>(manager.state().tasks.size());
    while (finished.load() < total) {
        for (const auto& result : manager.scheduleReadyTasks()) {
            if (!result.assigned()) {
                continue;
            }
            auto outcome = manager.executeTask(*result.agentId, result.taskId, "build-farm", result.taskId);
            if (!outcome.succeeded) {
                std::printf("  %s failed on %s: %s\n", result.taskId.c_str(), result.agentId->c_str(),
                            outcome.errorMessage.c_str());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto sample = manager.getMetricsSnapshot();
    std::printf("backend calls: %d, queue depth: %zu, completed: %llu\n", backendCalls.load(), sample.queueDepth,
                static_cast<unsigned long long>(sample.tasksCompleted));
    for (const auto& endpoint : sample.endpoints) {
        std::printf("endpoint %s: %s, failure rate %.2f\n", endpoint.endpoint.c_str(),
                    circuitStateToString(endpoint.state), endpoint.failureRate);
    }

    manager.shutdown();
    std::printf("checkpointed records: %zu\n", store->keys("swarm").size());
    return 0;
}
