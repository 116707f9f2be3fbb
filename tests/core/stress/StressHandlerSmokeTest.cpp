#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/stress/StressHandler.hpp"
#include "support/FakeSources.hpp"

using namespace resguard::core;
using resguard::testing::FakeCounterSource;
using resguard::testing::FakeReclaimer;

namespace {

struct Fixture {
    std::shared_ptr<FakeCounterSource> source = std::make_shared<FakeCounterSource>();
    std::shared_ptr<FakeReclaimer> reclaimer = std::make_shared<FakeReclaimer>();
    std::shared_ptr<monitor::ResourceDetector> detector;
    std::shared_ptr<memory::MemoryOptimizer> optimizer;
    std::unique_ptr<stress::StressHandler> handler;

    explicit Fixture(config::GuardConfig cfg = defaultConfig()) {
        detector = std::make_shared<monitor::ResourceDetector>(cfg, source);
        optimizer = std::make_shared<memory::MemoryOptimizer>(cfg, detector, reclaimer);
        handler = std::make_unique<stress::StressHandler>(cfg, detector, optimizer);
    }

    static config::GuardConfig defaultConfig() {
        config::GuardConfig cfg;
        cfg.stress.cpuThresholdPercent = 80.0;
        cfg.gc.enabled = false;
        return cfg;
    }
};

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

class RecordingPipeline : public stress::IRequestPipeline {
public:
    void addPreRequestGate(stress::PreRequestGate gate) override { gates.push_back(std::move(gate)); }

    stress::GateDecision handle(const std::string& endpoint, const std::string& path) {
        for (const auto& gate : gates) {
            auto decision = gate(stress::RequestContext{endpoint, path});
            if (!decision.allowed) return decision;
        }
        return stress::GateDecision::allow();
    }

    std::vector<stress::PreRequestGate> gates;
};

} // namespace

void testScoreBoundaries() {
    std::cout << "Testing stress score boundaries...\n";
    assert(stress::scoreToState(0.99) == stress::StressState::Normal);
    assert(stress::scoreToState(1.00) == stress::StressState::Elevated);
    assert(stress::scoreToState(1.19) == stress::StressState::Elevated);
    assert(stress::scoreToState(1.20) == stress::StressState::High);
    assert(stress::scoreToState(1.49) == stress::StressState::High);
    assert(stress::scoreToState(1.50) == stress::StressState::Critical);
    assert(stress::toString(stress::StressState::High) == "HIGH");

    stress::StressComponents c{0.5, 1.1, 0.2};
    assert(c.score() == 1.1);

    Fixture f;
    assert(f.handler->handleScore(0.99) == stress::StressState::Normal);
    assert(f.handler->handleScore(1.00) == stress::StressState::Elevated);
    assert(f.handler->handleScore(1.20) == stress::StressState::High);
    assert(f.handler->handleScore(1.50) == stress::StressState::Critical);
    assert(f.handler->currentState() == stress::StressState::Critical);
    assert(f.handler->currentScore() == 1.50);
    std::cout << "[OK] stress score boundaries\n";
}

void testElevatedFromCpu() {
    std::cout << "Testing ELEVATED state from CPU load...\n";
    Fixture f;
    f.source->advance(1.0, 10.0);
    f.detector->sampleUsage();
    // Первая проверка задает базу разностей, скорости берутся из выборки детектора
    assert(f.handler->checkOnce() == stress::StressState::Normal);
    f.source->advance(1.0, 85.0);

    auto usage = f.detector->peekUsage();
    auto components = f.handler->computeComponents(usage);
    assert(std::fabs(components.cpu - 1.0625) < 1e-9);
    assert(components.memory < 1.0);
    assert(components.network == 0.0);

    assert(f.handler->checkOnce() == stress::StressState::Elevated);
    assert(std::fabs(f.handler->currentScore() - 1.0625) < 1e-9);
    auto actions = f.handler->lastActions();
    assert((actions == std::vector<std::string>{"reduce_logging", "collect"}));
    assert(f.handler->isLoggingReduced());
    assert(!f.handler->circuitBreaker().isActive());
    assert(!f.handler->isThrottling());
    // Проверка не пишет в историю детектора
    assert(f.detector->historySize() == 1);

    // Повторная оценка на том же уровне не повторяет действий
    assert(f.handler->handleScore(1.1) == stress::StressState::Elevated);
    assert(f.handler->lastActions().empty());
    std::cout << "[OK] ELEVATED state from CPU load\n";
}

void testCheckRightAfterDetectorTick() {
    std::cout << "Testing stress check right after a detector tick...\n";
    Fixture f;
    f.source->advance(1.0, 10.0);
    f.detector->sampleUsage();
    f.handler->checkOnce();
    for (int i = 0; i < 5; ++i) {
        f.source->advance(1.0, 90.0);
        f.detector->sampleUsage();
        // Проверка в ту же миллисекунду, что и выборка детектора
        assert(f.handler->checkOnce() == stress::StressState::Elevated);
        assert(std::fabs(f.handler->currentScore() - 1.125) < 1e-9);
    }
    assert(f.handler->stressMetrics()["stressEvents"].get<std::uint64_t>() == 1);

    // Окно короче минимального: скорости из последней выборки, база на месте
    f.source->advance(0.1, 0.0);
    assert(f.handler->checkOnce() == stress::StressState::Elevated);
    assert(std::fabs(f.handler->currentScore() - 1.125) < 1e-9);
    f.source->advance(1.0, 0.0);
    assert(f.handler->checkOnce() == stress::StressState::Normal);
    assert(f.handler->stressMetrics()["stressEvents"].get<std::uint64_t>() == 1);

    // Детектор без выборок: проверки считают скорости от своей базы
    Fixture g;
    assert(g.handler->checkOnce() == stress::StressState::Normal);
    g.source->advance(1.0, 90.0);
    assert(g.handler->checkOnce() == stress::StressState::Elevated);
    assert(std::fabs(g.handler->currentScore() - 1.125) < 1e-9);
    assert(g.detector->historySize() == 0);
    std::cout << "[OK] stress check right after a detector tick\n";
}

void testGraduatedEscalation() {
    std::cout << "Testing graduated escalation...\n";
    Fixture f;
    f.handler->handleScore(1.05);
    f.handler->handleScore(1.3);
    auto high = f.handler->lastActions();
    // Нет фоновых задач: приостанавливать нечего
    assert((high == std::vector<std::string>{"optimize_memory"}));
    assert(f.reclaimer->collects() == 1);

    f.handler->handleScore(1.7);
    auto critical = f.handler->lastActions();
    assert(critical.size() >= 2);
    assert(critical[0] == "circuit_break");
    assert(critical[1] == "throttle_requests");
    assert(f.handler->circuitBreaker().isActive());
    assert(f.handler->isThrottling());

    // Снижение внутри эпизода не отменяет действий
    f.handler->handleScore(1.25);
    assert(f.handler->currentState() == stress::StressState::High);
    assert(f.handler->circuitBreaker().isActive());
    assert(f.handler->lastActions().empty());
    std::cout << "[OK] graduated escalation\n";
}

void testRecoveryClearsEverything() {
    std::cout << "Testing return to NORMAL...\n";
    Fixture f;
    std::atomic<int> pauses{0}, resumes{0};
    assert(f.handler->registerBackgroundTask("indexer", [&pauses]() { ++pauses; }, [&resumes]() { ++resumes; }));
    assert(f.handler->registerBackgroundTask("reporter", [&pauses]() { ++pauses; }, [&resumes]() { ++resumes; }, true));

    f.handler->handleScore(1.3);
    assert(contains(f.handler->lastActions(), "pause_background"));
    assert(pauses.load() == 2);
    assert(f.handler->backgroundTasks().pausedCount() == 2);

    f.handler->handleScore(1.6);
    assert(f.handler->circuitBreaker().isActive());
    assert(f.handler->admitRequest({"orders", "/orders"}).statusCode == 503);

    assert(f.handler->handleScore(0.4) == stress::StressState::Normal);
    auto actions = f.handler->lastActions();
    assert(contains(actions, "circuit_reset"));
    assert(contains(actions, "resume_background"));
    assert(contains(actions, "restore_logging"));
    assert(contains(actions, "throttle_off"));
    assert(!f.handler->circuitBreaker().isActive());
    assert(f.handler->backgroundTasks().pausedCount() == 0);
    assert(resumes.load() == 2);
    assert(!f.handler->isThrottling());
    assert(!f.handler->isLoggingReduced());
    assert(f.handler->admitRequest({"orders", "/orders"}).allowed);

    // Ошибка возобновления не оставляет задачу приостановленной
    Fixture g;
    g.handler->registerBackgroundTask("flaky", []() {}, []() { throw std::runtime_error("resume failed"); });
    g.handler->handleScore(1.3);
    assert(g.handler->backgroundTasks().pausedCount() == 1);
    g.handler->handleScore(0.1);
    assert(g.handler->backgroundTasks().pausedCount() == 0);
    std::cout << "[OK] return to NORMAL\n";
}

void testNonStandardCallbackFailures() {
    std::cout << "Testing callbacks throwing non-standard values...\n";
    Fixture f;
    std::atomic<int> resumedB{0};
    assert(f.handler->registerBackgroundTask("a", []() {}, []() { throw 42; }));
    assert(f.handler->registerBackgroundTask("b", []() {}, [&resumedB]() { ++resumedB; }));
    f.handler->handleScore(1.3);
    assert(f.handler->backgroundTasks().pausedCount() == 2);
    assert(f.handler->handleScore(0.2) == stress::StressState::Normal);
    assert(f.handler->backgroundTasks().pausedCount() == 0);
    assert(resumedB.load() == 1);
    assert(contains(f.handler->lastActions(), "resume_background"));

    Fixture g;
    std::atomic<int> pausedB{0};
    assert(g.handler->registerBackgroundTask("a", []() { throw std::string("pause failed"); }, []() {}));
    assert(g.handler->registerBackgroundTask("b", [&pausedB]() { ++pausedB; }, []() {}));
    g.handler->handleScore(1.3);
    assert(pausedB.load() == 1);
    assert(g.handler->backgroundTasks().pausedCount() == 1);

    auto cfg = Fixture::defaultConfig();
    cfg.stress.stressActions = {"circuit_break", "explode"};
    Fixture h(cfg);
    h.handler->registerActionHandler("explode", []() -> bool { throw 7; });
    assert(h.handler->handleScore(1.6) == stress::StressState::Critical);
    assert((h.handler->lastActions() == std::vector<std::string>{"circuit_break"}));
    assert(h.handler->circuitBreaker().isActive());
    std::cout << "[OK] callbacks throwing non-standard values\n";
}

void testPauseOnlyTaskIsSkipped() {
    std::cout << "Testing pause-only background task...\n";
    Fixture f;
    std::atomic<int> pauses{0};
    assert(!f.handler->registerBackgroundTask("pauseOnly", [&pauses]() { ++pauses; }, nullptr));
    auto tasks = f.handler->backgroundTasks().tasks();
    assert(tasks.size() == 1);
    assert(!tasks[0].pausable());

    f.handler->handleScore(1.3);
    assert(pauses.load() == 0);
    assert(!contains(f.handler->lastActions(), "pause_background"));
    assert(f.handler->backgroundTasks().pausedCount() == 0);
    std::cout << "[OK] pause-only background task\n";
}

void testEmergencyOncePerEpisode() {
    std::cout << "Testing emergency escalation once per episode...\n";
    auto cfg = Fixture::defaultConfig();
    cfg.stress.maxStressTime = 0.05;
    Fixture f(cfg);

    f.handler->handleScore(1.6);
    assert(!contains(f.handler->lastActions(), "emergency"));
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    f.handler->handleScore(1.6);
    assert(contains(f.handler->lastActions(), "emergency"));
    assert(f.handler->stressMetrics()["emergencyEscalations"].get<std::uint64_t>() == 1);
    assert(f.reclaimer->trims() == 1);

    for (int i = 0; i < 3; ++i) {
        f.handler->handleScore(1.6);
        assert(!contains(f.handler->lastActions(), "emergency"));
    }
    assert(f.handler->stressMetrics()["emergencyEscalations"].get<std::uint64_t>() == 1);

    // Новый эпизод начинает отсчет заново
    f.handler->handleScore(0.2);
    f.handler->handleScore(1.6);
    assert(!contains(f.handler->lastActions(), "emergency"));
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    f.handler->handleScore(1.6);
    assert(f.handler->stressMetrics()["emergencyEscalations"].get<std::uint64_t>() == 2);

    auto disabled = Fixture::defaultConfig();
    disabled.stress.maxStressTime = 0.0;
    Fixture g(disabled);
    g.handler->handleScore(1.6);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    g.handler->handleScore(1.6);
    assert(g.handler->stressMetrics()["emergencyEscalations"].get<std::uint64_t>() == 0);
    std::cout << "[OK] emergency escalation once per episode\n";
}

void testRequestGate() {
    std::cout << "Testing request gate...\n";
    auto cfg = Fixture::defaultConfig();
    cfg.stress.criticalEndpoints = {"health", "api/admin/*"};
    Fixture f(cfg);
    RecordingPipeline pipeline;
    f.handler->attachTo(pipeline);
    assert(pipeline.gates.size() == 1);

    assert(pipeline.handle("orders", "/orders").allowed);
    f.handler->handleScore(1.6);
    auto rejected = pipeline.handle("orders", "/orders");
    assert(!rejected.allowed);
    assert(rejected.statusCode == 503);
    assert(rejected.message == "Service temporarily unavailable due to high load");
    assert(pipeline.handle("health", "/health").allowed);
    assert(pipeline.handle("admin", "api/admin/users").allowed);
    assert(f.handler->stressMetrics()["rejectedRequests"].get<std::uint64_t>() == 1);

    // Только ограничение частоты: выключатель не настроен
    auto throttleOnly = Fixture::defaultConfig();
    throttleOnly.stress.stressActions = {"throttle_requests"};
    throttleOnly.stress.throttleRequestsPerSecond = 2.0;
    Fixture g(throttleOnly);
    g.handler->handleScore(1.6);
    assert(!g.handler->circuitBreaker().isActive());
    assert(g.handler->isThrottling());
    assert(g.handler->admitRequest({"orders", "/orders"}).allowed);
    assert(g.handler->admitRequest({"orders", "/orders"}).allowed);
    auto throttled = g.handler->admitRequest({"orders", "/orders"});
    assert(!throttled.allowed);
    assert(throttled.statusCode == 429);
    std::cout << "[OK] request gate\n";
}

void testCustomActionsAndInterval() {
    std::cout << "Testing custom actions and check interval...\n";
    auto cfg = Fixture::defaultConfig();
    cfg.stress.stressActions = {"circuit_break", "drop_sessions"};
    cfg.stress.normalCheckInterval = 5.0;
    cfg.stress.stressCheckInterval = 1.0;
    Fixture f(cfg);
    std::atomic<int> drops{0};
    f.handler->registerActionHandler("drop_sessions", [&drops]() {
        ++drops;
        return true;
    });
    assert(f.handler->nextCheckInterval() == std::chrono::milliseconds(5000));

    f.handler->handleScore(1.55);
    auto actions = f.handler->lastActions();
    assert((actions == std::vector<std::string>{"circuit_break", "drop_sessions"}));
    assert(drops.load() == 1);
    assert(f.handler->nextCheckInterval() == std::chrono::milliseconds(1000));

    // HIGH действия не настроены: эскалация проходит без действий
    Fixture g(cfg);
    g.handler->handleScore(1.3);
    assert(g.handler->lastActions().empty());
    std::cout << "[OK] custom actions and check interval\n";
}

void testStressMetrics() {
    std::cout << "Testing stress metrics...\n";
    Fixture f;
    f.source->advance(1.0, 10.0);
    f.detector->sampleUsage();
    f.handler->checkOnce();
    f.source->advance(1.0, 90.0);
    f.handler->checkOnce();
    f.handler->handleScore(1.3);
    f.handler->handleScore(0.5);
    f.handler->handleScore(1.0);

    auto m = f.handler->stressMetrics();
    assert(m["stressEvents"].get<std::uint64_t>() == 2);
    assert(m["maxStressLevel"].get<std::string>() == "HIGH");
    assert(m["currentState"].get<std::string>() == "ELEVATED");
    assert(m["actionsTaken"]["collect"].get<std::uint64_t>() == 2);
    assert(m["maxStressScore"].get<double>() == 1.3);
    assert(m["averages"]["samples"].get<std::size_t>() == 2);
    assert(!m["sustainedStress"].get<bool>());
    assert(!m["lastStressTime"].is_null());
    assert(m["checks"].get<std::uint64_t>() == 5);

    f.handler->resetMetrics();
    m = f.handler->stressMetrics();
    assert(m["stressEvents"].get<std::uint64_t>() == 0);
    assert(m["actionsTaken"].empty());
    assert(m["maxStressLevel"].get<std::string>() == "ELEVATED");
    assert(m["maxStressScore"].get<double>() == 1.0);
    std::cout << "[OK] stress metrics\n";
}

void testMonitoringLoop() {
    std::cout << "Testing stress handler loop...\n";
    auto cfg = Fixture::defaultConfig();
    cfg.stress.normalCheckInterval = 0.01;
    Fixture f(cfg);
    assert(f.handler->initialize());
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    f.handler->shutdown();
    auto checks = f.handler->stressMetrics()["checks"].get<std::uint64_t>();
    assert(checks >= 2);

    auto disabled = Fixture::defaultConfig();
    disabled.stress.enabled = false;
    Fixture g(disabled);
    assert(g.handler->initialize());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(g.handler->stressMetrics()["checks"].get<std::uint64_t>() == 0);
    std::cout << "[OK] stress handler loop\n";
}

int main() {
    try {
        testScoreBoundaries();
        testElevatedFromCpu();
        testCheckRightAfterDetectorTick();
        testGraduatedEscalation();
        testRecoveryClearsEverything();
        testNonStandardCallbackFailures();
        testPauseOnlyTaskIsSkipped();
        testEmergencyOncePerEpisode();
        testRequestGate();
        testCustomActionsAndInterval();
        testStressMetrics();
        testMonitoringLoop();
        std::cout << "All StressHandler tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "StressHandler test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
