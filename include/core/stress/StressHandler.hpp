#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/config/GuardConfig.hpp"
#include "core/logging/Logging.hpp"
#include "core/memory/MemoryOptimizer.hpp"
#include "core/memory/PatternCache.hpp"
#include "core/monitor/ResourceDetector.hpp"
#include "core/stress/BackgroundTaskRegistry.hpp"
#include "core/stress/CircuitBreaker.hpp"
#include "core/stress/RequestPipeline.hpp"
#include "core/stress/StressTypes.hpp"
#include "core/thread/PeriodicTask.hpp"

namespace resguard {
namespace core {
namespace stress {

// StressHandler: цикл классификации нагрузки (оценка, конечный автомат состояний,
// ступенчатые действия, выключатель запросов и реестр фоновых задач).
// Состояние меняется только через пересчет оценки.
class StressHandler {
public:
    using ActionHandler = std::function<bool()>; // true, если действие выполнено

    StressHandler(const config::GuardConfig& config,
                  std::shared_ptr<monitor::ResourceDetector> detector,
                  std::shared_ptr<memory::MemoryOptimizer> optimizer,
                  std::shared_ptr<memory::PatternCache> patterns = nullptr);
    ~StressHandler();
    StressHandler(const StressHandler&) = delete;
    StressHandler& operator=(const StressHandler&) = delete;

    bool initialize(); // Запуск цикла, если stress.enabled
    void shutdown();

    StressComponents computeComponents(const monitor::ResourceUsage& usage) const;
    double computeScore(const monitor::ResourceUsage& usage) const;
    StressState checkOnce();                                   // Снимок от своей базы и переход
    StressState evaluate(const monitor::ResourceUsage& usage); // Переход по готовому снимку
    StressState handleScore(double score);                     // Переход по готовой оценке

    StressState currentState() const;
    double currentScore() const;
    std::chrono::milliseconds nextCheckInterval() const;

    bool registerBackgroundTask(const std::string& name, std::function<void()> pause,
                                std::function<void()> resume, bool isCritical = false);
    void registerActionHandler(const std::string& name, ActionHandler handler);

    // Шлюз хранит указатель на this: конвейер не должен пережить обработчик
    void attachTo(IRequestPipeline& pipeline);
    GateDecision admitRequest(const RequestContext& request);
    bool isCriticalEndpoint(const RequestContext& request) const;

    std::vector<std::string> lastActions() const; // Действия последнего перехода
    nlohmann::json stressMetrics() const;
    void resetMetrics();

    const CircuitBreaker& circuitBreaker() const { return breaker_; }
    const BackgroundTaskRegistry& backgroundTasks() const { return tasks_; }
    bool isThrottling() const { return throttle_.isEnabled(); }
    bool isLoggingReduced() const { return logGuard_.isReduced(); }

private:
    StressState transition(double score, const std::optional<StressComponents>& components);
    std::vector<std::string> escalate(StressState target);
    std::vector<std::string> recover();
    void runEmergency();
    bool runAction(const std::string& name, std::vector<std::string>& executed);
    bool isConfigured(const std::string& name) const;
    void countAction(const std::string& name);
    void registerBuiltinActions();

    config::GuardConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<monitor::ResourceDetector> detector_;
    std::shared_ptr<memory::MemoryOptimizer> optimizer_;
    std::shared_ptr<memory::PatternCache> patterns_;

    CircuitBreaker breaker_;
    RequestThrottle throttle_;
    BackgroundTaskRegistry tasks_;
    logging::LogVerbosityGuard logGuard_;

    mutable std::mutex handlersMutex_;
    std::map<std::string, ActionHandler> handlers_;

    std::mutex transitionMutex_; // Сериализует переходы
    std::optional<monitor::RawCounters> baseline_; // База разностей проверок, под transitionMutex_
    std::atomic<StressState> state_{StressState::Normal};
    std::atomic<double> score_{0.0};
    std::chrono::steady_clock::time_point stateEnteredAt_;
    std::chrono::steady_clock::time_point stressStartedAt_;   // Начало эпизода для учета времени
    std::chrono::steady_clock::time_point emergencyTimerAt_;  // Сбрасывается аварийной эскалацией

    mutable std::mutex metricsMutex_;
    std::deque<StressComponents> window_;
    std::map<std::string, std::uint64_t> actionsTaken_;
    std::vector<std::string> lastActions_;
    StressState maxStressLevel_ = StressState::Normal;
    double maxStressScore_ = 0.0;
    double totalStressSeconds_ = 0.0;
    std::optional<std::chrono::system_clock::time_point> lastStressTime_;
    std::uint64_t episodeChecks_ = 0;
    std::uint64_t episodeEmergencies_ = 0;

    std::atomic<std::uint64_t> stressEvents_{0};
    std::atomic<std::uint64_t> emergencyEscalations_{0};
    std::atomic<std::uint64_t> rejectedRequests_{0};
    std::atomic<std::uint64_t> throttledRequests_{0};
    std::atomic<std::uint64_t> checks_{0};

    thread::PeriodicTask loop_;
};

} // namespace stress
} // namespace core
} // namespace resguard
