#include "core/stress/StressHandler.hpp"
#include <algorithm>
#include <numeric>

namespace resguard {
namespace core {
namespace stress {

namespace {

constexpr std::size_t kComponentWindow = 60;
constexpr double kMinRateWindowSeconds = 0.5;
constexpr const char* kOverloadMessage = "Service temporarily unavailable due to high load";
constexpr const char* kThrottleMessage = "Too many requests, throttled due to high load";

double secondsSince(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - tp).count();
}

} // namespace

StressHandler::StressHandler(const config::GuardConfig& config,
                             std::shared_ptr<monitor::ResourceDetector> detector,
                             std::shared_ptr<memory::MemoryOptimizer> optimizer,
                             std::shared_ptr<memory::PatternCache> patterns)
    : config_(config),
      logger_(logging::componentLogger("stress")),
      detector_(std::move(detector)),
      optimizer_(std::move(optimizer)),
      patterns_(std::move(patterns)),
      throttle_(config.stress.throttleRequestsPerSecond),
      loop_("stress-handler") {
    if (!detector_) {
        detector_ = std::make_shared<monitor::ResourceDetector>(config_);
    }
    if (!optimizer_) {
        optimizer_ = std::make_shared<memory::MemoryOptimizer>(config_, detector_);
    }
    if (!patterns_) {
        patterns_ = std::make_shared<memory::PatternCache>();
    }
    auto now = std::chrono::steady_clock::now();
    stateEnteredAt_ = now;
    stressStartedAt_ = now;
    emergencyTimerAt_ = now;
    registerBuiltinActions();
}

StressHandler::~StressHandler() {
    shutdown();
}

void StressHandler::registerBuiltinActions() {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_[actions::kReduceLogging] = [this]() { return logGuard_.reduce(); };
    handlers_[actions::kPauseBackground] = [this]() { return tasks_.pauseAll().affected > 0; };
    handlers_[actions::kOptimizeMemory] = [this]() {
        optimizer_->optimize(memory::OptimizationLevel::Normal);
        return true;
    };
    handlers_[actions::kCircuitBreak] = [this]() { return breaker_.activate(); };
    handlers_[actions::kThrottleRequests] = [this]() {
        throttle_.enable();
        return true;
    };
}

bool StressHandler::initialize() {
    if (!config_.stress.enabled) {
        logger_->info("StressHandler: обработка нагрузки отключена конфигурацией");
        return true;
    }
    if (loop_.isRunning()) {
        logger_->warn("StressHandler: цикл уже запущен");
        return true;
    }
    bool started = loop_.start([this]() {
        checkOnce();
        return nextCheckInterval();
    });
    if (started) {
        logger_->info("StressHandler: цикл запущен (normal={} с, stress={} с)",
                      config_.stress.normalCheckInterval, config_.stress.stressCheckInterval);
    }
    return started;
}

void StressHandler::shutdown() {
    if (loop_.isRunning()) {
        loop_.stop();
        logger_->info("StressHandler: цикл остановлен");
    }
}

StressComponents StressHandler::computeComponents(const monitor::ResourceUsage& usage) const {
    StressComponents c;
    const auto& s = config_.stress;
    c.cpu = s.cpuThresholdPercent > 0.0 ? usage.cpuPercent / s.cpuThresholdPercent : 0.0;
    c.memory = config_.thresholds.warningPercent > 0.0 ? usage.memoryPercent / config_.thresholds.warningPercent : 0.0;
    c.network = s.networkThresholdMBs > 0.0 ? usage.networkMBps() / s.networkThresholdMBs : 0.0;
    return c;
}

double StressHandler::computeScore(const monitor::ResourceUsage& usage) const {
    return computeComponents(usage).score();
}

StressState StressHandler::checkOnce() {
    try {
        monitor::ResourceUsage usage;
        {
            std::lock_guard<std::mutex> lock(transitionMutex_);
            usage = detector_->usageSince(baseline_, kMinRateWindowSeconds);
        }
        return evaluate(usage);
    } catch (const std::exception& e) {
        logger_->error("StressHandler: ошибка проверки нагрузки: {}", e.what());
        return currentState();
    }
}

StressState StressHandler::evaluate(const monitor::ResourceUsage& usage) {
    StressComponents components = computeComponents(usage);
    return transition(components.score(), components);
}

StressState StressHandler::handleScore(double score) {
    return transition(score, std::nullopt);
}

StressState StressHandler::transition(double score, const std::optional<StressComponents>& components) {
    std::lock_guard<std::mutex> lock(transitionMutex_);
    checks_.fetch_add(1, std::memory_order_relaxed);
    StressState previous = state_.load();
    StressState next = scoreToState(score);
    score_ = score;
    {
        std::lock_guard<std::mutex> mlock(metricsMutex_);
        maxStressScore_ = std::max(maxStressScore_, score);
    }
    auto now = std::chrono::steady_clock::now();

    if (components) {
        std::lock_guard<std::mutex> mlock(metricsMutex_);
        window_.push_back(*components);
        while (window_.size() > kComponentWindow) {
            window_.pop_front();
        }
    }

    std::vector<std::string> executed;
    if (next != StressState::Normal) {
        if (previous == StressState::Normal) {
            stressEvents_.fetch_add(1, std::memory_order_relaxed);
            std::lock_guard<std::mutex> mlock(metricsMutex_);
            stressStartedAt_ = now;
            emergencyTimerAt_ = now;
            lastStressTime_ = std::chrono::system_clock::now();
            logger_->warn("StressHandler: обнаружена нагрузка, оценка {:.3f} -> {}", score, toString(next));
        }
        {
            std::lock_guard<std::mutex> mlock(metricsMutex_);
            ++episodeChecks_;
            if (next > maxStressLevel_) maxStressLevel_ = next;
            if (next != previous) stateEnteredAt_ = now;
        }
        state_ = next;

        if (next > previous) {
            if (previous != StressState::Normal) {
                logger_->warn("StressHandler: эскалация {} -> {} (оценка {:.3f})", toString(previous), toString(next), score);
            }
            executed = escalate(next);
        }

        std::chrono::steady_clock::time_point timerStart;
        {
            std::lock_guard<std::mutex> mlock(metricsMutex_);
            timerStart = emergencyTimerAt_;
        }
        double maxStress = config_.stress.maxStressTime;
        if (maxStress > 0.0 && std::chrono::duration<double>(now - timerStart).count() > maxStress) {
            runEmergency();
            executed.push_back("emergency");
            std::lock_guard<std::mutex> mlock(metricsMutex_);
            // Повторная эскалация возможна только после нового полного интервала
            emergencyTimerAt_ = std::chrono::steady_clock::now();
        }
    } else if (previous != StressState::Normal) {
        state_ = StressState::Normal;
        executed = recover();
        std::lock_guard<std::mutex> mlock(metricsMutex_);
        stateEnteredAt_ = now;
    }

    std::lock_guard<std::mutex> mlock(metricsMutex_);
    lastActions_ = executed;
    return next;
}

bool StressHandler::isConfigured(const std::string& name) const {
    const auto& list = config_.stress.stressActions;
    return std::find(list.begin(), list.end(), name) != list.end();
}

void StressHandler::countAction(const std::string& name) {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    ++actionsTaken_[name];
}

bool StressHandler::runAction(const std::string& name, std::vector<std::string>& executed) {
    ActionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(name);
        if (it != handlers_.end()) handler = it->second;
    }
    if (!handler) {
        logger_->warn("StressHandler: для действия '{}' нет обработчика", name);
        return false;
    }
    try {
        if (!handler()) {
            return false;
        }
        executed.push_back(name);
        countAction(name);
        logger_->warn("StressHandler: выполнено действие '{}'", name);
        return true;
    } catch (const std::exception& e) {
        logger_->error("StressHandler: ошибка действия '{}': {}", name, e.what());
        return false;
    } catch (...) {
        logger_->error("StressHandler: неизвестная ошибка действия '{}'", name);
        return false;
    }
}

std::vector<std::string> StressHandler::escalate(StressState target) {
    std::vector<std::string> executed;
    switch (target) {
        case StressState::Elevated:
            if (isConfigured(actions::kReduceLogging)) runAction(actions::kReduceLogging, executed);
            {
                memory::CollectionResult pass = optimizer_->runCollection(false);
                executed.push_back(actions::kCollect);
                countAction(actions::kCollect);
                logger_->debug("StressHandler: проход освобождения {}", pass.toJson().dump());
            }
            break;
        case StressState::High:
            if (isConfigured(actions::kPauseBackground)) runAction(actions::kPauseBackground, executed);
            if (isConfigured(actions::kOptimizeMemory)) runAction(actions::kOptimizeMemory, executed);
            break;
        case StressState::Critical: {
            std::vector<std::string> attempted;
            for (const char* name : {actions::kCircuitBreak, actions::kThrottleRequests}) {
                if (isConfigured(name)) {
                    runAction(name, executed);
                    attempted.emplace_back(name);
                }
            }
            for (const auto& name : config_.stress.stressActions) {
                if (std::find(attempted.begin(), attempted.end(), name) != attempted.end()) continue;
                attempted.push_back(name);
                runAction(name, executed);
            }
            break;
        }
        case StressState::Normal:
            break;
    }
    return executed;
}

std::vector<std::string> StressHandler::recover() {
    std::vector<std::string> executed;
    if (breaker_.deactivate()) executed.push_back("circuit_reset");
    TaskSweepResult resumed = tasks_.resumeAll();
    if (resumed.affected > 0 || resumed.failed > 0) executed.push_back("resume_background");
    if (logGuard_.restore()) executed.push_back("restore_logging");
    if (throttle_.isEnabled()) {
        throttle_.disable();
        executed.push_back("throttle_off");
    }
    for (const auto& name : executed) {
        countAction(name);
    }

    double episode = 0.0;
    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        episode = secondsSince(stressStartedAt_);
        totalStressSeconds_ += episode;
        episodeChecks_ = 0;
        episodeEmergencies_ = 0;
    }
    logger_->warn("StressHandler: нагрузка снята после {:.1f} с", episode);
    return executed;
}

void StressHandler::runEmergency() {
    emergencyEscalations_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        ++episodeEmergencies_;
    }
    countAction("emergency");
    logger_->critical("StressHandler: нагрузка дольше {} с, аварийная оптимизация", config_.stress.maxStressTime);
    try {
        optimizer_->optimize(memory::OptimizationLevel::Aggressive);
    } catch (const std::exception& e) {
        logger_->error("StressHandler: ошибка аварийной оптимизации: {}", e.what());
    } catch (...) {
        logger_->error("StressHandler: неизвестная ошибка аварийной оптимизации");
    }
    breaker_.activate();
}

StressState StressHandler::currentState() const {
    return state_.load();
}

double StressHandler::currentScore() const {
    return score_.load();
}

std::chrono::milliseconds StressHandler::nextCheckInterval() const {
    double seconds = currentState() == StressState::Normal ? config_.stress.normalCheckInterval
                                                           : config_.stress.stressCheckInterval;
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

bool StressHandler::registerBackgroundTask(const std::string& name, std::function<void()> pause,
                                           std::function<void()> resume, bool isCritical) {
    return tasks_.registerTask(name, std::move(pause), std::move(resume), isCritical);
}

void StressHandler::registerActionHandler(const std::string& name, ActionHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_[name] = std::move(handler);
    logger_->info("StressHandler: зарегистрирован обработчик действия '{}'", name);
}

void StressHandler::attachTo(IRequestPipeline& pipeline) {
    pipeline.addPreRequestGate([this](const RequestContext& request) { return admitRequest(request); });
    logger_->info("StressHandler: шлюз запросов установлен");
}

bool StressHandler::isCriticalEndpoint(const RequestContext& request) const {
    for (const auto& pattern : config_.stress.criticalEndpoints) {
        if (patterns_->matches(pattern, request.endpoint) || patterns_->matches(pattern, request.path)) {
            return true;
        }
    }
    return false;
}

GateDecision StressHandler::admitRequest(const RequestContext& request) {
    if (currentState() == StressState::Normal) {
        return GateDecision::allow();
    }
    if (isCriticalEndpoint(request)) {
        return GateDecision::allow();
    }
    if (breaker_.isActive()) {
        rejectedRequests_.fetch_add(1, std::memory_order_relaxed);
        return GateDecision::reject(503, kOverloadMessage);
    }
    if (!throttle_.tryAcquire()) {
        throttledRequests_.fetch_add(1, std::memory_order_relaxed);
        return GateDecision::reject(429, kThrottleMessage);
    }
    return GateDecision::allow();
}

std::vector<std::string> StressHandler::lastActions() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastActions_;
}

nlohmann::json StressHandler::stressMetrics() const {
    StressState state = currentState();
    nlohmann::json j;
    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        StressComponents avg;
        if (!window_.empty()) {
            for (const auto& c : window_) {
                avg.cpu += c.cpu;
                avg.memory += c.memory;
                avg.network += c.network;
            }
            double n = static_cast<double>(window_.size());
            avg.cpu /= n;
            avg.memory /= n;
            avg.network /= n;
        }
        double episode = state == StressState::Normal ? 0.0 : secondsSince(stressStartedAt_);
        j["stateDurationSeconds"] = secondsSince(stateEnteredAt_);
        j["currentEpisodeSeconds"] = episode;
        j["totalStressTimeSeconds"] = totalStressSeconds_;
        j["sustainedStress"] = state != StressState::Normal && episode >= config_.stress.stressDurationSeconds;
        j["maxStressLevel"] = toString(maxStressLevel_);
        j["maxStressScore"] = maxStressScore_;
        j["actionsTaken"] = actionsTaken_;
        j["lastActions"] = lastActions_;
        j["episodeChecks"] = episodeChecks_;
        j["episodeEmergencies"] = episodeEmergencies_;
        j["lastStressTime"] = lastStressTime_
            ? nlohmann::json(monitor::toEpochMillis(*lastStressTime_)) : nlohmann::json(nullptr);
        j["averages"] = {{"cpu", avg.cpu}, {"memory", avg.memory}, {"network", avg.network},
                         {"samples", window_.size()}};
    }
    j["currentState"] = toString(state);
    j["currentScore"] = currentScore();
    j["stressEvents"] = stressEvents_.load(std::memory_order_relaxed);
    j["emergencyEscalations"] = emergencyEscalations_.load(std::memory_order_relaxed);
    j["checks"] = checks_.load(std::memory_order_relaxed);
    j["circuitBreaker"] = breaker_.toJson();
    j["circuitBreakerTrips"] = breaker_.trips();
    j["throttling"] = throttle_.isEnabled();
    j["rejectedRequests"] = rejectedRequests_.load(std::memory_order_relaxed);
    j["throttledRequests"] = throttledRequests_.load(std::memory_order_relaxed);
    j["loggingReduced"] = logGuard_.isReduced();
    j["checkIntervalSeconds"] = nextCheckInterval().count() / 1000.0;
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& task : tasks_.tasks()) {
        tasks.push_back(task.toJson());
    }
    j["backgroundTasks"] = tasks;
    j["pausedTasks"] = tasks_.pausedCount();
    return j;
}

void StressHandler::resetMetrics() {
    stressEvents_ = 0;
    emergencyEscalations_ = 0;
    rejectedRequests_ = 0;
    throttledRequests_ = 0;
    checks_ = 0;
    breaker_.resetTrips();
    std::lock_guard<std::mutex> lock(metricsMutex_);
    actionsTaken_.clear();
    totalStressSeconds_ = 0.0;
    maxStressLevel_ = currentState();
    maxStressScore_ = currentScore();
    lastStressTime_.reset();
    window_.clear();
    logger_->info("StressHandler: метрики сброшены");
}

} // namespace stress
} // namespace core
} // namespace resguard
