#include "core/manager/PressureManager.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <spdlog/spdlog.h>
#include "core/memory/PatternCache.hpp"

namespace resguard {
namespace core {
namespace manager {

namespace {

constexpr std::size_t kStatusSpikes = 5;

std::string sha256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

} // namespace

struct PressureManager::Impl {
    config::GuardConfig config;
    std::shared_ptr<monitor::ResourceDetector> detector;
    std::shared_ptr<memory::PatternCache> patterns;
    std::shared_ptr<memory::MemoryOptimizer> optimizer;
    std::shared_ptr<stress::StressHandler> stress;
    std::atomic<bool> running{false};
    mutable std::mutex growthMutex;
    std::optional<memory::GrowthReport> lastGrowth;

    Impl(const config::GuardConfig& cfg,
         std::shared_ptr<monitor::ICounterSource> source,
         std::shared_ptr<memory::IReclaimer> reclaimer)
        : config(cfg) {
        if (!config.validate()) {
            spdlog::warn("PressureManager: конфигурация не прошла проверку, используются значения по умолчанию");
            config = config::GuardConfig{};
        }
        detector = std::make_shared<monitor::ResourceDetector>(config, std::move(source));
        patterns = std::make_shared<memory::PatternCache>();
        optimizer = std::make_shared<memory::MemoryOptimizer>(config, detector, std::move(reclaimer));
        optimizer->registerClearable(patterns);
        stress = std::make_shared<stress::StressHandler>(config, detector, optimizer, patterns);
    }
};

PressureManager::PressureManager(const config::GuardConfig& config,
                                 std::shared_ptr<monitor::ICounterSource> source,
                                 std::shared_ptr<memory::IReclaimer> reclaimer)
    : pImpl(std::make_unique<Impl>(config, std::move(source), std::move(reclaimer))) {}

PressureManager::~PressureManager() {
    stop();
}

bool PressureManager::start() {
    if (pImpl->running) {
        spdlog::warn("PressureManager: уже запущен");
        return true;
    }
    try {
        if (!pImpl->detector->startMonitoring()) {
            spdlog::error("PressureManager: не удалось запустить мониторинг");
            return false;
        }
        pImpl->optimizer->initialize();
        pImpl->stress->initialize();
        pImpl->running = true;
        spdlog::info("PressureManager: запущен");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("PressureManager: ошибка запуска: {}", e.what());
        stop();
        return false;
    }
}

void PressureManager::stop() {
    if (!pImpl) return;
    pImpl->stress->shutdown();
    pImpl->optimizer->shutdown();
    pImpl->detector->stopMonitoring();
    if (pImpl->running.exchange(false)) {
        spdlog::info("PressureManager: остановлен");
    }
}

bool PressureManager::isRunning() const {
    return pImpl->running;
}

bool PressureManager::registerBackgroundTask(const std::string& name, std::function<void()> pause,
                                             std::function<void()> resume, bool isCritical) {
    return pImpl->stress->registerBackgroundTask(name, std::move(pause), std::move(resume), isCritical);
}

void PressureManager::registerClearable(const std::shared_ptr<memory::Clearable>& cache) {
    pImpl->optimizer->registerClearable(cache);
}

void PressureManager::setHostContext(std::shared_ptr<memory::IHostContext> context) {
    pImpl->optimizer->setHostContext(std::move(context));
}

void PressureManager::attachRequestPipeline(stress::IRequestPipeline& pipeline) {
    pImpl->stress->attachTo(pipeline);
}

nlohmann::json PressureManager::currentStatus() const {
    const auto& detector = *pImpl->detector;
    auto latest = detector.latestUsage();
    auto memory = detector.detectMemoryPressure();
    auto cpu = detector.detectCpuPressure();
    monitor::MemoryProbe probe;
    bool probed = detector.probeMemory(probe);

    nlohmann::json status;
    status["timestamp"] = monitor::toEpochMillis(std::chrono::system_clock::now());
    status["running"] = isRunning();
    status["memory"] = {
        {"processMb", probed ? probe.rssBytes / (1024.0 * 1024.0)
                             : (latest ? latest->processRssBytes / (1024.0 * 1024.0) : 0.0)},
        {"processPercent", probed ? probe.processPercent() : (latest ? latest->processMemoryPercent : 0.0)},
        {"systemPercent", memory.value},
        {"underPressure", memory.underPressure},
        {"level", monitor::toString(detector.memoryPressureLevel())}
    };
    status["cpu"] = {{"percent", cpu.value}, {"underPressure", cpu.underPressure}};
    const auto& stress = *pImpl->stress;
    status["stress"] = {
        {"state", stress::toString(stress.currentState())},
        {"score", stress.currentScore()},
        {"circuitBreakerActive", stress.circuitBreaker().isActive()},
        {"throttling", stress.isThrottling()}
    };
    {
        std::lock_guard<std::mutex> lock(pImpl->growthMutex);
        status["growth"] = pImpl->lastGrowth ? pImpl->lastGrowth->toJson() : nlohmann::json(nullptr);
    }
    auto spikes = detector.memorySpikes();
    nlohmann::json recent = nlohmann::json::array();
    std::size_t from = spikes.size() > kStatusSpikes ? spikes.size() - kStatusSpikes : 0;
    for (std::size_t i = from; i < spikes.size(); ++i) {
        recent.push_back(spikes[i].toJson());
    }
    status["recentSpikes"] = recent;
    return status;
}

nlohmann::json PressureManager::systemFacts() const {
    nlohmann::json j = pImpl->detector->summary();
    return j;
}

nlohmann::json PressureManager::usageHistory(std::size_t minutes) const {
    std::chrono::seconds duration(static_cast<long long>(minutes) * 60);
    nlohmann::json samples = nlohmann::json::array();
    for (const auto& usage : pImpl->detector->historicalUsage(duration)) {
        samples.push_back(usage.toJson());
    }
    return {
        {"minutes", minutes},
        {"samples", samples},
        {"summary", pImpl->detector->historySummary(duration)}
    };
}

nlohmann::json PressureManager::growthReport() {
    memory::GrowthReport report = pImpl->optimizer->checkGrowthTrend();
    {
        std::lock_guard<std::mutex> lock(pImpl->growthMutex);
        pImpl->lastGrowth = report;
    }
    nlohmann::json j = report.toJson();
    j["historyPoints"] = pImpl->optimizer->growthHistory().size();
    return j;
}

nlohmann::json PressureManager::metrics() const {
    return {
        {"optimizer", pImpl->optimizer->metrics()},
        {"stress", pImpl->stress->stressMetrics()},
        {"detector", {
            {"historySize", pImpl->detector->historySize()},
            {"historyCapacity", pImpl->detector->historyCapacity()},
            {"failedSamples", pImpl->detector->failedSamples()},
            {"memorySpikes", pImpl->detector->memorySpikes().size()}
        }}
    };
}

nlohmann::json PressureManager::optimize(const std::string& level) {
    auto parsed = memory::parseOptimizationLevel(level);
    if (!parsed) {
        return {{"error", "invalid optimization level"}, {"validLevels", {"normal", "aggressive"}}};
    }
    return pImpl->optimizer->optimize(*parsed).toJson();
}

nlohmann::json PressureManager::setMemoryLimit(std::size_t limitMb) {
    return pImpl->optimizer->setMemoryLimit(limitMb).toJson();
}

void PressureManager::resetMetrics() {
    pImpl->optimizer->resetMetrics();
    pImpl->stress->resetMetrics();
}

bool PressureManager::authorizeManagement(const std::string& token) const {
    const auto& api = pImpl->config.api;
    if (!api.enabled || !api.managementEndpoints) {
        return false;
    }
    if (api.authToken.empty()) {
        return true;
    }
    // Сравнение дайджестов фиксированной длины за постоянное время
    std::string expected = sha256(api.authToken);
    std::string presented = sha256(token);
    return CRYPTO_memcmp(expected.data(), presented.data(), SHA256_DIGEST_LENGTH) == 0;
}

const config::GuardConfig& PressureManager::configuration() const {
    return pImpl->config;
}

std::shared_ptr<monitor::ResourceDetector> PressureManager::detector() const {
    return pImpl->detector;
}

std::shared_ptr<memory::MemoryOptimizer> PressureManager::optimizer() const {
    return pImpl->optimizer;
}

std::shared_ptr<stress::StressHandler> PressureManager::stressHandler() const {
    return pImpl->stress;
}

} // namespace manager
} // namespace core
} // namespace resguard
