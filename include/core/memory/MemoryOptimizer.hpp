#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/config/GuardConfig.hpp"
#include "core/memory/Clearable.hpp"
#include "core/memory/Reclaimer.hpp"
#include "core/monitor/ResourceDetector.hpp"
#include "core/thread/PeriodicTask.hpp"

namespace resguard {
namespace core {
namespace memory {

enum class OptimizationLevel { Normal, Aggressive };
std::string toString(OptimizationLevel level);
std::optional<OptimizationLevel> parseOptimizationLevel(const std::string& level);

// Результат прохода освобождения памяти
struct CollectionResult {
    bool ran = false;
    double durationMs = 0.0;
    std::size_t itemsReclaimed = 0;
    std::size_t bytesReclaimedEstimate = 0;
    bool wasForced = false;
    std::string reason;               // "not needed", если проход пропущен
    double currentMemoryPercent = 0.0;
    std::string error;

    nlohmann::json toJson() const;
};

struct GrowthRecord {
    std::chrono::steady_clock::time_point timestamp;
    std::uint64_t memoryBytes = 0;
    double growthPercent = 0.0; // Относительно базовой линии
};

struct GrowthReport {
    bool growthDetected = false;
    double currentMb = 0.0;
    double baselineMb = 0.0;
    double growthPercent = 0.0;
    double growthPerHour = 0.0;
    bool consistentGrowth = false;
    double measuredOverSeconds = 0.0;
    double thresholdPercent = 0.0;
    std::string reason; // Непусто, если проверка не выполнена

    nlohmann::json toJson() const;
};

struct OptimizationResult {
    OptimizationLevel level = OptimizationLevel::Normal;
    std::uint64_t savedBytes = 0;
    double savedMb = 0.0;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json toJson() const;
};

struct MemoryLimitResult {
    bool success = false;
    std::size_t limitMb = 0;
    std::string error;

    nlohmann::json toJson() const;
};

// MemoryOptimizer: тюнинг порогов аллокатора, проходы освобождения, очистка кэшей и контроль роста памяти.
// Счетчики метрик приблизительные: relaxed-атомики без общей блокировки.
class MemoryOptimizer {
public:
    using IntrospectionHook = std::function<nlohmann::json()>;

    MemoryOptimizer(const config::GuardConfig& config,
                    std::shared_ptr<monitor::ResourceDetector> detector,
                    std::shared_ptr<IReclaimer> reclaimer = nullptr);
    ~MemoryOptimizer();
    MemoryOptimizer(const MemoryOptimizer&) = delete;
    MemoryOptimizer& operator=(const MemoryOptimizer&) = delete;

    bool initialize(); // Тюнинг порогов, базовая линия, периодический проход
    void shutdown();

    static CollectorThresholds computeThresholds(const config::GcConfig& gc, std::uint64_t totalMemoryBytes);
    CollectorThresholds tunedThresholds() const;

    CollectionResult runCollection(bool force);
    CacheSweepResult clearKnownCaches();
    nlohmann::json reduceReferences();
    GrowthReport checkGrowthTrend();
    OptimizationResult optimize(OptimizationLevel level);
    MemoryLimitResult setMemoryLimit(std::size_t limitMb);

    nlohmann::json metrics() const;
    void resetMetrics();
    std::vector<GrowthRecord> growthHistory() const;

    void registerClearable(const std::shared_ptr<Clearable>& cache);
    void setHostContext(std::shared_ptr<IHostContext> context);
    void setIntrospectionHook(IntrospectionHook hook);

private:
    double currentMemoryPercent() const;
    void updatePeak(std::uint64_t rssBytes);
    std::uint64_t currentRss() const;
    std::chrono::milliseconds periodicDelay() const;

    config::GuardConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<monitor::ResourceDetector> detector_;
    std::shared_ptr<IReclaimer> reclaimer_;
    CacheRegistry caches_;

    mutable std::mutex hookMutex_;
    IntrospectionHook introspectionHook_;

    CollectorThresholds tuned_;
    std::uint64_t baselineBytes_ = 0;
    std::chrono::steady_clock::time_point baselineTime_;
    bool initialized_ = false;

    mutable std::mutex growthMutex_;
    std::deque<GrowthRecord> growthHistory_;

    mutable std::mutex durationsMutex_;
    std::deque<double> recentDurationsMs_;

    std::atomic<std::uint64_t> collections_{0};
    std::atomic<std::uint64_t> itemsReclaimed_{0};
    std::atomic<std::uint64_t> bytesReclaimed_{0};
    std::atomic<std::uint64_t> emergencyCollections_{0};
    std::atomic<std::uint64_t> optimizationsApplied_{0};
    std::atomic<std::uint64_t> memorySavedBytes_{0};
    std::atomic<std::uint64_t> cachesCleared_{0};
    std::atomic<std::uint64_t> peakMemoryBytes_{0};
    std::atomic<std::int64_t> lastCollectionEpochMs_{0};
    std::atomic<std::uint64_t> failures_{0};

    thread::PeriodicTask collectionTask_;
};

} // namespace memory
} // namespace core
} // namespace resguard
