#include "core/memory/MemoryOptimizer.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <numeric>
#include <sys/resource.h>
#include "core/logging/Logging.hpp"

namespace resguard {
namespace core {
namespace memory {

namespace {

constexpr std::size_t kDurationWindow = 10;
constexpr std::size_t kGrowthWindow = 60;
constexpr double kMb = 1024.0 * 1024.0;
constexpr double kGb = 1024.0 * 1024.0 * 1024.0;

constexpr int kDebugCollectionStats = 1;
constexpr int kDebugCacheSweep = 2;

std::int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

std::string toString(OptimizationLevel level) {
    return level == OptimizationLevel::Aggressive ? "aggressive" : "normal";
}

std::optional<OptimizationLevel> parseOptimizationLevel(const std::string& level) {
    if (level == "normal") return OptimizationLevel::Normal;
    if (level == "aggressive") return OptimizationLevel::Aggressive;
    return std::nullopt;
}

nlohmann::json CollectionResult::toJson() const {
    if (ran) {
        return {
            {"ran", true},
            {"durationMs", durationMs},
            {"itemsReclaimed", itemsReclaimed},
            {"bytesReclaimedEstimate", bytesReclaimedEstimate},
            {"wasForced", wasForced}
        };
    }
    if (!error.empty()) {
        return {{"ran", false}, {"error", error}};
    }
    return {{"ran", false}, {"reason", reason}, {"currentMemoryPercent", currentMemoryPercent}};
}

nlohmann::json GrowthReport::toJson() const {
    nlohmann::json j = {
        {"growthDetected", growthDetected},
        {"currentMb", currentMb},
        {"baselineMb", baselineMb},
        {"growthPercent", growthPercent},
        {"growthPerHour", growthPerHour},
        {"consistentGrowth", consistentGrowth},
        {"measuredOverSeconds", measuredOverSeconds},
        {"thresholdPercent", thresholdPercent}
    };
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

nlohmann::json OptimizationResult::toJson() const {
    return {{"level", toString(level)}, {"savedBytes", savedBytes}, {"savedMb", savedMb}, {"details", details}};
}

nlohmann::json MemoryLimitResult::toJson() const {
    nlohmann::json j = {{"success", success}, {"limitMb", limitMb}};
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

MemoryOptimizer::MemoryOptimizer(const config::GuardConfig& config,
                                 std::shared_ptr<monitor::ResourceDetector> detector,
                                 std::shared_ptr<IReclaimer> reclaimer)
    : config_(config),
      logger_(logging::componentLogger("optimizer")),
      detector_(std::move(detector)),
      reclaimer_(std::move(reclaimer)),
      collectionTask_("memory-collection") {
    if (!detector_) {
        detector_ = std::make_shared<monitor::ResourceDetector>(config_);
    }
    if (!reclaimer_) {
        CollectorThresholds defaults{config_.gc.baseTrimThresholdBytes, config_.gc.baseTopPadBytes,
                                     config_.gc.baseMmapThresholdBytes};
        reclaimer_ = std::make_shared<MallocReclaimer>(defaults);
    }
    tuned_ = reclaimer_->thresholds();

    if (config_.gc.tuneThresholds) {
        std::uint64_t total = detector_->systemInfo().totalMemoryBytes;
        if (total == 0) {
            logger_->warn("MemoryOptimizer: объем памяти неизвестен, тюнинг порогов пропущен");
        } else {
            CollectorThresholds computed = computeThresholds(config_.gc, total);
            if (reclaimer_->applyThresholds(computed)) {
                logger_->info("MemoryOptimizer: пороги аллокатора {} -> {}", tuned_.toJson().dump(), computed.toJson().dump());
                tuned_ = computed;
            }
        }
    }

    baselineBytes_ = currentRss();
    baselineTime_ = std::chrono::steady_clock::now();
    updatePeak(baselineBytes_);
    logger_->info("MemoryOptimizer: базовая линия {:.1f} MB", baselineBytes_ / kMb);
}

MemoryOptimizer::~MemoryOptimizer() {
    shutdown();
}

bool MemoryOptimizer::initialize() {
    if (initialized_) {
        return true;
    }
    if (config_.gc.enabled && config_.gc.intervalSeconds > 0.0) {
        collectionTask_.start([this]() {
            runCollection(false);
            checkGrowthTrend();
            return periodicDelay();
        });
        logger_->info("MemoryOptimizer: периодический проход каждые {} с", config_.gc.intervalSeconds);
    }
    initialized_ = true;
    return true;
}

void MemoryOptimizer::shutdown() {
    if (!initialized_) {
        return;
    }
    collectionTask_.stop();
    initialized_ = false;
    logger_->info("MemoryOptimizer: завершение работы");
}

std::chrono::milliseconds MemoryOptimizer::periodicDelay() const {
    return std::chrono::milliseconds(static_cast<long long>(config_.gc.intervalSeconds * 1000.0));
}

CollectorThresholds MemoryOptimizer::computeThresholds(const config::GcConfig& gc, std::uint64_t totalMemoryBytes) {
    double memoryGb = static_cast<double>(totalMemoryBytes) / kGb;
    double factor = std::clamp(memoryGb / gc.referenceMemoryGb, gc.minFactor, gc.maxFactor) * gc.tuneFactor;
    auto scale = [factor](std::size_t base, std::size_t floor) {
        return std::max(floor, static_cast<std::size_t>(static_cast<double>(base) * factor));
    };
    CollectorThresholds t;
    t.trimThreshold = scale(gc.baseTrimThresholdBytes, gc.minTrimThresholdBytes);
    t.topPad = scale(gc.baseTopPadBytes, gc.minTopPadBytes);
    t.mmapThreshold = scale(gc.baseMmapThresholdBytes, gc.minMmapThresholdBytes);
    return t;
}

CollectorThresholds MemoryOptimizer::tunedThresholds() const {
    return tuned_;
}

std::uint64_t MemoryOptimizer::currentRss() const {
    monitor::MemoryProbe probe;
    if (detector_->probeMemory(probe)) {
        return probe.rssBytes;
    }
    auto latest = detector_->latestUsage();
    return latest ? latest->processRssBytes : 0;
}

double MemoryOptimizer::currentMemoryPercent() const {
    monitor::MemoryProbe probe;
    bool system = config_.gc.thresholdBasis == "system";
    if (detector_->probeMemory(probe)) {
        return system ? probe.systemPercent() : probe.processPercent();
    }
    auto latest = detector_->latestUsage();
    if (!latest) return 0.0;
    return system ? latest->memoryPercent : latest->processMemoryPercent;
}

void MemoryOptimizer::updatePeak(std::uint64_t rssBytes) {
    std::uint64_t peak = peakMemoryBytes_.load(std::memory_order_relaxed);
    while (rssBytes > peak && !peakMemoryBytes_.compare_exchange_weak(peak, rssBytes, std::memory_order_relaxed)) {
    }
}

CollectionResult MemoryOptimizer::runCollection(bool force) {
    CollectionResult result;
    result.wasForced = force;
    try {
        result.currentMemoryPercent = currentMemoryPercent();
        if (!force && result.currentMemoryPercent <= config_.gc.thresholdPercent) {
            result.reason = "not needed";
            return result;
        }

        auto start = std::chrono::steady_clock::now();
        ReclaimResult reclaimed = reclaimer_->collect();
        result.durationMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        result.ran = true;
        result.itemsReclaimed = reclaimed.itemsReclaimed;
        result.bytesReclaimedEstimate =
            std::max(reclaimed.bytesReclaimed, reclaimed.itemsReclaimed * config_.gc.estimatedObjectBytes);

        collections_.fetch_add(1, std::memory_order_relaxed);
        itemsReclaimed_.fetch_add(result.itemsReclaimed, std::memory_order_relaxed);
        bytesReclaimed_.fetch_add(result.bytesReclaimedEstimate, std::memory_order_relaxed);
        if (force) {
            emergencyCollections_.fetch_add(1, std::memory_order_relaxed);
        }
        lastCollectionEpochMs_.store(nowEpochMs(), std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(durationsMutex_);
            recentDurationsMs_.push_back(result.durationMs);
            while (recentDurationsMs_.size() > kDurationWindow) {
                recentDurationsMs_.pop_front();
            }
        }
        updatePeak(currentRss());

        if (config_.gc.debugFlags & kDebugCollectionStats) {
            logger_->info("MemoryOptimizer: аллокатор после прохода {}", reclaimer_->stats().toJson().dump());
        }
        logger_->debug("MemoryOptimizer: проход {} мс, блоков {}, ~{} байт{}", result.durationMs,
                       result.itemsReclaimed, result.bytesReclaimedEstimate, force ? " (принудительно)" : "");
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->error("MemoryOptimizer: ошибка прохода освобождения: {}", e.what());
        result = CollectionResult{};
        result.wasForced = force;
        result.error = e.what();
    }
    return result;
}

CacheSweepResult MemoryOptimizer::clearKnownCaches() {
    try {
        CacheSweepResult result = caches_.sweep();
        cachesCleared_.fetch_add(result.cachesCleared, std::memory_order_relaxed);
        if (config_.gc.debugFlags & kDebugCacheSweep) {
            logger_->info("MemoryOptimizer: очищены кэши {}", nlohmann::json(result.cleared).dump());
        }
        return result;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->error("MemoryOptimizer: ошибка очистки кэшей: {}", e.what());
        return CacheSweepResult{};
    }
}

nlohmann::json MemoryOptimizer::reduceReferences() {
    IntrospectionHook hook;
    {
        std::lock_guard<std::mutex> lock(hookMutex_);
        hook = introspectionHook_;
    }
    if (!hook) {
        return {{"available", false}, {"reason", "heap introspection is not available"}};
    }
    try {
        return {{"available", true}, {"details", hook()}};
    } catch (const std::exception& e) {
        logger_->error("MemoryOptimizer: ошибка анализа кучи: {}", e.what());
        return {{"available", true}, {"error", e.what()}};
    }
}

GrowthReport MemoryOptimizer::checkGrowthTrend() {
    GrowthReport report;
    report.thresholdPercent = config_.thresholds.leakPercent;
    report.baselineMb = baselineBytes_ / kMb;
    try {
        std::uint64_t current = currentRss();
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - baselineTime_).count();
        report.currentMb = current / kMb;
        report.measuredOverSeconds = elapsed;
        if (current == 0 || baselineBytes_ == 0) {
            report.reason = "memory data not available";
            return report;
        }
        if (elapsed <= 0.0) {
            report.reason = "insufficient time data";
            return report;
        }

        report.growthPercent = (static_cast<double>(current) - static_cast<double>(baselineBytes_)) /
                               static_cast<double>(baselineBytes_) * 100.0;
        report.growthPerHour = report.growthPercent / elapsed * 3600.0;
        updatePeak(current);

        std::lock_guard<std::mutex> lock(growthMutex_);
        growthHistory_.push_back(GrowthRecord{now, current, report.growthPercent});
        while (growthHistory_.size() > kGrowthWindow) {
            growthHistory_.pop_front();
        }
        // Три последние точки: положительный рост и строго возрастающая память
        std::size_t n = growthHistory_.size();
        if (n >= 3) {
            const auto& a = growthHistory_[n - 3];
            const auto& b = growthHistory_[n - 2];
            const auto& c = growthHistory_[n - 1];
            report.consistentGrowth = a.growthPercent > 0.0 && b.growthPercent > 0.0 && c.growthPercent > 0.0 &&
                                      b.memoryBytes > a.memoryBytes && c.memoryBytes > b.memoryBytes;
        }
        report.growthDetected = report.growthPerHour > report.thresholdPercent && report.consistentGrowth;
        if (report.growthDetected) {
            logger_->warn("MemoryOptimizer: устойчивый рост памяти {:.1f}%/ч ({:.1f} -> {:.1f} MB)",
                          report.growthPerHour, report.baselineMb, report.currentMb);
        }
    } catch (const std::exception& e) {
        logger_->error("MemoryOptimizer: ошибка проверки роста памяти: {}", e.what());
        report.reason = e.what();
    }
    return report;
}

OptimizationResult MemoryOptimizer::optimize(OptimizationLevel level) {
    OptimizationResult result;
    result.level = level;
    try {
        std::uint64_t before = currentRss();
        result.details["collection"] = runCollection(true).toJson();
        result.details["caches"] = clearKnownCaches().toJson();
        if (level == OptimizationLevel::Aggressive) {
            result.details["references"] = reduceReferences();
            bool released = reclaimer_->trim();
            result.details["trim"] = {{"supported", reclaimer_->stats().available}, {"released", released}};
        }
        std::uint64_t after = currentRss();
        result.savedBytes = before > after ? before - after : 0;
        result.savedMb = result.savedBytes / kMb;
        optimizationsApplied_.fetch_add(1, std::memory_order_relaxed);
        memorySavedBytes_.fetch_add(result.savedBytes, std::memory_order_relaxed);
        logger_->info("MemoryOptimizer: оптимизация '{}' освободила {:.2f} MB", toString(level), result.savedMb);
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->error("MemoryOptimizer: ошибка оптимизации '{}': {}", toString(level), e.what());
        result.details["error"] = e.what();
    }
    return result;
}

MemoryLimitResult MemoryOptimizer::setMemoryLimit(std::size_t limitMb) {
    MemoryLimitResult result;
    result.limitMb = limitMb;
    if (limitMb == 0) {
        result.error = "limit must be positive";
        return result;
    }
#if defined(RLIMIT_AS)
    struct rlimit current {};
    if (::getrlimit(RLIMIT_AS, &current) != 0) {
        result.error = std::strerror(errno);
        logger_->error("MemoryOptimizer: getrlimit: {}", result.error);
        return result;
    }
    rlim_t bytes = static_cast<rlim_t>(limitMb) * 1024 * 1024;
    if (current.rlim_max != RLIM_INFINITY && bytes > current.rlim_max) {
        result.error = "limit exceeds hard limit";
        return result;
    }
    // Меняется только мягкий лимит: снижение жесткого необратимо без привилегий
    struct rlimit next = current;
    next.rlim_cur = bytes;
    if (::setrlimit(RLIMIT_AS, &next) != 0) {
        result.error = std::strerror(errno);
        logger_->error("MemoryOptimizer: setrlimit: {}", result.error);
        return result;
    }
    result.success = true;
    logger_->info("MemoryOptimizer: лимит адресного пространства {} MB", limitMb);
#else
    result.error = "address-space limits are not supported on this platform";
#endif
    return result;
}

nlohmann::json MemoryOptimizer::metrics() const {
    double averageMs = 0.0;
    {
        std::lock_guard<std::mutex> lock(durationsMutex_);
        if (!recentDurationsMs_.empty()) {
            averageMs = std::accumulate(recentDurationsMs_.begin(), recentDurationsMs_.end(), 0.0) /
                        static_cast<double>(recentDurationsMs_.size());
        }
    }
    std::int64_t last = lastCollectionEpochMs_.load(std::memory_order_relaxed);
    return {
        {"collections", collections_.load(std::memory_order_relaxed)},
        {"objectsCollected", itemsReclaimed_.load(std::memory_order_relaxed)},
        {"bytesReclaimedEstimate", bytesReclaimed_.load(std::memory_order_relaxed)},
        {"emergencyCollections", emergencyCollections_.load(std::memory_order_relaxed)},
        {"optimizationsApplied", optimizationsApplied_.load(std::memory_order_relaxed)},
        {"memorySavedBytes", memorySavedBytes_.load(std::memory_order_relaxed)},
        {"cachesCleared", cachesCleared_.load(std::memory_order_relaxed)},
        {"peakMemoryBytes", peakMemoryBytes_.load(std::memory_order_relaxed)},
        {"lastCollectionTime", last ? nlohmann::json(last) : nlohmann::json(nullptr)},
        {"averageCollectionTimeMs", averageMs},
        {"failures", failures_.load(std::memory_order_relaxed)},
        {"registeredCaches", caches_.size()},
        {"baselineMb", baselineBytes_ / kMb},
        {"thresholds", tuned_.toJson()},
        {"allocator", reclaimer_->stats().toJson()}
    };
}

void MemoryOptimizer::resetMetrics() {
    collections_ = 0;
    itemsReclaimed_ = 0;
    bytesReclaimed_ = 0;
    emergencyCollections_ = 0;
    optimizationsApplied_ = 0;
    memorySavedBytes_ = 0;
    cachesCleared_ = 0;
    peakMemoryBytes_ = 0;
    lastCollectionEpochMs_ = 0;
    failures_ = 0;
    std::lock_guard<std::mutex> lock(durationsMutex_);
    recentDurationsMs_.clear();
    logger_->info("MemoryOptimizer: метрики сброшены");
}

std::vector<GrowthRecord> MemoryOptimizer::growthHistory() const {
    std::lock_guard<std::mutex> lock(growthMutex_);
    return std::vector<GrowthRecord>(growthHistory_.begin(), growthHistory_.end());
}

void MemoryOptimizer::registerClearable(const std::shared_ptr<Clearable>& cache) {
    caches_.registerClearable(cache);
}

void MemoryOptimizer::setHostContext(std::shared_ptr<IHostContext> context) {
    caches_.setHostContext(std::move(context));
}

void MemoryOptimizer::setIntrospectionHook(IntrospectionHook hook) {
    std::lock_guard<std::mutex> lock(hookMutex_);
    introspectionHook_ = std::move(hook);
}

} // namespace memory
} // namespace core
} // namespace resguard
