#include "core/monitor/ResourceDetector.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace monitor {

namespace {

constexpr std::size_t kMaxSpikes = 50;
constexpr double kMb = 1024.0 * 1024.0;

// Счетчики могут обнулиться (переполнение, перезапуск интерфейса)
double counterDelta(std::uint64_t current, std::uint64_t previous) {
    return current >= previous ? static_cast<double>(current - previous) : 0.0;
}

double busyPercent(const CpuTimes& current, const CpuTimes& previous) {
    double total = counterDelta(current.total(), previous.total());
    if (total <= 0.0) return 0.0;
    double busy = counterDelta(current.busy(), previous.busy());
    return std::clamp(100.0 * busy / total, 0.0, 100.0);
}

// Скорости из снимка с полноценным окном, объемы остаются свежими
void copyRates(const ResourceUsage& from, ResourceUsage& to) {
    to.cpuPercent = from.cpuPercent;
    if (from.perCpuPercent.size() == to.perCpuPercent.size()) {
        to.perCpuPercent = from.perCpuPercent;
    }
    to.processCpuPercent = from.processCpuPercent;
    to.diskReadBytesPerSec = from.diskReadBytesPerSec;
    to.diskWriteBytesPerSec = from.diskWriteBytesPerSec;
    to.diskReadOpsPerSec = from.diskReadOpsPerSec;
    to.diskWriteOpsPerSec = from.diskWriteOpsPerSec;
    to.netSentBytesPerSec = from.netSentBytesPerSec;
    to.netRecvBytesPerSec = from.netRecvBytesPerSec;
    to.netPacketsSentPerSec = from.netPacketsSentPerSec;
    to.netPacketsRecvPerSec = from.netPacketsRecvPerSec;
}

nlohmann::json stats(std::vector<double> values) {
    if (values.empty()) {
        return {{"min", 0.0}, {"max", 0.0}, {"avg", 0.0}, {"median", 0.0}};
    }
    std::sort(values.begin(), values.end());
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    std::size_t n = values.size();
    double median = n % 2 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
    return {{"min", values.front()}, {"max", values.back()}, {"avg", sum / n}, {"median", median}};
}

} // namespace

std::string toString(MemoryLevel level) {
    switch (level) {
        case MemoryLevel::Normal: return "normal";
        case MemoryLevel::Warning: return "warning";
        case MemoryLevel::Critical: return "critical";
        case MemoryLevel::Emergency: return "emergency";
    }
    return "unknown";
}

ResourceDetector::ResourceDetector(const config::GuardConfig& config, std::shared_ptr<ICounterSource> source)
    : config_(config),
      source_(std::move(source)),
      capacity_(config.monitoring.historySize > 0 ? config.monitoring.historySize : 1),
      intervalMs_(static_cast<long long>(config.monitoring.intervalSeconds * 1000.0)),
      ticker_("resource-detector") {
    if (!source_) {
        source_ = std::make_shared<ProcfsCounterSource>(config_.monitoring.diskPath);
    }
    if (intervalMs_.load() <= 0) {
        intervalMs_ = 5000;
    }
    refreshHardwareFacts();
    spdlog::info("ResourceDetector: инициализирован (history={}, interval={} мс)", capacity_, intervalMs_.load());
}

ResourceDetector::~ResourceDetector() {
    stopMonitoring();
}

SystemInfo ResourceDetector::refreshHardwareFacts() {
    SystemInfo info;
    bool ok = false;
    try {
        ok = source_->readHardwareFacts(info);
    } catch (const std::exception& e) {
        spdlog::error("ResourceDetector: исключение при чтении аппаратных данных: {}", e.what());
    }
    std::lock_guard<std::mutex> lock(factsMutex_);
    if (!ok) {
        spdlog::warn("ResourceDetector: аппаратные данные не обновлены, используются предыдущие");
        return facts_;
    }
    facts_ = std::move(info);
    spdlog::debug("ResourceDetector: аппаратные данные обновлены ({} CPU, {:.0f} MB)",
                  facts_.logicalCpuCount, facts_.totalMemoryBytes / kMb);
    return facts_;
}

ResourceUsage ResourceDetector::buildUsage(const RawCounters& raw, const RawCounters* previous) const {
    ResourceUsage u;
    u.timestamp = raw.wallTime;
    u.monotonicSeconds = raw.monotonicSeconds;
    u.loadAverage1 = raw.loadAverage1;
    u.loadAverage5 = raw.loadAverage5;
    u.loadAverage15 = raw.loadAverage15;

    u.memoryTotalBytes = raw.memTotalBytes;
    u.memoryAvailableBytes = std::min(raw.memAvailableBytes, raw.memTotalBytes);
    u.memoryUsedBytes = raw.memTotalBytes - u.memoryAvailableBytes;
    u.memoryPercent = raw.memTotalBytes ? 100.0 * u.memoryUsedBytes / raw.memTotalBytes : 0.0;
    u.swapTotalBytes = raw.swapTotalBytes;
    u.swapUsedBytes = raw.swapTotalBytes - std::min(raw.swapFreeBytes, raw.swapTotalBytes);
    u.swapPercent = raw.swapTotalBytes ? 100.0 * u.swapUsedBytes / raw.swapTotalBytes : 0.0;
    u.diskUsagePercent = raw.diskTotalBytes
        ? 100.0 * counterDelta(raw.diskTotalBytes, raw.diskFreeBytes) / raw.diskTotalBytes : 0.0;

    u.processRssBytes = raw.procRssBytes;
    u.processVmsBytes = raw.procVmsBytes;
    u.processMemoryPercent = raw.memTotalBytes ? 100.0 * raw.procRssBytes / raw.memTotalBytes : 0.0;
    u.processThreads = raw.procThreads;
    u.processOpenFiles = raw.procOpenFiles;
    u.systemUptimeSeconds = raw.systemUptimeSeconds;
    u.processUptimeSeconds = raw.processUptimeSeconds;
    u.perCpuPercent.assign(raw.perCpu.size(), 0.0);

    double elapsed = previous ? raw.monotonicSeconds - previous->monotonicSeconds : 0.0;
    if (!previous || elapsed <= 0.0) {
        return u; // скорости остаются нулевыми
    }

    u.cpuPercent = busyPercent(raw.cpuTotal, previous->cpuTotal);
    if (raw.perCpu.size() == previous->perCpu.size()) {
        for (std::size_t i = 0; i < raw.perCpu.size(); ++i) {
            u.perCpuPercent[i] = busyPercent(raw.perCpu[i], previous->perCpu[i]);
        }
    }
    double ticks = raw.clockTicksPerSecond > 0.0 ? raw.clockTicksPerSecond : 100.0;
    u.processCpuPercent = 100.0 * counterDelta(raw.procCpuTicks, previous->procCpuTicks) / ticks / elapsed;

    u.diskReadBytesPerSec = counterDelta(raw.diskReadBytes, previous->diskReadBytes) / elapsed;
    u.diskWriteBytesPerSec = counterDelta(raw.diskWriteBytes, previous->diskWriteBytes) / elapsed;
    u.diskReadOpsPerSec = counterDelta(raw.diskReadOps, previous->diskReadOps) / elapsed;
    u.diskWriteOpsPerSec = counterDelta(raw.diskWriteOps, previous->diskWriteOps) / elapsed;
    u.netSentBytesPerSec = counterDelta(raw.netSentBytes, previous->netSentBytes) / elapsed;
    u.netRecvBytesPerSec = counterDelta(raw.netRecvBytes, previous->netRecvBytes) / elapsed;
    u.netPacketsSentPerSec = counterDelta(raw.netPacketsSent, previous->netPacketsSent) / elapsed;
    u.netPacketsRecvPerSec = counterDelta(raw.netPacketsRecv, previous->netPacketsRecv) / elapsed;
    return u;
}

void ResourceDetector::detectSpike(const ResourceUsage& usage) {
    if (!lastUsage_) return;
    MemorySpike spike;
    spike.timestamp = usage.timestamp;
    spike.previousRssBytes = lastUsage_->processRssBytes;
    spike.currentRssBytes = usage.processRssBytes;
    if (spike.deltaMb() <= config_.thresholds.spikeThresholdMb) return;
    spdlog::warn("ResourceDetector: всплеск памяти процесса +{:.1f} MB ({:.1f} -> {:.1f} MB)",
                 spike.deltaMb(), spike.previousRssBytes / kMb, spike.currentRssBytes / kMb);
    spikes_.push_back(spike);
    while (spikes_.size() > kMaxSpikes) {
        spikes_.pop_front();
    }
}

ResourceUsage ResourceDetector::sampleUsage() {
    RawCounters raw;
    bool ok = false;
    try {
        ok = source_->readCounters(raw);
    } catch (const std::exception& e) {
        spdlog::error("ResourceDetector: исключение при чтении счетчиков: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(historyMutex_);
    if (!ok) {
        failedSamples_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("ResourceDetector: выборка не удалась, возвращается последний снимок");
        return lastUsage_ ? *lastUsage_ : ResourceUsage{};
    }
    try {
        ResourceUsage usage = buildUsage(raw, previousCounters_ ? &*previousCounters_ : nullptr);
        detectSpike(usage);
        previousCounters_ = raw;
        history_.push_back(usage);
        while (history_.size() > capacity_) {
            history_.pop_front();
        }
        lastUsage_ = usage;
        totalSamples_.fetch_add(1, std::memory_order_relaxed);
        return usage;
    } catch (const std::exception& e) {
        failedSamples_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("ResourceDetector: ошибка обработки выборки: {}", e.what());
        return lastUsage_ ? *lastUsage_ : ResourceUsage{};
    }
}

ResourceUsage ResourceDetector::peekUsage() const {
    RawCounters raw;
    bool ok = false;
    try {
        ok = source_->readCounters(raw);
    } catch (const std::exception& e) {
        spdlog::error("ResourceDetector: исключение при чтении счетчиков: {}", e.what());
    }
    std::lock_guard<std::mutex> lock(historyMutex_);
    if (ok) {
        try {
            return buildUsage(raw, previousCounters_ ? &*previousCounters_ : nullptr);
        } catch (const std::exception& e) {
            spdlog::error("ResourceDetector: ошибка обработки выборки: {}", e.what());
        }
    }
    return lastUsage_ ? *lastUsage_ : ResourceUsage{};
}

ResourceUsage ResourceDetector::usageSince(std::optional<RawCounters>& baseline, double minWindowSeconds) const {
    RawCounters raw;
    bool ok = false;
    try {
        ok = source_->readCounters(raw);
    } catch (const std::exception& e) {
        spdlog::error("ResourceDetector: исключение при чтении счетчиков: {}", e.what());
    }
    std::lock_guard<std::mutex> lock(historyMutex_);
    if (!ok) {
        return lastUsage_ ? *lastUsage_ : ResourceUsage{};
    }
    try {
        if (baseline && raw.monotonicSeconds - baseline->monotonicSeconds >= minWindowSeconds) {
            ResourceUsage usage = buildUsage(raw, &*baseline);
            baseline = raw;
            return usage;
        }
        ResourceUsage usage = buildUsage(raw, nullptr);
        if (lastUsage_) {
            copyRates(*lastUsage_, usage);
        }
        if (!baseline) {
            baseline = raw;
        }
        return usage;
    } catch (const std::exception& e) {
        spdlog::error("ResourceDetector: ошибка обработки выборки: {}", e.what());
        return lastUsage_ ? *lastUsage_ : ResourceUsage{};
    }
}

bool ResourceDetector::startMonitoring(std::chrono::milliseconds interval) {
    if (ticker_.isRunning()) {
        spdlog::warn("ResourceDetector: мониторинг уже запущен");
        return false;
    }
    if (interval.count() > 0) {
        intervalMs_ = interval.count();
    }
    {
        // Первая выборка после запуска не имеет базы для разностей
        std::lock_guard<std::mutex> lock(historyMutex_);
        previousCounters_.reset();
    }
    ticks_ = 0;
    bool started = ticker_.start([this]() {
        std::size_t tick = ticks_.fetch_add(1) + 1;
        if (tick % std::max<std::size_t>(1, config_.monitoring.hardwareRefreshTicks) == 0) {
            refreshHardwareFacts();
        }
        sampleUsage();
        return std::chrono::milliseconds(intervalMs_.load());
    });
    if (started) {
        spdlog::info("ResourceDetector: мониторинг запущен с интервалом {} мс", intervalMs_.load());
    }
    return started;
}

bool ResourceDetector::startMonitoring() {
    return startMonitoring(std::chrono::milliseconds(intervalMs_.load()));
}

void ResourceDetector::stopMonitoring() {
    if (!ticker_.isRunning()) {
        return;
    }
    ticker_.stop();
    spdlog::info("ResourceDetector: мониторинг остановлен");
}

bool ResourceDetector::isMonitoring() const {
    return ticker_.isRunning();
}

PressureReading ResourceDetector::detectMemoryPressure() const {
    PressureReading reading;
    reading.threshold = config_.thresholds.warningPercent;
    std::lock_guard<std::mutex> lock(historyMutex_);
    if (!lastUsage_) return reading;
    reading.value = lastUsage_->memoryPercent;
    reading.underPressure = reading.value > reading.threshold;
    return reading;
}

PressureReading ResourceDetector::detectCpuPressure() const {
    PressureReading reading;
    reading.threshold = config_.stress.cpuThresholdPercent;
    std::lock_guard<std::mutex> lock(historyMutex_);
    if (!lastUsage_) return reading;
    reading.value = lastUsage_->cpuPercent;
    reading.underPressure = reading.value > reading.threshold;
    return reading;
}

MemoryLevel ResourceDetector::memoryPressureLevel() const {
    double percent = detectMemoryPressure().value;
    const auto& t = config_.thresholds;
    if (percent >= t.emergencyPercent) return MemoryLevel::Emergency;
    if (percent >= t.criticalPercent) return MemoryLevel::Critical;
    if (percent >= t.warningPercent) return MemoryLevel::Warning;
    return MemoryLevel::Normal;
}

std::vector<ResourceUsage> ResourceDetector::historicalUsage(std::chrono::seconds duration) const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    if (duration.count() <= 0 || history_.empty()) {
        return {};
    }
    long long intervalMs = std::max<long long>(1, intervalMs_.load());
    auto wanted = static_cast<std::size_t>(
        std::ceil(static_cast<double>(duration.count()) * 1000.0 / static_cast<double>(intervalMs)));
    std::size_t count = std::min(wanted, history_.size());
    return std::vector<ResourceUsage>(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

std::optional<ResourceUsage> ResourceDetector::latestUsage() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return lastUsage_;
}

SystemInfo ResourceDetector::systemInfo() const {
    std::lock_guard<std::mutex> lock(factsMutex_);
    return facts_;
}

bool ResourceDetector::probeMemory(MemoryProbe& out) const {
    try {
        return source_->readMemoryProbe(out);
    } catch (const std::exception& e) {
        spdlog::error("ResourceDetector: ошибка чтения памяти процесса: {}", e.what());
        return false;
    }
}

std::vector<MemorySpike> ResourceDetector::memorySpikes() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return std::vector<MemorySpike>(spikes_.begin(), spikes_.end());
}

std::size_t ResourceDetector::historySize() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return history_.size();
}

std::chrono::milliseconds ResourceDetector::samplingInterval() const {
    return std::chrono::milliseconds(intervalMs_.load());
}

nlohmann::json ResourceDetector::summary() const {
    nlohmann::json j;
    j["system"] = systemInfo().toJson();
    auto latest = latestUsage();
    j["current"] = latest ? latest->toJson() : nlohmann::json(nullptr);
    auto memory = detectMemoryPressure();
    auto cpu = detectCpuPressure();
    j["pressure"] = {
        {"memory", {{"underPressure", memory.underPressure}, {"percent", memory.value}, {"threshold", memory.threshold}}},
        {"cpu", {{"underPressure", cpu.underPressure}, {"percent", cpu.value}, {"threshold", cpu.threshold}}},
        {"memoryLevel", toString(memoryPressureLevel())}
    };
    j["monitoring"] = {
        {"active", isMonitoring()},
        {"intervalSeconds", intervalMs_.load() / 1000.0},
        {"historySize", historySize()},
        {"historyCapacity", capacity_},
        {"samples", totalSamples_.load(std::memory_order_relaxed)},
        {"failedSamples", failedSamples()}
    };
    j["memorySpikes"] = memorySpikes().size();
    return j;
}

nlohmann::json ResourceDetector::historySummary(std::chrono::seconds duration) const {
    auto samples = historicalUsage(duration);
    if (samples.empty()) {
        return {{"samples", 0}};
    }
    std::vector<double> cpu, memory, processMb;
    for (const auto& s : samples) {
        cpu.push_back(s.cpuPercent);
        memory.push_back(s.memoryPercent);
        processMb.push_back(s.processRssBytes / kMb);
    }
    double firstMb = processMb.front();
    double lastMb = processMb.back();
    nlohmann::json process = stats(processMb);
    process["growthMb"] = lastMb - firstMb;
    process["growthPercent"] = firstMb > 0.0 ? 100.0 * (lastMb - firstMb) / firstMb : 0.0;
    return {
        {"samples", samples.size()},
        {"periodSeconds", samples.back().monotonicSeconds - samples.front().monotonicSeconds},
        {"cpuPercent", stats(cpu)},
        {"memoryPercent", stats(memory)},
        {"processMemoryMb", process}
    };
}

} // namespace monitor
} // namespace core
} // namespace resguard
