#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/GuardConfig.hpp"
#include "core/monitor/CounterSource.hpp"
#include "core/monitor/SystemTypes.hpp"
#include "core/thread/PeriodicTask.hpp"

namespace resguard {
namespace core {
namespace monitor {

// Результат проверки давления: превышен ли порог и текущее значение
struct PressureReading {
    bool underPressure = false;
    double value = 0.0;
    double threshold = 0.0;
};

enum class MemoryLevel { Normal, Warning, Critical, Emergency };
std::string toString(MemoryLevel level);

// ResourceDetector: выборка счетчиков ОС, ограниченная история снимков и аппаратные данные.
// Публичные методы не выбрасывают исключений: при ошибке чтения возвращаются последние известные данные.
class ResourceDetector {
public:
    explicit ResourceDetector(const config::GuardConfig& config = config::GuardConfig{},
                              std::shared_ptr<ICounterSource> source = nullptr);
    ~ResourceDetector();
    ResourceDetector(const ResourceDetector&) = delete;
    ResourceDetector& operator=(const ResourceDetector&) = delete;

    SystemInfo refreshHardwareFacts(); // Обновить аппаратные данные
    ResourceUsage sampleUsage();       // Снять снимок и добавить в историю
    // Свежий снимок без записи в историю; скорости относительно последней выборки истории
    ResourceUsage peekUsage() const;
    // Снимок с разностями от собственной базы вызывающего, без записи в историю.
    // Если с базы прошло меньше minWindowSeconds, скорости берутся из последней выборки истории
    // и база не сдвигается.
    ResourceUsage usageSince(std::optional<RawCounters>& baseline, double minWindowSeconds) const;
    bool startMonitoring(std::chrono::milliseconds interval);
    bool startMonitoring();            // Интервал из конфигурации
    void stopMonitoring();
    bool isMonitoring() const;

    PressureReading detectMemoryPressure() const;
    PressureReading detectCpuPressure() const;
    MemoryLevel memoryPressureLevel() const;

    std::vector<ResourceUsage> historicalUsage(std::chrono::seconds duration) const;
    std::optional<ResourceUsage> latestUsage() const;
    SystemInfo systemInfo() const;
    bool probeMemory(MemoryProbe& out) const; // Память без записи в историю
    std::vector<MemorySpike> memorySpikes() const;

    nlohmann::json summary() const;
    nlohmann::json historySummary(std::chrono::seconds duration) const;

    std::size_t historySize() const;
    std::size_t historyCapacity() const { return capacity_; }
    std::chrono::milliseconds samplingInterval() const;
    std::size_t failedSamples() const { return failedSamples_.load(std::memory_order_relaxed); }

private:
    ResourceUsage buildUsage(const RawCounters& raw, const RawCounters* previous) const;
    void detectSpike(const ResourceUsage& usage);

    config::GuardConfig config_;
    std::shared_ptr<ICounterSource> source_;
    std::size_t capacity_;

    mutable std::mutex historyMutex_;
    std::deque<ResourceUsage> history_;
    std::optional<RawCounters> previousCounters_;
    std::optional<ResourceUsage> lastUsage_;
    std::deque<MemorySpike> spikes_;

    mutable std::mutex factsMutex_;
    SystemInfo facts_;

    std::atomic<long long> intervalMs_;
    std::atomic<std::size_t> ticks_{0};
    std::atomic<std::size_t> failedSamples_{0};
    std::atomic<std::size_t> totalSamples_{0};
    thread::PeriodicTask ticker_; // Последним: поток останавливается до разрушения остальных полей
};

} // namespace monitor
} // namespace core
} // namespace resguard
