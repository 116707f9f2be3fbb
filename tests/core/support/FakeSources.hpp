#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include "core/memory/Reclaimer.hpp"
#include "core/monitor/CounterSource.hpp"

namespace resguard {
namespace testing {

constexpr std::uint64_t kMiB = 1024 * 1024;

// FakeCounterSource: управляемые тестом счетчики вместо /proc
class FakeCounterSource : public core::monitor::ICounterSource {
public:
    FakeCounterSource() {
        counters_.memTotalBytes = 1000 * kMiB;
        counters_.memAvailableBytes = 800 * kMiB;
        counters_.clockTicksPerSecond = 100.0;
        counters_.wallTime = std::chrono::system_clock::now();
        counters_.procRssBytes = 100 * kMiB;
        facts_.logicalCpuCount = 4;
        facts_.physicalCpuCount = 2;
        facts_.totalMemoryBytes = counters_.memTotalBytes;
        facts_.hostname = "fake-host";
    }

    // Следующая выборка: +seconds, загрузка CPU cpuPercent, сеть +netBytes
    void advance(double seconds, double cpuPercent, std::uint64_t netBytes = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.monotonicSeconds += seconds;
        counters_.wallTime += std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
        std::uint64_t total = 1000;
        auto busy = static_cast<std::uint64_t>(cpuPercent * 10.0);
        counters_.cpuTotal.user += busy;
        counters_.cpuTotal.idle += total - busy;
        counters_.netRecvBytes += netBytes;
    }

    void setMemoryPercent(double percent) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto used = static_cast<std::uint64_t>(counters_.memTotalBytes * percent / 100.0);
        counters_.memAvailableBytes = counters_.memTotalBytes - used;
    }

    void setRss(std::uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.procRssBytes = bytes;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    bool readCounters(core::monitor::RawCounters& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++reads_;
        if (failing_) return false;
        out = counters_;
        return true;
    }

    bool readHardwareFacts(core::monitor::SystemInfo& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++factReads_;
        if (failing_) return false;
        out = facts_;
        return true;
    }

    bool readMemoryProbe(core::monitor::MemoryProbe& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) return false;
        out.rssBytes = counters_.procRssBytes;
        out.vmsBytes = counters_.procRssBytes * 2;
        out.systemTotalBytes = counters_.memTotalBytes;
        out.systemAvailableBytes = counters_.memAvailableBytes;
        return true;
    }

    std::size_t reads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }

    std::size_t factReads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factReads_;
    }

private:
    mutable std::mutex mutex_;
    core::monitor::RawCounters counters_;
    core::monitor::SystemInfo facts_;
    bool failing_ = false;
    std::size_t reads_ = 0;
    std::size_t factReads_ = 0;
};

// FakeReclaimer: счетчики вызовов вместо glibc
class FakeReclaimer : public core::memory::IReclaimer {
public:
    core::memory::ReclaimResult collect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++collects_;
        return core::memory::ReclaimResult{true, 10, 0};
    }

    bool trim() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++trims_;
        return true;
    }

    core::memory::AllocatorStats stats() const override {
        core::memory::AllocatorStats s;
        s.available = true;
        return s;
    }

    bool applyThresholds(const core::memory::CollectorThresholds& thresholds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        thresholds_ = thresholds;
        return true;
    }

    core::memory::CollectorThresholds thresholds() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return thresholds_;
    }

    std::size_t collects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return collects_;
    }

    std::size_t trims() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return trims_;
    }

private:
    mutable std::mutex mutex_;
    core::memory::CollectorThresholds thresholds_{128 * 1024, 128 * 1024, 128 * 1024};
    std::size_t collects_ = 0;
    std::size_t trims_ = 0;
};

} // namespace testing
} // namespace resguard
