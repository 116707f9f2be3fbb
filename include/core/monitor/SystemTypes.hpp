#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace monitor {

inline std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// SystemInfo: редко меняющиеся аппаратные данные и идентичность процесса
struct SystemInfo {
    std::size_t logicalCpuCount = 0;   // Логические ядра
    std::size_t physicalCpuCount = 0;  // Физические ядра
    double cpuFrequencyMhz = 0.0;      // Текущая частота
    double cpuMaxFrequencyMhz = 0.0;   // Максимальная частота
    std::uint64_t totalMemoryBytes = 0;
    std::uint64_t totalSwapBytes = 0;
    std::uint64_t totalDiskBytes = 0;
    std::vector<std::string> networkInterfaces;
    int pid = 0;
    std::string hostname;
    std::string platform;
    std::string release;
    std::string machine;
    std::int64_t bootTimeEpochSeconds = 0;
    std::chrono::system_clock::time_point refreshedAt; // Последнее обновление

    nlohmann::json toJson() const {
        return {
            {"cpu", {
                {"logicalCount", logicalCpuCount},
                {"physicalCount", physicalCpuCount},
                {"frequencyMhz", cpuFrequencyMhz},
                {"maxFrequencyMhz", cpuMaxFrequencyMhz}
            }},
            {"memory", {
                {"totalBytes", totalMemoryBytes},
                {"totalMb", totalMemoryBytes / (1024.0 * 1024.0)},
                {"swapTotalBytes", totalSwapBytes}
            }},
            {"disk", {{"totalBytes", totalDiskBytes}}},
            {"networkInterfaces", networkInterfaces},
            {"process", {
                {"pid", pid},
                {"hostname", hostname},
                {"platform", platform},
                {"release", release},
                {"machine", machine},
                {"bootTime", bootTimeEpochSeconds}
            }},
            {"refreshedAt", toEpochMillis(refreshedAt)}
        };
    }
};

// ResourceUsage: снимок одного тика выборки; скорости в единицах в секунду
struct ResourceUsage {
    std::chrono::system_clock::time_point timestamp;
    double monotonicSeconds = 0.0;       // Для вычисления интервалов
    double cpuPercent = 0.0;
    std::vector<double> perCpuPercent;
    double loadAverage1 = 0.0;
    double loadAverage5 = 0.0;
    double loadAverage15 = 0.0;
    std::uint64_t memoryTotalBytes = 0;
    std::uint64_t memoryUsedBytes = 0;
    std::uint64_t memoryAvailableBytes = 0;
    double memoryPercent = 0.0;
    std::uint64_t swapTotalBytes = 0;
    std::uint64_t swapUsedBytes = 0;
    double swapPercent = 0.0;
    double diskReadBytesPerSec = 0.0;
    double diskWriteBytesPerSec = 0.0;
    double diskReadOpsPerSec = 0.0;
    double diskWriteOpsPerSec = 0.0;
    double diskUsagePercent = 0.0;
    double netSentBytesPerSec = 0.0;
    double netRecvBytesPerSec = 0.0;
    double netPacketsSentPerSec = 0.0;
    double netPacketsRecvPerSec = 0.0;
    std::uint64_t processRssBytes = 0;
    std::uint64_t processVmsBytes = 0;
    double processMemoryPercent = 0.0;
    double processCpuPercent = 0.0;
    std::size_t processThreads = 0;
    std::size_t processOpenFiles = 0;
    double systemUptimeSeconds = 0.0;
    double processUptimeSeconds = 0.0;

    double networkMBps() const {
        return (netSentBytesPerSec + netRecvBytesPerSec) / (1024.0 * 1024.0);
    }

    nlohmann::json toJson() const {
        return {
            {"timestamp", toEpochMillis(timestamp)},
            {"cpu", {
                {"percent", cpuPercent},
                {"perCpu", perCpuPercent},
                {"loadAverage", {loadAverage1, loadAverage5, loadAverage15}}
            }},
            {"memory", {
                {"totalBytes", memoryTotalBytes},
                {"usedBytes", memoryUsedBytes},
                {"availableBytes", memoryAvailableBytes},
                {"percent", memoryPercent},
                {"swapTotalBytes", swapTotalBytes},
                {"swapUsedBytes", swapUsedBytes},
                {"swapPercent", swapPercent}
            }},
            {"disk", {
                {"readBytesPerSec", diskReadBytesPerSec},
                {"writeBytesPerSec", diskWriteBytesPerSec},
                {"readOpsPerSec", diskReadOpsPerSec},
                {"writeOpsPerSec", diskWriteOpsPerSec},
                {"usagePercent", diskUsagePercent}
            }},
            {"network", {
                {"sentBytesPerSec", netSentBytesPerSec},
                {"recvBytesPerSec", netRecvBytesPerSec},
                {"packetsSentPerSec", netPacketsSentPerSec},
                {"packetsRecvPerSec", netPacketsRecvPerSec}
            }},
            {"process", {
                {"rssBytes", processRssBytes},
                {"vmsBytes", processVmsBytes},
                {"memoryPercent", processMemoryPercent},
                {"cpuPercent", processCpuPercent},
                {"threads", processThreads},
                {"openFiles", processOpenFiles},
                {"uptimeSeconds", processUptimeSeconds}
            }},
            {"systemUptimeSeconds", systemUptimeSeconds}
        };
    }
};

// Процессорное время в тиках, как в строке /proc/stat
struct CpuTimes {
    std::uint64_t user = 0;
    std::uint64_t nice = 0;
    std::uint64_t system = 0;
    std::uint64_t idle = 0;
    std::uint64_t iowait = 0;
    std::uint64_t irq = 0;
    std::uint64_t softirq = 0;
    std::uint64_t steal = 0;

    std::uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
    std::uint64_t busy() const { return total() - idle - iowait; }
};

// RawCounters: накопительные счетчики ОС на момент чтения
struct RawCounters {
    double monotonicSeconds = 0.0;
    std::chrono::system_clock::time_point wallTime;
    CpuTimes cpuTotal;
    std::vector<CpuTimes> perCpu;
    double loadAverage1 = 0.0;
    double loadAverage5 = 0.0;
    double loadAverage15 = 0.0;
    std::uint64_t memTotalBytes = 0;
    std::uint64_t memAvailableBytes = 0;
    std::uint64_t swapTotalBytes = 0;
    std::uint64_t swapFreeBytes = 0;
    std::uint64_t diskReadBytes = 0;
    std::uint64_t diskWriteBytes = 0;
    std::uint64_t diskReadOps = 0;
    std::uint64_t diskWriteOps = 0;
    std::uint64_t diskTotalBytes = 0;
    std::uint64_t diskFreeBytes = 0;
    std::uint64_t netSentBytes = 0;
    std::uint64_t netRecvBytes = 0;
    std::uint64_t netPacketsSent = 0;
    std::uint64_t netPacketsRecv = 0;
    std::uint64_t procRssBytes = 0;
    std::uint64_t procVmsBytes = 0;
    std::uint64_t procCpuTicks = 0;      // utime + stime
    std::size_t procThreads = 0;
    std::size_t procOpenFiles = 0;
    double systemUptimeSeconds = 0.0;
    double processUptimeSeconds = 0.0;
    double clockTicksPerSecond = 100.0;
};

// Память процесса и системы без записи в историю
struct MemoryProbe {
    std::uint64_t rssBytes = 0;
    std::uint64_t vmsBytes = 0;
    std::uint64_t systemTotalBytes = 0;
    std::uint64_t systemAvailableBytes = 0;

    double processPercent() const {
        return systemTotalBytes ? 100.0 * static_cast<double>(rssBytes) / static_cast<double>(systemTotalBytes) : 0.0;
    }
    double systemPercent() const {
        if (!systemTotalBytes || systemAvailableBytes > systemTotalBytes) return 0.0;
        return 100.0 * static_cast<double>(systemTotalBytes - systemAvailableBytes) / static_cast<double>(systemTotalBytes);
    }
};

// Всплеск памяти процесса между двумя выборками
struct MemorySpike {
    std::chrono::system_clock::time_point timestamp;
    std::uint64_t previousRssBytes = 0;
    std::uint64_t currentRssBytes = 0;

    double deltaMb() const {
        return (static_cast<double>(currentRssBytes) - static_cast<double>(previousRssBytes)) / (1024.0 * 1024.0);
    }
    nlohmann::json toJson() const {
        return {
            {"timestamp", toEpochMillis(timestamp)},
            {"previousMb", previousRssBytes / (1024.0 * 1024.0)},
            {"currentMb", currentRssBytes / (1024.0 * 1024.0)},
            {"deltaMb", deltaMb()}
        };
    }
};

} // namespace monitor
} // namespace core
} // namespace resguard
