#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include "core/monitor/ResourceDetector.hpp"
#include "support/FakeSources.hpp"

using namespace resguard::core;
using resguard::testing::FakeCounterSource;
using resguard::testing::kMiB;

namespace {

config::GuardConfig makeConfig(std::size_t historySize = 720) {
    config::GuardConfig cfg;
    cfg.monitoring.historySize = historySize;
    cfg.monitoring.intervalSeconds = 5.0;
    return cfg;
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

} // namespace

void testResourceDetectorFirstSampleHasZeroRates() {
    std::cout << "Testing ResourceDetector first sample rates...\n";
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(makeConfig(), source);

    source->advance(1.0, 60.0, 4 * kMiB);
    auto first = detector.sampleUsage();
    assert(first.cpuPercent == 0.0);
    assert(first.netRecvBytesPerSec == 0.0);
    assert(first.diskReadBytesPerSec == 0.0);
    assert(first.memoryPercent > 0.0);

    source->advance(2.0, 60.0, 4 * kMiB);
    auto second = detector.sampleUsage();
    assert(std::fabs(second.cpuPercent - 60.0) < 1e-9);
    assert(std::fabs(second.netRecvBytesPerSec - 2.0 * kMiB) < 1e-6);
    assert(std::fabs(second.networkMBps() - 2.0) < 1e-9);
    std::cout << "[OK] ResourceDetector first sample rates\n";
}

void testResourceDetectorBoundedHistory() {
    std::cout << "Testing ResourceDetector bounded history...\n";
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(makeConfig(5), source);
    assert(detector.historyCapacity() == 5);
    for (int i = 0; i < 12; ++i) {
        source->advance(5.0, 10.0 + i);
        detector.sampleUsage();
        assert(detector.historySize() <= 5);
    }
    assert(detector.historySize() == 5);

    // Самый старый снимок вытеснен: последний снимок соответствует 21% CPU
    auto latest = detector.latestUsage();
    assert(latest.has_value());
    assert(std::fabs(latest->cpuPercent - 21.0) < 1e-9);
    std::cout << "[OK] ResourceDetector bounded history\n";
}

void testResourceDetectorHistoricalUsage() {
    std::cout << "Testing ResourceDetector historical usage...\n";
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(makeConfig(), source);
    assert(detector.historicalUsage(std::chrono::seconds(60)).empty());
    for (int i = 0; i < 10; ++i) {
        source->advance(5.0, 20.0);
        detector.sampleUsage();
    }
    assert(detector.historicalUsage(std::chrono::seconds(10)).size() == 2);
    assert(detector.historicalUsage(std::chrono::seconds(11)).size() == 3);
    assert(detector.historicalUsage(std::chrono::seconds(3600)).size() == 10);
    assert(detector.historicalUsage(std::chrono::seconds(0)).empty());

    auto summary = detector.historySummary(std::chrono::seconds(3600));
    assert(summary["samples"].get<std::size_t>() == 10);
    assert(std::fabs(summary["cpuPercent"]["max"].get<double>() - 20.0) < 1e-9);
    assert(detector.historySummary(std::chrono::seconds(0))["samples"].get<std::size_t>() == 0);
    std::cout << "[OK] ResourceDetector historical usage\n";
}

void testResourceDetectorPressureAndSpikes() {
    std::cout << "Testing ResourceDetector pressure and spikes...\n";
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(makeConfig(), source);

    assert(!detector.detectMemoryPressure().underPressure);
    source->setMemoryPercent(50.0);
    source->advance(1.0, 30.0);
    detector.sampleUsage();
    assert(!detector.detectMemoryPressure().underPressure);
    assert(detector.memoryPressureLevel() == monitor::MemoryLevel::Normal);

    source->setMemoryPercent(90.0);
    source->setRss(200 * kMiB); // +100 MB к предыдущей выборке
    source->advance(1.0, 99.0);
    detector.sampleUsage();
    auto memory = detector.detectMemoryPressure();
    assert(memory.underPressure);
    assert(std::fabs(memory.value - 90.0) < 0.01);
    assert(detector.memoryPressureLevel() == monitor::MemoryLevel::Critical);
    assert(monitor::toString(detector.memoryPressureLevel()) == "critical");
    assert(detector.detectCpuPressure().underPressure);

    auto spikes = detector.memorySpikes();
    assert(spikes.size() == 1);
    assert(std::fabs(spikes[0].deltaMb() - 100.0) < 1e-9);

    // Рост меньше порога всплеском не считается
    source->setRss(220 * kMiB);
    source->advance(1.0, 10.0);
    detector.sampleUsage();
    assert(detector.memorySpikes().size() == 1);
    std::cout << "[OK] ResourceDetector pressure and spikes\n";
}

void testResourceDetectorPeekAndFailures() {
    std::cout << "Testing ResourceDetector peek and failed samples...\n";
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(makeConfig(), source);
    source->advance(1.0, 40.0);
    detector.sampleUsage();
    source->advance(1.0, 70.0);
    auto peeked = detector.peekUsage();
    assert(std::fabs(peeked.cpuPercent - 70.0) < 1e-9);
    assert(detector.historySize() == 1);

    source->setFailing(true);
    auto fallback = detector.sampleUsage();
    assert(detector.failedSamples() == 1);
    assert(detector.historySize() == 1);
    assert(fallback.monotonicSeconds == detector.latestUsage()->monotonicSeconds);
    // Аппаратные данные сохраняются при ошибке обновления
    assert(detector.refreshHardwareFacts().logicalCpuCount == 4);
    source->setFailing(false);
    std::cout << "[OK] ResourceDetector peek and failed samples\n";
}

void testResourceDetectorUsageSinceBaseline() {
    std::cout << "Testing ResourceDetector snapshots against a caller baseline...\n";
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(makeConfig(), source);
    std::optional<monitor::RawCounters> baseline;
    detector.sampleUsage();

    auto first = detector.usageSince(baseline, 0.5);
    assert(baseline.has_value());
    assert(first.cpuPercent == 0.0);

    source->advance(1.0, 60.0);
    detector.sampleUsage();
    // Скорости считаются от собственной базы, база сдвигается
    auto sinceBase = detector.usageSince(baseline, 0.5);
    assert(std::fabs(sinceBase.cpuPercent - 60.0) < 1e-9);
    assert(baseline->monotonicSeconds == 1.0);

    source->advance(0.1, 0.0);
    source->setMemoryPercent(55.0);
    auto shortWindow = detector.usageSince(baseline, 0.5);
    assert(std::fabs(shortWindow.cpuPercent - 60.0) < 1e-9);
    assert(std::fabs(shortWindow.memoryPercent - 55.0) < 1e-6);
    assert(baseline->monotonicSeconds == 1.0);
    assert(detector.historySize() == 2);
    std::cout << "[OK] ResourceDetector snapshots against a caller baseline\n";
}

void testResourceDetectorMonitoringLoop() {
    std::cout << "Testing ResourceDetector monitoring loop...\n";
    auto cfg = makeConfig();
    cfg.monitoring.hardwareRefreshTicks = 2;
    auto source = std::make_shared<FakeCounterSource>();
    monitor::ResourceDetector detector(cfg, source);
    std::size_t factsBefore = source->factReads();

    assert(detector.startMonitoring(std::chrono::milliseconds(10)));
    assert(detector.isMonitoring());
    assert(!detector.startMonitoring(std::chrono::milliseconds(10)));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    detector.stopMonitoring();
    assert(!detector.isMonitoring());
    assert(detector.historySize() >= 3);
    assert(source->factReads() > factsBefore);
    assert(detector.samplingInterval() == std::chrono::milliseconds(10));

    auto summary = detector.summary();
    assert(summary["system"]["cpu"]["logicalCount"].get<std::size_t>() == 4);
    assert(!summary["monitoring"]["active"].get<bool>());
    std::cout << "[OK] ResourceDetector monitoring loop\n";
}

void testProcfsCounterSource() {
    std::cout << "Testing ProcfsCounterSource on prepared files...\n";
    auto root = std::filesystem::temp_directory_path() / "resguard_procfs_test";
    std::filesystem::remove_all(root);
    auto proc = root / "proc";
    auto sys = root / "sys";
    writeFile(proc / "stat",
              "cpu  100 0 50 800 50 0 0 0 0 0\n"
              "cpu0 50 0 25 400 25 0 0 0 0 0\n"
              "cpu1 50 0 25 400 25 0 0 0 0 0\n"
              "btime 1700000000\n");
    writeFile(proc / "meminfo",
              "MemTotal:        2048000 kB\n"
              "MemFree:          100000 kB\n"
              "MemAvailable:    1024000 kB\n"
              "SwapTotal:        512000 kB\n"
              "SwapFree:         256000 kB\n");
    writeFile(proc / "loadavg", "0.50 0.40 0.30 1/100 12345\n");
    writeFile(proc / "uptime", "500.00 900.00\n");
    writeFile(proc / "diskstats",
              "   7       0 loop0 9 0 9 0 9 0 9 0 0 0 0\n"
              "   8       0 sda 100 0 2000 0 50 0 1000 0 0 0 0\n"
              "   8       1 sda1 90 0 1800 0 40 0 900 0 0 0 0\n");
    writeFile(proc / "net/dev",
              "Inter-|   Receive                                                |  Transmit\n"
              " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
              "    lo:    1000      10    0    0    0     0          0         0     1000      10    0    0    0     0       0          0\n"
              "  eth0:    5000      50    0    0    0     0          0         0     3000      30    0    0    0     0       0          0\n");
    writeFile(proc / "self/stat",
              "4242 (resguard test) S 1 1 1 0 -1 0 0 0 0 0 150 50 0 0 20 0 7 0 1000 0 0\n");
    writeFile(proc / "self/status", "Name:\tresguard\nVmSize:\t  204800 kB\nVmRSS:\t   102400 kB\n");
    writeFile(proc / "cpuinfo",
              "processor\t: 0\nphysical id\t: 0\ncore id\t\t: 0\ncpu MHz\t\t: 2400.000\n\n"
              "processor\t: 1\nphysical id\t: 0\ncore id\t\t: 0\ncpu MHz\t\t: 2400.000\n\n");
    writeFile(sys / "devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq", "3000000\n");
    std::filesystem::create_directories(proc / "self/fd");
    writeFile(proc / "self/fd/0", "");
    writeFile(proc / "self/fd/1", "");

    monitor::ProcfsCounterSource source("/", proc.string(), sys.string());
    monitor::RawCounters raw;
    assert(source.readCounters(raw));
    assert(raw.cpuTotal.total() == 1000);
    assert(raw.cpuTotal.busy() == 150);
    assert(raw.perCpu.size() == 2);
    assert(raw.memTotalBytes == 2048000ull * 1024);
    assert(raw.memAvailableBytes == 1024000ull * 1024);
    assert(raw.swapFreeBytes == 256000ull * 1024);
    assert(raw.loadAverage1 == 0.5);
    assert(raw.diskReadOps == 100);
    assert(raw.diskReadBytes == 2000ull * 512);
    assert(raw.diskWriteBytes == 1000ull * 512);
    assert(raw.netRecvBytes == 6000);
    assert(raw.netSentBytes == 4000);
    assert(raw.procCpuTicks == 200);
    assert(raw.procThreads == 7);
    assert(raw.procRssBytes == 102400ull * 1024);
    assert(raw.procOpenFiles == 2);
    assert(raw.systemUptimeSeconds == 500.0);

    monitor::MemoryProbe probe;
    assert(source.readMemoryProbe(probe));
    assert(std::fabs(probe.processPercent() - 5.0) < 1e-9);
    assert(std::fabs(probe.systemPercent() - 50.0) < 1e-9);

    monitor::SystemInfo info;
    assert(source.readHardwareFacts(info));
    assert(info.logicalCpuCount == 2);
    assert(info.physicalCpuCount == 1);
    assert(info.cpuMaxFrequencyMhz == 3000.0);
    assert(info.bootTimeEpochSeconds == 1700000000);
    assert(info.networkInterfaces.size() == 2);

    std::filesystem::remove(proc / "stat");
    assert(!source.readCounters(raw));
    std::filesystem::remove_all(root);
    std::cout << "[OK] ProcfsCounterSource on prepared files\n";
}

int main() {
    try {
        testResourceDetectorFirstSampleHasZeroRates();
        testResourceDetectorBoundedHistory();
        testResourceDetectorHistoricalUsage();
        testResourceDetectorPressureAndSpikes();
        testResourceDetectorPeekAndFailures();
        testResourceDetectorUsageSinceBaseline();
        testResourceDetectorMonitoringLoop();
        testProcfsCounterSource();
        std::cout << "All ResourceDetector tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ResourceDetector test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
