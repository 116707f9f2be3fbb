#include "core/monitor/CounterSource.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace monitor {

namespace {

constexpr std::uint64_t kSectorSize = 512;

double steadySeconds() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool parseCpuLine(const std::string& line, CpuTimes& times) {
    std::istringstream ls(line);
    std::string label;
    ls >> label >> times.user >> times.nice >> times.system >> times.idle;
    if (!ls) return false;
    // Поля iowait и далее отсутствуют в старых ядрах
    ls >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return true;
}

std::uint64_t parseKbValue(const std::string& line) {
    std::istringstream ls(line);
    std::string key;
    std::uint64_t kb = 0;
    ls >> key >> kb;
    return kb * 1024;
}

} // namespace

ProcfsCounterSource::ProcfsCounterSource(std::string diskPath, std::string procRoot, std::string sysRoot)
    : diskPath_(std::move(diskPath)), procRoot_(std::move(procRoot)), sysRoot_(std::move(sysRoot)) {
    long ticks = ::sysconf(_SC_CLK_TCK);
    clockTicks_ = ticks > 0 ? static_cast<double>(ticks) : 100.0;
}

std::string ProcfsCounterSource::procPath(const std::string& rel) const {
    return (std::filesystem::path(procRoot_) / rel).string();
}

std::string ProcfsCounterSource::sysPath(const std::string& rel) const {
    return (std::filesystem::path(sysRoot_) / rel).string();
}

std::optional<std::string> ProcfsCounterSource::readFile(const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool ProcfsCounterSource::readCpuTimes(RawCounters& out) const {
    auto text = readFile(procPath("stat"));
    if (!text) return false;
    std::istringstream ss(*text);
    std::string line;
    bool haveTotal = false;
    out.perCpu.clear();
    while (std::getline(ss, line)) {
        if (line.rfind("cpu", 0) != 0) continue;
        CpuTimes times;
        if (!parseCpuLine(line, times)) continue;
        if (line.size() > 3 && line[3] == ' ') {
            out.cpuTotal = times;
            haveTotal = true;
        } else {
            out.perCpu.push_back(times);
        }
    }
    return haveTotal;
}

bool ProcfsCounterSource::readMeminfo(std::uint64_t& total, std::uint64_t& available,
                                      std::uint64_t& swapTotal, std::uint64_t& swapFree) const {
    auto text = readFile(procPath("meminfo"));
    if (!text) return false;
    std::istringstream ss(*text);
    std::string line;
    std::uint64_t memFree = 0;
    bool haveAvailable = false;
    while (std::getline(ss, line)) {
        if (line.rfind("MemTotal:", 0) == 0) total = parseKbValue(line);
        else if (line.rfind("MemAvailable:", 0) == 0) { available = parseKbValue(line); haveAvailable = true; }
        else if (line.rfind("MemFree:", 0) == 0) memFree = parseKbValue(line);
        else if (line.rfind("SwapTotal:", 0) == 0) swapTotal = parseKbValue(line);
        else if (line.rfind("SwapFree:", 0) == 0) swapFree = parseKbValue(line);
    }
    if (!haveAvailable) available = memFree;
    return total > 0;
}

void ProcfsCounterSource::readLoadAverage(RawCounters& out) const {
    auto text = readFile(procPath("loadavg"));
    if (!text) return;
    std::istringstream ss(*text);
    ss >> out.loadAverage1 >> out.loadAverage5 >> out.loadAverage15;
}

void ProcfsCounterSource::readDiskStats(RawCounters& out) const {
    auto text = readFile(procPath("diskstats"));
    if (!text) return;
    std::istringstream ss(*text);
    std::string line;
    std::string lastDisk;
    while (std::getline(ss, line)) {
        std::istringstream ls(line);
        unsigned major = 0, minor = 0;
        std::string name;
        std::uint64_t rd = 0, rdmerge = 0, rdsec = 0, rdtm = 0, wr = 0, wrmerge = 0, wrsec = 0;
        if (!(ls >> major >> minor >> name >> rd >> rdmerge >> rdsec >> rdtm >> wr >> wrmerge >> wrsec)) continue;
        if (name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0) continue;
        // Разделы идут после своего диска: sda, sda1, nvme0n1, nvme0n1p1
        if (!lastDisk.empty() && name.size() > lastDisk.size() && name.rfind(lastDisk, 0) == 0) continue;
        lastDisk = name;
        out.diskReadOps += rd;
        out.diskWriteOps += wr;
        out.diskReadBytes += rdsec * kSectorSize;
        out.diskWriteBytes += wrsec * kSectorSize;
    }
}

void ProcfsCounterSource::readNetDev(RawCounters& out, std::vector<std::string>* interfaces) const {
    auto text = readFile(procPath("net/dev"));
    if (!text) return;
    std::istringstream ss(*text);
    std::string line;
    while (std::getline(ss, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue; // заголовки
        std::string name = line.substr(0, colon);
        name.erase(0, name.find_first_not_of(' '));
        std::istringstream ls(line.substr(colon + 1));
        std::uint64_t rbytes = 0, rpackets = 0, rerrs = 0, rdrop = 0, rfifo = 0, rframe = 0, rcomp = 0, rmcast = 0;
        std::uint64_t tbytes = 0, tpackets = 0;
        if (!(ls >> rbytes >> rpackets >> rerrs >> rdrop >> rfifo >> rframe >> rcomp >> rmcast >> tbytes >> tpackets)) continue;
        out.netRecvBytes += rbytes;
        out.netPacketsRecv += rpackets;
        out.netSentBytes += tbytes;
        out.netPacketsSent += tpackets;
        if (interfaces) interfaces->push_back(name);
    }
}

bool ProcfsCounterSource::readSelfStat(RawCounters& out) const {
    auto text = readFile(procPath("self/stat"));
    if (!text) return false;
    // Имя процесса в скобках может содержать пробелы
    auto close = text->rfind(')');
    if (close == std::string::npos) return false;
    std::istringstream ls(text->substr(close + 1));
    std::vector<std::string> fields;
    std::string field;
    while (ls >> field) fields.push_back(field);
    if (fields.size() < 20) return false;
    std::uint64_t utime = std::stoull(fields[11]);
    std::uint64_t stime = std::stoull(fields[12]);
    out.procCpuTicks = utime + stime;
    out.procThreads = static_cast<std::size_t>(std::stoul(fields[17]));
    double startSeconds = static_cast<double>(std::stoull(fields[19])) / clockTicks_;
    out.processUptimeSeconds = out.systemUptimeSeconds > startSeconds ? out.systemUptimeSeconds - startSeconds : 0.0;
    return true;
}

bool ProcfsCounterSource::readSelfStatus(std::uint64_t& rss, std::uint64_t& vms) const {
    auto text = readFile(procPath("self/status"));
    if (!text) return false;
    std::istringstream ss(*text);
    std::string line;
    bool haveRss = false;
    while (std::getline(ss, line)) {
        if (line.rfind("VmRSS:", 0) == 0) { rss = parseKbValue(line); haveRss = true; }
        else if (line.rfind("VmSize:", 0) == 0) vms = parseKbValue(line);
    }
    return haveRss;
}

bool ProcfsCounterSource::readCounters(RawCounters& out) {
    try {
        out = RawCounters{};
        out.monotonicSeconds = steadySeconds();
        out.wallTime = std::chrono::system_clock::now();
        out.clockTicksPerSecond = clockTicks_;

        if (!readCpuTimes(out)) {
            spdlog::warn("ProcfsCounterSource: не удалось прочитать {}", procPath("stat"));
            return false;
        }
        if (!readMeminfo(out.memTotalBytes, out.memAvailableBytes, out.swapTotalBytes, out.swapFreeBytes)) {
            spdlog::warn("ProcfsCounterSource: не удалось прочитать {}", procPath("meminfo"));
            return false;
        }
        readLoadAverage(out);
        readDiskStats(out);
        readNetDev(out, nullptr);

        if (auto uptime = readFile(procPath("uptime"))) {
            std::istringstream(*uptime) >> out.systemUptimeSeconds;
        }
        if (!readSelfStat(out)) {
            spdlog::debug("ProcfsCounterSource: self/stat недоступен");
        }
        readSelfStatus(out.procRssBytes, out.procVmsBytes);

        std::error_code ec;
        std::filesystem::directory_iterator fdDir(procPath("self/fd"), ec);
        if (!ec) {
            for (auto it = fdDir; it != std::filesystem::directory_iterator(); it.increment(ec)) {
                if (ec) break;
                ++out.procOpenFiles;
            }
        }

        struct statvfs vfs {};
        if (::statvfs(diskPath_.c_str(), &vfs) == 0) {
            std::uint64_t frsize = vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize;
            std::uint64_t used = (vfs.f_blocks - vfs.f_bfree) * frsize;
            out.diskFreeBytes = vfs.f_bavail * frsize;
            out.diskTotalBytes = used + out.diskFreeBytes;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("ProcfsCounterSource: ошибка чтения счетчиков: {}", e.what());
        return false;
    }
}

bool ProcfsCounterSource::readHardwareFacts(SystemInfo& out) {
    try {
        SystemInfo info;
        std::uint64_t available = 0, swapFree = 0;
        if (!readMeminfo(info.totalMemoryBytes, available, info.totalSwapBytes, swapFree)) {
            return false;
        }

        if (auto cpuinfo = readFile(procPath("cpuinfo"))) {
            std::istringstream ss(*cpuinfo);
            std::string line;
            std::set<std::pair<std::string, std::string>> cores;
            std::string physicalId;
            std::size_t processors = 0;
            while (std::getline(ss, line)) {
                auto colon = line.find(':');
                if (colon == std::string::npos) continue;
                std::string key = line.substr(0, line.find_last_not_of(" \t", colon - 1) + 1);
                std::string value = line.substr(colon + 1);
                value.erase(0, value.find_first_not_of(' '));
                if (key == "processor") ++processors;
                else if (key == "physical id") physicalId = value;
                else if (key == "core id") cores.emplace(physicalId, value);
                else if (key == "cpu MHz" && info.cpuFrequencyMhz == 0.0) info.cpuFrequencyMhz = std::stod(value);
            }
            info.logicalCpuCount = processors;
            info.physicalCpuCount = cores.empty() ? processors : cores.size();
        }
        if (info.logicalCpuCount == 0) {
            long online = ::sysconf(_SC_NPROCESSORS_ONLN);
            info.logicalCpuCount = online > 0 ? static_cast<std::size_t>(online) : 1;
            info.physicalCpuCount = info.logicalCpuCount;
        }
        if (auto maxFreq = readFile(sysPath("devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq"))) {
            double khz = 0.0;
            std::istringstream(*maxFreq) >> khz;
            info.cpuMaxFrequencyMhz = khz / 1000.0;
        }
        if (auto curFreq = readFile(sysPath("devices/system/cpu/cpu0/cpufreq/scaling_cur_freq"))) {
            double khz = 0.0;
            std::istringstream(*curFreq) >> khz;
            if (khz > 0.0) info.cpuFrequencyMhz = khz / 1000.0;
        }
        if (info.cpuMaxFrequencyMhz == 0.0) info.cpuMaxFrequencyMhz = info.cpuFrequencyMhz;

        if (auto stat = readFile(procPath("stat"))) {
            std::istringstream ss(*stat);
            std::string line;
            while (std::getline(ss, line)) {
                if (line.rfind("btime", 0) == 0) {
                    std::istringstream(line.substr(5)) >> info.bootTimeEpochSeconds;
                }
            }
        }

        RawCounters net;
        readNetDev(net, &info.networkInterfaces);

        struct statvfs vfs {};
        if (::statvfs(diskPath_.c_str(), &vfs) == 0) {
            std::uint64_t frsize = vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize;
            info.totalDiskBytes = vfs.f_blocks * frsize;
        }

        struct utsname uts {};
        if (::uname(&uts) == 0) {
            info.hostname = uts.nodename;
            info.platform = uts.sysname;
            info.release = uts.release;
            info.machine = uts.machine;
        }
        info.pid = static_cast<int>(::getpid());
        info.refreshedAt = std::chrono::system_clock::now();
        out = std::move(info);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("ProcfsCounterSource: ошибка чтения аппаратных данных: {}", e.what());
        return false;
    }
}

bool ProcfsCounterSource::readMemoryProbe(MemoryProbe& out) {
    try {
        MemoryProbe probe;
        std::uint64_t swapTotal = 0, swapFree = 0;
        if (!readMeminfo(probe.systemTotalBytes, probe.systemAvailableBytes, swapTotal, swapFree)) {
            return false;
        }
        if (!readSelfStatus(probe.rssBytes, probe.vmsBytes)) {
            return false;
        }
        out = probe;
        return true;
    } catch (const std::exception& e) {
        spdlog::error("ProcfsCounterSource: ошибка чтения памяти процесса: {}", e.what());
        return false;
    }
}

} // namespace monitor
} // namespace core
} // namespace resguard
