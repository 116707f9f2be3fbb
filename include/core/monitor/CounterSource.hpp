#pragma once

#include <optional>
#include <string>
#include "core/monitor/SystemTypes.hpp"

namespace resguard {
namespace core {
namespace monitor {

// ICounterSource: источник счетчиков ОС для ResourceDetector.
// Реализации возвращают false при ошибке чтения и не выбрасывают исключений.
class ICounterSource {
public:
    virtual ~ICounterSource() = default;
    virtual bool readCounters(RawCounters& out) = 0;       // Накопительные счетчики
    virtual bool readHardwareFacts(SystemInfo& out) = 0;   // Аппаратные данные
    virtual bool readMemoryProbe(MemoryProbe& out) = 0;    // Память процесса и системы
};

// ProcfsCounterSource: чтение /proc и /sys в Linux.
// Корни можно переопределить для тестов на подготовленных файлах.
class ProcfsCounterSource : public ICounterSource {
public:
    explicit ProcfsCounterSource(std::string diskPath = "/",
                                 std::string procRoot = "/proc",
                                 std::string sysRoot = "/sys");

    bool readCounters(RawCounters& out) override;
    bool readHardwareFacts(SystemInfo& out) override;
    bool readMemoryProbe(MemoryProbe& out) override;

private:
    std::string procPath(const std::string& rel) const;
    std::string sysPath(const std::string& rel) const;
    std::optional<std::string> readFile(const std::string& path) const;

    bool readCpuTimes(RawCounters& out) const;
    bool readMeminfo(std::uint64_t& total, std::uint64_t& available,
                     std::uint64_t& swapTotal, std::uint64_t& swapFree) const;
    void readLoadAverage(RawCounters& out) const;
    void readDiskStats(RawCounters& out) const;
    void readNetDev(RawCounters& out, std::vector<std::string>* interfaces) const;
    bool readSelfStat(RawCounters& out) const;
    bool readSelfStatus(std::uint64_t& rss, std::uint64_t& vms) const;

    std::string diskPath_;
    std::string procRoot_;
    std::string sysRoot_;
    double clockTicks_;
};

} // namespace monitor
} // namespace core
} // namespace resguard
