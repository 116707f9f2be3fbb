#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "core/config/GuardConfig.hpp"

namespace resguard {
namespace core {
namespace logging {

// Настройка логгера по умолчанию "resguard": консоль и/или ротация файлов
bool initializeLogging(const config::LoggingConfig& config);

// Именованный логгер компонента с общими синками логгера по умолчанию
std::shared_ptr<spdlog::logger> componentLogger(const std::string& name);

spdlog::level::level_enum parseLevel(const std::string& level);

// LogVerbosityGuard: временное снижение подробности всех зарегистрированных логгеров
class LogVerbosityGuard {
public:
    explicit LogVerbosityGuard(spdlog::level::level_enum floor = spdlog::level::warn);
    ~LogVerbosityGuard();
    LogVerbosityGuard(const LogVerbosityGuard&) = delete;
    LogVerbosityGuard& operator=(const LogVerbosityGuard&) = delete;

    bool reduce();  // false, если уже снижено
    bool restore(); // false, если нечего восстанавливать
    bool isReduced() const;

private:
    spdlog::level::level_enum floor_;
    std::unordered_map<std::string, spdlog::level::level_enum> savedLevels_;
    bool reduced_ = false;
    mutable std::mutex mutex_;
};

} // namespace logging
} // namespace core
} // namespace resguard
