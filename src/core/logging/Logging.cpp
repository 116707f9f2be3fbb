#include "core/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace resguard {
namespace core {
namespace logging {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* kDefaultLoggerName = "resguard";
}

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "warning") {
        return spdlog::level::warn;
    }
    return spdlog::level::from_str(level);
}

bool initializeLogging(const config::LoggingConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.toConsole) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kPattern);
            sinks.push_back(console_sink);
        }
        if (config.toFile) {
            std::filesystem::path logPath(config.filePath);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSizeMb * 1024 * 1024, config.maxFiles);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        spdlog::drop(kDefaultLoggerName);
        auto logger = std::make_shared<spdlog::logger>(kDefaultLoggerName, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(config.level));
        spdlog::set_default_logger(logger);
        spdlog::info("Logging: инициализировано (level={}, console={}, file={})",
                     config.level, config.toConsole, config.toFile ? config.filePath : "-");
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return false;
    }
}

std::shared_ptr<spdlog::logger> componentLogger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto base = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(name, base->sinks().begin(), base->sinks().end());
    logger->set_level(base->level());
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Зарегистрирован параллельно другим потоком
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
    }
    return logger;
}

LogVerbosityGuard::LogVerbosityGuard(spdlog::level::level_enum floor) : floor_(floor) {}

LogVerbosityGuard::~LogVerbosityGuard() {
    restore();
}

bool LogVerbosityGuard::reduce() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reduced_) {
        return false;
    }
    savedLevels_.clear();
    // apply_all удерживает мьютекс реестра: внутри нельзя вызывать spdlog::get
    spdlog::apply_all([this](std::shared_ptr<spdlog::logger> logger) {
        savedLevels_[logger->name()] = logger->level();
        if (logger->level() < floor_) {
            logger->set_level(floor_);
        }
    });
    reduced_ = true;
    return true;
}

bool LogVerbosityGuard::restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reduced_) {
        return false;
    }
    spdlog::apply_all([this](std::shared_ptr<spdlog::logger> logger) {
        auto it = savedLevels_.find(logger->name());
        if (it != savedLevels_.end()) {
            logger->set_level(it->second);
        }
    });
    savedLevels_.clear();
    reduced_ = false;
    return true;
}

bool LogVerbosityGuard::isReduced() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reduced_;
}

} // namespace logging
} // namespace core
} // namespace resguard
