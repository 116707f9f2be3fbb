#include "core/config/GuardConfig.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace config {

namespace {

const std::vector<std::string> kKnownActions = {
    "reduce_logging", "pause_background", "optimize_memory", "circuit_break", "throttle_requests"};

bool isPercent(double v) { return v > 0.0 && v <= 100.0; }

void readGroup(const nlohmann::json& j, GcConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.thresholdPercent = j.value("thresholdPercent", c.thresholdPercent);
    c.intervalSeconds = j.value("intervalSeconds", c.intervalSeconds);
    c.tuneFactor = j.value("tuneFactor", c.tuneFactor);
    c.tuneThresholds = j.value("tuneThresholds", c.tuneThresholds);
    c.debugFlags = j.value("debugFlags", c.debugFlags);
    c.thresholdBasis = j.value("thresholdBasis", c.thresholdBasis);
    c.referenceMemoryGb = j.value("referenceMemoryGb", c.referenceMemoryGb);
    c.minFactor = j.value("minFactor", c.minFactor);
    c.maxFactor = j.value("maxFactor", c.maxFactor);
    c.baseTrimThresholdBytes = j.value("baseTrimThresholdBytes", c.baseTrimThresholdBytes);
    c.baseTopPadBytes = j.value("baseTopPadBytes", c.baseTopPadBytes);
    c.baseMmapThresholdBytes = j.value("baseMmapThresholdBytes", c.baseMmapThresholdBytes);
    c.minTrimThresholdBytes = j.value("minTrimThresholdBytes", c.minTrimThresholdBytes);
    c.minTopPadBytes = j.value("minTopPadBytes", c.minTopPadBytes);
    c.minMmapThresholdBytes = j.value("minMmapThresholdBytes", c.minMmapThresholdBytes);
    c.estimatedObjectBytes = j.value("estimatedObjectBytes", c.estimatedObjectBytes);
}

void readGroup(const nlohmann::json& j, ThresholdsConfig& c) {
    c.warningPercent = j.value("warningPercent", c.warningPercent);
    c.criticalPercent = j.value("criticalPercent", c.criticalPercent);
    c.emergencyPercent = j.value("emergencyPercent", c.emergencyPercent);
    c.leakPercent = j.value("leakPercent", c.leakPercent);
    c.spikeThresholdMb = j.value("spikeThresholdMb", c.spikeThresholdMb);
}

void readGroup(const nlohmann::json& j, MonitoringConfig& c) {
    c.intervalSeconds = j.value("intervalSeconds", c.intervalSeconds);
    c.historySize = j.value("historySize", c.historySize);
    c.hardwareRefreshTicks = j.value("hardwareRefreshTicks", c.hardwareRefreshTicks);
    c.diskPath = j.value("diskPath", c.diskPath);
}

void readGroup(const nlohmann::json& j, StressConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.normalCheckInterval = j.value("normalCheckInterval", c.normalCheckInterval);
    c.stressCheckInterval = j.value("stressCheckInterval", c.stressCheckInterval);
    c.stressDurationSeconds = j.value("stressDurationSeconds", c.stressDurationSeconds);
    c.cpuThresholdPercent = j.value("cpuThresholdPercent", c.cpuThresholdPercent);
    c.networkThresholdMBs = j.value("networkThresholdMBs", c.networkThresholdMBs);
    c.criticalEndpoints = j.value("criticalEndpoints", c.criticalEndpoints);
    c.stressActions = j.value("stressActions", c.stressActions);
    c.maxStressTime = j.value("maxStressTime", c.maxStressTime);
    c.throttleRequestsPerSecond = j.value("throttleRequestsPerSecond", c.throttleRequestsPerSecond);
}

void readGroup(const nlohmann::json& j, ApiConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.endpointPrefix = j.value("endpointPrefix", c.endpointPrefix);
    c.detailedEndpoints = j.value("detailedEndpoints", c.detailedEndpoints);
    c.managementEndpoints = j.value("managementEndpoints", c.managementEndpoints);
    if (j.contains("authToken") && !j["authToken"].is_null()) {
        c.authToken = j["authToken"].get<std::string>();
    }
    c.corsOrigins = j.value("corsOrigins", c.corsOrigins);
}

void readGroup(const nlohmann::json& j, LoggingConfig& c) {
    c.level = j.value("level", c.level);
    c.toConsole = j.value("toConsole", c.toConsole);
    c.toFile = j.value("toFile", c.toFile);
    c.filePath = j.value("filePath", c.filePath);
    c.maxFileSizeMb = j.value("maxFileSizeMb", c.maxFileSizeMb);
    c.maxFiles = j.value("maxFiles", c.maxFiles);
}

template <typename Group>
void readOptionalGroup(const nlohmann::json& root, const char* key, Group& group) {
    if (root.contains(key) && root[key].is_object()) {
        readGroup(root[key], group);
    }
}

} // namespace

bool GcConfig::validate() const {
    if (!isPercent(thresholdPercent)) return false;
    if (intervalSeconds < 0.0) return false;
    if (tuneFactor <= 0.0) return false;
    if (thresholdBasis != "process" && thresholdBasis != "system") return false;
    if (referenceMemoryGb <= 0.0) return false;
    if (minFactor <= 0.0 || maxFactor < minFactor) return false;
    if (minTrimThresholdBytes == 0 || minTopPadBytes == 0 || minMmapThresholdBytes == 0) return false;
    return true;
}

bool ThresholdsConfig::validate() const {
    if (!isPercent(warningPercent) || !isPercent(criticalPercent) || !isPercent(emergencyPercent)) return false;
    if (warningPercent > criticalPercent || criticalPercent > emergencyPercent) return false;
    if (leakPercent <= 0.0) return false;
    return spikeThresholdMb > 0.0;
}

bool MonitoringConfig::validate() const {
    return intervalSeconds > 0.0 && historySize > 0 && hardwareRefreshTicks > 0 && !diskPath.empty();
}

bool StressConfig::validate() const {
    if (normalCheckInterval <= 0.0 || stressCheckInterval <= 0.0) return false;
    if (stressDurationSeconds < 0.0 || maxStressTime < 0.0) return false;
    if (cpuThresholdPercent <= 0.0 || networkThresholdMBs <= 0.0) return false;
    if (throttleRequestsPerSecond <= 0.0) return false;
    for (const auto& action : stressActions) {
        if (action.empty()) return false;
    }
    return true;
}

bool ApiConfig::validate() const {
    return endpointPrefix.empty() || endpointPrefix.front() == '/';
}

bool LoggingConfig::validate() const {
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warning", "warn", "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), level) == levels.end()) return false;
    if (toFile && (filePath.empty() || maxFileSizeMb == 0 || maxFiles == 0)) return false;
    return true;
}

bool GuardConfig::validate() const {
    return gc.validate() && thresholds.validate() && monitoring.validate() &&
           stress.validate() && api.validate() && logging.validate();
}

nlohmann::json GuardConfig::toJson() const {
    return {
        {"gc", {
            {"enabled", gc.enabled},
            {"thresholdPercent", gc.thresholdPercent},
            {"intervalSeconds", gc.intervalSeconds},
            {"tuneFactor", gc.tuneFactor},
            {"tuneThresholds", gc.tuneThresholds},
            {"debugFlags", gc.debugFlags},
            {"thresholdBasis", gc.thresholdBasis},
            {"referenceMemoryGb", gc.referenceMemoryGb},
            {"minFactor", gc.minFactor},
            {"maxFactor", gc.maxFactor},
            {"baseTrimThresholdBytes", gc.baseTrimThresholdBytes},
            {"baseTopPadBytes", gc.baseTopPadBytes},
            {"baseMmapThresholdBytes", gc.baseMmapThresholdBytes},
            {"minTrimThresholdBytes", gc.minTrimThresholdBytes},
            {"minTopPadBytes", gc.minTopPadBytes},
            {"minMmapThresholdBytes", gc.minMmapThresholdBytes},
            {"estimatedObjectBytes", gc.estimatedObjectBytes}
        }},
        {"thresholds", {
            {"warningPercent", thresholds.warningPercent},
            {"criticalPercent", thresholds.criticalPercent},
            {"emergencyPercent", thresholds.emergencyPercent},
            {"leakPercent", thresholds.leakPercent},
            {"spikeThresholdMb", thresholds.spikeThresholdMb}
        }},
        {"monitoring", {
            {"intervalSeconds", monitoring.intervalSeconds},
            {"historySize", monitoring.historySize},
            {"hardwareRefreshTicks", monitoring.hardwareRefreshTicks},
            {"diskPath", monitoring.diskPath}
        }},
        {"stress", {
            {"enabled", stress.enabled},
            {"normalCheckInterval", stress.normalCheckInterval},
            {"stressCheckInterval", stress.stressCheckInterval},
            {"stressDurationSeconds", stress.stressDurationSeconds},
            {"cpuThresholdPercent", stress.cpuThresholdPercent},
            {"networkThresholdMBs", stress.networkThresholdMBs},
            {"criticalEndpoints", stress.criticalEndpoints},
            {"stressActions", stress.stressActions},
            {"maxStressTime", stress.maxStressTime},
            {"throttleRequestsPerSecond", stress.throttleRequestsPerSecond}
        }},
        {"api", {
            {"enabled", api.enabled},
            {"endpointPrefix", api.endpointPrefix},
            {"detailedEndpoints", api.detailedEndpoints},
            {"managementEndpoints", api.managementEndpoints},
            {"authTokenConfigured", !api.authToken.empty()}, // сам токен не выводится
            {"corsOrigins", api.corsOrigins}
        }},
        {"logging", {
            {"level", logging.level},
            {"toConsole", logging.toConsole},
            {"toFile", logging.toFile},
            {"filePath", logging.filePath},
            {"maxFileSizeMb", logging.maxFileSizeMb},
            {"maxFiles", logging.maxFiles}
        }}
    };
}

GuardConfig GuardConfig::fromJson(const nlohmann::json& j) {
    GuardConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    readOptionalGroup(j, "gc", cfg.gc);
    readOptionalGroup(j, "thresholds", cfg.thresholds);
    readOptionalGroup(j, "monitoring", cfg.monitoring);
    readOptionalGroup(j, "stress", cfg.stress);
    readOptionalGroup(j, "api", cfg.api);
    readOptionalGroup(j, "logging", cfg.logging);
    for (const auto& action : cfg.stress.stressActions) {
        if (std::find(kKnownActions.begin(), kKnownActions.end(), action) == kKnownActions.end()) {
            spdlog::debug("GuardConfig: действие '{}' должно быть зарегистрировано отдельно", action);
        }
    }
    return cfg;
}

GuardConfig GuardConfig::loadFromFile(const std::string& path) {
    try {
        if (path.empty() || !std::filesystem::exists(path)) {
            spdlog::warn("GuardConfig: файл конфигурации '{}' не найден, используются значения по умолчанию", path);
            return GuardConfig{};
        }
        std::ifstream file(path);
        if (!file) {
            spdlog::warn("GuardConfig: не удалось открыть '{}', используются значения по умолчанию", path);
            return GuardConfig{};
        }
        nlohmann::json j;
        file >> j;
        GuardConfig cfg = fromJson(j);
        if (!cfg.validate()) {
            spdlog::warn("GuardConfig: конфигурация '{}' не прошла проверку, используются значения по умолчанию", path);
            return GuardConfig{};
        }
        spdlog::info("GuardConfig: конфигурация загружена из {}", path);
        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("GuardConfig: ошибка чтения '{}': {}", path, e.what());
        return GuardConfig{};
    }
}

} // namespace config
} // namespace core
} // namespace resguard
