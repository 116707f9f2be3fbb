#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace config {

// Настройки проходов освобождения памяти и тюнинга аллокатора
struct GcConfig {
    bool enabled = true;                       // Периодические проходы
    double thresholdPercent = 70.0;            // Порог памяти для непринудительного прохода, %
    double intervalSeconds = 300.0;            // Интервал периодического прохода
    double tuneFactor = 0.8;                   // Множитель тюнинга порогов
    bool tuneThresholds = true;                // Тюнинг порогов аллокатора при старте
    int debugFlags = 0;                        // Битовая маска отладочного логирования
    std::string thresholdBasis = "process";    // "process" или "system"
    double referenceMemoryGb = 4.0;            // Объем памяти, соответствующий коэффициенту 1.0
    double minFactor = 0.5;                    // Нижняя граница коэффициента
    double maxFactor = 2.0;                    // Верхняя граница коэффициента
    std::size_t baseTrimThresholdBytes = 128 * 1024;
    std::size_t baseTopPadBytes = 128 * 1024;
    std::size_t baseMmapThresholdBytes = 128 * 1024;
    std::size_t minTrimThresholdBytes = 64 * 1024;   // Минимальные значения после тюнинга
    std::size_t minTopPadBytes = 16 * 1024;
    std::size_t minMmapThresholdBytes = 64 * 1024;
    std::size_t estimatedObjectBytes = 100;    // Оценка размера одного освобожденного блока

    bool validate() const;
};

// Пороги памяти, %
struct ThresholdsConfig {
    double warningPercent = 70.0;
    double criticalPercent = 85.0;
    double emergencyPercent = 95.0;
    double leakPercent = 10.0;        // Рост памяти в час, при котором фиксируется утечка
    double spikeThresholdMb = 50.0;   // Прирост RSS между выборками, считающийся всплеском

    bool validate() const;
};

struct MonitoringConfig {
    double intervalSeconds = 5.0;
    std::size_t historySize = 720;          // 1 час при интервале 5 секунд
    std::size_t hardwareRefreshTicks = 120; // Обновление аппаратных данных каждые N тиков
    std::string diskPath = "/";             // Точка монтирования для статистики диска

    bool validate() const;
};

struct StressConfig {
    bool enabled = true;
    double normalCheckInterval = 5.0;    // Интервал проверки в обычном режиме, с
    double stressCheckInterval = 1.0;    // Интервал проверки под нагрузкой, с
    double stressDurationSeconds = 30.0; // Длительность, после которой нагрузка считается устойчивой
    double cpuThresholdPercent = 95.0;
    double networkThresholdMBs = 250.0;
    std::vector<std::string> criticalEndpoints;
    std::vector<std::string> stressActions = {
        "reduce_logging", "pause_background", "optimize_memory", "circuit_break", "throttle_requests"};
    double maxStressTime = 300.0;        // 0 отключает аварийную эскалацию
    double throttleRequestsPerSecond = 50.0;

    bool validate() const;
};

// Используется внешним транспортным слоем и проверкой токена управления
struct ApiConfig {
    bool enabled = true;
    std::string endpointPrefix = "/memory";
    bool detailedEndpoints = true;
    bool managementEndpoints = false;
    std::string authToken;
    std::vector<std::string> corsOrigins = {"*"};

    bool validate() const;
};

struct LoggingConfig {
    std::string level = "info";
    bool toConsole = true;
    bool toFile = false;
    std::string filePath = "logs/resguard.log";
    std::size_t maxFileSizeMb = 100;
    std::size_t maxFiles = 10;

    bool validate() const;
};

// GuardConfig: полная конфигурация контроллера нагрузки
struct GuardConfig {
    GcConfig gc;
    ThresholdsConfig thresholds;
    MonitoringConfig monitoring;
    StressConfig stress;
    ApiConfig api;
    LoggingConfig logging;

    bool validate() const;
    nlohmann::json toJson() const;
    // Отсутствующие ключи сохраняют значения по умолчанию; ошибки типов выбрасывают nlohmann::json::exception
    static GuardConfig fromJson(const nlohmann::json& j);
    // Никогда не выбрасывает: при ошибке возвращает конфигурацию по умолчанию
    static GuardConfig loadFromFile(const std::string& path);
};

} // namespace config
} // namespace core
} // namespace resguard
