#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace stress {

// Состояния упорядочены по тяжести
enum class StressState { Normal = 0, Elevated = 1, High = 2, Critical = 3 };

constexpr double kElevatedScore = 1.0;
constexpr double kHighScore = 1.2;
constexpr double kCriticalScore = 1.5;

std::string toString(StressState state);
StressState scoreToState(double score); // Нижние границы нестрогие

// Составляющие оценки нагрузки: отношение наблюдаемого значения к порогу
struct StressComponents {
    double cpu = 0.0;
    double memory = 0.0;
    double network = 0.0;

    double score() const;
    nlohmann::json toJson() const {
        return {{"cpu", cpu}, {"memory", memory}, {"network", network}, {"score", score()}};
    }
};

// Имена действий при нагрузке
namespace actions {
constexpr const char* kReduceLogging = "reduce_logging";
constexpr const char* kPauseBackground = "pause_background";
constexpr const char* kOptimizeMemory = "optimize_memory";
constexpr const char* kCircuitBreak = "circuit_break";
constexpr const char* kThrottleRequests = "throttle_requests";
constexpr const char* kCollect = "collect"; // Непринудительный проход, всегда при ELEVATED
} // namespace actions

} // namespace stress
} // namespace core
} // namespace resguard
