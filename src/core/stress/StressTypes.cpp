#include "core/stress/StressTypes.hpp"
#include <algorithm>

namespace resguard {
namespace core {
namespace stress {

std::string toString(StressState state) {
    switch (state) {
        case StressState::Normal: return "NORMAL";
        case StressState::Elevated: return "ELEVATED";
        case StressState::High: return "HIGH";
        case StressState::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

StressState scoreToState(double score) {
    if (score >= kCriticalScore) return StressState::Critical;
    if (score >= kHighScore) return StressState::High;
    if (score >= kElevatedScore) return StressState::Elevated;
    return StressState::Normal;
}

double StressComponents::score() const {
    return std::max({cpu, memory, network});
}

} // namespace stress
} // namespace core
} // namespace resguard
