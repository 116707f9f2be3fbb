#include "core/stress/CircuitBreaker.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace stress {

bool CircuitBreaker::activate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        return false;
    }
    active_ = true;
    activatedAt_ = std::chrono::system_clock::now();
    activatedSteady_ = std::chrono::steady_clock::now();
    trips_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("CircuitBreaker: активирован, некритичные запросы отклоняются");
    return true;
}

bool CircuitBreaker::deactivate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return false;
    }
    active_ = false;
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - activatedSteady_).count();
    spdlog::info("CircuitBreaker: деактивирован после {:.1f} с", seconds);
    return true;
}

bool CircuitBreaker::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::uint64_t CircuitBreaker::trips() const {
    return trips_.load(std::memory_order_relaxed);
}

std::optional<std::chrono::system_clock::time_point> CircuitBreaker::activatedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return std::nullopt;
    return activatedAt_;
}

double CircuitBreaker::activeSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return 0.0;
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - activatedSteady_).count();
}

void CircuitBreaker::resetTrips() {
    trips_ = 0;
}

nlohmann::json CircuitBreaker::toJson() const {
    auto since = activatedAt();
    return {
        {"active", since.has_value()},
        {"activatedAt", since ? nlohmann::json(std::chrono::duration_cast<std::chrono::milliseconds>(
                                    since->time_since_epoch()).count())
                              : nlohmann::json(nullptr)},
        {"activeSeconds", activeSeconds()},
        {"trips", trips()}
    };
}

RequestThrottle::RequestThrottle(double requestsPerSecond)
    : rate_(requestsPerSecond > 0.0 ? requestsPerSecond : 1.0),
      tokens_(std::max(rate_, 1.0)),
      lastRefill_(std::chrono::steady_clock::now()) {}

void RequestThrottle::enable() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        enabled_ = true;
        tokens_ = std::max(rate_, 1.0);
        lastRefill_ = std::chrono::steady_clock::now();
    }
}

void RequestThrottle::disable() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = false;
}

bool RequestThrottle::isEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

bool RequestThrottle::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return true;
    }
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    tokens_ = std::min(std::max(rate_, 1.0), tokens_ + elapsed * rate_);
    lastRefill_ = now;
    if (tokens_ < 1.0) {
        ++rejected_;
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

std::uint64_t RequestThrottle::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

} // namespace stress
} // namespace core
} // namespace resguard
