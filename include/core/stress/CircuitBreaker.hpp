#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace stress {

// CircuitBreaker: флаг отказа некритичным запросам, время активации и счетчик срабатываний
class CircuitBreaker {
public:
    bool activate();   // true, если выключатель был неактивен (срабатывание засчитано)
    bool deactivate(); // true, если выключатель был активен
    bool isActive() const;
    std::uint64_t trips() const;
    std::optional<std::chrono::system_clock::time_point> activatedAt() const;
    double activeSeconds() const; // 0, если неактивен
    void resetTrips();
    nlohmann::json toJson() const;

private:
    mutable std::mutex mutex_;
    bool active_ = false;
    std::chrono::system_clock::time_point activatedAt_;
    std::chrono::steady_clock::time_point activatedSteady_;
    std::atomic<std::uint64_t> trips_{0};
};

// RequestThrottle: ограничение допуска запросов (token bucket)
class RequestThrottle {
public:
    explicit RequestThrottle(double requestsPerSecond);
    void enable();
    void disable();
    bool isEnabled() const;
    bool tryAcquire(); // Всегда true, если ограничение выключено
    std::uint64_t rejected() const;

private:
    double rate_;
    double tokens_;
    std::chrono::steady_clock::time_point lastRefill_;
    bool enabled_ = false;
    std::uint64_t rejected_ = 0;
    mutable std::mutex mutex_;
};

} // namespace stress
} // namespace core
} // namespace resguard
