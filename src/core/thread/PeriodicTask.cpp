#include "core/thread/PeriodicTask.hpp"
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace thread {

PeriodicTask::PeriodicTask(std::string name) : name_(std::move(name)) {}

PeriodicTask::~PeriodicTask() {
    stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool PeriodicTask::start(Body body) {
    if (!body) {
        spdlog::error("PeriodicTask[{}]: пустое тело задачи", name_);
        return false;
    }
    if (running_.load()) {
        spdlog::warn("PeriodicTask[{}]: уже запущена", name_);
        return false;
    }
    if (worker_.joinable()) {
        // Предыдущий поток не успел завершиться в stop()
        worker_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
        finished_ = false;
    }
    running_ = true;
    worker_ = std::thread(&PeriodicTask::run, this, std::move(body));
    spdlog::debug("PeriodicTask[{}]: запущена", name_);
    return true;
}

bool PeriodicTask::stop(std::chrono::milliseconds joinTimeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!worker_.joinable()) {
        return true;
    }
    stopRequested_ = true;
    cv_.notify_all();
    bool done = cv_.wait_for(lock, joinTimeout, [this] { return finished_; });
    lock.unlock();
    if (!done) {
        spdlog::warn("PeriodicTask[{}]: поток не завершился за {} мс", name_, joinTimeout.count());
        return false;
    }
    worker_.join();
    spdlog::debug("PeriodicTask[{}]: остановлена", name_);
    return true;
}

bool PeriodicTask::isRunning() const {
    return running_.load();
}

std::size_t PeriodicTask::iterations() const {
    return iterations_.load(std::memory_order_relaxed);
}

std::size_t PeriodicTask::failures() const {
    return failures_.load(std::memory_order_relaxed);
}

void PeriodicTask::run(Body body) {
    while (true) {
        std::chrono::milliseconds delay(1000);
        try {
            delay = body();
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("PeriodicTask[{}]: ошибка итерации: {}", name_, e.what());
        } catch (...) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("PeriodicTask[{}]: неизвестная ошибка итерации", name_);
        }
        iterations_.fetch_add(1, std::memory_order_relaxed);
        if (delay.count() < 1) {
            delay = std::chrono::milliseconds(1);
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, delay, [this] { return stopRequested_; })) {
            break;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        finished_ = true;
    }
    cv_.notify_all();
}

} // namespace thread
} // namespace core
} // namespace resguard
