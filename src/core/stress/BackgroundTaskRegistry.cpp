#include "core/stress/BackgroundTaskRegistry.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace stress {

bool BackgroundTaskRegistry::registerTask(const std::string& name, std::function<void()> pause,
                                          std::function<void()> resume, bool isCritical) {
    BackgroundTaskDescriptor task;
    task.name = name;
    task.pause = std::move(pause);
    task.resume = std::move(resume);
    task.isCritical = isCritical;
    bool pausable = task.pausable();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&name](const BackgroundTaskDescriptor& t) { return t.name == name; });
    if (it != tasks_.end()) {
        spdlog::warn("BackgroundTaskRegistry: задача '{}' перерегистрирована", name);
        *it = std::move(task);
    } else {
        tasks_.push_back(std::move(task));
    }
    spdlog::info("BackgroundTaskRegistry: зарегистрирована задача '{}' (pausable={}, critical={})",
                 name, pausable, isCritical);
    return pausable;
}

bool BackgroundTaskRegistry::unregisterTask(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&name](const BackgroundTaskDescriptor& t) { return t.name == name; });
    if (it == tasks_.end()) {
        return false;
    }
    tasks_.erase(it);
    return true;
}

void BackgroundTaskRegistry::setPaused(const std::string& name, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
        if (task.name == name) {
            task.paused = paused;
        }
    }
}

TaskSweepResult BackgroundTaskRegistry::pauseAll() {
    TaskSweepResult result;
    for (const auto& task : tasks()) {
        if (!task.pausable() || task.paused) {
            ++result.skipped;
            continue;
        }
        try {
            task.pause();
            setPaused(task.name, true);
            ++result.affected;
            spdlog::info("BackgroundTaskRegistry: задача '{}' приостановлена", task.name);
        } catch (const std::exception& e) {
            ++result.failed;
            spdlog::error("BackgroundTaskRegistry: ошибка приостановки '{}': {}", task.name, e.what());
        } catch (...) {
            ++result.failed;
            spdlog::error("BackgroundTaskRegistry: неизвестная ошибка приостановки '{}'", task.name);
        }
    }
    return result;
}

TaskSweepResult BackgroundTaskRegistry::resumeAll() {
    TaskSweepResult result;
    for (const auto& task : tasks()) {
        if (!task.paused) {
            ++result.skipped;
            continue;
        }
        try {
            task.resume();
            ++result.affected;
            spdlog::info("BackgroundTaskRegistry: задача '{}' возобновлена", task.name);
        } catch (const std::exception& e) {
            ++result.failed;
            spdlog::error("BackgroundTaskRegistry: ошибка возобновления '{}': {}", task.name, e.what());
        } catch (...) {
            ++result.failed;
            spdlog::error("BackgroundTaskRegistry: неизвестная ошибка возобновления '{}'", task.name);
        }
        setPaused(task.name, false);
    }
    return result;
}

std::vector<BackgroundTaskDescriptor> BackgroundTaskRegistry::tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

std::size_t BackgroundTaskRegistry::pausedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                                  [](const BackgroundTaskDescriptor& t) { return t.paused; }));
}

} // namespace stress
} // namespace core
} // namespace resguard
