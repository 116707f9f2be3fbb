#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace stress {

// Описание фоновой задачи, которую можно приостановить при нагрузке
struct BackgroundTaskDescriptor {
    std::string name;
    std::function<void()> pause;  // Ошибка сообщается исключением
    std::function<void()> resume;
    bool isCritical = false;
    bool paused = false;

    bool pausable() const { return static_cast<bool>(pause) && static_cast<bool>(resume); }
    nlohmann::json toJson() const {
        return {{"name", name}, {"critical", isCritical}, {"pausable", pausable()}, {"paused", paused}};
    }
};

struct TaskSweepResult {
    std::size_t affected = 0; // Приостановлено или возобновлено
    std::size_t skipped = 0;
    std::size_t failed = 0;
};

// BackgroundTaskRegistry: реестр фоновых задач; операции задач вызываются вне блокировки
class BackgroundTaskRegistry {
public:
    // Возвращает признак pausable; задача с тем же именем заменяется
    bool registerTask(const std::string& name, std::function<void()> pause,
                      std::function<void()> resume, bool isCritical = false);
    bool unregisterTask(const std::string& name);
    TaskSweepResult pauseAll();
    // После вызова ни одна задача не помечена приостановленной, даже если resume завершился ошибкой
    TaskSweepResult resumeAll();
    std::vector<BackgroundTaskDescriptor> tasks() const;
    std::size_t pausedCount() const;

private:
    void setPaused(const std::string& name, bool paused);

    mutable std::mutex mutex_;
    std::vector<BackgroundTaskDescriptor> tasks_;
};

} // namespace stress
} // namespace core
} // namespace resguard
