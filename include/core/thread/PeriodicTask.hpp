#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace resguard {
namespace core {
namespace thread {

// PeriodicTask: фоновый поток с периодическим вызовом и кооперативной остановкой.
// Тело возвращает задержку до следующей итерации, что позволяет менять частоту опроса.
// Исключение в итерации логируется и не прерывает цикл.
class PeriodicTask {
public:
    using Body = std::function<std::chrono::milliseconds()>;

    explicit PeriodicTask(std::string name); // Конструктор
    ~PeriodicTask(); // Деструктор: останавливает и дожидается потока
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    bool start(Body body); // false, если уже запущена
    // Сигнал остановки и ожидание завершения не дольше joinTimeout.
    // false, если поток не успел завершиться: он будет присоединен при следующем start() или в деструкторе.
    bool stop(std::chrono::milliseconds joinTimeout = std::chrono::milliseconds(2000));
    bool isRunning() const;
    const std::string& name() const { return name_; }
    std::size_t iterations() const; // Выполненные итерации
    std::size_t failures() const;   // Итерации, завершившиеся исключением

private:
    void run(Body body);

    std::string name_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> iterations_{0};
    std::atomic<std::size_t> failures_{0};
    bool stopRequested_ = false;
    bool finished_ = true;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace thread
} // namespace core
} // namespace resguard
