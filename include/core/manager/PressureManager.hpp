#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/GuardConfig.hpp"
#include "core/memory/Clearable.hpp"
#include "core/memory/MemoryOptimizer.hpp"
#include "core/memory/Reclaimer.hpp"
#include "core/monitor/CounterSource.hpp"
#include "core/monitor/ResourceDetector.hpp"
#include "core/stress/RequestPipeline.hpp"
#include "core/stress/StressHandler.hpp"

namespace resguard {
namespace core {
namespace manager {

// PressureManager: фасад контроллера нагрузки для транспортного слоя хоста.
// Владеет детектором, оптимизатором и обработчиком нагрузки; ответы в JSON.
class PressureManager {
public:
    explicit PressureManager(const config::GuardConfig& config = config::GuardConfig{},
                             std::shared_ptr<monitor::ICounterSource> source = nullptr,
                             std::shared_ptr<memory::IReclaimer> reclaimer = nullptr);
    ~PressureManager();
    PressureManager(const PressureManager&) = delete;
    PressureManager& operator=(const PressureManager&) = delete;

    bool start(); // Запуск фоновых циклов
    void stop();
    bool isRunning() const;

    bool registerBackgroundTask(const std::string& name, std::function<void()> pause,
                                std::function<void()> resume, bool isCritical = false);
    void registerClearable(const std::shared_ptr<memory::Clearable>& cache);
    void setHostContext(std::shared_ptr<memory::IHostContext> context);
    void attachRequestPipeline(stress::IRequestPipeline& pipeline);

    // Чтение
    nlohmann::json currentStatus() const;
    nlohmann::json systemFacts() const;
    nlohmann::json usageHistory(std::size_t minutes) const;
    nlohmann::json growthReport();
    nlohmann::json metrics() const;

    // Управление
    nlohmann::json optimize(const std::string& level);
    nlohmann::json setMemoryLimit(std::size_t limitMb);
    void resetMetrics();
    bool authorizeManagement(const std::string& token) const;

    const config::GuardConfig& configuration() const;
    std::shared_ptr<monitor::ResourceDetector> detector() const;
    std::shared_ptr<memory::MemoryOptimizer> optimizer() const;
    std::shared_ptr<stress::StressHandler> stressHandler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace manager
} // namespace core
} // namespace resguard
