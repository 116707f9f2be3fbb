#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace memory {

// Clearable: структура, которую можно очистить для освобождения памяти
class Clearable {
public:
    virtual ~Clearable() = default;
    virtual std::string cacheName() const = 0;
    virtual std::size_t clear() = 0; // Оценка освобожденных байт
};

// IHostContext: именованные ресурсы хост-приложения для эвристического обхода
class IHostContext {
public:
    virtual ~IHostContext() = default;
    virtual std::vector<std::string> resourceNames() const = 0;
    // Пустая функция, если у ресурса нет операции очистки
    virtual std::function<std::size_t()> clearOperation(const std::string& name) = 0;
};

struct CacheSweepResult {
    std::size_t cachesCleared = 0;
    std::size_t bytesFreedEstimate = 0;
    std::vector<std::string> cleared; // Имена очищенных структур
    std::size_t failures = 0;

    nlohmann::json toJson() const {
        return {
            {"cachesCleared", cachesCleared},
            {"bytesFreedEstimate", bytesFreedEstimate},
            {"cleared", cleared},
            {"failures", failures}
        };
    }
};

// CacheRegistry: реестр очищаемых структур одного оптимизатора.
// Хранит weak_ptr: реестр не продлевает жизнь зарегистрированных кэшей.
// Обход хост-контекста по имени ("cache" в названии) эвристический и не находит всё.
class CacheRegistry {
public:
    void registerClearable(const std::shared_ptr<Clearable>& cache);
    void setHostContext(std::shared_ptr<IHostContext> context);
    CacheSweepResult sweep();
    std::size_t size() const; // Живые зарегистрированные кэши

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Clearable>> caches_;
    std::shared_ptr<IHostContext> hostContext_;
};

} // namespace memory
} // namespace core
} // namespace resguard
