#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace resguard {
namespace core {
namespace stress {

// Идентичность запроса для проверки списка критичных эндпоинтов
struct RequestContext {
    std::string endpoint; // Имя обработчика
    std::string path;     // Путь запроса
};

struct GateDecision {
    bool allowed = true;
    int statusCode = 200;
    std::string message;

    static GateDecision allow() { return GateDecision{}; }
    static GateDecision reject(int status, std::string text) { return GateDecision{false, status, std::move(text)}; }
    nlohmann::json toJson() const {
        return {{"allowed", allowed}, {"status", statusCode}, {"message", message}};
    }
};

using PreRequestGate = std::function<GateDecision(const RequestContext&)>;

// IRequestPipeline: конвейер обработки запросов хоста, в который устанавливается предварительная проверка
class IRequestPipeline {
public:
    virtual ~IRequestPipeline() = default;
    virtual void addPreRequestGate(PreRequestGate gate) = 0;
};

} // namespace stress
} // namespace core
} // namespace resguard
