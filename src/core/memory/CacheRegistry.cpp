#include "core/memory/Clearable.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace memory {

namespace {

bool looksLikeCache(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name.find("cache") != std::string::npos;
}

} // namespace

void CacheRegistry::registerClearable(const std::shared_ptr<Clearable>& cache) {
    if (!cache) return;
    std::lock_guard<std::mutex> lock(mutex_);
    caches_.push_back(cache);
    spdlog::debug("CacheRegistry: зарегистрирован кэш '{}'", cache->cacheName());
}

void CacheRegistry::setHostContext(std::shared_ptr<IHostContext> context) {
    std::lock_guard<std::mutex> lock(mutex_);
    hostContext_ = std::move(context);
}

CacheSweepResult CacheRegistry::sweep() {
    std::vector<std::shared_ptr<Clearable>> live;
    std::shared_ptr<IHostContext> context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        caches_.erase(std::remove_if(caches_.begin(), caches_.end(),
                                     [](const std::weak_ptr<Clearable>& w) { return w.expired(); }),
                      caches_.end());
        for (const auto& weak : caches_) {
            if (auto cache = weak.lock()) live.push_back(std::move(cache));
        }
        context = hostContext_;
    }

    CacheSweepResult result;
    std::set<std::string> seen;
    for (const auto& cache : live) {
        std::string name = cache->cacheName();
        try {
            result.bytesFreedEstimate += cache->clear();
            ++result.cachesCleared;
            result.cleared.push_back(name);
            seen.insert(name);
        } catch (const std::exception& e) {
            ++result.failures;
            spdlog::warn("CacheRegistry: ошибка очистки '{}': {}", name, e.what());
        }
    }

    if (context) {
        std::vector<std::string> names;
        try {
            names = context->resourceNames();
        } catch (const std::exception& e) {
            spdlog::warn("CacheRegistry: хост-контекст недоступен: {}", e.what());
        }
        for (const auto& name : names) {
            if (seen.count(name) || !looksLikeCache(name)) continue;
            try {
                auto op = context->clearOperation(name);
                if (!op) continue;
                result.bytesFreedEstimate += op();
                ++result.cachesCleared;
                result.cleared.push_back(name);
                seen.insert(name);
            } catch (const std::exception& e) {
                ++result.failures;
                spdlog::warn("CacheRegistry: ошибка очистки ресурса '{}': {}", name, e.what());
            }
        }
    }

    spdlog::debug("CacheRegistry: очищено {} кэшей, ~{} байт", result.cachesCleared, result.bytesFreedEstimate);
    return result;
}

std::size_t CacheRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(caches_.begin(), caches_.end(),
                                                  [](const std::weak_ptr<Clearable>& w) { return !w.expired(); }));
}

} // namespace memory
} // namespace core
} // namespace resguard
