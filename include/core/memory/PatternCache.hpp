#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include "core/memory/Clearable.hpp"

namespace resguard {
namespace core {
namespace memory {

// PatternCache: кэш скомпилированных шаблонов вида "api/*" (LRU)
class PatternCache : public Clearable {
public:
    explicit PatternCache(std::size_t maxEntries = 256);

    // Шаблон без '*' сравнивается напрямую; некорректный шаблон не совпадает ни с чем
    bool matches(const std::string& pattern, const std::string& value);

    std::string cacheName() const override { return "pattern_cache"; }
    std::size_t clear() override;
    std::size_t size() const;
    std::size_t hits() const;
    std::size_t misses() const;

private:
    struct Entry {
        std::regex regex;
        std::list<std::string>::iterator order;
    };

    static std::string globToRegex(const std::string& pattern);
    std::size_t estimateBytes() const;

    std::size_t maxEntries_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> order_; // Начало: самый недавно использованный
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace memory
} // namespace core
} // namespace resguard
