#include "core/memory/PatternCache.hpp"
#include <spdlog/spdlog.h>

namespace resguard {
namespace core {
namespace memory {

namespace {
// Скомпилированный std::regex заметно больше исходной строки
constexpr std::size_t kCompiledEntryBytes = 512;
}

PatternCache::PatternCache(std::size_t maxEntries) : maxEntries_(maxEntries ? maxEntries : 1) {}

std::string PatternCache::globToRegex(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() * 2);
    for (char c : pattern) {
        switch (c) {
            case '*': out += ".*"; break;
            case '?': out += '.'; break;
            case '.': case '+': case '(': case ')': case '[': case ']':
            case '{': case '}': case '^': case '$': case '|': case '\\':
                out += '\\';
                out += c;
                break;
            default: out += c;
        }
    }
    return out;
}

bool PatternCache::matches(const std::string& pattern, const std::string& value) {
    if (pattern.find_first_of("*?") == std::string::npos) {
        return pattern == value;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(pattern);
    if (it != entries_.end()) {
        ++hits_;
        order_.splice(order_.begin(), order_, it->second.order);
        return std::regex_match(value, it->second.regex);
    }
    ++misses_;
    try {
        std::regex compiled(globToRegex(pattern));
        bool result = std::regex_match(value, compiled);
        order_.push_front(pattern);
        entries_.emplace(pattern, Entry{std::move(compiled), order_.begin()});
        while (entries_.size() > maxEntries_) {
            entries_.erase(order_.back());
            order_.pop_back();
        }
        return result;
    } catch (const std::regex_error& e) {
        spdlog::warn("PatternCache: некорректный шаблон '{}': {}", pattern, e.what());
        return false;
    }
}

std::size_t PatternCache::estimateBytes() const {
    std::size_t bytes = 0;
    for (const auto& key : order_) {
        bytes += kCompiledEntryBytes + key.size() * 2;
    }
    return bytes;
}

std::size_t PatternCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t freed = estimateBytes();
    entries_.clear();
    order_.clear();
    return freed;
}

std::size_t PatternCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t PatternCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t PatternCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace memory
} // namespace core
} // namespace resguard
