#pragma once

#include <cstddef>
#include <mutex>
#include <nlohmann/json.hpp>

#if defined(__GLIBC__)
    #define RESGUARD_HAVE_MALLOC_TUNING
#endif

namespace resguard {
namespace core {
namespace memory {

// Пороги аллокатора, управляющие частотой возврата памяти ОС
struct CollectorThresholds {
    std::size_t trimThreshold = 0; // M_TRIM_THRESHOLD
    std::size_t topPad = 0;        // M_TOP_PAD
    std::size_t mmapThreshold = 0; // M_MMAP_THRESHOLD

    nlohmann::json toJson() const {
        return {{"trimThreshold", trimThreshold}, {"topPad", topPad}, {"mmapThreshold", mmapThreshold}};
    }
};

// Живые счетчики аллокатора
struct AllocatorStats {
    std::size_t arenaBytes = 0;     // Выделено из ОС через brk
    std::size_t mmapBytes = 0;      // Выделено через mmap
    std::size_t inUseBytes = 0;     // Занято пользователем
    std::size_t freeBytes = 0;      // Свободно внутри кучи
    std::size_t releasableBytes = 0; // Можно вернуть с вершины кучи
    std::size_t freeChunks = 0;
    bool available = false;

    nlohmann::json toJson() const {
        return {
            {"available", available},
            {"arenaBytes", arenaBytes},
            {"mmapBytes", mmapBytes},
            {"inUseBytes", inUseBytes},
            {"freeBytes", freeBytes},
            {"releasableBytes", releasableBytes},
            {"freeChunks", freeChunks}
        };
    }
};

struct ReclaimResult {
    bool released = false;          // Память возвращена ОС
    std::size_t itemsReclaimed = 0; // Освобожденные свободные блоки
    std::size_t bytesReclaimed = 0;
};

// IReclaimer: примитив освобождения памяти процесса
class IReclaimer {
public:
    virtual ~IReclaimer() = default;
    virtual ReclaimResult collect() = 0; // Проход с сохранением запаса вершины кучи
    virtual bool trim() = 0;             // Полный возврат свободной памяти ОС
    virtual AllocatorStats stats() const = 0;
    virtual bool applyThresholds(const CollectorThresholds& thresholds) = 0;
    virtual CollectorThresholds thresholds() const = 0;
};

// MallocReclaimer: malloc_trim, mallopt и mallinfo2 из glibc
class MallocReclaimer : public IReclaimer {
public:
    explicit MallocReclaimer(const CollectorThresholds& initial);

    ReclaimResult collect() override;
    bool trim() override;
    AllocatorStats stats() const override;
    bool applyThresholds(const CollectorThresholds& thresholds) override;
    CollectorThresholds thresholds() const override;

private:
    CollectorThresholds current_; // glibc не позволяет прочитать пороги обратно
    mutable std::mutex mutex_;
};

} // namespace memory
} // namespace core
} // namespace resguard
