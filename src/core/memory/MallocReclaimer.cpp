#include "core/memory/Reclaimer.hpp"
#include <algorithm>
#include <climits>
#include <spdlog/spdlog.h>

#ifdef RESGUARD_HAVE_MALLOC_TUNING
    #include <malloc.h>
#endif

namespace resguard {
namespace core {
namespace memory {

MallocReclaimer::MallocReclaimer(const CollectorThresholds& initial) : current_(initial) {}

AllocatorStats MallocReclaimer::stats() const {
    AllocatorStats s;
#ifdef RESGUARD_HAVE_MALLOC_TUNING
    struct mallinfo2 info = ::mallinfo2();
    s.arenaBytes = info.arena;
    s.mmapBytes = info.hblkhd;
    s.inUseBytes = info.uordblks;
    s.freeBytes = info.fordblks;
    s.releasableBytes = info.keepcost;
    s.freeChunks = info.ordblks;
    s.available = true;
#endif
    return s;
}

ReclaimResult MallocReclaimer::collect() {
    ReclaimResult result;
#ifdef RESGUARD_HAVE_MALLOC_TUNING
    std::size_t pad = thresholds().topPad;
    AllocatorStats before = stats();
    result.released = ::malloc_trim(pad) == 1;
    AllocatorStats after = stats();
    if (before.arenaBytes > after.arenaBytes) {
        result.bytesReclaimed = before.arenaBytes - after.arenaBytes;
    }
    if (before.freeBytes > after.freeBytes) {
        result.bytesReclaimed = std::max(result.bytesReclaimed, before.freeBytes - after.freeBytes);
    }
    if (before.freeChunks > after.freeChunks) {
        result.itemsReclaimed = before.freeChunks - after.freeChunks;
    }
#endif
    return result;
}

bool MallocReclaimer::trim() {
#ifdef RESGUARD_HAVE_MALLOC_TUNING
    return ::malloc_trim(0) == 1;
#else
    return false;
#endif
}

bool MallocReclaimer::applyThresholds(const CollectorThresholds& thresholds) {
#ifdef RESGUARD_HAVE_MALLOC_TUNING
    auto toInt = [](std::size_t v) { return static_cast<int>(std::min<std::size_t>(v, INT_MAX)); };
    bool ok = ::mallopt(M_TRIM_THRESHOLD, toInt(thresholds.trimThreshold)) == 1;
    ok = ::mallopt(M_TOP_PAD, toInt(thresholds.topPad)) == 1 && ok;
    // Значение выше HEAP_MAX/2 glibc отвергает
    ok = ::mallopt(M_MMAP_THRESHOLD, toInt(thresholds.mmapThreshold)) == 1 && ok;
    if (ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = thresholds;
    } else {
        spdlog::warn("MallocReclaimer: mallopt отклонил пороги {}", thresholds.toJson().dump());
    }
    return ok;
#else
    (void)thresholds;
    return false;
#endif
}

CollectorThresholds MallocReclaimer::thresholds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace memory
} // namespace core
} // namespace resguard
