#pragma once

#include <mutex>
#include <type_traits>
#include <utility>

namespace pipemcp {

// ═══════════════════════════════════════════════════════════════════════════
// RequestSerializer
// ═══════════════════════════════════════════════════════════════════════════
// Capacity-one gate around a write+read exchange. Responses on stdout carry
// no ordering guarantee beyond arrival order, so two overlapping exchanges
// could consume each other's replies.

class RequestSerializer {
public:
    RequestSerializer() = default;

    RequestSerializer(const RequestSerializer&) = delete;
    RequestSerializer& operator=(const RequestSerializer&) = delete;

    /// Blocks until the gate is free; released when the lock goes away
    [[nodiscard]] std::unique_lock<std::mutex> acquire() {
        return std::unique_lock<std::mutex>(mutex_);
    }

    /// Non-blocking variant; the lock is unlocked if the gate was busy
    [[nodiscard]] std::unique_lock<std::mutex> try_acquire() {
        return std::unique_lock<std::mutex>(mutex_, std::try_to_lock);
    }

    /// Run `fn` while holding the gate
    template <typename Fn>
    auto run(Fn&& fn) -> std::invoke_result_t<Fn> {
        std::lock_guard lock(mutex_);
        return std::forward<Fn>(fn)();
    }

private:
    std::mutex mutex_;
};

}  // namespace pipemcp
