#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace relay::runtime {

// Sleeps for `duration` in slices, returning false as soon as the cancel
// token is observed set. A null token never cancels.
inline bool wait_for(const std::chrono::milliseconds duration,
                     const std::shared_ptr<std::atomic_bool>& cancel_token,
                     const std::chrono::milliseconds slice = std::chrono::milliseconds(50)) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (true) {
        if (cancel_token && cancel_token->load()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(
            std::max(std::chrono::milliseconds(1), std::min(slice, remaining)));
    }
}

}  // namespace relay::runtime
