// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/cancellation.hpp>
#include <mirror/core/config.hpp>
#include <algorithm>
#include <thread>

namespace mirror::core {

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const noexcept {
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, CANCEL_POLL_INTERVAL);
        std::this_thread::sleep_for(slice);
    }
    return false;
}

} // namespace mirror::core
