// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace mirror::core {

// Shared cancellation flag. Copies observe the same flag.
// The flag itself is lock-free so a signal handler may set it.
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] bool cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    void cancel() const noexcept {
        flag_->store(true, std::memory_order_release);
    }

    void reset() const noexcept {
        flag_->store(false, std::memory_order_release);
    }

    // Sleep in short slices, returning early on cancellation.
    // Returns false if the token was cancelled.
    bool sleep_for(std::chrono::milliseconds duration) const noexcept;

    // Raw flag for async-signal-safe access
    [[nodiscard]] std::atomic<bool>* native_flag() const noexcept { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace mirror::core
