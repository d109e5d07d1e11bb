// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/sync_types.hpp>

namespace mirror::core {

const char* to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::success:   return "success";
        case TransferStatus::failed:    return "failed";
        case TransferStatus::cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::success:   return "success";
        case SyncStatus::failed:    return "failed";
        case SyncStatus::cancelled: return "cancelled";
        case SyncStatus::declined:  return "declined";
    }
    return "unknown";
}

const char* to_string(RunState state) noexcept {
    switch (state) {
        case RunState::idle:                  return "idle";
        case RunState::listing:               return "listing";
        case RunState::planning:              return "planning";
        case RunState::awaiting_confirmation: return "awaiting_confirmation";
        case RunState::transferring:          return "transferring";
        case RunState::summarizing:           return "summarizing";
        case RunState::done:                  return "done";
        case RunState::cancelled:             return "cancelled";
    }
    return "unknown";
}

} // namespace mirror::core
