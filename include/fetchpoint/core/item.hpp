// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace fetchpoint::core {

// One record to fetch. `key` names both the output file and the checkpoint entry.
struct DownloadItem {
    std::string key;
    std::string url;
    std::string title;
};

enum class ItemState : std::uint8_t {
    pending,
    in_progress,
    completed,
    failed,
};

struct ItemStatus {
    ItemState state{ItemState::pending};
    std::string reason;          // Last failure reason (failed only)
    std::uint32_t attempts{0};   // Failed fetch attempts so far

    [[nodiscard]] static ItemStatus completed() { return {ItemState::completed, {}, 0}; }
    [[nodiscard]] static ItemStatus failed(std::string why, std::uint32_t attempt_count) {
        return {ItemState::failed, std::move(why), attempt_count};
    }

    [[nodiscard]] bool is_completed() const noexcept { return state == ItemState::completed; }
    [[nodiscard]] bool is_failed() const noexcept { return state == ItemState::failed; }
};

[[nodiscard]] constexpr std::string_view to_string(ItemState state) noexcept {
    switch (state) {
        case ItemState::pending:     return "pending";
        case ItemState::in_progress: return "in_progress";
        case ItemState::completed:   return "completed";
        case ItemState::failed:      return "failed";
    }
    return "pending";
}

} // namespace fetchpoint::core
