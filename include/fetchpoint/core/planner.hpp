// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/checkpoint.hpp>
#include <fetchpoint/core/item.hpp>
#include <fetchpoint/core/target_resolver.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

namespace fetchpoint::core {

enum class RunMode : std::uint8_t {
    resume,        // Everything not yet completed
    retry_failed,  // Same, but ignores the attempt cap
    clean_start,   // Discard prior progress, fetch everything
};

[[nodiscard]] constexpr std::string_view to_string(RunMode mode) noexcept {
    switch (mode) {
        case RunMode::resume:       return "resume";
        case RunMode::retry_failed: return "retry-failed";
        case RunMode::clean_start:  return "clean-start";
    }
    return "resume";
}

struct WorkPlan {
    std::vector<DownloadItem> pending;
    std::size_t already_completed{0};
    std::size_t previously_failed{0};  // Failed keys that are queued again
    std::size_t capped{0};             // Failed keys left out by max_attempts
};

// Keep the first occurrence of every key. `duplicates` receives the number dropped.
[[nodiscard]] std::vector<DownloadItem>
dedup_by_key(const std::vector<DownloadItem>& items, std::size_t* duplicates = nullptr);

// Mark items whose target file already satisfies the completeness check as
// completed. Used only when no checkpoint exists. Returns the number seeded.
std::size_t seed_from_disk(const std::vector<DownloadItem>& items,
                           CheckpointState& state,
                           const TargetResolver& resolver);

// Compute the pending set for a run. Pure: no I/O.
// `max_attempts` of 0 means failed keys are retried without limit.
[[nodiscard]] WorkPlan plan_work(const std::vector<DownloadItem>& items,
                                 const CheckpointState& state,
                                 RunMode mode,
                                 std::uint32_t max_attempts = 0);

} // namespace fetchpoint::core
