// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/planner.hpp>
#include <unordered_set>

namespace fetchpoint::core {

std::vector<DownloadItem>
dedup_by_key(const std::vector<DownloadItem>& items, std::size_t* duplicates) {
    std::vector<DownloadItem> unique;
    unique.reserve(items.size());
    std::unordered_set<std::string> seen;
    seen.reserve(items.size());

    std::size_t dropped = 0;
    for (const auto& item : items) {
        if (seen.insert(item.key).second) {
            unique.push_back(item);
        } else {
            ++dropped;
        }
    }

    if (duplicates) {
        *duplicates = dropped;
    }
    return unique;
}

std::size_t seed_from_disk(const std::vector<DownloadItem>& items,
                           CheckpointState& state,
                           const TargetResolver& resolver) {
    std::size_t seeded = 0;
    for (const auto& item : items) {
        if (state.is_completed(item.key)) {
            continue;
        }
        if (resolver.is_complete(item.key)) {
            state.items[item.key] = ItemStatus::completed();
            ++seeded;
        }
    }
    return seeded;
}

WorkPlan plan_work(const std::vector<DownloadItem>& items,
                   const CheckpointState& state,
                   RunMode mode,
                   std::uint32_t max_attempts) {
    WorkPlan plan;
    plan.pending.reserve(items.size());

    if (mode == RunMode::clean_start) {
        plan.pending = items;
        return plan;
    }

    for (const auto& item : items) {
        const auto* status = state.find(item.key);
        if (status == nullptr) {
            plan.pending.push_back(item);
            continue;
        }

        if (status->is_completed()) {
            ++plan.already_completed;
            continue;
        }

        if (status->is_failed()) {
            if (mode == RunMode::resume && max_attempts > 0 && status->attempts >= max_attempts) {
                ++plan.capped;
                continue;
            }
            ++plan.previously_failed;
        }

        plan.pending.push_back(item);
    }

    return plan;
}

} // namespace fetchpoint::core
