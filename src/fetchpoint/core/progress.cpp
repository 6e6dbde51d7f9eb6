// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/progress.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fetchpoint::core {

void ProgressReporter::begin(std::uint64_t total,
                             std::uint64_t baseline_completed,
                             std::uint64_t queued) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = {};
    progress_.total = total;
    progress_.baseline_completed = baseline_completed;
    progress_.queued = queued;
    progress_.start_time = std::chrono::steady_clock::now();
    progress_.last_update = progress_.start_time;
    if (total > 0) {
        progress_.percent = static_cast<double>(baseline_completed) * 100.0 / static_cast<double>(total);
    }
}

void ProgressReporter::report(const ItemEvent& event) noexcept {
    ProgressSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (event.outcome) {
            case ItemOutcome::completed:
                ++progress_.completed;
                progress_.bytes += event.bytes;
                break;
            case ItemOutcome::failed:
                ++progress_.failed;
                break;
            case ItemOutcome::skipped:
                ++progress_.skipped;
                break;
        }
        if (progress_.total > 0) {
            progress_.percent = std::min(100.0, static_cast<double>(progress_.done()) * 100.0
                                                / static_cast<double>(progress_.total));
        }
        progress_.last_update = std::chrono::steady_clock::now();
        snap = progress_;
    }

    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> cb_lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) {
        try {
            cb(event, snap);
        } catch (const std::exception& e) {
            spdlog::warn("Progress listener threw: {}", e.what());
        }
    }
}

ProgressSnapshot ProgressReporter::snapshot() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

} // namespace fetchpoint::core
