// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

namespace fetchpoint::core {

enum class ItemOutcome : std::uint8_t {
    completed,
    failed,
    skipped,   // Already completed by a concurrent attempt
};

// One terminal item event
struct ItemEvent {
    std::string key;
    ItemOutcome outcome{ItemOutcome::completed};
    std::string message;             // Failure reason, empty on success
    std::error_code error;           // Failure cause (failed only)
    std::filesystem::path path;      // Target path
    std::uint32_t attempts{0};       // Failed attempts so far (failed only)
    std::uint64_t bytes{0};
};

// Run progress. Derived for display; the checkpoint is authoritative.
struct ProgressSnapshot {
    std::uint64_t total{0};               // Known keys
    std::uint64_t baseline_completed{0};  // Completed before this run
    std::uint64_t queued{0};              // Dispatched to the pool this run
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t skipped{0};
    std::uint64_t bytes{0};
    double percent{0.0};                  // (baseline + completed) / total
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;

    [[nodiscard]] std::uint64_t done() const noexcept { return baseline_completed + completed; }
    [[nodiscard]] std::uint64_t remaining() const noexcept {
        const auto finished = completed + failed + skipped;
        return queued > finished ? queued - finished : 0;
    }
};

using ProgressCallback = std::function<void(const ItemEvent&, const ProgressSnapshot&)>;

class ProgressReporter {
public:
    ProgressReporter() = default;

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    // Reset counters for a run
    void begin(std::uint64_t total, std::uint64_t baseline_completed, std::uint64_t queued) noexcept;

    // Count a terminal event and notify the listener (thread-safe)
    void report(const ItemEvent& event) noexcept;

    [[nodiscard]] ProgressSnapshot snapshot() const noexcept;

    // Set listener (thread-safe)
    void callback(ProgressCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

private:
    ProgressSnapshot progress_;
    mutable std::mutex mutex_;

    ProgressCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access
};

} // namespace fetchpoint::core
