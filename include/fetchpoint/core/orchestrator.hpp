// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/checkpoint.hpp>
#include <fetchpoint/core/config.hpp>
#include <fetchpoint/core/fetcher.hpp>
#include <fetchpoint/core/item.hpp>
#include <fetchpoint/core/planner.hpp>
#include <fetchpoint/core/progress.hpp>
#include <fetchpoint/core/target_resolver.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fetchpoint::core {

// Per-invocation settings; never persisted
struct RunConfig {
    std::filesystem::path output_dir;
    std::uint32_t workers{DEFAULT_WORKERS};
    std::chrono::seconds timeout{DEFAULT_TIMEOUT_SEC};
    RunMode mode{RunMode::resume};
    std::uint32_t flush_every{DEFAULT_FLUSH_EVERY};
    std::size_t limit{0};            // Process at most this many input records (0 = all)
    std::uint32_t max_attempts{0};   // 0 = retry failed keys without limit
    Completeness completeness{Completeness::non_empty};
};

enum class RunState : std::uint8_t {
    init,
    loading,
    resolving,
    running,
    draining,    // Stop requested; in-flight fetches finishing
    finalizing,
    done,
};

[[nodiscard]] constexpr std::string_view to_string(RunState state) noexcept {
    switch (state) {
        case RunState::init:       return "init";
        case RunState::loading:    return "loading";
        case RunState::resolving:  return "resolving";
        case RunState::running:    return "running";
        case RunState::draining:   return "draining";
        case RunState::finalizing: return "finalizing";
        case RunState::done:       return "done";
    }
    return "init";
}

struct FailedItem {
    std::string key;
    std::string reason;
    std::uint32_t attempts{0};
};

struct RunSummary {
    std::uint64_t total{0};           // Unique keys in this run's input
    std::uint64_t completed{0};       // Of those, completed after the run
    std::uint64_t failed{0};
    std::uint64_t pending{0};         // Never attempted (interrupted or capped)

    std::uint64_t seeded{0};          // Inferred from files already on disk
    std::uint64_t duplicates{0};      // Input records dropped as repeated keys
    std::uint64_t capped{0};          // Failed keys held back by max_attempts
    std::uint64_t queued{0};          // Size of the pending set
    std::uint64_t dispatched{0};
    std::uint64_t fetched{0};         // Completed by this run
    std::uint64_t fetch_failures{0};  // Failed in this run
    std::uint64_t skipped{0};

    LoadOrigin origin{LoadOrigin::fresh};
    bool interrupted{false};
    bool checkpoint_saved{true};
    bool checkpoint_removed{false};
    std::vector<FailedItem> failed_items;  // Sorted by key

    [[nodiscard]] double percent() const noexcept {
        return total == 0 ? 100.0 : static_cast<double>(completed) * 100.0 / static_cast<double>(total);
    }

    // 0 clean, 1 failed keys remain, 130 interrupted without failures
    [[nodiscard]] int exit_code() const noexcept;
};

using StateCallback = std::function<void(RunState)>;

// Drives one run: load checkpoint, plan, fetch, persist.
class Orchestrator {
public:
    Orchestrator(RunConfig config, Fetcher& fetcher);

    // Non-copyable, non-movable (owns the checkpoint store)
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Run to completion or until `stop` is requested. Returns an error only
    // for fatal configuration problems, before any item is touched.
    [[nodiscard]] std::expected<RunSummary, std::error_code>
    run(const std::vector<DownloadItem>& items, std::stop_token stop = {}) noexcept;

    [[nodiscard]] RunState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Set state listener (thread-safe)
    void state_callback(StateCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        state_callback_ = std::move(cb);
    }

    [[nodiscard]] ProgressReporter& progress() noexcept { return progress_; }
    [[nodiscard]] const CheckpointStore& store() const noexcept { return store_; }
    [[nodiscard]] const TargetResolver& resolver() const noexcept { return resolver_; }
    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

private:
    void transition(RunState next) noexcept;

    // Move running -> draining exactly once
    void begin_draining() noexcept;

    [[nodiscard]] RunSummary summarize(const std::vector<DownloadItem>& items,
                                       const CheckpointState& state) const;

    RunConfig config_;
    Fetcher& fetcher_;
    CheckpointStore store_;
    TargetResolver resolver_;
    ProgressReporter progress_;

    std::atomic<RunState> state_{RunState::init};
    StateCallback state_callback_;
    std::mutex callback_mutex_;  // Protects state_callback_ access
};

} // namespace fetchpoint::core
