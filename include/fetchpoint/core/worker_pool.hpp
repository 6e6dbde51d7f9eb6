// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/checkpoint.hpp>
#include <fetchpoint/core/config.hpp>
#include <fetchpoint/core/fetcher.hpp>
#include <fetchpoint/core/item.hpp>
#include <fetchpoint/core/progress.hpp>
#include <fetchpoint/core/target_resolver.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stop_token>
#include <vector>

namespace fetchpoint::core {

struct PoolOptions {
    std::uint32_t workers{DEFAULT_WORKERS};
    std::chrono::seconds timeout{DEFAULT_TIMEOUT_SEC};
    std::uint32_t flush_every{DEFAULT_FLUSH_EVERY};
};

struct PoolResult {
    std::uint64_t dispatched{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t skipped{0};
    bool interrupted{false};  // Stop was requested before every item was dispatched
};

// Fixed set of threads draining one pending list. No ordering between items.
class WorkerPool {
public:
    WorkerPool(PoolOptions options,
               Fetcher& fetcher,
               CheckpointStore& store,
               const TargetResolver& resolver,
               ProgressReporter& progress) noexcept;

    // Non-copyable, non-movable (atomic members)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Process `pending` until done or until `stop` is requested. In-flight
    // fetches are allowed to finish; no new item is taken after the request.
    [[nodiscard]] PoolResult run(const std::vector<DownloadItem>& pending,
                                 std::stop_token stop) noexcept;

    [[nodiscard]] const PoolOptions& options() const noexcept { return options_; }

private:
    void worker_loop(const std::vector<DownloadItem>& pending, std::stop_token stop) noexcept;

    // Fetch one item and record its terminal status
    void process(const DownloadItem& item) noexcept;

    // Record a terminal outcome exactly once: store, counters, progress
    void settle(const DownloadItem& item, ItemEvent& event) noexcept;

    // Count a terminal transition; flush on cadence
    void note_terminal() noexcept;

    PoolOptions options_;
    Fetcher& fetcher_;
    CheckpointStore& store_;
    const TargetResolver& resolver_;
    ProgressReporter& progress_;

    std::atomic<std::size_t> next_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> skipped_{0};
    std::atomic<std::uint64_t> terminal_{0};
};

} // namespace fetchpoint::core
