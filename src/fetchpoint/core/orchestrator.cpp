// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/orchestrator.hpp>
#include <fetchpoint/core/error.hpp>
#include <fetchpoint/core/worker_pool.hpp>
#include <fetchpoint/disk/file.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <utility>

namespace fetchpoint::core {

int RunSummary::exit_code() const noexcept {
    if (failed > 0) return 1;
    if (interrupted) return 130;
    return 0;
}

//=============================================================================
// Orchestrator
//=============================================================================

Orchestrator::Orchestrator(RunConfig config, Fetcher& fetcher)
    : config_(std::move(config))
    , fetcher_(fetcher)
    , store_(config_.output_dir)
    , resolver_(config_.output_dir, config_.completeness) {}

void Orchestrator::transition(RunState next) noexcept {
    state_.store(next, std::memory_order_release);
    spdlog::debug("Run state -> {}", to_string(next));

    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = state_callback_;
    }
    if (cb) {
        try {
            cb(next);
        } catch (const std::exception& e) {
            spdlog::warn("State listener threw: {}", e.what());
        }
    }
}

void Orchestrator::begin_draining() noexcept {
    auto expected = RunState::running;
    if (state_.compare_exchange_strong(expected, RunState::draining, std::memory_order_acq_rel)) {
        spdlog::info("Stop requested; waiting for in-flight downloads to finish");
        transition(RunState::draining);
    }
}

std::expected<RunSummary, std::error_code>
Orchestrator::run(const std::vector<DownloadItem>& input, std::stop_token stop) noexcept {
    try {
        // ---- Init -----------------------------------------------------------
        transition(RunState::init);

        if (auto ec = disk::ensure_writable_directory(config_.output_dir)) {
            spdlog::error("Output directory {} is not writable: {}",
                          config_.output_dir.string(), ec.message());
            return std::unexpected(make_error_code(RunErrc::output_not_writable));
        }

        std::size_t duplicates = 0;
        auto items = dedup_by_key(input, &duplicates);
        if (duplicates > 0) {
            spdlog::info("Ignoring {} repeated keys in input", duplicates);
        }
        if (config_.limit > 0 && items.size() > config_.limit) {
            items.resize(config_.limit);
            spdlog::info("Limiting run to the first {} records", config_.limit);
        }
        if (items.empty()) {
            return std::unexpected(make_error_code(RunErrc::no_records));
        }

        // ---- Loading --------------------------------------------------------
        transition(RunState::loading);

        CheckpointState state;
        std::uint64_t seeded = 0;
        if (config_.mode == RunMode::clean_start) {
            spdlog::info("Clean start: discarding previous progress");
            store_.purge();
            store_.reset();
        } else {
            state = store_.load();
            if (store_.origin() == LoadOrigin::restored) {
                auto counts = state.counts();
                spdlog::info("Resuming from checkpoint: {} completed, {} failed",
                             counts.completed, counts.failed);
            } else {
                seeded = seed_from_disk(items, state, resolver_);
                if (seeded > 0) {
                    spdlog::info("No checkpoint found; {} files already on disk marked as downloaded",
                                 seeded);
                }
            }
        }
        // Keys from earlier, larger inputs stay tracked
        std::uint64_t untracked = 0;
        for (const auto& item : items) {
            if (state.find(item.key) == nullptr) ++untracked;
        }
        state.total_known = state.items.size() + untracked;
        store_.replace(state);

        // ---- Resolving ------------------------------------------------------
        transition(RunState::resolving);

        auto plan = plan_work(items, state, config_.mode, config_.max_attempts);
        std::uint64_t baseline = 0;
        for (const auto& item : items) {
            if (state.is_completed(item.key)) ++baseline;
        }
        progress_.begin(items.size(), baseline, plan.pending.size());

        spdlog::info("{} keys: {} already downloaded, {} to fetch ({} retried){}",
                     items.size(), baseline, plan.pending.size(), plan.previously_failed,
                     plan.capped > 0 ? std::format(", {} held back by attempt limit", plan.capped)
                                     : std::string{});

        // Persist seeding and the new total before any fetch
        if (auto ec = store_.flush()) {
            spdlog::warn("Initial checkpoint flush failed: {}", ec.message());
        }

        PoolResult pool_result;
        if (!plan.pending.empty()) {
            // ---- Running ----------------------------------------------------
            transition(RunState::running);

            std::stop_callback on_stop(stop, [this] { begin_draining(); });

            PoolOptions options;
            options.workers = config_.workers;
            options.timeout = config_.timeout;
            options.flush_every = config_.flush_every;

            WorkerPool pool(options, fetcher_, store_, resolver_, progress_);
            pool_result = pool.run(plan.pending, stop);
        }

        // ---- Finalizing -----------------------------------------------------
        transition(RunState::finalizing);

        const bool saved = !store_.flush();
        auto final_state = store_.snapshot();

        RunSummary summary = summarize(items, final_state);
        summary.seeded = seeded;
        summary.duplicates = duplicates;
        summary.capped = plan.capped;
        summary.queued = plan.pending.size();
        summary.dispatched = pool_result.dispatched;
        summary.fetched = pool_result.completed;
        summary.fetch_failures = pool_result.failed;
        summary.skipped = pool_result.skipped;
        summary.origin = config_.mode == RunMode::clean_start ? LoadOrigin::fresh : store_.origin();
        summary.interrupted = pool_result.interrupted;
        summary.checkpoint_saved = saved;

        if (saved && summary.completed == summary.total) {
            if (final_state.all_completed()) {
                // Nothing left to resume
                store_.remove();
                summary.checkpoint_removed = true;
                spdlog::info("All {} keys downloaded; checkpoint removed", summary.total);
            } else {
                const auto counts = final_state.counts();
                spdlog::info("Checkpoint kept: {} failed and {} pending keys from earlier runs",
                             counts.failed, counts.pending + counts.in_progress);
            }
        }

        transition(RunState::done);
        return summary;
    } catch (const std::exception& e) {
        spdlog::error("Run aborted: {}", e.what());
        if (auto ec = store_.flush()) {
            spdlog::error("Emergency checkpoint flush failed: {}", ec.message());
        }
        transition(RunState::done);
        return std::unexpected(make_error_code(RunErrc::run_aborted));
    }
}

RunSummary Orchestrator::summarize(const std::vector<DownloadItem>& items,
                                   const CheckpointState& state) const {
    RunSummary summary;
    summary.total = items.size();

    for (const auto& item : items) {
        const auto* status = state.find(item.key);
        if (status == nullptr) {
            ++summary.pending;
            continue;
        }
        switch (status->state) {
            case ItemState::completed:
                ++summary.completed;
                break;
            case ItemState::failed:
                ++summary.failed;
                summary.failed_items.push_back({item.key, status->reason, status->attempts});
                break;
            case ItemState::pending:
            case ItemState::in_progress:
                ++summary.pending;
                break;
        }
    }

    std::sort(summary.failed_items.begin(), summary.failed_items.end(),
              [](const FailedItem& a, const FailedItem& b) { return a.key < b.key; });
    return summary;
}

} // namespace fetchpoint::core
