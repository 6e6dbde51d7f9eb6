// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/worker_pool.hpp>
#include <fetchpoint/disk/file.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace fetchpoint::core {

namespace fs = std::filesystem;

namespace {

// Validate a fetched body against the completeness predicate
std::error_code check_body(const TargetResolver& resolver, const fs::path& partial) noexcept {
    std::error_code ec;
    auto size = fs::file_size(partial, ec);
    if (ec) {
        return make_error_code(FetchErrc::write_failed);
    }
    if (size == 0) {
        return make_error_code(FetchErrc::empty_body);
    }
    if (!resolver.satisfies(partial)) {
        return make_error_code(FetchErrc::unexpected_content);
    }
    return {};
}

} // namespace

WorkerPool::WorkerPool(PoolOptions options,
                       Fetcher& fetcher,
                       CheckpointStore& store,
                       const TargetResolver& resolver,
                       ProgressReporter& progress) noexcept
    : options_(options)
    , fetcher_(fetcher)
    , store_(store)
    , resolver_(resolver)
    , progress_(progress) {
    options_.workers = std::clamp<std::uint32_t>(options_.workers, 1, MAX_WORKERS);
    options_.flush_every = std::max<std::uint32_t>(options_.flush_every, 1);
}

PoolResult WorkerPool::run(const std::vector<DownloadItem>& pending, std::stop_token stop) noexcept {
    next_.store(0, std::memory_order_relaxed);
    completed_.store(0, std::memory_order_relaxed);
    failed_.store(0, std::memory_order_relaxed);
    skipped_.store(0, std::memory_order_relaxed);
    terminal_.store(0, std::memory_order_relaxed);

    PoolResult result;
    if (pending.empty()) {
        return result;
    }

    std::error_code dir_ec;
    fs::create_directories(resolver_.target_dir(), dir_ec);
    if (dir_ec) {
        spdlog::error("Cannot create {}: {}", resolver_.target_dir().string(), dir_ec.message());
    }

    const auto thread_count = static_cast<std::uint32_t>(
        std::min<std::size_t>(options_.workers, pending.size()));
    spdlog::debug("Starting {} workers for {} items", thread_count, pending.size());

    try {
        std::vector<std::jthread> threads;
        threads.reserve(thread_count);
        for (std::uint32_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this, &pending, stop] {
                worker_loop(pending, stop);
            });
        }
        // jthread joins on destruction
    } catch (const std::system_error& e) {
        // Threads already started have been joined; the rest of the list stays pending
        spdlog::error("Failed to start worker thread: {}", e.what());
    }

    result.dispatched = std::min<std::size_t>(next_.load(std::memory_order_acquire), pending.size());
    result.completed = completed_.load(std::memory_order_acquire);
    result.failed = failed_.load(std::memory_order_acquire);
    result.skipped = skipped_.load(std::memory_order_acquire);
    result.interrupted = stop.stop_requested() && result.dispatched < pending.size();
    return result;
}

void WorkerPool::worker_loop(const std::vector<DownloadItem>& pending, std::stop_token stop) noexcept {
    while (!stop.stop_requested()) {
        const auto index = next_.fetch_add(1, std::memory_order_acq_rel);
        if (index >= pending.size()) {
            break;
        }
        process(pending[index]);
    }
}

void WorkerPool::process(const DownloadItem& item) noexcept {
    ItemEvent event;
    try {
        event.key = item.key;
        event.path = resolver_.path_for(item.key);

        // Guards against a duplicate key or a concurrent attempt
        auto claim = store_.try_claim(item.key);
        if (claim != ClaimResult::claimed) {
            skipped_.fetch_add(1, std::memory_order_acq_rel);
            event.outcome = ItemOutcome::skipped;
            event.message = claim == ClaimResult::busy ? "in progress elsewhere" : "already completed";
            progress_.report(event);
            return;
        }

        const fs::path partial = resolver_.partial_path_for(item.key);
        auto fetched = fetcher_.fetch(item.url, partial, options_.timeout);

        std::error_code ec = fetched ? std::error_code{} : fetched.error();
        if (!ec) {
            ec = check_body(resolver_, partial);
        }
        if (!ec) {
            if (auto commit_ec = disk::commit(partial, event.path)) {
                spdlog::debug("Cannot move {} into place: {}", partial.string(), commit_ec.message());
                ec = make_error_code(FetchErrc::write_failed);
            }
        }

        if (ec) {
            disk::remove_quietly(partial);
            event.outcome = ItemOutcome::failed;
            event.message = ec.message();
            event.error = ec;
        } else {
            event.outcome = ItemOutcome::completed;
            event.bytes = fetched->bytes;
            spdlog::debug("{}: saved {} bytes to {}", item.key, event.bytes, event.path.string());
        }
    } catch (const std::exception& e) {
        // Never leave the key claimed
        spdlog::error("{}: unexpected error: {}", item.key, e.what());
        event.outcome = ItemOutcome::failed;
        event.error = make_error_code(FetchErrc::write_failed);
        event.message = e.what();
    }

    settle(item, event);
}

void WorkerPool::settle(const DownloadItem& item, ItemEvent& event) noexcept {
    if (event.outcome == ItemOutcome::completed) {
        store_.mark_completed(item.key);
        completed_.fetch_add(1, std::memory_order_acq_rel);
    } else {
        event.attempts = store_.mark_failed(item.key, event.message);
        failed_.fetch_add(1, std::memory_order_acq_rel);
        spdlog::debug("{}: {} ({}, attempt {}{})", item.key, event.message, item.url, event.attempts,
                      is_transient(event.error) ? "" : ", permanent");
    }
    progress_.report(event);
    note_terminal();
}

void WorkerPool::note_terminal() noexcept {
    const auto count = terminal_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (count % options_.flush_every == 0) {
        if (auto ec = store_.flush()) {
            spdlog::error("Periodic checkpoint flush failed: {}", ec.message());
        }
    }
}

} // namespace fetchpoint::core
