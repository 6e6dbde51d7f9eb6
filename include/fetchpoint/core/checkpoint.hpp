// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/item.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>

namespace fetchpoint::core {

struct CheckpointCounts {
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t pending{0};
    std::uint64_t in_progress{0};
};

// Durable per-key progress for one output directory
struct CheckpointState {
    std::unordered_map<std::string, ItemStatus> items;
    std::string start_time;       // ISO 8601, first run that created the state
    std::string last_update;      // ISO 8601, last flush
    std::uint64_t total_known{0}; // Tracked keys plus untracked keys of the latest input

    [[nodiscard]] CheckpointCounts counts() const noexcept;
    [[nodiscard]] const ItemStatus* find(const std::string& key) const noexcept;
    [[nodiscard]] bool is_completed(const std::string& key) const noexcept;

    // True when no tracked key is pending, in progress or failed
    [[nodiscard]] bool all_completed() const noexcept;
};

// Where the in-memory state came from
enum class LoadOrigin : std::uint8_t {
    fresh,      // No checkpoint on disk
    restored,   // Checkpoint decoded
    recovered,  // Checkpoint unreadable, started over
};

// Result of trying to take a key for fetching
enum class ClaimResult : std::uint8_t {
    claimed,            // Now in progress for the caller
    already_completed,  // Nothing to do
    busy,               // Another worker holds it
};

// Thread-safe owner of CheckpointState. One mutex guards the state and both
// files; every write to disk is an atomic replace.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path output_dir);

    // Non-copyable, non-movable (owns a mutex)
    CheckpointStore(const CheckpointStore&) = delete;
    CheckpointStore& operator=(const CheckpointStore&) = delete;

    // Read the checkpoint; never fails. Missing or corrupt files yield an
    // empty state, and in-progress entries come back as pending.
    CheckpointState load() noexcept;

    [[nodiscard]] LoadOrigin origin() const noexcept;

    // Update one entry. A completed entry is never downgraded.
    void record(const std::string& key, ItemStatus status) noexcept;

    void mark_in_progress(const std::string& key) noexcept;

    // Atomically move a key that is neither completed nor in progress to
    // in progress
    [[nodiscard]] ClaimResult try_claim(const std::string& key) noexcept;
    void mark_completed(const std::string& key) noexcept;

    // Returns the new attempt count
    std::uint32_t mark_failed(const std::string& key, std::string reason) noexcept;

    [[nodiscard]] std::optional<ItemStatus> status(const std::string& key) const noexcept;
    [[nodiscard]] bool is_completed(const std::string& key) const noexcept;

    void set_total_known(std::uint64_t total) noexcept;

    // Copy of the current state
    [[nodiscard]] CheckpointState snapshot() const;

    // Replace the in-memory state wholesale (seeding, planning)
    void replace(CheckpointState state) noexcept;

    // Forget everything in memory (clean start)
    void reset() noexcept;

    // Persist state and summary atomically
    [[nodiscard]] std::error_code flush() noexcept;

    // Delete the durable checkpoint, keeping the summary
    void remove() noexcept;

    // Delete checkpoint and summary
    void purge() noexcept;

    [[nodiscard]] bool exists() const noexcept;

    [[nodiscard]] const std::filesystem::path& checkpoint_path() const noexcept { return checkpoint_path_; }
    [[nodiscard]] const std::filesystem::path& summary_path() const noexcept { return summary_path_; }

    // Current UTC time as ISO 8601
    [[nodiscard]] static std::string now_iso8601();

private:
    [[nodiscard]] std::error_code flush_locked() noexcept;

    std::filesystem::path checkpoint_path_;
    std::filesystem::path summary_path_;

    CheckpointState state_;
    LoadOrigin origin_{LoadOrigin::fresh};
    mutable std::mutex mutex_;
};

} // namespace fetchpoint::core
