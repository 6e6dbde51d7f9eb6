// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/checkpoint.hpp>
#include <fetchpoint/core/config.hpp>
#include <fetchpoint/core/error.hpp>
#include <fetchpoint/disk/error.hpp>
#include <fetchpoint/disk/file.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <format>

namespace fetchpoint::core {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr std::string_view FORMAT_TAG = "fetchpoint-checkpoint";

// Checkpoint layout (CBOR):
//   { "format": tag, "version": 1, "start_time": str, "last_update": str,
//     "total_known": uint, "items": { key: { "s": state, "r": reason, "a": attempts } } }

json encode_state(const CheckpointState& state) {
    json items = json::object();
    for (const auto& [key, status] : state.items) {
        // An interrupted fetch is never persisted as in flight
        auto persisted = status.state == ItemState::in_progress ? ItemState::pending : status.state;
        json entry = {
            {"s", static_cast<std::uint8_t>(persisted)},
            {"a", status.attempts},
        };
        if (!status.reason.empty()) {
            entry["r"] = status.reason;
        }
        items[key] = std::move(entry);
    }

    return json{
        {"format", FORMAT_TAG},
        {"version", CHECKPOINT_FORMAT_VERSION},
        {"start_time", state.start_time},
        {"last_update", state.last_update},
        {"total_known", state.total_known},
        {"items", std::move(items)},
    };
}

std::expected<CheckpointState, std::error_code> decode_state(const json& j) {
    const auto corrupt = std::unexpected(make_error_code(RunErrc::checkpoint_corrupt));

    if (!j.is_object() || j.value("format", std::string{}) != FORMAT_TAG) {
        return corrupt;
    }
    if (j.value("version", 0u) != CHECKPOINT_FORMAT_VERSION) {
        return corrupt;
    }
    if (!j.contains("items") || !j["items"].is_object()) {
        return corrupt;
    }

    CheckpointState state;
    state.start_time = j.value("start_time", std::string{});
    state.last_update = j.value("last_update", std::string{});
    state.total_known = j.value("total_known", std::uint64_t{0});

    for (const auto& [key, entry] : j["items"].items()) {
        if (!entry.is_object() || !entry.contains("s") || !entry["s"].is_number_unsigned()) {
            return corrupt;
        }
        auto raw = entry["s"].get<unsigned>();
        if (raw > static_cast<unsigned>(ItemState::failed)) {
            return corrupt;
        }

        ItemStatus status;
        status.state = static_cast<ItemState>(raw);
        if (status.state == ItemState::in_progress) {
            status.state = ItemState::pending;
        }
        status.attempts = entry.value("a", std::uint32_t{0});
        status.reason = entry.value("r", std::string{});
        state.items.emplace(key, std::move(status));
    }

    return state;
}

json encode_summary(const CheckpointState& state) {
    const auto counts = state.counts();
    // Counts and total describe the same population
    const std::uint64_t total = std::max<std::uint64_t>(
        state.total_known, counts.completed + counts.failed + counts.pending + counts.in_progress);
    const std::uint64_t pending = total - counts.completed - counts.failed;
    const double percent = static_cast<double>(counts.completed) * 100.0
                           / static_cast<double>(std::max<std::uint64_t>(1, total));
    return json{
        {"downloaded_count", counts.completed},
        {"failed_count", counts.failed},
        {"pending_count", pending},
        {"total", total},
        {"progress_percentage", percent},
        {"start_time", state.start_time},
        {"last_update", state.last_update},
    };
}

} // namespace

//=============================================================================
// CheckpointState
//=============================================================================

CheckpointCounts CheckpointState::counts() const noexcept {
    CheckpointCounts c;
    for (const auto& [key, status] : items) {
        switch (status.state) {
            case ItemState::pending:     ++c.pending; break;
            case ItemState::in_progress: ++c.in_progress; break;
            case ItemState::completed:   ++c.completed; break;
            case ItemState::failed:      ++c.failed; break;
        }
    }
    return c;
}

const ItemStatus* CheckpointState::find(const std::string& key) const noexcept {
    auto it = items.find(key);
    return it == items.end() ? nullptr : &it->second;
}

bool CheckpointState::is_completed(const std::string& key) const noexcept {
    const auto* status = find(key);
    return status != nullptr && status->is_completed();
}

bool CheckpointState::all_completed() const noexcept {
    return std::all_of(items.begin(), items.end(),
                       [](const auto& entry) { return entry.second.is_completed(); });
}

//=============================================================================
// CheckpointStore
//=============================================================================

CheckpointStore::CheckpointStore(fs::path output_dir) {
    const fs::path dir = output_dir / std::string(CHECKPOINT_DIR);
    checkpoint_path_ = dir / std::string(CHECKPOINT_FILE);
    summary_path_ = dir / std::string(SUMMARY_FILE);
}

CheckpointState CheckpointStore::load() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    state_ = {};
    origin_ = LoadOrigin::fresh;

    auto data = disk::read_all(checkpoint_path_);
    if (!data) {
        if (data.error() != make_error_code(disk::DiskErrc::file_not_found)) {
            spdlog::warn("Cannot read checkpoint {}: {}; starting without prior progress",
                         checkpoint_path_.string(), data.error().message());
            origin_ = LoadOrigin::recovered;
        }
        return state_;
    }

    try {
        auto decoded = decode_state(json::from_cbor(*data));
        if (!decoded) {
            spdlog::warn("Checkpoint {} is not in a recognised format; starting without prior progress",
                         checkpoint_path_.string());
            origin_ = LoadOrigin::recovered;
            return state_;
        }
        state_ = std::move(*decoded);
        origin_ = LoadOrigin::restored;
        spdlog::debug("Loaded checkpoint with {} entries", state_.items.size());
    } catch (const json::exception& e) {
        spdlog::warn("Checkpoint {} is corrupt ({}); starting without prior progress",
                     checkpoint_path_.string(), e.what());
        state_ = {};
        origin_ = LoadOrigin::recovered;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load checkpoint {}: {}", checkpoint_path_.string(), e.what());
        state_ = {};
        origin_ = LoadOrigin::recovered;
    }

    return state_;
}

LoadOrigin CheckpointStore::origin() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return origin_;
}

void CheckpointStore::record(const std::string& key, ItemStatus status) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = state_.items[key];
        if (slot.is_completed() && !status.is_completed()) {
            return;
        }
        slot = std::move(status);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record status for {}: {}", key, e.what());
    }
}

void CheckpointStore::mark_in_progress(const std::string& key) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = state_.items[key];
        if (!slot.is_completed()) {
            slot.state = ItemState::in_progress;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to record status for {}: {}", key, e.what());
    }
}

ClaimResult CheckpointStore::try_claim(const std::string& key) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = state_.items[key];
        if (slot.is_completed()) {
            return ClaimResult::already_completed;
        }
        if (slot.state == ItemState::in_progress) {
            return ClaimResult::busy;
        }
        slot.state = ItemState::in_progress;
        return ClaimResult::claimed;
    } catch (const std::exception& e) {
        spdlog::error("Failed to claim {}: {}", key, e.what());
        return ClaimResult::busy;
    }
}

void CheckpointStore::mark_completed(const std::string& key) noexcept {
    record(key, ItemStatus::completed());
}

std::uint32_t CheckpointStore::mark_failed(const std::string& key, std::string reason) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = state_.items[key];
        if (slot.is_completed()) {
            return slot.attempts;
        }
        slot.state = ItemState::failed;
        slot.reason = std::move(reason);
        ++slot.attempts;
        return slot.attempts;
    } catch (const std::exception& e) {
        spdlog::error("Failed to record status for {}: {}", key, e.what());
        return 0;
    }
}

std::optional<ItemStatus> CheckpointStore::status(const std::string& key) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* found = state_.find(key);
        if (!found) {
            return std::nullopt;
        }
        return *found;
    } catch (...) {
        return std::nullopt;
    }
}

bool CheckpointStore::is_completed(const std::string& key) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.is_completed(key);
}

void CheckpointStore::set_total_known(std::uint64_t total) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.total_known = total;
}

CheckpointState CheckpointStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void CheckpointStore::replace(CheckpointState state) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(state);
}

void CheckpointStore::reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = {};
    origin_ = LoadOrigin::fresh;
}

std::error_code CheckpointStore::flush() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_locked();
}

std::error_code CheckpointStore::flush_locked() noexcept {
    try {
        state_.last_update = now_iso8601();
        if (state_.start_time.empty()) {
            state_.start_time = state_.last_update;
        }

        const auto cbor = json::to_cbor(encode_state(state_));
        const std::string_view bytes(reinterpret_cast<const char*>(cbor.data()), cbor.size());
        if (auto ec = disk::write_atomically(checkpoint_path_, bytes)) {
            spdlog::error("Failed to save checkpoint {}: {}", checkpoint_path_.string(), ec.message());
            return ec;
        }

        // Derived view; a failure here does not invalidate the checkpoint
        if (auto ec = disk::write_atomically(summary_path_, encode_summary(state_).dump(2))) {
            spdlog::warn("Failed to write summary {}: {}", summary_path_.string(), ec.message());
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Failed to save checkpoint: {}", e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

void CheckpointStore::remove() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    disk::remove_quietly(checkpoint_path_);
}

void CheckpointStore::purge() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    disk::remove_quietly(checkpoint_path_);
    disk::remove_quietly(summary_path_);
}

bool CheckpointStore::exists() const noexcept {
    std::error_code ec;
    return fs::exists(checkpoint_path_, ec);
}

std::string CheckpointStore::now_iso8601() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

} // namespace fetchpoint::core
