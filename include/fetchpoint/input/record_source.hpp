// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/error.hpp>
#include <fetchpoint/core/item.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fetchpoint::input {

enum class RecordFormat : std::uint8_t {
    csv,
    json,    // Array of objects, or {"notes": [...]}
    ndjson,  // One object per line
};

[[nodiscard]] constexpr std::string_view to_string(RecordFormat format) noexcept {
    switch (format) {
        case RecordFormat::csv:    return "csv";
        case RecordFormat::json:   return "json";
        case RecordFormat::ndjson: return "ndjson";
    }
    return "csv";
}

struct RecordBatch {
    std::vector<core::DownloadItem> items;  // Unique keys, input order
    std::size_t skipped{0};                 // Records without key or URL
    std::size_t duplicates{0};              // Repeated keys dropped
};

// Pick a reader from the file extension
[[nodiscard]] std::expected<RecordFormat, std::error_code>
detect_format(const std::filesystem::path& path) noexcept;

// Read and normalise every record in `path`. Relative URLs are resolved
// against `base_url`.
[[nodiscard]] std::expected<RecordBatch, std::error_code>
load_records(const std::filesystem::path& path, std::string_view base_url) noexcept;

// Same, from an in-memory document
[[nodiscard]] std::expected<RecordBatch, std::error_code>
parse_records(std::string_view content, RecordFormat format, std::string_view base_url) noexcept;

// Split CSV text into rows (RFC 4180 quoting)
[[nodiscard]] std::vector<std::vector<std::string>> parse_csv(std::string_view text);

} // namespace fetchpoint::input
