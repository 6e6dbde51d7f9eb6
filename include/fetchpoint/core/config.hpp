// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace fetchpoint::core {

constexpr std::uint32_t DEFAULT_WORKERS = 3;
constexpr std::uint32_t MAX_WORKERS = 64;

constexpr std::uint32_t DEFAULT_TIMEOUT_SEC = 30;
constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 15;
constexpr std::uint32_t PREFLIGHT_TIMEOUT_SEC = 10;

constexpr std::uint32_t DEFAULT_FLUSH_EVERY = 10;       // Terminal transitions between flushes
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::string_view DEFAULT_BASE_URL = "https://openreview.net";

// Layout inside the output directory
constexpr std::string_view CHECKPOINT_DIR = ".download";
constexpr std::string_view CHECKPOINT_FILE = "progress.cbor";
constexpr std::string_view SUMMARY_FILE = "state.json";
constexpr std::string_view TARGET_SUBDIR = "pdfs";
constexpr std::string_view TARGET_EXTENSION = ".pdf";
constexpr std::string_view PARTIAL_SUFFIX = ".part";
constexpr std::string_view TEMP_SUFFIX = ".tmp";

constexpr std::uint32_t CHECKPOINT_FORMAT_VERSION = 1;

constexpr std::string_view USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";
constexpr std::string_view ACCEPT_HEADER = "application/pdf,*/*";
constexpr std::string_view ACCEPT_LANGUAGE_HEADER = "en-US,en;q=0.9";

constexpr std::size_t MAX_FAILED_KEYS_SHOWN = 10;

} // namespace fetchpoint::core
