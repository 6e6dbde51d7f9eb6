// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/orchestrator.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

namespace fetchpoint::cli {

// CLI result: process exit code, or a fatal configuration error
using CliResult = std::expected<int, std::error_code>;

// Exit code for fatal configuration errors and bad usage
constexpr int EXIT_FATAL = 2;

// Command line arguments
struct CliArgs {
    std::string input;        // Empty: <dir>/../submissions.csv
    std::string output_dir;
    std::string base_url{core::DEFAULT_BASE_URL};
    std::uint32_t workers{core::DEFAULT_WORKERS};
    std::uint32_t timeout{core::DEFAULT_TIMEOUT_SEC};
    std::uint32_t flush_every{core::DEFAULT_FLUSH_EVERY};
    std::uint32_t max_attempts{0};
    std::size_t limit{0};
    core::RunMode mode{core::RunMode::resume};
    bool verify_pdf{false};
    bool preflight{true};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;        // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Input file used when none is given
[[nodiscard]] std::string default_input(std::string_view output_dir);

// Install the "fetchpoint" console logger
void setup_logging(bool verbose, bool quiet);

// Load records, check connectivity and run the download
[[nodiscard]] CliResult download(const CliArgs& args, std::stop_token stop) noexcept;

// Show final counts, failed keys and hints
void print_summary(const core::RunSummary& summary, const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace fetchpoint::cli
