// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/cli/commands.hpp>
#include <fetchpoint/cli/progress_bar.hpp>
#include <fetchpoint/core/error.hpp>
#include <fetchpoint/core/http_session.hpp>
#include <fetchpoint/input/record_source.hpp>
#include <fetchpoint/version.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

using namespace fetchpoint::core;

namespace fetchpoint::cli {

namespace {

// Parse a non-negative decimal; false on junk
bool parse_number(const char* text, std::uint64_t& out) noexcept {
    if (text == nullptr || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    auto value = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE) return false;
    out = value;
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;
    int mode_flags = 0;

    auto fail = [&](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Option that takes a value
        auto value = [&]() -> const char* {
            if (i + 1 < argc) return argv[++i];
            fail("Missing value for " + arg);
            return nullptr;
        };
        auto number = [&](std::uint64_t min, std::uint64_t max) -> std::uint64_t {
            const char* text = value();
            std::uint64_t n = 0;
            if (text == nullptr) return min;
            if (!parse_number(text, n) || n < min || n > max) {
                fail("Invalid value for " + arg + ": " + text);
                return min;
            }
            return n;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--input") {
            if (const char* v = value()) args.input = v;
        } else if (arg == "-d" || arg == "--dir") {
            if (const char* v = value()) args.output_dir = v;
        } else if (arg == "--base-url") {
            if (const char* v = value()) args.base_url = v;
        } else if (arg == "-w" || arg == "--workers") {
            args.workers = static_cast<std::uint32_t>(number(1, MAX_WORKERS));
        } else if (arg == "-t" || arg == "--timeout") {
            args.timeout = static_cast<std::uint32_t>(number(1, 3600));
        } else if (arg == "--flush-every") {
            args.flush_every = static_cast<std::uint32_t>(number(1, 1'000'000));
        } else if (arg == "--max-attempts") {
            args.max_attempts = static_cast<std::uint32_t>(number(0, 1'000'000));
        } else if (arg == "-l" || arg == "--limit") {
            args.limit = static_cast<std::size_t>(number(0, SIZE_MAX));
        } else if (arg == "--resume") {
            args.mode = RunMode::resume;
            ++mode_flags;
        } else if (arg == "--retry-failed") {
            args.mode = RunMode::retry_failed;
            ++mode_flags;
        } else if (arg == "--clean-start") {
            args.mode = RunMode::clean_start;
            ++mode_flags;
        } else if (arg == "--verify-pdf") {
            args.verify_pdf = true;
        } else if (arg == "--no-preflight") {
            args.preflight = false;
        } else {
            fail("Unknown option: " + arg);
        }
    }

    if (mode_flags > 1) {
        fail("--resume, --retry-failed and --clean-start are mutually exclusive");
    }
    if (args.output_dir.empty()) {
        fail("No output directory specified (-d)");
    }
    if (args.verbose && args.quiet) {
        args.quiet = false;
    }
    return args;
}

std::string default_input(std::string_view output_dir) {
    return (std::filesystem::path(output_dir) / ".." / "submissions.csv").lexically_normal().string();
}

void setup_logging(bool verbose, bool quiet) {
    auto logger = spdlog::get("fetchpoint");
    if (!logger) {
        logger = spdlog::stderr_color_mt("fetchpoint");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    if (verbose) {
        logger->set_level(spdlog::level::debug);
    } else if (quiet) {
        logger->set_level(spdlog::level::warn);
    } else {
        logger->set_level(spdlog::level::info);
    }
    spdlog::set_default_logger(logger);
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, std::stop_token stop) noexcept {
    try {
        const std::string input = args.input.empty() ? default_input(args.output_dir) : args.input;

        auto batch = input::load_records(input, args.base_url);
        if (!batch) {
            std::cout << "Error: " << input << ": " << batch.error().message() << std::endl;
            return std::unexpected(batch.error());
        }
        if (batch->items.empty()) {
            std::cout << "Error: no downloadable records in " << input << std::endl;
            return std::unexpected(make_error_code(RunErrc::no_records));
        }

        if (!args.quiet) {
            std::cout << "Input:   " << input << " (" << batch->items.size() << " records";
            if (batch->skipped > 0) std::cout << ", " << batch->skipped << " skipped";
            std::cout << ")\n";
            std::cout << "Output:  " << args.output_dir << "\n";
            std::cout << "Mode:    " << to_string(args.mode) << ", " << args.workers << " workers, "
                      << args.timeout << "s timeout" << std::endl;
        }

        HttpSession session;

        if (args.preflight) {
            auto probe = session.probe(args.base_url, std::chrono::seconds(PREFLIGHT_TIMEOUT_SEC));
            if (!probe) {
                std::cout << "Error: cannot reach " << args.base_url << ": "
                          << probe.error().message() << std::endl;
                return std::unexpected(make_error_code(RunErrc::preflight_failed));
            }
            if (probe->error) {
                spdlog::info("{} answered HTTP {} ({}); continuing", args.base_url,
                             probe->status_code, probe->error.message());
            } else {
                spdlog::debug("Preflight {} returned HTTP {}", args.base_url, probe->status_code);
            }
        }

        RunConfig config;
        config.output_dir = args.output_dir;
        config.workers = args.workers;
        config.timeout = std::chrono::seconds(args.timeout);
        config.mode = args.mode;
        config.flush_every = args.flush_every;
        config.limit = args.limit;
        config.max_attempts = args.max_attempts;
        config.completeness = args.verify_pdf ? Completeness::pdf_signature : Completeness::non_empty;

        Orchestrator orchestrator(config, session);

        // Per-item lines and the bar are written from worker threads
        std::mutex console_mutex;
        ProgressBar bar(0, "Downloading");

        if (!args.quiet) {
            orchestrator.progress().callback([&](const ItemEvent& event, const ProgressSnapshot& p) {
                std::lock_guard<std::mutex> lock(console_mutex);
                bar.total(p.total);
                bar.clear();
                switch (event.outcome) {
                    case ItemOutcome::completed:
                        if (args.verbose) std::cout << "[ok]   " << event.key << std::endl;
                        break;
                    case ItemOutcome::failed:
                        std::cout << "[fail] " << event.key << ": " << event.message
                                  << (is_transient(event.error) ? "" : " (permanent)") << std::endl;
                        break;
                    case ItemOutcome::skipped:
                        if (args.verbose) std::cout << "[skip] " << event.key << std::endl;
                        break;
                }
                bar.update(p.done(), p.failed);
            });
        }

        auto summary = orchestrator.run(batch->items, stop);

        if (!args.quiet) {
            std::lock_guard<std::mutex> lock(console_mutex);
            bar.finish();
        }

        if (!summary) {
            std::cout << "Error: " << summary.error().message() << std::endl;
            return std::unexpected(summary.error());
        }

        print_summary(*summary, args);
        return summary->exit_code();
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(RunErrc::run_aborted));
    }
}

void print_summary(const RunSummary& s, const CliArgs& args) noexcept {
    std::cout << "\n";
    std::cout << "Summary\n";
    std::cout << "  Total:       " << s.total << "\n";
    std::cout << "  Downloaded:  " << s.completed << std::format(" ({:.1f}%)", s.percent()) << "\n";
    std::cout << "  Failed:      " << s.failed << "\n";
    if (s.pending > 0) {
        std::cout << "  Not tried:   " << s.pending << "\n";
    }
    std::cout << "  This run:    " << s.fetched << " fetched, " << s.fetch_failures << " failed";
    if (s.seeded > 0) std::cout << ", " << s.seeded << " found on disk";
    std::cout << "\n";
    if (s.duplicates > 0) {
        std::cout << "  Duplicates:  " << s.duplicates << " repeated keys ignored\n";
    }

    if (!s.failed_items.empty()) {
        std::cout << "\nFailed keys:\n";
        const auto shown = std::min<std::size_t>(s.failed_items.size(), MAX_FAILED_KEYS_SHOWN);
        for (std::size_t i = 0; i < shown; ++i) {
            const auto& f = s.failed_items[i];
            std::cout << "  " << f.key << ": " << f.reason << " (attempts: " << f.attempts << ")\n";
        }
        if (s.failed_items.size() > shown) {
            std::cout << "  ... and " << s.failed_items.size() - shown << " more\n";
        }
    }

    if (s.interrupted) {
        std::cout << "\nInterrupted. Progress is saved; run again to continue.\n";
    }
    if (!s.checkpoint_saved) {
        std::cout << "\nWarning: progress could not be saved to disk\n";
    }
    if (s.checkpoint_removed) {
        std::cout << "\nAll downloads complete.\n";
    } else if (s.failed > 0) {
        std::cout << "\nHints:\n";
        std::cout << "  Retry the failed keys with --retry-failed\n";
        if (args.workers > 1) {
            std::cout << "  Many failures? Try fewer workers (-w " << std::max<std::uint32_t>(1, args.workers / 2)
                      << ")\n";
        }
        if (s.capped > 0) {
            std::cout << "  " << s.capped << " keys reached --max-attempts and were not retried\n";
        }
    }
    std::cout << std::flush;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "fetchpoint " << program_name << " - Resumable bulk PDF downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " -d <DIR> [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -i, --input <FILE>      Records file: .csv, .json, .jsonl/.ndjson\n";
    std::cout << "                          (default: <DIR>/../submissions.csv)\n";
    std::cout << "  -d, --dir <DIR>         Output directory\n";
    std::cout << "  -w, --workers <N>       Concurrent downloads (default: " << DEFAULT_WORKERS << ")\n";
    std::cout << "  -t, --timeout <SEC>     Per-request timeout (default: " << DEFAULT_TIMEOUT_SEC << ")\n";
    std::cout << "  -l, --limit <N>         Only process the first N records\n";
    std::cout << "      --resume            Continue from saved progress (default)\n";
    std::cout << "      --retry-failed      Retry failed keys, ignoring --max-attempts\n";
    std::cout << "      --clean-start       Discard saved progress and fetch everything\n";
    std::cout << "      --flush-every <N>   Save progress every N items (default: " << DEFAULT_FLUSH_EVERY << ")\n";
    std::cout << "      --max-attempts <N>  Stop retrying a key after N failures (default: unlimited)\n";
    std::cout << "      --base-url <URL>    Base for relative links (default: " << DEFAULT_BASE_URL << ")\n";
    std::cout << "      --verify-pdf        Require the %PDF- signature for existing files\n";
    std::cout << "      --no-preflight      Skip the connectivity check\n";
    std::cout << "\n";
    std::cout << "EXIT CODES:\n";
    std::cout << "  0 all done, 1 some keys failed, 2 fatal error, 130 interrupted\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -d papers/pdfs\n";
    std::cout << "  " << program_name << " -i notes.jsonl -d papers -w 8\n";
    std::cout << "  " << program_name << " -d papers --retry-failed\n";
}

void print_version() noexcept {
    std::cout << "fetchpoint " << fetchpoint::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace fetchpoint::cli
