// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchpoint/cli/commands.hpp>
#include <fetchpoint/cli/progress_bar.hpp>
#include <filesystem>
#include <string>
#include <vector>

using namespace fetchpoint;
using namespace fetchpoint::cli;

namespace {

CliArgs parse(std::vector<std::string> args) {
    args.insert(args.begin(), "fetchpoint");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args defaults", "[cli]") {
    auto args = parse({"-d", "out"});
    CHECK(args.error.empty());
    CHECK(args.output_dir == "out");
    CHECK(args.input.empty());
    CHECK(args.workers == core::DEFAULT_WORKERS);
    CHECK(args.timeout == core::DEFAULT_TIMEOUT_SEC);
    CHECK(args.flush_every == core::DEFAULT_FLUSH_EVERY);
    CHECK(args.mode == core::RunMode::resume);
    CHECK(args.max_attempts == 0);
    CHECK(args.limit == 0);
    CHECK(args.preflight);
    CHECK(!args.verify_pdf);
    CHECK(args.base_url == core::DEFAULT_BASE_URL);
}

TEST_CASE("parse_args options", "[cli]") {
    auto args = parse({"--dir", "papers", "-i", "notes.jsonl", "-w", "8", "-t", "60", "--retry-failed",
                       "-l", "100", "--flush-every", "5", "--max-attempts", "3", "--base-url",
                       "http://localhost:8080", "--verify-pdf", "--no-preflight", "-q"});
    CHECK(args.error.empty());
    CHECK(args.output_dir == "papers");
    CHECK(args.input == "notes.jsonl");
    CHECK(args.workers == 8);
    CHECK(args.timeout == 60);
    CHECK(args.mode == core::RunMode::retry_failed);
    CHECK(args.limit == 100);
    CHECK(args.flush_every == 5);
    CHECK(args.max_attempts == 3);
    CHECK(args.base_url == "http://localhost:8080");
    CHECK(args.verify_pdf);
    CHECK(!args.preflight);
    CHECK(args.quiet);
}

TEST_CASE("parse_args errors", "[cli]") {
    CHECK(!parse({}).error.empty());
    CHECK(!parse({"-d", "out", "--resume", "--clean-start"}).error.empty());
    CHECK(!parse({"-d", "out", "-w", "0"}).error.empty());
    CHECK(!parse({"-d", "out", "-w", "abc"}).error.empty());
    CHECK(!parse({"-d", "out", "-w", "-3"}).error.empty());
    CHECK(!parse({"-d", "out", "--bogus"}).error.empty());
    CHECK(!parse({"-d"}).error.empty());

    // Mode flags may appear only once
    CHECK(!parse({"-d", "out", "--clean-start", "--clean-start"}).error.empty());
    CHECK(parse({"-d", "out", "--clean-start"}).mode == core::RunMode::clean_start);
}

TEST_CASE("parse_args help and version", "[cli]") {
    CHECK(parse({"-h"}).help);
    CHECK(parse({"--version"}).version);
    CHECK(parse({"-d", "out", "-V", "-q"}).verbose);
    CHECK(!parse({"-d", "out", "-V", "-q"}).quiet);
}

TEST_CASE("default_input", "[cli]") {
    CHECK(std::filesystem::path(default_input("data/pdfs")) == std::filesystem::path("data/submissions.csv"));
}

TEST_CASE("ProgressBar rendering", "[cli]") {
    ProgressBar bar(10, "Downloading");

    auto line = bar.render(5, 1, std::chrono::seconds(12));
    CHECK(line.starts_with("Downloading: ["));
    CHECK(line.find(" 50.0% (5/10)") != std::string::npos);
    CHECK(line.find("1 failed") != std::string::npos);
    CHECK(line.find("ETA: 8s") != std::string::npos);

    auto done = bar.render(10, 0, std::chrono::seconds(30));
    CHECK(done.find("100.0% (10/10)") != std::string::npos);
    CHECK(done.find("ETA") == std::string::npos);

    CHECK(ProgressBar::format_time(59) == "59s");
    CHECK(ProgressBar::format_time(61) == "1m 1s");
    CHECK(ProgressBar::format_time(3725) == "1h 02m 5s");
}
