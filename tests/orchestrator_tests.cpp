// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchpoint/core/orchestrator.hpp>
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>
#include <stop_token>

using namespace fetchpoint;
using namespace fetchpoint::core;

namespace fs = std::filesystem;

namespace {

std::vector<DownloadItem> make_items(int count) {
    std::vector<DownloadItem> items;
    for (int i = 0; i < count; ++i) {
        auto key = "note" + std::to_string(i);
        items.push_back({key, "https://openreview.net/pdf?id=" + key, "Paper " + std::to_string(i)});
    }
    return items;
}

struct RunFixture {
    test::TempDir dir;
    test::FakeFetcher fetcher;

    [[nodiscard]] RunConfig config(RunMode mode = RunMode::resume) const {
        RunConfig c;
        c.output_dir = dir.path();
        c.workers = 3;
        c.flush_every = 2;
        c.mode = mode;
        return c;
    }

    RunSummary run(const std::vector<DownloadItem>& items, const RunConfig& c, std::stop_token stop = {}) {
        Orchestrator orchestrator(c, fetcher);
        auto summary = orchestrator.run(items, stop);
        REQUIRE(summary.has_value());
        return *summary;
    }

    [[nodiscard]] fs::path checkpoint() const { return dir.path() / ".download" / "progress.cbor"; }
    [[nodiscard]] fs::path summary_file() const { return dir.path() / ".download" / "state.json"; }
    [[nodiscard]] fs::path target(const std::string& key) const { return dir.path() / "pdfs" / (key + ".pdf"); }
};

} // namespace

TEST_CASE("Orchestrator resumes after failures", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(5);
    f.fetcher.fail(items[2].url, make_error_code(FetchErrc::server_error));

    auto first = f.run(items, f.config());

    CHECK(first.total == 5);
    CHECK(first.completed == 4);
    CHECK(first.failed == 1);
    CHECK(first.exit_code() == 1);
    CHECK(!first.checkpoint_removed);
    CHECK(fs::exists(f.checkpoint()));
    REQUIRE(first.failed_items.size() == 1);
    CHECK(first.failed_items[0].key == items[2].key);
    CHECK(first.failed_items[0].attempts == 1);
    CHECK(!fs::exists(f.target(items[2].key)));

    // Second run only touches the failed key
    f.fetcher.serve(items[2].url, std::string(test::PDF_BODY));
    auto second = f.run(items, f.config());

    CHECK(second.origin == LoadOrigin::restored);
    CHECK(second.queued == 1);
    CHECK(second.fetched == 1);
    CHECK(second.completed == 5);
    CHECK(second.failed == 0);
    CHECK(second.exit_code() == 0);
    CHECK(second.checkpoint_removed);
    CHECK(!fs::exists(f.checkpoint()));
    CHECK(fs::exists(f.summary_file()));

    for (const auto& item : items) {
        CHECK(f.fetcher.calls(item.url) == (item.key == items[2].key ? 2u : 1u));
        CHECK(fs::exists(f.target(item.key)));
    }
}

TEST_CASE("Orchestrator rerun after completion is a no-op", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(5);

    auto first = f.run(items, f.config());
    REQUIRE(first.exit_code() == 0);
    REQUIRE(f.fetcher.total_calls() == 5);

    // Checkpoint is gone; the files on disk seed the new state
    auto second = f.run(items, f.config());
    CHECK(second.seeded == 5);
    CHECK(second.queued == 0);
    CHECK(second.completed == 5);
    CHECK(second.exit_code() == 0);
    CHECK(f.fetcher.total_calls() == 5);
}

TEST_CASE("Orchestrator clean start refetches everything", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(5);
    f.fetcher.fail(items[0].url, make_error_code(FetchErrc::timeout));

    auto first = f.run(items, f.config());
    REQUIRE(first.failed == 1);

    f.fetcher.serve(items[0].url, std::string(test::PDF_BODY));
    auto clean = f.run(items, f.config(RunMode::clean_start));

    CHECK(clean.origin == LoadOrigin::fresh);
    CHECK(clean.queued == 5);
    CHECK(clean.fetched == 5);
    CHECK(clean.seeded == 0);
    CHECK(clean.exit_code() == 0);
    for (const auto& item : items) {
        CHECK(f.fetcher.calls(item.url) == 2);
    }
}

TEST_CASE("Orchestrator attempt cap and retry-failed", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(3);
    f.fetcher.fail(items[1].url, make_error_code(FetchErrc::forbidden));

    auto config = f.config();
    config.max_attempts = 1;

    auto first = f.run(items, config);
    REQUIRE(first.failed == 1);

    SECTION("Resume holds back keys at the cap") {
        auto second = f.run(items, config);
        CHECK(second.capped == 1);
        CHECK(second.queued == 0);
        CHECK(second.failed == 1);
        CHECK(second.exit_code() == 1);
        CHECK(f.fetcher.calls(items[1].url) == 1);
    }

    SECTION("Retry-failed ignores the cap and skips completed keys") {
        f.fetcher.serve(items[1].url, std::string(test::PDF_BODY));
        config.mode = RunMode::retry_failed;
        auto second = f.run(items, config);
        CHECK(second.capped == 0);
        CHECK(second.queued == 1);
        CHECK(second.completed == 3);
        CHECK(second.exit_code() == 0);
        CHECK(f.fetcher.calls(items[0].url) == 1);
        CHECK(f.fetcher.calls(items[1].url) == 2);
    }

    SECTION("Attempts accumulate across runs") {
        config.max_attempts = 0;
        auto second = f.run(items, config);
        REQUIRE(second.failed_items.size() == 1);
        CHECK(second.failed_items[0].attempts == 2);
    }
}

TEST_CASE("Orchestrator seeds from existing files", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(5);
    for (int i : {0, 2, 4}) {
        test::write_file(f.target(items[i].key), test::PDF_BODY);
    }

    auto summary = f.run(items, f.config());

    CHECK(summary.seeded == 3);
    CHECK(summary.queued == 2);
    CHECK(summary.completed == 5);
    CHECK(f.fetcher.total_calls() == 2);
    CHECK(f.fetcher.calls(items[1].url) == 1);
    CHECK(f.fetcher.calls(items[3].url) == 1);
}

TEST_CASE("Orchestrator seeds after a corrupt checkpoint", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(3);
    test::write_file(f.checkpoint(), "garbage");
    test::write_file(f.target(items[0].key), test::PDF_BODY);

    auto summary = f.run(items, f.config());

    CHECK(summary.origin == LoadOrigin::recovered);
    CHECK(summary.seeded == 1);
    CHECK(summary.completed == 3);
    CHECK(f.fetcher.total_calls() == 2);
}

TEST_CASE("Orchestrator fetches each key once", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(4);
    auto repeated = items;
    repeated.push_back(items[1]);
    repeated.push_back(items[1]);
    repeated.push_back(items[3]);

    auto config = f.config();
    config.workers = 8;
    auto summary = f.run(repeated, config);

    CHECK(summary.total == 4);
    CHECK(summary.duplicates == 3);
    CHECK(summary.completed == 4);
    for (const auto& item : items) {
        CHECK(f.fetcher.calls(item.url) == 1);
    }
}

TEST_CASE("Orchestrator limit", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(6);
    auto config = f.config();
    config.limit = 2;

    auto summary = f.run(items, config);

    CHECK(summary.total == 2);
    CHECK(summary.completed == 2);
    CHECK(summary.checkpoint_removed);
    CHECK(f.fetcher.total_calls() == 2);
    CHECK(f.fetcher.calls(items[0].url) == 1);
    CHECK(f.fetcher.calls(items[1].url) == 1);
}

TEST_CASE("Orchestrator keeps failures from outside a limited rerun", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(5);
    f.fetcher.fail(items[4].url, make_error_code(FetchErrc::timeout));

    auto first = f.run(items, f.config());
    REQUIRE(first.failed == 1);
    REQUIRE(first.exit_code() == 1);

    // The limited input is fully downloaded, but items[4] still failed
    auto limited = f.config();
    limited.limit = 2;
    auto second = f.run(items, limited);

    CHECK(second.total == 2);
    CHECK(second.completed == 2);
    CHECK(second.exit_code() == 0);
    CHECK(!second.checkpoint_removed);
    CHECK(fs::exists(f.checkpoint()));

    CheckpointStore reloaded(f.dir.path());
    auto state = reloaded.load();
    REQUIRE(state.find(items[4].key) != nullptr);
    CHECK(state.find(items[4].key)->is_failed());
    CHECK(state.find(items[4].key)->attempts == 1);

    auto summary = nlohmann::json::parse(test::read_file(f.summary_file()));
    CHECK(summary["downloaded_count"] == 4);
    CHECK(summary["failed_count"] == 1);
    CHECK(summary["total"] == 5);
    CHECK(summary["progress_percentage"].get<double>() == Catch::Approx(80.0));

    // The attempt count survived, so the cap still applies
    auto capped = f.config();
    capped.max_attempts = 1;
    auto third = f.run(items, capped);

    CHECK(third.capped == 1);
    CHECK(third.queued == 0);
    CHECK(third.failed == 1);
    CHECK(f.fetcher.calls(items[4].url) == 1);
    CHECK(fs::exists(f.checkpoint()));
}

TEST_CASE("Orchestrator drains on stop and resumes later", "[orchestrator]") {
    RunFixture f;
    auto items = make_items(5);

    std::stop_source stop;
    f.fetcher.on_fetch([&stop](const std::string&) { stop.request_stop(); });

    auto config = f.config();
    config.workers = 1;

    std::mutex states_mutex;
    std::vector<RunState> states;

    Orchestrator orchestrator(config, f.fetcher);
    orchestrator.state_callback([&](RunState s) {
        std::lock_guard<std::mutex> lock(states_mutex);
        states.push_back(s);
    });
    auto result = orchestrator.run(items, stop.get_token());
    REQUIRE(result.has_value());

    CHECK(result->interrupted);
    CHECK(result->completed == 1);
    CHECK(result->pending == 4);
    CHECK(result->failed == 0);
    CHECK(result->exit_code() == 130);
    CHECK(fs::exists(f.checkpoint()));
    CHECK(orchestrator.state() == RunState::done);
    CHECK(std::find(states.begin(), states.end(), RunState::draining) != states.end());

    // A later run picks up the rest
    f.fetcher.on_fetch({});
    auto rest = f.run(items, f.config());
    CHECK(rest.queued == 4);
    CHECK(rest.completed == 5);
    CHECK(rest.exit_code() == 0);
    CHECK(f.fetcher.total_calls() == 5);
}

TEST_CASE("Orchestrator state sequence", "[orchestrator]") {
    RunFixture f;
    std::vector<RunState> states;

    Orchestrator orchestrator(f.config(), f.fetcher);
    orchestrator.state_callback([&](RunState s) { states.push_back(s); });
    auto result = orchestrator.run(make_items(2));
    REQUIRE(result.has_value());

    CHECK(states == std::vector<RunState>{RunState::init, RunState::loading, RunState::resolving,
                                          RunState::running, RunState::finalizing, RunState::done});
}

TEST_CASE("Orchestrator configuration errors", "[orchestrator]") {
    RunFixture f;

    SECTION("Output directory cannot be created") {
        test::write_file(f.dir / "blocker", "x");
        auto config = f.config();
        config.output_dir = f.dir / "blocker" / "out";

        Orchestrator orchestrator(config, f.fetcher);
        auto result = orchestrator.run(make_items(2));
        REQUIRE(!result.has_value());
        CHECK(result.error() == RunErrc::output_not_writable);
        CHECK(f.fetcher.total_calls() == 0);
    }

    SECTION("No records") {
        Orchestrator orchestrator(f.config(), f.fetcher);
        auto result = orchestrator.run({});
        REQUIRE(!result.has_value());
        CHECK(result.error() == RunErrc::no_records);
    }
}

TEST_CASE("RunSummary exit codes", "[orchestrator]") {
    RunSummary s;
    CHECK(s.exit_code() == 0);

    s.interrupted = true;
    CHECK(s.exit_code() == 130);

    s.failed = 1;
    CHECK(s.exit_code() == 1);

    RunSummary empty;
    CHECK(empty.percent() == Catch::Approx(100.0));
}

TEST_CASE("Orchestrator abort is not reported as a configuration error", "[orchestrator]") {
    const auto aborted = make_error_code(RunErrc::run_aborted);
    const auto unwritable = make_error_code(RunErrc::output_not_writable);

    CHECK(aborted != unwritable);
    CHECK(aborted.category() == unwritable.category());
    CHECK(aborted.message() != unwritable.message());
    CHECK(!is_transient(aborted));
}
