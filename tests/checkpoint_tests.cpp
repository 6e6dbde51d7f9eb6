// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchpoint/core/checkpoint.hpp>
#include <nlohmann/json.hpp>
#include "test_support.hpp"
#include <thread>
#include <vector>

using namespace fetchpoint;
using namespace fetchpoint::core;

namespace fs = std::filesystem;

TEST_CASE("CheckpointStore paths", "[checkpoint]") {
    CheckpointStore store("/data/out");
    CHECK(store.checkpoint_path() == fs::path("/data/out/.download/progress.cbor"));
    CHECK(store.summary_path() == fs::path("/data/out/.download/state.json"));
}

TEST_CASE("CheckpointStore load without a checkpoint", "[checkpoint]") {
    test::TempDir dir;
    CheckpointStore store(dir.path());

    auto state = store.load();
    CHECK(state.items.empty());
    CHECK(store.origin() == LoadOrigin::fresh);
    CHECK(!store.exists());
}

TEST_CASE("CheckpointStore save and load", "[checkpoint]") {
    test::TempDir dir;

    {
        CheckpointStore store(dir.path());
        store.load();
        store.set_total_known(4);
        store.mark_completed("A");
        CHECK(store.mark_failed("B", "HTTP 404") == 1);
        CHECK(store.mark_failed("B", "Timed out") == 2);
        REQUIRE(store.try_claim("C") == ClaimResult::claimed);
        REQUIRE(!store.flush());
        CHECK(store.exists());
    }

    CheckpointStore reloaded(dir.path());
    auto state = reloaded.load();
    CHECK(reloaded.origin() == LoadOrigin::restored);
    CHECK(state.total_known == 4);
    CHECK(!state.start_time.empty());
    CHECK(!state.last_update.empty());

    REQUIRE(state.find("A") != nullptr);
    CHECK(state.find("A")->is_completed());

    REQUIRE(state.find("B") != nullptr);
    CHECK(state.find("B")->is_failed());
    CHECK(state.find("B")->attempts == 2);
    CHECK(state.find("B")->reason == "Timed out");

    // An in-flight key comes back as pending
    REQUIRE(state.find("C") != nullptr);
    CHECK(state.find("C")->state == ItemState::pending);

    // No temporary files left behind
    for (const auto& entry : fs::directory_iterator(reloaded.checkpoint_path().parent_path())) {
        CHECK(entry.path().extension() != ".tmp");
    }
}

TEST_CASE("CheckpointStore start_time survives flushes", "[checkpoint]") {
    test::TempDir dir;
    CheckpointStore store(dir.path());
    store.load();
    REQUIRE(!store.flush());
    auto first = store.snapshot().start_time;

    CheckpointStore again(dir.path());
    again.load();
    again.mark_completed("X");
    REQUIRE(!again.flush());
    CHECK(again.snapshot().start_time == first);
}

TEST_CASE("CheckpointStore never downgrades completed", "[checkpoint]") {
    CheckpointStore store("unused");
    store.mark_completed("A");

    store.mark_failed("A", "late failure");
    store.mark_in_progress("A");
    store.record("A", ItemStatus{});

    auto status = store.status("A");
    REQUIRE(status.has_value());
    CHECK(status->is_completed());
    CHECK(store.is_completed("A"));
}

TEST_CASE("CheckpointStore::try_claim", "[checkpoint]") {
    CheckpointStore store("unused");

    CHECK(store.try_claim("K") == ClaimResult::claimed);
    CHECK(store.try_claim("K") == ClaimResult::busy);

    store.mark_failed("K", "x");
    CHECK(store.try_claim("K") == ClaimResult::claimed);

    store.mark_completed("K");
    CHECK(store.try_claim("K") == ClaimResult::already_completed);
}

TEST_CASE("CheckpointStore recovers from a corrupt checkpoint", "[checkpoint]") {
    test::TempDir dir;
    CheckpointStore store(dir.path());

    SECTION("Garbage bytes") {
        test::write_file(store.checkpoint_path(), "this is not cbor \x01\x02\xff");
    }

    SECTION("Valid CBOR, wrong layout") {
        auto bytes = nlohmann::json::to_cbor(nlohmann::json{{"downloaded", {"a", "b"}}});
        test::write_file(store.checkpoint_path(),
                         std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }

    SECTION("Truncated") {
        test::write_file(store.checkpoint_path(), "");
    }

    auto state = store.load();
    CHECK(state.items.empty());
    CHECK(store.origin() == LoadOrigin::recovered);

    // The next flush replaces the bad file
    store.mark_completed("A");
    REQUIRE(!store.flush());
    CheckpointStore reloaded(dir.path());
    CHECK(reloaded.load().is_completed("A"));
    CHECK(reloaded.origin() == LoadOrigin::restored);
}

TEST_CASE("CheckpointStore summary file", "[checkpoint]") {
    test::TempDir dir;
    CheckpointStore store(dir.path());
    store.load();
    store.set_total_known(4);
    store.mark_completed("A");
    store.mark_completed("B");
    store.mark_failed("C", "HTTP 500");
    REQUIRE(!store.flush());

    auto summary = nlohmann::json::parse(test::read_file(store.summary_path()));
    CHECK(summary["downloaded_count"] == 2);
    CHECK(summary["failed_count"] == 1);
    CHECK(summary["pending_count"] == 1);
    CHECK(summary["total"] == 4);
    CHECK(summary["progress_percentage"].get<double>() == Catch::Approx(50.0));
    CHECK(summary["start_time"].is_string());
    CHECK(summary["last_update"].is_string());

    SECTION("remove keeps the summary") {
        store.remove();
        CHECK(!fs::exists(store.checkpoint_path()));
        CHECK(fs::exists(store.summary_path()));
    }

    SECTION("purge deletes both") {
        store.purge();
        CHECK(!fs::exists(store.checkpoint_path()));
        CHECK(!fs::exists(store.summary_path()));
    }
}

TEST_CASE("CheckpointStore concurrent updates", "[checkpoint]") {
    test::TempDir dir;
    CheckpointStore store(dir.path());
    store.load();

    constexpr int threads = 8;
    constexpr int per_thread = 50;

    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back([&store, t] {
                for (int i = 0; i < per_thread; ++i) {
                    auto key = std::to_string(t) + "-" + std::to_string(i);
                    if (store.try_claim(key) != ClaimResult::claimed) continue;
                    if (i % 5 == 0) {
                        store.mark_failed(key, "err");
                    } else {
                        store.mark_completed(key);
                    }
                    if (i % 10 == 0) {
                        (void)store.flush();
                    }
                }
            });
        }
    }

    REQUIRE(!store.flush());
    auto counts = store.snapshot().counts();
    CHECK(counts.completed == threads * per_thread * 4 / 5);
    CHECK(counts.failed == threads * per_thread / 5);
    CHECK(counts.in_progress == 0);

    CheckpointStore reloaded(dir.path());
    CHECK(reloaded.load().counts().completed == counts.completed);
}

TEST_CASE("CheckpointState all_completed", "[checkpoint]") {
    CheckpointState state;
    CHECK(state.all_completed());

    state.items["A"] = ItemStatus::completed();
    CHECK(state.all_completed());

    state.items["B"].state = ItemState::failed;
    CHECK(!state.all_completed());

    state.items["B"] = ItemStatus::completed();
    state.items["C"].state = ItemState::pending;
    CHECK(!state.all_completed());
}
