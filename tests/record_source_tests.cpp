// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchpoint/input/record_source.hpp>
#include "test_support.hpp"

using namespace fetchpoint;
using namespace fetchpoint::input;

namespace {

constexpr std::string_view BASE = "https://openreview.net";

RecordBatch parse(std::string_view content, RecordFormat format) {
    auto batch = parse_records(content, format, BASE);
    REQUIRE(batch.has_value());
    return *batch;
}

} // namespace

TEST_CASE("detect_format", "[records]") {
    CHECK(detect_format("submissions.csv").value() == RecordFormat::csv);
    CHECK(detect_format("SUBMISSIONS.CSV").value() == RecordFormat::csv);
    CHECK(detect_format("notes.json").value() == RecordFormat::json);
    CHECK(detect_format("notes.jsonl").value() == RecordFormat::ndjson);
    CHECK(detect_format("notes.ndjson").value() == RecordFormat::ndjson);
    CHECK(detect_format("notes.txt").error() == core::RunErrc::unsupported_format);
    CHECK(!detect_format("notes").has_value());
}

TEST_CASE("parse_csv quoting", "[records]") {
    SECTION("Plain rows") {
        auto rows = parse_csv("a,b,c\n1,2,3\n");
        REQUIRE(rows.size() == 2);
        CHECK(rows[1] == std::vector<std::string>{"1", "2", "3"});
    }

    SECTION("Quoted comma, doubled quote and newline") {
        auto rows = parse_csv("k,t\r\nx,\"Hello, \"\"world\"\"\nagain\"\r\n");
        REQUIRE(rows.size() == 2);
        CHECK(rows[1][0] == "x");
        CHECK(rows[1][1] == "Hello, \"world\"\nagain");
    }

    SECTION("Missing trailing newline and empty fields") {
        auto rows = parse_csv("a,b\n,\n1,");
        REQUIRE(rows.size() == 3);
        CHECK(rows[1] == std::vector<std::string>{"", ""});
        CHECK(rows[2] == std::vector<std::string>{"1", ""});
    }
}

TEST_CASE("CSV records", "[records]") {
    SECTION("Forum, JSON-valued pdf cell and title") {
        auto batch = parse(
            "\xEF\xBB\xBF" "forum,title,pdf\n"
            "A1,\"{\"\"value\"\": \"\"Paper One\"\"}\",\"{\"\"value\"\": \"\"/pdf/a1.pdf\"\"}\"\n"
            "B2,Paper Two,https://example.com/b2.pdf\n",
            RecordFormat::csv);

        REQUIRE(batch.items.size() == 2);
        CHECK(batch.items[0].key == "A1");
        CHECK(batch.items[0].url == "https://openreview.net/pdf/a1.pdf");
        CHECK(batch.items[0].title == "Paper One");
        CHECK(batch.items[1].url == "https://example.com/b2.pdf");
        CHECK(batch.items[1].title == "Paper Two");
        CHECK(batch.skipped == 0);
    }

    SECTION("note_id is used when forum is empty") {
        auto batch = parse("forum,note_id,pdf\n,N9,/pdf?id=N9\n", RecordFormat::csv);
        REQUIRE(batch.items.size() == 1);
        CHECK(batch.items[0].key == "N9");
        CHECK(batch.items[0].url == "https://openreview.net/pdf?id=N9");
    }

    SECTION("Missing URLs and keys are skipped") {
        auto batch = parse(
            "forum,pdf\n"
            "A,\n"
            "B,null\n"
            "C,\"{\"\"value\"\": null}\"\n"
            ",/pdf?id=x\n"
            "D,/pdf?id=D\n",
            RecordFormat::csv);
        REQUIRE(batch.items.size() == 1);
        CHECK(batch.items[0].key == "D");
        CHECK(batch.skipped == 4);
    }

    SECTION("Repeated keys keep the first") {
        auto batch = parse("forum,pdf\nA,/first\nA,/second\nB,/b\n", RecordFormat::csv);
        REQUIRE(batch.items.size() == 2);
        CHECK(batch.items[0].url == "https://openreview.net/first");
        CHECK(batch.duplicates == 1);
    }

    SECTION("Header only") {
        auto batch = parse("forum,pdf\n", RecordFormat::csv);
        CHECK(batch.items.empty());
    }
}

TEST_CASE("JSON records", "[records]") {
    SECTION("Array of notes with content.pdf") {
        auto batch = parse(R"([
            {"id": "n1", "forum": "F1", "content": {"pdf": {"value": "/pdf/f1.pdf"}, "title": {"value": "T1"}}},
            {"id": "n2", "content": {"pdf": "/pdf/n2.pdf"}},
            {"forum": "F3", "pdf": null},
            "not an object"
        ])", RecordFormat::json);

        REQUIRE(batch.items.size() == 2);
        CHECK(batch.items[0].key == "F1");
        CHECK(batch.items[0].url == "https://openreview.net/pdf/f1.pdf");
        CHECK(batch.items[0].title == "T1");
        CHECK(batch.items[1].key == "n2");
        CHECK(batch.skipped == 2);
    }

    SECTION("Wrapped in an object") {
        auto batch = parse(R"({"notes": [{"forum": "X", "pdf": "https://e.com/x.pdf"}]})", RecordFormat::json);
        REQUIRE(batch.items.size() == 1);
        CHECK(batch.items[0].url == "https://e.com/x.pdf");
    }

    SECTION("Invalid document") {
        auto batch = parse_records("[{\"forum\": ", RecordFormat::json, BASE);
        REQUIRE(!batch.has_value());
        CHECK(batch.error() == core::RunErrc::input_unreadable);
    }
}

TEST_CASE("NDJSON records", "[records]") {
    auto batch = parse(
        "{\"forum\": \"A\", \"pdf\": \"/pdf?id=A\"}\n"
        "\n"
        "{broken json\n"
        "{\"forum\": \"B\", \"content\": {\"pdf\": {\"value\": \"/pdf?id=B\"}}}\n"
        "{\"forum\": \"C\", \"pdf\": \"mailto:someone@example.com\"}\n",
        RecordFormat::ndjson);

    REQUIRE(batch.items.size() == 2);
    CHECK(batch.items[0].key == "A");
    CHECK(batch.items[1].url == "https://openreview.net/pdf?id=B");
    CHECK(batch.skipped == 2);
}

TEST_CASE("load_records from disk", "[records]") {
    test::TempDir dir;

    SECTION("Reads by extension") {
        test::write_file(dir / "s.csv", "forum,pdf\nK,/pdf?id=K\n");
        auto batch = load_records(dir / "s.csv", BASE);
        REQUIRE(batch.has_value());
        CHECK(batch->items.size() == 1);
    }

    SECTION("Missing file") {
        auto batch = load_records(dir / "missing.csv", BASE);
        REQUIRE(!batch.has_value());
        CHECK(batch.error() == core::RunErrc::input_unreadable);
    }

    SECTION("Unsupported extension") {
        test::write_file(dir / "s.xml", "<x/>");
        auto batch = load_records(dir / "s.xml", BASE);
        REQUIRE(!batch.has_value());
        CHECK(batch.error() == core::RunErrc::unsupported_format);
    }
}
