// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/input/record_source.hpp>
#include <fetchpoint/core/url.hpp>
#include <fetchpoint/disk/file.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace fetchpoint::input {

using json = nlohmann::json;

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string_view strip_bom(std::string_view s) noexcept {
    constexpr std::string_view bom = "\xEF\xBB\xBF";
    if (s.starts_with(bom)) s.remove_prefix(bom.size());
    return s;
}

// A raw record before validation
struct RawRecord {
    std::string key;
    std::optional<std::string> url;  // nullopt: field absent or null
    std::string title;
};

// Accepts "url", {"value": "url"} and JSON-encoded objects inside strings
std::optional<std::string> value_of(const json& field) {
    if (field.is_string()) {
        const auto& s = field.get_ref<const std::string&>();
        auto t = trim(s);
        if (t.starts_with('{')) {
            auto inner = json::parse(t, nullptr, false);
            if (!inner.is_discarded()) return value_of(inner);
        }
        return s;
    }
    if (field.is_object()) {
        auto it = field.find("value");
        if (it != field.end()) return value_of(*it);
    }
    return std::nullopt;
}

std::string key_of(const json& obj) {
    for (const char* name : {"forum", "note_id", "id"}) {
        auto it = obj.find(name);
        if (it == obj.end()) continue;
        if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
        if (it->is_number_integer()) {
            return std::to_string(it->get<std::int64_t>());
        }
    }
    return {};
}

RawRecord from_object(const json& obj) {
    RawRecord rec;
    rec.key = key_of(obj);

    if (auto it = obj.find("pdf"); it != obj.end()) {
        rec.url = value_of(*it);
    } else if (auto content = obj.find("content"); content != obj.end() && content->is_object()) {
        if (auto pdf = content->find("pdf"); pdf != content->end()) {
            rec.url = value_of(*pdf);
        }
    }

    const json* title = nullptr;
    if (auto it = obj.find("title"); it != obj.end()) {
        title = &*it;
    } else if (auto content = obj.find("content"); content != obj.end() && content->is_object()) {
        if (auto t = content->find("title"); t != content->end()) title = &*t;
    }
    if (title != nullptr) {
        if (auto v = value_of(*title)) rec.title = *v;
    }
    return rec;
}

// Validate and normalise raw records into a batch
class BatchBuilder {
public:
    explicit BatchBuilder(std::string_view base_url) : base_url_(base_url) {}

    void add(RawRecord rec, std::size_t position) {
        if (rec.key.empty()) {
            ++batch_.skipped;
            spdlog::warn("Record {}: {}", position, core::make_error_code(core::RunErrc::malformed_record).message());
            return;
        }

        auto url = rec.url ? trim(*rec.url) : std::string_view{};
        if (url.empty() || url == "null") {
            ++batch_.skipped;
            spdlog::warn("Record {} ({}): {}", position, rec.key,
                         core::make_error_code(core::RunErrc::missing_url).message());
            return;
        }

        auto resolved = core::resolve_url(base_url_, url);
        if (!resolved) {
            ++batch_.skipped;
            spdlog::warn("Record {} ({}): {}: {}", position, rec.key, resolved.error().message(), url);
            return;
        }

        if (!seen_.insert(rec.key).second) {
            ++batch_.duplicates;
            spdlog::debug("Record {}: repeated key {} ignored", position, rec.key);
            return;
        }

        batch_.items.push_back({std::move(rec.key), std::move(*resolved), std::move(rec.title)});
    }

    [[nodiscard]] RecordBatch finish() { return std::move(batch_); }

private:
    std::string_view base_url_;
    RecordBatch batch_;
    std::unordered_set<std::string> seen_;
};

std::expected<RecordBatch, std::error_code>
parse_csv_records(std::string_view content, std::string_view base_url) {
    auto rows = parse_csv(strip_bom(content));
    if (rows.empty()) {
        return RecordBatch{};
    }

    std::unordered_map<std::string, std::size_t> columns;
    for (std::size_t i = 0; i < rows[0].size(); ++i) {
        columns.emplace(lower(trim(rows[0][i])), i);
    }

    auto column = [&](std::initializer_list<const char*> names) -> std::optional<std::size_t> {
        for (const char* name : names) {
            if (auto it = columns.find(name); it != columns.end()) return it->second;
        }
        return std::nullopt;
    };
    const auto forum_col = column({"forum"});
    const auto note_col = column({"note_id"});
    const auto pdf_col = column({"pdf"});
    const auto title_col = column({"title"});

    auto cell = [](const std::vector<std::string>& row, std::optional<std::size_t> col) -> std::string {
        if (!col || *col >= row.size()) return {};
        return std::string(trim(row[*col]));
    };

    BatchBuilder builder(base_url);
    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() == 1 && trim(row[0]).empty()) continue;  // Blank line

        RawRecord rec;
        rec.key = cell(row, forum_col);
        if (rec.key.empty()) rec.key = cell(row, note_col);

        auto pdf = cell(row, pdf_col);
        if (!pdf.empty()) rec.url = value_of(json(pdf));

        auto title = cell(row, title_col);
        if (!title.empty()) {
            auto v = value_of(json(title));
            rec.title = v ? *v : title;
        }
        builder.add(std::move(rec), r + 1);
    }
    return builder.finish();
}

std::expected<RecordBatch, std::error_code>
parse_json_records(std::string_view content, std::string_view base_url) {
    auto doc = json::parse(strip_bom(content), nullptr, false);
    if (doc.is_discarded()) {
        spdlog::error("Input is not valid JSON");
        return std::unexpected(core::make_error_code(core::RunErrc::input_unreadable));
    }

    const json* list = &doc;
    if (doc.is_object()) {
        for (const char* name : {"notes", "submissions", "items"}) {
            if (auto it = doc.find(name); it != doc.end() && it->is_array()) {
                list = &*it;
                break;
            }
        }
    }
    if (!list->is_array()) {
        spdlog::error("Input JSON holds no array of records");
        return std::unexpected(core::make_error_code(core::RunErrc::input_unreadable));
    }

    BatchBuilder builder(base_url);
    std::size_t position = 0;
    for (const auto& entry : *list) {
        ++position;
        if (!entry.is_object()) {
            builder.add({}, position);
            continue;
        }
        builder.add(from_object(entry), position);
    }
    return builder.finish();
}

std::expected<RecordBatch, std::error_code>
parse_ndjson_records(std::string_view content, std::string_view base_url) {
    content = strip_bom(content);
    BatchBuilder builder(base_url);
    std::size_t skipped_lines = 0;
    std::size_t line_no = 0;

    while (!content.empty()) {
        auto eol = content.find('\n');
        auto line = trim(content.substr(0, eol));
        content = eol == std::string_view::npos ? std::string_view{} : content.substr(eol + 1);
        ++line_no;

        if (line.empty()) continue;

        auto obj = json::parse(line, nullptr, false);
        if (obj.is_discarded() || !obj.is_object()) {
            ++skipped_lines;
            spdlog::warn("Line {}: not a JSON object, skipped", line_no);
            continue;
        }
        builder.add(from_object(obj), line_no);
    }

    auto batch = builder.finish();
    batch.skipped += skipped_lines;
    return batch;
}

} // namespace

std::vector<std::vector<std::string>> parse_csv(std::string_view text) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_started = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                row_started = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                row_started = true;
                break;
            case '\r':
                break;
            case '\n':
                row.push_back(std::move(field));
                field.clear();
                rows.push_back(std::move(row));
                row.clear();
                row_started = false;
                break;
            default:
                field += c;
                row_started = true;
                break;
        }
    }

    if (row_started || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::expected<RecordFormat, std::error_code>
detect_format(const std::filesystem::path& path) noexcept {
    const auto ext = lower(path.extension().string());
    if (ext == ".csv") return RecordFormat::csv;
    if (ext == ".json") return RecordFormat::json;
    if (ext == ".jsonl" || ext == ".ndjson") return RecordFormat::ndjson;
    return std::unexpected(core::make_error_code(core::RunErrc::unsupported_format));
}

std::expected<RecordBatch, std::error_code>
parse_records(std::string_view content, RecordFormat format, std::string_view base_url) noexcept {
    try {
        switch (format) {
            case RecordFormat::csv:    return parse_csv_records(content, base_url);
            case RecordFormat::json:   return parse_json_records(content, base_url);
            case RecordFormat::ndjson: return parse_ndjson_records(content, base_url);
        }
        return std::unexpected(core::make_error_code(core::RunErrc::unsupported_format));
    } catch (const std::exception& e) {
        spdlog::error("Failed to read records: {}", e.what());
        return std::unexpected(core::make_error_code(core::RunErrc::input_unreadable));
    }
}

std::expected<RecordBatch, std::error_code>
load_records(const std::filesystem::path& path, std::string_view base_url) noexcept {
    auto format = detect_format(path);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto content = disk::read_all(path);
    if (!content) {
        spdlog::error("Cannot read {}: {}", path.string(), content.error().message());
        return std::unexpected(core::make_error_code(core::RunErrc::input_unreadable));
    }

    auto batch = parse_records(*content, *format, base_url);
    if (batch) {
        spdlog::info("Loaded {} records from {} ({}), {} skipped, {} repeated",
                     batch->items.size(), path.filename().string(), to_string(*format),
                     batch->skipped, batch->duplicates);
    }
    return batch;
}

} // namespace fetchpoint::input
