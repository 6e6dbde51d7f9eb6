// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/target_resolver.hpp>
#include <fetchpoint/core/config.hpp>
#include <array>
#include <fstream>
#include <utility>

namespace fetchpoint::core {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view PDF_MAGIC = "%PDF-";

bool has_pdf_signature(const fs::path& path) noexcept {
    try {
        std::ifstream in(path, std::ios::binary);
        std::array<char, PDF_MAGIC.size()> head{};
        if (!in.read(head.data(), static_cast<std::streamsize>(head.size()))) {
            return false;
        }
        return std::string_view(head.data(), head.size()) == PDF_MAGIC;
    } catch (...) {
        return false;
    }
}

} // namespace

TargetResolver::TargetResolver(fs::path output_dir, Completeness completeness)
    : target_dir_(std::move(output_dir) / std::string(TARGET_SUBDIR))
    , completeness_(completeness) {}

std::string TargetResolver::file_stem(std::string_view key) {
    if (key.empty()) {
        return "%";
    }

    std::string stem;
    stem.reserve(key.size());
    bool leading = true;
    for (char c : key) {
        // Percent-escape so distinct keys never share a file
        if (c == '/') {
            stem += "%2F";
        } else if (c == '\\') {
            stem += "%5C";
        } else if (c == '%') {
            stem += "%25";
        } else if (c == '\0') {
            stem += "%00";
        } else if (c == '.' && leading) {
            stem += "%2E";  // No hidden files, no "." or ".."
            continue;
        } else {
            stem += c;
        }
        leading = false;
    }
    return stem;
}

fs::path TargetResolver::path_for(std::string_view key) const {
    return target_dir_ / (file_stem(key) + std::string(TARGET_EXTENSION));
}

fs::path TargetResolver::partial_path_for(std::string_view key) const {
    auto path = path_for(key);
    path += std::string(PARTIAL_SUFFIX);
    return path;
}

bool TargetResolver::is_complete(std::string_view key) const noexcept {
    try {
        return satisfies(path_for(key));
    } catch (...) {
        return false;
    }
}

bool TargetResolver::satisfies(const fs::path& path) const noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        return false;
    }
    if (completeness_ == Completeness::pdf_signature) {
        return has_pdf_signature(path);
    }
    return true;
}

} // namespace fetchpoint::core
