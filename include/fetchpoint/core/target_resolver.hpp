// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fetchpoint::core {

// What counts as an already-downloaded target
enum class Completeness : std::uint8_t {
    non_empty,      // Regular file with at least one byte
    pdf_signature,  // ...that also starts with "%PDF-"
};

// Maps keys to deterministic paths under <output_dir>/pdfs
class TargetResolver {
public:
    explicit TargetResolver(std::filesystem::path output_dir,
                            Completeness completeness = Completeness::non_empty);

    [[nodiscard]] const std::filesystem::path& target_dir() const noexcept { return target_dir_; }

    [[nodiscard]] std::filesystem::path path_for(std::string_view key) const;

    // Staging path the body is streamed into before it is moved into place
    [[nodiscard]] std::filesystem::path partial_path_for(std::string_view key) const;

    [[nodiscard]] bool is_complete(std::string_view key) const noexcept;

    // Check a file on disk against the configured predicate
    [[nodiscard]] bool satisfies(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] Completeness completeness() const noexcept { return completeness_; }

    // Key with path separators, '%' and leading dots percent-escaped.
    // Distinct keys always yield distinct stems.
    [[nodiscard]] static std::string file_stem(std::string_view key);

private:
    std::filesystem::path target_dir_;
    Completeness completeness_;
};

} // namespace fetchpoint::core
