// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace fetchpoint::disk {

// Write-only file handle (POSIX descriptor, closed on destruction)
class File {
public:
    // Create or truncate a file for writing
    static std::expected<File, std::error_code>
    create(const std::filesystem::path& path) noexcept;

    File() = default;
    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&&) noexcept;
    File& operator=(File&&) noexcept;

    // Append bytes, retrying short writes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush file contents to stable storage
    [[nodiscard]] std::error_code sync() noexcept;

    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
    std::uint64_t written_{0};
};

// Replace `path` with `data` so readers see either the old or the new
// contents, never a mix: write <path>.tmp, fsync, rename.
[[nodiscard]] std::error_code write_atomically(const std::filesystem::path& path,
                                               std::string_view data) noexcept;

// Rename a fully written file into its final place and sync the directory
[[nodiscard]] std::error_code commit(const std::filesystem::path& from,
                                     const std::filesystem::path& to) noexcept;

[[nodiscard]] std::expected<std::string, std::error_code>
read_all(const std::filesystem::path& path) noexcept;

// Create the directory if needed and prove a file can be written into it
[[nodiscard]] std::error_code ensure_writable_directory(const std::filesystem::path& dir) noexcept;

// Remove a file, ignoring a missing one
void remove_quietly(const std::filesystem::path& path) noexcept;

} // namespace fetchpoint::disk
