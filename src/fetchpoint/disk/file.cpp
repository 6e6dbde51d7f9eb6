// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/disk/file.hpp>
#include <fetchpoint/core/config.hpp>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fetchpoint::disk {

namespace fs = std::filesystem;

namespace {

void sync_directory(const fs::path& dir) noexcept {
    // Best effort: persists the rename itself on filesystems that need it
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd >= 0) {
        (void)::fsync(fd);
        ::close(fd);
    }
}

fs::path temp_path_for(const fs::path& path) {
    fs::path tmp = path;
    tmp += std::string(core::TEMP_SUFFIX);
    return tmp;
}

} // namespace

//=============================================================================
// File
//=============================================================================

std::expected<File, std::error_code>
File::create(const fs::path& path) noexcept {
    try {
        File file;
        file.path_ = path;
        file.fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (file.fd_ < 0) {
            return std::unexpected(from_errno(errno, DiskErrc::write_error));
        }
        return file;
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::write_error));
    }
}

File::~File() {
    (void)close();
}

File::File(File&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
    , written_(std::exchange(other.written_, 0)) {}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        (void)close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        written_ = std::exchange(other.written_, 0);
    }
    return *this;
}

std::error_code File::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::write_error);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, bytes, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        bytes += n;
        remaining -= static_cast<std::size_t>(n);
    }

    written_ += size;
    return {};
}

std::error_code File::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::sync_failed);
    }
    if (::fsync(fd_) != 0) {
        return from_errno(errno, DiskErrc::sync_failed);
    }
    return {};
}

std::error_code File::close() noexcept {
    if (fd_ < 0) {
        return {};
    }
    int rc = ::close(std::exchange(fd_, -1));
    if (rc != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code write_atomically(const fs::path& path, std::string_view data) noexcept {
    try {
        if (path.has_parent_path()) {
            std::error_code dir_ec;
            fs::create_directories(path.parent_path(), dir_ec);
            if (dir_ec) {
                return from_errno(dir_ec.value(), DiskErrc::invalid_path);
            }
        }

        const fs::path tmp = temp_path_for(path);
        auto file = File::create(tmp);
        if (!file) {
            return file.error();
        }

        std::error_code ec = file->write(data.data(), data.size());
        if (!ec) ec = file->sync();
        if (!ec) ec = file->close();
        if (ec) {
            remove_quietly(tmp);
            return ec;
        }

        return commit(tmp, path);
    } catch (...) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code commit(const fs::path& from, const fs::path& to) noexcept {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        auto ec = from_errno(errno, DiskErrc::rename_failed);
        remove_quietly(from);
        return ec;
    }
    if (to.has_parent_path()) {
        sync_directory(to.parent_path());
    }
    return {};
}

std::expected<std::string, std::error_code> read_all(const fs::path& path) noexcept {
    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::error_code exists_ec;
            if (!fs::exists(path, exists_ec)) {
                return std::unexpected(make_error_code(DiskErrc::file_not_found));
            }
            return std::unexpected(make_error_code(DiskErrc::access_denied));
        }
        std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
        return data;
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::error_code ensure_writable_directory(const fs::path& dir) noexcept {
    try {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return from_errno(ec.value(), DiskErrc::access_denied);
        }
        if (!fs::is_directory(dir, ec)) {
            return make_error_code(DiskErrc::invalid_path);
        }

        const fs::path probe = dir / ".fetchpoint-write-probe";
        auto file = File::create(probe);
        if (!file) {
            return file.error();
        }
        auto close_ec = file->close();
        remove_quietly(probe);
        return close_ec;
    } catch (...) {
        return make_error_code(DiskErrc::access_denied);
    }
}

void remove_quietly(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace fetchpoint::disk
