// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <cerrno>
#include <string>
#include <system_error>

namespace fetchpoint::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    rename_failed,
    sync_failed,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "fetchpoint::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::file_not_found: return "File not found";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::read_error:     return "Read error";
            case DiskErrc::rename_failed:  return "Rename failed";
            case DiskErrc::sync_failed:    return "Sync to storage failed";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value to the closest disk error
[[nodiscard]] inline std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT: return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:  return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT: return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR: return make_error_code(DiskErrc::invalid_path);
        default:     return make_error_code(fallback);
    }
}

} // namespace fetchpoint::disk

namespace std {

template<>
struct is_error_code_enum<fetchpoint::disk::DiskErrc> : true_type {};

} // namespace std
