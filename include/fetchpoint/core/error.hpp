// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace fetchpoint::core {

// Outcome of a single network fetch
enum class FetchErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    connection_lost,
    not_found,
    forbidden,
    rate_limited,
    server_error,
    http_error,
    empty_body,
    unexpected_content,
    write_failed,
    invalid_url,
    cancelled,
};

// Run-level failures (input, configuration, checkpoint)
enum class RunErrc {
    success = 0,
    output_not_writable,
    input_unreadable,
    unsupported_format,
    no_records,
    malformed_record,
    missing_url,
    checkpoint_corrupt,
    preflight_failed,
    run_aborted,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "fetchpoint::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:            return "Success";
            case FetchErrc::network_error:      return "Network error";
            case FetchErrc::timeout:            return "Request timed out";
            case FetchErrc::refused:            return "Connection refused";
            case FetchErrc::dns_error:          return "DNS resolution failed";
            case FetchErrc::ssl_error:          return "SSL/TLS error";
            case FetchErrc::too_many_redirects: return "Too many redirects";
            case FetchErrc::connection_lost:    return "Connection lost";
            case FetchErrc::not_found:          return "Resource not found (404)";
            case FetchErrc::forbidden:          return "Access forbidden (401/403)";
            case FetchErrc::rate_limited:       return "Rate limited (429)";
            case FetchErrc::server_error:       return "Server error (5xx)";
            case FetchErrc::http_error:         return "Unexpected HTTP status";
            case FetchErrc::empty_body:         return "Empty response body";
            case FetchErrc::unexpected_content: return "Response is not a PDF document";
            case FetchErrc::write_failed:       return "Failed to write response body";
            case FetchErrc::invalid_url:        return "Invalid URL";
            case FetchErrc::cancelled:          return "Fetch cancelled";
            default:                            return "Unknown error";
        }
    }
};

struct RunErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "fetchpoint::run";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<RunErrc>(ev)) {
            case RunErrc::success:             return "Success";
            case RunErrc::output_not_writable: return "Output directory is not writable";
            case RunErrc::input_unreadable:    return "Input file cannot be read";
            case RunErrc::unsupported_format:  return "Unsupported input format";
            case RunErrc::no_records:          return "No downloadable records in input";
            case RunErrc::malformed_record:    return "Malformed record";
            case RunErrc::missing_url:         return "Record has no URL";
            case RunErrc::checkpoint_corrupt:  return "Checkpoint file is corrupt";
            case RunErrc::preflight_failed:    return "Connectivity check failed";
            case RunErrc::run_aborted:         return "Run aborted by an internal error";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline const detail::RunErrcCategory& run_errc_category() noexcept {
    static detail::RunErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

inline std::error_code make_error_code(RunErrc e) noexcept {
    return {static_cast<int>(e), run_errc_category()};
}

// True for failures that may clear up on a later attempt
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != fetch_errc_category()) {
        return false;
    }
    switch (static_cast<FetchErrc>(ec.value())) {
        case FetchErrc::network_error:
        case FetchErrc::timeout:
        case FetchErrc::refused:
        case FetchErrc::dns_error:
        case FetchErrc::ssl_error:
        case FetchErrc::connection_lost:
        case FetchErrc::rate_limited:
        case FetchErrc::server_error:
        case FetchErrc::write_failed:
        case FetchErrc::cancelled:
            return true;
        default:
            return false;
    }
}

} // namespace fetchpoint::core

namespace std {

template<>
struct is_error_code_enum<fetchpoint::core::FetchErrc> : true_type {};

template<>
struct is_error_code_enum<fetchpoint::core::RunErrc> : true_type {};

} // namespace std
