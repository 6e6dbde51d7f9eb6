// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace fetchpoint::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// True when `ref` starts with "scheme:" (RFC 3986 scheme characters)
bool has_scheme(std::string_view ref) noexcept {
    auto colon = ref.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(ref.front()))) {
        return false;
    }
    return std::all_of(ref.begin(), ref.begin() + static_cast<std::ptrdiff_t>(colon), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) {
            path_start = url_str.length();
        }

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) {
            query_start = url_str.length();
        }

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }

        // host_end is at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start});

        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            // IPv6 literal [::1]:port
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
                return std::unexpected(make_error_code(FetchErrc::invalid_url));
            }
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
                url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
                url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        }

        if (path_start < url_str.length() && path_start < std::min(query_start, fragment_start)) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        return url;
    } catch (...) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::expected<std::string, std::error_code>
resolve_url(std::string_view base, std::string_view reference) noexcept {
    reference = trim(reference);
    if (reference.empty()) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    if (has_scheme(reference)) {
        auto parsed = Url::parse(reference);
        if (!parsed || !parsed->is_http()) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }
        return std::string(reference);
    }

    auto parsed_base = Url::parse(trim(base));
    if (!parsed_base || !parsed_base->is_http()) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }

    try {
        // Protocol-relative reference: //host/path
        if (reference.starts_with("//")) {
            return parsed_base->scheme() + ":" + std::string(reference);
        }

        std::string result = parsed_base->base();
        if (!reference.starts_with('/')) {
            result += '/';
        }
        result += reference;
        return result;
    } catch (...) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }
}

} // namespace fetchpoint::core
