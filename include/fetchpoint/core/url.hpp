// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace fetchpoint::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Resolve a possibly relative reference ("/pdf?id=x", "pdf/x.pdf") against a
// base such as "https://openreview.net". Absolute http(s) references are
// returned normalised; any other scheme is rejected.
[[nodiscard]] std::expected<std::string, std::error_code>
resolve_url(std::string_view base, std::string_view reference) noexcept;

} // namespace fetchpoint::core
