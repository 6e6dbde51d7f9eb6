// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/fetcher.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace fetchpoint::core {

// Outcome of a connectivity check. `error` carries the status mapping for a
// non-2xx answer; the server was still reached.
struct ProbeResult {
    std::int32_t status_code{0};
    std::error_code error;
};

// libcurl-backed fetcher. Each call uses its own easy handle, so one session
// can be shared by every worker. Proxy settings come from the environment.
class HttpSession final : public Fetcher {
public:
    HttpSession() = default;

    [[nodiscard]] std::expected<FetchResult, std::error_code>
    fetch(const std::string& url,
          const std::filesystem::path& destination,
          std::chrono::seconds timeout) noexcept override;

    // HEAD request used as a connectivity check. Fails only when no HTTP
    // status came back.
    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const std::string& url, std::chrono::seconds timeout) noexcept;

    // True for any HTTP status line, including 4xx and 5xx
    [[nodiscard]] static bool answered(long http_code) noexcept;

    // Map an HTTP status to an error (empty for 2xx)
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace fetchpoint::core
