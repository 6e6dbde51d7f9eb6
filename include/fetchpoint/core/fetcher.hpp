// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <fetchpoint/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace fetchpoint::core {

struct FetchResult {
    std::int32_t status_code{0};
    std::uint64_t bytes{0};
};

// Retrieves one URL into a local file. Implementations must be safe to call
// from several worker threads at once.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Stream the response body for `url` into `destination` (created or
    // truncated). On error the destination may hold partial data; the caller
    // owns cleanup.
    [[nodiscard]] virtual std::expected<FetchResult, std::error_code>
    fetch(const std::string& url,
          const std::filesystem::path& destination,
          std::chrono::seconds timeout) noexcept = 0;
};

} // namespace fetchpoint::core
