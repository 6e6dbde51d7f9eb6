// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace fetchpoint::cli {

// Item-count progress bar for the console
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Redraw with `done` of `total` finished, `failed` of them failed
    void update(std::uint64_t done, std::uint64_t failed = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    // Build the bar text without drawing it
    [[nodiscard]] std::string render(std::uint64_t done, std::uint64_t failed,
                                     std::chrono::seconds elapsed) const;

    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::uint64_t total_{0};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point started_{std::chrono::steady_clock::now()};
};

} // namespace fetchpoint::cli
