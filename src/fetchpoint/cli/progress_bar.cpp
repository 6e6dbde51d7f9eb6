// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace fetchpoint::cli {

namespace chrono = std::chrono;

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t done, std::uint64_t failed) noexcept {
    if (total_ == 0 || finished_) return;

    auto elapsed = chrono::duration_cast<chrono::seconds>(chrono::steady_clock::now() - started_);
    std::cout << '\r' << render(done, failed, elapsed) << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << '\r' << std::string(100, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(std::uint64_t done, std::uint64_t failed,
                                chrono::seconds elapsed) const {
    double percent = total_ == 0 ? 100.0
                                 : static_cast<double>(done) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);
    line += std::format(" {:5.1f}% ({}/{})", percent, done, total_);
    if (failed > 0) {
        line += std::format(" {} failed", failed);
    }

    // ETA from the average rate so far
    const auto finished = done + failed;
    const auto secs = static_cast<std::uint64_t>(elapsed.count());
    if (finished > 0 && finished < total_ && secs > 0) {
        auto eta = (total_ - finished) * secs / finished;
        line += " ETA: ";
        line += format_time(eta);
    }

    line += std::string(8, ' ');
    return line;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}h {:02}m {}s", hours, minutes, secs);
    } else if (minutes > 0) {
        return std::format("{}m {}s", minutes, secs);
    }
    return std::format("{}s", secs);
}

} // namespace fetchpoint::cli
