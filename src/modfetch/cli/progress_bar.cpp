// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace modfetch::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

} // namespace

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(std::string_view label)
    : label_(label) {}

void Spinner::update(std::uint64_t current) noexcept {
    std::cout << "\r" << SPINNER_FRAMES[frame_ % 4] << " " << label_ << " "
              << ProgressBar::format_bytes(current) << "   " << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    std::cout << "\r" << label_ << " done" << std::string(20, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    std::cout << "\r" << std::string(60, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0) return;
    current_ = std::min(current, total_);

    double percent = static_cast<double>(current_) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on whole-percent steps
    auto scaled = static_cast<std::uint64_t>(percent);
    if (drawn_ && scaled <= last_percent_ && !finished_) return;
    last_percent_ = scaled;
    drawn_ = true;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);
    line += std::format(" {:3}% ({}/{})", scaled, format_bytes(current_), format_bytes(total_));

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        std::uint64_t remaining = total_ - current_;
        if (remaining > 0) {
            line += " ETA: ";
            line += format_time(remaining / speed_bps);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');

    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_, 0);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(bar_width - filled), ' ');
    bar += ']';
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    if (bps >= GB) return std::format("{:.1f} GB/s", static_cast<double>(bps) / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", static_cast<double>(bps) / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", static_cast<double>(bps) / KB);
    return std::format("{} B/s", bps);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return std::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    return std::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

} // namespace modfetch::cli
