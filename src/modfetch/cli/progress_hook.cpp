// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/cli/progress_hook.hpp>
#include <iostream>

namespace modfetch::cli {

ProgressHook::ProgressHook()
    : bar_(0, "Downloading")
    , spinner_("Downloading")
    , start_(std::chrono::steady_clock::now()) {}

void ProgressHook::on_resume_download(std::uint64_t bytes_on_disk) {
    base_ = bytes_on_disk;
}

void ProgressHook::on_content_length(std::uint64_t content_length) {
    total_ = content_length;
    bar_.total(content_length);
}

std::error_code ProgressHook::on_content(std::span<const std::byte> content) {
    if (!single_stream_) {
        single_stream_ = true;
        // A ranged single-stream response only counts the remainder
        if (total_ && base_ > 0) {
            *total_ += base_;
            bar_.total(*total_);
        }
    }
    advance(content.size());
    return {};
}

std::error_code ProgressHook::on_concurrent_content(std::uint64_t byte_count,
                                                    std::uint64_t /*offset*/,
                                                    std::span<const std::byte> /*content*/) {
    advance(byte_count);
    return {};
}

void ProgressHook::on_max_retries() {
    if (warned_) return;
    warned_ = true;
    std::cout << "\nWarning: retry budget exceeded, still retrying" << std::endl;
}

void ProgressHook::on_finish() {
    if (total_ && *total_ > 0) {
        bar_.finish();
    } else {
        spinner_.finish();
    }
}

void ProgressHook::advance(std::uint64_t bytes) noexcept {
    received_ += bytes;
    if (total_ && *total_ > 0) {
        bar_.update(base_ + received_, speed_bps());
    } else {
        spinner_.update(base_ + received_);
    }
}

std::uint64_t ProgressHook::speed_bps() const noexcept {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
    if (elapsed <= 0) return 0;
    return received_ * 1000 / static_cast<std::uint64_t>(elapsed);
}

} // namespace modfetch::cli
