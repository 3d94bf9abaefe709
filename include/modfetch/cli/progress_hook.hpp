// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/cli/progress_bar.hpp>
#include <modfetch/core/download_hook.hpp>
#include <chrono>
#include <cstdint>
#include <optional>

namespace modfetch::cli {

// Drives the terminal progress bar from download events. Falls back to a
// spinner while the content length is unknown.
class ProgressHook final : public core::DownloadHook {
public:
    ProgressHook();

    void on_resume_download(std::uint64_t bytes_on_disk) override;
    void on_content_length(std::uint64_t content_length) override;
    [[nodiscard]] std::error_code on_content(std::span<const std::byte> content) override;
    [[nodiscard]] std::error_code on_concurrent_content(std::uint64_t byte_count,
                                                        std::uint64_t offset,
                                                        std::span<const std::byte> content) override;
    void on_max_retries() override;
    void on_finish() override;

    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }

private:
    void advance(std::uint64_t bytes) noexcept;
    [[nodiscard]] std::uint64_t speed_bps() const noexcept;

    ProgressBar bar_;
    Spinner spinner_;
    std::uint64_t base_{0};        // bytes already on disk
    std::uint64_t received_{0};    // bytes this run
    std::optional<std::uint64_t> total_;
    std::chrono::steady_clock::time_point start_;
    bool warned_{false};
    bool single_stream_{false};
};

} // namespace modfetch::cli
