// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/config.hpp>
#include <modfetch/core/download_hook.hpp>
#include <modfetch/core/url.hpp>
#include <modfetch/disk/file.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace modfetch::disk {

// save_path/file, falling back to the URL's file name
[[nodiscard]] std::string target_path(const core::DownloadConfig& config, const core::Url& url);

// Hook that writes the downloaded bytes into the target file.
// Single-stream content is appended, concurrent content lands at its
// offset. A resumed download keeps the file and continues at
// bytes_on_disk, which must not lie past the end of the existing file;
// otherwise the file starts empty.
class FileSink final : public core::DownloadHook {
public:
    [[nodiscard]] static std::expected<std::unique_ptr<FileSink>, std::error_code>
    open(std::string_view path, const core::DownloadConfig& config) noexcept;

    [[nodiscard]] std::error_code on_content(std::span<const std::byte> content) override;

    [[nodiscard]] std::error_code on_concurrent_content(std::uint64_t byte_count,
                                                        std::uint64_t offset,
                                                        std::span<const std::byte> content) override;

    void on_finish() override;

    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }
    [[nodiscard]] const std::string& path() const noexcept { return file_.path(); }

private:
    FileSink(File file, std::uint64_t position) noexcept
        : file_(std::move(file)), position_(position) {}

    File file_;
    std::uint64_t position_{0};      // next single-stream write offset
    std::uint64_t bytes_written_{0};
};

} // namespace modfetch::disk
