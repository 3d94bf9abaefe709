// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/disk/file_sink.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace modfetch::disk {

std::string target_path(const core::DownloadConfig& config, const core::Url& url) {
    std::filesystem::path path(config.save_path);
    path /= config.file.empty() ? url.filename() : config.file;
    return path.string();
}

//=============================================================================
// FileSink
//=============================================================================

std::expected<std::unique_ptr<FileSink>, std::error_code>
FileSink::open(std::string_view path, const core::DownloadConfig& config) noexcept {
    const std::uint64_t resume_from = config.resume ? config.bytes_on_disk.value_or(0) : 0;

    auto file = File::open(path, resume_from > 0 ? OpenMode::keep : OpenMode::truncate);
    if (!file) {
        return std::unexpected(file.error());
    }
    if (resume_from > 0) {
        // Continuing past the end would leave a hole in the file
        auto size = file->size();
        if (!size) {
            return std::unexpected(size.error());
        }
        if (*size < resume_from) {
            spdlog::warn("sink: {} holds {} bytes, cannot resume at {}", path, *size, resume_from);
            return std::unexpected(make_error_code(DiskErrc::seek_error));
        }
    }

    spdlog::debug("sink: writing {} from offset {}", path, resume_from);
    return std::unique_ptr<FileSink>(new FileSink(std::move(*file), resume_from));
}

std::error_code FileSink::on_content(std::span<const std::byte> content) {
    auto written = file_.write(position_, content.data(), content.size());
    if (!written) {
        return written.error();
    }
    position_ += *written;
    bytes_written_ += *written;
    return {};
}

std::error_code FileSink::on_concurrent_content(std::uint64_t byte_count,
                                                std::uint64_t offset,
                                                std::span<const std::byte> content) {
    const auto size = static_cast<std::size_t>(std::min<std::uint64_t>(byte_count, content.size()));
    auto written = file_.write(offset, content.data(), size);
    if (!written) {
        return written.error();
    }
    bytes_written_ += *written;
    return {};
}

void FileSink::on_finish() {
    if (auto ec = file_.flush()) {
        spdlog::warn("sink: flushing {} failed: {}", file_.path(), ec.message());
    }
}

} // namespace modfetch::disk
