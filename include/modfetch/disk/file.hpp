// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace modfetch::disk {

// How open() treats an existing file
enum class OpenMode : std::uint8_t {
    truncate,   // start empty
    keep        // keep existing contents (resume)
};

// POSIX file descriptor wrapper for positional writes. Writes at distinct
// offsets do not share a file position, so callers need no locking.
class File {
public:
    [[nodiscard]] static std::expected<File, std::error_code>
    open(std::string_view path, OpenMode mode) noexcept;

    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&&) noexcept;
    File& operator=(File&&) noexcept;

    // Write all of data at offset, retrying short writes
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    File() = default;

    int fd_{-1};
    std::string path_;
};

} // namespace modfetch::disk
