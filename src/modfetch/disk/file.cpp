// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/disk/file.hpp>
#include <cerrno>
#include <new>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace modfetch::disk {

//=============================================================================
// File
//=============================================================================

std::expected<File, std::error_code>
File::open(std::string_view path, OpenMode mode) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    File file;
    try {
        file.path_ = path;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (mode == OpenMode::truncate) {
        flags |= O_TRUNC;
    }

    file.fd_ = ::open(file.path_.c_str(), flags, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(from_errno(errno, DiskErrc::invalid_path));
    }
    return file;
}

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<std::size_t, std::error_code>
File::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::pwrite(fd_, bytes + written, size - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(from_errno(errno, DiskErrc::write_error));
        }
        if (n == 0) {
            return std::unexpected(make_error_code(DiskErrc::write_error));
        }
        written += static_cast<std::size_t>(n);
    }
    return written;
}

std::expected<std::uint64_t, std::error_code> File::size() const noexcept {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(from_errno(errno, DiskErrc::handle_invalid));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code File::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void File::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace modfetch::disk
