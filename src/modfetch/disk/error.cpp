// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/disk/error.hpp>
#include <cerrno>

namespace modfetch::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        case ESPIPE:
        case EOVERFLOW:     return make_error_code(DiskErrc::seek_error);
        default:            return make_error_code(fallback);
    }
}

} // namespace modfetch::disk
