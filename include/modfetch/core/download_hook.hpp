// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/headers.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

namespace modfetch::core {

// Observer of one download's lifecycle. Every event has a no-op default
// so an implementation overrides only what it needs. Events are delivered
// synchronously on the thread running HttpDownload::download(), in this
// order: resume download, server supports resume, headers, content
// length, content (repeated), status, max retries, finish.
//
// Content callbacks may fail; a non-empty error aborts the download and
// is returned from download().
class DownloadHook {
public:
    virtual ~DownloadHook() = default;

    // bytes_on_disk > 0 was supplied by the caller
    virtual void on_resume_download(std::uint64_t /*bytes_on_disk*/) {}

    // Server answered Accept-Ranges: bytes to a request carrying Range
    virtual void on_server_supports_resume() {}

    virtual void on_headers(const Headers& /*headers*/) {}

    virtual void on_content_length(std::uint64_t /*content_length*/) {}

    // Single-stream path: body bytes in transmission order
    [[nodiscard]] virtual std::error_code on_content(std::span<const std::byte> /*content*/) {
        return {};
    }

    // Concurrent path: byte_count bytes starting at absolute offset.
    // Chunks interleave, so consumers must place data by offset.
    [[nodiscard]] virtual std::error_code on_concurrent_content(std::uint64_t /*byte_count*/,
                                                                std::uint64_t /*offset*/,
                                                                std::span<const std::byte> /*content*/) {
        return {};
    }

    virtual void on_success_status(std::int32_t /*status_code*/) {}

    virtual void on_failure_status(std::int32_t /*status_code*/) {}

    // Fired each time a failed chunk pushes the retry counter past max_retries
    virtual void on_max_retries() {}

    virtual void on_finish() {}
};

} // namespace modfetch::core
