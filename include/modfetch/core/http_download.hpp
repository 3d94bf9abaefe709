// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/chunk.hpp>
#include <modfetch/core/config.hpp>
#include <modfetch/core/download_hook.hpp>
#include <modfetch/core/error.hpp>
#include <modfetch/core/http_transport.hpp>
#include <modfetch/core/url.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <stop_token>
#include <system_error>
#include <vector>

namespace modfetch::core {

// Drives one download: probes the server, then either fetches byte
// ranges on a worker pool or streams the body in one request. Every
// byte from bytes_on_disk onward reaches the hooks exactly once.
class HttpDownload {
public:
    HttpDownload(Url url, DownloadConfig config);
    HttpDownload(Url url, DownloadConfig config, std::unique_ptr<HttpTransport> transport);

    HttpDownload(const HttpDownload&) = delete;
    HttpDownload& operator=(const HttpDownload&) = delete;

    // Register a hook. Hooks run in registration order.
    HttpDownload& add_hook(std::unique_ptr<DownloadHook> hook);

    // Run the transfer on the calling thread. Empty on success.
    [[nodiscard]] std::error_code download() noexcept;

    // Safe from any thread. The current (or next) download() returns cancelled.
    void cancel() noexcept { stop_source_.request_stop(); }

    [[nodiscard]] const Url& url() const noexcept { return url_; }
    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

    // Retry count of the most recent concurrent run
    [[nodiscard]] std::uint32_t retries() const noexcept { return retries_.load(std::memory_order_relaxed); }

private:
    // Mutable bookkeeping of the concurrent path
    struct TransferState {
        std::uint64_t count{0};
        std::uint32_t retries{0};
        std::uint64_t content_length{0};
        std::uint32_t in_flight{0};
        // chunk start -> absolute offset delivered up to (exclusive)
        std::map<std::uint64_t, std::uint64_t> delivered;
    };

    [[nodiscard]] std::error_code run();

    [[nodiscard]] std::error_code concurrent_download(const HttpRequest& request,
                                                      std::uint64_t content_length);

    [[nodiscard]] std::error_code single_stream_download(const HttpRequest& request);

    [[nodiscard]] HttpRequest make_request(const Headers& headers) const;

    [[nodiscard]] std::error_code accept_chunk_data(TransferState& state,
                                                    const Chunk& chunk,
                                                    std::uint64_t offset,
                                                    std::span<const std::byte> bytes);

    // Event fan-out
    void notify_resume_download(std::uint64_t bytes_on_disk);
    void notify_server_supports_resume();
    void notify_headers(const Headers& headers);
    void notify_content_length(std::uint64_t content_length);
    [[nodiscard]] std::error_code notify_content(std::span<const std::byte> content);
    [[nodiscard]] std::error_code notify_concurrent_content(std::uint64_t offset, std::span<const std::byte> content);
    void notify_success_status(std::int32_t status_code);
    void notify_failure_status(std::int32_t status_code);
    void notify_max_retries();
    void notify_finish();

    Url url_;
    DownloadConfig config_;
    std::unique_ptr<HttpTransport> transport_;
    std::vector<std::unique_ptr<DownloadHook>> hooks_;
    std::stop_source stop_source_;
    std::atomic<std::uint32_t> retries_{0};
};

} // namespace modfetch::core
