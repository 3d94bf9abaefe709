// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/error.hpp>
#include <modfetch/core/headers.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>

namespace modfetch::core {

// GET request description; copied freely, one copy per worker task
struct HttpRequest {
    std::string url;
    Headers headers;             // lower-case names
    std::string user_agent;
    std::chrono::seconds timeout{0};
    std::size_t buffer_size{0};  // preferred body piece size, 0 = transport default
    std::stop_token stop;        // aborts the transfer when stop is requested
};

// Head of the final response (after redirects)
struct HttpResponse {
    std::int32_t status_code{0};
    Headers headers;             // lower-case names
    std::uint64_t body_bytes{0}; // body bytes handed to on_body
    bool stopped_early{false};   // a handler callback asked to stop
};

// Callbacks for a streaming GET. Either may return false to stop the
// transfer; that is reported as success with stopped_early set.
struct ResponseHandler {
    std::function<bool(const HttpResponse&)> on_headers;
    std::function<bool(std::span<const std::byte>)> on_body;
};

// Seam between the download engine and the network. Implementations must
// allow concurrent perform() calls from worker threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Run one GET. on_headers fires exactly once, before any on_body call.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, const ResponseHandler& handler) = 0;
};

// libcurl transport. Each perform() uses its own easy handle.
class CurlTransport final : public HttpTransport {
public:
    CurlTransport() = default;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, const ResponseHandler& handler) override;

    // Call once at startup / shutdown before any transfer
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

[[nodiscard]] std::unique_ptr<HttpTransport> make_curl_transport();

} // namespace modfetch::core
