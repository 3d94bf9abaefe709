// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/http_download.hpp>
#include <modfetch/core/chunk_fetcher.hpp>
#include <modfetch/core/worker_channels.hpp>
#include <modfetch/core/worker_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <format>
#include <optional>
#include <variant>

namespace modfetch::core {

namespace {

constexpr std::int32_t HTTP_PARTIAL_CONTENT = 206;
constexpr std::int32_t HTTP_BAD_REQUEST = 400;
constexpr std::int32_t HTTP_RANGE_NOT_SATISFIABLE = 416;

} // namespace

//=============================================================================
// HttpDownload
//=============================================================================

HttpDownload::HttpDownload(Url url, DownloadConfig config)
    : HttpDownload(std::move(url), std::move(config), make_curl_transport()) {}

HttpDownload::HttpDownload(Url url, DownloadConfig config, std::unique_ptr<HttpTransport> transport)
    : url_(std::move(url))
    , config_(std::move(config))
    , transport_(std::move(transport)) {
    config_.headers = normalize_headers(config_.headers);
    if (config_.user_agent.empty()) {
        config_.user_agent = default_user_agent();
    }
}

HttpDownload& HttpDownload::add_hook(std::unique_ptr<DownloadHook> hook) {
    if (hook) {
        hooks_.push_back(std::move(hook));
    }
    return *this;
}

std::error_code HttpDownload::download() noexcept {
    try {
        auto ec = run();
        if (ec) {
            spdlog::error("{}: {}", url_.full(), ec.message());
        }
        return ec;
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", url_.full(), e.what());
        return make_error_code(DownloadErrc::network_error);
    }
}

std::error_code HttpDownload::run() {
    if (!transport_) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (auto ec = validate_config(config_)) {
        return ec;
    }
    if (stop_source_.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }
    retries_.store(0, std::memory_order_relaxed);

    const std::uint64_t bytes_on_disk = config_.bytes_on_disk.value_or(0);
    if (bytes_on_disk > 0) {
        notify_resume_download(bytes_on_disk);
    }

    // Probe: headers only, the body is abandoned
    ResponseHandler probe_handler;
    probe_handler.on_headers = [](const HttpResponse&) { return false; };

    auto probe = transport_->perform(make_request(config_.headers), probe_handler);
    if (!probe) {
        return stop_source_.stop_requested() ? make_error_code(DownloadErrc::cancelled) : probe.error();
    }

    const Headers& headers = probe->headers;
    const std::int32_t status = probe->status_code;
    const bool supports_bytes = find_header(headers, header::accept_ranges) == "bytes";

    spdlog::debug("probe {}: status {}, ranges {}, length {}",
                  url_.full(), status, supports_bytes ? "yes" : "no",
                  find_header(headers, header::content_length).value_or("unknown"));

    Headers request_headers = config_.headers;
    if (supports_bytes && config_.concurrent && request_headers.contains(std::string(header::range))) {
        // Per-chunk ranges replace the caller's single range
        request_headers.erase(std::string(header::range));
        notify_server_supports_resume();
    }

    if (status == HTTP_RANGE_NOT_SATISFIABLE && bytes_on_disk > 0) {
        // "bytes */L" with L == bytes_on_disk: the file is already complete
        auto range = find_header(headers, header::content_range);
        auto total = range ? parse_unsatisfied_range(*range) : std::nullopt;
        if (total && *total == bytes_on_disk) {
            spdlog::info("{}: already complete at {} bytes", url_.full(), bytes_on_disk);
            notify_headers(headers);
            notify_content_length(*total);
            notify_finish();
            return {};
        }
    }

    if (status >= HTTP_BAD_REQUEST) {
        notify_failure_status(status);
        return make_error_code(DownloadErrc::http_status);
    }

    const HttpRequest request = make_request(request_headers);
    notify_headers(headers);

    auto content_length = parse_content_length(headers);
    if (!content_length) {
        return content_length.error();
    }

    std::error_code ec;
    if (supports_bytes && config_.concurrent && content_length->has_value()) {
        std::uint64_t total = **content_length;
        if (status == HTTP_PARTIAL_CONTENT) {
            // Probe carried the caller's Range; Content-Length is only the remainder
            auto range = find_header(headers, header::content_range);
            auto parsed = range ? parse_content_range(*range) : std::nullopt;
            if (!parsed || !parsed->total) {
                return make_error_code(DownloadErrc::invalid_content_length);
            }
            total = *parsed->total;
        }
        ec = concurrent_download(request, total);
    } else if (bytes_on_disk > 0 && !find_header(request.headers, header::range)) {
        // The stream has to continue where the file ends
        HttpRequest resumed = request;
        resumed.headers[std::string(header::range)] = std::format("bytes={}-", bytes_on_disk);
        ec = single_stream_download(resumed);
    } else {
        ec = single_stream_download(request);
    }
    if (ec) {
        return ec;
    }

    notify_success_status(status);
    notify_finish();
    return {};
}

std::error_code HttpDownload::concurrent_download(const HttpRequest& request,
                                                  std::uint64_t content_length) {
    TransferState state;
    state.content_length = content_length;
    state.count = config_.bytes_on_disk.value_or(0);

    notify_content_length(content_length);

    if (state.count > state.content_length) {
        return make_error_code(DownloadErrc::invalid_range);
    }
    if (state.count == state.content_length) {
        return {};
    }

    const std::vector<Chunk> chunks = config_.chunk_offsets
        ? *config_.chunk_offsets
        : partition(content_length, config_.chunk_size, state.count);
    if (chunks.empty()) {
        return make_error_code(DownloadErrc::invalid_range);
    }

    spdlog::info("{}: {} bytes in {} chunks on {} workers",
                 url_.full(), content_length - state.count, chunks.size(), config_.num_workers);

    const auto buffer_size = static_cast<std::size_t>(config_.chunk_size);

    // Pool after channels: workers are joined while the channels still exist
    WorkerChannels channels;
    WorkerPool pool(config_.num_workers);

    auto submit = [&](const Chunk& chunk) {
        pool.submit([this, &channels, request, chunk, buffer_size](std::stop_token stop) {
            fetch_chunk(*transport_, request, chunk, buffer_size, channels, stop);
        });
    };

    for (const auto& chunk : chunks) {
        submit(chunk);
        ++state.in_flight;
    }

    std::error_code ec;
    auto stop = stop_source_.get_token();

    while (state.count < state.content_length) {
        auto message = channels.receive(stop);
        if (!message) {
            ec = stop.stop_requested()
                ? make_error_code(DownloadErrc::cancelled)
                : make_error_code(DownloadErrc::channel_closed);
            break;
        }

        if (auto* data = std::get_if<ChunkData>(&*message)) {
            ec = accept_chunk_data(state, data->chunk, data->offset, data->bytes);
            if (ec) break;
        } else if (std::holds_alternative<ChunkCompleted>(*message)) {
            --state.in_flight;
            if (state.in_flight == 0 && state.count < state.content_length) {
                spdlog::warn("{}: all chunks done at {} of {} bytes",
                             url_.full(), state.count, state.content_length);
                ec = make_error_code(DownloadErrc::incomplete_transfer);
                break;
            }
        } else if (auto* failure = std::get_if<ChunkFailure>(&*message)) {
            ++state.retries;
            retries_.store(state.retries, std::memory_order_relaxed);
            spdlog::warn("chunk {}-{}: retry {} after {}",
                         failure->chunk.start, failure->chunk.end, state.retries, failure->error.message());

            if (state.retries > config_.max_retries) {
                spdlog::warn("{}: retry budget of {} exceeded", url_.full(), config_.max_retries);
                notify_max_retries();
                if (config_.retry_exhaustion == RetryExhaustion::fail) {
                    ec = make_error_code(DownloadErrc::retries_exhausted);
                    break;
                }
            }
            submit(failure->chunk);
        }
    }

    // Unblock workers still sending before the pool joins them
    channels.close();

    if (!ec) {
        spdlog::info("{}: {} bytes, {} retries", url_.full(), state.count, state.retries);
    }
    return ec;
}

std::error_code HttpDownload::accept_chunk_data(TransferState& state,
                                                const Chunk& chunk,
                                                std::uint64_t offset,
                                                std::span<const std::byte> bytes) {
    // A retried chunk starts over; skip what an earlier attempt delivered
    auto& delivered_until = state.delivered.try_emplace(chunk.start, chunk.start).first->second;
    if (offset + bytes.size() <= delivered_until) {
        return {};
    }
    if (offset < delivered_until) {
        bytes = bytes.subspan(static_cast<std::size_t>(delivered_until - offset));
        offset = delivered_until;
    }

    if (bytes.size() > state.content_length - state.count) {
        return make_error_code(DownloadErrc::invalid_range);
    }

    delivered_until = offset + bytes.size();
    state.count += bytes.size();
    return notify_concurrent_content(offset, bytes);
}

std::error_code HttpDownload::single_stream_download(const HttpRequest& request) {
    std::optional<std::uint64_t> content_length;
    std::uint64_t received = 0;
    std::error_code handler_error;
    const bool resumed = config_.bytes_on_disk.value_or(0) > 0;

    ResponseHandler handler;
    handler.on_headers = [&](const HttpResponse& response) {
        if (response.status_code >= HTTP_BAD_REQUEST) {
            notify_failure_status(response.status_code);
            handler_error = make_error_code(DownloadErrc::http_status);
            return false;
        }
        if (resumed && response.status_code != HTTP_PARTIAL_CONTENT) {
            // A full body would land after the bytes already on disk
            handler_error = make_error_code(DownloadErrc::range_not_honoured);
            return false;
        }
        auto parsed = parse_content_length(response.headers);
        if (!parsed) {
            handler_error = parsed.error();
            return false;
        }
        content_length = *parsed;
        if (content_length) {
            notify_content_length(*content_length);
            return *content_length > 0;
        }
        return true;
    };
    handler.on_body = [&](std::span<const std::byte> piece) {
        if (content_length) {
            piece = piece.first(static_cast<std::size_t>(
                std::min<std::uint64_t>(piece.size(), *content_length - received)));
        }
        if (!piece.empty()) {
            received += piece.size();
            if (auto ec = notify_content(piece)) {
                handler_error = ec;
                return false;
            }
        }
        return !content_length || received < *content_length;
    };

    spdlog::info("{}: single-stream transfer", url_.full());

    auto result = transport_->perform(request, handler);
    if (!result) {
        return stop_source_.stop_requested() ? make_error_code(DownloadErrc::cancelled) : result.error();
    }
    if (handler_error) {
        return handler_error;
    }
    if (stop_source_.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    spdlog::info("{}: {} bytes", url_.full(), received);
    return {};
}

HttpRequest HttpDownload::make_request(const Headers& headers) const {
    HttpRequest request;
    request.url = url_.full();
    request.headers = headers;
    request.user_agent = config_.user_agent;
    request.timeout = config_.timeout;
    request.buffer_size = static_cast<std::size_t>(config_.chunk_size);
    request.stop = stop_source_.get_token();
    return request;
}

//=============================================================================
// Event fan-out
//=============================================================================

void HttpDownload::notify_resume_download(std::uint64_t bytes_on_disk) {
    for (auto& hook : hooks_) hook->on_resume_download(bytes_on_disk);
}

void HttpDownload::notify_server_supports_resume() {
    for (auto& hook : hooks_) hook->on_server_supports_resume();
}

void HttpDownload::notify_headers(const Headers& headers) {
    for (auto& hook : hooks_) hook->on_headers(headers);
}

void HttpDownload::notify_content_length(std::uint64_t content_length) {
    for (auto& hook : hooks_) hook->on_content_length(content_length);
}

std::error_code HttpDownload::notify_content(std::span<const std::byte> content) {
    for (auto& hook : hooks_) {
        if (auto ec = hook->on_content(content)) return ec;
    }
    return {};
}

std::error_code HttpDownload::notify_concurrent_content(std::uint64_t offset, std::span<const std::byte> content) {
    for (auto& hook : hooks_) {
        if (auto ec = hook->on_concurrent_content(content.size(), offset, content)) return ec;
    }
    return {};
}

void HttpDownload::notify_success_status(std::int32_t status_code) {
    for (auto& hook : hooks_) hook->on_success_status(status_code);
}

void HttpDownload::notify_failure_status(std::int32_t status_code) {
    for (auto& hook : hooks_) hook->on_failure_status(status_code);
}

void HttpDownload::notify_max_retries() {
    for (auto& hook : hooks_) hook->on_max_retries();
}

void HttpDownload::notify_finish() {
    for (auto& hook : hooks_) hook->on_finish();
}

} // namespace modfetch::core
