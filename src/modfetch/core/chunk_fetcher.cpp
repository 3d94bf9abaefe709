// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/chunk_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace modfetch::core {

namespace {

constexpr std::int32_t HTTP_PARTIAL_CONTENT = 206;

} // namespace

HttpRequest make_chunk_request(HttpRequest request, const Chunk& chunk) {
    request.headers[std::string(header::range)] = chunk.range_header();
    request.headers[std::string(header::accept)] = "*/*";
    request.headers[std::string(header::connection)] = "keep-alive";
    return request;
}

void fetch_chunk(HttpTransport& transport,
                 const HttpRequest& request,
                 const Chunk& chunk,
                 std::size_t buffer_size,
                 WorkerChannels& channels,
                 std::stop_token stop) noexcept {
    std::error_code error;

    try {
        HttpRequest chunk_request = make_chunk_request(request, chunk);
        chunk_request.buffer_size = buffer_size;
        chunk_request.stop = stop;

        const std::uint64_t wanted = chunk.length();
        std::uint64_t offset = chunk.start;
        std::uint64_t received = 0;
        std::error_code handler_error;

        ResponseHandler handler;
        handler.on_headers = [&](const HttpResponse& response) {
            if (response.status_code != HTTP_PARTIAL_CONTENT) {
                handler_error = response.status_code >= 400
                    ? make_error_code(DownloadErrc::http_status)
                    : make_error_code(DownloadErrc::range_not_honoured);
                return false;
            }
            return true;
        };
        handler.on_body = [&](std::span<const std::byte> piece) {
            auto take = std::min<std::uint64_t>(piece.size(), wanted - received);
            if (take > 0) {
                ChunkData data{chunk, offset, {piece.begin(), piece.begin() + static_cast<std::ptrdiff_t>(take)}};
                if (!channels.send_data(std::move(data))) {
                    handler_error = make_error_code(DownloadErrc::channel_closed);
                    return false;
                }
                offset += take;
                received += take;
            }
            return received < wanted;
        };

        spdlog::debug("chunk {}-{}: requesting", chunk.start, chunk.end);

        auto result = transport.perform(chunk_request, handler);
        if (!result) {
            error = result.error();
        } else if (handler_error) {
            error = handler_error;
        } else if (stop.stop_requested()) {
            error = make_error_code(DownloadErrc::cancelled);
        } else {
            spdlog::debug("chunk {}-{}: {} bytes", chunk.start, chunk.end, received);
        }
    } catch (const std::exception& e) {
        spdlog::debug("chunk {}-{}: {}", chunk.start, chunk.end, e.what());
        error = make_error_code(DownloadErrc::network_error);
    }

    if (error) {
        spdlog::warn("chunk {}-{} failed: {}", chunk.start, chunk.end, error.message());
        // A closed channel means the consumer has already gone
        (void)channels.send_failure({chunk, error});
        return;
    }

    (void)channels.send_completed(chunk);
}

} // namespace modfetch::core
