// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/chunk.hpp>
#include <modfetch/core/http_transport.hpp>
#include <modfetch/core/worker_channels.hpp>
#include <cstddef>
#include <stop_token>
#include <system_error>

namespace modfetch::core {

// Request for one chunk: template headers plus Range, Accept, Connection
[[nodiscard]] HttpRequest make_chunk_request(HttpRequest request, const Chunk& chunk);

// Fetch one chunk and stream it into channels as ChunkData pieces of at
// most buffer_size bytes. Reading stops at end of stream or after
// chunk.length() bytes. Ends with ChunkCompleted on success, or with a
// ChunkFailure carrying the original chunk on any error.
void fetch_chunk(HttpTransport& transport,
                 const HttpRequest& request,
                 const Chunk& chunk,
                 std::size_t buffer_size,
                 WorkerChannels& channels,
                 std::stop_token stop) noexcept;

} // namespace modfetch::core
