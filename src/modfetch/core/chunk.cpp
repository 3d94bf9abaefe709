// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/chunk.hpp>
#include <format>

namespace modfetch::core {

std::string Chunk::range_header() const {
    return std::format("bytes={}-{}", start, end);
}

std::vector<Chunk> partition(std::uint64_t content_length,
                             std::uint64_t chunk_size,
                             std::uint64_t first_byte) {
    std::vector<Chunk> chunks;
    if (chunk_size == 0 || first_byte > content_length) {
        return chunks;
    }

    const std::uint64_t span = content_length - first_byte;
    const std::uint64_t count = span / chunk_size;
    chunks.reserve(count > 0 ? count : 1);

    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t start = first_byte + i * chunk_size;
        // Last chunk takes the remainder, bounded by content_length itself
        const std::uint64_t end = (i == count - 1)
            ? content_length
            : first_byte + (i + 1) * chunk_size - 1;
        chunks.push_back({start, end});
    }

    if (chunks.empty()) {
        chunks.push_back({first_byte, content_length});
    }
    return chunks;
}

} // namespace modfetch::core
