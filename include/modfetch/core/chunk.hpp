// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modfetch::core {

// Byte range in absolute resource offsets, sent as "bytes=start-end"
struct Chunk {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
    [[nodiscard]] std::string range_header() const;

    friend bool operator==(const Chunk&, const Chunk&) = default;
};

// Split [first_byte, content_length) into chunk_size pieces. The last
// chunk takes the remainder and ends at content_length, so it can be
// up to twice chunk_size. A span shorter than one chunk yields a
// single (first_byte, content_length) chunk. chunk_size must be > 0.
[[nodiscard]] std::vector<Chunk> partition(std::uint64_t content_length,
                                           std::uint64_t chunk_size,
                                           std::uint64_t first_byte = 0);

} // namespace modfetch::core
