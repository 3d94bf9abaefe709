// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace modfetch::core {

// Header map keyed by lower-case field name
using Headers = std::map<std::string, std::string>;

namespace header {
inline constexpr std::string_view accept = "accept";
inline constexpr std::string_view accept_ranges = "accept-ranges";
inline constexpr std::string_view connection = "connection";
inline constexpr std::string_view content_length = "content-length";
inline constexpr std::string_view content_range = "content-range";
inline constexpr std::string_view range = "range";
} // namespace header

// Parsed "Content-Range: bytes first-last/total"
struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;  // "*" means unknown
};

[[nodiscard]] std::string to_lower(std::string_view s);

// Copy with every field name lower-cased; later duplicates win
[[nodiscard]] Headers normalize_headers(const Headers& headers);

[[nodiscard]] std::optional<std::string_view> find_header(const Headers& headers, std::string_view name) noexcept;

// Rejects CR, LF and NUL anywhere, and empty or non-token names
[[nodiscard]] std::error_code validate_header(std::string_view name, std::string_view value) noexcept;

// Empty optional when the header is absent, invalid_content_length when present but malformed
[[nodiscard]] std::expected<std::optional<std::uint64_t>, std::error_code>
parse_content_length(const Headers& headers) noexcept;

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Total length from the "bytes */<total>" form sent with 416
[[nodiscard]] std::optional<std::uint64_t> parse_unsatisfied_range(std::string_view value) noexcept;

} // namespace modfetch::core
