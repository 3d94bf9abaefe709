// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/headers.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace modfetch::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// RFC 9110 token characters
bool is_tchar(char c) noexcept {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
    return extra.find(c) != std::string_view::npos;
}

} // namespace

std::string to_lower(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

Headers normalize_headers(const Headers& headers) {
    Headers normalized;
    for (const auto& [name, value] : headers) {
        normalized[to_lower(name)] = value;
    }
    return normalized;
}

std::optional<std::string_view> find_header(const Headers& headers, std::string_view name) noexcept {
    auto it = headers.find(std::string(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::error_code validate_header(std::string_view name, std::string_view value) noexcept {
    if (name.empty() || !std::all_of(name.begin(), name.end(), is_tchar)) {
        return make_error_code(DownloadErrc::invalid_header);
    }
    auto bad = [](char c) { return c == '\r' || c == '\n' || c == '\0'; };
    if (std::any_of(value.begin(), value.end(), bad)) {
        return make_error_code(DownloadErrc::invalid_header);
    }
    return {};
}

std::expected<std::optional<std::uint64_t>, std::error_code>
parse_content_length(const Headers& headers) noexcept {
    auto value = find_header(headers, header::content_length);
    if (!value) {
        return std::optional<std::uint64_t>{};
    }
    auto parsed = parse_u64(*value);
    if (!parsed) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_content_length));
    }
    return parsed;
}

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    // bytes <first>-<last>/<total|*>
    value = trim(value);
    constexpr std::string_view unit = "bytes ";
    if (value.size() <= unit.size() || to_lower(value.substr(0, unit.size())) != unit) {
        return std::nullopt;
    }
    value.remove_prefix(unit.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto first = parse_u64(value.substr(0, dash));
    auto last = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range{*first, *last, std::nullopt};
    auto total = trim(value.substr(slash + 1));
    if (total != "*") {
        range.total = parse_u64(total);
        if (!range.total || *range.total <= *last) {
            return std::nullopt;
        }
    }
    return range;
}

std::optional<std::uint64_t> parse_unsatisfied_range(std::string_view value) noexcept {
    value = trim(value);
    constexpr std::string_view prefix = "bytes */";
    if (value.size() <= prefix.size() || to_lower(value.substr(0, prefix.size())) != prefix) {
        return std::nullopt;
    }
    return parse_u64(trim(value.substr(prefix.size())));
}

} // namespace modfetch::core
