// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace modfetch::core {

class Url {
public:
    // Accepts http:// and https:// URLs with a non-empty host
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    // Reassembled URL without the fragment, as sent on the wire
    [[nodiscard]] std::string full() const;
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace modfetch::core
