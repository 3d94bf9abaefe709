// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace modfetch::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    dns_error,
    ssl_error,
    connection_lost,
    too_many_redirects,
    http_status,
    invalid_url,
    invalid_user_agent,
    invalid_header,
    invalid_content_length,
    invalid_range,
    range_not_honoured,
    invalid_config,
    channel_closed,
    retries_exhausted,
    incomplete_transfer,
    cancelled,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "modfetch::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                return "Success";
            case DownloadErrc::network_error:          return "Network error";
            case DownloadErrc::timeout:                return "Operation timed out";
            case DownloadErrc::dns_error:              return "DNS resolution failed";
            case DownloadErrc::ssl_error:              return "SSL/TLS error";
            case DownloadErrc::connection_lost:        return "Connection lost";
            case DownloadErrc::too_many_redirects:     return "Too many redirects";
            case DownloadErrc::http_status:            return "Server answered with an error status";
            case DownloadErrc::invalid_url:            return "Invalid URL";
            case DownloadErrc::invalid_user_agent:     return "Malformed user agent";
            case DownloadErrc::invalid_header:         return "Malformed request header";
            case DownloadErrc::invalid_content_length: return "Unparsable Content-Length";
            case DownloadErrc::invalid_range:          return "Invalid byte range";
            case DownloadErrc::range_not_honoured:     return "Server ignored the byte range";
            case DownloadErrc::invalid_config:         return "Invalid configuration";
            case DownloadErrc::channel_closed:         return "Worker channel closed";
            case DownloadErrc::retries_exhausted:      return "Retry budget exhausted";
            case DownloadErrc::incomplete_transfer:    return "Transfer ended before all bytes arrived";
            case DownloadErrc::cancelled:              return "Download cancelled";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace modfetch::core

namespace std {

template<>
struct is_error_code_enum<modfetch::core::DownloadErrc> : true_type {};

} // namespace std
