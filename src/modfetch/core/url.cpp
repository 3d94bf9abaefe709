// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/url.hpp>
#include <modfetch/core/headers.hpp>
#include <algorithm>
#include <cctype>
#include <new>

namespace modfetch::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.scheme_ = to_lower(url_str.substr(0, scheme_end));
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3;

        // Fragment never goes on the wire
        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start != std::string_view::npos) {
            url_str = url_str.substr(0, fragment_start);
        }

        auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
        auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
        auto host_end = std::min(path_start, query_start);

        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);
        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal: [::1]:8080
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto after = authority.substr(bracket_end + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (path_start < query_start) {
            url.path_ = std::string(url_str.substr(path_start, query_start - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length()) {
            url.query_ = std::string(url_str.substr(query_start + 1));
        }

        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ':';
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += '?';
        result += query_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto filename = path_.substr(last_slash + 1);
    if (filename.empty()) {
        return "index.html";
    }
    return filename;
}

} // namespace modfetch::core
