// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/config.hpp>
#include <modfetch/version.hpp>
#include <algorithm>
#include <format>

namespace modfetch::core {

std::string default_user_agent() {
    return std::format("{}/{}", PROJECT_NAME, version.to_string());
}

std::error_code validate_config(const DownloadConfig& config) noexcept {
    if (config.chunk_size == 0 || config.num_workers == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }

    auto bad = [](char c) { return c == '\r' || c == '\n' || c == '\0'; };
    if (std::any_of(config.user_agent.begin(), config.user_agent.end(), bad)) {
        return make_error_code(DownloadErrc::invalid_user_agent);
    }

    for (const auto& [name, value] : config.headers) {
        if (auto ec = validate_header(name, value)) {
            return ec;
        }
    }
    return {};
}

void apply_resume(DownloadConfig& config, std::uint64_t bytes_on_disk) {
    config.resume = true;
    config.bytes_on_disk = bytes_on_disk;
    config.headers = normalize_headers(config.headers);
    config.headers[std::string(header::range)] = std::format("bytes={}-", bytes_on_disk);
}

} // namespace modfetch::core
