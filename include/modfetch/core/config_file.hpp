// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/config.hpp>
#include <nlohmann/json_fwd.hpp>
#include <expected>
#include <string_view>
#include <system_error>

namespace modfetch::core {

// Overlay the keys present in j onto base. Unknown keys are ignored.
[[nodiscard]] std::expected<DownloadConfig, std::error_code>
config_from_json(const nlohmann::json& j, DownloadConfig base = {}) noexcept;

// Read a JSON configuration file
[[nodiscard]] std::expected<DownloadConfig, std::error_code>
load_config(std::string_view path, DownloadConfig base = {}) noexcept;

} // namespace modfetch::core
