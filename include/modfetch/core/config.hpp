// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/chunk.hpp>
#include <modfetch/core/error.hpp>
#include <modfetch/core/headers.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace modfetch::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 512 * 1024;            // 512 KB
constexpr std::uint32_t DEFAULT_WORKERS = 8;
constexpr std::uint32_t RETRY_COUNT = 5;

constexpr std::chrono::seconds IO_TIMEOUT{30};
constexpr std::chrono::seconds CONNECTION_TIMEOUT{15};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// What happens once the global retry counter passes max_retries
enum class RetryExhaustion : std::uint8_t {
    notify_only,  // fire on_max_retries and keep resubmitting
    fail          // fire on_max_retries and abort with retries_exhausted
};

// Parameters for one download; immutable once handed to HttpDownload
struct DownloadConfig {
    std::string user_agent;               // empty means modfetch/<version>
    bool resume{false};
    Headers headers;
    std::string file;
    std::string save_path;
    std::chrono::seconds timeout{IO_TIMEOUT};
    bool concurrent{true};
    std::uint32_t max_retries{RETRY_COUNT};
    std::uint32_t num_workers{DEFAULT_WORKERS};
    std::optional<std::uint64_t> bytes_on_disk;
    // Must cover [bytes_on_disk, content_length) exactly; not re-validated
    std::optional<std::vector<Chunk>> chunk_offsets;
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    RetryExhaustion retry_exhaustion{RetryExhaustion::notify_only};
};

[[nodiscard]] std::string default_user_agent();

[[nodiscard]] std::error_code validate_config(const DownloadConfig& config) noexcept;

// Mark config as continuing a transfer that already has bytes_on_disk bytes
void apply_resume(DownloadConfig& config, std::uint64_t bytes_on_disk);

} // namespace modfetch::core
