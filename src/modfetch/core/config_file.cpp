// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/config_file.hpp>
#include <modfetch/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace modfetch::core {

std::expected<DownloadConfig, std::error_code>
config_from_json(const nlohmann::json& j, DownloadConfig base) noexcept {
    if (!j.is_object()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }

    try {
        DownloadConfig cfg = std::move(base);

        if (j.contains("user_agent")) {
            cfg.user_agent = j["user_agent"].get<std::string>();
        }
        if (j.contains("resume")) {
            cfg.resume = j["resume"].get<bool>();
        }
        if (j.contains("headers")) {
            if (!j["headers"].is_object()) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_config));
            }
            for (auto& [key, value] : j["headers"].items()) {
                cfg.headers[to_lower(key)] = value.get<std::string>();
            }
        }
        if (j.contains("file")) {
            cfg.file = j["file"].get<std::string>();
        }
        if (j.contains("save_path")) {
            cfg.save_path = j["save_path"].get<std::string>();
        }
        if (j.contains("timeout_sec")) {
            cfg.timeout = std::chrono::seconds{j["timeout_sec"].get<std::uint32_t>()};
        }
        if (j.contains("concurrent")) {
            cfg.concurrent = j["concurrent"].get<bool>();
        }
        if (j.contains("max_retries")) {
            cfg.max_retries = j["max_retries"].get<std::uint32_t>();
        }
        if (j.contains("num_workers")) {
            cfg.num_workers = j["num_workers"].get<std::uint32_t>();
        }
        if (j.contains("bytes_on_disk")) {
            cfg.bytes_on_disk = j["bytes_on_disk"].get<std::uint64_t>();
        }
        if (j.contains("chunk_offsets")) {
            if (!j["chunk_offsets"].is_array()) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_config));
            }
            std::vector<Chunk> chunks;
            for (const auto& pair : j["chunk_offsets"]) {
                if (!pair.is_array() || pair.size() != 2) {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_config));
                }
                chunks.push_back({pair[0].get<std::uint64_t>(), pair[1].get<std::uint64_t>()});
            }
            cfg.chunk_offsets = std::move(chunks);
        }
        if (j.contains("chunk_size")) {
            cfg.chunk_size = j["chunk_size"].get<std::uint64_t>();
        }
        if (j.contains("retry_exhaustion")) {
            auto mode = j["retry_exhaustion"].get<std::string>();
            if (mode == "notify_only") {
                cfg.retry_exhaustion = RetryExhaustion::notify_only;
            } else if (mode == "fail") {
                cfg.retry_exhaustion = RetryExhaustion::fail;
            } else {
                return std::unexpected(make_error_code(DownloadErrc::invalid_config));
            }
        }

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("config: rejected value: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    } catch (const std::exception& e) {
        spdlog::debug("config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::expected<DownloadConfig, std::error_code>
load_config(std::string_view path, DownloadConfig base) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        auto j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded()) {
            spdlog::debug("config: {} is not valid JSON", path);
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        spdlog::debug("config: loaded {}", path);
        return config_from_json(j, std::move(base));
    } catch (const std::exception& e) {
        spdlog::debug("config: failed to read {}: {}", path, e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

} // namespace modfetch::core
