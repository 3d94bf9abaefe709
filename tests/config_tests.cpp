// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <modfetch/core/config.hpp>
#include <modfetch/core/config_file.hpp>
#include <modfetch/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace modfetch::core;
using nlohmann::json;

namespace {

// Removes the file when the test ends
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(std::string_view contents) {
        path = std::filesystem::temp_directory_path() /
               ("modfetch_config_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + ".json");
        std::ofstream out(path);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace

TEST_CASE("DownloadConfig defaults", "[config]") {
    DownloadConfig config;
    CHECK(config.chunk_size == DEFAULT_CHUNK_SIZE);
    CHECK(config.num_workers == DEFAULT_WORKERS);
    CHECK(config.max_retries == RETRY_COUNT);
    CHECK(config.timeout == IO_TIMEOUT);
    CHECK(config.concurrent);
    CHECK_FALSE(config.resume);
    CHECK(config.retry_exhaustion == RetryExhaustion::notify_only);
    CHECK_FALSE(validate_config(config));
    CHECK(default_user_agent().starts_with("modfetch/"));
}

TEST_CASE("validate_config", "[config]") {
    DownloadConfig config;

    SECTION("zero chunk size") {
        config.chunk_size = 0;
        CHECK(validate_config(config) == DownloadErrc::invalid_config);
    }

    SECTION("zero workers") {
        config.num_workers = 0;
        CHECK(validate_config(config) == DownloadErrc::invalid_config);
    }

    SECTION("user agent with line break") {
        config.user_agent = "agent\nInjected: 1";
        CHECK(validate_config(config) == DownloadErrc::invalid_user_agent);
    }

    SECTION("header with bad name") {
        config.headers["bad header"] = "x";
        CHECK(validate_config(config) == DownloadErrc::invalid_header);
    }
}

TEST_CASE("apply_resume", "[config]") {
    DownloadConfig config;
    config.headers["Range"] = "bytes=0-";
    apply_resume(config, 4096);

    CHECK(config.resume);
    CHECK(config.bytes_on_disk == 4096u);
    CHECK(config.headers.size() == 1);
    CHECK(config.headers.at("range") == "bytes=4096-");
}

TEST_CASE("config_from_json", "[config][json]") {
    SECTION("all keys") {
        auto j = json::parse(R"({
            "user_agent": "ModManager/2.0",
            "resume": true,
            "headers": {"Authorization": "Bearer t"},
            "file": "pack.zip",
            "save_path": "/tmp/mods",
            "timeout_sec": 45,
            "concurrent": false,
            "max_retries": 9,
            "num_workers": 2,
            "bytes_on_disk": 1000,
            "chunk_offsets": [[1000, 1999], [2000, 2500]],
            "chunk_size": 1000,
            "retry_exhaustion": "fail"
        })");

        auto config = config_from_json(j);
        REQUIRE(config.has_value());
        CHECK(config->user_agent == "ModManager/2.0");
        CHECK(config->resume);
        CHECK(config->headers.at("authorization") == "Bearer t");
        CHECK(config->file == "pack.zip");
        CHECK(config->save_path == "/tmp/mods");
        CHECK(config->timeout == std::chrono::seconds{45});
        CHECK_FALSE(config->concurrent);
        CHECK(config->max_retries == 9);
        CHECK(config->num_workers == 2);
        CHECK(config->bytes_on_disk == 1000u);
        REQUIRE(config->chunk_offsets.has_value());
        CHECK(*config->chunk_offsets == std::vector<Chunk>{{1000, 1999}, {2000, 2500}});
        CHECK(config->chunk_size == 1000);
        CHECK(config->retry_exhaustion == RetryExhaustion::fail);
    }

    SECTION("missing keys keep the base") {
        DownloadConfig base;
        base.num_workers = 3;
        auto config = config_from_json(json::parse(R"({"max_retries": 1})"), base);
        REQUIRE(config.has_value());
        CHECK(config->num_workers == 3);
        CHECK(config->max_retries == 1);
    }

    SECTION("wrong types are rejected") {
        CHECK(config_from_json(json::parse(R"({"num_workers": "many"})")).error() == DownloadErrc::invalid_config);
        CHECK(config_from_json(json::parse(R"({"headers": ["a"]})")).error() == DownloadErrc::invalid_config);
        CHECK(config_from_json(json::parse(R"({"chunk_offsets": [[1, 2, 3]]})")).error() == DownloadErrc::invalid_config);
        CHECK(config_from_json(json::parse(R"({"retry_exhaustion": "sometimes"})")).error() == DownloadErrc::invalid_config);
        CHECK(config_from_json(json::parse("[1, 2]")).error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("load_config", "[config][json]") {
    SECTION("reads a file") {
        TempFile file(R"({"num_workers": 4, "chunk_size": 65536})");
        auto config = load_config(file.path.string());
        REQUIRE(config.has_value());
        CHECK(config->num_workers == 4);
        CHECK(config->chunk_size == 65536);
    }

    SECTION("malformed JSON") {
        TempFile file("{ not json");
        auto config = load_config(file.path.string());
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error() == DownloadErrc::invalid_config);
    }

    SECTION("missing file") {
        auto config = load_config("/nonexistent/modfetch/config.json");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error() == modfetch::disk::DiskErrc::file_not_found);
    }
}
