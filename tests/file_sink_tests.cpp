// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <modfetch/core/http_download.hpp>
#include <modfetch/disk/file_sink.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace modfetch;
using modfetch::test::FakeTransport;
using modfetch::test::make_body;

namespace {

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        path = std::filesystem::temp_directory_path() /
               ("modfetch_sink_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    [[nodiscard]] std::string file(std::string_view name) const { return (path / name).string(); }
};

std::vector<std::byte> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(raw.size());
    std::transform(raw.begin(), raw.end(), bytes.begin(), [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

void write_file(const std::string& path, const std::vector<std::byte>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::span<const std::byte> view(const std::vector<std::byte>& bytes, std::size_t first, std::size_t count) {
    return std::span<const std::byte>(bytes).subspan(first, count);
}

} // namespace

TEST_CASE("target_path", "[sink]") {
    auto url = core::Url::parse("https://mods.example.com/files/pack.zip?dl=1");
    REQUIRE(url.has_value());

    core::DownloadConfig config;
    CHECK(disk::target_path(config, *url) == "pack.zip");

    config.save_path = "/srv/mods";
    CHECK(disk::target_path(config, *url) == "/srv/mods/pack.zip");

    config.file = "renamed.zip";
    CHECK(disk::target_path(config, *url) == "/srv/mods/renamed.zip");
}

TEST_CASE("FileSink - writes", "[sink]") {
    TempDir dir;
    const auto path = dir.file("out.bin");
    auto body = make_body(3000);

    SECTION("single-stream content is appended") {
        auto sink = disk::FileSink::open(path, {});
        REQUIRE(sink.has_value());

        REQUIRE_FALSE((*sink)->on_content(view(body, 0, 1000)));
        REQUIRE_FALSE((*sink)->on_content(view(body, 1000, 2000)));
        (*sink)->on_finish();

        CHECK((*sink)->bytes_written() == 3000);
        CHECK(read_file(path) == body);
    }

    SECTION("concurrent content lands at its offset") {
        auto sink = disk::FileSink::open(path, {});
        REQUIRE(sink.has_value());

        REQUIRE_FALSE((*sink)->on_concurrent_content(1000, 2000, view(body, 2000, 1000)));
        REQUIRE_FALSE((*sink)->on_concurrent_content(1000, 0, view(body, 0, 1000)));
        REQUIRE_FALSE((*sink)->on_concurrent_content(1000, 1000, view(body, 1000, 1000)));
        (*sink)->on_finish();

        CHECK(read_file(path) == body);
    }

    SECTION("a fresh download truncates an old file") {
        write_file(path, make_body(5000));

        auto sink = disk::FileSink::open(path, {});
        REQUIRE(sink.has_value());
        REQUIRE_FALSE((*sink)->on_content(view(body, 0, 10)));

        CHECK(read_file(path).size() == 10);
    }

    SECTION("a resumed download keeps the prefix and continues after it") {
        write_file(path, std::vector<std::byte>(body.begin(), body.begin() + 1200));

        core::DownloadConfig config;
        core::apply_resume(config, 1200);
        auto sink = disk::FileSink::open(path, config);
        REQUIRE(sink.has_value());
        REQUIRE_FALSE((*sink)->on_content(view(body, 1200, 1800)));

        CHECK(read_file(path) == body);
    }

    SECTION("resuming past the end of a shorter file") {
        write_file(path, std::vector<std::byte>(body.begin(), body.begin() + 500));

        core::DownloadConfig config;
        core::apply_resume(config, 1200);
        auto sink = disk::FileSink::open(path, config);
        REQUIRE_FALSE(sink.has_value());
        CHECK(sink.error() == disk::DiskErrc::seek_error);
        CHECK(read_file(path).size() == 500);
    }

    SECTION("missing directory") {
        auto sink = disk::FileSink::open(dir.file("missing/out.bin"), {});
        REQUIRE_FALSE(sink.has_value());
        CHECK(sink.error() == disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("FileSink - end to end with HttpDownload", "[sink][download]") {
    TempDir dir;
    const auto path = dir.file("pack.zip");
    auto body = make_body(7777);

    core::DownloadConfig config;
    config.chunk_size = 1024;
    config.num_workers = 4;

    SECTION("concurrent") {
        auto transport = std::make_unique<FakeTransport>(body);
        transport->piece_size = 200;
        transport->fail_range(2048, 300, 1);

        auto sink = disk::FileSink::open(path, config);
        REQUIRE(sink.has_value());

        core::HttpDownload download(*core::Url::parse("https://mods.example.com/pack.zip"), config, std::move(transport));
        download.add_hook(std::move(*sink));

        REQUIRE_FALSE(download.download());
        CHECK(read_file(path) == body);
    }

    SECTION("resumed concurrent") {
        write_file(path, std::vector<std::byte>(body.begin(), body.begin() + 3000));
        core::apply_resume(config, 3000);

        auto sink = disk::FileSink::open(path, config);
        REQUIRE(sink.has_value());

        core::HttpDownload download(*core::Url::parse("https://mods.example.com/pack.zip"), config,
                                    std::make_unique<FakeTransport>(body));
        download.add_hook(std::move(*sink));

        REQUIRE_FALSE(download.download());
        CHECK(read_file(path) == body);
    }

    SECTION("single stream") {
        config.concurrent = false;

        auto sink = disk::FileSink::open(path, config);
        REQUIRE(sink.has_value());

        core::HttpDownload download(*core::Url::parse("https://mods.example.com/pack.zip"), config,
                                    std::make_unique<FakeTransport>(body));
        download.add_hook(std::move(*sink));

        REQUIRE_FALSE(download.download());
        CHECK(read_file(path) == body);
    }

    SECTION("resumed single stream against a server ignoring ranges") {
        const std::vector<std::byte> prefix(body.begin(), body.begin() + 1000);
        write_file(path, prefix);
        config.concurrent = false;
        core::apply_resume(config, 1000);

        auto transport = std::make_unique<FakeTransport>(body);
        transport->honour_ranges = false;

        auto sink = disk::FileSink::open(path, config);
        REQUIRE(sink.has_value());

        core::HttpDownload download(*core::Url::parse("https://mods.example.com/pack.zip"), config,
                                    std::move(transport));
        download.add_hook(std::move(*sink));

        CHECK(download.download() == core::DownloadErrc::range_not_honoured);
        CHECK(std::filesystem::file_size(path) == 1000u);
        CHECK(read_file(path) == prefix);
    }

    SECTION("resumed single stream") {
        write_file(path, std::vector<std::byte>(body.begin(), body.begin() + 1000));
        config.concurrent = false;
        core::apply_resume(config, 1000);

        auto sink = disk::FileSink::open(path, config);
        REQUIRE(sink.has_value());

        core::HttpDownload download(*core::Url::parse("https://mods.example.com/pack.zip"), config,
                                    std::make_unique<FakeTransport>(body));
        download.add_hook(std::move(*sink));

        REQUIRE_FALSE(download.download());
        CHECK(std::filesystem::file_size(path) == body.size());
        CHECK(read_file(path) == body);
    }
}
