// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <modfetch/cli/commands.hpp>
#include <modfetch/cli/progress_bar.hpp>
#include <modfetch/core/error.hpp>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using namespace modfetch;

namespace {

// argv builder; argv[0] is the program name
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_{"modfetch"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& s : storage_) pointers_.push_back(s.data());
    }

    [[nodiscard]] int argc() const { return static_cast<int>(pointers_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

cli::CliArgs parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return cli::parse_args(argv.argc(), argv.argv());
}

} // namespace

TEST_CASE("parse_args - options", "[cli]") {
    auto args = parse({"-n", "8", "-c", "65536", "-r", "5", "-d", "/tmp/mods", "-o", "pack.zip",
                       "-A", "tester/1.0", "-s", "-C", "--fail-on-retries", "-V",
                       "https://mods.example.com/pack.zip"});

    CHECK(args.errors.empty());
    REQUIRE(args.urls.size() == 1);
    CHECK(args.urls[0] == "https://mods.example.com/pack.zip");
    CHECK(args.workers == 8u);
    CHECK(args.chunk_size == 65536u);
    CHECK(args.retries == 5u);
    CHECK(args.output_dir == "/tmp/mods");
    CHECK(args.output_file == "pack.zip");
    CHECK(args.user_agent == "tester/1.0");
    CHECK(args.single);
    CHECK(args.resume);
    CHECK(args.fail_on_retries);
    CHECK(args.verbose);
    CHECK_FALSE(args.quiet);
}

TEST_CASE("parse_args - headers", "[cli]") {
    auto args = parse({"-H", "X-Token:  abc ", "--header", "Accept: text/plain", "http://a.example/f"});

    CHECK(args.errors.empty());
    CHECK(args.headers.at("x-token") == "abc");
    CHECK(args.headers.at("accept") == "text/plain");

    auto bad = parse({"-H", "no-colon", "-H", ": empty-name"});
    CHECK(bad.errors.size() == 2);
    CHECK(bad.headers.empty());
}

TEST_CASE("parse_args - invalid input", "[cli]") {
    SECTION("numbers") {
        auto args = parse({"-n", "0", "-c", "12k", "-r", "-1"});
        CHECK(args.errors.size() == 3);
    }

    SECTION("missing value") {
        auto args = parse({"https://a.example/f", "-n"});
        REQUIRE(args.errors.size() == 1);
        CHECK(args.errors[0] == "missing value for -n");
        CHECK(args.urls.size() == 1);
    }

    SECTION("unknown argument") {
        auto args = parse({"--frobnicate", "ftp://a.example/f"});
        CHECK(args.errors.size() == 2);
        CHECK(args.urls.empty());
    }
}

TEST_CASE("parse_args - help and version stop parsing", "[cli]") {
    auto help = parse({"--help", "--frobnicate"});
    CHECK(help.help);
    CHECK(help.errors.empty());

    auto version = parse({"-v"});
    CHECK(version.version);
}

TEST_CASE("build_config", "[cli]") {
    SECTION("defaults take the file name from the URL") {
        auto config = cli::build_config(parse({}), "https://mods.example.com/files/pack.zip?dl=1");
        REQUIRE(config.has_value());
        CHECK(config->file == "pack.zip");
        CHECK(config->concurrent);
        CHECK_FALSE(config->bytes_on_disk.has_value());
        CHECK(config->retry_exhaustion == core::RetryExhaustion::notify_only);
    }

    SECTION("command line overrides") {
        auto args = parse({"-n", "3", "-c", "4096", "-r", "7", "-s", "--fail-on-retries",
                           "-o", "out.bin", "-d", "/srv", "-H", "X-Token: abc"});
        auto config = cli::build_config(args, "https://mods.example.com/pack.zip");
        REQUIRE(config.has_value());
        CHECK(config->num_workers == 3);
        CHECK(config->chunk_size == 4096);
        CHECK(config->max_retries == 7);
        CHECK_FALSE(config->concurrent);
        CHECK(config->retry_exhaustion == core::RetryExhaustion::fail);
        CHECK(config->file == "out.bin");
        CHECK(config->save_path == "/srv");
        CHECK(config->headers.at("x-token") == "abc");
    }

    SECTION("invalid URL") {
        auto config = cli::build_config(parse({}), "not a url");
        CHECK_FALSE(config.has_value());
    }

    SECTION("missing config file") {
        auto args = parse({"--config", "/nonexistent/modfetch.json"});
        CHECK_FALSE(cli::build_config(args, "https://mods.example.com/pack.zip").has_value());
    }
}

TEST_CASE("build_config - continue picks up an existing file", "[cli]") {
    auto dir = std::filesystem::temp_directory_path() / "modfetch_cli_resume";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "pack.zip", std::ios::binary | std::ios::trunc);
        out << std::string(1500, 'x');
    }

    auto args = parse({"-C", "-d", dir.string()});
    auto config = cli::build_config(args, "https://mods.example.com/pack.zip");

    REQUIRE(config.has_value());
    CHECK(config->resume);
    CHECK(config->bytes_on_disk == 1500u);
    CHECK(config->headers.at("range") == "bytes=1500-");

    SECTION("no file, no resume") {
        auto fresh = cli::build_config(args, "https://mods.example.com/other.zip");
        REQUIRE(fresh.has_value());
        CHECK_FALSE(fresh->bytes_on_disk.has_value());
        CHECK_FALSE(fresh->headers.contains("range"));
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("ProgressBar formatting", "[cli]") {
    CHECK(cli::ProgressBar::format_bytes(512) == "512 B");
    CHECK(cli::ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(cli::ProgressBar::format_speed(3 * 1024 * 1024) == "3.0 MB/s");
    CHECK(cli::ProgressBar::format_time(3725) == "1h 02m 5s");
    CHECK(cli::ProgressBar::format_time(65) == "1m 5s");
    CHECK(cli::ProgressBar::format_time(9) == "9s");
}
