// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/config.hpp>
#include <modfetch/core/headers.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modfetch::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_file;
    std::string user_agent;
    core::Headers headers;
    std::optional<std::uint32_t> workers;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint32_t> retries;
    std::vector<std::string> errors;   // unusable options, reported by main
    bool single{false};
    bool resume{false};
    bool fail_on_retries{false};
    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Configuration for one URL: config file first, then command-line overrides.
// With --continue an existing target file turns into a resume offset.
[[nodiscard]] std::expected<core::DownloadConfig, std::error_code>
build_config(const CliArgs& args, std::string_view url) noexcept;

// Download a single URL
[[nodiscard]] CliResult download(const std::string& url, const CliArgs& args) noexcept;

// Probe a URL and print what the server supports
[[nodiscard]] CliResult info(const std::string& url, const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace modfetch::cli
