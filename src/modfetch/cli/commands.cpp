// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/cli/commands.hpp>
#include <modfetch/cli/progress_hook.hpp>
#include <modfetch/core/config_file.hpp>
#include <modfetch/core/error.hpp>
#include <modfetch/core/http_download.hpp>
#include <modfetch/core/http_transport.hpp>
#include <modfetch/core/url.hpp>
#include <modfetch/disk/file_sink.hpp>
#include <modfetch/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <new>
#include <filesystem>
#include <iostream>
#include <memory>

namespace modfetch::cli {

namespace {

template <typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto value = [&]() -> std::optional<std::string_view> {
                if (i + 1 < argc) return std::string_view(argv[++i]);
                args.errors.push_back("missing value for " + arg);
                return std::nullopt;
            };

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }

            if (arg == "-V" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-q" || arg == "--quiet") {
                args.quiet = true;
            } else if (arg == "-o" || arg == "--output") {
                if (auto v = value()) args.output_file = *v;
            } else if (arg == "-d" || arg == "--directory") {
                if (auto v = value()) args.output_dir = *v;
            } else if (arg == "-n" || arg == "--workers") {
                if (auto v = value()) {
                    args.workers = parse_number<std::uint32_t>(*v);
                    if (!args.workers || *args.workers == 0) args.errors.push_back("invalid worker count: " + std::string(*v));
                }
            } else if (arg == "-c" || arg == "--chunk-size") {
                if (auto v = value()) {
                    args.chunk_size = parse_number<std::uint64_t>(*v);
                    if (!args.chunk_size || *args.chunk_size == 0) args.errors.push_back("invalid chunk size: " + std::string(*v));
                }
            } else if (arg == "-r" || arg == "--retries") {
                if (auto v = value()) {
                    args.retries = parse_number<std::uint32_t>(*v);
                    if (!args.retries) args.errors.push_back("invalid retry count: " + std::string(*v));
                }
            } else if (arg == "-H" || arg == "--header") {
                if (auto v = value()) {
                    auto colon = v->find(':');
                    if (colon == std::string_view::npos || colon == 0) {
                        args.errors.push_back("invalid header: " + std::string(*v));
                    } else {
                        args.headers[core::to_lower(trim(v->substr(0, colon)))] = std::string(trim(v->substr(colon + 1)));
                    }
                }
            } else if (arg == "-A" || arg == "--user-agent") {
                if (auto v = value()) args.user_agent = *v;
            } else if (arg == "-s" || arg == "--single") {
                args.single = true;
            } else if (arg == "-C" || arg == "--continue") {
                args.resume = true;
            } else if (arg == "--fail-on-retries") {
                args.fail_on_retries = true;
            } else if (arg == "--config") {
                if (auto v = value()) args.config_file = *v;
            } else if (arg == "-i" || arg == "--info") {
                args.list_only = true;
            } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
                // URL arguments (no option)
                args.urls.push_back(arg);
            } else {
                args.errors.push_back("unknown argument: " + arg);
            }
        }
    } catch (const std::bad_alloc&) {
        args.errors.emplace_back("out of memory");
    }

    return args;
}

std::expected<core::DownloadConfig, std::error_code>
build_config(const CliArgs& args, std::string_view url) noexcept {
    try {
        auto parsed = core::Url::parse(url);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }

        core::DownloadConfig config;
        if (!args.config_file.empty()) {
            auto loaded = core::load_config(args.config_file);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            config = std::move(*loaded);
        }

        if (!args.user_agent.empty()) config.user_agent = args.user_agent;
        for (const auto& [name, value] : args.headers) {
            config.headers[name] = value;
        }
        if (!args.output_file.empty()) config.file = args.output_file;
        if (!args.output_dir.empty()) config.save_path = args.output_dir;
        if (config.file.empty()) config.file = parsed->filename();

        if (args.workers) config.num_workers = *args.workers;
        if (args.chunk_size) config.chunk_size = *args.chunk_size;
        if (args.retries) config.max_retries = *args.retries;
        if (args.single) config.concurrent = false;
        if (args.fail_on_retries) config.retry_exhaustion = core::RetryExhaustion::fail;

        if (args.resume) {
            std::error_code ec;
            auto existing = std::filesystem::file_size(disk::target_path(config, *parsed), ec);
            if (!ec && existing > 0) {
                core::apply_resume(config, existing);
            }
        }

        if (auto ec = core::validate_config(config)) {
            return std::unexpected(ec);
        }
        return config;
    } catch (const std::exception& e) {
        spdlog::debug("config: {}", e.what());
        return std::unexpected(make_error_code(core::DownloadErrc::invalid_config));
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& url, const CliArgs& args) noexcept {
    try {
        auto parsed = core::Url::parse(url);
        if (!parsed) {
            std::cerr << "Error: Invalid URL: " << url << std::endl;
            return std::unexpected(parsed.error());
        }

        auto config = build_config(args, url);
        if (!config) {
            std::cerr << "Error: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        const std::string path = disk::target_path(*config, *parsed);
        auto sink = disk::FileSink::open(path, *config);
        if (!sink) {
            std::cerr << "Error: Cannot open " << path << ": " << sink.error().message() << std::endl;
            return std::unexpected(sink.error());
        }

        if (config->bytes_on_disk) {
            spdlog::info("resuming {} at byte {}", path, *config->bytes_on_disk);
        }
        spdlog::info("saving {} to {}", url, path);

        core::HttpDownload transfer(std::move(*parsed), std::move(*config));
        transfer.add_hook(std::move(*sink));
        if (!args.quiet) {
            transfer.add_hook(std::make_unique<ProgressHook>());
        }

        if (auto ec = transfer.download()) {
            std::cerr << "\nError: Download failed: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }

        if (transfer.retries() > 0) {
            spdlog::info("{} chunk retries", transfer.retries());
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(core::DownloadErrc::network_error));
    }
}

CliResult info(const std::string& url, const CliArgs& args) noexcept {
    try {
        auto parsed = core::Url::parse(url);
        if (!parsed) {
            std::cerr << "Error: Invalid URL: " << url << std::endl;
            return std::unexpected(parsed.error());
        }

        auto config = build_config(args, url);
        if (!config) {
            std::cerr << "Error: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        core::HttpRequest request;
        request.url = parsed->full();
        request.headers = config->headers;
        request.user_agent = config->user_agent.empty() ? core::default_user_agent() : config->user_agent;
        request.timeout = config->timeout;

        core::ResponseHandler handler;
        handler.on_headers = [](const core::HttpResponse&) { return false; };

        auto transport = core::make_curl_transport();
        auto response = transport->perform(request, handler);
        if (!response) {
            std::cerr << "Error: " << response.error().message() << std::endl;
            return std::unexpected(response.error());
        }

        const auto& headers = response->headers;
        auto content_length = core::parse_content_length(headers);
        const bool ranges = core::find_header(headers, core::header::accept_ranges) == "bytes";
        const bool concurrent = ranges && config->concurrent && content_length && content_length->has_value();

        std::cout << "URL: " << request.url << std::endl;
        std::cout << "Status: " << response->status_code << std::endl;
        std::cout << "Content-Type: " << core::find_header(headers, "content-type").value_or("unknown") << std::endl;
        std::cout << "Content-Length: "
                  << (content_length && content_length->has_value() ? std::to_string(**content_length) : "unknown")
                  << std::endl;
        std::cout << "Accepts-Ranges: " << (ranges ? "yes" : "no") << std::endl;
        std::cout << "Strategy: " << (concurrent ? "concurrent" : "single-stream") << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(core::DownloadErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "modfetch " << program_name << " - resumable chunked downloader for mod archives\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, warnings only)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -n, --workers <N>       Parallel chunk fetches (default: " << core::DEFAULT_WORKERS << ")\n";
    std::cout << "  -c, --chunk-size <B>    Chunk size in bytes (default: " << core::DEFAULT_CHUNK_SIZE << ")\n";
    std::cout << "  -r, --retries <N>       Retry budget (default: " << core::RETRY_COUNT << ")\n";
    std::cout << "  -H, --header <H: V>     Extra request header (repeatable)\n";
    std::cout << "  -A, --user-agent <UA>   User agent string\n";
    std::cout << "  -s, --single            Single request, no ranged chunks\n";
    std::cout << "  -C, --continue          Resume from an existing partial file\n";
    std::cout << "      --fail-on-retries   Fail once the retry budget is exceeded\n";
    std::cout << "      --config <FILE>     JSON configuration file\n";
    std::cout << "  -i, --info              Show server info without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/mod.zip\n";
    std::cout << "  " << program_name << " -o pack.7z -n 4 https://example.com/pack.7z\n";
    std::cout << "  " << program_name << " -C https://example.com/large.zip\n";
}

void print_version() noexcept {
    std::cout << PROJECT_NAME << " " << version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace modfetch::cli
