// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/cli/commands.hpp>
#include <modfetch/core/http_transport.hpp>
#include <spdlog/spdlog.h>
#include <iostream>

using namespace modfetch::cli;

int main(int argc, char* argv[]) {
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.urls.size() > 1 && !args.output_file.empty()) {
        std::cerr << "Error: -o only works with a single URL" << std::endl;
        return 1;
    }

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    modfetch::core::CurlTransport::global_init();

    int exit_code = 0;
    for (const auto& url : args.urls) {
        auto result = args.list_only ? info(url, args) : download(url, args);
        if (!result) {
            exit_code = 1;
        }
    }

    modfetch::core::CurlTransport::global_cleanup();
    return exit_code;
}
