/**
 * @file download_example.cpp
 * @brief Download the files of a feed, a plugin instance, or a path prefix
 *
 * This example demonstrates:
 * - Building a file search from command-line filters
 * - Concurrent downloads that preserve the remote directory layout
 * - Stripping a leading path from downloaded file names
 * - Refusing or allowing overwrites of existing local files
 */

#include <kcenon/cube/cube.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace kcenon::cube;

namespace {

struct options {
    std::string url = "http://localhost:8000/api/v1/";
    std::string username = "chris";
    std::string password = "chris1234";
    std::optional<uint32_t> feed;
    std::optional<uint32_t> instance;
    std::string fname;
    std::string strip_prefix;
    std::size_t threads = 4;
    bool clobber = false;
    bool quiet = false;
    std::filesystem::path destination;
};

void print_usage(const char* program) {
    std::cout << "Download Example - CUBE Client System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <destination>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --address <url>       CUBE API URL (default: http://localhost:8000/api/v1/)" << std::endl;
    std::cout << "  -u, --username <name>     Username (default: chris)" << std::endl;
    std::cout << "  -p, --password <pass>     Password (default: chris1234)" << std::endl;
    std::cout << "  -f, --feed <id>           Files of a feed" << std::endl;
    std::cout << "  -i, --instance <id>       Files of a plugin instance" << std::endl;
    std::cout << "  -n, --fname <prefix>      Files whose path starts with prefix" << std::endl;
    std::cout << "  -s, --strip <prefix>      Drop prefix from local paths" << std::endl;
    std::cout << "  -j, --threads <n>         Concurrent downloads (default: 4)" << std::endl;
    std::cout << "  -o, --overwrite           Overwrite existing local files" << std::endl;
    std::cout << "  -q, --quiet               Do not show progress" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " -f 12 ./feed_12" << std::endl;
    std::cout << "  " << program << " -n chris/uploads/study -s chris/uploads/ ./restored" << std::endl;
}

auto parse_args(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    bool has_destination = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help") {
            return std::nullopt;
        } else if ((arg == "-a" || arg == "--address") && has_value) {
            opts.url = argv[++i];
        } else if ((arg == "-u" || arg == "--username") && has_value) {
            opts.username = argv[++i];
        } else if ((arg == "-p" || arg == "--password") && has_value) {
            opts.password = argv[++i];
        } else if ((arg == "-f" || arg == "--feed") && has_value) {
            opts.feed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if ((arg == "-i" || arg == "--instance") && has_value) {
            opts.instance = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if ((arg == "-n" || arg == "--fname") && has_value) {
            opts.fname = argv[++i];
        } else if ((arg == "-s" || arg == "--strip") && has_value) {
            opts.strip_prefix = argv[++i];
        } else if ((arg == "-j" || arg == "--threads") && has_value) {
            opts.threads = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "-o" || arg == "--overwrite") {
            opts.clobber = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg[0] != '-' && !has_destination) {
            opts.destination = arg;
            has_destination = true;
        } else {
            std::cerr << "Unknown option or missing value: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (!has_destination) {
        std::cerr << "Error: destination is required" << std::endl;
        return std::nullopt;
    }
    if (!opts.feed && !opts.instance && opts.fname.empty()) {
        std::cerr << "Error: give at least one of --feed, --instance, --fname" << std::endl;
        return std::nullopt;
    }
    return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 1;
    }

    auto client = cube_client::builder()
        .with_url(opts->url)
        .with_username(opts->username)
        .with_password(opts->password)
        .connect();
    if (!client) {
        std::cerr << "Login failed: " << client.error().describe() << std::endl;
        return 1;
    }

    auto query = client.value().files();
    if (opts->feed) {
        query = query.feed(feed_id{*opts->feed});
    }
    if (opts->instance) {
        query = query.plugin_instance(plugin_instance_id{*opts->instance});
    }
    if (!opts->fname.empty()) {
        query = query.fname(opts->fname);
    }

    transfer_config config;
    config.concurrency = opts->threads;
    config.clobber = opts->clobber;
    config.hidden = opts->quiet;
    config.strip_prefix = opts->strip_prefix;

    auto summary = download_files(query.build(), opts->destination, config);
    if (!summary) {
        if (summary.error().code == error_code::empty_collection) {
            std::cout << "No files matched." << std::endl;
            return 0;
        }
        std::cerr << "Download stopped: " << summary.error().describe() << std::endl;
        return 1;
    }

    std::cout << "Downloaded " << summary.value().succeeded << "/" << summary.value().declared
              << " file(s), " << format_bytes(summary.value().bytes_transferred) << " to "
              << opts->destination << std::endl;

    for (const auto& failure : summary.value().failures) {
        std::cerr << "  skipped: " << failure.name << ": " << failure.err.describe() << std::endl;
    }
    return summary.value().all_succeeded() ? 0 : 2;
}
