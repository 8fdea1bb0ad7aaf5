/**
 * @file upload_example.cpp
 * @brief Upload local files and directories to a CUBE user's space
 *
 * This example demonstrates:
 * - Logging in with a username and password
 * - Expanding directories into the files they contain
 * - Concurrent uploads with a console progress display
 * - Telling per-file failures apart from errors that stop the upload
 */

#include <kcenon/cube/cube.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::cube;

namespace {

struct options {
    std::string url = "http://localhost:8000/api/v1/";
    std::string username = "chris";
    std::string password = "chris1234";
    std::string upload_dir;
    std::size_t threads = 4;
    uint32_t retries = 3;
    bool quiet = false;
    std::vector<std::filesystem::path> paths;
};

void print_usage(const char* program) {
    std::cout << "Upload Example - CUBE Client System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <file_or_dir>... <upload_dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Files land under <username>/uploads/<upload_dir>/." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --address <url>     CUBE API URL (default: http://localhost:8000/api/v1/)" << std::endl;
    std::cout << "  -u, --username <name>   Username (default: chris)" << std::endl;
    std::cout << "  -p, --password <pass>   Password (default: chris1234)" << std::endl;
    std::cout << "  -j, --threads <n>       Concurrent uploads (default: 4)" << std::endl;
    std::cout << "  -r, --retries <n>       Retries for transient errors (default: 3)" << std::endl;
    std::cout << "  -q, --quiet             Do not show progress" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " scan.dcm my_study" << std::endl;
    std::cout << "  " << program << " -j 8 ./dicoms ./notes.txt session_2" << std::endl;
}

auto parse_args(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    std::vector<std::string> positional;

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
        } else if ((arg == "-j" || arg == "--threads") && has_value) {
            opts.threads = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if ((arg == "-r" || arg == "--retries") && has_value) {
            opts.retries = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option or missing value: " << arg << std::endl;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        std::cerr << "Error: need at least one path and an upload directory" << std::endl;
        return std::nullopt;
    }

    opts.upload_dir = positional.back();
    positional.pop_back();
    for (const auto& p : positional) {
        opts.paths.emplace_back(p);
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

    auto files = discover_input_files(opts->paths);
    if (!files) {
        std::cerr << "Error: " << files.error().describe() << std::endl;
        return 1;
    }
    if (files.value().empty()) {
        std::cout << "Nothing to upload." << std::endl;
        return 0;
    }

    auto client = cube_client::builder()
        .with_url(opts->url)
        .with_username(opts->username)
        .with_password(opts->password)
        .with_retries(opts->retries)
        .connect();
    if (!client) {
        std::cerr << "Login failed: " << client.error().describe() << std::endl;
        return 1;
    }

    transfer_config config;
    config.concurrency = opts->threads;
    config.hidden = opts->quiet;

    std::cout << "Uploading " << files.value().size() << " file(s) to "
              << opts->username << "/uploads/" << opts->upload_dir << "/" << std::endl;

    auto summary = upload_files(client.value(), files.value(), opts->upload_dir, config);
    if (!summary) {
        std::cerr << "Upload stopped: " << summary.error().describe() << std::endl;
        return 1;
    }

    const auto& transfers = summary.value().transfers;
    std::cout << "Uploaded " << transfers.succeeded << "/" << transfers.declared << " file(s), "
              << format_bytes(transfers.bytes_transferred) << " of "
              << format_bytes(summary.value().total_size) << std::endl;

    for (const auto& failure : transfers.failures) {
        std::cerr << "  failed: " << failure.name << ": " << failure.err.describe() << std::endl;
    }
    return transfers.all_succeeded() ? 0 : 2;
}
