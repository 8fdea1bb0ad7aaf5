/**
 * @file run_plugin_example.cpp
 * @brief Run a plugin after an existing plugin instance and follow its links
 *
 * This example demonstrates:
 * - Looking up a plugin by exact name and version
 * - Creating a plugin instance from a JSON parameter body
 * - Following linked resources: feed, plugin and previous instance
 * - Polling the new instance until it leaves the scheduling states
 */

#include <kcenon/cube/cube.h>

#include <json/json.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace kcenon::cube;

namespace {

struct options {
    std::string url = "http://localhost:8000/api/v1/";
    std::string username = "chris";
    std::string password = "chris1234";
    std::string plugin_name = "pl-simpledsapp";
    std::string plugin_version;
    std::optional<uint32_t> previous_id;
    std::string title;
    int poll_seconds = 0;
};

void print_usage(const char* program) {
    std::cout << "Run Plugin Example - CUBE Client System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <plugin_name> <plugin_version>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --address <url>     CUBE API URL (default: http://localhost:8000/api/v1/)" << std::endl;
    std::cout << "  -u, --username <name>   Username (default: chris)" << std::endl;
    std::cout << "  -p, --password <pass>   Password (default: chris1234)" << std::endl;
    std::cout << "  --previous <id>         Plugin instance to run after" << std::endl;
    std::cout << "  --title <text>          Title of the new instance" << std::endl;
    std::cout << "  --poll <seconds>        Poll the instance status for this long" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --previous 4 pl-simpledsapp 2.1.0" << std::endl;
    std::cout << "  " << program << " --title upload pl-dircopy 2.1.1" << std::endl;
}

auto parse_args(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    int positional = 0;

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
        } else if (arg == "--previous" && has_value) {
            opts.previous_id = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--title" && has_value) {
            opts.title = argv[++i];
        } else if (arg == "--poll" && has_value) {
            opts.poll_seconds = std::stoi(argv[++i]);
        } else if (arg[0] != '-' && positional == 0) {
            opts.plugin_name = arg;
            ++positional;
        } else if (arg[0] != '-' && positional == 1) {
            opts.plugin_version = arg;
            ++positional;
        } else {
            std::cerr << "Unknown option or missing value: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (positional != 2) {
        std::cerr << "Error: plugin name and version are required" << std::endl;
        return std::nullopt;
    }
    return opts;
}

auto is_pending(const std::string& status) -> bool {
    return status == "created" || status == "waiting" || status == "scheduled" ||
           status == "started" || status == "registeringFiles";
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

    auto plugin = client.value().get_plugin(opts->plugin_name, opts->plugin_version);
    if (!plugin) {
        std::cerr << "Plugin lookup failed: " << plugin.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Plugin: " << plugin.value()->name << " " << plugin.value()->version
              << " (" << plugin.value()->dock_image << ")" << std::endl;

    Json::Value params(Json::objectValue);
    if (opts->previous_id) {
        params["previous_id"] = *opts->previous_id;
    }
    if (!opts->title.empty()) {
        params["title"] = opts->title;
    }

    auto instance = create_instance(plugin.value(), params);
    if (!instance) {
        std::cerr << "Could not run plugin: " << instance.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Created plugin instance #" << instance.value()->id.value
              << " with status " << instance.value()->status << std::endl;

    auto feed = feed_of(instance.value()).get();
    if (feed) {
        std::cout << "Feed: #" << feed.value()->id.value << " " << feed.value()->name << std::endl;
    } else {
        std::cerr << "Feed lookup failed: " << feed.error().describe() << std::endl;
    }

    if (auto previous = previous_of(instance.value())) {
        auto prev = previous->get();
        if (prev) {
            std::cout << "Runs after: #" << prev.value()->id.value << " "
                      << prev.value()->plugin_name << std::endl;
        }
    }

    auto current = instance.value();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opts->poll_seconds);
    while (is_pending(current->status) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::seconds(2));
        auto refreshed = current.refresh();
        if (!refreshed) {
            std::cerr << "Refresh failed: " << refreshed.error().describe() << std::endl;
            return 1;
        }
        current = refreshed.value();
        std::cout << "  status: " << current->status << std::endl;
    }

    if (current->status == "finishedSuccessfully") {
        auto output = files(current).count();
        if (output) {
            std::cout << "Output files: " << output.value() << std::endl;
        }
    }
    return 0;
}
