/**
 * @file search_example.cpp
 * @brief Browse plugins, feeds and files of a CUBE instance
 *
 * This example demonstrates:
 * - Connecting with a token, a password, or anonymously
 * - Counting a collection without fetching its items
 * - Streaming a search lazily, one page at a time
 * - Limiting how many items a stream yields
 */

#include <kcenon/cube/cube.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace kcenon::cube;

namespace {

struct options {
    std::string url = "http://localhost:8000/api/v1/";
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> token;
    std::string collection = "plugins";
    std::string name;
    std::size_t max_items = 20;
    uint32_t page_limit = 10;
};

void print_usage(const char* program) {
    std::cout << "Search Example - CUBE Client System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <plugins|feeds|files>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --address <url>     CUBE API URL (default: http://localhost:8000/api/v1/)" << std::endl;
    std::cout << "  -u, --username <name>   Username" << std::endl;
    std::cout << "  -p, --password <pass>   Password used to obtain a token" << std::endl;
    std::cout << "  -t, --token <token>     Existing auth token" << std::endl;
    std::cout << "  -n, --name <text>       Filter by name (plugins, feeds) or fname (files)" << std::endl;
    std::cout << "  -m, --max <n>           Stop after n items (default: 20)" << std::endl;
    std::cout << "  -l, --page-limit <n>    Items per request (default: 10)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " plugins -n pl-dcm2niix" << std::endl;
    std::cout << "  " << program << " -u chris -p chris1234 -n chris/feed_1 files" << std::endl;
}

auto parse_args(int argc, char* argv[]) -> std::optional<options> {
    options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            std::cerr << "Error: " << arg << " requires a value" << std::endl;
            return std::nullopt;
        };

        if (arg == "--help") {
            return std::nullopt;
        } else if (arg == "-a" || arg == "--address") {
            auto v = value(); if (!v) return std::nullopt; opts.url = *v;
        } else if (arg == "-u" || arg == "--username") {
            auto v = value(); if (!v) return std::nullopt; opts.username = *v;
        } else if (arg == "-p" || arg == "--password") {
            auto v = value(); if (!v) return std::nullopt; opts.password = *v;
        } else if (arg == "-t" || arg == "--token") {
            auto v = value(); if (!v) return std::nullopt; opts.token = *v;
        } else if (arg == "-n" || arg == "--name") {
            auto v = value(); if (!v) return std::nullopt; opts.name = *v;
        } else if (arg == "-m" || arg == "--max") {
            auto v = value(); if (!v) return std::nullopt;
            opts.max_items = static_cast<std::size_t>(std::stoul(*v));
        } else if (arg == "-l" || arg == "--page-limit") {
            auto v = value(); if (!v) return std::nullopt;
            opts.page_limit = static_cast<uint32_t>(std::stoul(*v));
        } else if (arg[0] != '-') {
            opts.collection = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return opts;
}

/**
 * @brief Print the count and up to max_items entries of a search
 */
template <typename R, typename A, typename Printer>
auto list(const search<R, A>& results, std::size_t max_items, Printer print) -> int {
    auto total = results.count();
    if (!total) {
        std::cerr << "Count failed: " << total.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Found " << total.value() << " item(s)" << std::endl;

    auto stream = results.stream();
    for (std::size_t shown = 0; shown < max_items; ++shown) {
        auto item = stream.next();
        if (!item) {
            std::cerr << "Fetch failed: " << item.error().describe() << std::endl;
            return 1;
        }
        if (!item.value()) {
            break;
        }
        print(*item.value());
    }
    std::cout << "(" << stream.pages_fetched() << " page(s) fetched)" << std::endl;
    return 0;
}

template <typename A>
auto run(const basic_client<A>& client, const options& opts) -> int {
    if (opts.collection == "plugins") {
        auto builder = client.plugins().page_limit(opts.page_limit);
        if (!opts.name.empty()) {
            builder = builder.name(opts.name);
        }
        return list(builder.build(), opts.max_items, [](const plugin_response& p) {
            std::cout << "  " << p.name << " " << p.version << "  [" << p.plugin_type << "]"
                      << std::endl;
        });
    }
    if (opts.collection == "feeds") {
        auto builder = client.public_feeds().page_limit(opts.page_limit);
        if (!opts.name.empty()) {
            builder = builder.name(opts.name);
        }
        return list(builder.build(), opts.max_items, [](const feed_response& f) {
            std::cout << "  #" << f.id.value << " " << f.name << std::endl;
        });
    }
    if (opts.collection == "files") {
        auto builder = client.files().page_limit(opts.page_limit);
        if (!opts.name.empty()) {
            builder = builder.fname(opts.name);
        }
        return list(builder.build(), opts.max_items, [](const file_response& f) {
            std::cout << "  " << f.fname << " (" << format_bytes(f.fsize) << ")" << std::endl;
        });
    }

    std::cerr << "Unknown collection: " << opts.collection << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 1;
    }

    auto builder = cube_client::builder().with_url(opts->url).with_page_limit(opts->page_limit);

    if (!opts->username) {
        auto client = builder.connect_anonymous();
        if (!client) {
            std::cerr << "Connect failed: " << client.error().describe() << std::endl;
            return 1;
        }
        return run(client.value(), *opts);
    }

    builder.with_username(*opts->username);
    if (opts->token) {
        builder.with_token(*opts->token);
    } else if (opts->password) {
        builder.with_password(*opts->password);
    }

    auto client = builder.connect();
    if (!client) {
        std::cerr << "Login failed: " << client.error().describe() << std::endl;
        return 1;
    }
    return run(client.value(), *opts);
}
