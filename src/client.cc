#include <fetch/bridge.hh>

using json = nlohmann::json;

namespace {
[[noreturn]] void usage(const char* argv0) {
    fmt::print(stderr, "Usage: {} [--config <file.json>] <url>...\n", argv0);
    std::exit(2);
}

fetch::config load_config(const char* path) {
    auto file = fopen(path, "r");
    if (not file) die("Could not open \"{}\": {}", path, std::strerror(errno));
    defer { fclose(file); };

    try {
        return json::parse(file).get<fetch::config>();
    } catch (const std::exception& e) {
        die("Invalid configuration in \"{}\": {}", path, e.what());
    }
}
} // namespace

int main(int argc, char** argv) {
    fetch::config cfg;
    std::vector<std::string_view> urls;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) usage(argv[0]);
            cfg = load_config(argv[++i]);
        } else if (arg == "--help" or arg == "-h") {
            usage(argv[0]);
        } else {
            urls.push_back(arg);
        }
    }

    if (urls.empty()) usage(argv[0]);

    fetch::engine engine{std::move(cfg)};
    int failures = 0;
    for (auto url : urls) {
        auto res = fetch::handle(engine, {std::string{url}});
        if (res.success) {
            fmt::print("{}\n", res.content);
        } else {
            fmt::print(stderr, "{}: {}\n", url, res.error);
            failures++;
        }
    }

    return failures ? 1 : 0;
}
