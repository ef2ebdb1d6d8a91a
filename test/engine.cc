#include <atomic>
#include <fetch/bridge.hh>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <zlib.h>

#include "check.hh"

using json = nlohmann::json;
using namespace std::literals;

/// ===========================================================================
///  Scripted loopback server
/// ===========================================================================
/// Serves canned responses on 127.0.0.1, one connexion at a time.
class test_server {
    struct route {
        /// Sent verbatim. Nothing is sent if empty.
        std::string response;

        /// Wait for another request on the same connexion instead of closing it.
        bool keep_open = false;
    };

    fetch::tcp::server sock;
    std::mutex routes_mutex;
    std::unordered_map<std::string, route> routes;
    std::string last;
    fetch::stop_flag stop;

    void serve(fetch::tcp::connexion& conn) {
        std::string buffer;
        char chunk[4096];
        for (;;) {
            auto end = buffer.find("\r\n\r\n");
            if (end == std::string::npos) {
                auto n = conn.recv(chunk, sizeof chunk);
                if (n == 0) return;
                buffer.append(chunk, n);
                continue;
            }

            auto request = buffer.substr(0, end + 4);
            buffer.erase(0, end + 4);

            /// GET <path> HTTP/1.1
            auto first = request.find(' ');
            auto second = request.find(' ', first + 1);
            auto path = request.substr(first + 1, second - first - 1);

            route r;
            {
                std::unique_lock lock{routes_mutex};
                last = request;
                auto it = routes.find(path);
                if (it != routes.end()) r = it->second;
                else r.response = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n";
            }

            ++requests;
            if (not r.response.empty()) conn.send(r.response);
            if (not r.keep_open) return;
        }
    }

    void run() {
        while (not stop.stopped()) {
            try {
                auto conn = sock.accept();
                if (stop.stopped()) return;
                ++accepts;
                serve(*conn);
            } catch (const fetch::error& e) {
                if (stop.stopped()) return;
                err("Test server: {}", e.what());
            }
        }
    }

public:
    std::atomic<usz> accepts = 0;
    std::atomic<usz> requests = 0;

    test_server() {
        sock.listen(0);
        thread = std::jthread([this] { run(); });
    }

    /// Wake up accept() so the thread sees the stop flag.
    ~test_server() {
        stop.stop();
        try {
            fetch::tcp::client poke{"127.0.0.1", port()};
        } catch (const fetch::error& e) {
            err("Could not stop test server: {}", e.what());
        }
    }

    [[nodiscard]] u16 port() const { return sock.port(); }

    [[nodiscard]] std::string url(std::string_view path) const {
        return fmt::format("http://127.0.0.1:{}{}", port(), path);
    }

    void on(std::string path, std::string response, bool keep_open = false) {
        std::unique_lock lock{routes_mutex};
        routes[std::move(path)] = route{std::move(response), keep_open};
    }

    [[nodiscard]] std::string last_request() {
        std::unique_lock lock{routes_mutex};
        return last;
    }

private:
    /// Last, so it is joined before anything it uses goes away.
    std::jthread thread;
};

std::string ok(std::string_view body, std::string_view extra_headers = "") {
    return fmt::format("HTTP/1.1 200 OK\r\nContent-Length: {}\r\n{}\r\n{}", body.size(), extra_headers, body);
}

std::string gzip(std::string_view data) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("deflateInit2() failed");
    defer { deflateEnd(&stream); };

    std::string out(deflateBound(&stream, uLong(data.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = uInt(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = uInt(out.size());
    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) throw std::runtime_error("deflate() failed");
    out.resize(stream.total_out);
    return out;
}

/// ===========================================================================
///  Tests
/// ===========================================================================
void test_basic_fetch() {
    test_server server;
    server.on("/hello", ok("hello", "Cache-Control: max-age=60\r\n"));
    server.on("/other", ok("other"));

    fetch::engine engine;
    check engine.load(server.url("/hello")) == "hello";
    check server.requests == 1;

    /// The request as it went out.
    auto req = server.last_request();
    check req.starts_with("GET /hello HTTP/1.1\r\n");
    check req.find(fmt::format("Host: 127.0.0.1\r\n")) != std::string::npos;
    check req.find("Connection: close\r\n") != std::string::npos;
    check req.find("User-Agent: Mozilla/5.0\r\n") != std::string::npos;
    check req.find("Accept-Encoding: gzip\r\n") != std::string::npos;
    check req.ends_with("\r\n\r\n");

    /// Served from the cache; any path on the authority hits the same entry.
    check engine.load(server.url("/hello")) == "hello";
    check engine.load(server.url("/other")) == "hello";
    check server.requests == 1;

    /// Same body with view-source.
    check engine.load("view-source:" + server.url("/hello")) == "hello";
    check server.requests == 1;
}

void test_resource_scope() {
    test_server server;
    server.on("/a", ok("a"));
    server.on("/b", ok("b"));

    fetch::config cfg;
    cfg.scope = fetch::cache_scope::resource;
    fetch::engine engine{cfg};
    check engine.load(server.url("/a")) == "a";
    check engine.load(server.url("/b")) == "b";
    check engine.load(server.url("/a")) == "a";
    check server.requests == 2;
}

void test_cache_expiry() {
    test_server server;
    server.on("/", ok("fresh", "Cache-Control: max-age=60\r\n"));

    auto t = fetch::response_cache::clock::time_point{};
    fetch::engine engine{{}, [&] { return t; }};

    check engine.load(server.url("/")) == "fresh";
    t += 59s;
    check engine.load(server.url("/")) == "fresh";
    check server.requests == 1;

    /// Stale: evicted and fetched again.
    t += 2s;
    server.on("/", ok("refetched", "Cache-Control: max-age=60\r\n"));
    check engine.load(server.url("/")) == "refetched";
    check server.requests == 2;

    /// And cached again.
    check engine.load(server.url("/")) == "refetched";
    check server.requests == 2;
}

void test_uncacheable() {
    test_server server;
    server.on("/no-store", ok("x", "Cache-Control: no-store\r\n"));
    server.on("/missing", "HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\n\r\nnope");

    {
        fetch::engine engine;
        check engine.load(server.url("/no-store")) == "x";
        check engine.load(server.url("/no-store")) == "x";
        check server.requests == 2;
        check engine.cache().size() == 0;
    }

    {
        fetch::engine engine;
        check engine.load(server.url("/missing")) == "nope";
        check engine.load(server.url("/missing")) == "nope";
        check server.requests == 4;
    }

    /// Caching switched off.
    {
        server.on("/cacheable", ok("y"));
        fetch::config cfg;
        cfg.use_cache = false;
        fetch::engine engine{cfg};
        check engine.load(server.url("/cacheable")) == "y";
        check engine.load(server.url("/cacheable")) == "y";
        check server.requests == 6;
    }
}

void test_redirects() {
    test_server server;

    /// /r/N redirects to /r/N-1; /r/0 is the target.
    for (int i = 1; i <= 11; i++) server.on(fmt::format("/r/{}", i), fmt::format("HTTP/1.1 301 Moved Permanently\r\nLocation: /r/{}\r\nContent-Length: 0\r\n\r\n", i - 1));
    server.on("/r/0", ok("done"));

    /// Exactly ten redirects are fine.
    {
        fetch::engine engine;
        check engine.load(server.url("/r/10")) == "done";
        check server.requests == 11;
    }

    /// Eleven are not.
    {
        fetch::engine engine;
        check throws<fetch::too_many_redirects>([&] { (void) engine.load(server.url("/r/11")); });
        check server.requests == 11 + 11;
    }

    /// Relative locations resolve against the current directory.
    server.on("/dir/start", "HTTP/1.1 302 Found\r\nLocation: end\r\nContent-Length: 0\r\n\r\n");
    server.on("/dir/end", ok("relative"));
    {
        fetch::engine engine;
        check engine.load(server.url("/dir/start")) == "relative";
    }

    /// A lower limit.
    {
        fetch::config cfg;
        cfg.max_redirects = 2;
        fetch::engine engine{cfg};
        check throws<fetch::too_many_redirects>([&] { (void) engine.load(server.url("/r/3")); });
        check engine.load(server.url("/r/2")) == "done";
    }

    /// A server can't redirect us to a local file.
    char name[] = "/tmp/fetch-redirect-XXXXXX";
    int fd = mkstemp(name);
    check fd != -1;
    if (fd != -1) {
        defer { ::unlink(name); };
        constexpr std::string_view secret = "local only";
        check ::write(fd, secret.data(), secret.size()) == ssize_t(secret.size());
        ::close(fd);

        server.on("/to-file", fmt::format("HTTP/1.1 302 Found\r\nLocation: file://{}\r\nContent-Length: 0\r\n\r\n", name));
        fetch::engine engine;
        std::string body;
        check throws<fetch::parse_error>([&] { body = engine.load(server.url("/to-file")); });
        check body.find(secret) == std::string::npos;
        check engine.load(fmt::format("file://{}", name)) == secret;
    }
}

void test_keep_alive() {
    test_server server;
    server.on("/ka", ok("kept", "Connection: keep-alive\r\nCache-Control: no-store\r\n"), true);
    server.on("/close", ok("closed", "Connection: close\r\nCache-Control: no-store\r\n"));

    {
        fetch::engine engine;
        check engine.load(server.url("/ka")) == "kept";
        check engine.connections().size() == 1;
        check engine.connections().contains(fmt::format("http://127.0.0.1:{}", server.port()));
        check engine.load(server.url("/ka")) == "kept";
        check server.accepts == 1;
        check server.requests == 2;
    }

    {
        fetch::engine engine;
        check engine.load(server.url("/close")) == "closed";
        check engine.connections().size() == 0;
        check engine.load(server.url("/close")) == "closed";
        check server.accepts == 3;
    }

    /// Pooling switched off.
    {
        fetch::config cfg;
        cfg.keep_alive = false;
        fetch::engine engine{cfg};
        check engine.load(server.url("/ka")) == "kept";
        check engine.connections().size() == 0;
    }
}

void test_encodings() {
    test_server server;
    auto text = "<html><body>compressed and chunked</body></html>"s;
    for (int i = 0; i < 5; i++) text += text;

    auto z = gzip(text);
    std::string chunked;
    for (usz i = 0; i < z.size(); i += 100) {
        auto piece = std::string_view{z}.substr(i, 100);
        chunked += fmt::format("{:X}\r\n{}\r\n", piece.size(), piece);
    }
    chunked += "0\r\n\r\n";

    server.on("/gzip", ok(z, "Content-Encoding: gzip\r\n"));
    server.on("/chunked", "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nContent-Encoding: gzip\r\n\r\n" + chunked);
    server.on("/until-close", "HTTP/1.0 200 OK\r\n\r\nread until the end");

    fetch::config cfg;
    cfg.use_cache = false;
    fetch::engine engine{cfg};
    check engine.load(server.url("/gzip")) == text;
    check engine.load(server.url("/chunked")) == text;
    check engine.load(server.url("/until-close")) == "read until the end";
}

void test_failures() {
    test_server server;
    server.on("/garbage", "garbage");
    server.on("/no-delimiter", "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n");
    server.on("/bad-gzip", ok("not gzip", "Content-Encoding: gzip\r\n"));
    server.on("/bad-status", "HTTP/1.1 two-hundred OK\r\nContent-Length: 0\r\n\r\n");
    server.on("/hang", "", true);

    fetch::config cfg;
    cfg.use_cache = false;
    cfg.read_timeout = 200ms;
    fetch::engine engine{cfg};
    check throws<fetch::parse_error>([&] { (void) engine.load(server.url("/garbage")); });
    check throws<fetch::parse_error>([&] { (void) engine.load(server.url("/no-delimiter")); });
    check throws<fetch::parse_error>([&] { (void) engine.load(server.url("/bad-status")); });
    check throws<fetch::decode_error>([&] { (void) engine.load(server.url("/bad-gzip")); });
    check throws<fetch::connection_error>([&] { (void) engine.load(server.url("/hang")); });

    /// Nothing listening.
    u16 port;
    {
        fetch::tcp::server closed;
        closed.listen(0);
        port = closed.port();
    }
    check throws<fetch::connection_error>([&] { (void) engine.load(fmt::format("http://127.0.0.1:{}/", port)); });
}

void test_local() {
    fetch::engine engine;
    check engine.load("data:text/html,Hello%20world!") == "Hello world!";
    check engine.load("data:text/plain;base64,SGVsbG8sIFdvcmxkIQ==") == "Hello, World!";
    check engine.load("view-source:data:text/html,<b>x</b>") == "<b>x</b>";

    char name[] = "/tmp/fetch-engine-XXXXXX";
    int fd = mkstemp(name);
    check fd != -1;
    if (fd != -1) {
        defer { ::unlink(name); };
        constexpr std::string_view contents = "<html>from disk</html>";
        check ::write(fd, contents.data(), contents.size()) == ssize_t(contents.size());
        ::close(fd);
        check engine.load(fmt::format("file://{}", name)) == contents;
    }

    check throws<fetch::file_read_error>([&] { (void) engine.load("file:///nonexistent/fetch/index.html"); });
    check throws<fetch::decode_error>([&] { (void) engine.load("data:text/plain,%G0"); });
}

void test_bridge() {
    check fetch::normalise_input("example.com") == "https://example.com";
    check fetch::normalise_input("  example.com/path ") == "https://example.com/path";
    check fetch::normalise_input("http://example.com") == "http://example.com";
    check fetch::normalise_input("file:///tmp/x") == "file:///tmp/x";
    check fetch::normalise_input("data:text/plain,x") == "data:text/plain,x";
    check fetch::normalise_input("view-source:https://example.com") == "view-source:https://example.com";
    check fetch::normalise_input("1http://x") == "https://1http://x";

    /// Messages.
    check json(fetch::load_request{"https://example.com"}) == json::parse(R"({"url": "https://example.com"})");
    check json(fetch::load_result::ok("body")) == json::parse(R"({"success": true, "content": "body"})");
    check json(fetch::load_result::failure("nope")) == json::parse(R"({"success": false, "error": "nope"})");

    auto decoded = json::parse(R"({"success": false, "error": "boom"})").get<fetch::load_result>();
    check not decoded.success and decoded.error == "boom" and decoded.content.empty();

    /// Configuration.
    auto cfg = json::parse(R"({"user_agent": "test/1.0", "max_redirects": 3, "read_timeout_ms": 1500, "cache_scope": "resource"})").get<fetch::config>();
    check cfg.user_agent == "test/1.0";
    check cfg.max_redirects == 3;
    check cfg.read_timeout == 1500ms;
    check cfg.connect_timeout == 0ms;
    check cfg.scope == fetch::cache_scope::resource;
    check cfg.default_host == "browser.engineering";
    check throws<std::invalid_argument>([] { (void) json::parse(R"({"cache_scope": "everything"})").get<fetch::config>(); });

    test_server server;
    server.on("/page", ok("page body"));
    server.on("/redirect", "HTTP/1.1 301 Moved\r\nLocation: /page\r\nContent-Length: 0\r\n\r\n");

    fetch::loader loader;

    /// Synchronous JSON round trip.
    auto reply = json::parse(loader.handle(json(fetch::load_request{server.url("/redirect")}).dump()));
    check reply["success"].get<bool>();
    check reply["content"].get<std::string>() == "page body";

    auto malformed = json::parse(loader.handle("{not json"));
    check not malformed["success"].get<bool>();
    check malformed.contains("error");

    auto missing = json::parse(loader.handle(R"({"url": "file:///nonexistent/fetch"})"));
    check not missing["success"].get<bool>();
    check missing["error"].get<std::string>().find("/nonexistent/fetch") != std::string::npos;

    /// Asynchronous.
    std::promise<fetch::load_result> promise;
    auto future = promise.get_future();
    loader.post({server.url("/page")}, [&](fetch::load_result res) { promise.set_value(std::move(res)); });
    check future.wait_for(10s) == std::future_status::ready;
    auto res = future.get();
    check res.success and res.content == "page body";

    /// Several at once.
    constexpr usz n = 8;
    std::vector<std::promise<fetch::load_result>> promises(n);
    for (auto& p : promises) loader.post({"data:text/plain,parallel"}, [&p](fetch::load_result r) { p.set_value(std::move(r)); });
    usz succeeded = 0;
    for (auto& p : promises)
        if (auto r = p.get_future().get(); r.success and r.content == "parallel") succeeded++;
    check succeeded == n;
}

int main() {
    test_basic_fetch();
    test_resource_scope();
    test_cache_expiry();
    test_uncacheable();
    test_redirects();
    test_keep_alive();
    test_encodings();
    test_failures();
    test_local();
    test_bridge();
    return summary();
}
