#include <fetch/pool.hh>

void fetch::connection::open(const locator& loc, timeouts limits) {
    if (not loc.remote()) throw connection_error("Cannot open a connection to {}", loc.to_string());
    if (loc.port <= 0 or loc.port > 65535) throw connection_error("Invalid port {}", loc.port);

    key = loc.authority();
    auto port = u16(loc.port);
    try {
        switch (loc.kind) {
            case scheme::http:
                transport.emplace<tcp::client>().connect(loc.host, port, limits);
                break;
            case scheme::https:
                transport.emplace<ssl::client>().connect(loc.host, port, limits);
                break;
            default: break;
        }
    } catch (const error&) {
        transport.emplace<std::monostate>();
        throw;
    }
}

void fetch::connection::send(std::string_view data) {
    std::visit([&]<typename transport_t>(transport_t& t) {
        if constexpr (std::is_same_v<transport_t, std::monostate>) throw connection_error("Connection is not open");
        else t.send(data);
    }, transport);
}

u64 fetch::connection::recv(recvbuffer& buf) {
    return std::visit([&]<typename transport_t>(transport_t& t) -> u64 {
        if constexpr (std::is_same_v<transport_t, std::monostate>) throw connection_error("Connection is not open");
        else return t.recv(buf);
    }, transport);
}

auto fetch::connection_pool::acquire(const locator& loc) -> std::unique_ptr<connection> {
    auto key = loc.authority();
    auto pooled = idle.with_lock([&](auto& map) -> std::unique_ptr<connection> {
        auto it = map.find(key);
        if (it == map.end()) return nullptr;
        auto conn = std::move(it->second);
        map.erase(it);
        return conn;
    });

    if (pooled) {
        VERBOSE("Reusing connection to {}", key);
        return pooled;
    }

    info("Opening connection to {}", key);
    auto conn = std::make_unique<connection>();
    conn->open(loc, limits);
    return conn;
}

void fetch::connection_pool::release(std::unique_ptr<connection> conn, bool keep_alive) {
    if (not conn or not conn->is_open()) return;

    /// Dropping the pointer closes the socket.
    if (not keep_alive) return;

    std::string key{conn->authority()};
    idle.with_lock([&](auto& map) { map[key] = std::move(conn); });
}

bool fetch::connection_pool::contains(std::string_view authority) const {
    return idle.with_lock([&](const auto& map) { return map.contains(std::string{authority}); });
}

usz fetch::connection_pool::size() const {
    return idle.with_lock([](const auto& map) { return map.size(); });
}

void fetch::connection_pool::clear() {
    idle.with_lock([](auto& map) { map.clear(); });
}
