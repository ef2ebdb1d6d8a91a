#include <fetch/engine.hh>

fetch::engine::engine(config options, response_cache::clock_fn now)
    : cfg(std::move(options)),
      responses(std::move(now)),
      pool(timeouts{cfg.connect_timeout, cfg.read_timeout}) {}

std::string fetch::engine::cache_key(const locator& loc) const {
    switch (cfg.scope) {
        case cache_scope::authority: return loc.authority();
        case cache_scope::resource: return loc.authority() + loc.path;
    }
    return loc.authority();
}

auto fetch::engine::exchange(const locator& loc) -> http::response {
    auto conn = pool.acquire(loc);

    /// The request is built with keep-alive, but always goes out with
    /// close. Whether the connection is pooled afterwards is up to the
    /// server’s reply.
    http::request req{loc, cfg.user_agent};
    req.set("Connection", "close");
    req.send(*conn);

    http::assembler reader;
    reader.connected();
    while (not reader.done()) {
        if (conn->recv(reader.buffer()) == 0) reader.end_of_stream();
        else reader.update();
    }

    auto res = reader.take();
    VERBOSE("{} {} {} ({} bytes)", loc.to_string(), res.status, res.explanation, res.body.size());
    http::decode_body(res);

    /// A connection the server has already closed is useless.
    pool.release(std::move(conn), cfg.keep_alive and res.keep_alive() and not reader.peer_closed());
    return res;
}

std::string fetch::engine::load(std::string_view url) {
    return fetch(locator{url, cfg.default_host});
}

std::string fetch::engine::fetch(const locator& target) {
    locator loc = target;
    usz hops = 0;
    for (;;) {
        switch (loc.kind) {
            case scheme::data: return load_data(loc.path);
            case scheme::file: return read_file(loc.path);
            case scheme::http:
            case scheme::https: break;
        }

        auto key = cache_key(loc);
        if (cfg.use_cache) {
            if (auto hit = responses.lookup(key)) {
                VERBOSE("Cache hit for {}", key);
                return std::move(hit->body);
            }
        }

        auto res = exchange(loc);
        if (cfg.use_cache) responses.store(key, res);

        auto next = http::redirect_target(loc, res, cfg.default_host);
        if (not next) return std::move(res.body);

        if (++hops > cfg.max_redirects)
            throw too_many_redirects("Too many redirects: gave up after {} following {}", cfg.max_redirects, target.to_string());

        info("Redirect {}: {} -> {}", res.status, loc.to_string(), next->to_string());
        loc = std::move(*next);
    }
}
