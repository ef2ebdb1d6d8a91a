#include <fetch/cache.hh>

#include <limits>

bool fetch::is_cacheable(const http::response& res) {
    if (res.status != 200) return false;
    auto cc = res.hdrs.get("cache-control");
    return not cc or tolower(*cc).find("no-store") == std::string::npos;
}

auto fetch::max_age(const http::response& res) -> std::optional<std::chrono::seconds> {
    static constexpr std::string_view prefix = "max-age=";

    auto cc = res.hdrs.get("cache-control");
    if (not cc) return std::nullopt;

    /// The first max-age= followed by at least one digit wins; anything
    /// after the digits is ignored.
    auto value = tolower(*cc);
    for (auto pos = value.find(prefix); pos != std::string::npos; pos = value.find(prefix, pos + 1)) {
        auto i = pos + prefix.size();
        if (i >= value.size() or value[i] < '0' or value[i] > '9') continue;

        /// Out-of-range ages are clamped rather than rejected.
        i64 seconds = 0;
        for (; i < value.size() and value[i] >= '0' and value[i] <= '9'; i++)
            if (seconds < std::numeric_limits<i32>::max()) seconds = seconds * 10 + (value[i] - '0');
        return std::chrono::seconds{std::min<i64>(seconds, std::numeric_limits<i32>::max())};
    }

    return std::nullopt;
}

bool fetch::response_cache::store(const std::string& key, const http::response& res) {
    if (not is_cacheable(res)) return false;

    cache_entry entry{res, now(), max_age(res)};
    auto t = entry.stored_at;
    entries.with_lock([&](auto& map) {
        std::erase_if(map, [&](const auto& kv) { return not kv.second.fresh(t); });
        map.insert_or_assign(key, std::move(entry));
    });

    VERBOSE("Cached response for {}", key);
    return true;
}

auto fetch::response_cache::lookup(const std::string& key) -> std::optional<http::response> {
    auto t = now();
    return entries.with_lock([&](auto& map) -> std::optional<http::response> {
        auto it = map.find(key);
        if (it == map.end()) return std::nullopt;
        if (not it->second.fresh(t)) {
            map.erase(it);
            return std::nullopt;
        }
        return it->second.res;
    });
}

usz fetch::response_cache::sweep() {
    auto t = now();
    return entries.with_lock([&](auto& map) -> usz {
        return usz(std::erase_if(map, [&](const auto& kv) { return not kv.second.fresh(t); }));
    });
}

bool fetch::response_cache::contains(const std::string& key) const {
    return entries.with_lock([&](const auto& map) { return map.contains(key); });
}

usz fetch::response_cache::size() const {
    return entries.with_lock([](const auto& map) { return map.size(); });
}

void fetch::response_cache::clear() {
    entries.with_lock([](auto& map) { map.clear(); });
}
