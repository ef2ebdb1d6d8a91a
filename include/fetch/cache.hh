#ifndef FETCH_CACHE_HH
#define FETCH_CACHE_HH

#include "execution/exec_context.hh"
#include "http.hh"

#include <chrono>
#include <functional>
#include <optional>
#include <unordered_map>

namespace fetch {
/// Whether a response may be stored at all.
///
/// Only 200 responses are, and only if Cache-Control doesn’t say no-store.
[[nodiscard]] bool is_cacheable(const http::response& res);

/// The max-age directive of a response, if it has one.
[[nodiscard]] std::optional<std::chrono::seconds> max_age(const http::response& res);

/// A stored response.
struct cache_entry {
    using clock = std::chrono::steady_clock;

    http::response res;
    clock::time_point stored_at;
    std::optional<std::chrono::seconds> max_age;

    /// An entry without max-age never expires; one with max-age=0 is
    /// never fresh.
    [[nodiscard]] bool fresh(clock::time_point now) const {
        if (not max_age) return true;
        return now - stored_at < *max_age;
    }
};

/// In-memory cache of decoded responses.
///
/// Entries live until their max-age runs out. Stale entries are
/// dropped when they are looked up and whenever something is stored.
class response_cache {
public:
    using clock = cache_entry::clock;
    using clock_fn = std::function<clock::time_point()>;

private:
    detail::synchronised<std::unordered_map<std::string, cache_entry>> entries;
    clock_fn now;

public:
    /// \param now Time source. Tests pass a fake clock.
    explicit response_cache(clock_fn now = clock::now) : now(std::move(now)) {}
    nocopy(response_cache);
    nomove(response_cache);

    /// Store a response if it is cacheable.
    ///
    /// \return Whether it was stored.
    bool store(const std::string& key, const http::response& res);

    /// Get a fresh response, dropping the entry if it has gone stale.
    [[nodiscard]] std::optional<http::response> lookup(const std::string& key);

    /// Drop all stale entries.
    ///
    /// \return How many were dropped.
    usz sweep();

    /// Whether there is an entry for a key, fresh or not.
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Number of entries, fresh or not.
    [[nodiscard]] usz size() const;

    /// Drop everything.
    void clear();
};
} // namespace fetch

#endif // FETCH_CACHE_HH
