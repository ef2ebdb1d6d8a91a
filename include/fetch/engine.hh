#ifndef FETCH_ENGINE_HH
#define FETCH_ENGINE_HH

#include "cache.hh"
#include "http.hh"
#include "local.hh"
#include "locator.hh"
#include "pool.hh"

#include <chrono>

namespace fetch {
/// What the response cache is keyed by.
enum struct cache_scope {
    /// scheme://host:port. Every path on a host shares one entry.
    authority,

    /// scheme://host:port/path.
    resource,
};

/// Engine configuration.
struct config {
    /// Host of the resource that unparseable locators are replaced with.
    std::string default_host{fetch::default_host};

    std::string user_agent = "Mozilla/5.0";

    /// A chain of this many redirects is followed; one more is an error.
    usz max_redirects = 10;

    /// Zero means no timeout.
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds read_timeout{0};

    bool use_cache = true;

    /// Pool connections if the response allows it.
    bool keep_alive = true;

    cache_scope scope = cache_scope::authority;
};

/// Fetches resources.
///
/// Each engine owns its connection pool and response cache. \c load()
/// and \c fetch() may be called from several threads at once; a
/// connection is only ever used by one of them at a time.
class engine {
    config cfg;
    response_cache responses;
    connection_pool pool;

    /// Cache key of a locator.
    [[nodiscard]] std::string cache_key(const locator& loc) const;

    /// Send a request and read, decode and return its response.
    [[nodiscard]] http::response exchange(const locator& loc);

public:
    explicit engine(config cfg = {}, response_cache::clock_fn now = response_cache::clock::now);
    nocopy(engine);
    nomove(engine);

    /// Fetch a resource given as text.
    ///
    /// Text that isn’t a valid locator is logged and replaced by the
    /// default resource.
    ///
    /// \return The decoded body.
    /// \throw error If the fetch fails.
    [[nodiscard]] std::string load(std::string_view url);

    /// Fetch a resource, following redirects.
    ///
    /// \return The decoded body.
    /// \throw too_many_redirects If the redirect chain is too long.
    /// \throw connection_error If the transport fails.
    /// \throw parse_error If a response is malformed.
    /// \throw decode_error If a body can’t be decoded.
    /// \throw file_read_error If a file can’t be read.
    [[nodiscard]] std::string fetch(const locator& target);

    [[nodiscard]] response_cache& cache() { return responses; }
    [[nodiscard]] connection_pool& connections() { return pool; }
    [[nodiscard]] const config& options() const { return cfg; }
};
} // namespace fetch

#endif // FETCH_ENGINE_HH
