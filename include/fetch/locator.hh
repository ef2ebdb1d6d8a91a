#ifndef FETCH_LOCATOR_HH
#define FETCH_LOCATOR_HH

#include "errors.hh"
#include "utils.hh"

#include <string>
#include <string_view>

namespace fetch {
/// Schemes a locator can end up with.
///
/// view-source is not among them: it only sets \c locator::view_source
/// on top of the scheme of the resource it wraps.
enum struct scheme {
    http,
    https,
    file,
    data,
};

constexpr inline std::string_view scheme_to_str(scheme s) {
    switch (s) {
        case scheme::http: return "http";
        case scheme::https: return "https";
        case scheme::file: return "file";
        case scheme::data: return "data";
    }
    return "https";
}

/// Host used when a locator cannot be parsed.
constexpr inline std::string_view default_host = "browser.engineering";

/// A parsed resource locator.
///
/// Constructing a locator from a string never fails: anything that
/// doesn’t parse is logged and replaced by https://<fallback host>/.
/// Use \c locator::parse() to get the error instead.
struct locator {
    scheme kind = scheme::https;
    std::string host;
    std::string path = "/";

    /// 80 or 443 unless given explicitly; -1 for file and data.
    i32 port = 443;

    /// Set when the input was view-source:<locator>.
    bool view_source = false;

    locator() = default;
    explicit locator(std::string_view url, std::string_view fallback_host = default_host);

    /// Parse a locator.
    ///
    /// \throw invalid_scheme If the scheme isn’t supported.
    /// \throw malformed_url If the locator can’t be parsed otherwise.
    [[nodiscard]] static locator parse(std::string_view url);

    /// The resource every parse failure is replaced with.
    [[nodiscard]] static locator fallback(std::string_view host = default_host);

    /// scheme://host:port. Key of the connection pool and response cache.
    [[nodiscard]] std::string authority() const;

    /// Whether the scheme needs a network round trip.
    [[nodiscard]] bool remote() const { return kind == scheme::http or kind == scheme::https; }

    /// Whether the port is the default one of the scheme.
    [[nodiscard]] bool default_port() const;

    /// Render the locator, without the view-source prefix.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const locator&) const = default;
};
} // namespace fetch

#endif // FETCH_LOCATOR_HH
