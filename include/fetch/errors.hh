#ifndef FETCH_ERRORS_HH
#define FETCH_ERRORS_HH

#include "utils.hh"

#include <stdexcept>

namespace fetch {
/// What went wrong during a fetch.
enum struct error_kind {
    invalid_scheme,
    malformed_url,
    too_many_redirects,
    connection_error,
    decode_error,
    file_read_error,
    parse_error,
};

constexpr inline std::string_view error_kind_to_str(error_kind kind) {
    switch (kind) {
        case error_kind::invalid_scheme: return "InvalidScheme";
        case error_kind::malformed_url: return "MalformedUrl";
        case error_kind::too_many_redirects: return "TooManyRedirects";
        case error_kind::connection_error: return "ConnectionError";
        case error_kind::decode_error: return "DecodeError";
        case error_kind::file_read_error: return "FileReadError";
        case error_kind::parse_error: return "ParseError";
    }
    return "Unknown";
}

/// Base class of everything the engine throws.
///
/// The message is human-readable and is what the bridge hands back to
/// the caller in a failed result.
class error : public std::runtime_error {
    error_kind what_kind;

public:
    error(error_kind kind, const std::string& message)
        : std::runtime_error(message), what_kind(kind) {}

    [[nodiscard]] error_kind kind() const noexcept { return what_kind; }
};

namespace detail {
template <error_kind k>
struct error_of : error {
    static constexpr error_kind value = k;

    template <typename... arguments>
    explicit error_of(fmt::format_string<arguments...> format, arguments&&... args)
        : error(k, fmt::format(format, std::forward<arguments>(args)...)) {}
};
} // namespace detail

/// Scheme is not one of http, https, file, data, view-source.
using invalid_scheme = detail::error_of<error_kind::invalid_scheme>;

/// Locator could not be parsed for any other reason.
using malformed_url = detail::error_of<error_kind::malformed_url>;

/// The redirect hop limit was exceeded.
using too_many_redirects = detail::error_of<error_kind::too_many_redirects>;

/// Transport failure: resolve, connect, handshake, send, or receive.
using connection_error = detail::error_of<error_kind::connection_error>;

/// Body could not be decoded (gzip, deflate, percent or base64 encoding).
using decode_error = detail::error_of<error_kind::decode_error>;

/// A file: resource could not be read.
using file_read_error = detail::error_of<error_kind::file_read_error>;

/// The response is missing structure we need.
using parse_error = detail::error_of<error_kind::parse_error>;
} // namespace fetch

#endif // FETCH_ERRORS_HH
