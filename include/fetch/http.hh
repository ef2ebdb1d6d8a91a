#ifndef FETCH_HTTP_HH
#define FETCH_HTTP_HH

#include "common.hh"
#include "errors.hh"
#include "locator.hh"
#include "utils.hh"

#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fetch::http {
/// Response headers.
///
/// Keys are case-folded to lowercase on the way in; assigning to an
/// existing header replaces its value.
struct headers {
    std::unordered_map<std::string, std::string> values;

    headers() = default;
    headers(std::initializer_list<std::pair<const std::string, std::string>> init) {
        for (const auto& [k, v] : init) values[tolower(k)] = v;
    }

    /// Reference to a header value.
    struct ref {
        headers& parent;
        std::string key;

    private:
        friend struct headers;
        ref(headers& parent, std::string&& key) : parent(parent), key(std::move(key)) {}

    public:
        /// Set the header value. Last write wins.
        ref& operator=(std::string_view value) {
            parent.values[key] = value;
            return *this;
        }

        /// Check if the header exists.
        explicit operator bool() const { return parent.values.contains(key); }

        /// Get the header value.
        std::string& operator*() { return parent.values.at(key); }

        /// Get the header value.
        std::string* operator->() { return std::addressof(parent.values.at(key)); }
    };

    /// Get a reference to a header value.
    ref operator[](std::string_view key) { return {*this, tolower(key)}; }

    /// Get a header value, or nullptr if it isn’t present.
    [[nodiscard]] const std::string* get(std::string_view key) const {
        auto it = values.find(tolower(key));
        return it == values.end() ? nullptr : std::addressof(it->second);
    }

    /// Check if a certain header exists.
    [[nodiscard]] bool has(std::string_view key) const { return values.contains(tolower(key)); }

    [[nodiscard]] bool empty() const { return values.empty(); }
    [[nodiscard]] usz size() const { return values.size(); }
};

/// HTTP response.
struct response {
    std::string version;
    u32 status{};
    std::string explanation;
    headers hdrs;

    /// Raw body until \c decode_body() has run; decoded text afterwards.
    std::string body;

    /// Whether the server asked to keep the connexion open.
    [[nodiscard]] bool keep_alive() const;
};

/// HTTP GET request.
///
/// Header fields are kept in the order they were first set, which is
/// the order they go out on the wire.
struct request {
    std::string path = "/";
    std::vector<std::pair<std::string, std::string>> fields;

    request() = default;

    /// The request every fetch sends: Host, Connection: keep-alive,
    /// User-Agent, Accept and Accept-Encoding: gzip.
    explicit request(const locator& loc, std::string_view user_agent = "Mozilla/5.0");

    /// Set a header field, replacing its value if it’s already there.
    void set(std::string_view name, std::string_view value);

    /// Get a header field, or nullptr if it isn’t set.
    [[nodiscard]] const std::string* get(std::string_view name) const;

    /// The request line and headers, CRLF-terminated, with the final blank line.
    [[nodiscard]] std::string frame() const;

    /// Send the request over a connexion.
    template <typename conn_t>
    void send(conn_t& conn) const { conn.send(frame()); }
};

namespace detail {
/// How the end of a response body is found.
enum struct framing {
    /// No body at all (1xx, 204, 304, or Content-Length: 0).
    empty,
    content_length,
    chunked,
    until_close,
};

/// What the header block says about the body.
struct head {
    /// Offset of the first body byte (just past CRLFCRLF).
    usz body_offset{};
    framing kind = framing::until_close;
    u64 length{};
};

/// Locate the header block and work out how the body is framed.
///
/// \return \c std::nullopt if the header/body delimiter hasn’t arrived yet.
[[nodiscard]] std::optional<head> scan_head(std::string_view bytes);

/// Check whether the body described by \c hd has fully arrived.
///
/// \param scan_from Where to resume looking for the chunk terminator;
///     updated so repeated calls don’t rescan the whole body.
[[nodiscard]] bool body_complete(const head& hd, std::string_view bytes, usz& scan_from);
} // namespace detail

/// Check whether a buffered response is completely framed.
[[nodiscard]] bool is_framed(std::string_view bytes);

/// Where in its lifecycle a response is.
enum struct phase {
    connecting,
    awaiting_headers,
    awaiting_body,
    complete,
    failed,
};

constexpr inline std::string_view phase_to_str(phase p) {
    switch (p) {
        case phase::connecting: return "connecting";
        case phase::awaiting_headers: return "awaiting headers";
        case phase::awaiting_body: return "awaiting body";
        case phase::complete: return "complete";
        case phase::failed: return "failed";
    }
    return "unknown";
}

/// Collects the bytes of one response until it is framed.
///
/// The transport receives straight into \c buffer(); \c update() then
/// advances the state. Once \c complete, \c take() splits the bytes
/// into a \c response.
class assembler {
    recvbuffer bytes;
    phase st = phase::connecting;
    std::optional<detail::head> hd;
    usz scan_from{};
    bool eof = false;

public:
    assembler() = default;
    nocopy(assembler);

    /// The transport is ready; start waiting for the status line.
    void connected();

    /// Advance the state after more bytes were received into \c buffer().
    phase update();

    /// Append bytes and advance the state.
    phase feed(std::span<const char> data);

    /// The peer closed the connexion.
    ///
    /// A response whose headers have arrived is complete at this point;
    /// anything else is a \c parse_error.
    phase end_of_stream();

    /// Split the assembled bytes into a response. The body is not decoded.
    ///
    /// \throw parse_error If the response is not complete or malformed.
    [[nodiscard]] response take();

    [[nodiscard]] recvbuffer& buffer() { return bytes; }
    [[nodiscard]] phase state() const { return st; }
    [[nodiscard]] bool done() const { return st == phase::complete; }

    /// Whether the peer closed the connexion while we were reading.
    [[nodiscard]] bool peer_closed() const { return eof; }
};

/// Split raw response bytes into status line, headers and (raw) body.
///
/// \throw parse_error If there is no CRLF at all, no header/body
///     delimiter, or the status code isn’t a number.
[[nodiscard]] response split_response(std::string_view raw);

/// Content codings we can undo.
enum struct content_coding {
    identity,
    gzip,
    deflate,
    other,
};

/// Map a Content-Encoding value to a coding.
[[nodiscard]] content_coding coding_of(std::string_view value);

/// Undo chunked transfer encoding.
///
/// Chunk extensions and trailers are ignored. A stream that ends early
/// yields whatever was received.
///
/// \throw parse_error If a chunk header or delimiter is malformed.
[[nodiscard]] std::string decode_chunked(std::string_view body);

/// Inflate a gzip or deflate body with zlib.
///
/// \throw decode_error If the data is corrupt or truncated.
[[nodiscard]] std::string decompress(std::string_view data, content_coding coding);

/// Apply transfer and content decoding to a response body in place.
void decode_body(response& res);

/// Where a redirect response points to, if anywhere.
///
/// Relative locations are resolved against the directory of the current
/// path; locations starting with / replace the path; absolute locations
/// replace everything. A location that can't be parsed falls back to
/// \p fallback_host.
///
/// \throw parse_error If the location points at anything but http or https.
[[nodiscard]] std::optional<locator> redirect_target(const locator& current, const response& res, std::string_view fallback_host = default_host);
} // namespace fetch::http

#endif // FETCH_HTTP_HH
