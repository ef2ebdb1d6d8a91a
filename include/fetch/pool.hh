#ifndef FETCH_POOL_HH
#define FETCH_POOL_HH

#include "execution/exec_context.hh"
#include "locator.hh"
#include "ssl.hh"
#include "tcp.hh"

#include <memory>
#include <unordered_map>
#include <variant>

namespace fetch {
/// An open transport to one authority: plain TCP for http, TLS for https.
class connection {
    std::variant<std::monostate, tcp::client, ssl::client> transport;
    std::string key;

public:
    connection() = default;
    nocopy(connection);
    nomove(connection);

    /// Connect to the host and port of a locator.
    ///
    /// \throw connection_error If resolving, connecting, or the TLS
    ///     handshake fails.
    void open(const locator& loc, timeouts limits = {});

    /// Send bytes.
    void send(std::string_view data);

    /// Receive whatever is available.
    ///
    /// \return The number of bytes received, or 0 if the peer closed.
    u64 recv(recvbuffer& buf);

    /// The authority this connection was opened to.
    [[nodiscard]] std::string_view authority() const { return key; }

    /// Whether \c open() has succeeded.
    [[nodiscard]] bool is_open() const { return not std::holds_alternative<std::monostate>(transport); }

    /// Whether this is a TLS connection.
    [[nodiscard]] bool secure() const { return std::holds_alternative<ssl::client>(transport); }
};

/// Keeps at most one idle connection per authority.
///
/// A connection is taken out of the pool while a request runs on it
/// and only goes back in if the response allowed keep-alive.
class connection_pool {
    detail::synchronised<std::unordered_map<std::string, std::unique_ptr<connection>>> idle;
    timeouts limits;

public:
    explicit connection_pool(timeouts limits = {}) : limits(limits) {}
    nocopy(connection_pool);
    nomove(connection_pool);

    /// Take the idle connection to the authority of \c loc, or open a new one.
    [[nodiscard]] std::unique_ptr<connection> acquire(const locator& loc);

    /// Hand a connection back after a response has been read.
    ///
    /// If \c keep_alive is false, the connection is closed instead. A
    /// connection already pooled under the same authority is replaced.
    void release(std::unique_ptr<connection> conn, bool keep_alive);

    /// Whether there is an idle connection to an authority.
    [[nodiscard]] bool contains(std::string_view authority) const;

    /// Number of idle connections.
    [[nodiscard]] usz size() const;

    /// Close all idle connections.
    void clear();
};
} // namespace fetch

#endif // FETCH_POOL_HH
