#ifndef FETCH_TCP_HH
#define FETCH_TCP_HH

#include "common.hh"
#include "errors.hh"
#include "utils.hh"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <memory>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace fetch {
/// Socket timeouts. Zero means wait forever.
struct timeouts {
    std::chrono::milliseconds connect{0};
    std::chrono::milliseconds read{0};
};
} // namespace fetch

namespace fetch::tcp {
namespace detail {
/// Data and functions that are common to both client and server.
class tcp_base {
protected:
    int fd = -1;
    bool connected = false;
    std::string host_name;

    /// Get the current error message.
    [[nodiscard]] static std::string geterr() { return std::strerror(errno); }

    /// Raise an error.
    template <typename... arguments>
    [[noreturn]] void raise(fmt::format_string<arguments...> format, arguments&&... args) const {
        std::string message = fmt::format(format, std::forward<arguments>(args)...);
        message += fmt::format(": {}", geterr());
        throw connection_error("{}", message);
    }

    /// Set SO_SNDTIMEO or SO_RCVTIMEO. A zero duration leaves the default.
    void set_timeout(int option, std::chrono::milliseconds ms) const {
        if (ms <= std::chrono::milliseconds::zero()) return;
        timeval tv{};
        tv.tv_sec = ms.count() / 1000;
        tv.tv_usec = (ms.count() % 1000) * 1000;
        if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof tv) == -1) raise("setsockopt() failed");
    }

public:
    tcp_base() = default;
    explicit tcp_base(int fd) : fd(fd), connected(fd != -1) {}
    ~tcp_base() { close(); }
    nocopy(tcp_base);
    nomove(tcp_base);

    /// Close the socket.
    void close() {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }

        connected = false;
    }

    /// Connect to a server.
    ///
    /// \param host Hostname or IP address.
    /// \param port Port number.
    /// \param limits Connect and read timeouts.
    /// \throw connection_error if there is an error.
    void connect(std::string_view host, u16 port, timeouts limits = {}) {
        if (fd != -1) ::close(fd);
        connected = false;

        /// Resolve host.
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        std::string name{host};
        if (auto code = ::getaddrinfo(name.c_str(), nullptr, &hints, &res); code != 0)
            throw connection_error("getaddrinfo(\"{}\") failed: {}", host, gai_strerror(code));
        defer { ::freeaddrinfo(res); };

        /// Create the socket.
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd == -1) raise("socket() failed");

        /// On Linux, SO_SNDTIMEO also bounds connect().
        set_timeout(SO_SNDTIMEO, limits.connect);
        set_timeout(SO_RCVTIMEO, limits.read);

        /// Connect.
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
            auto message = fmt::format("connect() to {}:{} failed: {}", host, port, geterr());
            ::close(fd);
            fd = -1;
            throw connection_error("{}", message);
        }

        host_name = host;
        connected = true;
    }

    /// Send a message.
    ///
    /// \param msg The message to send.
    /// \throw connection_error if the call to ::send() fails.
    void send(std::string_view msg) {
        if (not connected) throw connection_error("Cannot send data on a disconnected socket");
        while (not msg.empty()) {
            auto n = ::send(fd, msg.data(), msg.size(), MSG_NOSIGNAL);
            if (n == -1) {
                if (errno == EINTR) continue;
                raise("send() failed");
            }
            msg.remove_prefix(usz(n));
        }
    }

    /// Receive whatever is available into a buffer.
    ///
    /// \return The number of bytes received; 0 once the peer has closed
    ///     its side of the connection.
    u64 recv(recvbuffer& v) {
        if (v.spare() < 1024) v.allocate(4096);
        auto n = recv(v.tail(), v.spare());
        v.grow(n);
        return n;
    }

    /// Receive data from the peer.
    ///
    /// \param data The buffer to receive the data into.
    /// \param size The size of the buffer (in bytes).
    /// \returns The number of bytes received, or 0 on end of stream.
    /// \throws connection_error If the receive fails or times out.
    u64 recv(char* data, u64 size) {
        if (not connected) throw connection_error("Cannot receive data on a disconnected socket");
        for (;;) {
            auto ret = ::recv(fd, data, size, 0);
            if (ret >= 0) return u64(ret);
            if (errno == EINTR) continue;
            if (errno == EAGAIN or errno == EWOULDBLOCK) throw connection_error("recv() from {} timed out", host_name);
            raise("recv() failed");
        }
    }

    /// The underlying socket.
    [[nodiscard]] int native_handle() const { return fd; }

    /// Whether the socket is connected.
    [[nodiscard]] bool is_connected() const { return connected; }
};
} // namespace detail

/// Connexion to a client.
using connexion = detail::tcp_base;

/// ===========================================================================
///  TCP Server
/// ===========================================================================
struct server : detail::tcp_base {
    server() = default;
    ~server() { close(); }

    /// A server can't connect to anything.
    void connect(std::string_view host, u16 port) = delete;

    /// Listen on a port on the loopback interface.
    ///
    /// \param port Port number, or 0 to let the kernel pick one.
    /// \throw connection_error if there is an error.
    void listen(u16 port, int max_connexions = 128) {
        if (max_connexions < 1) throw connection_error("max_connexions must be >= 1");

        if (fd != -1) ::close(fd);
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd == -1) raise("socket() failed");

        int yes = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof yes) == -1) raise("setsockopt() failed");

        /// Bind to port.
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
            auto message = fmt::format("bind() failed: {}", geterr());
            ::close(fd);
            fd = -1;
            throw connection_error("{}", message);
        }

        if (::listen(fd, max_connexions) == -1) {
            auto message = fmt::format("listen() failed: {}", geterr());
            ::close(fd);
            fd = -1;
            throw connection_error("{}", message);
        }
    }

    /// The port we’re listening on.
    [[nodiscard]] u16 port() const {
        sockaddr_in addr{};
        socklen_t len = sizeof addr;
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) raise("getsockname() failed");
        return ntohs(addr.sin_port);
    }

    /// Accept a connexion.
    /// \throw connection_error if there is an error.
    [[nodiscard]] std::unique_ptr<connexion> accept() const {
        for (;;) {
            int client = ::accept(fd, nullptr, nullptr);
            if (client != -1) return std::make_unique<connexion>(client);
            if (errno != EINTR) raise("accept() failed");
        }
    }
};

/// ===========================================================================
///  TCP Client
/// ===========================================================================
class client : public detail::tcp_base {
public:
    client() = default;
    client(std::string_view host, u16 port, timeouts limits = {}) { connect(host, port, limits); }
    ~client() { close(); }

    /// Returns the current host name or the empty string if not connected.
    [[nodiscard]] std::string_view host() const { return host_name; }
};

} // namespace fetch::tcp

#endif // FETCH_TCP_HH
