#ifndef FETCH_SSL_HH
#define FETCH_SSL_HH

#include "tcp.hh"

#include <limits>
#include <openssl/conf.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#if OPENSSL_VERSION_NUMBER < 0x10100000L
#    error "OpenSSL version 1.1.0 or higher is required"
#endif

namespace fetch::ssl {
/// SSL client.
///
/// The TCP connexion is made by a \c tcp::client, so connect and read
/// timeouts apply to TLS traffic as well; the TLS session runs on top
/// of it through a socket BIO.
///
/// Even though it has some builtin checks, this client is NOT thread-safe. Do
/// not use it across multiple threads.
class client {
    tcp::client sock;
    SSL_CTX* ctx = nullptr;
    BIO* bio = nullptr;
    SSL* ssl = nullptr;
    bool connected = false;
    std::string host_name;

    /// Get the current error message.
    [[nodiscard]] static std::string geterr() {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof buf);
        return buf;
    }

    /// Raise an error.
    template <typename... arguments>
    [[noreturn]] void raise(fmt::format_string<arguments...> format, arguments&&... args) {
        std::string message = fmt::format(format, std::forward<arguments>(args)...);
        message += fmt::format(": {}", geterr());
        close();
        throw connection_error("{}", message);
    }

    /// Whether a failed BIO call was a read timeout rather than a retry.
    [[nodiscard]] static bool timed_out() { return errno == EAGAIN or errno == EWOULDBLOCK; }

public:
    client() = default;
    client(std::string_view host, u16 port, timeouts limits = {}) { connect(host, port, limits); }
    ~client() { close(); }
    nocopy(client);
    nomove(client);

    /// Returns the current host name or the empty string if not connected.
    [[nodiscard]] std::string_view host() const { return host_name; }

    /// Connect to a server.
    ///
    /// \param host The host to connect to. Also used for SNI and to
    ///     verify the certificate.
    /// \param port The port to connect to.
    /// \param limits Connect and read timeouts.
    /// \throws connection_error If the connection fails.
    void connect(std::string_view host, u16 port, timeouts limits = {}) {
        if (connected) raise("SSL client already connected");
        std::string name{host};

        /// Let openssl figure out the TLS version.
        const SSL_METHOD* method = TLS_client_method();
        if (not method) raise("OpenSSL: TLS_client_method() failed");

        /// Create the SSL context.
        ctx = SSL_CTX_new(method);
        if (not ctx) raise("OpenSSL: SSL_CTX_new() failed");
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_verify_depth(ctx, 4);
        SSL_CTX_set_options(ctx, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_COMPRESSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        /// Plenty of servers close without close_notify once the body is sent.
        SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

        /// Load the trusted CA certificates.
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) raise("OpenSSL: SSL_CTX_set_default_verify_paths() failed");

        /// TCP first.
        sock.connect(host, port, limits);

        /// TLS filter BIO on top of a socket BIO.
        bio = BIO_new_ssl(ctx, 1);
        if (not bio) raise("OpenSSL: BIO_new_ssl() failed");
        BIO* socket_bio = BIO_new_socket(sock.native_handle(), BIO_NOCLOSE);
        if (not socket_bio) raise("OpenSSL: BIO_new_socket() failed");
        BIO_push(bio, socket_bio);

        /// Get the SSL object from the BIO.
        BIO_get_ssl(bio, &ssl);
        if (not ssl) raise("OpenSSL: BIO_get_ssl() failed");
        SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);

        auto res = SSL_set_cipher_list(ssl, "HIGH:!aNULL:!kRSA:!PSK:!SRP:!MD5:!RC4");
        if (res != 1) raise("OpenSSL: SSL_set_cipher_list() failed");

        /// Server name indication.
        res = int(SSL_set_tlsext_host_name(ssl, name.c_str()));
        if (res != 1) raise("OpenSSL: SSL_set_tlsext_host_name() failed");

        /// Perform the TLS handshake.
        for (;;) {
            res = int(BIO_do_handshake(bio));
            if (res != 1) {
                if (not BIO_should_retry(bio)) raise("OpenSSL: TLS handshake with {} failed", host);
                if (timed_out()) raise("OpenSSL: TLS handshake with {} timed out", host);
                continue;
            }
            break;
        }

        /// Verify the server certificate.
        X509* cert = SSL_get_peer_certificate(ssl);
        if (not cert) raise("OpenSSL: SSL_get_peer_certificate() failed");
        defer { X509_free(cert); };

        /// Verify the chain.
        if (SSL_get_verify_result(ssl) != X509_V_OK) raise("OpenSSL: Could not verify remote certificate");

        /// Verify the hostname.
        res = X509_check_host(cert, name.data(), name.size(), 0, nullptr);
        if (res != 1) raise("OpenSSL: Could not verify remote certificate hostname");

        host_name = host;
        connected = true;
    }

    /// Close the connection.
    void close() {
        if (bio) {
            BIO_free_all(bio);
            bio = nullptr;
            ssl = nullptr;
        }

        if (ctx) {
            SSL_CTX_free(ctx);
            ctx = nullptr;
        }

        sock.close();
        connected = false;
    }

    /// Send data to the server.
    ///
    /// \param data The data to send.
    /// \throws connection_error If the send fails.
    void send(std::string_view data) {
        if (not connected) raise("SSL client not connected");
        if (data.size() > usz(std::numeric_limits<int>::max())) raise("SSL client send size too large");

        while (not data.empty()) {
            auto res = BIO_write(bio, data.data(), int(data.size()));
            if (res <= 0) {
                if (BIO_should_retry(bio) and not timed_out()) continue;
                raise("OpenSSL: BIO_write() failed");
            }
            data.remove_prefix(usz(res));
        }
    }

    /// Receive whatever is available into a buffer.
    ///
    /// \return The number of bytes received; 0 once the peer has closed
    ///     the connection.
    u64 recv(recvbuffer& v) {
        if (v.spare() < 1024) v.allocate(4096);
        auto n = recv(v.tail(), std::min<u64>(v.spare(), u64(std::numeric_limits<int>::max())));
        v.grow(n);
        return n;
    }

    /// Receive data from the server.
    ///
    /// \param data The buffer to receive the data into.
    /// \param size The size of the buffer (in bytes).
    /// \returns The number of bytes received, or 0 on end of stream.
    /// \throws connection_error If the receive fails or times out.
    u64 recv(char* data, u64 size) {
        if (not connected) raise("SSL client not connected");
        if (not size or size > u64(std::numeric_limits<int>::max())) raise("SSL client recv() size must be between 1 and {}, but was {}", std::numeric_limits<int>::max(), size);

        for (;;) {
            auto ret = BIO_read(bio, data, int(size));
            if (ret > 0) return u64(ret);
            if (BIO_should_retry(bio)) {
                if (timed_out()) raise("OpenSSL: read from {} timed out", host_name);
                continue;
            }

            /// Orderly shutdown.
            if (ret == 0 or SSL_get_error(ssl, ret) == SSL_ERROR_ZERO_RETURN) return 0;
            raise("OpenSSL: BIO_read() failed");
        }
    }
};

} // namespace fetch::ssl

#endif // FETCH_SSL_HH
