#ifndef FETCH_COMMON_HH
#define FETCH_COMMON_HH

#include "utils.hh"

#include <cstdint>
#include <new>
#include <span>
#include <stdexcept>

namespace fetch {
/// \brief Growable receive buffer for a single response.
///
/// Bytes are appended at the end by the transports and never moved
/// until the buffer is cleared, so offsets into it (the header/body
/// delimiter, the last position scanned for a chunk terminator) stay
/// valid while a response is being assembled.
///
/// Like the transports, the buffer is not thread-safe.
class recvbuffer {
    char* bytes{};
    u64 sz{};
    u64 cap{};

public:
    recvbuffer() = default;
    ~recvbuffer() { std::free(bytes); }

    recvbuffer(const recvbuffer&) = delete;
    recvbuffer& operator=(const recvbuffer&) = delete;

    recvbuffer(recvbuffer&& other) noexcept { *this = std::move(other); }
    recvbuffer& operator=(recvbuffer&& other) noexcept {
        if (this == std::addressof(other)) return *this;
        std::free(bytes);
        bytes = other.bytes;
        sz = other.sz;
        cap = other.cap;
        other.bytes = nullptr;
        other.sz = 0;
        other.cap = 0;
        return *this;
    }

    /// Make room for at least \c size more bytes at the end of the buffer.
    ///
    /// Nothing happens if there already is enough spare capacity.
    void allocate(u64 size) {
        if (size > spare()) {
            cap = std::max(cap * 2, sz + size);
            auto* grown = (char*) std::realloc(bytes, cap);
            if (not grown) throw std::bad_alloc();
            bytes = grown;
        }
    }

    /// Append bytes to the buffer.
    void append(std::span<const char> data) {
        if (data.empty()) return;
        allocate(data.size());
        std::memcpy(bytes + sz, data.data(), data.size());
        sz += data.size();
    }

    /// Drop all data. The capacity is kept.
    void clear() { sz = 0; }

    /// \brief Mark \c nbytes bytes past the end as received.
    ///
    /// This does not allocate; call \c allocate() first and receive
    /// into \c tail().
    ///
    /// \throw std::runtime_error If that would exceed the capacity.
    void grow(u64 nbytes) {
        if (nbytes > spare()) throw std::runtime_error(fmt::format("recvbuffer::grow({}) out of bounds. Capacity is {}", nbytes, cap));
        sz += nbytes;
    }

    /// Where the next received byte goes.
    [[nodiscard]] char* tail() { return bytes + sz; }

    /// How many bytes fit before the next reallocation.
    [[nodiscard]] u64 spare() const { return cap - sz; }

    [[nodiscard]] const char* data() const { return bytes; }
    [[nodiscard]] usz size() const { return sz; }
    [[nodiscard]] bool empty() const { return sz == 0; }

    [[nodiscard]] std::span<const char> span() const { return {bytes, sz}; }
    [[nodiscard]] std::string_view str() const { return {bytes, sz}; }
};
} // namespace fetch

#endif // FETCH_COMMON_HH
