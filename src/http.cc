#include <fetch/http.hh>

#include <limits>
#include <zlib.h>

namespace http = fetch::http;

namespace {
constexpr std::string_view crlf = "\r\n";
constexpr std::string_view delimiter = "\r\n\r\n";
constexpr std::string_view last_chunk = "\r\n0\r\n\r\n";

/// Parse a run of decimal digits. Returns nullopt if there are none or it overflows.
std::optional<u64> parse_decimal(std::string_view digits) {
    if (digits.empty()) return std::nullopt;
    u64 value = 0;
    for (char c : digits) {
        if (c < '0' or c > '9') return std::nullopt;
        if (value > (std::numeric_limits<u64>::max() - 9) / 10) return std::nullopt;
        value = value * 10 + u64(c - '0');
    }
    return value;
}

/// Status codes that never carry a body.
constexpr bool bodiless(u64 status) {
    return (status >= 100 and status < 200) or status == 204 or status == 304;
}
} // namespace

/// ===========================================================================
///  Request framer
/// ===========================================================================
http::request::request(const locator& loc, std::string_view user_agent) : path(loc.path) {
    if (path.empty()) path = "/";
    set("Host", loc.host);
    set("Connection", "keep-alive");
    set("User-Agent", user_agent);
    set("Accept", "*/*");
    set("Accept-Encoding", "gzip");
}

void http::request::set(std::string_view name, std::string_view value) {
    auto key = tolower(name);
    for (auto& [k, v] : fields) {
        if (tolower(k) == key) {
            v = value;
            return;
        }
    }
    fields.emplace_back(name, value);
}

auto http::request::get(std::string_view name) const -> const std::string* {
    auto key = tolower(name);
    for (const auto& [k, v] : fields)
        if (tolower(k) == key) return std::addressof(v);
    return nullptr;
}

std::string http::request::frame() const {
    std::string buf = fmt::format("GET {} HTTP/1.1\r\n", path);
    for (const auto& [key, value] : fields) buf += fmt::format("{}: {}\r\n", key, value);
    buf += crlf;
    return buf;
}

bool http::response::keep_alive() const {
    auto conn = hdrs.get("connection");
    return conn and tolower(trim(*conn)) == "keep-alive";
}

/// ===========================================================================
///  Response assembler
/// ===========================================================================
auto http::detail::scan_head(std::string_view bytes) -> std::optional<head> {
    auto end = bytes.find(delimiter);
    if (end == std::string_view::npos) return std::nullopt;

    head hd;
    hd.body_offset = end + delimiter.size();

    std::optional<u64> content_length;
    bool chunked = false;
    bool no_body = false;

    /// Status line: the code is the second space-separated field.
    auto block = bytes.substr(0, end);
    auto eol = block.find(crlf);
    auto status_line = block.substr(0, eol);
    if (auto sp = status_line.find(' '); sp != std::string_view::npos) {
        auto code = status_line.substr(sp + 1);
        code = code.substr(0, code.find(' '));
        if (auto status = parse_decimal(code); status and bodiless(*status)) no_body = true;
    }

    /// Header lines.
    while (eol != std::string_view::npos) {
        block.remove_prefix(eol + crlf.size());
        eol = block.find(crlf);
        auto line = block.substr(0, eol);
        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        auto name = tolower(trim(line.substr(0, colon)));
        auto value = trim(line.substr(colon + 1));
        if (name == "content-length") content_length = parse_decimal(value);
        else if (name == "transfer-encoding") chunked = tolower(value).find("chunked") != std::string::npos;
    }

    if (no_body) hd.kind = framing::empty;
    else if (chunked) hd.kind = framing::chunked;
    else if (content_length) {
        hd.kind = *content_length == 0 ? framing::empty : framing::content_length;
        hd.length = *content_length;
    } else hd.kind = framing::until_close;
    return hd;
}

bool http::detail::body_complete(const head& hd, std::string_view bytes, usz& scan_from) {
    switch (hd.kind) {
        case framing::empty: return true;
        case framing::until_close: return false;
        case framing::content_length: return bytes.size() - hd.body_offset >= hd.length;
        case framing::chunked: {
            /// Start at the CRLF that ends the headers so that an empty
            /// body ("0\r\n\r\n") is found too.
            auto from = std::max(scan_from, hd.body_offset - crlf.size());
            if (bytes.find(last_chunk, from) != std::string_view::npos) return true;
            if (bytes.size() >= last_chunk.size()) scan_from = std::max(from, bytes.size() - last_chunk.size() + 1);
            return false;
        }
    }
    UNREACHABLE();
}

bool http::is_framed(std::string_view bytes) {
    auto hd = detail::scan_head(bytes);
    if (not hd) return false;
    usz scan_from = 0;
    return detail::body_complete(*hd, bytes, scan_from);
}

void http::assembler::connected() {
    bytes.clear();
    hd.reset();
    scan_from = 0;
    eof = false;
    st = phase::awaiting_headers;
}

auto http::assembler::update() -> phase {
    switch (st) {
        case phase::connecting:
            st = phase::awaiting_headers;
            [[fallthrough]];

        case phase::awaiting_headers:
            hd = detail::scan_head(bytes.str());
            if (not hd) return st;
            st = phase::awaiting_body;
            VERBOSE("Response headers complete after {} bytes", hd->body_offset);
            [[fallthrough]];

        case phase::awaiting_body:
            ASSERT(hd, "Awaiting body without a header block");
            if (detail::body_complete(*hd, bytes.str(), scan_from)) st = phase::complete;
            return st;

        case phase::complete:
        case phase::failed:
            return st;
    }
    UNREACHABLE();
}

auto http::assembler::feed(std::span<const char> data) -> phase {
    bytes.append(data);
    return update();
}

auto http::assembler::end_of_stream() -> phase {
    eof = true;
    switch (st) {
        case phase::connecting:
        case phase::awaiting_headers:
            st = phase::failed;
            if (bytes.empty()) throw parse_error("Connection closed before a response was received");
            if (bytes.str().find(crlf) == std::string_view::npos) throw parse_error("Invalid response format - no line endings found");
            throw parse_error("Invalid response format - no header/body delimiter found");

        /// Read-until-close bodies end here; so do truncated ones.
        case phase::awaiting_body:
            st = phase::complete;
            return st;

        case phase::complete:
        case phase::failed:
            return st;
    }
    return st;
}

auto http::assembler::take() -> response {
    if (st != phase::complete) throw parse_error("Response is not complete (state: {})", phase_to_str(st));
    return split_response(bytes.str());
}

auto http::split_response(std::string_view raw) -> response {
    if (raw.find(crlf) == std::string_view::npos) throw parse_error("Invalid response format - no line endings found");
    auto end = raw.find(delimiter);
    if (end == std::string_view::npos) throw parse_error("Invalid response format - no header/body delimiter found");

    response res;
    auto block = raw.substr(0, end);
    res.body = raw.substr(end + delimiter.size());

    /// Status line: version, code, and the rest is the explanation.
    auto eol = block.find(crlf);
    auto status_line = block.substr(0, eol);
    auto sp = status_line.find(' ');
    res.version = status_line.substr(0, sp);
    if (sp != std::string_view::npos) {
        auto rest = status_line.substr(sp + 1);
        auto sp2 = rest.find(' ');
        auto code = rest.substr(0, sp2);
        auto status = parse_decimal(code);
        if (not status or *status > std::numeric_limits<u32>::max()) throw parse_error("Invalid status code \"{}\"", code);
        res.status = u32(*status);
        if (sp2 != std::string_view::npos) res.explanation = rest.substr(sp2 + 1);
    } else {
        throw parse_error("Status line \"{}\" has no status code", status_line);
    }

    /// Headers. A line without a colon is a header with an empty value.
    while (eol != std::string_view::npos) {
        block.remove_prefix(eol + crlf.size());
        eol = block.find(crlf);
        auto line = block.substr(0, eol);
        auto colon = line.find(':');
        auto name = trim(line.substr(0, colon));
        if (name.empty()) continue;
        res.hdrs[name] = colon == std::string_view::npos ? std::string_view{} : trim(line.substr(colon + 1));
    }

    return res;
}

/// ===========================================================================
///  Content decoder
/// ===========================================================================
auto http::coding_of(std::string_view value) -> content_coding {
    auto enc = tolower(trim(value));
    if (enc.empty() or enc == "identity") return content_coding::identity;
    if (enc == "gzip" or enc == "x-gzip") return content_coding::gzip;
    if (enc == "deflate") return content_coding::deflate;
    return content_coding::other;
}

std::string http::decode_chunked(std::string_view input) {
    enum state_t {
        st_size_start,
        st_size,
        st_extension,
        st_lf_after_size,
        st_data,
        st_cr_after_data,
        st_lf_after_data,
    } state = st_size_start;

    std::string out;
    u64 len = 0;
    for (usz i = 0; i < input.size(); i++) {
        const char c = input[i];
        switch (state) {
            case st_size_start:
            case st_size: {
                if (auto d = xtonum(c); d >= 0) {
                    if (len > (std::numeric_limits<u64>::max() >> 4)) throw parse_error("Chunk size overflow");
                    len = len * 16 + u64(d);
                    state = st_size;
                    break;
                }

                if (state == st_size_start) throw parse_error("Invalid character in chunk size: '{}'", c);
                switch (c) {
                    case ';':
                    case ' ':
                    case '\t': state = st_extension; break;
                    case '\r': state = st_lf_after_size; break;
                    default: throw parse_error("Invalid character in chunk size: '{}'", c);
                }
            } break;

            /// Chunk extensions are skipped.
            case st_extension: {
                if (c == '\r') state = st_lf_after_size;
            } break;

            case st_lf_after_size: {
                if (c != '\n') throw parse_error("Expected LF after chunk size");

                /// Last chunk. Trailers, if any, are ignored.
                if (len == 0) return out;
                state = st_data;
            } break;

            case st_data: {
                auto n = std::min<u64>(len, input.size() - i);
                out.append(input.data() + i, n);
                len -= n;
                i += n - 1;
                if (len == 0) state = st_cr_after_data;
            } break;

            case st_cr_after_data: {
                if (c != '\r') throw parse_error("Expected CR after chunk data");
                state = st_lf_after_data;
            } break;

            case st_lf_after_data: {
                if (c != '\n') throw parse_error("Expected LF after chunk data");
                len = 0;
                state = st_size_start;
            } break;
        }
    }

    /// Truncated stream.
    return out;
}

std::string http::decompress(std::string_view data, content_coding coding) {
    int window_bits;
    switch (coding) {
        case content_coding::gzip: window_bits = 16 + MAX_WBITS; break;
        case content_coding::deflate: window_bits = MAX_WBITS; break;
        default: return std::string{data};
    }

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    if (inflateInit2(&stream, window_bits) != Z_OK) throw decode_error("inflateInit2() failed");
    defer { inflateEnd(&stream); };

    if (data.size() > std::numeric_limits<uInt>::max()) throw decode_error("Compressed body too large");
    stream.avail_in = uInt(data.size());
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));

    static constexpr usz step = 16 * 1024;
    std::string out;
    int ret;
    do {
        out.resize(out.size() + step);
        stream.avail_out = uInt(step);
        stream.next_out = reinterpret_cast<Bytef*>(out.data() + out.size() - step);
        ret = ::inflate(&stream, Z_NO_FLUSH);
        switch (ret) {
            case Z_NEED_DICT:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                throw decode_error("Failed to decompress response: {}", stream.msg ? stream.msg : "inflate() failed");
            default: break;
        }
        out.resize(out.size() - stream.avail_out);
    } while (ret != Z_STREAM_END and ret != Z_BUF_ERROR and (stream.avail_in > 0 or stream.avail_out == 0));

    if (ret != Z_STREAM_END) throw decode_error("Failed to decompress response: unexpected end of stream");
    return out;
}

void http::decode_body(response& res) {
    if (auto te = res.hdrs.get("transfer-encoding"); te and tolower(*te).find("chunked") != std::string::npos)
        res.body = decode_chunked(res.body);

    if (auto ce = res.hdrs.get("content-encoding")) {
        switch (auto coding = coding_of(*ce)) {
            case content_coding::gzip:
            case content_coding::deflate:
                res.body = decompress(res.body, coding);
                break;
            case content_coding::other:
                VERBOSE("Leaving body with Content-Encoding \"{}\" as is", *ce);
                break;
            case content_coding::identity:
                break;
        }
    }
}

/// ===========================================================================
///  Redirect resolver
/// ===========================================================================
auto http::redirect_target(const locator& current, const response& res, std::string_view fallback_host) -> std::optional<locator> {
    if (res.status < 300 or res.status >= 400) return std::nullopt;
    auto location = res.hdrs.get("location");
    if (not location) return std::nullopt;

    std::string target;
    if (location->find("://") != std::string::npos) {
        target = *location;
    } else {
        auto origin = current.default_port()
                        ? fmt::format("{}://{}", scheme_to_str(current.kind), current.host)
                        : fmt::format("{}://{}:{}", scheme_to_str(current.kind), current.host, current.port);

        if (location->starts_with('/')) {
            target = origin + *location;
        } else {
            /// The directory of the current path, including its last slash.
            const auto& path = current.path;
            auto dir = path.ends_with('/') ? std::string_view{path} : std::string_view{path}.substr(0, path.rfind('/') + 1);
            target = fmt::format("{}{}{}", origin, dir, *location);
        }
    }

    locator next{target, fallback_host};
    if (not next.remote()) throw parse_error("Refusing to redirect from {} to {}", current.to_string(), next.to_string());
    next.view_source = current.view_source;
    return next;
}
