#include <fetch/local.hh>

#include <cerrno>
#include <fcntl.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <unistd.h>

std::string fetch::load_data(std::string_view contents) {
    auto comma = contents.find(',');
    if (comma == std::string_view::npos) return {};

    auto media_type = tolower(trim(contents.substr(0, comma)));
    auto payload = percent_decode(contents.substr(comma + 1));
    if (media_type.ends_with(";base64")) return base64_decode(payload);
    return payload;
}

std::string fetch::percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (usz i = 0; i < text.size(); i++) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }

        if (i + 2 >= text.size()) throw decode_error("Truncated escape sequence at offset {}", i);
        auto hi = xtonum(text[i + 1]), lo = xtonum(text[i + 2]);
        if (hi < 0 or lo < 0) throw decode_error("Invalid escape sequence \"{}\" at offset {}", text.substr(i, 3), i);
        out += char((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::string fetch::base64_decode(std::string_view text) {
    std::string in;
    in.reserve(text.size());
    for (char c : text)
        if (c != ' ' and c != '\t' and c != '\r' and c != '\n') in += c;

    if (in.empty()) return {};
    if (in.size() % 4) throw decode_error("Base64 payload length {} is not a multiple of 4", in.size());

    /// EVP_DecodeBlock() doesn’t account for padding; strip it ourselves.
    usz padding = 0;
    if (in.ends_with("==")) padding = 2;
    else if (in.ends_with('=')) padding = 1;

    std::string out(in.size() / 4 * 3, '\0');
    auto n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(in.data()), int(in.size()));
    if (n < 0) throw decode_error("Invalid base64 payload");
    out.resize(usz(n) - padding);
    return out;
}

std::string fetch::read_file(std::string_view path) {
    std::string name{path};
    int fd = ::open(name.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw file_read_error("Could not open \"{}\": {}", path, std::strerror(errno));
    defer { ::close(fd); };

    struct stat s {};
    if (::fstat(fd, &s)) throw file_read_error("fstat(\"{}\") failed: {}", path, std::strerror(errno));
    if (S_ISDIR(s.st_mode)) throw file_read_error("Could not read \"{}\": {}", path, std::strerror(EISDIR));

    std::string bytes;
    bytes.reserve(usz(s.st_size));
    char buf[16 * 1024];
    for (;;) {
        auto n = ::read(fd, buf, sizeof buf);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            throw file_read_error("Could not read \"{}\": {}", path, std::strerror(errno));
        }
        bytes.append(buf, usz(n));
    }

    return bytes;
}
