#include <fetch/locator.hh>

namespace {
constexpr std::string_view data_prefix = "data:";
constexpr std::string_view file_prefix = "file:";
constexpr std::string_view view_source_prefix = "view-source:";
constexpr std::string_view scheme_separator = "://";

/// Parse the port after the colon in host:port.
i32 parse_port(std::string_view digits, std::string_view url) {
    if (digits.empty() or digits.size() > 5) throw fetch::malformed_url("Invalid port in \"{}\"", url);
    i32 port = 0;
    for (char c : digits) {
        if (c < '0' or c > '9') throw fetch::malformed_url("Invalid port in \"{}\"", url);
        port = port * 10 + (c - '0');
    }
    if (port == 0 or port > 65535) throw fetch::malformed_url("Port out of range in \"{}\"", url);
    return port;
}

fetch::locator local(fetch::scheme kind, std::string_view path) {
    fetch::locator loc;
    loc.kind = kind;
    loc.host.clear();
    loc.port = -1;
    loc.path = path;
    return loc;
}
} // namespace

fetch::locator::locator(std::string_view url, std::string_view fallback_host) {
    try {
        *this = parse(url);
    } catch (const error& e) {
        err("Malformed URL found, falling back to default: {}\n  URL was: {}", e.what(), url);
        *this = fallback(fallback_host);
    }
}

auto fetch::locator::parse(std::string_view url) -> locator {
    /// The payload isn’t split here; that happens when the data is loaded.
    if (url.starts_with(data_prefix)) return local(scheme::data, url.substr(data_prefix.size()));

    /// view-source:<locator>. The inner scheme, host, port and path are
    /// hoisted into the result.
    if (url.starts_with(view_source_prefix)) {
        auto inner = parse(url.substr(view_source_prefix.size()));
        inner.view_source = true;
        return inner;
    }

    auto sep = url.find(scheme_separator);
    if (sep == std::string_view::npos) {
        /// file:relative/path has no authority.
        if (url.starts_with(file_prefix)) return local(scheme::file, url.substr(file_prefix.size()));
        throw malformed_url("Missing \"://\" in \"{}\"", url);
    }

    auto name = tolower(url.substr(0, sep));
    auto rest = url.substr(sep + scheme_separator.size());

    if (name == "file") return local(scheme::file, rest);

    locator loc;
    if (name == "http") {
        loc.kind = scheme::http;
        loc.port = 80;
    } else if (name == "https") {
        loc.kind = scheme::https;
        loc.port = 443;
    } else {
        throw invalid_scheme("Invalid URL scheme \"{}\"", name);
    }

    /// A bare host always gets the path /.
    auto slash = rest.find('/');
    std::string_view host = slash == std::string_view::npos ? rest : rest.substr(0, slash);
    loc.path = slash == std::string_view::npos ? "/" : std::string{rest.substr(slash)};

    if (auto colon = host.find(':'); colon != std::string_view::npos) {
        loc.port = parse_port(host.substr(colon + 1), url);
        host = host.substr(0, colon);
    }

    if (host.empty()) throw malformed_url("Missing host in \"{}\"", url);
    loc.host = host;
    return loc;
}

auto fetch::locator::fallback(std::string_view host) -> locator {
    locator loc;
    loc.kind = scheme::https;
    loc.host = host;
    loc.port = 443;
    loc.path = "/";
    return loc;
}

std::string fetch::locator::authority() const {
    return fmt::format("{}://{}:{}", scheme_to_str(kind), host, port);
}

bool fetch::locator::default_port() const {
    switch (kind) {
        case scheme::http: return port == 80;
        case scheme::https: return port == 443;
        case scheme::file:
        case scheme::data: return port == -1;
    }
    return false;
}

std::string fetch::locator::to_string() const {
    switch (kind) {
        case scheme::data: return fmt::format("data:{}", path);
        case scheme::file: return fmt::format("file://{}", path);
        case scheme::http:
        case scheme::https:
            if (default_port()) return fmt::format("{}://{}{}", scheme_to_str(kind), host, path);
            return fmt::format("{}://{}:{}{}", scheme_to_str(kind), host, port, path);
    }
    return {};
}
