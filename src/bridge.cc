#include <fetch/bridge.hh>

using json = nlohmann::json;

void fetch::to_json(json& j, const load_request& req) {
    j = json{{"url", req.url}};
}

void fetch::from_json(const json& j, load_request& req) {
    j.at("url").get_to(req.url);
}

void fetch::to_json(json& j, const load_result& res) {
    if (res.success) j = json{{"success", true}, {"content", res.content}};
    else j = json{{"success", false}, {"error", res.error}};
}

void fetch::from_json(const json& j, load_result& res) {
    j.at("success").get_to(res.success);
    res.content = res.success ? j.value("content", "") : "";
    res.error = res.success ? "" : j.value("error", "");
}

void fetch::from_json(const json& j, config& cfg) {
    cfg.default_host = j.value("default_host", cfg.default_host);
    cfg.user_agent = j.value("user_agent", cfg.user_agent);
    cfg.max_redirects = j.value("max_redirects", cfg.max_redirects);
    cfg.connect_timeout = std::chrono::milliseconds{j.value("connect_timeout_ms", cfg.connect_timeout.count())};
    cfg.read_timeout = std::chrono::milliseconds{j.value("read_timeout_ms", cfg.read_timeout.count())};
    cfg.use_cache = j.value("use_cache", cfg.use_cache);
    cfg.keep_alive = j.value("keep_alive", cfg.keep_alive);

    if (j.contains("cache_scope")) {
        auto scope = j.at("cache_scope").get<std::string>();
        if (scope == "authority") cfg.scope = cache_scope::authority;
        else if (scope == "resource") cfg.scope = cache_scope::resource;
        else throw std::invalid_argument(fmt::format("Unknown cache_scope \"{}\"", scope));
    }
}

void fetch::to_json(json& j, const config& cfg) {
    j = json{
        {"default_host", cfg.default_host},
        {"user_agent", cfg.user_agent},
        {"max_redirects", cfg.max_redirects},
        {"connect_timeout_ms", cfg.connect_timeout.count()},
        {"read_timeout_ms", cfg.read_timeout.count()},
        {"use_cache", cfg.use_cache},
        {"keep_alive", cfg.keep_alive},
        {"cache_scope", cfg.scope == cache_scope::resource ? "resource" : "authority"},
    };
}

std::string fetch::normalise_input(std::string_view text) {
    auto input = trim(text);
    for (auto prefix : {"data:", "file:", "view-source:"})
        if (input.starts_with(prefix)) return std::string{input};

    /// <letters>://
    usz i = 0;
    while (i < input.size() and std::isalpha(u8(input[i]))) i++;
    if (i > 0 and input.substr(i).starts_with("://")) return std::string{input};
    return fmt::format("https://{}", input);
}

auto fetch::handle(engine& e, const load_request& req) -> load_result {
    try {
        return load_result::ok(e.load(normalise_input(req.url)));
    } catch (const error& ex) {
        err("Failed to load {}: {} ({})", req.url, ex.what(), error_kind_to_str(ex.kind()));
        return load_result::failure(ex.what());
    } catch (const std::exception& ex) {
        err("Failed to load {}: {}", req.url, ex.what());
        return load_result::failure(ex.what());
    }
}

void fetch::loader::post(load_request req, reply_fn reply) {
    ctx.add_task([this, req = std::move(req), reply = std::move(reply)] {
        reply(fetch::handle(eng, req));
    });
}

std::string fetch::loader::handle(std::string_view message) {
    load_request req;
    try {
        req = json::parse(message).get<load_request>();
    } catch (const json::exception& e) {
        err("Malformed load request: {}", e.what());
        return json(load_result::failure(fmt::format("Malformed request: {}", e.what()))).dump();
    }

    return json(fetch::handle(eng, req)).dump();
}
