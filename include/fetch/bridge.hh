#ifndef FETCH_BRIDGE_HH
#define FETCH_BRIDGE_HH

#include "engine.hh"
#include "execution/exec_context.hh"

#include <functional>
#include <nlohmann/json.hpp>

namespace fetch {
/// Ask for a resource. Wire form: {"url": "..."}.
struct load_request {
    std::string url;
};

/// Outcome of a load_request.
///
/// Wire form: {"success": true, "content": "..."} or
/// {"success": false, "error": "..."}.
struct load_result {
    bool success = false;
    std::string content;
    std::string error;

    [[nodiscard]] static load_result ok(std::string content) { return {true, std::move(content), {}}; }
    [[nodiscard]] static load_result failure(std::string message) { return {false, {}, std::move(message)}; }
};

void to_json(nlohmann::json& j, const load_request& req);
void from_json(const nlohmann::json& j, load_request& req);
void to_json(nlohmann::json& j, const load_result& res);
void from_json(const nlohmann::json& j, load_result& res);

/// Read engine options from JSON. Missing keys keep their defaults.
void from_json(const nlohmann::json& j, config& cfg);
void to_json(nlohmann::json& j, const config& cfg);

/// Turn what a user typed into a locator.
///
/// Anything that doesn’t start with <letters>:// and isn’t a data:,
/// file: or view-source: locator gets https:// in front.
[[nodiscard]] std::string normalise_input(std::string_view text);

/// Serve one request. Never throws: every error becomes a failed result.
[[nodiscard]] load_result handle(engine& e, const load_request& req);

/// Serves load requests on a pool of worker threads.
///
/// All requests share one engine, and thus one connection pool and one
/// response cache.
class loader {
public:
    using reply_fn = std::function<void(load_result)>;

private:
    engine eng;

    /// Declared last so that the workers are joined before the engine goes.
    execution_context ctx;

public:
    explicit loader(config cfg = {}, usz threads = 2) : eng(std::move(cfg)), ctx(threads) {}
    nocopy(loader);
    nomove(loader);

    /// Run a request on a worker thread and call \c reply with the result there.
    void post(load_request req, reply_fn reply);

    /// Answer one JSON-encoded request on the calling thread.
    ///
    /// \return The JSON-encoded result. Malformed messages get a failed result.
    [[nodiscard]] std::string handle(std::string_view message);

    [[nodiscard]] engine& backend() { return eng; }
};
} // namespace fetch

#endif // FETCH_BRIDGE_HH
