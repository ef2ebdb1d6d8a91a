#include "check.hh"

#include <fetch/locator.hh>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

#ifndef FETCH_TEST_DATA_DIR
#    define FETCH_TEST_DATA_DIR "test"
#endif

std::string_view scheme_name(fetch::scheme s) { return fetch::scheme_to_str(s); }

/// Parse a locator and compare it against the expected fields of a test case.
bool test_locator(const json& test) try {
    auto input = test["input"].get<std::string>();

    if (test.contains("error")) {
        auto expected = test["error"].get<std::string>();
        try {
            (void) fetch::locator::parse(input);
            return false;
        } catch (const fetch::error& e) {
            if (fetch::error_kind_to_str(e.kind()) != expected) {
                error = std::current_exception();
                return false;
            }
        }

        /// The fail-soft constructor turns it into the fallback resource.
        return fetch::locator{input} == fetch::locator::fallback();
    }

    auto loc = fetch::locator::parse(input);
    return scheme_name(loc.kind) == test["scheme"].get<std::string>()
           and loc.host == test["host"].get<std::string>()
           and loc.port == test["port"].get<i32>()
           and loc.path == test["path"].get<std::string>()
           and loc.view_source == test.value("view_source", false);
} catch (const std::exception& e) {
    error = std::current_exception();
    return false;
}

void test_fallback() {
    auto fallback = fetch::locator::fallback();
    check fallback.kind == fetch::scheme::https;
    check fallback.host == "browser.engineering";
    check fallback.port == 443;
    check fallback.path == "/";
    check not fallback.view_source;

    /// Custom default host.
    auto custom = fetch::locator{"not a url", "example.org"};
    check custom.host == "example.org";
    check custom.to_string() == "https://example.org/";
}

void test_view_source() {
    auto plain = fetch::locator::parse("https://example.com/page");
    auto source = fetch::locator::parse("view-source:https://example.com/page");
    check source.view_source;
    check source.kind == plain.kind and source.host == plain.host and source.port == plain.port and source.path == plain.path;
    check source != plain;
    check source.authority() == plain.authority();
}

void test_rendering() {
    check fetch::locator::parse("http://example.com/a").authority() == "http://example.com:80";
    check fetch::locator::parse("https://example.com:8443/a").authority() == "https://example.com:8443";
    check fetch::locator::parse("https://example.com/a/b").to_string() == "https://example.com/a/b";
    check fetch::locator::parse("http://example.com:8080/x").to_string() == "http://example.com:8080/x";
    check fetch::locator::parse("data:text/plain,hi").to_string() == "data:text/plain,hi";
    check fetch::locator::parse("file:///etc/hosts").to_string() == "file:///etc/hosts";

    check fetch::locator::parse("http://example.com").default_port();
    check not fetch::locator::parse("http://example.com:443").default_port();
    check fetch::locator::parse("https://example.com").remote();
    check not fetch::locator::parse("data:,x").remote();
}

int main() {
    test_fallback();
    test_view_source();
    test_rendering();

    auto path = FETCH_TEST_DATA_DIR "/locators.json";
    auto file = fopen(path, "r");
    if (file) {
        defer { fclose(file); };
        auto input = json::parse(file);

        for (auto& test : input) {
            if (not test.is_object()) continue;
            ++tests_run;
            if (not test_locator(test)) {
                ++tests_failed;
                fmt::print(stderr, "\033[33m[Locator] \033[1;31mfailed\033[m \033[33m{}\033[m", test["input"].get<std::string>());
                if (error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        fmt::print(stderr, "\033[1;31m: \033[0;31m{}\033[m", e.what());
                    }
                }
                fmt::print(stderr, "\n");
            }
            error = {};
        }
    } else {
        err("Failed to open {}", path);
        ++tests_run;
        ++tests_failed;
    }

    return summary();
}
