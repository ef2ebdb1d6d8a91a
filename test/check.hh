#ifndef FETCH_TEST_CHECK_HH
#define FETCH_TEST_CHECK_HH

#include <exception>
#include <fetch/utils.hh>
#include <span>

#define check test_info{},

inline u64 tests_run = 0;
inline u64 tests_failed = 0;
inline std::exception_ptr error;

constexpr inline std::span<const char> operator"" _sp(const char* str, size_t sz) noexcept {
    return std::span<const char>{str, sz};
}

struct test_info {
    const char* file;
    const char* function;
    u32 line;
    explicit test_info(
        const char* file = __builtin_FILE(),
        const char* function = __builtin_FUNCTION(),
        u32 line = __builtin_LINE()
    ) : file(file), function(function), line(line) {}

    void operator,(bool condition) {
        ++tests_run;
        if (!condition) {
            ++tests_failed;
            fmt::print(stderr, "\033[33m{}:{} in function \033[32m{}\033[33m:\033[1;31m test failed\033[m", file, line, function);
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
};

/// Run an expression and report whether it threw an exception of type \c ex.
template <typename ex, typename callable>
bool throws(callable&& f) {
    try {
        f();
        return false;
    } catch (const ex&) {
        return true;
    } catch (const std::exception&) {
        error = std::current_exception();
        return false;
    }
}

/// Print results and return the exit code.
inline int summary() {
    fmt::print(stderr, "\033[33mSUMMARY:\n"
                       "  Tests run:    {}\n"
                       "  Tests \033[32mpassed\033[33m: \033[32m{}\033[33m\n"
                       "  Tests \033[31mfailed\033[33m: \033[31m{}\033[33m\n",
               tests_run, tests_run - tests_failed, tests_failed);
    return tests_failed ? 1 : 0;
}

#endif // FETCH_TEST_CHECK_HH
