#ifndef FETCH_UTILS_HH
#define FETCH_UTILS_HH

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <cxxabi.h>
#include <execinfo.h>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <type_traits>
#include <unistd.h>

#define CAT_(X, Y) X##Y
#define CAT(X, Y)  CAT_(X, Y)

#define nocopy(type)            \
    type(const type&) = delete; \
    type& operator=(const type&) = delete

#define nomove(type)       \
    type(type&&) = delete; \
    type& operator=(type&&) = delete

#define ASSERT(condition, ...)                                                                               \
    do {                                                                                                     \
        if (!(condition))                                                                                    \
            assertion_error(#condition, FILENAME, __LINE__, __PRETTY_FUNCTION__ __VA_OPT__(, ) __VA_ARGS__); \
    } while (0)

#define FILENAME (this_file_name())

#define UNREACHABLE() ASSERT(false, "UNREACHABLE")

#ifndef NDEBUG
#    define VERBOSE(...) info(__VA_ARGS__)
#else
#    define VERBOSE(...) void()
#endif

#define defer auto CAT($$defer_struct_instance_, __COUNTER__) = defer_type_operator_lhs_instance % [&]

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;
typedef size_t usz;

inline FILE* log_stream;

[[gnu::constructor]] static void init_log_stream() {
    log_stream = stdout;
    fflush(log_stream);
    setbuf(log_stream, nullptr);
}

/// Get the current time as hh:mm:ss.mmm.
inline std::string current_time() {
    timespec ts{};
    tm tm{};
    clock_gettime(CLOCK_REALTIME, &ts);
    localtime_r(&ts.tv_sec, &tm);
    return fmt::format("{:02}:{:02}:{:02}.{:03}", tm.tm_hour, tm.tm_min, tm.tm_sec, ts.tv_nsec / 1000000);
}

template <typename... args_t>
inline void info(fmt::format_string<args_t...> fmt_str, args_t&&... args) {
    fmt::print(log_stream, "\033[33m[{}] Info: ", current_time());
    fmt::print(log_stream, fmt_str, std::forward<args_t>(args)...);
    fmt::print(log_stream, "\033[m\n");
}

template <typename callable_t>
struct defer_type {
    using callable_type = callable_t;
    const callable_type function;
    explicit defer_type(callable_t _function) : function(_function) {}
    inline ~defer_type() { function(); }
    nocopy(defer_type);
    nomove(defer_type);
};

struct defer_type_operator_lhs {
    template <typename callable_t>
    auto operator%(callable_t rhs) -> defer_type<callable_t> { return defer_type<callable_t>(rhs); }
};
inline defer_type_operator_lhs defer_type_operator_lhs_instance;

constexpr const char* extract_file_name(const char* fname) {
    const char *ptr = __builtin_strchr(fname, '/'), *last = ptr;
    if (!last) return fname;
    while (last) {
        ptr = last;
        last = __builtin_strchr(last + 1, '/');
    }
    return ptr + 1;
}

consteval const char* this_file_name(const char* fname = __builtin_FILE()) {
    return extract_file_name(fname);
}

/// Get the current stacktrace.
inline std::string current_stacktrace() {
    void* buffer[15];
    auto nptrs = backtrace(buffer, 15);

    char** strings = backtrace_symbols(buffer, nptrs);
    if (strings == nullptr) return "";
    defer { free(strings); };

    /// __cxa_demangle() may realloc() this, so it has to come from malloc().
    char* demangled_name = (char*) malloc(1024);
    defer { free(demangled_name); };

    std::string s;
    for (int i = 2; i < nptrs; i++) {
        /// The mangled name is between '(', and '+'.
        auto mangled_name = strings[i];
        auto left = std::strchr(mangled_name, '(');
        if (left == nullptr) {
            s += fmt::format("{}\n", strings[i]);
            continue;
        }

        left++;
        auto right = std::strchr(left, '+');
        if (right == nullptr || left == right) {
            s += fmt::format("{}\n", strings[i]);
            continue;
        }
        *right = '\0';

        int status;
        size_t length = 1024;
        auto* ret = abi::__cxa_demangle(left, demangled_name, &length, &status);
        *right = '+';
        if (status == 0) {
            demangled_name = ret;
            s.append(mangled_name, u64(left - mangled_name));
            s.append(demangled_name);
            s.append(right);
            s += '\n';
        } else s += fmt::format("{}\n", strings[i]);
    }

    return s;
}

template <typename... args_t>
inline void err(fmt::format_string<args_t...> fmt_str, args_t&&... args) {
    fmt::print(log_stream, "\033[31m[{}] Error: ", current_time());
    fmt::print(log_stream, fmt_str, std::forward<args_t>(args)...);
#ifndef NDEBUG
    fmt::print(log_stream, "\n{}", current_stacktrace());
#endif
    fmt::print(log_stream, "\033[m\n");
}

template <typename... args_t>
[[noreturn]] inline void die(fmt::format_string<args_t...> fmt_str, args_t&&... args) {
    fmt::print(log_stream, "\033[1;31m[{}] Fatal: ", current_time());
    fmt::print(log_stream, fmt_str, std::forward<args_t>(args)...);
#ifndef NDEBUG
    fmt::print(log_stream, "\n{}", current_stacktrace());
#endif
    fmt::print(log_stream, "\033[m\n");
    std::exit(1);
}

template <typename... args_t>
[[noreturn]] void assertion_error(const std::string& cond_mess, const char* file, int line, const char* pretty_function, fmt::format_string<args_t...> fmt_str = "", args_t&&... args) {
    fmt::print(log_stream, "Assertion Error\n"
                           "    In internal file {}:{}\n"
                           "    In function {}\n"
                           "    Assertion failed: {}\n",
               file, line, pretty_function, cond_mess);
    auto str = fmt::format(fmt_str, std::forward<args_t>(args)...);
    if (!str.empty()) fmt::print(log_stream, "    Message: {}\n", str);
    fmt::print(log_stream, "    Stack trace:\n{}", current_stacktrace());
    _Exit(1);
}

/// Convert a string to lowercase.
inline std::string tolower(std::string_view str) {
    std::string res;
    res.resize(str.size());
    std::ranges::transform(str, res.begin(), [](char c) { return char(std::tolower(u8(c))); });
    return res;
}

/// Strip spaces and tabs from both ends of a string.
constexpr std::string_view trim(std::string_view str) {
    while (not str.empty() and (str.front() == ' ' or str.front() == '\t')) str.remove_prefix(1);
    while (not str.empty() and (str.back() == ' ' or str.back() == '\t')) str.remove_suffix(1);
    return str;
}

/// Value of a hex digit, or -1 if it isn’t one.
constexpr inline i8 xtonum(char c) {
    if (c >= '0' and c <= '9') return static_cast<i8>(c - '0');
    else if (c >= 'A' and c <= 'F') return static_cast<i8>(c - 'A') + 10;
    else if (c >= 'a' and c <= 'f') return static_cast<i8>(c - 'a') + 10;
    else return -1;
}

#endif // FETCH_UTILS_HH
