#pragma once
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstdio>
#include <exception>
#include <format>
#include <functional>
#include <optional>
#include <print>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "log.hpp"

namespace morphcore::test {

// ---------------------------------------------------------------------------
// Registry and run state
// ---------------------------------------------------------------------------

namespace color {
    inline constexpr const char* green  = "\033[32m";
    inline constexpr const char* red    = "\033[31m";
    inline constexpr const char* yellow = "\033[33m";
    inline constexpr const char* reset  = "\033[0m";
    inline constexpr const char* bold   = "\033[1m";
} // namespace color

struct TestCase {
    std::string_view name;
    std::string_view file;
    int line;
    std::function<void()> func;
};

/// Thrown by REQUIRE* to abandon the current test case.
struct TestFailure {};

struct Context {
    int passed = 0;
    int failed = 0;
    int checks = 0;
    bool current_failed = false;
    bool use_color = true;
    bool verbose = false;
    std::string filter;
};

inline std::vector<TestCase>& registry()
{
    static std::vector<TestCase> r;
    return r;
}

inline Context& ctx()
{
    static Context c;
    return c;
}

inline const char* col(const char* code)
{
    return ctx().use_color ? code : "";
}

template <typename T>
std::string to_string_val(const T& v)
{
    if constexpr (std::formattable<T, char>) {
        return std::format("{}", v);
    } else if constexpr (std::is_enum_v<T>) {
        return std::format("{}", static_cast<long long>(v));
    } else {
        return "<non-printable>";
    }
}

template <>
inline std::string to_string_val<ErrorCode>(const ErrorCode& v)
{
    return std::string(error_code_name(v));
}

// ---------------------------------------------------------------------------
// Assertion reporting
// ---------------------------------------------------------------------------

inline void fail_assert(const char* expr, std::string_view lhs, std::string_view rhs,
                        std::source_location loc)
{
    ctx().current_failed = true;
    std::println(stderr, "    {}{}:{}{}: {}check failed: {}{}",
                 col(color::bold), loc.file_name(), loc.line(), col(color::reset),
                 col(color::red), expr, col(color::reset));
    if (!lhs.empty() || !rhs.empty()) {
        std::println(stderr, "      lhs = {}", lhs);
        std::println(stderr, "      rhs = {}", rhs);
    }
}

inline void pass_assert(const char* expr, std::source_location loc)
{
    ++ctx().checks;
    if (ctx().verbose) {
        std::println("    {}PASS{}: {} ({}:{})", col(color::green), col(color::reset),
                     expr, loc.file_name(), loc.line());
    }
}

/// Record the outcome of one check; a failed fatal check ends the test case.
inline void report(bool ok, const char* expr, std::string_view lhs, std::string_view rhs,
                   bool fatal, std::source_location loc)
{
    if (ok) {
        pass_assert(expr, loc);
        return;
    }
    fail_assert(expr, lhs, rhs, loc);
    if (fatal) throw TestFailure{};
}

/// Run @p fn and return the ErrorCode it threw, or nothing if it returned
/// normally. Other exception types propagate.
template <typename F>
std::optional<ErrorCode> thrown_code(F&& fn)
{
    try {
        std::invoke(std::forward<F>(fn));
    } catch (const Error& e) {
        return e.code();
    }
    return std::nullopt;
}

struct AutoRegister {
    AutoRegister(std::string_view name, std::function<void()> func,
                 std::source_location loc = std::source_location::current())
    {
        registry().push_back({name, loc.file_name(), static_cast<int>(loc.line()),
                              std::move(func)});
    }
};

// ---------------------------------------------------------------------------
// Runner
// ---------------------------------------------------------------------------

inline int run_all(int argc = 0, const char** argv = nullptr)
{
    auto& c = ctx();

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.starts_with("--filter=")) {
            c.filter = std::string(arg.substr(9));
        } else if (arg == "--no-color") {
            c.use_color = false;
        } else if (arg == "--verbose") {
            c.verbose = true;
        } else if (arg == "--list") {
            for (const auto& tc : registry())
                std::println("{}", tc.name);
            return 0;
        }
    }

    // Library diagnostics would interleave with the report.
    if (!c.verbose) {
        Logger::set_stderr(false);
    }

    std::vector<const TestCase*> to_run;
    for (const auto& tc : registry()) {
        if (c.filter.empty() || tc.name.find(c.filter) != std::string_view::npos) {
            to_run.push_back(&tc);
        }
    }

    std::println("{}[==========]{} Running {} test{}", col(color::bold), col(color::reset),
                 to_run.size(), to_run.size() == 1 ? "" : "s");

    const auto wall_start = std::chrono::steady_clock::now();

    for (const auto* tc : to_run) {
        std::println("{}[ RUN      ]{} {}", col(color::green), col(color::reset), tc->name);
        c.current_failed = false;
        const auto t0 = std::chrono::steady_clock::now();

        try {
            tc->func();
        } catch (const TestFailure&) {
            // already reported
        } catch (const std::exception& e) {
            c.current_failed = true;
            std::println(stderr, "    {}Unhandled exception{}: {}", col(color::red),
                         col(color::reset), e.what());
        }

        const double ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();

        if (c.current_failed) {
            ++c.failed;
            std::println("{}[  FAILED  ]{} {} ({:.1f}ms) {}:{}", col(color::red),
                         col(color::reset), tc->name, ms, tc->file, tc->line);
        } else {
            ++c.passed;
            std::println("{}[       OK ]{} {} ({:.1f}ms)", col(color::green),
                         col(color::reset), tc->name, ms);
        }
    }

    const double total_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - wall_start).count();

    std::println("{}[==========]{} {}{} passed{}, {}{} failed{}, {} checks ({:.1f}ms total)",
                 col(color::bold), col(color::reset),
                 col(color::green), c.passed, col(color::reset),
                 c.failed ? col(color::red) : col(color::green), c.failed, col(color::reset),
                 c.checks, total_ms);

    return c.failed > 0 ? 1 : 0;
}

} // namespace morphcore::test

// ===========================================================================
// Macros
// ===========================================================================

#define MORPHCORE_TEST_CAT2(a, b) a##b
#define MORPHCORE_TEST_CAT(a, b) MORPHCORE_TEST_CAT2(a, b)

// One TEST_CASE per line: the identifiers are keyed on __LINE__.
#define TEST_CASE(tname)                                                       \
    static void MORPHCORE_TEST_CAT(morphcore_test_func_, __LINE__)();          \
    static ::morphcore::test::AutoRegister                                     \
        MORPHCORE_TEST_CAT(morphcore_test_reg_, __LINE__)(                     \
            tname, MORPHCORE_TEST_CAT(morphcore_test_func_, __LINE__));        \
    static void MORPHCORE_TEST_CAT(morphcore_test_func_, __LINE__)()

#define SECTION(sname)                                                         \
    if (::morphcore::test::ctx().verbose)                                      \
        std::println("  {}-- {}{}",                                            \
                     ::morphcore::test::col(::morphcore::test::color::yellow), \
                     sname,                                                    \
                     ::morphcore::test::col(::morphcore::test::color::reset)); \
    if (true)

#define STATIC_REQUIRE(expr) static_assert(expr, "STATIC_REQUIRE(" #expr ") failed")

// ---------------------------------------------------------------------------
// Boolean and comparison checks
// ---------------------------------------------------------------------------

#define MORPHCORE_BOOL_ASSERT(expr, fatal)                                     \
    ::morphcore::test::report(static_cast<bool>(expr), #expr, "", "", fatal,   \
                              std::source_location::current())

#define REQUIRE(expr) MORPHCORE_BOOL_ASSERT(expr, true)
#define CHECK(expr)   MORPHCORE_BOOL_ASSERT(expr, false)

#define MORPHCORE_CMP_ASSERT(a, b, op, fatal)                                  \
    do {                                                                       \
        const auto _morphcore_a = (a);                                         \
        const auto _morphcore_b = (b);                                         \
        const bool _morphcore_ok = (_morphcore_a op _morphcore_b);             \
        ::morphcore::test::report(                                             \
            _morphcore_ok, #a " " #op " " #b,                                  \
            _morphcore_ok ? "" : ::morphcore::test::to_string_val(_morphcore_a), \
            _morphcore_ok ? "" : ::morphcore::test::to_string_val(_morphcore_b), \
            fatal, std::source_location::current());                           \
    } while (0)

#define REQUIRE_EQ(a, b) MORPHCORE_CMP_ASSERT(a, b, ==, true)
#define CHECK_EQ(a, b)   MORPHCORE_CMP_ASSERT(a, b, ==, false)
#define REQUIRE_NE(a, b) MORPHCORE_CMP_ASSERT(a, b, !=, true)
#define CHECK_NE(a, b)   MORPHCORE_CMP_ASSERT(a, b, !=, false)
#define REQUIRE_LT(a, b) MORPHCORE_CMP_ASSERT(a, b, <,  true)
#define CHECK_LT(a, b)   MORPHCORE_CMP_ASSERT(a, b, <,  false)
#define REQUIRE_GT(a, b) MORPHCORE_CMP_ASSERT(a, b, >,  true)
#define CHECK_GT(a, b)   MORPHCORE_CMP_ASSERT(a, b, >,  false)
#define REQUIRE_LE(a, b) MORPHCORE_CMP_ASSERT(a, b, <=, true)
#define CHECK_LE(a, b)   MORPHCORE_CMP_ASSERT(a, b, <=, false)
#define REQUIRE_GE(a, b) MORPHCORE_CMP_ASSERT(a, b, >=, true)
#define CHECK_GE(a, b)   MORPHCORE_CMP_ASSERT(a, b, >=, false)

#define MORPHCORE_NEAR_ASSERT(a, b, eps, fatal)                                \
    do {                                                                       \
        const auto _morphcore_a = static_cast<double>(a);                      \
        const auto _morphcore_b = static_cast<double>(b);                      \
        const bool _morphcore_ok =                                             \
            std::fabs(_morphcore_a - _morphcore_b) <= static_cast<double>(eps);\
        ::morphcore::test::report(                                             \
            _morphcore_ok, #a " ~= " #b " (eps=" #eps ")",                     \
            ::morphcore::test::to_string_val(_morphcore_a),                    \
            ::morphcore::test::to_string_val(_morphcore_b),                    \
            fatal, std::source_location::current());                           \
    } while (0)

#define REQUIRE_NEAR(a, b, eps) MORPHCORE_NEAR_ASSERT(a, b, eps, true)
#define CHECK_NEAR(a, b, eps)   MORPHCORE_NEAR_ASSERT(a, b, eps, false)

// ---------------------------------------------------------------------------
// Exception checks
// ---------------------------------------------------------------------------

#define MORPHCORE_THROWS_ASSERT(expr, fatal)                                   \
    do {                                                                       \
        bool _morphcore_threw = false;                                         \
        try { (void)(expr); } catch (const std::exception&) { _morphcore_threw = true; } \
        ::morphcore::test::report(_morphcore_threw, #expr " throws", "", "",   \
                                  fatal, std::source_location::current());     \
    } while (0)

#define REQUIRE_THROWS(expr) MORPHCORE_THROWS_ASSERT(expr, true)
#define CHECK_THROWS(expr)   MORPHCORE_THROWS_ASSERT(expr, false)

#define MORPHCORE_THROWS_AS_ASSERT(expr, type, fatal)                          \
    do {                                                                       \
        bool _morphcore_threw = false;                                         \
        try { (void)(expr); } catch (const type&) { _morphcore_threw = true; } \
        ::morphcore::test::report(_morphcore_threw, #expr " throws " #type,    \
                                  "", "", fatal,                               \
                                  std::source_location::current());            \
    } while (0)

#define REQUIRE_THROWS_AS(expr, type) MORPHCORE_THROWS_AS_ASSERT(expr, type, true)
#define CHECK_THROWS_AS(expr, type)   MORPHCORE_THROWS_AS_ASSERT(expr, type, false)

// Expects a morphcore::Error carrying the given ErrorCode.
#define MORPHCORE_ERROR_ASSERT(expr, ecode, fatal)                             \
    do {                                                                       \
        const auto _morphcore_code =                                           \
            ::morphcore::test::thrown_code([&] { (void)(expr); });             \
        const bool _morphcore_ok = _morphcore_code == (ecode);                 \
        ::morphcore::test::report(                                             \
            _morphcore_ok, #expr " fails with " #ecode,                        \
            _morphcore_code ? ::morphcore::test::to_string_val(*_morphcore_code) \
                            : std::string("no error"),                         \
            ::morphcore::test::to_string_val(ecode),                           \
            fatal, std::source_location::current());                           \
    } while (0)

#define REQUIRE_ERROR(expr, ecode) MORPHCORE_ERROR_ASSERT(expr, ecode, true)
#define CHECK_ERROR(expr, ecode)   MORPHCORE_ERROR_ASSERT(expr, ecode, false)

#define MORPHCORE_TEST_MAIN()                                                  \
    int main(int argc, const char** argv)                                      \
    {                                                                          \
        return ::morphcore::test::run_all(argc, argv);                         \
    }
