#pragma once

/// clustermc test framework: single-header C++23 test harness
/// Usage:
///   TEST(test_name) { ASSERT_EQ(1, 1); }
///   RUN_TESTS()
///
/// The test binary accepts name filters: `test_x discovery_` runs only the
/// tests whose name contains "discovery_".

#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <sstream>
#include <system_error>

namespace clustermc::test {

struct test_case {
    std::string name;
    std::function<void()> fn;
};

inline std::vector<test_case>& registry() {
    static std::vector<test_case> cases;
    return cases;
}

inline int& failure_count() {
    static int n = 0;
    return n;
}

inline int& total_count() {
    static int n = 0;
    return n;
}

struct registrar {
    registrar(std::string name, std::function<void()> fn) {
        registry().push_back({std::move(name), std::move(fn)});
    }
};

inline bool selected(const test_case& tc, int argc, char** argv) {
    if (argc <= 1) return true;
    for (int i = 1; i < argc; ++i)
        if (tc.name.find(argv[i]) != std::string::npos) return true;
    return false;
}

inline int run_all(int argc = 0, char** argv = nullptr) {
    int passed = 0;
    int failed = 0;

    std::vector<const test_case*> cases;
    for (auto& tc : registry())
        if (selected(tc, argc, argv)) cases.push_back(&tc);

    std::cout << "[==========] Running " << cases.size() << " test(s).\n";

    for (auto* tc : cases) {
        std::cout << "[ RUN      ] " << tc->name << "\n";
        failure_count() = 0;
        total_count() = 0;

        try {
            tc->fn();
        } catch (const std::exception& e) {
            std::cerr << "  EXCEPTION: " << e.what() << "\n";
            ++failure_count();
        } catch (...) {
            std::cerr << "  UNKNOWN EXCEPTION\n";
            ++failure_count();
        }

        if (failure_count() == 0) {
            std::cout << "[       OK ] " << tc->name << "\n";
            ++passed;
        } else {
            std::cout << "[  FAILED  ] " << tc->name
                      << " (" << failure_count() << " failure(s))\n";
            ++failed;
        }
    }

    std::cout << "[==========] " << (passed + failed) << " test(s) ran.\n";
    std::cout << "[  PASSED  ] " << passed << " test(s).\n";
    if (failed > 0)
        std::cout << "[  FAILED  ] " << failed << " test(s).\n";

    return failed > 0 ? 1 : 0;
}

namespace detail {

inline void assert_fail(const std::string& expr, const char* file, int line) {
    std::cerr << "  ASSERT FAILED: " << expr
              << " at " << file << ":" << line << "\n";
    ++failure_count();
}

template <typename A, typename B>
void assert_eq_impl(const A& a, const B& b,
                    const char* a_expr, const char* b_expr,
                    const char* file, int line) {
    ++total_count();
    if (!(a == b)) {
        std::ostringstream oss;
        oss << a_expr << " == " << b_expr
            << " (got: " << a << " vs " << b << ")";
        assert_fail(oss.str(), file, line);
    }
}

template <typename A, typename B>
void assert_ne_impl(const A& a, const B& b,
                    const char* a_expr, const char* b_expr,
                    const char* file, int line) {
    ++total_count();
    if (a == b) {
        std::ostringstream oss;
        oss << a_expr << " != " << b_expr << " (both equal)";
        assert_fail(oss.str(), file, line);
    }
}

/// For std::expected<T, E> where E has code() (clustermc::error) or is an error_code
template <typename E>
auto code_of(const E& e) -> std::error_code {
    if constexpr (std::is_same_v<E, std::error_code>)
        return e;
    else
        return e.code();
}

template <typename Expected>
void assert_ok_impl(const Expected& r, const char* expr, const char* file, int line) {
    ++total_count();
    if (!r.has_value()) {
        auto ec = code_of(r.error());
        assert_fail(std::string(expr) + " should succeed (got error: "
                    + ec.category().name() + ": " + ec.message() + ")", file, line);
    }
}

template <typename Expected, typename Code>
void assert_err_impl(const Expected& r, Code expected_code,
                     const char* expr, const char* code_expr,
                     const char* file, int line) {
    ++total_count();
    if (r.has_value()) {
        assert_fail(std::string(expr) + " should fail with " + code_expr, file, line);
        return;
    }
    auto ec = code_of(r.error());
    std::error_code want;
    if constexpr (std::is_same_v<Code, std::error_code>)
        want = expected_code;
    else
        want = make_error_code(expected_code);   // ADL: the enum's own category
    if (ec != want) {
        assert_fail(std::string(expr) + " should fail with " + code_expr
                    + " (got: " + ec.category().name() + ": " + ec.message() + ")",
                    file, line);
    }
}

} // namespace detail

} // namespace clustermc::test

// =============================================================================
// Macros
// =============================================================================

#define TEST(name) \
    void test_##name(); \
    static clustermc::test::registrar reg_##name(#name, test_##name); \
    void test_##name()

#define ASSERT_TRUE(expr) \
    do { \
        ++clustermc::test::total_count(); \
        if (!(expr)) \
            clustermc::test::detail::assert_fail(#expr, __FILE__, __LINE__); \
    } while(0)

#define ASSERT_FALSE(expr) \
    do { \
        ++clustermc::test::total_count(); \
        if ((expr)) \
            clustermc::test::detail::assert_fail("!" #expr, __FILE__, __LINE__); \
    } while(0)

#define ASSERT_EQ(a, b) \
    clustermc::test::detail::assert_eq_impl((a), (b), #a, #b, __FILE__, __LINE__)

#define ASSERT_NE(a, b) \
    clustermc::test::detail::assert_ne_impl((a), (b), #a, #b, __FILE__, __LINE__)

/// std::expected holds a value
#define ASSERT_OK(expr) \
    clustermc::test::detail::assert_ok_impl((expr), #expr, __FILE__, __LINE__)

/// std::expected holds an error equal to code
#define ASSERT_ERR(expr, code) \
    clustermc::test::detail::assert_err_impl((expr), (code), #expr, #code, __FILE__, __LINE__)

#define ASSERT_THROWS(expr) \
    do { \
        ++clustermc::test::total_count(); \
        bool caught = false; \
        try { expr; } catch (...) { caught = true; } \
        if (!caught) \
            clustermc::test::detail::assert_fail(#expr " should throw", __FILE__, __LINE__); \
    } while(0)

#define RUN_TESTS() \
    int main(int argc, char** argv) { return clustermc::test::run_all(argc, argv); }
