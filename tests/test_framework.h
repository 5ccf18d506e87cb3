/*
 * Minimal test harness
 *
 * Each test file is its own executable: TEST() bodies register themselves,
 * main() calls run_all_tests(), and the exit code tells CTest the result.
 * A failed ASSERT throws out of the test body.
 */

#ifndef TEST_FRAMEWORK_H
#define TEST_FRAMEWORK_H

#include <cmath>
#include <cstdio>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test_framework {

using TestFunc = std::function<void()>;

inline std::vector<std::pair<std::string, TestFunc>>& registry() {
    static std::vector<std::pair<std::string, TestFunc>> tests;
    return tests;
}

struct Registrar {
    Registrar(const char* name, TestFunc func) {
        registry().push_back(std::make_pair(std::string(name), func));
    }
};

template <typename A, typename B>
std::string describe_mismatch(const char* expr_a, const char* expr_b, const A& a, const B& b,
                              const char* file, int line) {
    std::ostringstream os;
    os << file << ":" << line << ": ASSERT_EQ(" << expr_a << ", " << expr_b << ") got "
       << a << " vs " << b;
    return os.str();
}

inline std::string location(const char* what, const char* file, int line) {
    std::ostringstream os;
    os << file << ":" << line << ": " << what;
    return os.str();
}

inline int run_all_tests(const char* suite) {
    int passed = 0;
    int failed = 0;

    fprintf(stderr, "=== %s ===\n", suite);
    for (auto& test : registry()) {
        try {
            test.second();
            passed++;
            fprintf(stderr, "[ PASS ] %s\n", test.first.c_str());
        } catch (const std::exception& e) {
            failed++;
            fprintf(stderr, "[ FAIL ] %s\n         %s\n", test.first.c_str(), e.what());
        }
    }

    fprintf(stderr, "%d passed, %d failed\n", passed, failed);
    return failed > 0 ? 1 : 0;
}

} // namespace test_framework

#define TEST(name) \
    static void test_##name(); \
    static test_framework::Registrar registrar_##name(#name, test_##name); \
    static void test_##name()

#define ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            throw std::runtime_error(test_framework::location("ASSERT_TRUE(" #expr ")", __FILE__, __LINE__)); \
        } \
    } while (0)

#define ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            throw std::runtime_error(test_framework::location("ASSERT_FALSE(" #expr ")", __FILE__, __LINE__)); \
        } \
    } while (0)

#define ASSERT_EQ(a, b) \
    do { \
        auto va_ = (a); \
        auto vb_ = (b); \
        if (!(va_ == vb_)) { \
            throw std::runtime_error(test_framework::describe_mismatch(#a, #b, va_, vb_, __FILE__, __LINE__)); \
        } \
    } while (0)

#define ASSERT_NEAR(a, b, tolerance) \
    do { \
        if (std::fabs(static_cast<double>(a) - static_cast<double>(b)) > (tolerance)) { \
            throw std::runtime_error(test_framework::location("ASSERT_NEAR(" #a ", " #b ")", __FILE__, __LINE__)); \
        } \
    } while (0)

#endif // TEST_FRAMEWORK_H
