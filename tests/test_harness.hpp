#pragma once

// ============================================================================
// Simple Test Framework
// ============================================================================

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
    std::chrono::milliseconds duration;
};

inline std::vector<TestResult> g_test_results;
inline int g_tests_passed = 0;
inline int g_tests_failed = 0;

#define TEST(name) void name(TestResult& test_result_)
#define ASSERT(cond, msg) do { if (!(cond)) { test_result_.passed = false; test_result_.message = msg; return; } } while(0)
#define ASSERT_EQ(a, b, msg) ASSERT((a) == (b), msg)
#define ASSERT_NE(a, b, msg) ASSERT((a) != (b), msg)
#define ASSERT_GT(a, b, msg) ASSERT((a) > (b), msg)
#define ASSERT_THROWS(expr, type, msg) \
    do { \
        bool thrown_ = false; \
        try { expr; } catch (const type&) { thrown_ = true; } \
        ASSERT(thrown_, msg); \
    } while(0)

#define RUN_TEST(fn) run_test(#fn, fn)

inline void run_test(const std::string& name, void (*fn)(TestResult&)) {
    std::cout << "Running test: " << name << " :";
    TestResult result;
    result.name = name;
    result.passed = true;
    result.message = "";

    auto start = std::chrono::steady_clock::now();

    try {
        fn(result);
    } catch (const std::exception& e) {
        result.passed = false;
        result.message = std::string("Exception: ") + e.what();
    }

    auto end = std::chrono::steady_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    if (result.passed) {
        g_tests_passed++;
        std::cout << " ✅ " << " (" << result.duration.count() << "ms)" << std::endl;
    } else {
        g_tests_failed++;
        std::cout << " ❌ " << " - " << result.message << " (" << result.duration.count() << "ms)" << std::endl;
    }

    g_test_results.push_back(result);
}

inline int print_summary() {
    std::cout << std::endl;
    std::cout << "============================================" << std::endl;
    std::cout << "Results: " << g_tests_passed << " passed, " << g_tests_failed << " failed" << std::endl;
    std::cout << "============================================" << std::endl;
    return g_tests_failed > 0 ? 1 : 0;
}
