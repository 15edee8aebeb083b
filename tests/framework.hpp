/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for proddb.
 *
 * @details
 * ANSI-colored terminal output, exception-protected execution blocks, and
 * assertion macros. Failed assertions throw `AssertionFailure`, which aborts
 * the current test case only.
 */

#pragma once

#include "proddb/infra/error.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace proddb::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/// @brief Thrown by assertion primitives after the failure has been reported.
struct AssertionFailure : std::runtime_error {
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

inline void report_failure(const char* file, int line, const std::string& detail)
{
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
              << " -> Assertion failed: " << detail << std::endl;
    failed_count++;
    throw AssertionFailure();
}

/**
 * @brief Validates that two values are equivalent.
 */
template <typename A, typename B>
void assert_eq(const A& val1, const B& val2, const char* file, int line, const char* expr)
{
    if (!(val1 == val2)) {
        std::ostringstream detail;
        detail << expr << " (" << val1 << " != " << val2 << ")";
        report_failure(file, line, detail.str());
    }
}

/**
 * @brief Validates that two values are NOT equivalent.
 */
template <typename A, typename B>
void assert_ne(const A& val1, const B& val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::ostringstream detail;
        detail << expr << " (" << val1 << " == " << val2 << ")";
        report_failure(file, line, detail.str());
    }
}

/**
 * @brief Validates that a boolean expression evaluates to true.
 */
inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        report_failure(file, line, std::string(expr) + " is FALSE");
    }
}

/**
 * @brief Validates that a boolean expression evaluates to false.
 */
inline void assert_true_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        report_failure(file, line, std::string(expr) + " is TRUE");
    }
}

/**
 * @brief Validates that `fn` throws `E`, optionally with a specific error code.
 */
template <typename E>
void assert_throws(const std::function<void()>& fn, const char* code, const char* file, int line,
                   const char* expr)
{
    try {
        fn();
    } catch (const E& e) {
        if constexpr (std::is_base_of_v<proddb::infra::Error, E>) {
            if (code && e.code() != code) {
                report_failure(file, line,
                               std::string(expr) + " threw code " + e.code() + ", expected " +
                                   code);
            }
        }
        return;
    } catch (const std::exception& e) {
        report_failure(file, line, std::string(expr) + " threw unexpected exception: " + e.what());
    }
    report_failure(file, line, std::string(expr) + " did not throw");
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        // Clear line and print pass status
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
        return;
    } catch (const AssertionFailure&) {
        // Already reported and counted by the assertion primitive.
    } catch (const std::exception& e) {
        std::cout << "\n\033[31m[FAIL]\033[0m Unexpected exception: " << e.what() << std::endl;
        failed_count++;
    }
    std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== proddb Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace proddb::test

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def ASSERT_EQ
 * @brief Macro for equality assertions. Includes file and line metadata.
 */
#define ASSERT_EQ(a, b) proddb::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

/**
 * @def ASSERT_NE
 * @brief Macro for inequality assertions. Includes file and line metadata.
 */
#define ASSERT_NE(a, b) proddb::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

/**
 * @def ASSERT_TRUE
 * @brief Macro for truthiness assertions.
 */
#define ASSERT_TRUE(a) proddb::test::assert_true((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_FALSE
 * @brief Macro for falsiness assertions.
 */
#define ASSERT_FALSE(a) proddb::test::assert_true_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that `stmt` throws an exception of type `type`.
 */
#define ASSERT_THROWS(stmt, type)                                                                  \
    proddb::test::assert_throws<type>([&]() { stmt; }, nullptr, __FILE__, __LINE__, #stmt)

/**
 * @def ASSERT_THROWS_CODE
 * @brief Asserts that `stmt` throws `type` carrying the error code `code`.
 */
#define ASSERT_THROWS_CODE(stmt, type, code)                                                       \
    proddb::test::assert_throws<type>([&]() { stmt; }, code, __FILE__, __LINE__, #stmt)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) proddb::test::run(#func_name, func_name)
