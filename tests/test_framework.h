/*
 * test_framework.h - Test harness shared by the TagForge test programs
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TEST_FRAMEWORK_H
#define TEST_FRAMEWORK_H

#include <string>
#include <vector>
#include <memory>
#include <iostream>
#include <sstream>
#include <exception>
#include <chrono>

namespace TestFramework {

    // ========================================
    // ASSERTION MACROS
    // ========================================

    #define TAGFORGE_ASSERTION_FAILED(message, detail) \
        do { \
            std::ostringstream oss; \
            oss << "ASSERTION FAILED: " << (message) \
                << " at " << __FILE__ << ":" << __LINE__ << " - " << detail; \
            throw TestFramework::AssertionFailure(oss.str()); \
        } while(0)

    #define ASSERT_TRUE(condition, message) \
        do { \
            if (!(condition)) { \
                TAGFORGE_ASSERTION_FAILED(message, "Expected: true, Got: false"); \
            } \
        } while(0)

    #define ASSERT_FALSE(condition, message) \
        do { \
            if ((condition)) { \
                TAGFORGE_ASSERTION_FAILED(message, "Expected: false, Got: true"); \
            } \
        } while(0)

    /**
     * @brief Assert that two values are equal
     *
     * Both values must be printable with operator<<; the tag enums
     * (Version, Encoding, PictureType, ContentShape) provide one.
     */
    #define ASSERT_EQUALS(expected, actual, message) \
        do { \
            if (!((expected) == (actual))) { \
                TAGFORGE_ASSERTION_FAILED(message, "Expected: " << (expected) << ", Got: " << (actual)); \
            } \
        } while(0)

    #define ASSERT_NOT_NULL(ptr, message) \
        do { \
            if ((ptr) == nullptr) { \
                TAGFORGE_ASSERTION_FAILED(message, "Expected: non-null pointer, Got: null"); \
            } \
        } while(0)

    // ========================================
    // EXCEPTION CLASSES
    // ========================================

    class AssertionFailure : public std::exception {
    public:
        explicit AssertionFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };

    /**
     * @brief Thrown when a fixture (a temporary file, for instance) cannot be built
     *
     * Reported as an error rather than a failure.
     */
    class TestSetupFailure : public std::exception {
    public:
        explicit TestSetupFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };

    // ========================================
    // TEST RESULTS
    // ========================================

    enum class TestResult {
        PASSED,     ///< Test completed successfully
        FAILED,     ///< An assertion did not hold
        ERROR       ///< Setup failed or an unexpected exception escaped
    };

    struct TestInfo {
        std::string name;
        TestResult result;
        std::string failure_message;
        std::chrono::milliseconds execution_time;

        explicit TestInfo(const std::string& test_name)
            : name(test_name), result(TestResult::PASSED), execution_time(0) {}
    };

    // ========================================
    // TEST CASE
    // ========================================

    /**
     * @brief One named test; derived classes implement runTest()
     *
     * An error escaping runTest() is caught by run() and reported in the
     * returned TestInfo, so one broken case never stops the suite.
     */
    class TestCase {
    public:
        explicit TestCase(const std::string& name);
        virtual ~TestCase() = default;

        TestInfo run();

        const std::string& getName() const { return m_name; }

    protected:
        virtual void runTest() = 0;

    private:
        std::string m_name;
    };

    // ========================================
    // TEST SUITE
    // ========================================

    /**
     * @brief Ordered set of test cases run by one test program
     */
    class TestSuite {
    public:
        explicit TestSuite(const std::string& name);

        void addTest(std::unique_ptr<TestCase> test);

        /**
         * @brief Run every test in insertion order, printing each outcome
         */
        std::vector<TestInfo> runAll();

        void printResults(const std::vector<TestInfo>& results);

        /**
         * @return Number of tests that failed an assertion or raised an error
         */
        int getFailureCount(const std::vector<TestInfo>& results);

    private:
        std::string m_name;
        std::vector<std::unique_ptr<TestCase>> m_tests;
    };

} // namespace TestFramework

#endif // TEST_FRAMEWORK_H
