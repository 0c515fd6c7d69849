/**
 * @file TestHarness.h
 * @brief Assertion macros shared by the keyforge test executables
 *
 * Each test is a `static void test_x()` that calls TEST_BEGIN, any number
 * of TEST_ASSERT / TEST_ASSERT_MSG, then TEST_PASS. A failed assertion
 * returns from the test. main() ends with TEST_SUMMARY and returns
 * non-zero if anything failed.
 */

#pragma once

#include <cmath>
#include <cstdio>
#include <string>

//=============================================================================
// TEST FRAMEWORK MACROS
//=============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;
static int g_currentTestLine = 0;
static std::string g_currentTestName;

#define TEST_BEGIN(name) \
    do { \
        g_currentTestName = name; \
        g_currentTestLine = __LINE__; \
        std::printf("[TEST] %-50s ", name); \
    } while(0)

#define TEST_ASSERT(condition) \
    do { \
        if (!(condition)) { \
            std::printf("FAIL\n"); \
            std::printf("       Assertion failed at line %d: %s\n", \
                        __LINE__, #condition); \
            g_testsFailed++; \
            return; \
        } \
    } while(0)

#define TEST_ASSERT_MSG(condition, msg) \
    do { \
        if (!(condition)) { \
            std::printf("FAIL\n"); \
            std::printf("       %s\n", std::string(msg).c_str()); \
            g_testsFailed++; \
            return; \
        } \
    } while(0)

#define TEST_ASSERT_NEAR(a, b, tol) \
    do { \
        if (!(std::fabs((a) - (b)) <= (tol))) { \
            std::printf("FAIL\n"); \
            std::printf("       %s = %.9g, expected %.9g (tol %g) at line %d\n", \
                        #a, static_cast<double>(a), static_cast<double>(b), \
                        static_cast<double>(tol), __LINE__); \
            g_testsFailed++; \
            return; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::printf("PASS\n"); \
        g_testsPassed++; \
    } while(0)

#define TEST_SUMMARY() \
    do { \
        std::printf("\n========================================\n"); \
        std::printf("TEST SUMMARY\n"); \
        std::printf("========================================\n"); \
        std::printf("Passed: %d\n", g_testsPassed); \
        std::printf("Failed: %d\n", g_testsFailed); \
        std::printf("Total:  %d\n", g_testsPassed + g_testsFailed); \
        std::printf("========================================\n"); \
        if (g_testsFailed == 0) { \
            std::printf("ALL TESTS PASSED!\n"); \
        } else { \
            std::printf("SOME TESTS FAILED!\n"); \
        } \
    } while(0)
