/**
 * Retry Policy Test
 *
 * Validates backoff and error classification for sink writes:
 * 1. Transient failures are retried with 1s, 2s, 4s delays
 * 2. Integrity and other failures are not retried
 * 3. Attempts stop after max_retries + 1
 * 4. SQLSTATE codes map to the right error class
 */

#include "enricher/retry_policy.hpp"
#include "enricher/async_database.hpp"
#include <iostream>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

using namespace enricher;

// Test utilities
#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

DbError transient_error() {
    return DbError("server closed the connection unexpectedly", "", DbErrorClass::Transient);
}

// Test 1: two transient failures then success, with recorded delays
bool test_transient_then_success() {
    std::cout << "\n=== Test 1: Transient Then Success ===" << std::endl;

    RetryPolicy policy(3, 1000);
    std::vector<std::chrono::milliseconds> delays;
    policy.set_sleeper([&delays](std::chrono::milliseconds d) { delays.push_back(d); });

    int attempts = 0;
    int value = policy.run("write", [&]() {
        ++attempts;
        if (attempts <= 2) {
            throw transient_error();
        }
        return 42;
    });

    TEST_ASSERT(value == 42, "Result of the successful attempt is returned");
    TEST_ASSERT(attempts == 3, "Three attempts were made");
    TEST_ASSERT(delays.size() == 2, "Two backoff pauses");
    TEST_ASSERT(delays[0].count() == 1000 && delays[1].count() == 2000, "Delays double from 1s");

    long long total = 0;
    for (auto d : delays) total += d.count();
    TEST_ASSERT(total == 3000, "Total backoff is 3s");
    return true;
}

// Test 2: same scenario against the real clock
bool test_transient_then_success_wall_clock() {
    std::cout << "\n=== Test 2: Transient Then Success (wall clock) ===" << std::endl;

    RetryPolicy policy(3, 1000);
    int attempts = 0;
    auto start = std::chrono::steady_clock::now();

    policy.run("write", [&]() {
        ++attempts;
        if (attempts <= 2) {
            throw transient_error();
        }
    });

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    TEST_ASSERT(attempts == 3, "Succeeded on the third attempt");
    TEST_ASSERT(elapsed_ms >= 2900 && elapsed_ms < 4500, "Took about 3 seconds");
    std::cout << "Elapsed: " << elapsed_ms << "ms" << std::endl;
    return true;
}

// Test 3: integrity violations are never retried
bool test_integrity_not_retried() {
    std::cout << "\n=== Test 3: Integrity Not Retried ===" << std::endl;

    RetryPolicy policy(3, 1000);
    int sleeps = 0;
    policy.set_sleeper([&sleeps](std::chrono::milliseconds) { ++sleeps; });

    int attempts = 0;
    bool thrown = false;
    try {
        policy.run("write", [&]() {
            ++attempts;
            throw DbError("duplicate key value violates unique constraint", "23505", DbErrorClass::Integrity);
        });
    } catch (const DbError& e) {
        thrown = e.is_integrity();
    }

    TEST_ASSERT(thrown, "Integrity error is rethrown");
    TEST_ASSERT(attempts == 1, "Only one attempt");
    TEST_ASSERT(sleeps == 0, "No backoff");

    attempts = 0;
    thrown = false;
    try {
        policy.run("write", [&]() {
            ++attempts;
            throw DbError("syntax error", "42601", DbErrorClass::Other);
        });
    } catch (const DbError& e) {
        thrown = e.error_class() == DbErrorClass::Other;
    }
    TEST_ASSERT(thrown && attempts == 1, "Other errors are not retried either");
    return true;
}

// Test 4: persistent transient failure gives up after max_retries
bool test_retries_exhausted() {
    std::cout << "\n=== Test 4: Retries Exhausted ===" << std::endl;

    RetryPolicy policy(3, 1000);
    std::vector<std::chrono::milliseconds> delays;
    policy.set_sleeper([&delays](std::chrono::milliseconds d) { delays.push_back(d); });

    int attempts = 0;
    bool thrown = false;
    try {
        policy.run("write", [&]() {
            ++attempts;
            throw transient_error();
        });
    } catch (const DbError& e) {
        thrown = e.is_transient();
    }

    TEST_ASSERT(thrown, "Last transient error surfaces");
    TEST_ASSERT(attempts == 4, "max_retries + 1 attempts");
    TEST_ASSERT(delays.size() == 3 && delays[2].count() == 4000, "Delays were 1s, 2s, 4s");
    return true;
}

// Test 5: non-database exceptions pass straight through
bool test_foreign_exception_passes_through() {
    std::cout << "\n=== Test 5: Foreign Exception Passes Through ===" << std::endl;

    RetryPolicy policy(3, 1000);
    int attempts = 0;
    bool thrown = false;
    try {
        policy.run("write", [&]() {
            ++attempts;
            throw std::invalid_argument("bad record");
        });
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    TEST_ASSERT(thrown && attempts == 1, "std::invalid_argument is not retried");
    return true;
}

// Test 6: SQLSTATE classification
bool test_classify_sqlstate() {
    std::cout << "\n=== Test 6: SQLSTATE Classification ===" << std::endl;

    TEST_ASSERT(classify_sqlstate("08006", false) == DbErrorClass::Transient, "Connection failure is transient");
    TEST_ASSERT(classify_sqlstate("40001", false) == DbErrorClass::Transient, "Serialization failure is transient");
    TEST_ASSERT(classify_sqlstate("40P01", false) == DbErrorClass::Transient, "Deadlock is transient");
    TEST_ASSERT(classify_sqlstate("57014", false) == DbErrorClass::Transient, "Statement timeout is transient");
    TEST_ASSERT(classify_sqlstate("55P03", false) == DbErrorClass::Transient, "Lock timeout is transient");
    TEST_ASSERT(classify_sqlstate("23505", false) == DbErrorClass::Integrity, "Unique violation is integrity");
    TEST_ASSERT(classify_sqlstate("23502", false) == DbErrorClass::Integrity, "Not-null violation is integrity");
    TEST_ASSERT(classify_sqlstate("42P01", false) == DbErrorClass::Other, "Undefined table is other");
    TEST_ASSERT(classify_sqlstate("", true) == DbErrorClass::Transient, "Lost connection without SQLSTATE is transient");
    TEST_ASSERT(classify_sqlstate("", false) == DbErrorClass::Other, "Client error without SQLSTATE is other");
    TEST_ASSERT(std::string(to_string(DbErrorClass::Integrity)) == "integrity", "Class names render");
    return true;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::err);  // Retries log at warn level

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Retry Policy Tests                                   ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_transient_then_success();
    all_passed &= test_transient_then_success_wall_clock();
    all_passed &= test_integrity_not_retried();
    all_passed &= test_retries_exhausted();
    all_passed &= test_foreign_exception_passes_through();
    all_passed &= test_classify_sqlstate();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
