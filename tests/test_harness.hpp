#pragma once

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace tests
{
    struct TestResult
    {
        std::string name;
        bool passed;
    };

    extern std::vector<TestResult> results;
    extern std::string last_error;

#define EXPECT(cond, false_msg)        \
    do                                 \
    {                                  \
        if (!(cond))                   \
        {                              \
            tests::last_error = false_msg; \
            return false;              \
        }                              \
    } while (0)

// Passes only if `stmt` throws exactly something catchable as `ex_type`.
#define EXPECT_THROW(stmt, ex_type, false_msg) \
    do                                         \
    {                                          \
        bool thrown = false;                   \
        try                                    \
        {                                      \
            stmt;                              \
        }                                      \
        catch (const ex_type &)                \
        {                                      \
            thrown = true;                     \
        }                                      \
        EXPECT(thrown, false_msg);             \
    } while (0)

// A test that throws counts as failed and reports the exception.
#define RUN_TEST(fn)                                                   \
    do                                                                 \
    {                                                                  \
        bool ok = false;                                               \
        tests::last_error.clear();                                     \
        try                                                            \
        {                                                              \
            ok = fn();                                                 \
        }                                                              \
        catch (const std::exception &e)                                \
        {                                                              \
            tests::last_error = std::string("uncaught exception: ") + e.what(); \
        }                                                              \
        tests::results.push_back({#fn, ok});                           \
        std::cout << (ok ? "[ ok ] " : "[FAIL] ") << #fn;              \
        if (!ok)                                                       \
            std::cout << " FAILED: " << tests::last_error;             \
        std::cout << "\n";                                             \
    } while (0)

#define SUBCAT(msg)                                                             \
    do                                                                          \
    {                                                                           \
        std::string title(msg);                                                 \
        std::transform(title.begin(), title.end(), title.begin(), ::toupper);   \
        std::cout << "-------" << title << "--------------\n";                  \
    } while (0)
} // namespace tests
