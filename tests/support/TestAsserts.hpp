#pragma once

#include "lumen/core/LightSourceTypes.hpp"
#include "lumen/log/Log.hpp"

#include <chrono>
#include <cmath>
#include <functional>
#include <thread>

// Each test executable counts failures and returns non-zero if any occurred.
inline int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lumen::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_FALSE(cond, msg) ASSERT_TRUE(!(cond), msg)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lumen::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

// Relative tolerance for the nanowatt-scale values the controller deals in.
#define ASSERT_NEAR(a,b,msg) \
    do { double _va=(a); double _vb=(b); \
        double _tol = 1e-9 * std::fmax(std::fabs(_va), std::fabs(_vb)) + 1e-30; \
        if (std::fabs(_va - _vb) > _tol) { lumen::logError("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_STATE(actual,expected,msg) \
    do { auto _va=(actual); auto _vb=(expected); if (_va != _vb) { lumen::logError("ASSERT STATE FAILED: ", (msg), \
        "  (", lumen::core::toString(_va), " != ", lumen::core::toString(_vb), ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace lumen::test {

/// Poll @p predicate until it holds or @p timeout elapses.
inline bool waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return predicate();
}

/// Silence info chatter so failures stand out; call at the top of main().
inline void quietLogs() {
    lumen::log::setMinimumLevel(lumen::LogLevel::Error);
}

inline int finish(const char* suite) {
    if (g_failures) {
        lumen::logError(suite, ": ", g_failures, " failure(s)\n");
        return 1;
    }
    lumen::log::setMinimumLevel(lumen::LogLevel::Info);
    lumen::logInfo(suite, " passed.\n");
    return 0;
}

} // namespace lumen::test
