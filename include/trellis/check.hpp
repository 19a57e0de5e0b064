#pragma once

#include <stdexcept>
#include <string>

namespace trellis {

// Thrown by a test body whose check does not hold; the invocation is
// recorded as failed rather than errored.
class AssertionFailure : public std::runtime_error {
public:
    explicit AssertionFailure(const std::string& message)
        : std::runtime_error(message) {}
};

// Thrown to skip the running test.
class SkipTest : public std::runtime_error {
public:
    explicit SkipTest(const std::string& reason)
        : std::runtime_error(reason) {}
};

void check(bool condition, const std::string& message);

[[noreturn]] void skip(const std::string& reason);

#define TRELLIS_CHECK(expr) \
    do { \
        if (!(expr)) { \
            throw ::trellis::AssertionFailure( \
                std::string("check failed: ") + #expr + " (" + __FILE__ + ":" + \
                std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

} // namespace trellis
