#include <trellis/check.hpp>

namespace trellis {

void check(bool condition, const std::string& message) {
    if (!condition) {
        throw AssertionFailure(message);
    }
}

void skip(const std::string& reason) {
    throw SkipTest(reason);
}

} // namespace trellis
