#include <trellis/test_item.hpp>

namespace trellis {

Tags& Tags::skip(std::string reason) {
    skip_reason = std::move(reason);
    return *this;
}

Tags& Tags::skip_if(bool condition, std::string reason) {
    if (condition) {
        skip_reason = std::move(reason);
    }
    return *this;
}

Tags& Tags::expect_fail(std::string reason) {
    expect_fail_reason = std::move(reason);
    return *this;
}

Tags& Tags::use(std::vector<std::string> fixture_names) {
    for (auto& name : fixture_names) {
        use_fixtures.push_back(std::move(name));
    }
    return *this;
}

} // namespace trellis
