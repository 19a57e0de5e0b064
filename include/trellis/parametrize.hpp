#pragma once

#include <trellis/test_item.hpp>
#include <vector>

namespace trellis {

// Expands one test into its invocations: the Cartesian product of its
// parametrize specs, first-declared spec varying slowest. Ids are the row
// ids joined by '-' in declaration order, e.g. "test_add[1-2-x]".
//
// A test without specs yields a single invocation named after the test.
std::vector<TestInvocation> expand(const TestItem& item);

// Comma-separated names, used in ids and messages.
std::string join_names(const std::vector<std::string>& names,
                       const char* sep = ", ");

} // namespace trellis
