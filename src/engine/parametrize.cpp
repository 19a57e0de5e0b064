#include <trellis/parametrize.hpp>

namespace trellis {

std::string join_names(const std::vector<std::string>& names, const char* sep) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += names[i];
    }
    return out;
}

static std::string row_id(const ParametrizeSpec& spec, size_t row) {
    const ParamSet& set = spec.rows[row];
    if (!set.id.empty()) return set.id;

    std::vector<std::string> parts;
    for (const auto& name : spec.arg_names) {
        parts.push_back(name + std::to_string(row));
    }
    return join_names(parts, "-");
}

static TestInvocation plain_invocation(const TestItem& item) {
    TestInvocation inv;
    inv.item = &item;
    inv.id = item.name;
    return inv;
}

std::vector<TestInvocation> expand(const TestItem& item) {
    std::vector<TestInvocation> out;
    if (item.parametrize.empty()) {
        out.push_back(plain_invocation(item));
        return out;
    }

    for (const auto& spec : item.parametrize) {
        if (spec.rows.empty()) {
            TestInvocation inv = plain_invocation(item);
            inv.skip_reason = "empty parameter set for (" +
                              join_names(spec.arg_names) + ")";
            out.push_back(std::move(inv));
            return out;
        }
    }

    // Odometer over the row index of every spec; the last spec turns fastest
    std::vector<size_t> idx(item.parametrize.size(), 0);
    while (true) {
        TestInvocation inv = plain_invocation(item);
        std::vector<std::string> ids;

        for (size_t s = 0; s < item.parametrize.size(); ++s) {
            const ParametrizeSpec& spec = item.parametrize[s];
            const ParamSet& set = spec.rows[idx[s]];
            ids.push_back(row_id(spec, idx[s]));

            if (set.values.size() != spec.arg_names.size()) {
                if (!inv.error) {
                    inv.error = "parametrize row " + std::to_string(idx[s]) +
                        " for (" + join_names(spec.arg_names) + ") has " +
                        std::to_string(set.values.size()) + " value(s), expected " +
                        std::to_string(spec.arg_names.size());
                }
                continue;
            }
            for (size_t a = 0; a < spec.arg_names.size(); ++a) {
                inv.params.set(spec.arg_names[a], set.values[a]);
            }
        }

        inv.param_id = join_names(ids, "-");
        inv.id = item.name + "[" + inv.param_id + "]";
        out.push_back(std::move(inv));

        size_t s = item.parametrize.size();
        while (s > 0) {
            --s;
            if (++idx[s] < item.parametrize[s].rows.size()) break;
            idx[s] = 0;
            if (s == 0) return out;
        }
    }
}

} // namespace trellis
