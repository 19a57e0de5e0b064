#include <trellis/builtins.hpp>
#include <trellis/log.hpp>
#include <trellis/uuid.hpp>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace trellis {

static const char* kBuiltinLocation = "<builtin>";

static FixtureYield make_tmp_path(const Arguments&) {
    fs::path dir = fs::temp_directory_path() / ("trellis-" + Uuid::v4().short_id());
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create temporary directory " +
                                 dir.string() + ": " + ec.message());
    }
    log::trace("created %s", dir.string().c_str());

    return FixtureYield{Value::of(dir), [dir]() {
        std::error_code rm_ec;
        fs::remove_all(dir, rm_ec);
        if (rm_ec) {
            throw std::runtime_error("cannot remove " + dir.string() + ": " +
                                     rm_ec.message());
        }
    }};
}

static Value make_request(const Arguments& args) {
    const RequestInfo* info = args.request();
    if (!info) {
        throw std::logic_error("no invocation is being set up");
    }
    return Value::of(*info);
}

void register_builtins(FixtureTable& table) {
    for (const char* name : {"tmp_path", "temp_dir"}) {
        table.add_builtin(make_generator_fixture(name, kBuiltinLocation, "function",
                                                 {}, make_tmp_path));
    }
    table.add_builtin(make_fixture("request", kBuiltinLocation, "function",
                                   {}, make_request));
}

} // namespace trellis
