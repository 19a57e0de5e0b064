#pragma once

#include <trellis/fixture_table.hpp>

namespace trellis {

// Engine-provided fixtures, registered in the builtin level so any user
// fixture of the same name shadows them:
//   tmp_path  fresh directory per invocation (std::filesystem::path),
//             removed at teardown; also available as temp_dir
//   request   RequestInfo of the invocation being set up
void register_builtins(FixtureTable& table);

} // namespace trellis
