#include <trellis/fixture.hpp>
#include <trellis/source_path.hpp>

namespace trellis {

std::string FixtureDefinition::directory() const {
    return parent_dir(location);
}

std::string FixtureDefinition::display() const {
    std::string out = name + " (" + location;
    if (line > 0) {
        out += ":" + std::to_string(line);
    }
    out += ")";
    return out;
}

FixtureDecl make_fixture(std::string name, std::string location,
                         std::string scope,
                         std::vector<std::string> dependencies,
                         std::function<Value(const Arguments&)> body) {
    FixtureDecl decl;
    decl.name = std::move(name);
    decl.location = std::move(location);
    decl.scope = std::move(scope);
    decl.dependencies = std::move(dependencies);
    decl.body = [fn = std::move(body)](const Arguments& args) {
        return FixtureYield{fn(args), {}};
    };
    return decl;
}

FixtureDecl make_generator_fixture(std::string name, std::string location,
                                   std::string scope,
                                   std::vector<std::string> dependencies,
                                   FixtureBody body) {
    FixtureDecl decl;
    decl.name = std::move(name);
    decl.location = std::move(location);
    decl.scope = std::move(scope);
    decl.dependencies = std::move(dependencies);
    decl.is_generator = true;
    decl.body = std::move(body);
    return decl;
}

} // namespace trellis
