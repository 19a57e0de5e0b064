#pragma once

#include <string>

namespace trellis {

struct TrellisError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Duplicate,
        Cycle,
        InvalidArg,
        InvalidFixture,
        ScopeMismatch,
        Fixture,
        Database
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    TrellisError() = default;
    TrellisError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TrellisError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TrellisError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace trellis
