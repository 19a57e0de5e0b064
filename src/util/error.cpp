#include <trellis/error.hpp>

namespace trellis {

const char* TrellisError::code_name(Code c) {
    switch (c) {
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case NotFound:       return "NotFound";
        case Duplicate:      return "Duplicate";
        case Cycle:          return "Cycle";
        case InvalidArg:     return "InvalidArg";
        case InvalidFixture: return "InvalidFixture";
        case ScopeMismatch:  return "ScopeMismatch";
        case Fixture:        return "Fixture";
        case Database:       return "Database";
    }
    return "Unknown";
}

std::string TrellisError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace trellis
