#include <trellis/value.hpp>

namespace trellis {

void Arguments::set(const std::string& name, Value value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(name, std::move(value));
}

bool Arguments::has(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return true;
    }
    return false;
}

const Value& Arguments::raw(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return entry.second;
    }
    throw std::out_of_range("no argument named '" + name + "'");
}

std::vector<std::string> Arguments::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

void Arguments::merge(const Arguments& other) {
    for (const auto& entry : other.entries_) {
        if (!has(entry.first)) {
            entries_.push_back(entry);
        }
    }
}

} // namespace trellis
