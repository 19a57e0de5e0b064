#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace trellis {

// Random (version 4) identifier used for run ids and scratch directory
// names.
struct Uuid {
    std::array<uint8_t, 16> bytes;

    static Uuid v4();

    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
    std::string to_string() const;

    // First 12 hex digits, for file names.
    std::string short_id() const;

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
};

} // namespace trellis
