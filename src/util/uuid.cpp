#include <trellis/uuid.hpp>
#include <fstream>
#include <random>

namespace trellis {

// /dev/urandom, or mt19937_64 when it cannot be read
static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

static const char hex_chars[] = "0123456789abcdef";

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), u.bytes.size());
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;   // version 4
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;   // variant 1
    return u;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) out += '-';
    }
    return out;
}

std::string Uuid::short_id() const {
    std::string out;
    out.reserve(12);
    for (size_t i = 0; i < 6; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace trellis
