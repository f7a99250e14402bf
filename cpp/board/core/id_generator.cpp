#include "board/core/id_generator.h"

#include <array>

namespace board {

IdGenerator::IdGenerator()
    : rng_(std::random_device{}()) {}

IdGenerator::IdGenerator(std::uint64_t seed)
    : rng_(seed) {}

std::string IdGenerator::next() {
    static constexpr char kHex[] = "0123456789abcdef";

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        const std::uint64_t v = rng_();
        for (std::size_t k = 0; k < 8; ++k) {
            bytes[i + k] = static_cast<std::uint8_t>((v >> (k * 8)) & 0xFF);
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace board
