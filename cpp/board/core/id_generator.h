#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace board {

// Produces RFC 4122 version-4 UUID strings for locally created elements.
class IdGenerator {
public:
    IdGenerator();
    explicit IdGenerator(std::uint64_t seed);

    std::string next();

private:
    std::mt19937_64 rng_;
};

} // namespace board
