#include "morton.h"
#include <stdexcept>
#include <string>

namespace cortexlib {

static uint64_t spread_bits(uint32_t value) {
    uint64_t x = value & 0x1FFFFF;
    x = (x | (x << 32)) & 0x1F00000000FFFFULL;
    x = (x | (x << 16)) & 0x1F0000FF0000FFULL;
    x = (x | (x << 8)) & 0x100F00F00F00F00FULL;
    x = (x | (x << 4)) & 0x10C30C30C30C30C3ULL;
    x = (x | (x << 2)) & 0x1249249249249249ULL;
    return x;
}

static uint32_t compact_bits(uint64_t value) {
    uint64_t x = value & 0x1249249249249249ULL;
    x = (x ^ (x >> 2)) & 0x10C30C30C30C30C3ULL;
    x = (x ^ (x >> 4)) & 0x100F00F00F00F00FULL;
    x = (x ^ (x >> 8)) & 0x1F0000FF0000FFULL;
    x = (x ^ (x >> 16)) & 0x1F00000000FFFFULL;
    x = (x ^ (x >> 32)) & 0x1FFFFF;
    return static_cast<uint32_t>(x);
}

uint64_t morton_encode_3d(uint32_t x, uint32_t y, uint32_t z) {
    return spread_bits(x) | (spread_bits(y) << 1) | (spread_bits(z) << 2);
}

void morton_decode_3d(uint64_t code, uint32_t& x, uint32_t& y, uint32_t& z) {
    x = compact_bits(code);
    y = compact_bits(code >> 1);
    z = compact_bits(code >> 2);
}

uint64_t morton_encode(const Position& position) {
    if (position.x < 0 || position.y < 0 || position.z < 0 ||
        static_cast<uint32_t>(position.x) > MORTON_MAX_COORDINATE ||
        static_cast<uint32_t>(position.y) > MORTON_MAX_COORDINATE ||
        static_cast<uint32_t>(position.z) > MORTON_MAX_COORDINATE) {
        throw std::out_of_range("Position (" + std::to_string(position.x) + ", " +
                                std::to_string(position.y) + ", " + std::to_string(position.z) +
                                ") cannot be Morton encoded");
    }
    return morton_encode_3d(static_cast<uint32_t>(position.x), static_cast<uint32_t>(position.y),
                            static_cast<uint32_t>(position.z));
}

Position morton_decode(uint64_t code) {
    uint32_t x, y, z;
    morton_decode_3d(code, x, y, z);
    return Position(static_cast<int32_t>(x), static_cast<int32_t>(y), static_cast<int32_t>(z));
}

} // namespace cortexlib
