#ifndef CORTEXLIB_MORTON_H
#define CORTEXLIB_MORTON_H

#include <cstdint>
#include "types.h"

namespace cortexlib {

constexpr uint32_t MORTON_BITS_PER_AXIS = 21;
constexpr uint32_t MORTON_MAX_COORDINATE = (1u << MORTON_BITS_PER_AXIS) - 1;

// Interleaves x, y, z bits (x lowest); each coordinate must be <= MORTON_MAX_COORDINATE
uint64_t morton_encode_3d(uint32_t x, uint32_t y, uint32_t z);
void morton_decode_3d(uint64_t code, uint32_t& x, uint32_t& y, uint32_t& z);

// Throws std::out_of_range for negative or oversized coordinates
uint64_t morton_encode(const Position& position);
Position morton_decode(uint64_t code);

} // namespace cortexlib

#endif // CORTEXLIB_MORTON_H
