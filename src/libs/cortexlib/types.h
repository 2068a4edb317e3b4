#ifndef CORTEXLIB_TYPES_H
#define CORTEXLIB_TYPES_H

#include <cstdint>
#include <limits>

namespace cortexlib {

using NeuronId = uint32_t;
using SynapseId = uint32_t;
using AreaId = uint32_t;

constexpr NeuronId INVALID_NEURON = std::numeric_limits<NeuronId>::max();
constexpr SynapseId INVALID_SYNAPSE = std::numeric_limits<SynapseId>::max();
constexpr AreaId INVALID_AREA = std::numeric_limits<AreaId>::max();

struct Position {
    int32_t x;
    int32_t y;
    int32_t z;

    Position() : x(0), y(0), z(0) {}
    Position(int32_t x_, int32_t y_, int32_t z_) : x(x_), y(y_), z(z_) {}

    int32_t axis(int index) const {
        return index == 0 ? x : (index == 1 ? y : z);
    }

    void set_axis(int index, int32_t value) {
        if (index == 0) x = value;
        else if (index == 1) y = value;
        else z = value;
    }

    bool operator==(const Position& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
    bool operator<(const Position& other) const {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }
};

struct Dimensions {
    uint32_t width;
    uint32_t height;
    uint32_t depth;

    Dimensions() : width(1), height(1), depth(1) {}
    Dimensions(uint32_t w, uint32_t h, uint32_t d) : width(w), height(h), depth(d) {}

    uint32_t axis(int index) const {
        return index == 0 ? width : (index == 1 ? height : depth);
    }

    uint64_t volume() const {
        return static_cast<uint64_t>(width) * height * depth;
    }

    bool contains(const Position& pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.z >= 0 &&
               static_cast<uint32_t>(pos.x) < width &&
               static_cast<uint32_t>(pos.y) < height &&
               static_cast<uint32_t>(pos.z) < depth;
    }

    bool operator==(const Dimensions& other) const {
        return width == other.width && height == other.height && depth == other.depth;
    }
};

// Polarity lives in the type tag; weights are always non-negative magnitudes.
enum class SynapseType : uint8_t {
    EXCITATORY = 0,
    INHIBITORY = 1
};

inline float polarity(SynapseType type) {
    return type == SynapseType::INHIBITORY ? -1.0f : 1.0f;
}

enum class Precision {
    FLOAT32,
    QUANTIZED16
};

} // namespace cortexlib

#endif // CORTEXLIB_TYPES_H
