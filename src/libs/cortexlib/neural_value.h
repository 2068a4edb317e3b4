#ifndef CORTEXLIB_NEURAL_VALUE_H
#define CORTEXLIB_NEURAL_VALUE_H

#include <cstdint>
#include <cmath>
#include <limits>
#include "types.h"

namespace cortexlib {

// Signed Q8.8 fixed point: range [-128, 127.996], resolution 1/256.
struct QuantizedValue {
    int16_t raw;

    QuantizedValue() : raw(0) {}
    explicit QuantizedValue(int16_t r) : raw(r) {}

    static constexpr int FRACTION_BITS = 8;
    static constexpr float SCALE = 256.0f;

    bool operator==(const QuantizedValue& other) const { return raw == other.raw; }
    bool operator!=(const QuantizedValue& other) const { return raw != other.raw; }
};

// Arithmetic contract shared by every precision. Each operation that can leave the
// representable range clamps and bumps the caller's saturation counter.
template <typename T>
struct NeuralValueTraits;

template <>
struct NeuralValueTraits<float> {
    static constexpr Precision precision = Precision::FLOAT32;

    static float min_value() { return -std::numeric_limits<float>::max(); }
    static float max_value() { return std::numeric_limits<float>::max(); }
    static float zero() { return 0.0f; }

    static float from_float(float value, uint32_t& saturations) {
        if (std::isnan(value)) {
            ++saturations;
            return 0.0f;
        }
        if (value > max_value()) {
            ++saturations;
            return max_value();
        }
        if (value < min_value()) {
            ++saturations;
            return min_value();
        }
        return value;
    }

    static float to_float(float value) { return value; }

    static float add(float a, float b, uint32_t& saturations) {
        return from_float(a + b, saturations);
    }

    static float sub(float a, float b, uint32_t& saturations) {
        return from_float(a - b, saturations);
    }

    static float scale(float a, float factor, uint32_t& saturations) {
        return from_float(a * factor, saturations);
    }

    static bool ge(float a, float b) { return a >= b; }
    static bool gt(float a, float b) { return a > b; }
};

template <>
struct NeuralValueTraits<QuantizedValue> {
    static constexpr Precision precision = Precision::QUANTIZED16;

    static QuantizedValue min_value() { return QuantizedValue(std::numeric_limits<int16_t>::min()); }
    static QuantizedValue max_value() { return QuantizedValue(std::numeric_limits<int16_t>::max()); }
    static QuantizedValue zero() { return QuantizedValue(0); }

    static QuantizedValue from_float(float value, uint32_t& saturations) {
        if (std::isnan(value)) {
            ++saturations;
            return zero();
        }
        double scaled = static_cast<double>(value) * QuantizedValue::SCALE;
        if (scaled > std::numeric_limits<int16_t>::max()) {
            ++saturations;
            return max_value();
        }
        if (scaled < std::numeric_limits<int16_t>::min()) {
            ++saturations;
            return min_value();
        }
        return QuantizedValue(static_cast<int16_t>(std::lround(scaled)));
    }

    static float to_float(QuantizedValue value) {
        return static_cast<float>(value.raw) / QuantizedValue::SCALE;
    }

    static QuantizedValue add(QuantizedValue a, QuantizedValue b, uint32_t& saturations) {
        return clamp_raw(static_cast<long>(a.raw) + static_cast<long>(b.raw), saturations);
    }

    static QuantizedValue sub(QuantizedValue a, QuantizedValue b, uint32_t& saturations) {
        return clamp_raw(static_cast<long>(a.raw) - static_cast<long>(b.raw), saturations);
    }

    static QuantizedValue scale(QuantizedValue a, float factor, uint32_t& saturations) {
        if (std::isnan(factor)) {
            ++saturations;
            return zero();
        }
        double scaled = static_cast<double>(a.raw) * factor;
        if (scaled > std::numeric_limits<int16_t>::max()) {
            ++saturations;
            return max_value();
        }
        if (scaled < std::numeric_limits<int16_t>::min()) {
            ++saturations;
            return min_value();
        }
        return QuantizedValue(static_cast<int16_t>(std::lround(scaled)));
    }

    static bool ge(QuantizedValue a, QuantizedValue b) { return a.raw >= b.raw; }
    static bool gt(QuantizedValue a, QuantizedValue b) { return a.raw > b.raw; }

private:
    static QuantizedValue clamp_raw(long raw, uint32_t& saturations) {
        if (raw > std::numeric_limits<int16_t>::max()) {
            ++saturations;
            return max_value();
        }
        if (raw < std::numeric_limits<int16_t>::min()) {
            ++saturations;
            return min_value();
        }
        return QuantizedValue(static_cast<int16_t>(raw));
    }
};

} // namespace cortexlib

#endif // CORTEXLIB_NEURAL_VALUE_H
