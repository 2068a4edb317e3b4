#ifndef CORTEXLIB_MORPHOLOGY_H
#define CORTEXLIB_MORPHOLOGY_H

#include <array>
#include <cstdint>
#include <random>
#include <variant>
#include <vector>
#include "types.h"

namespace cortexlib {

enum class Axis {
    X = 0,
    Y = 1,
    Z = 2
};

// Proportional mapping between areas of different sizes. transpose[i] names the source
// axis feeding destination axis i. A non-negative project_last_layer_of names a destination
// axis (after the transpose) whose coordinate is forced to layer 0.
struct ProjectorMorphology {
    std::array<int, 3> transpose;
    int project_last_layer_of;

    ProjectorMorphology() : transpose{{0, 1, 2}}, project_last_layer_of(-1) {}
};

struct BlockConnectionMorphology {
    uint32_t scaling_factor;
    Axis axis;

    BlockConnectionMorphology() : scaling_factor(1), axis(Axis::X) {}
    BlockConnectionMorphology(uint32_t factor, Axis a = Axis::X) : scaling_factor(factor), axis(a) {}
};

struct ExpanderMorphology {
    uint32_t scaling_factor;
    Axis axis;

    ExpanderMorphology() : scaling_factor(1), axis(Axis::X) {}
    ExpanderMorphology(uint32_t factor, Axis a = Axis::X) : scaling_factor(factor), axis(a) {}
};

struct VectorsMorphology {
    std::vector<Position> offsets;
};

enum class PatternElementKind {
    EXACT,
    WILDCARD,   // '*'
    SKIP,       // '?': destination copies the source coordinate
    EXCLUDE     // '!': destination takes every coordinate except the source's
};

struct PatternElement {
    PatternElementKind kind;
    int32_t value;

    PatternElement() : kind(PatternElementKind::WILDCARD), value(0) {}
    PatternElement(PatternElementKind k, int32_t v) : kind(k), value(v) {}

    static PatternElement exact(int32_t v) { return PatternElement(PatternElementKind::EXACT, v); }
    static PatternElement wildcard() { return PatternElement(PatternElementKind::WILDCARD, 0); }
    static PatternElement skip() { return PatternElement(PatternElementKind::SKIP, 0); }
    static PatternElement exclude() { return PatternElement(PatternElementKind::EXCLUDE, 0); }
};

using PatternTriple = std::array<PatternElement, 3>;

struct PatternRule {
    PatternTriple source;
    PatternTriple destination;
};

struct PatternsMorphology {
    std::vector<PatternRule> rules;
};

// Bit i set in the source x coordinate selects destination x = i
struct ReducerMorphology {
    int32_t destination_y;
    int32_t destination_z;

    ReducerMorphology() : destination_y(0), destination_z(0) {}
    ReducerMorphology(int32_t y, int32_t z) : destination_y(y), destination_z(z) {}
};

struct RandomMorphology {
    uint32_t connections_per_neuron;

    RandomMorphology() : connections_per_neuron(1) {}
    explicit RandomMorphology(uint32_t count) : connections_per_neuron(count) {}
};

using Morphology = std::variant<ProjectorMorphology, BlockConnectionMorphology, ExpanderMorphology,
                                VectorsMorphology, PatternsMorphology, ReducerMorphology,
                                RandomMorphology>;

const char* morphology_name(const Morphology& morphology);
bool morphology_is_randomized(const Morphology& morphology);

// Throws ConfigurationError for parameters no source position could satisfy
void validate_morphology(const Morphology& morphology);

// Pure mappings. Results may fall outside the destination area; the caller decides
// between dropping and rejecting them.
std::vector<Position> project(const Position& source, const Dimensions& source_dims,
                              const Dimensions& destination_dims, const ProjectorMorphology& params);
std::vector<std::vector<Position>> project_batch(const std::vector<Position>& sources,
                                                 const Dimensions& source_dims,
                                                 const Dimensions& destination_dims,
                                                 const ProjectorMorphology& params);
Position block_connection(const Position& source, uint32_t scaling_factor, Axis axis = Axis::X);
std::vector<Position> expand(const Position& source, const ExpanderMorphology& params);
std::vector<Position> apply_vectors(const Position& source, const VectorsMorphology& params);
// Only exact elements constrain a source position
bool pattern_matches(const PatternTriple& pattern, const Position& position);
std::vector<Position> match_patterns(const Position& source, const Dimensions& destination_dims,
                                     const PatternsMorphology& params);
std::vector<Position> reduce(const Position& source, const ReducerMorphology& params);
std::vector<Position> random_targets(const Dimensions& destination_dims, const RandomMorphology& params,
                                     std::mt19937_64& rng);

std::vector<Position> evaluate_morphology(const Morphology& morphology, const Position& source,
                                          const Dimensions& source_dims, const Dimensions& destination_dims,
                                          std::mt19937_64& rng);

} // namespace cortexlib

#endif // CORTEXLIB_MORPHOLOGY_H
