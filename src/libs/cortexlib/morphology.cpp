#include "morphology.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace cortexlib {

static std::vector<int32_t> project_axis(int32_t location, uint32_t source_dim, uint32_t destination_dim) {
    std::vector<int32_t> targets;
    if (source_dim > destination_dim) {
        double ratio = static_cast<double>(source_dim) / destination_dim;
        int32_t target = static_cast<int32_t>(std::floor(location / ratio));
        targets.push_back(std::min(target, static_cast<int32_t>(destination_dim) - 1));
    } else if (source_dim < destination_dim) {
        double ratio = static_cast<double>(destination_dim) / source_dim;
        for (uint32_t v = 0; v < destination_dim; ++v) {
            if (static_cast<int32_t>(std::floor(v / ratio)) == location) {
                targets.push_back(static_cast<int32_t>(v));
            }
        }
    } else {
        targets.push_back(location);
    }
    return targets;
}

static std::vector<Position> cartesian(const std::array<std::vector<int32_t>, 3>& axes) {
    std::vector<Position> result;
    result.reserve(axes[0].size() * axes[1].size() * axes[2].size());
    for (int32_t x : axes[0]) {
        for (int32_t y : axes[1]) {
            for (int32_t z : axes[2]) {
                result.emplace_back(x, y, z);
            }
        }
    }
    return result;
}

static void check_transpose(const std::array<int, 3>& transpose) {
    std::array<int, 3> sorted = transpose;
    std::sort(sorted.begin(), sorted.end());
    if (sorted[0] != 0 || sorted[1] != 1 || sorted[2] != 2) {
        throw std::invalid_argument("Projector transpose must be a permutation of (0, 1, 2)");
    }
}

const char* morphology_name(const Morphology& morphology) {
    struct Namer {
        const char* operator()(const ProjectorMorphology&) const { return "projector"; }
        const char* operator()(const BlockConnectionMorphology&) const { return "block_connection"; }
        const char* operator()(const ExpanderMorphology&) const { return "expander"; }
        const char* operator()(const VectorsMorphology&) const { return "vectors"; }
        const char* operator()(const PatternsMorphology&) const { return "patterns"; }
        const char* operator()(const ReducerMorphology&) const { return "reducer"; }
        const char* operator()(const RandomMorphology&) const { return "random"; }
    };
    return std::visit(Namer{}, morphology);
}

bool morphology_is_randomized(const Morphology& morphology) {
    return std::holds_alternative<RandomMorphology>(morphology);
}

void validate_morphology(const Morphology& morphology) {
    if (auto* projector = std::get_if<ProjectorMorphology>(&morphology)) {
        try {
            check_transpose(projector->transpose);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(e.what());
        }
        if (projector->project_last_layer_of > 2) {
            throw ConfigurationError("project_last_layer_of must name an axis (0-2) or be negative");
        }
    } else if (auto* block = std::get_if<BlockConnectionMorphology>(&morphology)) {
        if (block->scaling_factor == 0) {
            throw ConfigurationError("Block connection scaling factor must be positive");
        }
    } else if (auto* expander = std::get_if<ExpanderMorphology>(&morphology)) {
        if (expander->scaling_factor == 0) {
            throw ConfigurationError("Expander scaling factor must be positive");
        }
    } else if (auto* vectors = std::get_if<VectorsMorphology>(&morphology)) {
        if (vectors->offsets.empty()) {
            throw ConfigurationError("Vectors morphology needs at least one offset");
        }
    } else if (auto* patterns = std::get_if<PatternsMorphology>(&morphology)) {
        if (patterns->rules.empty()) {
            throw ConfigurationError("Patterns morphology needs at least one rule");
        }
    } else if (auto* random = std::get_if<RandomMorphology>(&morphology)) {
        if (random->connections_per_neuron == 0) {
            throw ConfigurationError("Random morphology needs at least one connection per neuron");
        }
    }
}

std::vector<Position> project(const Position& source, const Dimensions& source_dims,
                              const Dimensions& destination_dims, const ProjectorMorphology& params) {
    if (!source_dims.contains(source)) {
        throw std::out_of_range("Projector source (" + std::to_string(source.x) + ", " +
                                std::to_string(source.y) + ", " + std::to_string(source.z) +
                                ") lies outside the source area");
    }
    check_transpose(params.transpose);

    int last = params.project_last_layer_of;
    std::array<std::vector<int32_t>, 3> axes;
    for (int i = 0; i < 3; ++i) {
        int source_axis = params.transpose[i];
        if (i == last) {
            axes[i].push_back(0);
            continue;
        }
        axes[i] = project_axis(source.axis(source_axis), source_dims.axis(source_axis),
                               destination_dims.axis(i));
    }
    return cartesian(axes);
}

std::vector<std::vector<Position>> project_batch(const std::vector<Position>& sources,
                                                 const Dimensions& source_dims,
                                                 const Dimensions& destination_dims,
                                                 const ProjectorMorphology& params) {
    std::vector<std::vector<Position>> result;
    result.reserve(sources.size());
    for (const auto& source : sources) {
        result.push_back(project(source, source_dims, destination_dims, params));
    }
    return result;
}

Position block_connection(const Position& source, uint32_t scaling_factor, Axis axis) {
    if (scaling_factor == 0) {
        throw std::invalid_argument("Block connection scaling factor must be positive");
    }
    Position destination = source;
    int index = static_cast<int>(axis);
    destination.set_axis(index, source.axis(index) / static_cast<int32_t>(scaling_factor));
    return destination;
}

std::vector<Position> expand(const Position& source, const ExpanderMorphology& params) {
    if (params.scaling_factor == 0) {
        throw std::invalid_argument("Expander scaling factor must be positive");
    }
    std::vector<Position> result;
    result.reserve(params.scaling_factor);
    int index = static_cast<int>(params.axis);
    int32_t factor = static_cast<int32_t>(params.scaling_factor);
    for (int32_t offset = 0; offset < factor; ++offset) {
        Position destination = source;
        destination.set_axis(index, source.axis(index) * factor + offset);
        result.push_back(destination);
    }
    return result;
}

std::vector<Position> apply_vectors(const Position& source, const VectorsMorphology& params) {
    std::vector<Position> result;
    result.reserve(params.offsets.size());
    for (const auto& offset : params.offsets) {
        result.emplace_back(source.x + offset.x, source.y + offset.y, source.z + offset.z);
    }
    return result;
}

bool pattern_matches(const PatternTriple& pattern, const Position& position) {
    for (int i = 0; i < 3; ++i) {
        const PatternElement& element = pattern[i];
        switch (element.kind) {
            case PatternElementKind::EXACT:
                if (position.axis(i) != element.value) return false;
                break;
            case PatternElementKind::WILDCARD:
            case PatternElementKind::SKIP:
            case PatternElementKind::EXCLUDE:
                break;
        }
    }
    return true;
}

std::vector<Position> match_patterns(const Position& source, const Dimensions& destination_dims,
                                     const PatternsMorphology& params) {
    std::vector<Position> result;
    for (const auto& rule : params.rules) {
        if (!pattern_matches(rule.source, source)) {
            continue;
        }
        std::array<std::vector<int32_t>, 3> axes;
        for (int i = 0; i < 3; ++i) {
            const PatternElement& element = rule.destination[i];
            int32_t extent = static_cast<int32_t>(destination_dims.axis(i));
            switch (element.kind) {
                case PatternElementKind::EXACT:
                    axes[i].push_back(element.value);
                    break;
                case PatternElementKind::SKIP:
                    axes[i].push_back(source.axis(i));
                    break;
                case PatternElementKind::WILDCARD:
                case PatternElementKind::EXCLUDE:
                    for (int32_t v = 0; v < extent; ++v) {
                        if (element.kind == PatternElementKind::EXCLUDE && v == source.axis(i)) {
                            continue;
                        }
                        axes[i].push_back(v);
                    }
                    break;
            }
        }
        std::vector<Position> expanded = cartesian(axes);
        result.insert(result.end(), expanded.begin(), expanded.end());
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<Position> reduce(const Position& source, const ReducerMorphology& params) {
    std::vector<Position> result;
    if (source.x < 0) {
        return result;
    }
    uint32_t bits = static_cast<uint32_t>(source.x);
    for (int32_t bit = 0; bits != 0; ++bit, bits >>= 1) {
        if (bits & 1u) {
            result.emplace_back(bit, params.destination_y, params.destination_z);
        }
    }
    return result;
}

std::vector<Position> random_targets(const Dimensions& destination_dims, const RandomMorphology& params,
                                     std::mt19937_64& rng) {
    std::uniform_int_distribution<int32_t> x_dist(0, static_cast<int32_t>(destination_dims.width) - 1);
    std::uniform_int_distribution<int32_t> y_dist(0, static_cast<int32_t>(destination_dims.height) - 1);
    std::uniform_int_distribution<int32_t> z_dist(0, static_cast<int32_t>(destination_dims.depth) - 1);

    std::vector<Position> result;
    result.reserve(params.connections_per_neuron);
    for (uint32_t i = 0; i < params.connections_per_neuron; ++i) {
        int32_t x = x_dist(rng);
        int32_t y = y_dist(rng);
        int32_t z = z_dist(rng);
        result.emplace_back(x, y, z);
    }
    return result;
}

std::vector<Position> evaluate_morphology(const Morphology& morphology, const Position& source,
                                          const Dimensions& source_dims, const Dimensions& destination_dims,
                                          std::mt19937_64& rng) {
    if (auto* projector = std::get_if<ProjectorMorphology>(&morphology)) {
        return project(source, source_dims, destination_dims, *projector);
    }
    if (auto* block = std::get_if<BlockConnectionMorphology>(&morphology)) {
        return {block_connection(source, block->scaling_factor, block->axis)};
    }
    if (auto* expander = std::get_if<ExpanderMorphology>(&morphology)) {
        return expand(source, *expander);
    }
    if (auto* vectors = std::get_if<VectorsMorphology>(&morphology)) {
        return apply_vectors(source, *vectors);
    }
    if (auto* patterns = std::get_if<PatternsMorphology>(&morphology)) {
        return match_patterns(source, destination_dims, *patterns);
    }
    if (auto* reducer = std::get_if<ReducerMorphology>(&morphology)) {
        return reduce(source, *reducer);
    }
    return random_targets(destination_dims, std::get<RandomMorphology>(morphology), rng);
}

} // namespace cortexlib
