#include "config.h"
#include "errors.h"
#include "morton.h"
#include "neuron_models.h"
#include <cmath>
#include <set>

namespace cortexlib {

static void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

static void validate_neuron_params(const std::string& area, const NeuronParamConfig& params) {
    require(std::isfinite(params.threshold), "Area '" + area + "': threshold must be finite");
    require(std::isfinite(params.threshold_limit) && params.threshold_limit >= 0.0f,
            "Area '" + area + "': threshold_limit must be finite and non-negative");
    require(params.threshold_limit == 0.0f || params.threshold_limit >= params.threshold,
            "Area '" + area + "': threshold_limit must not be below threshold");
    require(params.leak_coefficient >= 0.0f && params.leak_coefficient <= 1.0f,
            "Area '" + area + "': leak_coefficient must lie in [0, 1]");
    require(std::isfinite(params.resting_potential), "Area '" + area + "': resting_potential must be finite");
    require(params.excitability >= 0.0f && params.excitability <= 1.0f,
            "Area '" + area + "': excitability must lie in [0, 1]");
}

void validate_area(const CorticalAreaConfig& area) {
    require(!area.name.empty(), "Cortical area name must not be empty");
    const Dimensions& dims = area.dimensions;
    require(dims.width > 0 && dims.height > 0 && dims.depth > 0,
            "Area '" + area.name + "': dimensions must be positive");
    require(dims.width <= MORTON_MAX_COORDINATE + 1 && dims.height <= MORTON_MAX_COORDINATE + 1 &&
            dims.depth <= MORTON_MAX_COORDINATE + 1,
            "Area '" + area.name + "': dimensions exceed the spatial index range");
    require(is_known_neuron_model(area.model),
            "Area '" + area.name + "': unknown neuron model '" + area.model + "'");
    require(area.neurons_per_voxel > 0, "Area '" + area.name + "': neurons_per_voxel must be positive");
    validate_neuron_params(area.name, area.neuron);
}

void validate_genome(const GenomeConfig& genome) {
    std::set<std::string> names;
    for (const auto& area : genome.areas) {
        validate_area(area);
        require(names.insert(area.name).second, "Duplicate cortical area '" + area.name + "'");
    }

    for (const auto& rule : genome.rules) {
        std::string label = rule.source_area + " -> " + rule.destination_area;
        require(names.count(rule.source_area) > 0, "Rule " + label + ": unknown source area");
        require(names.count(rule.destination_area) > 0, "Rule " + label + ": unknown destination area");
        require(rule.attractivity >= 1 && rule.attractivity <= 100,
                "Rule " + label + ": attractivity must lie in [1, 100]");
        require(std::isfinite(rule.synapse.weight) && rule.synapse.weight >= 0.0f,
                "Rule " + label + ": synapse weight must be a non-negative magnitude");
        require(std::isfinite(rule.synapse.psp), "Rule " + label + ": psp must be finite");
        validate_morphology(rule.morphology);
    }

    const StdpConfig& stdp = genome.plasticity.stdp;
    require(stdp.window > 0, "STDP window must be positive");
    require(stdp.tau > 0.0f, "STDP tau must be positive");
    require(stdp.potentiation_rate >= 0.0f && stdp.depression_rate >= 0.0f, "STDP rates must be non-negative");
    require(stdp.weight_min >= 0.0f && stdp.weight_min <= stdp.weight_max,
            "STDP weight bounds must satisfy 0 <= min <= max");

    const PatternDetectorConfig& patterns = genome.plasticity.patterns;
    require(patterns.temporal_depth > 0, "Pattern temporal depth must be positive");
    require(patterns.min_member_support > 0 && patterns.min_member_support <= patterns.temporal_depth,
            "Pattern member support must lie in [1, temporal_depth]");
    require(patterns.min_pattern_size > 0, "Pattern size must be positive");
    require(patterns.confirmation_count > 0, "Pattern confirmation count must be positive");
    require(patterns.max_pattern_cache > 0, "Pattern cache size must be positive");

    const MemoryLifecycleConfig& memory = genome.plasticity.memory;
    require(memory.initial_lifespan > 0, "Memory neuron lifespan must be positive");
    require(memory.synapse_weight >= 0.0f, "Memory synapse weight must be non-negative");

    for (const auto& binding : genome.plasticity.memory_areas) {
        require(names.count(binding.memory_area) > 0,
                "Unknown memory area '" + binding.memory_area + "'");
        require(!binding.upstream_areas.empty(),
                "Memory area '" + binding.memory_area + "' needs upstream areas");
        for (const auto& upstream : binding.upstream_areas) {
            require(names.count(upstream) > 0, "Unknown upstream area '" + upstream + "'");
            require(upstream != binding.memory_area, "Memory area '" + upstream + "' cannot feed itself");
        }
        require(genome.plasticity.patterns.temporal_depth <= genome.engine.ledger_capacity,
                "Pattern temporal depth exceeds ledger capacity");
    }

    const EngineConfig& engine = genome.engine;
    require(engine.ledger_capacity > 0, "Ledger capacity must be positive");
    require(engine.worker_threads > 0, "Worker thread count must be positive");
    require(engine.shard_count > 0, "Shard count must be positive");
    require(engine.target_frequency_hz >= 0.0f, "Target frequency must be non-negative");
    require(engine.intake_queue_capacity > 0, "Intake queue capacity must be positive");
    require(engine.max_intake_per_burst > 0, "Max intake per burst must be positive");
}

Precision parse_precision(const std::string& name) {
    if (name == "float32") {
        return Precision::FLOAT32;
    }
    if (name == "quantized16") {
        return Precision::QUANTIZED16;
    }
    throw ConfigurationError("Unknown precision '" + name + "'");
}

const char* precision_name(Precision precision) {
    return precision == Precision::QUANTIZED16 ? "quantized16" : "float32";
}

} // namespace cortexlib
