#ifndef CORTEXLIB_CONFIG_H
#define CORTEXLIB_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "types.h"
#include "morphology.h"

namespace cortexlib {

struct NeuronParamConfig {
    float threshold;
    float threshold_limit;
    float leak_coefficient;
    float resting_potential;
    float excitability;
    uint16_t refractory_period;
    uint16_t consecutive_fire_limit;
    uint16_t snooze_period;

    NeuronParamConfig()
        : threshold(1.0f), threshold_limit(0.0f), leak_coefficient(0.1f), resting_potential(0.0f),
          excitability(1.0f), refractory_period(0), consecutive_fire_limit(0), snooze_period(0) {}
};

struct CorticalAreaConfig {
    std::string name;
    Dimensions dimensions;
    std::string model;
    NeuronParamConfig neuron;
    uint32_t neurons_per_voxel;
    bool populate;
    bool mp_driven_psp;
    bool psp_uniform_distribution;
    std::map<std::string, std::string> metadata;

    CorticalAreaConfig()
        : model("lif"), neurons_per_voxel(1), populate(true),
          mp_driven_psp(false), psp_uniform_distribution(true) {}
    CorticalAreaConfig(const std::string& n, const Dimensions& dims, const std::string& m = "lif")
        : name(n), dimensions(dims), model(m), neurons_per_voxel(1), populate(true),
          mp_driven_psp(false), psp_uniform_distribution(true) {}
};

struct SynapseParams {
    float weight;
    float psp;
    SynapseType type;
    bool plastic;

    SynapseParams() : weight(1.0f), psp(1.0f), type(SynapseType::EXCITATORY), plastic(false) {}
    SynapseParams(float w, float p, SynapseType t = SynapseType::EXCITATORY, bool is_plastic = false)
        : weight(w), psp(p), type(t), plastic(is_plastic) {}
};

struct SynaptogenesisRuleConfig {
    std::string source_area;
    std::string destination_area;
    Morphology morphology;
    SynapseParams synapse;
    uint32_t attractivity;   // percent chance each candidate synapse is kept
    bool strict;

    SynaptogenesisRuleConfig() : attractivity(100), strict(false) {}
    SynaptogenesisRuleConfig(const std::string& src, const std::string& dst, const Morphology& m)
        : source_area(src), destination_area(dst), morphology(m), attractivity(100), strict(false) {}
};

struct StdpConfig {
    bool enabled;
    uint32_t window;
    float tau;
    float potentiation_rate;
    float depression_rate;
    float weight_min;
    float weight_max;

    StdpConfig()
        : enabled(true), window(20), tau(4.0f), potentiation_rate(0.05f), depression_rate(0.06f),
          weight_min(0.0f), weight_max(10.0f) {}
};

struct PatternDetectorConfig {
    uint32_t temporal_depth;
    uint32_t min_member_support;
    uint32_t min_pattern_size;
    uint32_t confirmation_count;
    size_t max_pattern_cache;

    PatternDetectorConfig()
        : temporal_depth(3), min_member_support(1), min_pattern_size(2),
          confirmation_count(3), max_pattern_cache(10000) {}
};

struct MemoryLifecycleConfig {
    uint32_t initial_lifespan;
    uint32_t lifespan_growth;
    uint32_t longterm_threshold;
    float synapse_weight;
    float synapse_psp;

    MemoryLifecycleConfig()
        : initial_lifespan(20), lifespan_growth(3), longterm_threshold(100),
          synapse_weight(1.0f), synapse_psp(1.0f) {}
};

struct MemoryAreaConfig {
    std::string memory_area;
    std::vector<std::string> upstream_areas;
};

struct PlasticityConfig {
    StdpConfig stdp;
    PatternDetectorConfig patterns;
    MemoryLifecycleConfig memory;
    std::vector<MemoryAreaConfig> memory_areas;
};

struct EngineConfig {
    Precision precision;
    size_t ledger_capacity;
    size_t worker_threads;
    size_t shard_count;
    uint64_t rng_seed;
    float target_frequency_hz;          // zero runs unthrottled
    size_t intake_queue_capacity;
    uint32_t intake_poll_timeout_ms;
    size_t max_intake_per_burst;
    bool pin_worker_threads;

    EngineConfig()
        : precision(Precision::FLOAT32), ledger_capacity(64), worker_threads(1), shard_count(4),
          rng_seed(12345), target_frequency_hz(0.0f), intake_queue_capacity(4096),
          intake_poll_timeout_ms(0), max_intake_per_burst(4096), pin_worker_threads(false) {}
};

struct GenomeConfig {
    std::vector<CorticalAreaConfig> areas;
    std::vector<SynaptogenesisRuleConfig> rules;
    PlasticityConfig plasticity;
    EngineConfig engine;
};

// Throws ConfigurationError describing the first problem found
void validate_area(const CorticalAreaConfig& area);
void validate_genome(const GenomeConfig& genome);

Precision parse_precision(const std::string& name);
const char* precision_name(Precision precision);

} // namespace cortexlib

#endif // CORTEXLIB_CONFIG_H
