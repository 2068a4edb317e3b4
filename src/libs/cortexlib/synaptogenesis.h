#ifndef CORTEXLIB_SYNAPTOGENESIS_H
#define CORTEXLIB_SYNAPTOGENESIS_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "types.h"
#include "errors.h"
#include "config.h"
#include "connectome.h"

namespace cortexlib {

struct SynaptogenesisResult {
    std::string source_area;
    std::string destination_area;
    std::string morphology;
    size_t sources_evaluated;
    size_t synapses_created;
    size_t destinations_dropped;

    SynaptogenesisResult() : sources_evaluated(0), synapses_created(0), destinations_dropped(0) {}
};

// Builds synapses from morphology rules. Every randomized decision draws from the
// engine's own generator, seeded at construction.
class SynaptogenesisEngine {
public:
    explicit SynaptogenesisEngine(uint64_t seed);

    // All-or-nothing per area pair. Throws SynaptogenesisError for an out-of-range
    // destination in strict mode and StorageExhausted when the batch cannot fit.
    SynaptogenesisResult apply_rule(Connectome& connectome, const SynaptogenesisRuleConfig& rule,
                                    uint64_t burst);

    // Applies each rule, collecting failures instead of stopping
    std::vector<SynaptogenesisResult> apply_rules(Connectome& connectome,
                                                  const std::vector<SynaptogenesisRuleConfig>& rules,
                                                  uint64_t burst, std::vector<BurstError>& errors);

    // Wires a freshly grown neuron through every rule touching its area
    size_t grow_neuron(Connectome& connectome, NeuronId neuron,
                       const std::vector<SynaptogenesisRuleConfig>& rules, uint64_t burst);

    // Explicit fan-in used for memory neurons; skips pairs that already exist
    size_t connect_neurons(Connectome& connectome, const std::vector<NeuronId>& sources,
                           NeuronId destination, const SynapseParams& params, uint64_t burst);

    std::mt19937_64& rng() { return rng_; }

private:
    struct Candidate {
        NeuronId source;
        NeuronId target;
    };

    // Collects candidates for one source neuron; throws SynaptogenesisError on a strict violation
    void collect(Connectome& connectome, const SynaptogenesisRuleConfig& rule, AreaId source_area,
                 AreaId destination_area, NeuronId source, const Position& source_position,
                 std::vector<Candidate>& candidates, SynaptogenesisResult& result);
    void commit(Connectome& connectome, const SynaptogenesisRuleConfig& rule,
                const std::vector<Candidate>& candidates, uint64_t burst);
    bool attracted(uint32_t attractivity);

    std::mt19937_64 rng_;
};

} // namespace cortexlib

#endif // CORTEXLIB_SYNAPTOGENESIS_H
