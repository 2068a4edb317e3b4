#ifndef CORTEXLIB_PLASTICITY_SERVICE_H
#define CORTEXLIB_PLASTICITY_SERVICE_H

#include <cstdint>
#include <vector>
#include "types.h"
#include "errors.h"
#include "config.h"
#include "connectome.h"
#include "fire_ledger.h"
#include "fire_structures.h"
#include "stdp.h"
#include "pattern_detector.h"
#include "memory_neurons.h"
#include "synaptogenesis.h"

namespace cortexlib {

struct PlasticityReport {
    size_t weights_updated;
    size_t patterns_detected;
    size_t memory_neurons_created;
    size_t memory_neurons_reactivated;
    size_t memory_neurons_retired;

    PlasticityReport()
        : weights_updated(0), patterns_detected(0), memory_neurons_created(0),
          memory_neurons_reactivated(0), memory_neurons_retired(0) {}
};

// Runs after archival: STDP, pattern detection and the memory neuron lifecycle
class PlasticityService {
public:
    PlasticityService(const PlasticityConfig& config, const Connectome& connectome);

    PlasticityReport process_burst(uint64_t burst, const FireQueue& fired, const FireLedger& ledger,
                                   Connectome& connectome, SynaptogenesisEngine& synaptogenesis,
                                   std::vector<BurstError>& errors);

    // Keeps the registry in step with neurons pruned from outside the lifecycle
    void neuron_removed(NeuronId id) { memory_.forget(id); }

    const StdpEngine& stdp() const { return stdp_; }
    const MemoryNeuronRegistry& memory_neurons() const { return memory_; }
    size_t detector_count() const { return bindings_.size(); }
    const PatternDetector& detector(size_t index) const { return bindings_.at(index).detector; }

private:
    struct MemoryBinding {
        AreaId memory_area;
        PatternDetector detector;
        uint64_t next_slot;

        MemoryBinding(AreaId area, const PatternDetector& d) : memory_area(area), detector(d), next_slot(0) {}
    };

    bool create_memory_neuron(uint64_t burst, MemoryBinding& binding, const TemporalPattern& pattern,
                              Connectome& connectome, SynaptogenesisEngine& synaptogenesis,
                              std::vector<BurstError>& errors);

    PlasticityConfig config_;
    StdpEngine stdp_;
    MemoryNeuronRegistry memory_;
    std::vector<MemoryBinding> bindings_;
};

} // namespace cortexlib

#endif // CORTEXLIB_PLASTICITY_SERVICE_H
