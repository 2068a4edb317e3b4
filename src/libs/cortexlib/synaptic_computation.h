#ifndef CORTEXLIB_SYNAPTIC_COMPUTATION_H
#define CORTEXLIB_SYNAPTIC_COMPUTATION_H

#include <vector>
#include "types.h"
#include "connectome.h"
#include "fire_structures.h"

namespace cortexlib {

inline float synaptic_contribution(float weight, float source_value, SynapseType type) {
    return polarity(type) * weight * source_value;
}

// One synapse to deliver this burst, with the source-side factor already resolved
struct PropagationItem {
    SynapseId synapse;
    float source_value;

    PropagationItem() : synapse(INVALID_SYNAPSE), source_value(0.0f) {}
    PropagationItem(SynapseId s, float value) : synapse(s), source_value(value) {}
};

// Reserves every shard for per_shard deliveries so a burst within that bound never reallocates
void reserve_propagation(std::vector<std::vector<PropagationItem>>& shards, size_t shard_count, size_t per_shard);

// Walks the fired neurons in id order and their outgoing synapses in storage order,
// splitting the deliveries by destination shard. Returns the number of synapses visited.
size_t partition_propagation(const Connectome& connectome, const FireQueue& fired,
                             size_t shard_count, std::vector<std::vector<PropagationItem>>& shards);

// Single pass over an ordered batch, accumulating straight into FCL slots. Every target in
// the batch must belong to the same FCL shard when batches run concurrently.
void accumulate_contributions(const SynapseStorage& synapses, const PropagationItem* items, size_t count,
                              FireCandidateList& fcl);

} // namespace cortexlib

#endif // CORTEXLIB_SYNAPTIC_COMPUTATION_H
