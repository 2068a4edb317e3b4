#include "synaptic_computation.h"

namespace cortexlib {

void reserve_propagation(std::vector<std::vector<PropagationItem>>& shards, size_t shard_count, size_t per_shard) {
    shards.resize(shard_count);
    for (auto& shard : shards) {
        shard.reserve(per_shard);
    }
}

size_t partition_propagation(const Connectome& connectome, const FireQueue& fired,
                             size_t shard_count, std::vector<std::vector<PropagationItem>>& shards) {
    shards.resize(shard_count);
    for (auto& shard : shards) {
        shard.clear();
    }

    const SynapseStorage& synapses = connectome.synapse_storage();
    size_t visited = 0;
    for (const FiredNeuron& neuron : fired) {
        // Retired since it fired
        if (!connectome.is_live(neuron.id)) {
            continue;
        }
        const auto& outgoing = connectome.outgoing(neuron.id);
        if (outgoing.empty()) {
            continue;
        }
        const CorticalArea& area = connectome.area(neuron.area);
        float divisor = area.config.psp_uniform_distribution ? 1.0f : static_cast<float>(outgoing.size());

        for (SynapseId s : outgoing) {
            float source_value = area.config.mp_driven_psp ? neuron.membrane_potential : synapses.psp(s);
            NeuronId target = synapses.target(s);
            shards[FireCandidateList::shard_of(target, shard_count)].emplace_back(s, source_value / divisor);
            ++visited;
        }
    }
    return visited;
}

void accumulate_contributions(const SynapseStorage& synapses, const PropagationItem* items, size_t count,
                              FireCandidateList& fcl) {
    for (size_t i = 0; i < count; ++i) {
        const PropagationItem& item = items[i];
        fcl.accumulate(synapses.target(item.synapse),
                       synaptic_contribution(synapses.weight(item.synapse), item.source_value,
                                             synapses.type(item.synapse)));
    }
}

} // namespace cortexlib
