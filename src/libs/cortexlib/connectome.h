#ifndef CORTEXLIB_CONNECTOME_H
#define CORTEXLIB_CONNECTOME_H

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include "types.h"
#include "config.h"
#include "cortical_area.h"
#include "neuron_array.h"
#include "synapse_array.h"
#include "id_manager.h"
#include "spatial_hash.h"

namespace cortexlib {

using FloatNeuronArray = NeuronArray<float>;
using QuantizedNeuronArray = NeuronArray<QuantizedValue>;
using NeuronStorage = std::variant<FloatNeuronArray, QuantizedNeuronArray>;
using SynapseStorage = SynapseArray<>;

// Converts configured parameters into the active precision
template <typename T>
NeuronParams<T> make_neuron_params(const NeuronParamConfig& config, uint32_t& saturations) {
    using Traits = NeuralValueTraits<T>;
    NeuronParams<T> params;
    params.threshold = Traits::from_float(config.threshold, saturations);
    params.threshold_limit = Traits::from_float(config.threshold_limit, saturations);
    params.resting_potential = Traits::from_float(config.resting_potential, saturations);
    params.leak_coefficient = config.leak_coefficient;
    params.excitability = config.excitability;
    params.refractory_period = config.refractory_period;
    params.consecutive_fire_limit = config.consecutive_fire_limit;
    params.snooze_period = config.snooze_period;
    return params;
}

// Owns neuron and synapse storage, the cortical area registry and the spatial index.
// Not internally synchronized: the burst engine's guard protects it.
class Connectome {
public:
    // adjacency_capacity bounds the synapses the adjacency lists may index
    explicit Connectome(Precision precision, size_t adjacency_capacity = ActiveStorage::SYNAPSE_CAPACITY);
    Connectome(const Connectome&) = delete;
    Connectome& operator=(const Connectome&) = delete;

    Precision precision() const { return precision_; }

    // Areas
    AreaId add_area(const CorticalAreaConfig& config);
    size_t populate_area(AreaId area);
    const CorticalArea& area(AreaId area) const;
    const CorticalArea* find_area(const std::string& name) const;
    AreaId area_id(const std::string& name) const;
    const std::vector<CorticalArea>& areas() const { return areas_; }
    size_t area_count() const { return areas_.size(); }
    void set_area_metadata(AreaId area, const std::string& key, const std::string& value);

    // Neurons
    NeuronId add_neuron(AreaId area, const Position& position);
    NeuronId add_neuron(AreaId area, const Position& position, const NeuronParamConfig& params);
    // Retirements are stamped with the current burst
    void set_current_burst(uint64_t burst) { current_burst_ = burst; }
    uint64_t current_burst() const { return current_burst_; }
    void remove_neuron(NeuronId id);
    // Frees retired ids with no references that were retired at least hold_bursts ago
    std::vector<NeuronId> reclaim_retired(uint64_t hold_bursts = 0);
    bool is_live(NeuronId id) const;
    size_t neuron_count() const;
    size_t neuron_slots() const;
    size_t neuron_capacity_remaining() const;
    AreaId neuron_area(NeuronId id) const;
    Position neuron_position(NeuronId id) const;
    float membrane_potential(NeuronId id) const;
    void set_membrane_potential(NeuronId id, float value);
    uint32_t neuron_ref_count(NeuronId id) const { return neuron_ids_.ref_count(id); }
    size_t retired_pending() const { return neuron_ids_.pending_count(); }

    // Synapses
    SynapseId add_synapse(const SynapseRecord& record);
    void remove_synapse(SynapseId id);
    size_t remove_synapses_between(NeuronId source, NeuronId target);
    bool synapse_exists(NeuronId source, NeuronId target) const;
    size_t synapse_count() const { return synapses_.valid_count(); }
    size_t synapse_capacity_remaining() const;
    size_t adjacency_capacity() const { return adjacency_capacity_; }
    SynapseRecord synapse(SynapseId id) const;
    float synapse_weight(SynapseId id) const;
    void set_synapse_weight(SynapseId id, float weight);
    const std::vector<SynapseId>& outgoing(NeuronId id) const;
    const std::vector<SynapseId>& incoming(NeuronId id) const;

    // Raw storage for the burst engine
    NeuronStorage& neuron_storage() { return neurons_; }
    const NeuronStorage& neuron_storage() const { return neurons_; }
    const SynapseStorage& synapse_storage() const { return synapses_; }

    // Spatial queries (lazy rebuild)
    const AreaSpatialHash& spatial(AreaId area);
    const SpatialIndex& spatial_index() const { return spatial_; }
    NeuronId neuron_at(AreaId area, const Position& position);

    // Throws std::logic_error on a broken graph invariant
    void verify_integrity() const;

private:
    template <typename T>
    NeuronId insert_neuron(NeuronArray<T>& neurons, AreaId area, const Position& position,
                           const NeuronParamConfig& params);
    std::vector<SpatialEntry> area_population(AreaId area) const;
    void check_neuron(NeuronId id) const;
    void check_synapse(SynapseId id) const;
    void ensure_adjacency(NeuronId id);

    Precision precision_;
    NeuronStorage neurons_;
    SynapseStorage synapses_;
    std::vector<CorticalArea> areas_;
    std::unordered_map<std::string, AreaId> area_by_name_;
    IdManager neuron_ids_;
    IdManager synapse_ids_;
    std::vector<std::vector<SynapseId>> outgoing_;
    std::vector<std::vector<SynapseId>> incoming_;
    size_t adjacency_capacity_;
    size_t adjacency_entries_;
    uint64_t current_burst_;
    SpatialIndex spatial_;
};

} // namespace cortexlib

#endif // CORTEXLIB_CONNECTOME_H
