#include "connectome.h"
#include "errors.h"
#include <algorithm>
#include <limits>
#include <type_traits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace cortexlib {

static const std::vector<SynapseId> NO_SYNAPSES;

static void insert_sorted(std::vector<NeuronId>& ids, NeuronId id) {
    ids.insert(std::lower_bound(ids.begin(), ids.end(), id), id);
}

static size_t remaining(size_t capacity, size_t used) {
    return capacity == std::numeric_limits<size_t>::max() ? capacity : capacity - used;
}

Connectome::Connectome(Precision precision, size_t adjacency_capacity)
    : precision_(precision),
      adjacency_capacity_(adjacency_capacity),
      adjacency_entries_(0),
      current_burst_(0),
      spatial_([this](AreaId area) { return area_population(area); }) {
    if (precision == Precision::QUANTIZED16) {
        neurons_.emplace<QuantizedNeuronArray>();
    }
    if (ActiveStorage::NEURON_CAPACITY != std::numeric_limits<size_t>::max()) {
        outgoing_.reserve(ActiveStorage::NEURON_CAPACITY);
        incoming_.reserve(ActiveStorage::NEURON_CAPACITY);
    }
}

AreaId Connectome::add_area(const CorticalAreaConfig& config) {
    validate_area(config);
    if (area_by_name_.count(config.name)) {
        throw ConfigurationError("Duplicate cortical area '" + config.name + "'");
    }
    AreaId id = static_cast<AreaId>(areas_.size());
    areas_.emplace_back(id, config);
    area_by_name_[config.name] = id;
    spatial_.register_area(id, config.dimensions);

    spdlog::debug("Registered cortical area '{}' ({}x{}x{}, model {})", config.name,
                  config.dimensions.width, config.dimensions.height, config.dimensions.depth, config.model);
    return id;
}

size_t Connectome::populate_area(AreaId area_id) {
    const CorticalArea& target = area(area_id);
    const Dimensions dims = target.dimensions();
    const uint32_t per_voxel = target.config.neurons_per_voxel;
    const NeuronParamConfig params = target.config.neuron;

    size_t created = 0;
    for (uint32_t x = 0; x < dims.width; ++x) {
        for (uint32_t y = 0; y < dims.height; ++y) {
            for (uint32_t z = 0; z < dims.depth; ++z) {
                Position pos(static_cast<int32_t>(x), static_cast<int32_t>(y), static_cast<int32_t>(z));
                for (uint32_t n = 0; n < per_voxel; ++n) {
                    add_neuron(area_id, pos, params);
                    ++created;
                }
            }
        }
    }
    spdlog::info("Populated area '{}' with {} neurons", target.name(), created);
    return created;
}

const CorticalArea& Connectome::area(AreaId area) const {
    if (area >= areas_.size()) {
        throw std::out_of_range("Unknown area id " + std::to_string(area));
    }
    return areas_[area];
}

const CorticalArea* Connectome::find_area(const std::string& name) const {
    auto it = area_by_name_.find(name);
    return it == area_by_name_.end() ? nullptr : &areas_[it->second];
}

AreaId Connectome::area_id(const std::string& name) const {
    auto it = area_by_name_.find(name);
    if (it == area_by_name_.end()) {
        throw std::out_of_range("Unknown cortical area '" + name + "'");
    }
    return it->second;
}

void Connectome::set_area_metadata(AreaId area_id, const std::string& key, const std::string& value) {
    area(area_id);
    areas_[area_id].config.metadata[key] = value;
}

NeuronId Connectome::add_neuron(AreaId area_id, const Position& position) {
    return add_neuron(area_id, position, area(area_id).config.neuron);
}

NeuronId Connectome::add_neuron(AreaId area_id, const Position& position, const NeuronParamConfig& params) {
    const CorticalArea& target = area(area_id);
    if (!target.dimensions().contains(position)) {
        throw std::invalid_argument("Position (" + std::to_string(position.x) + ", " +
                                    std::to_string(position.y) + ", " + std::to_string(position.z) +
                                    ") lies outside area '" + target.name() + "'");
    }
    NeuronId id = std::visit([&](auto& neurons) { return insert_neuron(neurons, area_id, position, params); },
                             neurons_);
    ensure_adjacency(id);
    insert_sorted(areas_[area_id].neurons, id);
    spatial_.mark_dirty(area_id);
    return id;
}

template <typename T>
NeuronId Connectome::insert_neuron(NeuronArray<T>& neurons, AreaId area, const Position& position,
                                   const NeuronParamConfig& config) {
    uint32_t saturations = 0;
    NeuronParams<T> params = make_neuron_params<T>(config, saturations);
    if (saturations > 0) {
        spdlog::warn("Neuron parameters for area {} clamped to {} range", area, precision_name(precision_));
    }

    uint32_t id = 0;
    if (neuron_ids_.take_free(id)) {
        neurons.reset_slot(id, params, area, position);
        neuron_ids_.register_fresh(id);
        return id;
    }
    // Throws StorageExhausted before anything is modified
    id = neurons.append(params, area, position);
    neuron_ids_.register_fresh(id);
    return id;
}

void Connectome::remove_neuron(NeuronId id) {
    check_neuron(id);

    // Copies: remove_synapse edits the adjacency lists
    std::vector<SynapseId> out = outgoing_[id];
    std::vector<SynapseId> in = incoming_[id];
    for (SynapseId s : out) {
        remove_synapse(s);
    }
    for (SynapseId s : in) {
        if (synapses_.is_valid(s)) {
            remove_synapse(s);
        }
    }

    AreaId area_id = neuron_area(id);
    auto& members = areas_[area_id].neurons;
    auto it = std::lower_bound(members.begin(), members.end(), id);
    if (it != members.end() && *it == id) {
        members.erase(it);
    }

    std::visit([id](auto& neurons) { neurons.invalidate(id); }, neurons_);
    neuron_ids_.retire(id, current_burst_);
    spatial_.mark_dirty(area_id);
}

std::vector<NeuronId> Connectome::reclaim_retired(uint64_t hold_bursts) {
    return neuron_ids_.reclaim(current_burst_, hold_bursts);
}

bool Connectome::is_live(NeuronId id) const {
    bool valid = std::visit([id](const auto& neurons) { return neurons.is_valid(id); }, neurons_);
    return valid && !neuron_ids_.is_retired(id);
}

size_t Connectome::neuron_count() const {
    return std::visit([](const auto& neurons) { return neurons.valid_count(); }, neurons_);
}

size_t Connectome::neuron_slots() const {
    return std::visit([](const auto& neurons) { return neurons.size(); }, neurons_);
}

size_t Connectome::neuron_capacity_remaining() const {
    size_t capacity = std::visit([](const auto& neurons) { return neurons.capacity(); }, neurons_);
    size_t free_slots = neuron_ids_.free_count();
    size_t tail = remaining(capacity, neuron_slots());
    return tail == std::numeric_limits<size_t>::max() ? tail : tail + free_slots;
}

AreaId Connectome::neuron_area(NeuronId id) const {
    check_neuron(id);
    return std::visit([id](const auto& neurons) { return neurons.area(id); }, neurons_);
}

Position Connectome::neuron_position(NeuronId id) const {
    check_neuron(id);
    return std::visit([id](const auto& neurons) { return neurons.position(id); }, neurons_);
}

float Connectome::membrane_potential(NeuronId id) const {
    check_neuron(id);
    return std::visit([id](const auto& neurons) {
        using Array = std::decay_t<decltype(neurons)>;
        return Array::Traits::to_float(neurons.membrane_potential(id));
    }, neurons_);
}

void Connectome::set_membrane_potential(NeuronId id, float value) {
    check_neuron(id);
    std::visit([id, value](auto& neurons) {
        using Array = std::decay_t<decltype(neurons)>;
        uint32_t saturations = 0;
        neurons.set_membrane_potential(id, Array::Traits::from_float(value, saturations));
    }, neurons_);
}

SynapseId Connectome::add_synapse(const SynapseRecord& record) {
    if (!is_live(record.source) || !is_live(record.target)) {
        throw std::invalid_argument("Synapse endpoints " + std::to_string(record.source) + " -> " +
                                    std::to_string(record.target) + " must be live neurons");
    }
    if (!(record.weight >= 0.0f)) {
        throw std::invalid_argument("Synapse weight must be a non-negative magnitude");
    }
    if (adjacency_entries_ >= adjacency_capacity_) {
        throw StorageExhausted("Adjacency lists are full", adjacency_capacity_);
    }

    uint32_t id = 0;
    if (synapse_ids_.take_free(id)) {
        synapses_.reset_slot(id, record);
    } else {
        id = synapses_.append(record);
    }
    synapse_ids_.register_fresh(id);

    outgoing_[record.source].push_back(id);
    incoming_[record.target].push_back(id);
    ++adjacency_entries_;
    neuron_ids_.add_ref(record.source);
    neuron_ids_.add_ref(record.target);
    return id;
}

void Connectome::remove_synapse(SynapseId id) {
    check_synapse(id);
    NeuronId source = synapses_.source(id);
    NeuronId target = synapses_.target(id);

    auto& out = outgoing_[source];
    out.erase(std::find(out.begin(), out.end(), id));
    auto& in = incoming_[target];
    in.erase(std::find(in.begin(), in.end(), id));
    --adjacency_entries_;

    synapses_.invalidate(id);
    neuron_ids_.release_ref(source);
    neuron_ids_.release_ref(target);
    synapse_ids_.retire(id);
    synapse_ids_.reclaim();
}

size_t Connectome::remove_synapses_between(NeuronId source, NeuronId target) {
    check_neuron(source);
    std::vector<SynapseId> matches;
    for (SynapseId s : outgoing_[source]) {
        if (synapses_.target(s) == target) {
            matches.push_back(s);
        }
    }
    for (SynapseId s : matches) {
        remove_synapse(s);
    }
    return matches.size();
}

bool Connectome::synapse_exists(NeuronId source, NeuronId target) const {
    if (source >= outgoing_.size()) {
        return false;
    }
    for (SynapseId s : outgoing_[source]) {
        if (synapses_.target(s) == target) {
            return true;
        }
    }
    return false;
}

size_t Connectome::synapse_capacity_remaining() const {
    size_t tail = remaining(synapses_.capacity(), synapses_.size());
    size_t storage = tail == std::numeric_limits<size_t>::max() ? tail : tail + synapse_ids_.free_count();
    return std::min(storage, remaining(adjacency_capacity_, adjacency_entries_));
}

SynapseRecord Connectome::synapse(SynapseId id) const {
    check_synapse(id);
    return synapses_.record(id);
}

float Connectome::synapse_weight(SynapseId id) const {
    check_synapse(id);
    return synapses_.weight(id);
}

void Connectome::set_synapse_weight(SynapseId id, float weight) {
    check_synapse(id);
    if (!(weight >= 0.0f)) {
        throw std::invalid_argument("Synapse weight must be a non-negative magnitude");
    }
    synapses_.set_weight(id, weight);
}

const std::vector<SynapseId>& Connectome::outgoing(NeuronId id) const {
    return id < outgoing_.size() ? outgoing_[id] : NO_SYNAPSES;
}

const std::vector<SynapseId>& Connectome::incoming(NeuronId id) const {
    return id < incoming_.size() ? incoming_[id] : NO_SYNAPSES;
}

const AreaSpatialHash& Connectome::spatial(AreaId area) {
    return spatial_.area(area);
}

NeuronId Connectome::neuron_at(AreaId area, const Position& position) {
    const auto& ids = spatial(area).neurons_at(position);
    return ids.empty() ? INVALID_NEURON : ids.front();
}

void Connectome::verify_integrity() const {
    const size_t slots = synapses_.size();
    for (SynapseId s = 0; s < slots; ++s) {
        if (!synapses_.is_valid(s)) {
            continue;
        }
        if (!is_live(synapses_.source(s)) || !is_live(synapses_.target(s))) {
            spdlog::critical("Synapse {} references a freed neuron ({} -> {})", s,
                             synapses_.source(s), synapses_.target(s));
            throw std::logic_error("Connectome corrupted: synapse " + std::to_string(s) +
                                   " references a freed neuron");
        }
    }
    for (const auto& a : areas_) {
        for (NeuronId id : a.neurons) {
            if (!is_live(id) || !a.dimensions().contains(neuron_position(id))) {
                spdlog::critical("Neuron {} of area '{}' is dead or outside its area", id, a.name());
                throw std::logic_error("Connectome corrupted: neuron " + std::to_string(id) +
                                       " is inconsistent with area '" + a.name() + "'");
            }
        }
    }
}

std::vector<SpatialEntry> Connectome::area_population(AreaId area_id) const {
    const CorticalArea& target = area(area_id);
    std::vector<SpatialEntry> population;
    population.reserve(target.neurons.size());
    std::visit([&](const auto& neurons) {
        for (NeuronId id : target.neurons) {
            population.emplace_back(id, neurons.position(id));
        }
    }, neurons_);
    return population;
}

void Connectome::check_neuron(NeuronId id) const {
    bool valid = std::visit([id](const auto& neurons) { return neurons.is_valid(id); }, neurons_);
    if (!valid) {
        throw std::out_of_range("Neuron " + std::to_string(id) + " is not live");
    }
}

void Connectome::check_synapse(SynapseId id) const {
    if (!synapses_.is_valid(id)) {
        throw std::out_of_range("Synapse " + std::to_string(id) + " is not live");
    }
}

void Connectome::ensure_adjacency(NeuronId id) {
    if (id >= outgoing_.size()) {
        outgoing_.resize(static_cast<size_t>(id) + 1);
        incoming_.resize(static_cast<size_t>(id) + 1);
    }
}

} // namespace cortexlib
