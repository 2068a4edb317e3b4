#include "plasticity_service.h"
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace cortexlib {

static Position slot_position(uint64_t slot, const Dimensions& dims) {
    uint64_t index = slot % dims.volume();
    uint32_t x = static_cast<uint32_t>(index % dims.width);
    uint32_t y = static_cast<uint32_t>((index / dims.width) % dims.height);
    uint32_t z = static_cast<uint32_t>(index / (static_cast<uint64_t>(dims.width) * dims.height));
    return Position(static_cast<int32_t>(x), static_cast<int32_t>(y), static_cast<int32_t>(z));
}

PlasticityService::PlasticityService(const PlasticityConfig& config, const Connectome& connectome)
    : config_(config), stdp_(config.stdp), memory_(config.memory) {
    for (const auto& binding : config.memory_areas) {
        const CorticalArea* memory_area = connectome.find_area(binding.memory_area);
        if (memory_area == nullptr) {
            throw ConfigurationError("Unknown memory area '" + binding.memory_area + "'");
        }
        std::unordered_set<AreaId> upstream;
        for (const auto& name : binding.upstream_areas) {
            const CorticalArea* area = connectome.find_area(name);
            if (area == nullptr) {
                throw ConfigurationError("Unknown upstream area '" + name + "'");
            }
            upstream.insert(area->id);
        }
        bindings_.emplace_back(memory_area->id, PatternDetector(config.patterns, upstream));
    }
}

PlasticityReport PlasticityService::process_burst(uint64_t burst, const FireQueue& fired,
                                                  const FireLedger& ledger, Connectome& connectome,
                                                  SynaptogenesisEngine& synaptogenesis,
                                                  std::vector<BurstError>& errors) {
    PlasticityReport report;
    report.weights_updated = stdp_.apply(burst, fired, ledger, connectome);

    // A memory neuron that fires counts as recalled
    for (const FiredNeuron& neuron : fired) {
        if (memory_.find(neuron.id) != nullptr && memory_.reactivate(neuron.id, burst)) {
            ++report.memory_neurons_reactivated;
        }
    }

    auto area_of = [&connectome](NeuronId id) {
        return connectome.is_live(id) ? connectome.neuron_area(id) : INVALID_AREA;
    };

    for (auto& binding : bindings_) {
        TemporalPattern pattern;
        if (!binding.detector.detect(burst, ledger, area_of, pattern)) {
            continue;
        }
        ++report.patterns_detected;

        const MemoryNeuronRecord* existing = memory_.find_by_pattern(binding.memory_area, pattern.hash);
        if (existing != nullptr) {
            if (existing->last_active_burst != burst && memory_.reactivate(existing->id, burst)) {
                ++report.memory_neurons_reactivated;
            }
            continue;
        }
        if (binding.detector.confirmed() &&
            create_memory_neuron(burst, binding, pattern, connectome, synaptogenesis, errors)) {
            ++report.memory_neurons_created;
        }
    }

    for (const auto& record : memory_.collect_expired(burst)) {
        if (connectome.is_live(record.id)) {
            connectome.remove_neuron(record.id);
        }
        ++report.memory_neurons_retired;
        spdlog::debug("Retired memory neuron {} after {} idle bursts", record.id,
                      burst - record.last_active_burst);
    }
    return report;
}

bool PlasticityService::create_memory_neuron(uint64_t burst, MemoryBinding& binding,
                                             const TemporalPattern& pattern, Connectome& connectome,
                                             SynaptogenesisEngine& synaptogenesis,
                                             std::vector<BurstError>& errors) {
    const Dimensions dims = connectome.area(binding.memory_area).dimensions();
    NeuronId id = INVALID_NEURON;
    try {
        id = connectome.add_neuron(binding.memory_area, slot_position(binding.next_slot, dims));
    } catch (const StorageExhausted& e) {
        spdlog::warn("Memory neuron for pattern {:016x} not created: {}", pattern.hash, e.what());
        errors.emplace_back(BurstErrorKind::STORAGE_EXHAUSTED, e.what());
        return false;
    }

    SynapseParams params(config_.memory.synapse_weight, config_.memory.synapse_psp, SynapseType::EXCITATORY);
    try {
        synaptogenesis.connect_neurons(connectome, pattern.members, id, params, burst);
    } catch (const StorageExhausted& e) {
        connectome.remove_neuron(id);
        spdlog::warn("Memory neuron for pattern {:016x} not wired: {}", pattern.hash, e.what());
        errors.emplace_back(BurstErrorKind::STORAGE_EXHAUSTED, e.what());
        return false;
    }

    ++binding.next_slot;
    memory_.add(id, binding.memory_area, pattern.hash, pattern.members, burst);
    spdlog::info("Created memory neuron {} in area '{}' for a {}-member pattern",
                 id, connectome.area(binding.memory_area).name(), pattern.members.size());
    return true;
}

} // namespace cortexlib
