#include "synaptogenesis.h"
#include "morphology.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace cortexlib {

static AreaId resolve_area(const Connectome& connectome, const std::string& name) {
    const CorticalArea* area = connectome.find_area(name);
    if (area == nullptr) {
        throw ConfigurationError("Synaptogenesis rule names unknown area '" + name + "'");
    }
    return area->id;
}

static std::string describe(const Position& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ", " + std::to_string(p.z) + ")";
}

SynaptogenesisEngine::SynaptogenesisEngine(uint64_t seed) : rng_(seed) {}

SynaptogenesisResult SynaptogenesisEngine::apply_rule(Connectome& connectome,
                                                      const SynaptogenesisRuleConfig& rule,
                                                      uint64_t burst) {
    AreaId source_area = resolve_area(connectome, rule.source_area);
    AreaId destination_area = resolve_area(connectome, rule.destination_area);

    SynaptogenesisResult result;
    result.source_area = rule.source_area;
    result.destination_area = rule.destination_area;
    result.morphology = morphology_name(rule.morphology);

    std::vector<SpatialEntry> sources = connectome.spatial(source_area).all();
    std::sort(sources.begin(), sources.end(),
              [](const SpatialEntry& a, const SpatialEntry& b) { return a.id < b.id; });

    std::vector<Candidate> candidates;
    for (const auto& source : sources) {
        collect(connectome, rule, source_area, destination_area, source.id, source.position,
                candidates, result);
        ++result.sources_evaluated;
    }

    commit(connectome, rule, candidates, burst);
    result.synapses_created = candidates.size();

    spdlog::debug("Synaptogenesis {} -> {} ({}): {} synapses from {} sources, {} destinations dropped",
                  rule.source_area, rule.destination_area, result.morphology, result.synapses_created,
                  result.sources_evaluated, result.destinations_dropped);
    return result;
}

std::vector<SynaptogenesisResult> SynaptogenesisEngine::apply_rules(
    Connectome& connectome, const std::vector<SynaptogenesisRuleConfig>& rules, uint64_t burst,
    std::vector<BurstError>& errors) {
    std::vector<SynaptogenesisResult> results;
    results.reserve(rules.size());

    for (const auto& rule : rules) {
        try {
            results.push_back(apply_rule(connectome, rule, burst));
        } catch (const SynaptogenesisError& e) {
            spdlog::warn("Synaptogenesis {} -> {} aborted: {}", rule.source_area, rule.destination_area, e.what());
            errors.emplace_back(BurstErrorKind::SYNAPTOGENESIS, e.what());
            SynaptogenesisResult failed;
            failed.source_area = rule.source_area;
            failed.destination_area = rule.destination_area;
            failed.morphology = morphology_name(rule.morphology);
            results.push_back(failed);
        } catch (const StorageExhausted& e) {
            spdlog::warn("Synaptogenesis {} -> {} skipped: {}", rule.source_area, rule.destination_area, e.what());
            errors.emplace_back(BurstErrorKind::STORAGE_EXHAUSTED, e.what());
            SynaptogenesisResult failed;
            failed.source_area = rule.source_area;
            failed.destination_area = rule.destination_area;
            failed.morphology = morphology_name(rule.morphology);
            results.push_back(failed);
        }
    }
    return results;
}

size_t SynaptogenesisEngine::grow_neuron(Connectome& connectome, NeuronId neuron,
                                         const std::vector<SynaptogenesisRuleConfig>& rules,
                                         uint64_t burst) {
    AreaId area = connectome.neuron_area(neuron);
    Position position = connectome.neuron_position(neuron);
    size_t created = 0;

    for (const auto& rule : rules) {
        AreaId source_area = resolve_area(connectome, rule.source_area);
        AreaId destination_area = resolve_area(connectome, rule.destination_area);
        std::vector<Candidate> candidates;
        SynaptogenesisResult scratch;

        if (source_area == area) {
            collect(connectome, rule, source_area, destination_area, neuron, position, candidates, scratch);
        }
        if (destination_area == area) {
            const Dimensions source_dims = connectome.area(source_area).dimensions();
            const Dimensions destination_dims = connectome.area(destination_area).dimensions();
            std::vector<SpatialEntry> sources = connectome.spatial(source_area).all();
            std::sort(sources.begin(), sources.end(),
                      [](const SpatialEntry& a, const SpatialEntry& b) { return a.id < b.id; });
            for (const auto& source : sources) {
                if (source.id == neuron) {
                    continue;
                }
                std::vector<Position> targets = evaluate_morphology(rule.morphology, source.position,
                                                                    source_dims, destination_dims, rng_);
                if (std::find(targets.begin(), targets.end(), position) != targets.end() &&
                    attracted(rule.attractivity)) {
                    candidates.push_back(Candidate{source.id, neuron});
                }
            }
        }

        commit(connectome, rule, candidates, burst);
        created += candidates.size();
    }
    return created;
}

size_t SynaptogenesisEngine::connect_neurons(Connectome& connectome, const std::vector<NeuronId>& sources,
                                             NeuronId destination, const SynapseParams& params,
                                             uint64_t burst) {
    std::vector<NeuronId> ordered = sources;
    std::sort(ordered.begin(), ordered.end());
    ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

    std::vector<NeuronId> pending;
    for (NeuronId source : ordered) {
        if (source != destination && connectome.is_live(source) &&
            !connectome.synapse_exists(source, destination)) {
            pending.push_back(source);
        }
    }
    if (connectome.synapse_capacity_remaining() < pending.size()) {
        throw StorageExhausted("Not enough synapse capacity to wire neuron " + std::to_string(destination),
                               connectome.synapse_capacity_remaining());
    }
    for (NeuronId source : pending) {
        connectome.add_synapse(SynapseRecord(source, destination, params.weight, params.psp,
                                             params.type, params.plastic, burst));
    }
    return pending.size();
}

void SynaptogenesisEngine::collect(Connectome& connectome, const SynaptogenesisRuleConfig& rule,
                                   AreaId source_area, AreaId destination_area, NeuronId source,
                                   const Position& source_position, std::vector<Candidate>& candidates,
                                   SynaptogenesisResult& result) {
    const Dimensions source_dims = connectome.area(source_area).dimensions();
    const Dimensions destination_dims = connectome.area(destination_area).dimensions();

    std::vector<Position> destinations = evaluate_morphology(rule.morphology, source_position,
                                                             source_dims, destination_dims, rng_);
    for (const auto& destination : destinations) {
        if (!destination_dims.contains(destination)) {
            if (rule.strict) {
                throw SynaptogenesisError(rule.source_area, rule.destination_area, destination,
                                          "Destination " + describe(destination) + " from source " +
                                          describe(source_position) + " lies outside area '" +
                                          rule.destination_area + "'");
            }
            ++result.destinations_dropped;
            continue;
        }
        for (NeuronId target : connectome.spatial(destination_area).neurons_at(destination)) {
            if (target == source) {
                continue;
            }
            if (attracted(rule.attractivity)) {
                candidates.push_back(Candidate{source, target});
            }
        }
    }
}

void SynaptogenesisEngine::commit(Connectome& connectome, const SynaptogenesisRuleConfig& rule,
                                  const std::vector<Candidate>& candidates, uint64_t burst) {
    if (connectome.synapse_capacity_remaining() < candidates.size()) {
        throw StorageExhausted("Synapse storage cannot hold " + std::to_string(candidates.size()) +
                               " synapses for " + rule.source_area + " -> " + rule.destination_area,
                               connectome.synapse_capacity_remaining());
    }
    for (const auto& candidate : candidates) {
        connectome.add_synapse(SynapseRecord(candidate.source, candidate.target, rule.synapse.weight,
                                             rule.synapse.psp, rule.synapse.type, rule.synapse.plastic,
                                             burst));
    }
}

bool SynaptogenesisEngine::attracted(uint32_t attractivity) {
    if (attractivity >= 100) {
        return true;
    }
    std::uniform_int_distribution<uint32_t> percent(0, 99);
    return percent(rng_) < attractivity;
}

} // namespace cortexlib
