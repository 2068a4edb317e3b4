#include "stdp.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace cortexlib {

float stdp_timing_factor(int64_t dt, float tau) {
    return std::exp(-static_cast<float>(std::llabs(dt)) / tau);
}

float stdp_activity_factor(uint32_t pre_fires, uint32_t post_fires) {
    uint32_t total = std::max<uint32_t>(pre_fires, 1) + std::max<uint32_t>(post_fires, 1);
    return 2.0f / static_cast<float>(total);
}

float stdp_updated_weight(float weight, int64_t dt, float activity, const StdpConfig& config) {
    float delta = 0.0f;
    if (dt > 0) {
        delta = config.potentiation_rate * stdp_timing_factor(dt, config.tau) * activity;
    } else if (dt < 0) {
        delta = -config.depression_rate * stdp_timing_factor(dt, config.tau) * activity;
    }
    return std::min(std::max(weight + delta, config.weight_min), config.weight_max);
}

StdpEngine::StdpEngine(const StdpConfig& config) : config_(config) {}

size_t StdpEngine::apply(uint64_t burst, const FireQueue& fired, const FireLedger& ledger,
                         Connectome& connectome) {
    if (!config_.enabled || fired.empty() || burst == 0) {
        return 0;
    }

    uint64_t first = burst > config_.window ? burst - config_.window : 0;
    auto latest = ledger.latest_fires(first, burst - 1);
    auto counts = ledger.fire_counts(first, burst);
    if (latest.empty()) {
        return 0;
    }

    auto count_of = [&counts](NeuronId id) {
        auto it = counts.find(id);
        return it == counts.end() ? 0u : it->second;
    };

    const SynapseStorage& synapses = connectome.synapse_storage();
    size_t updated = 0;

    for (const FiredNeuron& neuron : fired) {
        if (!connectome.is_live(neuron.id)) {
            continue;
        }

        // Post fired now: reward inputs that fired shortly before
        for (SynapseId s : connectome.incoming(neuron.id)) {
            if (!synapses.plastic(s)) {
                continue;
            }
            auto pre = latest.find(synapses.source(s));
            if (pre == latest.end()) {
                continue;
            }
            int64_t dt = static_cast<int64_t>(burst - pre->second);
            float activity = stdp_activity_factor(count_of(pre->first), count_of(neuron.id));
            float weight = synapses.weight(s);
            float next = stdp_updated_weight(weight, dt, activity, config_);
            if (next != weight) {
                connectome.set_synapse_weight(s, next);
                ++updated;
            }
        }

        // Pre fired now: punish targets that already fired
        for (SynapseId s : connectome.outgoing(neuron.id)) {
            if (!synapses.plastic(s)) {
                continue;
            }
            auto post = latest.find(synapses.target(s));
            if (post == latest.end()) {
                continue;
            }
            int64_t dt = static_cast<int64_t>(post->second) - static_cast<int64_t>(burst);
            float activity = stdp_activity_factor(count_of(neuron.id), count_of(post->first));
            float weight = synapses.weight(s);
            float next = stdp_updated_weight(weight, dt, activity, config_);
            if (next != weight) {
                connectome.set_synapse_weight(s, next);
                ++updated;
            }
        }
    }
    return updated;
}

} // namespace cortexlib
