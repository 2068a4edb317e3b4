#ifndef CORTEXLIB_NEURON_MODELS_H
#define CORTEXLIB_NEURON_MODELS_H

#include <cstdint>
#include <string>
#include <variant>
#include "types.h"
#include "neural_value.h"
#include "neuron_array.h"

namespace cortexlib {

template <typename T>
struct StepResult {
    NeuronState<T> state;
    bool fired;
    T fire_potential;   // potential that crossed threshold, before reset
};

// Uniform draw in [0, 1) derived from (seed, neuron, burst); identical across runs and threads
float excitability_draw(uint64_t seed, NeuronId id, uint64_t burst);

namespace detail {

// Refractory gate shared by every model. Returns true when the neuron is blocked this burst.
template <typename T>
bool consume_refractory(const NeuronState<T>& prior, const NeuronParams<T>& params, NeuronState<T>& next) {
    if (prior.refractory_countdown == 0) {
        return false;
    }
    next.refractory_countdown = prior.refractory_countdown - 1;
    if (next.refractory_countdown == 0 && params.consecutive_fire_limit > 0 &&
        next.consecutive_fire_count >= params.consecutive_fire_limit) {
        next.consecutive_fire_count = 0;
    }
    return true;
}

template <typename T>
bool crosses_threshold(T potential, const NeuronParams<T>& params, float draw) {
    using Traits = NeuralValueTraits<T>;
    if (!Traits::ge(potential, params.threshold)) {
        return false;
    }
    if (Traits::gt(params.threshold_limit, Traits::zero()) && Traits::gt(potential, params.threshold_limit)) {
        return false;
    }
    if (params.excitability >= 0.999f) {
        return true;
    }
    if (params.excitability <= 0.0f) {
        return false;
    }
    return draw < params.excitability;
}

template <typename T>
void apply_fire(const NeuronParams<T>& params, NeuronState<T>& next) {
    next.membrane_potential = params.resting_potential;
    next.consecutive_fire_count = static_cast<uint16_t>(next.consecutive_fire_count + 1);
    next.refractory_countdown = params.refractory_period;
    if (params.consecutive_fire_limit > 0 && next.consecutive_fire_count >= params.consecutive_fire_limit) {
        next.refractory_countdown = static_cast<uint16_t>(params.refractory_period + params.snooze_period);
    }
}

} // namespace detail

// v' = rest + (v - rest) * (1 - leak) + input; reset to rest on firing
struct LeakyIntegrateFireModel {
    static constexpr const char* NAME = "lif";

    template <typename T>
    StepResult<T> step(T input, const NeuronState<T>& prior, const NeuronParams<T>& params,
                       float draw, uint32_t& saturations) const {
        using Traits = NeuralValueTraits<T>;
        StepResult<T> result{prior, false, prior.membrane_potential};
        if (detail::consume_refractory(prior, params, result.state)) {
            return result;
        }

        T offset = Traits::sub(prior.membrane_potential, params.resting_potential, saturations);
        T leaked = Traits::add(params.resting_potential,
                               Traits::scale(offset, 1.0f - params.leak_coefficient, saturations),
                               saturations);
        T potential = Traits::add(leaked, input, saturations);

        if (detail::crosses_threshold(potential, params, draw)) {
            detail::apply_fire(params, result.state);
            result.fired = true;
            result.fire_potential = potential;
        } else {
            result.state.membrane_potential = potential;
            result.state.consecutive_fire_count = 0;
        }
        return result;
    }
};

// Leak-free integrator
struct IntegrateFireModel {
    static constexpr const char* NAME = "integrate_fire";

    template <typename T>
    StepResult<T> step(T input, const NeuronState<T>& prior, const NeuronParams<T>& params,
                       float draw, uint32_t& saturations) const {
        using Traits = NeuralValueTraits<T>;
        StepResult<T> result{prior, false, prior.membrane_potential};
        if (detail::consume_refractory(prior, params, result.state)) {
            return result;
        }

        T potential = Traits::add(prior.membrane_potential, input, saturations);
        if (detail::crosses_threshold(potential, params, draw)) {
            detail::apply_fire(params, result.state);
            result.fired = true;
            result.fire_potential = potential;
        } else {
            result.state.membrane_potential = potential;
            result.state.consecutive_fire_count = 0;
        }
        return result;
    }
};

// Coincidence detector for pattern memory: no state carried between bursts
struct MemoryNeuronModel {
    static constexpr const char* NAME = "memory";

    template <typename T>
    StepResult<T> step(T input, const NeuronState<T>& prior, const NeuronParams<T>& params,
                       float draw, uint32_t& saturations) const {
        (void)saturations;
        StepResult<T> result{prior, false, prior.membrane_potential};
        if (detail::consume_refractory(prior, params, result.state)) {
            return result;
        }

        if (detail::crosses_threshold(input, params, draw)) {
            detail::apply_fire(params, result.state);
            result.fired = true;
            result.fire_potential = input;
        } else {
            result.state.membrane_potential = params.resting_potential;
            result.state.consecutive_fire_count = 0;
        }
        return result;
    }
};

using NeuronModel = std::variant<LeakyIntegrateFireModel, IntegrateFireModel, MemoryNeuronModel>;

// Throws ConfigurationError on an unknown tag
NeuronModel make_neuron_model(const std::string& tag);
const char* neuron_model_name(const NeuronModel& model);
bool is_known_neuron_model(const std::string& tag);

} // namespace cortexlib

#endif // CORTEXLIB_NEURON_MODELS_H
