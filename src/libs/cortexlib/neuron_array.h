#ifndef CORTEXLIB_NEURON_ARRAY_H
#define CORTEXLIB_NEURON_ARRAY_H

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "types.h"
#include "errors.h"
#include "neural_value.h"
#include "storage_backend.h"

namespace cortexlib {

template <typename T>
struct NeuronParams {
    T threshold;
    T threshold_limit;      // zero means no upper bound
    T resting_potential;
    float leak_coefficient;
    float excitability;
    uint16_t refractory_period;
    uint16_t consecutive_fire_limit;  // zero means unlimited
    uint16_t snooze_period;

    NeuronParams()
        : threshold(NeuralValueTraits<T>::zero()),
          threshold_limit(NeuralValueTraits<T>::zero()),
          resting_potential(NeuralValueTraits<T>::zero()),
          leak_coefficient(0.0f), excitability(1.0f),
          refractory_period(0), consecutive_fire_limit(0), snooze_period(0) {}
};

template <typename T>
struct NeuronState {
    T membrane_potential;
    uint16_t refractory_countdown;
    uint16_t consecutive_fire_count;

    NeuronState()
        : membrane_potential(NeuralValueTraits<T>::zero()),
          refractory_countdown(0), consecutive_fire_count(0) {}
};

// Structure-of-arrays neuron records over a storage backend. Slots are addressed by
// NeuronId; slot reuse is decided by the connectome's IdManager.
template <typename T, typename Storage = ActiveStorage>
class NeuronArray {
public:
    using Value = T;
    using Traits = NeuralValueTraits<T>;
    template <typename U> using Buffer = typename Storage::template NeuronBuffer<U>;

    NeuronArray() : valid_count_(0) {}
    NeuronArray(const NeuronArray&) = delete;
    NeuronArray& operator=(const NeuronArray&) = delete;
    NeuronArray(NeuronArray&&) = default;
    NeuronArray& operator=(NeuronArray&&) = default;

    size_t size() const { return valid_.size(); }
    size_t valid_count() const { return valid_count_; }

    size_t capacity() const {
        return std::min({membrane_potential_.capacity(), threshold_.capacity(),
                         threshold_limit_.capacity(), resting_.capacity(), leak_.capacity(),
                         excitability_.capacity(), refractory_period_.capacity(),
                         refractory_countdown_.capacity(), fire_limit_.capacity(),
                         fire_count_.capacity(), snooze_.capacity(), area_.capacity(),
                         position_.capacity(), valid_.capacity()});
    }

    bool full() const { return size() >= capacity(); }

    // Appends a new slot; the returned id equals the previous size()
    NeuronId append(const NeuronParams<T>& params, AreaId area, const Position& position) {
        if (full()) {
            throw StorageExhausted(std::string("Neuron storage (") + Storage::NAME + ") is full",
                                   capacity());
        }
        NeuronId id = static_cast<NeuronId>(size());
        membrane_potential_.push_back(params.resting_potential);
        threshold_.push_back(params.threshold);
        threshold_limit_.push_back(params.threshold_limit);
        resting_.push_back(params.resting_potential);
        leak_.push_back(params.leak_coefficient);
        excitability_.push_back(params.excitability);
        refractory_period_.push_back(params.refractory_period);
        refractory_countdown_.push_back(0);
        fire_limit_.push_back(params.consecutive_fire_limit);
        fire_count_.push_back(0);
        snooze_.push_back(params.snooze_period);
        area_.push_back(area);
        position_.push_back(position);
        valid_.push_back(1);
        ++valid_count_;
        return id;
    }

    // Reinitializes a previously invalidated slot
    void reset_slot(NeuronId id, const NeuronParams<T>& params, AreaId area, const Position& position) {
        check_index(id);
        if (valid_[id]) {
            throw std::logic_error("Neuron slot " + std::to_string(id) + " is still live");
        }
        membrane_potential_[id] = params.resting_potential;
        threshold_[id] = params.threshold;
        threshold_limit_[id] = params.threshold_limit;
        resting_[id] = params.resting_potential;
        leak_[id] = params.leak_coefficient;
        excitability_[id] = params.excitability;
        refractory_period_[id] = params.refractory_period;
        refractory_countdown_[id] = 0;
        fire_limit_[id] = params.consecutive_fire_limit;
        fire_count_[id] = 0;
        snooze_[id] = params.snooze_period;
        area_[id] = area;
        position_[id] = position;
        valid_[id] = 1;
        ++valid_count_;
    }

    void invalidate(NeuronId id) {
        check_index(id);
        if (valid_[id]) {
            valid_[id] = 0;
            --valid_count_;
        }
    }

    bool is_valid(NeuronId id) const { return id < size() && valid_[id] != 0; }

    NeuronParams<T> params(NeuronId id) const {
        NeuronParams<T> p;
        p.threshold = threshold_[id];
        p.threshold_limit = threshold_limit_[id];
        p.resting_potential = resting_[id];
        p.leak_coefficient = leak_[id];
        p.excitability = excitability_[id];
        p.refractory_period = refractory_period_[id];
        p.consecutive_fire_limit = fire_limit_[id];
        p.snooze_period = snooze_[id];
        return p;
    }

    NeuronState<T> state(NeuronId id) const {
        NeuronState<T> s;
        s.membrane_potential = membrane_potential_[id];
        s.refractory_countdown = refractory_countdown_[id];
        s.consecutive_fire_count = fire_count_[id];
        return s;
    }

    void set_state(NeuronId id, const NeuronState<T>& s) {
        membrane_potential_[id] = s.membrane_potential;
        refractory_countdown_[id] = s.refractory_countdown;
        fire_count_[id] = s.consecutive_fire_count;
    }

    T membrane_potential(NeuronId id) const { return membrane_potential_[id]; }
    void set_membrane_potential(NeuronId id, T value) { membrane_potential_[id] = value; }
    T threshold(NeuronId id) const { return threshold_[id]; }
    uint16_t refractory_countdown(NeuronId id) const { return refractory_countdown_[id]; }
    AreaId area(NeuronId id) const { return area_[id]; }
    const Position& position(NeuronId id) const { return position_[id]; }

    // Ticks a blocked neuron that received no input this burst
    void tick_refractory(NeuronId id) {
        if (refractory_countdown_[id] == 0) {
            return;
        }
        --refractory_countdown_[id];
        if (refractory_countdown_[id] == 0 && fire_limit_[id] > 0 && fire_count_[id] >= fire_limit_[id]) {
            fire_count_[id] = 0;
        }
    }

private:
    void check_index(NeuronId id) const {
        if (id >= size()) {
            throw std::out_of_range("Neuron id " + std::to_string(id) + " out of range");
        }
    }

    Buffer<T> membrane_potential_;
    Buffer<T> threshold_;
    Buffer<T> threshold_limit_;
    Buffer<T> resting_;
    Buffer<float> leak_;
    Buffer<float> excitability_;
    Buffer<uint16_t> refractory_period_;
    Buffer<uint16_t> refractory_countdown_;
    Buffer<uint16_t> fire_limit_;
    Buffer<uint16_t> fire_count_;
    Buffer<uint16_t> snooze_;
    Buffer<AreaId> area_;
    Buffer<Position> position_;
    Buffer<uint8_t> valid_;
    size_t valid_count_;
};

} // namespace cortexlib

#endif // CORTEXLIB_NEURON_ARRAY_H
