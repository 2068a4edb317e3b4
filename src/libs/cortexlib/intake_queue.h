#ifndef CORTEXLIB_INTAKE_QUEUE_H
#define CORTEXLIB_INTAKE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "types.h"

namespace cortexlib {

// Already-decoded activation addressed either by neuron id or by (area, position)
struct SensoryInput {
    NeuronId neuron;
    std::string area;
    Position position;
    float activation;

    SensoryInput() : neuron(INVALID_NEURON), activation(0.0f) {}

    static SensoryInput to_neuron(NeuronId id, float activation) {
        SensoryInput input;
        input.neuron = id;
        input.activation = activation;
        return input;
    }

    static SensoryInput at_position(const std::string& area, const Position& position, float activation) {
        SensoryInput input;
        input.area = area;
        input.position = position;
        input.activation = activation;
        return input;
    }

    bool targets_neuron() const { return neuron != INVALID_NEURON; }
};

// Bounded multi-producer queue. Producers never block: a full queue drops the input.
class IntakeQueue {
public:
    explicit IntakeQueue(size_t capacity);

    bool push(const SensoryInput& input);
    size_t push_batch(const std::vector<SensoryInput>& inputs);

    // Takes up to max_items; waits at most `timeout` for the first item when empty
    std::vector<SensoryInput> poll(size_t max_items,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    size_t size() const;
    bool empty() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped_count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<SensoryInput> queue_;
    size_t capacity_;
    uint64_t dropped_;
};

} // namespace cortexlib

#endif // CORTEXLIB_INTAKE_QUEUE_H
