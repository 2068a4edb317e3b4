#ifndef CORTEXLIB_FIRE_STRUCTURES_H
#define CORTEXLIB_FIRE_STRUCTURES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>
#include "types.h"

namespace cortexlib {

struct FiredNeuron {
    NeuronId id;
    AreaId area;
    float membrane_potential;   // potential at the moment of firing
    Position position;

    FiredNeuron() : id(INVALID_NEURON), area(INVALID_AREA), membrane_potential(0.0f) {}
    FiredNeuron(NeuronId n, AreaId a, float potential, const Position& pos)
        : id(n), area(a), membrane_potential(potential), position(pos) {}
};

// Neurons that crossed threshold in one burst, ordered by id
class FireQueue {
public:
    FireQueue() : burst_(0) {}

    void reset(uint64_t burst);
    void append(const std::vector<FiredNeuron>& fired);
    void finalize();
    // Drops the given ids (sorted ascending); returns how many were present
    size_t erase(const std::vector<NeuronId>& sorted_ids);

    uint64_t burst() const { return burst_; }
    size_t size() const { return neurons_.size(); }
    bool empty() const { return neurons_.empty(); }
    bool contains(NeuronId id) const;
    const FiredNeuron* find(NeuronId id) const;
    std::vector<NeuronId> ids() const;

    const std::vector<FiredNeuron>& neurons() const { return neurons_; }
    std::vector<FiredNeuron>::const_iterator begin() const { return neurons_.begin(); }
    std::vector<FiredNeuron>::const_iterator end() const { return neurons_.end(); }

private:
    std::vector<FiredNeuron> neurons_;
    uint64_t burst_;
};

// Per-burst sparse accumulator. Slots are dense by id; touched ids are tracked per shard
// so a worker owning shard s is the only writer of ids with id % shards == s.
// With a finite id_limit every slot and shard list is allocated up front and the
// list never grows afterwards.
class FireCandidateList {
public:
    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

    explicit FireCandidateList(size_t shard_count = 1, size_t id_limit = UNBOUNDED);

    static size_t shard_of(NeuronId id, size_t shard_count) {
        return static_cast<size_t>(id) % shard_count;
    }

    size_t shard_count() const { return shards_.size(); }
    void set_shard_count(size_t shard_count);

    // Grows the dense slots to cover every id below neuron_capacity.
    // Throws StorageExhausted past the id limit.
    void reserve_ids(size_t neuron_capacity);
    size_t id_limit() const { return id_limit_; }

    void accumulate(NeuronId id, float value);
    bool contains(NeuronId id) const;
    float get(NeuronId id) const;

    const std::vector<NeuronId>& shard_candidates(size_t shard) const { return shards_[shard]; }
    std::vector<std::pair<NeuronId, float>> sorted_entries() const;

    size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

private:
    std::vector<float> values_;
    std::vector<uint8_t> present_;
    std::vector<std::vector<NeuronId>> shards_;
    size_t id_limit_;
};

} // namespace cortexlib

#endif // CORTEXLIB_FIRE_STRUCTURES_H
