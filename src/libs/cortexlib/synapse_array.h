#ifndef CORTEXLIB_SYNAPSE_ARRAY_H
#define CORTEXLIB_SYNAPSE_ARRAY_H

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "types.h"
#include "errors.h"
#include "storage_backend.h"

namespace cortexlib {

struct SynapseRecord {
    NeuronId source;
    NeuronId target;
    float weight;          // magnitude, never negative
    float psp;
    SynapseType type;
    bool plastic;
    uint64_t created_burst;

    SynapseRecord()
        : source(INVALID_NEURON), target(INVALID_NEURON), weight(0.0f), psp(1.0f),
          type(SynapseType::EXCITATORY), plastic(false), created_burst(0) {}
    SynapseRecord(NeuronId src, NeuronId dst, float w, float p, SynapseType t,
                  bool is_plastic = false, uint64_t burst = 0)
        : source(src), target(dst), weight(w), psp(p), type(t),
          plastic(is_plastic), created_burst(burst) {}
};

template <typename Storage = ActiveStorage>
class SynapseArray {
public:
    template <typename U> using Buffer = typename Storage::template SynapseBuffer<U>;

    SynapseArray() : valid_count_(0) {}
    SynapseArray(const SynapseArray&) = delete;
    SynapseArray& operator=(const SynapseArray&) = delete;

    size_t size() const { return valid_.size(); }
    size_t valid_count() const { return valid_count_; }

    size_t capacity() const {
        return std::min({source_.capacity(), target_.capacity(), weight_.capacity(),
                         psp_.capacity(), type_.capacity(), plastic_.capacity(),
                         created_burst_.capacity(), valid_.capacity()});
    }

    SynapseId append(const SynapseRecord& record) {
        if (size() >= capacity()) {
            throw StorageExhausted(std::string("Synapse storage (") + Storage::NAME + ") is full",
                                   capacity());
        }
        SynapseId id = static_cast<SynapseId>(size());
        source_.push_back(record.source);
        target_.push_back(record.target);
        weight_.push_back(record.weight);
        psp_.push_back(record.psp);
        type_.push_back(static_cast<uint8_t>(record.type));
        plastic_.push_back(record.plastic ? 1 : 0);
        created_burst_.push_back(record.created_burst);
        valid_.push_back(1);
        ++valid_count_;
        return id;
    }

    void reset_slot(SynapseId id, const SynapseRecord& record) {
        check_index(id);
        if (valid_[id]) {
            throw std::logic_error("Synapse slot " + std::to_string(id) + " is still live");
        }
        source_[id] = record.source;
        target_[id] = record.target;
        weight_[id] = record.weight;
        psp_[id] = record.psp;
        type_[id] = static_cast<uint8_t>(record.type);
        plastic_[id] = record.plastic ? 1 : 0;
        created_burst_[id] = record.created_burst;
        valid_[id] = 1;
        ++valid_count_;
    }

    void invalidate(SynapseId id) {
        check_index(id);
        if (valid_[id]) {
            valid_[id] = 0;
            --valid_count_;
        }
    }

    bool is_valid(SynapseId id) const { return id < size() && valid_[id] != 0; }

    NeuronId source(SynapseId id) const { return source_[id]; }
    NeuronId target(SynapseId id) const { return target_[id]; }
    float weight(SynapseId id) const { return weight_[id]; }
    void set_weight(SynapseId id, float weight) { weight_[id] = weight; }
    float psp(SynapseId id) const { return psp_[id]; }
    SynapseType type(SynapseId id) const { return static_cast<SynapseType>(type_[id]); }
    bool plastic(SynapseId id) const { return plastic_[id] != 0; }
    uint64_t created_burst(SynapseId id) const { return created_burst_[id]; }

    SynapseRecord record(SynapseId id) const {
        check_index(id);
        return SynapseRecord(source_[id], target_[id], weight_[id], psp_[id],
                             type(id), plastic(id), created_burst_[id]);
    }

private:
    void check_index(SynapseId id) const {
        if (id >= size()) {
            throw std::out_of_range("Synapse id " + std::to_string(id) + " out of range");
        }
    }

    Buffer<NeuronId> source_;
    Buffer<NeuronId> target_;
    Buffer<float> weight_;
    Buffer<float> psp_;
    Buffer<uint8_t> type_;
    Buffer<uint8_t> plastic_;
    Buffer<uint64_t> created_burst_;
    Buffer<uint8_t> valid_;
    size_t valid_count_;
};

} // namespace cortexlib

#endif // CORTEXLIB_SYNAPSE_ARRAY_H
