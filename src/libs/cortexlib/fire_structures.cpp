#include "fire_structures.h"
#include "errors.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace cortexlib {

void FireQueue::reset(uint64_t burst) {
    neurons_.clear();
    burst_ = burst;
}

void FireQueue::append(const std::vector<FiredNeuron>& fired) {
    neurons_.insert(neurons_.end(), fired.begin(), fired.end());
}

void FireQueue::finalize() {
    std::sort(neurons_.begin(), neurons_.end(),
              [](const FiredNeuron& a, const FiredNeuron& b) { return a.id < b.id; });
}

const FiredNeuron* FireQueue::find(NeuronId id) const {
    auto it = std::lower_bound(neurons_.begin(), neurons_.end(), id,
                               [](const FiredNeuron& n, NeuronId value) { return n.id < value; });
    if (it == neurons_.end() || it->id != id) {
        return nullptr;
    }
    return &(*it);
}

bool FireQueue::contains(NeuronId id) const {
    return find(id) != nullptr;
}

size_t FireQueue::erase(const std::vector<NeuronId>& sorted_ids) {
    size_t before = neurons_.size();
    neurons_.erase(std::remove_if(neurons_.begin(), neurons_.end(),
                                  [&sorted_ids](const FiredNeuron& n) {
                                      return std::binary_search(sorted_ids.begin(), sorted_ids.end(), n.id);
                                  }),
                   neurons_.end());
    return before - neurons_.size();
}

std::vector<NeuronId> FireQueue::ids() const {
    std::vector<NeuronId> result;
    result.reserve(neurons_.size());
    for (const auto& neuron : neurons_) {
        result.push_back(neuron.id);
    }
    return result;
}

FireCandidateList::FireCandidateList(size_t shard_count, size_t id_limit) : id_limit_(id_limit) {
    if (id_limit_ != UNBOUNDED) {
        values_.assign(id_limit_, 0.0f);
        present_.assign(id_limit_, 0);
    }
    set_shard_count(shard_count);
}

void FireCandidateList::set_shard_count(size_t shard_count) {
    if (shard_count == 0) {
        throw std::invalid_argument("Fire candidate list needs at least one shard");
    }
    if (!empty()) {
        throw std::logic_error("Cannot reshard a non-empty fire candidate list");
    }
    shards_.assign(shard_count, std::vector<NeuronId>());
    if (id_limit_ != UNBOUNDED) {
        for (auto& shard : shards_) {
            shard.reserve(id_limit_ / shard_count + 1);
        }
    }
}

void FireCandidateList::reserve_ids(size_t neuron_capacity) {
    if (neuron_capacity > id_limit_) {
        throw StorageExhausted("Fire candidate list cannot cover " + std::to_string(neuron_capacity) +
                               " neuron ids", id_limit_);
    }
    if (neuron_capacity > values_.size()) {
        values_.resize(neuron_capacity, 0.0f);
        present_.resize(neuron_capacity, 0);
    }
}

void FireCandidateList::accumulate(NeuronId id, float value) {
    if (id >= values_.size()) {
        throw std::out_of_range("Fire candidate " + std::to_string(id) + " beyond reserved ids");
    }
    if (!present_[id]) {
        present_[id] = 1;
        values_[id] = value;
        shards_[shard_of(id, shards_.size())].push_back(id);
    } else {
        values_[id] += value;
    }
}

bool FireCandidateList::contains(NeuronId id) const {
    return id < present_.size() && present_[id] != 0;
}

float FireCandidateList::get(NeuronId id) const {
    return contains(id) ? values_[id] : 0.0f;
}

std::vector<std::pair<NeuronId, float>> FireCandidateList::sorted_entries() const {
    std::vector<std::pair<NeuronId, float>> entries;
    for (const auto& shard : shards_) {
        for (NeuronId id : shard) {
            entries.emplace_back(id, values_[id]);
        }
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

size_t FireCandidateList::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        total += shard.size();
    }
    return total;
}

void FireCandidateList::clear() {
    for (auto& shard : shards_) {
        for (NeuronId id : shard) {
            present_[id] = 0;
            values_[id] = 0.0f;
        }
        shard.clear();
    }
}

} // namespace cortexlib
