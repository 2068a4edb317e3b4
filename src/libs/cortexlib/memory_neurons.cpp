#include "memory_neurons.h"
#include <stdexcept>
#include <utility>
#include <string>

namespace cortexlib {

MemoryNeuronRegistry::MemoryNeuronRegistry(const MemoryLifecycleConfig& config) : config_(config) {}

uint64_t MemoryNeuronRegistry::pattern_key(AreaId area, uint64_t hash) {
    return hash ^ (static_cast<uint64_t>(area) * 0x9E3779B97F4A7C15ULL);
}

const MemoryNeuronRecord& MemoryNeuronRegistry::add(NeuronId id, AreaId area, uint64_t pattern_hash,
                                                    const std::vector<NeuronId>& members, uint64_t burst) {
    if (records_.count(id)) {
        throw std::logic_error("Memory neuron " + std::to_string(id) + " is already tracked");
    }
    MemoryNeuronRecord record;
    record.id = id;
    record.area = area;
    record.pattern_hash = pattern_hash;
    record.members = members;
    record.created_burst = burst;
    record.last_active_burst = burst;
    record.lifespan = config_.initial_lifespan;
    record.activation_count = 1;
    record.longterm = record.lifespan >= config_.longterm_threshold;

    by_pattern_[pattern_key(area, pattern_hash)] = id;
    ++stats_.created;
    return records_.emplace(id, std::move(record)).first->second;
}

const MemoryNeuronRecord* MemoryNeuronRegistry::find(NeuronId id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

const MemoryNeuronRecord* MemoryNeuronRegistry::find_by_pattern(AreaId area, uint64_t pattern_hash) const {
    auto it = by_pattern_.find(pattern_key(area, pattern_hash));
    return it == by_pattern_.end() ? nullptr : find(it->second);
}

bool MemoryNeuronRegistry::reactivate(NeuronId id, uint64_t burst) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    MemoryNeuronRecord& record = it->second;
    if (record.last_active_burst == burst) {
        return true;
    }
    record.last_active_burst = burst;
    ++record.activation_count;
    record.lifespan += config_.lifespan_growth;
    if (!record.longterm && record.lifespan >= config_.longterm_threshold) {
        record.longterm = true;
        ++stats_.converted_longterm;
    }
    ++stats_.reactivated;
    return true;
}

std::vector<MemoryNeuronRecord> MemoryNeuronRegistry::collect_expired(uint64_t burst) {
    std::vector<MemoryNeuronRecord> expired;
    for (auto it = records_.begin(); it != records_.end();) {
        const MemoryNeuronRecord& record = it->second;
        if (!record.longterm && burst - record.last_active_burst > record.lifespan) {
            by_pattern_.erase(pattern_key(record.area, record.pattern_hash));
            expired.push_back(record);
            it = records_.erase(it);
            ++stats_.retired;
        } else {
            ++it;
        }
    }
    return expired;
}

void MemoryNeuronRegistry::forget(NeuronId id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return;
    }
    by_pattern_.erase(pattern_key(it->second.area, it->second.pattern_hash));
    records_.erase(it);
}

size_t MemoryNeuronRegistry::longterm_count() const {
    size_t count = 0;
    for (const auto& kv : records_) {
        if (kv.second.longterm) {
            ++count;
        }
    }
    return count;
}

} // namespace cortexlib
