#ifndef CORTEXLIB_MEMORY_NEURONS_H
#define CORTEXLIB_MEMORY_NEURONS_H

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>
#include "types.h"
#include "config.h"

namespace cortexlib {

struct MemoryNeuronRecord {
    NeuronId id;
    AreaId area;
    uint64_t pattern_hash;
    std::vector<NeuronId> members;
    uint64_t created_burst;
    uint64_t last_active_burst;
    uint32_t lifespan;          // idle bursts tolerated before retirement
    uint32_t activation_count;
    bool longterm;

    MemoryNeuronRecord()
        : id(INVALID_NEURON), area(INVALID_AREA), pattern_hash(0), created_burst(0),
          last_active_burst(0), lifespan(0), activation_count(0), longterm(false) {}
};

struct MemoryNeuronStats {
    uint64_t created;
    uint64_t reactivated;
    uint64_t retired;
    uint64_t converted_longterm;

    MemoryNeuronStats() : created(0), reactivated(0), retired(0), converted_longterm(0) {}
};

// Lifecycle bookkeeping for pattern-bound memory neurons
class MemoryNeuronRegistry {
public:
    explicit MemoryNeuronRegistry(const MemoryLifecycleConfig& config);

    const MemoryNeuronRecord& add(NeuronId id, AreaId area, uint64_t pattern_hash,
                                  const std::vector<NeuronId>& members, uint64_t burst);

    const MemoryNeuronRecord* find(NeuronId id) const;
    const MemoryNeuronRecord* find_by_pattern(AreaId area, uint64_t pattern_hash) const;

    // Extends the lifespan; returns false when no such neuron is tracked
    bool reactivate(NeuronId id, uint64_t burst);

    // Removes and returns every short-term neuron idle longer than its lifespan
    std::vector<MemoryNeuronRecord> collect_expired(uint64_t burst);

    // Drops records whose neuron disappeared outside the lifecycle
    void forget(NeuronId id);

    size_t size() const { return records_.size(); }
    size_t longterm_count() const;
    const MemoryNeuronStats& stats() const { return stats_; }

private:
    static uint64_t pattern_key(AreaId area, uint64_t hash);

    MemoryLifecycleConfig config_;
    std::map<NeuronId, MemoryNeuronRecord> records_;
    std::unordered_map<uint64_t, NeuronId> by_pattern_;
    MemoryNeuronStats stats_;
};

} // namespace cortexlib

#endif // CORTEXLIB_MEMORY_NEURONS_H
