#ifndef CORTEXLIB_FIRE_LEDGER_H
#define CORTEXLIB_FIRE_LEDGER_H

#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>
#include <roaring/roaring.hh>
#include "types.h"
#include "fire_structures.h"

namespace cortexlib {

struct LedgerEntry {
    uint64_t burst;
    roaring::Roaring fired;

    LedgerEntry() : burst(0) {}
    LedgerEntry(uint64_t b, const std::vector<NeuronId>& ids);

    bool contains(NeuronId id) const { return fired.contains(id); }
    size_t count() const { return static_cast<size_t>(fired.cardinality()); }
    bool empty() const { return fired.isEmpty(); }
    // Fired ids, ascending
    std::vector<NeuronId> ids() const;

    bool operator==(const LedgerEntry& other) const {
        return burst == other.burst && fired == other.fired;
    }
};

// Bounded FIFO history of fired sets, one entry per burst, strictly increasing burst index
class FireLedger {
public:
    explicit FireLedger(size_t capacity);

    void record(uint64_t burst, const FireQueue& queue);
    void record(uint64_t burst, const std::vector<NeuronId>& fired);

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }
    uint64_t latest_burst() const;
    uint64_t oldest_burst() const;

    const LedgerEntry* find(uint64_t burst) const;
    bool fired_at(uint64_t burst, NeuronId id) const;

    // Most recent `depth` entries, oldest first
    std::vector<LedgerEntry> window(size_t depth) const;

    // Per-neuron statistics over entries with first_burst <= burst <= last_burst
    std::unordered_map<NeuronId, uint64_t> latest_fires(uint64_t first_burst, uint64_t last_burst) const;
    std::unordered_map<NeuronId, uint32_t> fire_counts(uint64_t first_burst, uint64_t last_burst) const;

    const std::deque<LedgerEntry>& entries() const { return entries_; }
    std::vector<LedgerEntry> snapshot() const;

private:
    std::deque<LedgerEntry> entries_;
    size_t capacity_;
};

} // namespace cortexlib

#endif // CORTEXLIB_FIRE_LEDGER_H
