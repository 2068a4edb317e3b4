#include "fire_ledger.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace cortexlib {

LedgerEntry::LedgerEntry(uint64_t b, const std::vector<NeuronId>& ids) : burst(b) {
    fired.addMany(ids.size(), ids.data());
    fired.runOptimize();
}

std::vector<NeuronId> LedgerEntry::ids() const {
    std::vector<NeuronId> result;
    result.reserve(count());
    for (NeuronId id : fired) {
        result.push_back(id);
    }
    return result;
}

FireLedger::FireLedger(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("Fire ledger capacity must be positive");
    }
}

void FireLedger::record(uint64_t burst, const FireQueue& queue) {
    record(burst, queue.ids());
}

void FireLedger::record(uint64_t burst, const std::vector<NeuronId>& fired) {
    if (!entries_.empty() && burst <= entries_.back().burst) {
        throw std::invalid_argument("Ledger burst " + std::to_string(burst) +
                                    " does not follow " + std::to_string(entries_.back().burst));
    }
    entries_.emplace_back(burst, fired);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

uint64_t FireLedger::latest_burst() const {
    if (entries_.empty()) {
        throw std::out_of_range("Fire ledger is empty");
    }
    return entries_.back().burst;
}

uint64_t FireLedger::oldest_burst() const {
    if (entries_.empty()) {
        throw std::out_of_range("Fire ledger is empty");
    }
    return entries_.front().burst;
}

const LedgerEntry* FireLedger::find(uint64_t burst) const {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), burst,
                               [](const LedgerEntry& e, uint64_t value) { return e.burst < value; });
    if (it == entries_.end() || it->burst != burst) {
        return nullptr;
    }
    return &(*it);
}

bool FireLedger::fired_at(uint64_t burst, NeuronId id) const {
    const LedgerEntry* entry = find(burst);
    return entry != nullptr && entry->contains(id);
}

std::vector<LedgerEntry> FireLedger::window(size_t depth) const {
    size_t count = std::min(depth, entries_.size());
    return std::vector<LedgerEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end());
}

std::unordered_map<NeuronId, uint64_t> FireLedger::latest_fires(uint64_t first_burst, uint64_t last_burst) const {
    std::unordered_map<NeuronId, uint64_t> latest;
    for (const auto& entry : entries_) {
        if (entry.burst < first_burst || entry.burst > last_burst) {
            continue;
        }
        for (NeuronId id : entry.fired) {
            latest[id] = entry.burst;
        }
    }
    return latest;
}

std::unordered_map<NeuronId, uint32_t> FireLedger::fire_counts(uint64_t first_burst, uint64_t last_burst) const {
    std::unordered_map<NeuronId, uint32_t> counts;
    for (const auto& entry : entries_) {
        if (entry.burst < first_burst || entry.burst > last_burst) {
            continue;
        }
        for (NeuronId id : entry.fired) {
            ++counts[id];
        }
    }
    return counts;
}

std::vector<LedgerEntry> FireLedger::snapshot() const {
    return std::vector<LedgerEntry>(entries_.begin(), entries_.end());
}

} // namespace cortexlib
