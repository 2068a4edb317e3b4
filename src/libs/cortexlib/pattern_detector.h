#ifndef CORTEXLIB_PATTERN_DETECTOR_H
#define CORTEXLIB_PATTERN_DETECTOR_H

#include <cstdint>
#include <list>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "types.h"
#include "config.h"
#include "fire_ledger.h"

namespace cortexlib {

struct TemporalPattern {
    uint64_t hash;
    std::vector<NeuronId> members;   // sorted
    uint64_t detected_burst;
    size_t total_activity;

    TemporalPattern() : hash(0), detected_burst(0), total_activity(0) {}
};

struct PatternDetectorStats {
    uint64_t patterns_detected;
    uint64_t empty_windows;
    uint64_t cache_hits;
    uint64_t cache_misses;
    uint64_t confirmations;

    PatternDetectorStats()
        : patterns_detected(0), empty_windows(0), cache_hits(0), cache_misses(0), confirmations(0) {}
};

// 64-bit FNV-1a over the member ids
uint64_t pattern_hash(const std::vector<NeuronId>& members);

// Finds the co-firing set of one memory area's upstream neurons and tracks how many
// consecutive bursts it has been seen.
class PatternDetector {
public:
    PatternDetector(const PatternDetectorConfig& config, std::unordered_set<AreaId> upstream_areas);

    // `area_of` maps a neuron id to its area. Returns true when a pattern was found.
    template <typename AreaLookup>
    bool detect(uint64_t burst, const FireLedger& ledger, AreaLookup&& area_of, TemporalPattern& pattern);

    // Streak length of the most recent detection
    uint32_t streak() const { return streak_; }
    bool confirmed() const { return streak_ >= config_.confirmation_count; }

    const PatternDetectorStats& stats() const { return stats_; }
    size_t cache_size() const { return lru_.size(); }
    const std::unordered_set<AreaId>& upstream_areas() const { return upstream_; }

private:
    bool finish(uint64_t burst, std::unordered_map<NeuronId, uint32_t>& support, TemporalPattern& pattern);
    void touch_cache(uint64_t hash);

    PatternDetectorConfig config_;
    std::unordered_set<AreaId> upstream_;
    PatternDetectorStats stats_;
    uint64_t last_hash_;
    uint64_t last_burst_;
    uint32_t streak_;
    std::list<uint64_t> lru_;
    std::unordered_map<uint64_t, std::list<uint64_t>::iterator> lru_index_;
};

template <typename AreaLookup>
bool PatternDetector::detect(uint64_t burst, const FireLedger& ledger, AreaLookup&& area_of,
                             TemporalPattern& pattern) {
    std::unordered_map<NeuronId, uint32_t> support;
    for (const auto& entry : ledger.window(config_.temporal_depth)) {
        for (NeuronId id : entry.fired) {
            if (upstream_.count(area_of(id))) {
                ++support[id];
            }
        }
    }
    return finish(burst, support, pattern);
}

} // namespace cortexlib

#endif // CORTEXLIB_PATTERN_DETECTOR_H
