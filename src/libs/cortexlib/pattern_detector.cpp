#include "pattern_detector.h"
#include <algorithm>
#include <utility>

namespace cortexlib {

uint64_t pattern_hash(const std::vector<NeuronId>& members) {
    uint64_t hash = 0xCBF29CE484222325ULL;
    for (NeuronId id : members) {
        for (int shift = 0; shift < 32; shift += 8) {
            hash ^= (id >> shift) & 0xFFu;
            hash *= 0x100000001B3ULL;
        }
    }
    return hash;
}

PatternDetector::PatternDetector(const PatternDetectorConfig& config, std::unordered_set<AreaId> upstream_areas)
    : config_(config), upstream_(std::move(upstream_areas)), last_hash_(0), last_burst_(0), streak_(0) {}

bool PatternDetector::finish(uint64_t burst, std::unordered_map<NeuronId, uint32_t>& support,
                             TemporalPattern& pattern) {
    std::vector<NeuronId> members;
    size_t activity = 0;
    for (const auto& kv : support) {
        if (kv.second >= config_.min_member_support) {
            members.push_back(kv.first);
            activity += kv.second;
        }
    }

    if (members.size() < config_.min_pattern_size) {
        ++stats_.empty_windows;
        streak_ = 0;
        return false;
    }

    std::sort(members.begin(), members.end());
    uint64_t hash = pattern_hash(members);

    if (streak_ > 0 && hash == last_hash_ && burst == last_burst_ + 1) {
        ++streak_;
    } else {
        streak_ = 1;
    }
    last_hash_ = hash;
    last_burst_ = burst;
    if (streak_ == config_.confirmation_count) {
        ++stats_.confirmations;
    }

    touch_cache(hash);
    ++stats_.patterns_detected;

    pattern.hash = hash;
    pattern.members = std::move(members);
    pattern.detected_burst = burst;
    pattern.total_activity = activity;
    return true;
}

void PatternDetector::touch_cache(uint64_t hash) {
    auto it = lru_index_.find(hash);
    if (it != lru_index_.end()) {
        ++stats_.cache_hits;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }
    ++stats_.cache_misses;
    lru_.push_front(hash);
    lru_index_[hash] = lru_.begin();
    if (lru_.size() > config_.max_pattern_cache) {
        lru_index_.erase(lru_.back());
        lru_.pop_back();
    }
}

} // namespace cortexlib
