#include "id_manager.h"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>

namespace cortexlib {

bool IdManager::take_free(uint32_t& id) {
    if (free_.empty()) {
        return false;
    }
    id = free_.back();
    free_.pop_back();
    retired_[id] = 0;
    return true;
}

void IdManager::register_fresh(uint32_t id) {
    ensure(id);
    ref_counts_[id] = 0;
    retired_[id] = 0;
}

void IdManager::add_ref(uint32_t id) {
    ensure(id);
    ++ref_counts_[id];
}

void IdManager::release_ref(uint32_t id) {
    if (id >= ref_counts_.size() || ref_counts_[id] == 0) {
        throw std::logic_error("Reference count underflow for id " + std::to_string(id));
    }
    --ref_counts_[id];
}

uint32_t IdManager::ref_count(uint32_t id) const {
    return id < ref_counts_.size() ? ref_counts_[id] : 0;
}

void IdManager::retire(uint32_t id, uint64_t burst) {
    ensure(id);
    if (retired_[id]) {
        return;
    }
    retired_[id] = 1;
    retired_at_[id] = burst;
    pending_.push_back(id);
}

bool IdManager::is_retired(uint32_t id) const {
    return id < retired_.size() && retired_[id] != 0;
}

std::vector<uint32_t> IdManager::reclaim(uint64_t now, uint64_t hold) {
    std::vector<uint32_t> reclaimed;
    std::vector<uint32_t> still_pending;
    for (uint32_t id : pending_) {
        if (ref_counts_[id] == 0 && retired_at_[id] + hold <= now) {
            reclaimed.push_back(id);
        } else {
            still_pending.push_back(id);
        }
    }
    pending_.swap(still_pending);

    if (!reclaimed.empty()) {
        free_.insert(free_.end(), reclaimed.begin(), reclaimed.end());
        std::sort(free_.begin(), free_.end(), std::greater<uint32_t>());
        std::sort(reclaimed.begin(), reclaimed.end());
    }
    return reclaimed;
}

void IdManager::ensure(uint32_t id) {
    if (id >= ref_counts_.size()) {
        ref_counts_.resize(static_cast<size_t>(id) + 1, 0);
        retired_.resize(static_cast<size_t>(id) + 1, 0);
        retired_at_.resize(static_cast<size_t>(id) + 1, 0);
    }
}

} // namespace cortexlib
