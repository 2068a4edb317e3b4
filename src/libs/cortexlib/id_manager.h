#ifndef CORTEXLIB_ID_MANAGER_H
#define CORTEXLIB_ID_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cortexlib {

// Arena id bookkeeping: a free list consulted before the arena grows, and a pending
// list of retired ids that become reusable once nothing references them and, when a
// hold is given, once that many bursts have passed since retirement.
class IdManager {
public:
    IdManager() = default;

    // Pops the lowest reusable id, or returns false when the arena must grow
    bool take_free(uint32_t& id);

    // Registers a freshly appended id
    void register_fresh(uint32_t id);

    void add_ref(uint32_t id);
    void release_ref(uint32_t id);
    uint32_t ref_count(uint32_t id) const;

    void retire(uint32_t id, uint64_t burst = 0);
    bool is_retired(uint32_t id) const;

    // Moves unreferenced retired ids with retire burst + hold <= now onto the free list
    // and returns them
    std::vector<uint32_t> reclaim(uint64_t now = 0, uint64_t hold = 0);

    std::size_t free_count() const { return free_.size(); }
    std::size_t pending_count() const { return pending_.size(); }

private:
    void ensure(uint32_t id);

    std::vector<uint32_t> free_;      // sorted descending so back() is the lowest id
    std::vector<uint32_t> pending_;
    std::vector<uint32_t> ref_counts_;
    std::vector<uint8_t> retired_;
    std::vector<uint64_t> retired_at_;
};

} // namespace cortexlib

#endif // CORTEXLIB_ID_MANAGER_H
