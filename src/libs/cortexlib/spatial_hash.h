#ifndef CORTEXLIB_SPATIAL_HASH_H
#define CORTEXLIB_SPATIAL_HASH_H

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>
#include <roaring/roaring64map.hh>
#include "types.h"
#include "morton.h"

namespace cortexlib {

struct SpatialEntry {
    NeuronId id;
    Position position;

    SpatialEntry() : id(INVALID_NEURON) {}
    SpatialEntry(NeuronId n, const Position& pos) : id(n), position(pos) {}
};

class AreaSpatialHash {
public:
    explicit AreaSpatialHash(const Dimensions& dimensions);

    void rebuild(const std::vector<SpatialEntry>& population);

    bool contains(const Position& position) const;
    const std::vector<NeuronId>& neurons_at(const Position& position) const;

    // Every neuron inside the inclusive box [min, max], clipped to the area, in Morton order.
    // Walks whichever is smaller: the voxels of the box or the occupied voxels of the area.
    std::vector<SpatialEntry> query_region(const Position& min, const Position& max) const;

    // Every neuron within Chebyshev distance `radius` of center, center voxel excluded
    std::vector<SpatialEntry> neighbors(const Position& center, uint32_t radius) const;

    std::vector<SpatialEntry> all() const;

    const Dimensions& dimensions() const { return dimensions_; }
    size_t neuron_count() const { return neuron_count_; }
    size_t occupied_voxels() const { return static_cast<size_t>(bitmap_.cardinality()); }

private:
    Dimensions dimensions_;
    roaring::Roaring64Map bitmap_;
    std::unordered_map<uint64_t, std::vector<NeuronId>> neurons_by_code_;
    size_t neuron_count_;
};

// Per-area hashes rebuilt on first query after a population change
class SpatialIndex {
public:
    using PopulationProvider = std::function<std::vector<SpatialEntry>(AreaId)>;

    explicit SpatialIndex(PopulationProvider provider);

    void register_area(AreaId area, const Dimensions& dimensions);
    void mark_dirty(AreaId area);
    bool is_dirty(AreaId area) const;

    const AreaSpatialHash& area(AreaId area);
    size_t rebuild_count() const { return rebuild_count_; }

private:
    struct Slot {
        AreaSpatialHash hash;
        bool dirty;

        explicit Slot(const Dimensions& dims) : hash(dims), dirty(true) {}
    };

    Slot& slot(AreaId area);
    const Slot& slot(AreaId area) const;

    PopulationProvider provider_;
    std::vector<Slot> slots_;
    size_t rebuild_count_;
};

} // namespace cortexlib

#endif // CORTEXLIB_SPATIAL_HASH_H
