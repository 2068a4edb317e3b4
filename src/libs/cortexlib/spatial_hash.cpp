#include "spatial_hash.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace cortexlib {

AreaSpatialHash::AreaSpatialHash(const Dimensions& dimensions)
    : dimensions_(dimensions), neuron_count_(0) {}

void AreaSpatialHash::rebuild(const std::vector<SpatialEntry>& population) {
    bitmap_ = roaring::Roaring64Map();
    neurons_by_code_.clear();
    neuron_count_ = 0;

    for (const auto& entry : population) {
        if (!dimensions_.contains(entry.position)) {
            throw std::logic_error("Neuron " + std::to_string(entry.id) + " lies outside its area");
        }
        uint64_t code = morton_encode(entry.position);
        bitmap_.add(code);
        neurons_by_code_[code].push_back(entry.id);
        ++neuron_count_;
    }
    for (auto& kv : neurons_by_code_) {
        std::sort(kv.second.begin(), kv.second.end());
    }
}

bool AreaSpatialHash::contains(const Position& position) const {
    if (!dimensions_.contains(position)) {
        return false;
    }
    return bitmap_.contains(morton_encode(position));
}

const std::vector<NeuronId>& AreaSpatialHash::neurons_at(const Position& position) const {
    static const std::vector<NeuronId> empty;
    if (!dimensions_.contains(position)) {
        return empty;
    }
    auto it = neurons_by_code_.find(morton_encode(position));
    return it == neurons_by_code_.end() ? empty : it->second;
}

std::vector<SpatialEntry> AreaSpatialHash::query_region(const Position& min, const Position& max) const {
    std::vector<SpatialEntry> result;
    if (dimensions_.volume() == 0) {
        return result;
    }

    Position lo(std::max(min.x, 0), std::max(min.y, 0), std::max(min.z, 0));
    Position hi(static_cast<int32_t>(std::min<int64_t>(max.x, static_cast<int64_t>(dimensions_.width) - 1)),
                static_cast<int32_t>(std::min<int64_t>(max.y, static_cast<int64_t>(dimensions_.height) - 1)),
                static_cast<int32_t>(std::min<int64_t>(max.z, static_cast<int64_t>(dimensions_.depth) - 1)));
    if (lo.x > hi.x || lo.y > hi.y || lo.z > hi.z) {
        return result;
    }

    uint64_t box_volume = static_cast<uint64_t>(hi.x - lo.x + 1) *
                          static_cast<uint64_t>(hi.y - lo.y + 1) *
                          static_cast<uint64_t>(hi.z - lo.z + 1);

    std::vector<uint64_t> codes;
    if (box_volume < bitmap_.cardinality()) {
        for (int32_t z = lo.z; z <= hi.z; ++z) {
            for (int32_t y = lo.y; y <= hi.y; ++y) {
                for (int32_t x = lo.x; x <= hi.x; ++x) {
                    uint64_t code = morton_encode(Position(x, y, z));
                    if (bitmap_.contains(code)) {
                        codes.push_back(code);
                    }
                }
            }
        }
        std::sort(codes.begin(), codes.end());
    } else {
        for (uint64_t code : bitmap_) {
            Position pos = morton_decode(code);
            if (pos.x >= lo.x && pos.x <= hi.x && pos.y >= lo.y && pos.y <= hi.y &&
                pos.z >= lo.z && pos.z <= hi.z) {
                codes.push_back(code);
            }
        }
    }

    for (uint64_t code : codes) {
        Position pos = morton_decode(code);
        for (NeuronId id : neurons_by_code_.at(code)) {
            result.emplace_back(id, pos);
        }
    }
    return result;
}

std::vector<SpatialEntry> AreaSpatialHash::neighbors(const Position& center, uint32_t radius) const {
    int32_t r = static_cast<int32_t>(std::min<uint32_t>(radius, MORTON_MAX_COORDINATE));
    std::vector<SpatialEntry> region = query_region(
        Position(center.x - r, center.y - r, center.z - r),
        Position(center.x + r, center.y + r, center.z + r));

    region.erase(std::remove_if(region.begin(), region.end(),
                                [&](const SpatialEntry& e) { return e.position == center; }),
                 region.end());
    return region;
}

std::vector<SpatialEntry> AreaSpatialHash::all() const {
    if (dimensions_.volume() == 0) {
        return {};
    }
    return query_region(Position(0, 0, 0),
                        Position(static_cast<int32_t>(dimensions_.width - 1),
                                 static_cast<int32_t>(dimensions_.height - 1),
                                 static_cast<int32_t>(dimensions_.depth - 1)));
}

SpatialIndex::SpatialIndex(PopulationProvider provider)
    : provider_(std::move(provider)), rebuild_count_(0) {
    if (!provider_) {
        throw std::invalid_argument("Spatial index needs a population provider");
    }
}

void SpatialIndex::register_area(AreaId area, const Dimensions& dimensions) {
    if (area != slots_.size()) {
        throw std::invalid_argument("Areas must be registered in id order");
    }
    slots_.emplace_back(dimensions);
}

void SpatialIndex::mark_dirty(AreaId area) {
    slot(area).dirty = true;
}

bool SpatialIndex::is_dirty(AreaId area) const {
    return slot(area).dirty;
}

const AreaSpatialHash& SpatialIndex::area(AreaId area) {
    Slot& s = slot(area);
    if (s.dirty) {
        s.hash.rebuild(provider_(area));
        s.dirty = false;
        ++rebuild_count_;
        SPDLOG_DEBUG("Rebuilt spatial hash for area {} ({} neurons)", area, s.hash.neuron_count());
    }
    return s.hash;
}

SpatialIndex::Slot& SpatialIndex::slot(AreaId area) {
    if (area >= slots_.size()) {
        throw std::out_of_range("Unknown area " + std::to_string(area));
    }
    return slots_[area];
}

const SpatialIndex::Slot& SpatialIndex::slot(AreaId area) const {
    if (area >= slots_.size()) {
        throw std::out_of_range("Unknown area " + std::to_string(area));
    }
    return slots_[area];
}

} // namespace cortexlib
