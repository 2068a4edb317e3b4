#ifndef CORTEXLIB_CORTICAL_AREA_H
#define CORTEXLIB_CORTICAL_AREA_H

#include <string>
#include <vector>
#include "types.h"
#include "config.h"
#include "neuron_models.h"

namespace cortexlib {

struct CorticalArea {
    AreaId id;
    CorticalAreaConfig config;
    NeuronModel model;
    std::vector<NeuronId> neurons;   // live members, ascending

    CorticalArea(AreaId area_id, const CorticalAreaConfig& cfg)
        : id(area_id), config(cfg), model(make_neuron_model(cfg.model)) {}

    const std::string& name() const { return config.name; }
    const Dimensions& dimensions() const { return config.dimensions; }
    size_t neuron_count() const { return neurons.size(); }

    const std::string* metadata(const std::string& key) const {
        auto it = config.metadata.find(key);
        return it == config.metadata.end() ? nullptr : &it->second;
    }
};

} // namespace cortexlib

#endif // CORTEXLIB_CORTICAL_AREA_H
