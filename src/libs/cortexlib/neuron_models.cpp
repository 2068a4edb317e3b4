#include "neuron_models.h"
#include "errors.h"

namespace cortexlib {

static uint64_t mix64(uint64_t value) {
    value += 0x9E3779B97F4A7C15ULL;
    value = (value ^ (value >> 30)) * 0xBF58476D1CE4E5B9ULL;
    value = (value ^ (value >> 27)) * 0x94D049BB133111EBULL;
    return value ^ (value >> 31);
}

float excitability_draw(uint64_t seed, NeuronId id, uint64_t burst) {
    uint64_t hash = mix64(seed ^ mix64((static_cast<uint64_t>(id) << 32) ^ burst));
    // Top 24 bits give an exactly representable float in [0, 1)
    return static_cast<float>(hash >> 40) / 16777216.0f;
}

NeuronModel make_neuron_model(const std::string& tag) {
    if (tag == LeakyIntegrateFireModel::NAME) {
        return LeakyIntegrateFireModel{};
    }
    if (tag == IntegrateFireModel::NAME) {
        return IntegrateFireModel{};
    }
    if (tag == MemoryNeuronModel::NAME) {
        return MemoryNeuronModel{};
    }
    throw ConfigurationError("Unknown neuron model '" + tag + "'");
}

const char* neuron_model_name(const NeuronModel& model) {
    return std::visit([](const auto& m) { return m.NAME; }, model);
}

bool is_known_neuron_model(const std::string& tag) {
    return tag == LeakyIntegrateFireModel::NAME || tag == IntegrateFireModel::NAME ||
           tag == MemoryNeuronModel::NAME;
}

} // namespace cortexlib
