#ifndef CORTEXLIB_STDP_H
#define CORTEXLIB_STDP_H

#include <cstdint>
#include "config.h"
#include "connectome.h"
#include "fire_ledger.h"
#include "fire_structures.h"

namespace cortexlib {

// exp(-|dt| / tau)
float stdp_timing_factor(int64_t dt, float tau);

// Firing-frequency normalization: 2 / (pre fires + post fires), counts floored at one
float stdp_activity_factor(uint32_t pre_fires, uint32_t post_fires);

// dt = post burst - pre burst; positive potentiates, negative depresses, zero leaves the weight
float stdp_updated_weight(float weight, int64_t dt, float activity, const StdpConfig& config);

// Nearest-neighbour pair rule over the ledger window
class StdpEngine {
public:
    explicit StdpEngine(const StdpConfig& config);

    // Call after the burst has been archived. Returns the number of weights changed.
    size_t apply(uint64_t burst, const FireQueue& fired, const FireLedger& ledger, Connectome& connectome);

    const StdpConfig& config() const { return config_; }

private:
    StdpConfig config_;
};

} // namespace cortexlib

#endif // CORTEXLIB_STDP_H
