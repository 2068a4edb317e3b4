#ifndef CORTEXLIB_BURST_ENGINE_H
#define CORTEXLIB_BURST_ENGINE_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "types.h"
#include "errors.h"
#include "config.h"
#include "connectome.h"
#include "fire_structures.h"
#include "fire_ledger.h"
#include "intake_queue.h"
#include "plasticity_service.h"
#include "shard_worker_pool.h"
#include "synaptic_computation.h"
#include "synaptogenesis.h"

namespace cortexlib {

struct PhaseTimings {
    double intake_us;
    double propagation_us;
    double firing_us;
    double archival_us;
    double plasticity_us;
    double cleanup_us;
    double total_us;

    PhaseTimings()
        : intake_us(0.0), propagation_us(0.0), firing_us(0.0), archival_us(0.0),
          plasticity_us(0.0), cleanup_us(0.0), total_us(0.0) {}
};

struct BurstReport {
    uint64_t index;
    size_t fired_count;
    PhaseTimings timing;
    std::vector<BurstError> errors;
    size_t inputs_accepted;
    size_t candidates;
    size_t synapses_processed;
    uint32_t saturations;
    PlasticityReport plasticity;

    BurstReport()
        : index(0), fired_count(0), inputs_accepted(0), candidates(0),
          synapses_processed(0), saturations(0) {}
};

// Consistent post-burst view for outside readers
struct BurstSnapshot {
    uint64_t burst_count;
    FireQueue fire_queue;
    std::vector<LedgerEntry> ledger;
    size_t neuron_count;
    size_t synapse_count;

    BurstSnapshot() : burst_count(0), neuron_count(0), synapse_count(0) {}
};

// Sole writer of the connectome. Each burst runs intake, propagation, firing evaluation,
// archival, plasticity and cleanup under one exclusive lock.
class BurstEngine {
public:
    // Throws ConfigurationError on an invalid genome
    explicit BurstEngine(const GenomeConfig& genome);
    ~BurstEngine();

    BurstEngine(const BurstEngine&) = delete;
    BurstEngine& operator=(const BurstEngine&) = delete;

    BurstReport advance_burst(const std::vector<SensoryInput>& external_inputs);

    // Drains the engine's intake queue, waiting no longer than the configured poll timeout
    BurstReport advance_burst();

    // Status
    uint64_t burst_count() const;
    size_t last_fired_count() const;
    double current_rate_hz() const;
    size_t fcl_size() const;

    // Snapshots
    BurstSnapshot snapshot() const;
    FireQueue fire_queue_snapshot() const;
    std::vector<LedgerEntry> ledger_snapshot() const;

    // Read-only access to the connectome under the shared lock
    template <typename Fn>
    auto inspect(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(guard_);
        const Connectome& connectome = *connectome_;
        return fn(connectome);
    }

    // Topology changes between bursts
    NeuronId grow_neuron(const std::string& area, const Position& position);
    void prune_neuron(NeuronId id);

    IntakeQueue& intake_queue() { return intake_; }
    const GenomeConfig& config() const { return config_; }
    const std::vector<SynaptogenesisResult>& construction_results() const { return construction_results_; }
    const std::vector<BurstError>& construction_errors() const { return construction_errors_; }
    size_t memory_neuron_count() const;

private:
    void build();
    void phase_intake(const std::vector<SensoryInput>& inputs, BurstReport& report);
    void phase_propagation(BurstReport& report);
    void phase_firing(uint64_t index, BurstReport& report);
    void phase_archival(uint64_t index);
    void phase_plasticity(uint64_t index, BurstReport& report);
    void phase_cleanup();

    template <typename T>
    void evaluate_shard(NeuronArray<T>& neurons, size_t shard, uint64_t index);

    std::vector<NeuronId> resolve_input(const SensoryInput& input);

    mutable std::shared_mutex guard_;
    GenomeConfig config_;
    std::unique_ptr<Connectome> connectome_;
    SynaptogenesisEngine synaptogenesis_;
    std::unique_ptr<PlasticityService> plasticity_;
    ShardWorkerPool workers_;
    IntakeQueue intake_;
    FireCandidateList fcl_;
    FireQueue fire_queue_;
    FireLedger ledger_;

    // Per-burst scratch
    std::vector<std::vector<PropagationItem>> propagation_shards_;
    std::vector<std::vector<FiredNeuron>> fired_shards_;
    std::vector<uint32_t> shard_saturations_;
    std::vector<NeuronId> refractory_;

    std::vector<SynaptogenesisResult> construction_results_;
    std::vector<BurstError> construction_errors_;
    uint64_t burst_count_;
    size_t last_fired_count_;
    std::deque<std::chrono::steady_clock::time_point> burst_times_;
};

} // namespace cortexlib

#endif // CORTEXLIB_BURST_ENGINE_H
