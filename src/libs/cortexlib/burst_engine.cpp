#include "burst_engine.h"
#include "neuron_models.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace cortexlib {

constexpr size_t RATE_WINDOW = 16;

static const GenomeConfig& validated(const GenomeConfig& genome) {
    validate_genome(genome);
    return genome;
}

static double elapsed_us(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::micro>(std::chrono::steady_clock::now() - start).count();
}

static std::string describe(const Position& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ", " + std::to_string(p.z) + ")";
}

BurstEngine::BurstEngine(const GenomeConfig& genome)
    : config_(validated(genome)),
      synaptogenesis_(genome.engine.rng_seed),
      workers_(genome.engine.worker_threads, genome.engine.pin_worker_threads),
      intake_(genome.engine.intake_queue_capacity),
      fcl_(genome.engine.shard_count, ActiveStorage::NEURON_CAPACITY),
      ledger_(genome.engine.ledger_capacity),
      burst_count_(0),
      last_fired_count_(0) {
    build();
}

BurstEngine::~BurstEngine() = default;

void BurstEngine::build() {
    auto start = std::chrono::steady_clock::now();
    connectome_ = std::make_unique<Connectome>(config_.engine.precision);

    for (const auto& area : config_.areas) {
        AreaId id = connectome_->add_area(area);
        if (area.populate) {
            connectome_->populate_area(id);
        }
    }

    construction_results_ = synaptogenesis_.apply_rules(*connectome_, config_.rules, 0, construction_errors_);
    plasticity_ = std::make_unique<PlasticityService>(config_.plasticity, *connectome_);
    connectome_->verify_integrity();

    const size_t shards = config_.engine.shard_count;
    propagation_shards_.resize(shards);
    fired_shards_.resize(shards);
    if (ActiveStorage::SYNAPSE_CAPACITY != std::numeric_limits<size_t>::max()) {
        reserve_propagation(propagation_shards_, shards, ActiveStorage::SYNAPSE_CAPACITY);
        for (auto& fired : fired_shards_) {
            fired.reserve(ActiveStorage::NEURON_CAPACITY / shards + 1);
        }
    }
    shard_saturations_.assign(shards, 0);

    spdlog::info("Burst engine ready: {} areas, {} neurons, {} synapses ({} precision, {} storage, "
                 "{} workers, {} shards) in {:.1f} ms",
                 connectome_->area_count(), connectome_->neuron_count(), connectome_->synapse_count(),
                 precision_name(config_.engine.precision), ActiveStorage::NAME, workers_.worker_count(),
                 shards, elapsed_us(start) / 1000.0);
    if (!construction_errors_.empty()) {
        spdlog::warn("{} synaptogenesis rules failed during construction", construction_errors_.size());
    }
}

BurstReport BurstEngine::advance_burst() {
    std::vector<SensoryInput> inputs = intake_.poll(
        config_.engine.max_intake_per_burst,
        std::chrono::milliseconds(config_.engine.intake_poll_timeout_ms));
    return advance_burst(inputs);
}

BurstReport BurstEngine::advance_burst(const std::vector<SensoryInput>& external_inputs) {
    std::unique_lock<std::shared_mutex> lock(guard_);
    auto burst_start = std::chrono::steady_clock::now();

    BurstReport report;
    report.index = burst_count_;
    connectome_->set_current_burst(report.index);

    auto phase_start = std::chrono::steady_clock::now();
    phase_intake(external_inputs, report);
    report.timing.intake_us = elapsed_us(phase_start);

    phase_start = std::chrono::steady_clock::now();
    phase_propagation(report);
    report.timing.propagation_us = elapsed_us(phase_start);

    phase_start = std::chrono::steady_clock::now();
    phase_firing(report.index, report);
    report.timing.firing_us = elapsed_us(phase_start);

    phase_start = std::chrono::steady_clock::now();
    phase_archival(report.index);
    report.timing.archival_us = elapsed_us(phase_start);

    phase_start = std::chrono::steady_clock::now();
    phase_plasticity(report.index, report);
    report.timing.plasticity_us = elapsed_us(phase_start);

    phase_start = std::chrono::steady_clock::now();
    phase_cleanup();
    report.timing.cleanup_us = elapsed_us(phase_start);

    report.timing.total_us = elapsed_us(burst_start);
    report.fired_count = fire_queue_.size();

    ++burst_count_;
    last_fired_count_ = report.fired_count;
    burst_times_.push_back(std::chrono::steady_clock::now());
    while (burst_times_.size() > RATE_WINDOW) {
        burst_times_.pop_front();
    }

    SPDLOG_DEBUG("Burst {}: {} inputs, {} candidates, {} fired, {} synapses, {:.1f} us",
                 report.index, report.inputs_accepted, report.candidates, report.fired_count,
                 report.synapses_processed, report.timing.total_us);
    return report;
}

void BurstEngine::phase_intake(const std::vector<SensoryInput>& inputs, BurstReport& report) {
    fcl_.reserve_ids(connectome_->neuron_slots());

    const size_t limit = config_.engine.max_intake_per_burst;
    size_t index = 0;
    for (; index < inputs.size() && report.inputs_accepted < limit; ++index) {
        try {
            for (NeuronId id : resolve_input(inputs[index])) {
                fcl_.accumulate(id, inputs[index].activation);
            }
            ++report.inputs_accepted;
        } catch (const IntakeError& e) {
            spdlog::warn("Burst {}: dropped sensory input: {}", report.index, e.what());
            report.errors.emplace_back(BurstErrorKind::INTAKE, e.what());
        }
    }
    if (index < inputs.size()) {
        std::string message = std::to_string(inputs.size() - index) + " inputs over the per-burst limit of " +
                              std::to_string(limit) + " were dropped";
        spdlog::warn("Burst {}: {}", report.index, message);
        report.errors.emplace_back(BurstErrorKind::INTAKE, message);
    }
}

std::vector<NeuronId> BurstEngine::resolve_input(const SensoryInput& input) {
    if (!std::isfinite(input.activation)) {
        throw IntakeError("Activation is not a finite number");
    }
    if (input.targets_neuron()) {
        if (!connectome_->is_live(input.neuron)) {
            throw IntakeError("Unknown neuron " + std::to_string(input.neuron));
        }
        return {input.neuron};
    }

    const CorticalArea* area = connectome_->find_area(input.area);
    if (area == nullptr) {
        throw IntakeError("Unknown cortical area '" + input.area + "'");
    }
    if (!area->dimensions().contains(input.position)) {
        throw IntakeError("Position " + describe(input.position) + " lies outside area '" + input.area + "'");
    }
    const auto& ids = connectome_->spatial(area->id).neurons_at(input.position);
    if (ids.empty()) {
        throw IntakeError("No neuron at " + describe(input.position) + " in area '" + input.area + "'");
    }
    return ids;
}

void BurstEngine::phase_propagation(BurstReport& report) {
    const size_t shards = fcl_.shard_count();
    report.synapses_processed = partition_propagation(*connectome_, fire_queue_, shards, propagation_shards_);

    const SynapseStorage& synapses = connectome_->synapse_storage();
    workers_.run(shards, [&](size_t shard) {
        const auto& items = propagation_shards_[shard];
        accumulate_contributions(synapses, items.data(), items.size(), fcl_);
    });
}

template <typename T>
void BurstEngine::evaluate_shard(NeuronArray<T>& neurons, size_t shard, uint64_t index) {
    using Traits = NeuralValueTraits<T>;
    std::vector<FiredNeuron>& fired = fired_shards_[shard];
    uint32_t& saturations = shard_saturations_[shard];
    const uint64_t seed = config_.engine.rng_seed;

    std::vector<NeuronId> candidates = fcl_.shard_candidates(shard);
    std::sort(candidates.begin(), candidates.end());
    std::stable_sort(candidates.begin(), candidates.end(), [&neurons](NeuronId a, NeuronId b) {
        return neurons.area(a) < neurons.area(b);
    });

    size_t begin = 0;
    while (begin < candidates.size()) {
        const AreaId area_id = neurons.area(candidates[begin]);
        size_t end = begin;
        while (end < candidates.size() && neurons.area(candidates[end]) == area_id) {
            ++end;
        }

        // One dispatch per area run; the loop below is specialized per model
        const CorticalArea& area = connectome_->area(area_id);
        std::visit([&](const auto& model) {
            for (size_t i = begin; i < end; ++i) {
                NeuronId id = candidates[i];
                float input = fcl_.get(id);
                if (!neurons.is_valid(id) || input == 0.0f) {
                    continue;
                }
                StepResult<T> result = model.step(Traits::from_float(input, saturations), neurons.state(id),
                                                  neurons.params(id), excitability_draw(seed, id, index),
                                                  saturations);
                neurons.set_state(id, result.state);
                if (result.fired) {
                    fired.emplace_back(id, area_id, Traits::to_float(result.fire_potential), neurons.position(id));
                }
            }
        }, area.model);
        begin = end;
    }
}

void BurstEngine::phase_firing(uint64_t index, BurstReport& report) {
    const size_t shards = fcl_.shard_count();
    report.candidates = fcl_.size();
    for (size_t s = 0; s < shards; ++s) {
        fired_shards_[s].clear();
        shard_saturations_[s] = 0;
    }

    NeuronStorage& storage = connectome_->neuron_storage();

    // Countdowns tick every burst, input or not
    std::visit([&](auto& neurons) {
        for (NeuronId id : refractory_) {
            if (neurons.is_valid(id) && fcl_.get(id) == 0.0f) {
                neurons.tick_refractory(id);
            }
        }
    }, storage);

    workers_.run(shards, [&](size_t shard) {
        std::visit([&](auto& neurons) { evaluate_shard(neurons, shard, index); }, storage);
    });

    fire_queue_.reset(index);
    for (size_t s = 0; s < shards; ++s) {
        fire_queue_.append(fired_shards_[s]);
        report.saturations += shard_saturations_[s];
    }
    fire_queue_.finalize();

    std::vector<NeuronId> blocked;
    std::visit([&](const auto& neurons) {
        for (NeuronId id : refractory_) {
            if (neurons.is_valid(id) && neurons.refractory_countdown(id) > 0) {
                blocked.push_back(id);
            }
        }
        for (const FiredNeuron& neuron : fire_queue_) {
            if (neurons.refractory_countdown(neuron.id) > 0) {
                blocked.push_back(neuron.id);
            }
        }
    }, storage);
    std::sort(blocked.begin(), blocked.end());
    blocked.erase(std::unique(blocked.begin(), blocked.end()), blocked.end());
    refractory_.swap(blocked);
}

void BurstEngine::phase_archival(uint64_t index) {
    ledger_.record(index, fire_queue_);
}

void BurstEngine::phase_plasticity(uint64_t index, BurstReport& report) {
    report.plasticity = plasticity_->process_burst(index, fire_queue_, ledger_, *connectome_,
                                                   synaptogenesis_, report.errors);
}

void BurstEngine::phase_cleanup() {
    fcl_.clear();
    for (auto& items : propagation_shards_) {
        items.clear();
    }
    for (auto& fired : fired_shards_) {
        fired.clear();
    }

    // An id stays retired until no ledger entry can still hold its firing history
    std::vector<NeuronId> reclaimed = connectome_->reclaim_retired(ledger_.capacity());
    if (!reclaimed.empty()) {
        // A reclaimed id may be reused before the next propagation
        fire_queue_.erase(reclaimed);
        refractory_.erase(std::remove_if(refractory_.begin(), refractory_.end(),
                                         [this](NeuronId id) { return !connectome_->is_live(id); }),
                          refractory_.end());
        SPDLOG_DEBUG("Reclaimed {} neuron ids", reclaimed.size());
    }
}

uint64_t BurstEngine::burst_count() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    return burst_count_;
}

size_t BurstEngine::last_fired_count() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    return last_fired_count_;
}

double BurstEngine::current_rate_hz() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    if (burst_times_.size() < 2) {
        return 0.0;
    }
    double seconds = std::chrono::duration<double>(burst_times_.back() - burst_times_.front()).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(burst_times_.size() - 1) / seconds;
}

size_t BurstEngine::fcl_size() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    return fcl_.size();
}

BurstSnapshot BurstEngine::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    BurstSnapshot snapshot;
    snapshot.burst_count = burst_count_;
    snapshot.fire_queue = fire_queue_;
    snapshot.ledger = ledger_.snapshot();
    snapshot.neuron_count = connectome_->neuron_count();
    snapshot.synapse_count = connectome_->synapse_count();
    return snapshot;
}

FireQueue BurstEngine::fire_queue_snapshot() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    return fire_queue_;
}

std::vector<LedgerEntry> BurstEngine::ledger_snapshot() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    return ledger_.snapshot();
}

NeuronId BurstEngine::grow_neuron(const std::string& area, const Position& position) {
    std::unique_lock<std::shared_mutex> lock(guard_);
    const CorticalArea* target = connectome_->find_area(area);
    if (target == nullptr) {
        throw std::invalid_argument("Unknown cortical area '" + area + "'");
    }
    NeuronId id = connectome_->add_neuron(target->id, position);
    try {
        size_t created = synaptogenesis_.grow_neuron(*connectome_, id, config_.rules, burst_count_);
        spdlog::debug("Grew neuron {} in '{}' with {} synapses", id, area, created);
    } catch (const std::exception& e) {
        connectome_->remove_neuron(id);
        spdlog::warn("Growth of neuron in '{}' at {} rolled back: {}", area, describe(position), e.what());
        throw;
    }
    return id;
}

void BurstEngine::prune_neuron(NeuronId id) {
    std::unique_lock<std::shared_mutex> lock(guard_);
    connectome_->remove_neuron(id);
    plasticity_->neuron_removed(id);
}

size_t BurstEngine::memory_neuron_count() const {
    std::shared_lock<std::shared_mutex> lock(guard_);
    return plasticity_->memory_neurons().size();
}

} // namespace cortexlib
