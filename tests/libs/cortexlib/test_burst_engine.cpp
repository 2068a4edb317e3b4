#include <gtest/gtest.h>
#include "burst_engine.h"
#include <cmath>
#include <limits>
#include <memory>

using namespace cortexlib;

// input(4x1x1) projects one-to-one onto output(4x1x1); ids 0..3 are input, 4..7 output
class BurstEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        genome.areas.push_back(CorticalAreaConfig("input", Dimensions(4, 1, 1)));
        CorticalAreaConfig output("output", Dimensions(4, 1, 1));
        output.neuron.refractory_period = 2;
        genome.areas.push_back(output);

        genome.rules.push_back(SynaptogenesisRuleConfig("input", "output", ProjectorMorphology()));
        genome.plasticity.stdp.enabled = false;
    }

    std::vector<LedgerEntry> run_random_drive(const GenomeConfig& config, int bursts) {
        BurstEngine engine(config);
        for (int burst = 0; burst < bursts; ++burst) {
            std::vector<SensoryInput> inputs;
            for (int32_t x = 0; x < 4; ++x) {
                if ((burst + x) % 3 != 0) {
                    inputs.push_back(SensoryInput::at_position("input", Position(x, 0, 0), 0.6f + 0.1f * x));
                }
            }
            engine.advance_burst(inputs);
        }
        return engine.ledger_snapshot();
    }

    GenomeConfig genome;
};

TEST_F(BurstEngineTest, Constructor_RejectsInvalidGenome) {
    genome.engine.shard_count = 0;
    EXPECT_THROW(BurstEngine engine(genome), ConfigurationError);

    genome.engine.shard_count = 4;
    genome.rules.push_back(SynaptogenesisRuleConfig("input", "nowhere", ProjectorMorphology()));
    EXPECT_THROW(BurstEngine engine(genome), ConfigurationError);
}

TEST_F(BurstEngineTest, Constructor_BuildsTopology) {
    BurstEngine engine(genome);
    BurstSnapshot snapshot = engine.snapshot();
    EXPECT_EQ(snapshot.burst_count, 0u);
    EXPECT_EQ(snapshot.neuron_count, 8u);
    EXPECT_EQ(snapshot.synapse_count, 4u);
    EXPECT_TRUE(engine.construction_errors().empty());
    EXPECT_TRUE(engine.inspect([](const Connectome& c) { return c.synapse_exists(2, 6); }));
}

TEST_F(BurstEngineTest, AdvanceBurst_PropagatesOneBurstLater) {
    BurstEngine engine(genome);

    BurstReport first = engine.advance_burst({SensoryInput::at_position("input", Position(0, 0, 0), 1.5f)});
    EXPECT_EQ(first.index, 0u);
    EXPECT_EQ(first.inputs_accepted, 1u);
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{0}));

    BurstReport second = engine.advance_burst({});
    EXPECT_EQ(second.index, 1u);
    EXPECT_EQ(second.synapses_processed, 1u);
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{4}));

    BurstReport third = engine.advance_burst({});
    EXPECT_EQ(third.fired_count, 0u);
    EXPECT_EQ(engine.burst_count(), 3u);
    EXPECT_EQ(engine.last_fired_count(), 0u);

    auto ledger = engine.ledger_snapshot();
    ASSERT_EQ(ledger.size(), 3u);
    EXPECT_TRUE(ledger[0].contains(0));
    EXPECT_TRUE(ledger[1].contains(4));
    EXPECT_TRUE(ledger[2].empty());
}

TEST_F(BurstEngineTest, AdvanceBurst_SubthresholdInputIntegrates) {
    BurstEngine engine(genome);
    engine.advance_burst({SensoryInput::to_neuron(1, 0.5f)});
    EXPECT_EQ(engine.last_fired_count(), 0u);
    EXPECT_FLOAT_EQ(engine.inspect([](const Connectome& c) { return c.membrane_potential(1); }), 0.5f);

    // 0.5 * 0.9 + 0.6 = 1.05
    engine.advance_burst({SensoryInput::to_neuron(1, 0.6f)});
    EXPECT_TRUE(engine.fire_queue_snapshot().contains(1));
    EXPECT_FLOAT_EQ(engine.inspect([](const Connectome& c) { return c.membrane_potential(1); }), 0.0f);
}

TEST_F(BurstEngineTest, AdvanceBurst_IdleBurstFiresNothing) {
    BurstEngine engine(genome);
    BurstReport report = engine.advance_burst({});
    EXPECT_EQ(report.fired_count, 0u);
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(engine.fcl_size(), 0u);
}

TEST_F(BurstEngineTest, AdvanceBurst_CandidateListEmptyAfterBurst) {
    BurstEngine engine(genome);
    BurstReport report = engine.advance_burst({SensoryInput::to_neuron(0, 0.2f), SensoryInput::to_neuron(3, 0.2f)});
    EXPECT_EQ(report.candidates, 2u);
    EXPECT_EQ(engine.fcl_size(), 0u);
}

TEST_F(BurstEngineTest, AdvanceBurst_ReportsBadInputs) {
    BurstEngine engine(genome);
    std::vector<SensoryInput> inputs = {
        SensoryInput::at_position("retina", Position(0, 0, 0), 1.0f),
        SensoryInput::at_position("input", Position(4, 0, 0), 1.0f),
        SensoryInput::to_neuron(999, 1.0f),
        SensoryInput::to_neuron(0, std::numeric_limits<float>::quiet_NaN()),
        SensoryInput::to_neuron(2, 1.5f),
    };
    BurstReport report = engine.advance_burst(inputs);

    EXPECT_EQ(report.inputs_accepted, 1u);
    ASSERT_EQ(report.errors.size(), 4u);
    for (const auto& error : report.errors) {
        EXPECT_EQ(error.kind, BurstErrorKind::INTAKE);
    }
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{2}));
}

TEST_F(BurstEngineTest, AdvanceBurst_DropsInputsOverLimit) {
    genome.engine.max_intake_per_burst = 2;
    BurstEngine engine(genome);
    BurstReport report = engine.advance_burst({SensoryInput::to_neuron(0, 1.5f), SensoryInput::to_neuron(1, 1.5f),
                                               SensoryInput::to_neuron(2, 1.5f)});
    EXPECT_EQ(report.inputs_accepted, 2u);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].kind, BurstErrorKind::INTAKE);
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{0, 1}));
}

TEST_F(BurstEngineTest, AdvanceBurst_RefractoryBlocksWithInput) {
    BurstEngine engine(genome);
    std::vector<bool> fired;
    for (int burst = 0; burst < 4; ++burst) {
        engine.advance_burst({SensoryInput::to_neuron(4, 1.5f)});
        fired.push_back(engine.fire_queue_snapshot().contains(4));
    }
    EXPECT_EQ(fired, (std::vector<bool>{true, false, false, true}));
}

TEST_F(BurstEngineTest, AdvanceBurst_RefractoryCountsDownWhileIdle) {
    BurstEngine engine(genome);
    engine.advance_burst({SensoryInput::to_neuron(5, 1.5f)});
    engine.advance_burst({});
    engine.advance_burst({});
    engine.advance_burst({SensoryInput::to_neuron(5, 1.5f)});
    EXPECT_TRUE(engine.fire_queue_snapshot().contains(5));
}

TEST_F(BurstEngineTest, AdvanceBurst_DrainsIntakeQueue) {
    BurstEngine engine(genome);
    EXPECT_TRUE(engine.intake_queue().push(SensoryInput::at_position("input", Position(3, 0, 0), 2.0f)));

    BurstReport report = engine.advance_burst();
    EXPECT_EQ(report.inputs_accepted, 1u);
    EXPECT_TRUE(engine.intake_queue().empty());
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{3}));
}

TEST_F(BurstEngineTest, Determinism_SameSeedSameLedger) {
    genome.rules[0] = SynaptogenesisRuleConfig("input", "output", RandomMorphology(3));
    genome.rules[0].attractivity = 70;
    genome.areas[1].neuron.excitability = 0.6f;
    genome.areas[1].neuron.refractory_period = 0;

    auto first = run_random_drive(genome, 40);
    auto second = run_random_drive(genome, 40);
    EXPECT_EQ(first, second);
}

TEST_F(BurstEngineTest, Determinism_IndependentOfWorkerCount) {
    genome.rules[0] = SynaptogenesisRuleConfig("input", "output", RandomMorphology(3));
    genome.areas[1].neuron.excitability = 0.6f;
    genome.engine.shard_count = 3;

    auto single = run_random_drive(genome, 40);
    genome.engine.worker_threads = 4;
    auto multi = run_random_drive(genome, 40);
    EXPECT_EQ(single, multi);

    size_t total_fired = 0;
    for (const auto& entry : single) {
        total_fired += entry.count();
    }
    EXPECT_GT(total_fired, 0u);
}

TEST_F(BurstEngineTest, QuantizedPrecision_PropagatesLikeFloat) {
    genome.engine.precision = Precision::QUANTIZED16;
    BurstEngine engine(genome);

    engine.advance_burst({SensoryInput::at_position("input", Position(1, 0, 0), 1.5f)});
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{1}));
    engine.advance_burst({});
    EXPECT_EQ(engine.fire_queue_snapshot().ids(), (std::vector<NeuronId>{5}));
}

TEST_F(BurstEngineTest, GrowNeuron_WiresFromRules) {
    BurstEngine engine(genome);
    engine.prune_neuron(5);
    EXPECT_FALSE(engine.inspect([](const Connectome& c) { return c.is_live(5); }));

    NeuronId grown = engine.grow_neuron("output", Position(1, 0, 0));
    EXPECT_TRUE(engine.inspect([grown](const Connectome& c) { return c.synapse_exists(1, grown); }));
    EXPECT_EQ(engine.snapshot().neuron_count, 8u);

    engine.advance_burst({SensoryInput::to_neuron(1, 1.5f)});
    engine.advance_burst({});
    EXPECT_TRUE(engine.fire_queue_snapshot().contains(grown));
}

TEST_F(BurstEngineTest, GrowNeuron_UnknownAreaThrows) {
    BurstEngine engine(genome);
    EXPECT_THROW(engine.grow_neuron("cerebellum", Position(0, 0, 0)), std::invalid_argument);
    EXPECT_THROW(engine.grow_neuron("output", Position(9, 0, 0)), std::invalid_argument);
    EXPECT_EQ(engine.snapshot().neuron_count, 8u);
}

TEST_F(BurstEngineTest, PruneNeuron_StopsPropagation) {
    BurstEngine engine(genome);
    engine.advance_burst({SensoryInput::to_neuron(2, 1.5f)});
    engine.prune_neuron(6);

    BurstReport report = engine.advance_burst({});
    EXPECT_EQ(report.synapses_processed, 0u);
    EXPECT_EQ(report.fired_count, 0u);
    EXPECT_EQ(engine.snapshot().synapse_count, 3u);
}

TEST_F(BurstEngineTest, PruneNeuron_IdNotReusedWhileInLedger) {
    genome.engine.ledger_capacity = 3;
    BurstEngine engine(genome);
    engine.advance_burst({SensoryInput::to_neuron(1, 1.5f)});
    engine.advance_burst({});
    ASSERT_TRUE(engine.fire_queue_snapshot().contains(5));
    engine.prune_neuron(5);

    NeuronId early = engine.grow_neuron("output", Position(1, 0, 0));
    EXPECT_NE(early, 5u);

    for (int burst = 0; burst < 3; ++burst) {
        engine.advance_burst({});
    }
    for (const auto& entry : engine.ledger_snapshot()) {
        EXPECT_FALSE(entry.contains(5));
    }
    EXPECT_EQ(engine.grow_neuron("output", Position(2, 0, 0)), 5u);
}

TEST_F(BurstEngineTest, Plasticity_CreatesMemoryNeuron) {
    CorticalAreaConfig memory("memory", Dimensions(4, 1, 1), "memory");
    memory.populate = false;
    genome.areas.push_back(memory);
    MemoryAreaConfig binding;
    binding.memory_area = "memory";
    binding.upstream_areas = {"input"};
    genome.plasticity.memory_areas.push_back(binding);
    genome.plasticity.patterns.temporal_depth = 1;
    genome.plasticity.patterns.confirmation_count = 2;

    BurstEngine engine(genome);
    std::vector<SensoryInput> pair = {SensoryInput::to_neuron(0, 1.5f), SensoryInput::to_neuron(3, 1.5f)};
    engine.advance_burst(pair);
    EXPECT_EQ(engine.memory_neuron_count(), 0u);

    BurstReport report = engine.advance_burst(pair);
    EXPECT_EQ(report.plasticity.memory_neurons_created, 1u);
    EXPECT_EQ(engine.memory_neuron_count(), 1u);
    EXPECT_EQ(engine.snapshot().neuron_count, 9u);
}
