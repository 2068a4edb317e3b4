#include <gtest/gtest.h>
#include "connectome.h"
#include "errors.h"
#include <memory>
#include <variant>

using namespace cortexlib;

class ConnectomeTest : public ::testing::Test {
protected:
    void SetUp() override {
        connectome = std::make_unique<Connectome>(Precision::FLOAT32);
        input = connectome->add_area(CorticalAreaConfig("input", Dimensions(3, 2, 1)));
        output = connectome->add_area(CorticalAreaConfig("output", Dimensions(2, 2, 2), "integrate_fire"));
    }

    std::unique_ptr<Connectome> connectome;
    AreaId input;
    AreaId output;
};

TEST_F(ConnectomeTest, AddArea_RejectsDuplicatesAndBadConfig) {
    EXPECT_THROW(connectome->add_area(CorticalAreaConfig("input", Dimensions(1, 1, 1))), ConfigurationError);
    EXPECT_THROW(connectome->add_area(CorticalAreaConfig("flat", Dimensions(0, 1, 1))), ConfigurationError);
    EXPECT_THROW(connectome->add_area(CorticalAreaConfig("odd", Dimensions(1, 1, 1), "izhikevich")),
                 ConfigurationError);
    EXPECT_EQ(connectome->area_count(), 2u);
}

TEST_F(ConnectomeTest, PopulateArea_OneNeuronPerVoxel) {
    EXPECT_EQ(connectome->populate_area(input), 6u);
    EXPECT_EQ(connectome->area(input).neuron_count(), 6u);
    EXPECT_EQ(connectome->neuron_count(), 6u);

    NeuronId id = connectome->neuron_at(input, Position(2, 1, 0));
    ASSERT_NE(id, INVALID_NEURON);
    EXPECT_EQ(connectome->neuron_position(id), Position(2, 1, 0));
    EXPECT_EQ(connectome->neuron_area(id), input);
}

TEST_F(ConnectomeTest, AddNeuron_OutsideAreaThrows) {
    EXPECT_THROW(connectome->add_neuron(input, Position(3, 0, 0)), std::invalid_argument);
    EXPECT_THROW(connectome->add_neuron(input, Position(-1, 0, 0)), std::invalid_argument);
    EXPECT_EQ(connectome->neuron_count(), 0u);
}

TEST_F(ConnectomeTest, AddSynapse_TracksAdjacencyAndReferences) {
    NeuronId a = connectome->add_neuron(input, Position(0, 0, 0));
    NeuronId b = connectome->add_neuron(output, Position(1, 1, 1));
    SynapseId s = connectome->add_synapse(SynapseRecord(a, b, 0.5f, 1.0f, SynapseType::INHIBITORY));

    EXPECT_EQ(connectome->outgoing(a), (std::vector<SynapseId>{s}));
    EXPECT_EQ(connectome->incoming(b), (std::vector<SynapseId>{s}));
    EXPECT_TRUE(connectome->synapse_exists(a, b));
    EXPECT_FALSE(connectome->synapse_exists(b, a));
    EXPECT_EQ(connectome->neuron_ref_count(a), 1u);
    EXPECT_EQ(connectome->neuron_ref_count(b), 1u);
    EXPECT_EQ(connectome->synapse(s).type, SynapseType::INHIBITORY);
}

TEST_F(ConnectomeTest, AddSynapse_RejectsNegativeWeightAndDeadEndpoints) {
    NeuronId a = connectome->add_neuron(input, Position(0, 0, 0));
    NeuronId b = connectome->add_neuron(output, Position(0, 0, 0));

    EXPECT_THROW(connectome->add_synapse(SynapseRecord(a, b, -0.5f, 1.0f, SynapseType::EXCITATORY)),
                 std::invalid_argument);
    EXPECT_THROW(connectome->add_synapse(SynapseRecord(a, 99, 0.5f, 1.0f, SynapseType::EXCITATORY)),
                 std::invalid_argument);
    EXPECT_EQ(connectome->synapse_count(), 0u);
}

TEST_F(ConnectomeTest, RemoveNeuron_DropsSynapsesAndDefersReuse) {
    NeuronId a = connectome->add_neuron(input, Position(0, 0, 0));
    NeuronId b = connectome->add_neuron(output, Position(0, 0, 0));
    NeuronId c = connectome->add_neuron(output, Position(1, 0, 0));
    connectome->add_synapse(SynapseRecord(a, b, 1.0f, 1.0f, SynapseType::EXCITATORY));
    connectome->add_synapse(SynapseRecord(c, a, 1.0f, 1.0f, SynapseType::EXCITATORY));

    connectome->remove_neuron(a);
    EXPECT_FALSE(connectome->is_live(a));
    EXPECT_EQ(connectome->synapse_count(), 0u);
    EXPECT_TRUE(connectome->outgoing(c).empty());
    EXPECT_EQ(connectome->retired_pending(), 1u);
    EXPECT_EQ(connectome->neuron_at(input, Position(0, 0, 0)), INVALID_NEURON);
    EXPECT_NO_THROW(connectome->verify_integrity());

    // Not reclaimed yet: the next neuron grows the arena
    NeuronId d = connectome->add_neuron(input, Position(1, 0, 0));
    EXPECT_EQ(d, 3u);

    EXPECT_EQ(connectome->reclaim_retired(), (std::vector<NeuronId>{a}));
    NeuronId e = connectome->add_neuron(input, Position(2, 0, 0));
    EXPECT_EQ(e, a);
    EXPECT_TRUE(connectome->is_live(e));
    EXPECT_EQ(connectome->neuron_position(e), Position(2, 0, 0));
}

TEST_F(ConnectomeTest, ReclaimRetired_HonoursHoldFromRetireBurst) {
    NeuronId a = connectome->add_neuron(input, Position(0, 0, 0));
    connectome->set_current_burst(7);
    connectome->remove_neuron(a);

    connectome->set_current_burst(9);
    EXPECT_TRUE(connectome->reclaim_retired(3).empty());
    EXPECT_NE(connectome->add_neuron(input, Position(1, 0, 0)), a);

    connectome->set_current_burst(10);
    EXPECT_EQ(connectome->reclaim_retired(3), (std::vector<NeuronId>{a}));
    EXPECT_EQ(connectome->add_neuron(input, Position(2, 0, 0)), a);
}

TEST_F(ConnectomeTest, AddSynapse_ThrowsWhenAdjacencyFull) {
    Connectome bounded(Precision::FLOAT32, 2);
    AreaId area = bounded.add_area(CorticalAreaConfig("pool", Dimensions(3, 1, 1)));
    bounded.populate_area(area);
    EXPECT_EQ(bounded.synapse_capacity_remaining(), 2u);

    bounded.add_synapse(SynapseRecord(0, 1, 1.0f, 1.0f, SynapseType::EXCITATORY));
    SynapseId second = bounded.add_synapse(SynapseRecord(0, 2, 1.0f, 1.0f, SynapseType::EXCITATORY));
    EXPECT_EQ(bounded.synapse_capacity_remaining(), 0u);
    EXPECT_THROW(bounded.add_synapse(SynapseRecord(1, 2, 1.0f, 1.0f, SynapseType::EXCITATORY)),
                 StorageExhausted);
    EXPECT_EQ(bounded.synapse_count(), 2u);
    EXPECT_TRUE(bounded.outgoing(1).empty());

    bounded.remove_synapse(second);
    EXPECT_NO_THROW(bounded.add_synapse(SynapseRecord(1, 2, 1.0f, 1.0f, SynapseType::EXCITATORY)));
    EXPECT_NO_THROW(bounded.verify_integrity());
}

TEST_F(ConnectomeTest, RemoveSynapsesBetween_RemovesEveryMatch) {
    NeuronId a = connectome->add_neuron(input, Position(0, 0, 0));
    NeuronId b = connectome->add_neuron(output, Position(0, 0, 0));
    connectome->add_synapse(SynapseRecord(a, b, 1.0f, 1.0f, SynapseType::EXCITATORY));
    connectome->add_synapse(SynapseRecord(a, b, 2.0f, 1.0f, SynapseType::INHIBITORY));

    EXPECT_EQ(connectome->remove_synapses_between(a, b), 2u);
    EXPECT_EQ(connectome->neuron_ref_count(a), 0u);
    EXPECT_FALSE(connectome->synapse_exists(a, b));
}

TEST_F(ConnectomeTest, SetSynapseWeight_KeepsMagnitudeNonNegative) {
    NeuronId a = connectome->add_neuron(input, Position(0, 0, 0));
    NeuronId b = connectome->add_neuron(output, Position(0, 0, 0));
    SynapseId s = connectome->add_synapse(SynapseRecord(a, b, 1.0f, 1.0f, SynapseType::EXCITATORY));

    connectome->set_synapse_weight(s, 2.5f);
    EXPECT_FLOAT_EQ(connectome->synapse_weight(s), 2.5f);
    EXPECT_THROW(connectome->set_synapse_weight(s, -1.0f), std::invalid_argument);
}

TEST_F(ConnectomeTest, MembranePotential_QuantizedPrecision) {
    auto quantized = std::make_unique<Connectome>(Precision::QUANTIZED16);
    AreaId area = quantized->add_area(CorticalAreaConfig("q", Dimensions(1, 1, 1)));
    NeuronId id = quantized->add_neuron(area, Position(0, 0, 0));

    quantized->set_membrane_potential(id, 1.3f);
    EXPECT_NEAR(quantized->membrane_potential(id), 1.3f, 1.0f / 256.0f);
    EXPECT_TRUE(std::holds_alternative<QuantizedNeuronArray>(quantized->neuron_storage()));
}

TEST_F(ConnectomeTest, AreaMetadata_RoundTrips) {
    connectome->set_area_metadata(input, "sensor", "retina");
    ASSERT_NE(connectome->area(input).metadata("sensor"), nullptr);
    EXPECT_EQ(*connectome->area(input).metadata("sensor"), "retina");
    EXPECT_EQ(connectome->area(input).metadata("missing"), nullptr);
    EXPECT_THROW(connectome->area_id("nowhere"), std::out_of_range);
}
