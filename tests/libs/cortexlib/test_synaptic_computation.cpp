#include <gtest/gtest.h>
#include "synaptic_computation.h"
#include <memory>

using namespace cortexlib;

class SynapticComputationTest : public ::testing::Test {
protected:
    void SetUp() override {
        connectome = std::make_unique<Connectome>(Precision::FLOAT32);
        CorticalAreaConfig sensors("sensors", Dimensions(2, 1, 1));
        sensors.psp_uniform_distribution = false;
        source_area = connectome->add_area(sensors);
        CorticalAreaConfig driven("driven", Dimensions(1, 1, 1));
        driven.mp_driven_psp = true;
        driven_area = connectome->add_area(driven);
        target_area = connectome->add_area(CorticalAreaConfig("targets", Dimensions(4, 1, 1)));

        s0 = connectome->add_neuron(source_area, Position(0, 0, 0));
        s1 = connectome->add_neuron(source_area, Position(1, 0, 0));
        d0 = connectome->add_neuron(driven_area, Position(0, 0, 0));
        for (int32_t x = 0; x < 4; ++x) {
            targets.push_back(connectome->add_neuron(target_area, Position(x, 0, 0)));
        }
        fcl.reserve_ids(connectome->neuron_slots());
    }

    void fire(std::initializer_list<FiredNeuron> neurons) {
        queue.reset(0);
        queue.append(neurons);
        queue.finalize();
    }

    std::unique_ptr<Connectome> connectome;
    AreaId source_area, driven_area, target_area;
    NeuronId s0, s1, d0;
    std::vector<NeuronId> targets;
    FireQueue queue;
    FireCandidateList fcl{2};
    std::vector<std::vector<PropagationItem>> shards;
};

TEST_F(SynapticComputationTest, Contribution_SignComesFromType) {
    EXPECT_FLOAT_EQ(synaptic_contribution(0.5f, 2.0f, SynapseType::EXCITATORY), 1.0f);
    EXPECT_FLOAT_EQ(synaptic_contribution(0.5f, 2.0f, SynapseType::INHIBITORY), -1.0f);
    EXPECT_FLOAT_EQ(synaptic_contribution(0.0f, 2.0f, SynapseType::INHIBITORY), 0.0f);
}

TEST_F(SynapticComputationTest, Propagation_PartitionsByTargetShard) {
    connectome->add_synapse(SynapseRecord(d0, targets[0], 1.0f, 1.0f, SynapseType::EXCITATORY));
    connectome->add_synapse(SynapseRecord(d0, targets[1], 1.0f, 1.0f, SynapseType::EXCITATORY));
    connectome->add_synapse(SynapseRecord(d0, targets[2], 1.0f, 1.0f, SynapseType::EXCITATORY));
    fire({FiredNeuron(d0, driven_area, 1.5f, Position())});

    EXPECT_EQ(partition_propagation(*connectome, queue, 2, shards), 3u);
    ASSERT_EQ(shards.size(), 2u);
    for (size_t shard = 0; shard < 2; ++shard) {
        for (const auto& item : shards[shard]) {
            EXPECT_EQ(FireCandidateList::shard_of(connectome->synapse(item.synapse).target, 2), shard);
        }
    }
    EXPECT_EQ(shards[0].size() + shards[1].size(), 3u);
}

TEST_F(SynapticComputationTest, Propagation_ReservedShardsDoNotReallocate) {
    for (NeuronId target : targets) {
        connectome->add_synapse(SynapseRecord(d0, target, 1.0f, 1.0f, SynapseType::EXCITATORY));
    }
    reserve_propagation(shards, 2, 4);
    const PropagationItem* first = shards[0].data();
    const PropagationItem* second = shards[1].data();

    fire({FiredNeuron(d0, driven_area, 1.0f, Position())});
    EXPECT_EQ(partition_propagation(*connectome, queue, 2, shards), 4u);
    EXPECT_EQ(shards[0].data(), first);
    EXPECT_EQ(shards[1].data(), second);
    EXPECT_GE(shards[0].capacity(), 4u);
}

TEST_F(SynapticComputationTest, Propagation_MembraneDrivenUsesFirePotential) {
    connectome->add_synapse(SynapseRecord(d0, targets[0], 0.5f, 9.0f, SynapseType::EXCITATORY));
    fire({FiredNeuron(d0, driven_area, 1.5f, Position())});

    partition_propagation(*connectome, queue, 2, shards);
    for (size_t shard = 0; shard < 2; ++shard) {
        accumulate_contributions(connectome->synapse_storage(), shards[shard].data(), shards[shard].size(), fcl);
    }
    EXPECT_FLOAT_EQ(fcl.get(targets[0]), 0.75f);
}

TEST_F(SynapticComputationTest, Propagation_NonUniformSplitsPspAcrossFanOut) {
    connectome->add_synapse(SynapseRecord(s0, targets[0], 1.0f, 2.0f, SynapseType::EXCITATORY));
    connectome->add_synapse(SynapseRecord(s0, targets[1], 1.0f, 2.0f, SynapseType::INHIBITORY));
    fire({FiredNeuron(s0, source_area, 1.0f, Position())});

    partition_propagation(*connectome, queue, 2, shards);
    for (size_t shard = 0; shard < 2; ++shard) {
        accumulate_contributions(connectome->synapse_storage(), shards[shard].data(), shards[shard].size(), fcl);
    }
    EXPECT_FLOAT_EQ(fcl.get(targets[0]), 1.0f);
    EXPECT_FLOAT_EQ(fcl.get(targets[1]), -1.0f);
}

TEST_F(SynapticComputationTest, Propagation_InhibitionCancelsExcitation) {
    connectome->add_synapse(SynapseRecord(s0, targets[3], 1.0f, 1.0f, SynapseType::EXCITATORY));
    connectome->add_synapse(SynapseRecord(s1, targets[3], 0.25f, 4.0f, SynapseType::INHIBITORY));
    fire({FiredNeuron(s0, source_area, 1.0f, Position()), FiredNeuron(s1, source_area, 1.0f, Position(1, 0, 0))});

    partition_propagation(*connectome, queue, 2, shards);
    for (size_t shard = 0; shard < 2; ++shard) {
        accumulate_contributions(connectome->synapse_storage(), shards[shard].data(), shards[shard].size(), fcl);
    }
    EXPECT_TRUE(fcl.contains(targets[3]));
    EXPECT_FLOAT_EQ(fcl.get(targets[3]), 0.0f);
}

TEST_F(SynapticComputationTest, Propagation_SkipsRetiredSources) {
    connectome->add_synapse(SynapseRecord(s0, targets[0], 1.0f, 1.0f, SynapseType::EXCITATORY));
    fire({FiredNeuron(s0, source_area, 1.0f, Position())});
    connectome->remove_neuron(s0);

    EXPECT_EQ(partition_propagation(*connectome, queue, 2, shards), 0u);
    EXPECT_TRUE(shards[0].empty());
    EXPECT_TRUE(shards[1].empty());
}
