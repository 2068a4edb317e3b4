#include <gtest/gtest.h>
#include "neuron_models.h"
#include "errors.h"

using namespace cortexlib;

class NeuronModelsTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.threshold = 1.0f;
        params.resting_potential = 0.0f;
        params.leak_coefficient = 0.5f;
        params.excitability = 1.0f;
        saturations = 0;
    }

    NeuronParams<float> params;
    NeuronState<float> state;
    uint32_t saturations;
    LeakyIntegrateFireModel lif;
    IntegrateFireModel integrator;
    MemoryNeuronModel memory;
};

TEST_F(NeuronModelsTest, Lif_LeaksTowardRestBeforeAddingInput) {
    state.membrane_potential = 0.8f;
    StepResult<float> result = lif.step(0.1f, state, params, 0.0f, saturations);

    EXPECT_FALSE(result.fired);
    EXPECT_FLOAT_EQ(result.state.membrane_potential, 0.5f);
}

TEST_F(NeuronModelsTest, Lif_FiresAndResetsAtThreshold) {
    state.membrane_potential = 0.5f;
    params.refractory_period = 3;
    StepResult<float> result = lif.step(0.75f, state, params, 0.0f, saturations);

    EXPECT_TRUE(result.fired);
    EXPECT_FLOAT_EQ(result.fire_potential, 1.0f);
    EXPECT_FLOAT_EQ(result.state.membrane_potential, 0.0f);
    EXPECT_EQ(result.state.refractory_countdown, 3);
    EXPECT_EQ(result.state.consecutive_fire_count, 1);
}

TEST_F(NeuronModelsTest, Lif_RefractoryBlocksAndTicks) {
    state.refractory_countdown = 2;
    state.membrane_potential = 0.2f;
    StepResult<float> result = lif.step(5.0f, state, params, 0.0f, saturations);

    EXPECT_FALSE(result.fired);
    EXPECT_EQ(result.state.refractory_countdown, 1);
    EXPECT_FLOAT_EQ(result.state.membrane_potential, 0.2f);
}

TEST_F(NeuronModelsTest, Lif_ThresholdLimitSuppressesOvershoot) {
    params.threshold_limit = 2.0f;
    StepResult<float> result = lif.step(3.0f, state, params, 0.0f, saturations);
    EXPECT_FALSE(result.fired);
    EXPECT_FLOAT_EQ(result.state.membrane_potential, 3.0f);
}

TEST_F(NeuronModelsTest, Lif_ExcitabilityGatesOnDraw) {
    params.excitability = 0.5f;
    EXPECT_TRUE(lif.step(2.0f, state, params, 0.25f, saturations).fired);
    EXPECT_FALSE(lif.step(2.0f, state, params, 0.75f, saturations).fired);

    params.excitability = 0.0f;
    EXPECT_FALSE(lif.step(2.0f, state, params, 0.0f, saturations).fired);
}

TEST_F(NeuronModelsTest, Lif_ConsecutiveFireLimitAddsSnooze) {
    params.refractory_period = 1;
    params.consecutive_fire_limit = 2;
    params.snooze_period = 4;
    state.consecutive_fire_count = 1;

    StepResult<float> result = lif.step(2.0f, state, params, 0.0f, saturations);
    EXPECT_TRUE(result.fired);
    EXPECT_EQ(result.state.consecutive_fire_count, 2);
    EXPECT_EQ(result.state.refractory_countdown, 5);
}

TEST_F(NeuronModelsTest, Lif_SnoozeExpiryClearsFireCount) {
    params.consecutive_fire_limit = 2;
    state.consecutive_fire_count = 2;
    state.refractory_countdown = 1;

    StepResult<float> result = lif.step(0.5f, state, params, 0.0f, saturations);
    EXPECT_FALSE(result.fired);
    EXPECT_EQ(result.state.refractory_countdown, 0);
    EXPECT_EQ(result.state.consecutive_fire_count, 0);
}

TEST_F(NeuronModelsTest, Lif_QuantizedMatchesFloatWithinResolution) {
    NeuronParams<QuantizedValue> qparams;
    qparams.threshold = NeuralValueTraits<QuantizedValue>::from_float(1.0f, saturations);
    qparams.leak_coefficient = 0.5f;
    NeuronState<QuantizedValue> qstate;
    qstate.membrane_potential = NeuralValueTraits<QuantizedValue>::from_float(0.8f, saturations);

    StepResult<QuantizedValue> result = lif.step(NeuralValueTraits<QuantizedValue>::from_float(0.1f, saturations),
                                                 qstate, qparams, 0.0f, saturations);
    EXPECT_FALSE(result.fired);
    EXPECT_NEAR(NeuralValueTraits<QuantizedValue>::to_float(result.state.membrane_potential), 0.5f, 2.0f / 256.0f);
    EXPECT_EQ(saturations, 0u);
}

TEST_F(NeuronModelsTest, IntegrateFire_AccumulatesWithoutLeak) {
    StepResult<float> first = integrator.step(0.4f, state, params, 0.0f, saturations);
    StepResult<float> second = integrator.step(0.4f, first.state, params, 0.0f, saturations);
    EXPECT_FALSE(second.fired);
    EXPECT_FLOAT_EQ(second.state.membrane_potential, 0.8f);

    StepResult<float> third = integrator.step(0.4f, second.state, params, 0.0f, saturations);
    EXPECT_TRUE(third.fired);
    EXPECT_FLOAT_EQ(third.state.membrane_potential, 0.0f);
}

TEST_F(NeuronModelsTest, Memory_FiresOnlyOnCoincidentInput) {
    params.threshold = 2.0f;
    StepResult<float> weak = memory.step(1.5f, state, params, 0.0f, saturations);
    EXPECT_FALSE(weak.fired);
    EXPECT_FLOAT_EQ(weak.state.membrane_potential, 0.0f);

    StepResult<float> strong = memory.step(2.0f, weak.state, params, 0.0f, saturations);
    EXPECT_TRUE(strong.fired);
    EXPECT_FLOAT_EQ(strong.fire_potential, 2.0f);
}

TEST_F(NeuronModelsTest, Draw_IsDeterministicAndInUnitRange) {
    for (NeuronId id = 0; id < 100; ++id) {
        float draw = excitability_draw(42, id, 7);
        EXPECT_GE(draw, 0.0f);
        EXPECT_LT(draw, 1.0f);
        EXPECT_EQ(draw, excitability_draw(42, id, 7));
    }
    EXPECT_NE(excitability_draw(42, 1, 7), excitability_draw(42, 1, 8));
}

TEST_F(NeuronModelsTest, Registry_ResolvesKnownTags) {
    EXPECT_STREQ(neuron_model_name(make_neuron_model("lif")), "lif");
    EXPECT_STREQ(neuron_model_name(make_neuron_model("integrate_fire")), "integrate_fire");
    EXPECT_STREQ(neuron_model_name(make_neuron_model("memory")), "memory");
    EXPECT_FALSE(is_known_neuron_model("izhikevich"));
    EXPECT_THROW(make_neuron_model("izhikevich"), ConfigurationError);
}
