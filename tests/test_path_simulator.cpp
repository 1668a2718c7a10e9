#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>
#include "Correlated_Shocks.h"
#include "Path_Simulator.h"

namespace {

// Feller condition badly violated: variance decays towards 5e-7 with vol-of-variance 0.25
ModelParameters sample_model() {
    ModelParameters p;
    p.S0 = -0.001;
    p.K = 0.0;
    p.T = 1.0;
    p.r = 0.0;
    p.q = 0.0;
    p.v0 = 0.09;
    p.theta = 5e-7;
    p.kappa = 1.0;
    p.sigma = 0.25;
    p.rho = -0.9;
    return p;
}

} // namespace

TEST(PathSimulatorTest, InitialStateIsSpotAndInitialVariance) {
    ModelParameters p = sample_model();
    Path_Simulator sim(p, 0.01);
    PathState state;
    sim.init(state, 100);
    ASSERT_EQ(state.raw_variance.size(), 101u);
    ASSERT_EQ(state.effective_variance.size(), 101u);
    ASSERT_EQ(state.asset.size(), 101u);
    EXPECT_DOUBLE_EQ(state.raw_variance[0], p.v0);
    EXPECT_DOUBLE_EQ(state.effective_variance[0], p.v0);
    EXPECT_DOUBLE_EQ(state.asset[0], p.S0);
}

TEST(PathSimulatorTest, AbsorbedVarianceKeepsMeanRevertingOnRawState) {
    ModelParameters p;
    p.S0 = 1.0;
    p.r = 0.05;
    p.q = 0.0;
    p.v0 = 0.04;
    p.theta = 0.04;
    p.kappa = 2.0;
    p.sigma = 1.0;
    p.rho = 0.0;
    double dt = 0.01;
    Path_Simulator sim(p, dt);

    std::vector<double> dW1 = {-0.5, 0.3};
    std::vector<double> dW2 = {0.1, 0.7};
    PathState state;
    sim.simulate(state, dW1, dW2);

    // 0.04 + 2 (0.04 - 0.04) 0.01 + 1 * sqrt(0.04) * (-0.5)
    EXPECT_NEAR(state.raw_variance[1], -0.06, 1e-15);
    EXPECT_DOUBLE_EQ(state.effective_variance[1], 0.0);

    // Drift on the negative raw state, diffusion switched off by the floor
    EXPECT_NEAR(state.raw_variance[2], -0.06 + 2.0 * (0.04 + 0.06) * dt, 1e-15);
    EXPECT_DOUBLE_EQ(state.effective_variance[2], 0.0);

    // Asset uses the start-of-interval effective variance
    EXPECT_NEAR(state.asset[1], 1.0 + 0.05 * dt + 0.2 * 0.1, 1e-15);
    EXPECT_NEAR(state.asset[2], state.asset[1] + 0.05 * dt, 1e-15);
}

TEST(PathSimulatorTest, StepByStepMatchesWholePath) {
    ModelParameters p = sample_model();
    double dt = 0.02;
    Path_Simulator sim(p, dt);
    std::vector<double> dW1 = {0.1, -0.2, 0.05, 0.3};
    std::vector<double> dW2 = {-0.1, 0.0, 0.2, -0.05};

    PathState whole;
    sim.simulate(whole, dW1, dW2);

    PathState manual;
    sim.init(manual, 4);
    for (int j = 0; j < 4; ++j) {
        sim.advance_variance(manual, j, dW1[j]);
        sim.advance_asset(manual, j, dW2[j]);
    }
    EXPECT_EQ(whole.raw_variance, manual.raw_variance);
    EXPECT_EQ(whole.effective_variance, manual.effective_variance);
    EXPECT_EQ(whole.asset, manual.asset);
}

TEST(PathSimulatorTest, EffectiveVarianceIsFlooredRawVarianceEverywhere) {
    ModelParameters p = sample_model();
    int num_steps = 100;
    double dt = p.T / num_steps;
    Correlated_Shocks shocks(p.rho, dt);
    Path_Simulator sim(p, dt);

    std::mt19937 gen(77);
    Shock_Matrices m = shocks.generate(2000, num_steps, gen);
    std::vector<PathState> states;
    sim.simulate_block(states, m);
    ASSERT_EQ(states.size(), 2000u);

    int negative_raw = 0;
    for (const PathState& s : states) {
        for (int t = 0; t <= num_steps; ++t) {
            EXPECT_GE(s.effective_variance[t], 0.0);
            ASSERT_EQ(s.effective_variance[t], std::max(s.raw_variance[t], 0.0));
            if (s.raw_variance[t] < 0.0) ++negative_raw;
        }
    }
    // With 2 kappa theta << sigma^2 some paths must cross zero
    EXPECT_GT(negative_raw, 0);
}

TEST(PathSimulatorTest, ZeroShocksFollowDeterministicMeanReversion) {
    ModelParameters p = sample_model();
    p.r = 0.03;
    p.q = 0.01;
    int num_steps = 50;
    double dt = p.T / num_steps;
    Path_Simulator sim(p, dt);
    std::vector<double> zeros(num_steps, 0.0);
    PathState state;
    sim.simulate(state, zeros, zeros);

    double v = p.v0;
    for (int j = 0; j < num_steps; ++j) v += p.kappa * (p.theta - v) * dt;
    EXPECT_NEAR(state.raw_variance[num_steps], v, 1e-14);
    EXPECT_NEAR(state.asset[num_steps], p.S0 + (p.r - p.q) * p.T, 1e-14);
}

TEST(PathSimulatorTest, MismatchedShockStreamsAreRejected) {
    Path_Simulator sim(sample_model(), 0.01);
    PathState state;
    std::vector<double> a(3, 0.0), b(4, 0.0);
    EXPECT_THROW(sim.simulate(state, a, b), std::invalid_argument);
}
