#include <gtest/gtest.h>
#include <cmath>
#include <nlohmann/json.hpp>
#include "Cross_Validation.h"
#include "Pricing_Errors.h"

using json = nlohmann::json;

namespace {

ModelParameters stochastic_model() {
    ModelParameters p;
    p.S0 = 0.1;
    p.K = 0.1;
    p.T = 1.0;
    p.r = 0.02;
    p.q = 0.0;
    p.v0 = 0.04;
    p.theta = 0.05;
    p.kappa = 1.5;
    p.sigma = 0.3;
    p.rho = -0.5;
    return p;
}

FFTGridConfig centred_grid(double k) {
    FFTGridConfig grid;
    grid.M = 4096;
    grid.eta = 0.25;
    grid.alpha = 5.0;
    grid.k_u = k;
    return grid;
}

SimulationConfig quick_run() {
    SimulationConfig sim;
    sim.num_paths = 20000;
    sim.num_steps = 25;
    sim.seed = 99;
    return sim;
}

} // namespace

TEST(CrossValidationTest, DifferenceIsMonteCarloMinusFFT) {
    ModelParameters p = stochastic_model();
    Cross_Validation validation;
    PricingResult result = validation.run(p, quick_run(), centred_grid(p.K));

    EXPECT_DOUBLE_EQ(result.mc_price, result.mc.price);
    EXPECT_DOUBLE_EQ(result.fft_price, result.fft.price);
    EXPECT_DOUBLE_EQ(result.difference, result.mc_price - result.fft_price);
    EXPECT_LT(std::abs(result.difference), 4.0 * result.mc.std_error + 1e-3);
}

TEST(CrossValidationTest, InvalidCorrelationIsRejected) {
    ModelParameters p = stochastic_model();
    p.rho = -1.2;
    Cross_Validation validation;
    EXPECT_THROW(validation.run(p, quick_run(), centred_grid(p.K)), Invalid_Correlation);
}

TEST(CrossValidationTest, BadGridFailsBeforeAnyPathIsSimulated) {
    // A run this large would take minutes; the grid error must come first
    SimulationConfig huge = quick_run();
    huge.num_paths = 50000000;
    huge.num_steps = 1000;

    FFTGridConfig grid = centred_grid(0.1);
    grid.M = 1;
    Cross_Validation validation;
    EXPECT_THROW(validation.run(stochastic_model(), huge, grid), Grid_Configuration_Error);
}

TEST(CrossValidationTest, StrikeOffTheGridFailsBeforeAnyPathIsSimulated) {
    SimulationConfig huge = quick_run();
    huge.num_paths = 50000000;
    huge.num_steps = 1000;

    // Grid centred on a non-finite strike
    FFTGridConfig grid = centred_grid(NAN);
    Cross_Validation validation;
    EXPECT_THROW(validation.run(stochastic_model(), huge, grid), Grid_Configuration_Error);
}

TEST(CrossValidationTest, ExplodingDampingFailsBeforeAnyPathIsSimulated) {
    SimulationConfig huge = quick_run();
    huge.num_paths = 50000000;
    huge.num_steps = 1000;

    ModelParameters p = stochastic_model();
    FFTGridConfig grid = centred_grid(p.K);
    grid.alpha = 30.0;
    Cross_Validation validation;
    try {
        validation.run(p, huge, grid);
        FAIL() << "alpha = 30 accepted";
    } catch (const Grid_Configuration_Error& e) {
        EXPECT_EQ(e.parameter(), "alpha");
    }
}

TEST(CrossValidationTest, JsonSummaryCarriesBothPrices) {
    ModelParameters p = stochastic_model();
    SimulationConfig sim = quick_run();
    sim.num_paths = 2000;
    sim.num_repetitions = 2;
    Cross_Validation validation;
    PricingResult result = validation.run(p, sim, centred_grid(p.K));

    json j = to_json(result);
    EXPECT_DOUBLE_EQ(j["mc_price"].get<double>(), result.mc_price);
    EXPECT_DOUBLE_EQ(j["fft_price"].get<double>(), result.fft_price);
    EXPECT_DOUBLE_EQ(j["difference"].get<double>(), result.difference);
    EXPECT_EQ(j["mc"]["repetition_prices"].size(), 2u);
    EXPECT_EQ(j["mc"]["reduction"].get<std::string>(), "mean");
    EXPECT_EQ(j["fft"]["index"].get<int>(), 2048);
    EXPECT_TRUE(j["mc"].contains("absorbed_fraction"));
}
