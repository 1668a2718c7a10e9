#include <stdexcept>
#include <random>
#include <omp.h>
#include <algorithm>
#include <iostream>
#include <vector>
#include <cmath>
#include "Monte_Carlo.h"
#include "Correlated_Shocks.h"
#include "Path_Simulator.h"
#include "Pricing_Errors.h"

using namespace std;

// Default constructor
Monte_Carlo::Monte_Carlo(bool debug_) : debug(debug_) {}
// Default destructor
Monte_Carlo::~Monte_Carlo() {}

// Sets debug flag for diagnostic output
void Monte_Carlo::SetDebug(bool d) {
    debug = d;
}

// Simulates one batch of num_paths paths and returns its payoff sums
Monte_Carlo::Repetition_Sums Monte_Carlo::simulate_repetition(const ModelParameters& params, const SimulationConfig& config, int repetition) {
    // Input: params (model), config (paths, steps, seed, block size), repetition (batch index)
    // Output: undiscounted payoff sum, sum of squared payoffs and number of absorbed path-steps
    // Logic: Splits the paths into fixed blocks, simulates the blocks in parallel with
    //        per-block generators, then adds the block sums in block order
    int num_paths = config.num_paths;
    int num_steps = config.num_steps;
    int block_size = config.block_size;
    int num_blocks = num_paths / block_size + (num_paths % block_size != 0 ? 1 : 0);
    double dt = config.dt(params.T);

    Correlated_Shocks generator(params.rho, dt);
    Path_Simulator simulator(params, dt);

    vector<double> block_payoffs(num_blocks, 0.0);
    vector<double> block_sq_payoffs(num_blocks, 0.0);
    vector<double> block_absorbed(num_blocks, 0.0);

    #pragma omp parallel
    {
        // Thread-local buffers reused across the blocks this thread picks up
        Shock_Matrices shocks;
        vector<PathState> states;

        #pragma omp for schedule(dynamic)
        for (int b = 0; b < num_blocks; ++b) {
            int first = b * block_size;
            int count = min(block_size, num_paths - first);

            seed_seq seq{config.seed, static_cast<unsigned int>(repetition), static_cast<unsigned int>(b)};
            mt19937 local_gen(seq);

            generator.fill(shocks, count, num_steps, local_gen);
            simulator.simulate_block(states, shocks);

            double sum = 0.0, sum_sq = 0.0, absorbed = 0.0;
            for (int i = 0; i < count; ++i) {
                const PathState& path = states[i];
                double payoff = max(path.asset[num_steps] - params.K, 0.0);
                sum += payoff;
                sum_sq += payoff * payoff;
                for (int t = 1; t <= num_steps; ++t) {
                    if (path.effective_variance[t] == 0.0) absorbed += 1.0;
                }
            }
            block_payoffs[b] = sum;
            block_sq_payoffs[b] = sum_sq;
            block_absorbed[b] = absorbed;
        }
    }

    // Serial reduction in block order keeps the floating-point sum reproducible
    Repetition_Sums sums;
    for (int b = 0; b < num_blocks; ++b) {
        sums.sum_payoffs += block_payoffs[b];
        sums.sum_sq_payoffs += block_sq_payoffs[b];
        sums.absorbed_steps += block_absorbed[b];
    }
    if (!isfinite(sums.sum_payoffs) || !isfinite(sums.sum_sq_payoffs)) {
        throw Numerical_Instability("monte_carlo", "non-finite payoff sum in repetition " + to_string(repetition));
    }
    return sums;
}

// Computes the European call price by simulating the normal-dynamics model
MC_Result Monte_Carlo::call_price(const ModelParameters& params, const SimulationConfig& config) {
    // Input: params (model parameters), config (simulation configuration)
    // Output: MC_Result with the reduced price and per-repetition prices
    // Logic: Runs config.num_repetitions independent batches, discounts each batch
    //        mean payoff by exp(-rT), then reduces the batches as config.reduction says
    params.validate();
    config.validate();

    double discount = exp(-params.r * params.T);
    double num_paths = static_cast<double>(config.num_paths);

    MC_Result result;
    result.reduction = config.reduction;
    result.repetition_prices.reserve(config.num_repetitions);

    double pooled_sum = 0.0, pooled_sum_sq = 0.0, absorbed = 0.0;
    double last_sum = 0.0, last_sum_sq = 0.0;

    for (int rep = 0; rep < config.num_repetitions; ++rep) {
        Repetition_Sums sums = simulate_repetition(params, config, rep);
        double price = discount * sums.sum_payoffs / num_paths;
        result.repetition_prices.push_back(price);

        pooled_sum += sums.sum_payoffs;
        pooled_sum_sq += sums.sum_sq_payoffs;
        absorbed += sums.absorbed_steps;
        last_sum = sums.sum_payoffs;
        last_sum_sq = sums.sum_sq_payoffs;

        if (debug) {
            cout << "MC repetition " << rep + 1 << "/" << config.num_repetitions
                 << ": price = " << price
                 << ", absorbed steps = " << sums.absorbed_steps << endl;
        }
    }

    // Standard error of the discounted mean built from (sum, sum_sq) over n payoffs
    auto std_error = [discount](double sum, double sum_sq, double n) {
        if (n < 2.0) return 0.0;
        double mean = sum / n;
        double var = max((sum_sq - n * mean * mean) / (n - 1.0), 0.0);
        return discount * sqrt(var / n);
    };

    if (config.reduction == Reduction::LastBatch) {
        if (config.num_repetitions > 1) {
            cerr << "Warning: reduction 'last' keeps repetition " << config.num_repetitions
                 << " only; " << config.num_repetitions - 1 << " simulated batches are discarded" << endl;
        }
        result.price = result.repetition_prices.back();
        result.std_error = std_error(last_sum, last_sum_sq, num_paths);
    } else {
        double total = num_paths * config.num_repetitions;
        result.price = discount * pooled_sum / total;
        result.std_error = std_error(pooled_sum, pooled_sum_sq, total);
    }

    if (config.num_repetitions > 1) {
        double mean = 0.0;
        for (double p : result.repetition_prices) mean += p;
        mean /= config.num_repetitions;
        double var = 0.0;
        for (double p : result.repetition_prices) var += (p - mean) * (p - mean);
        result.repetition_std_dev = sqrt(var / (config.num_repetitions - 1));
    }

    result.absorbed_fraction = absorbed / (num_paths * config.num_steps * config.num_repetitions);

    if (debug) {
        cout << "MC price = " << result.price << " +/- " << result.std_error
             << " (" << reduction_name(config.reduction) << " of " << config.num_repetitions << " repetitions)"
             << ", absorbed fraction = " << result.absorbed_fraction << endl;
    }
    if (!isfinite(result.price)) {
        throw Numerical_Instability("monte_carlo", "price is not finite");
    }
    return result;
}
