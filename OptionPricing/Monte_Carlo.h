#ifndef MONTE_CARLO_H
#define MONTE_CARLO_H

#include <random>
#include <cmath>
#include <vector>
#include <omp.h>
#include "Pricing_Config.h"

using namespace std;

// Outcome of a Monte Carlo run
struct MC_Result {
    double price = 0.0;              // Reduced price across repetitions
    double std_error = 0.0;          // Standard error of the discounted payoff mean behind price
    vector<double> repetition_prices; // One discounted price per repetition
    double repetition_std_dev = 0.0; // Sample standard deviation of repetition_prices (0 if R == 1)
    double absorbed_fraction = 0.0;  // Share of simulated path-steps with effective variance == 0
    Reduction reduction = Reduction::Mean;
};

// Prices a European call on the normal-dynamics model by path simulation
class Monte_Carlo
{
    public:
        Monte_Carlo(bool debug_ = false);
        virtual ~Monte_Carlo();

        void SetDebug(bool d);

        // Validates params and config before any path is simulated.
        // Paths are split into blocks of config.block_size; each block draws from
        // its own generator seeded by (seed, repetition, block), and the block sums
        // are added in block order, so the price does not depend on thread count.
        MC_Result call_price(const ModelParameters& params, const SimulationConfig& config);

    private:
        struct Repetition_Sums {
            double sum_payoffs = 0.0;
            double sum_sq_payoffs = 0.0;
            double absorbed_steps = 0.0;
        };

        Repetition_Sums simulate_repetition(const ModelParameters& params, const SimulationConfig& config, int repetition);

        bool debug;
};

#endif // MONTE_CARLO_H
