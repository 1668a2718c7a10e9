#ifndef PATH_SIMULATOR_H
#define PATH_SIMULATOR_H

#include <vector>
#include "Correlated_Shocks.h"
#include "Pricing_Config.h"

using namespace std;

// Time-indexed state of one simulated path.
// raw_variance may go negative; effective_variance[t] == max(raw_variance[t], 0).
struct PathState {
    vector<double> raw_variance;
    vector<double> effective_variance;
    vector<double> asset;
};

// Euler discretisation of the normal-dynamics model with the absorption fix
// for the square-root variance:
//   raw[j+1]       = raw[j] + kappa (theta - raw[j]) dt + sigma sqrt(max(raw[j], 0)) dW1[j]
//   effective[j+1] = max(raw[j+1], 0)
//   asset[j+1]     = asset[j] + (r - q) dt + sqrt(effective[j]) dW2[j]
// The drift acts on the unfloored state so a path that dips below zero still
// mean-reverts; only the square root sees the floored value.
class Path_Simulator {
public:
    Path_Simulator(const ModelParameters& params, double dt);

    // Size the three series to num_steps + 1 and set raw[0] = effective[0] = v0, asset[0] = S0
    void init(PathState& state, int num_steps) const;

    // Fill raw[j+1] and effective[j+1] from step j
    void advance_variance(PathState& state, int j, double dW1) const;

    // Fill asset[j+1] from step j, using the start-of-interval effective variance
    void advance_asset(PathState& state, int j, double dW2) const;

    // Run one path over every increment in dW1 / dW2
    void simulate(PathState& state, const vector<double>& dW1, const vector<double>& dW2) const;

    // Run every row of shocks; states is resized to the number of rows
    void simulate_block(vector<PathState>& states, const Shock_Matrices& shocks) const;

private:
    ModelParameters params;
    double dt;
};

#endif // PATH_SIMULATOR_H
