#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "Path_Simulator.h"

using namespace std;

Path_Simulator::Path_Simulator(const ModelParameters& params_, double dt_)
    : params(params_), dt(dt_) {
    if (!(dt > 0.0) || !isfinite(dt)) {
        throw invalid_argument("Invalid input: dt must be positive.");
    }
}

void Path_Simulator::init(PathState& state, int num_steps) const {
    state.raw_variance.assign(num_steps + 1, 0.0);
    state.effective_variance.assign(num_steps + 1, 0.0);
    state.asset.assign(num_steps + 1, 0.0);
    state.raw_variance[0] = params.v0;
    state.effective_variance[0] = params.v0;
    state.asset[0] = params.S0;
}

void Path_Simulator::advance_variance(PathState& state, int j, double dW1) const {
    double v = state.raw_variance[j];
    double next = v + params.kappa * (params.theta - v) * dt + params.sigma * sqrt(max(v, 0.0)) * dW1;
    state.raw_variance[j + 1] = next;
    state.effective_variance[j + 1] = max(next, 0.0);
}

void Path_Simulator::advance_asset(PathState& state, int j, double dW2) const {
    state.asset[j + 1] = state.asset[j] + (params.r - params.q) * dt + sqrt(state.effective_variance[j]) * dW2;
}

void Path_Simulator::simulate(PathState& state, const vector<double>& dW1, const vector<double>& dW2) const {
    if (dW1.size() != dW2.size()) {
        throw invalid_argument("Shock streams dW1 and dW2 must have the same length.");
    }
    int num_steps = static_cast<int>(dW1.size());
    init(state, num_steps);
    for (int j = 0; j < num_steps; ++j) {
        advance_variance(state, j, dW1[j]);
        advance_asset(state, j, dW2[j]);
    }
}

void Path_Simulator::simulate_block(vector<PathState>& states, const Shock_Matrices& shocks) const {
    if (shocks.dW1.size() != shocks.dW2.size()) {
        throw invalid_argument("Shock matrices dW1 and dW2 must have the same number of paths.");
    }
    states.resize(shocks.dW1.size());
    for (size_t i = 0; i < states.size(); ++i) {
        simulate(states[i], shocks.dW1[i], shocks.dW2[i]);
    }
}
