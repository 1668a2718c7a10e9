#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>
#include "Correlated_Shocks.h"
#include "Pricing_Errors.h"

using namespace std;

Correlated_Shocks::Correlated_Shocks(double rho, double dt)
    : rho_(rho), dt_(dt), sqrt_dt_(0.0), rho_bar_(0.0) {
    // Reject before any random number is drawn
    if (!(abs(rho) <= 1.0)) {
        throw Invalid_Correlation(rho);
    }
    if (!(dt > 0.0) || !isfinite(dt)) {
        throw invalid_argument("Invalid input: dt must be positive.");
    }
    sqrt_dt_ = sqrt(dt);
    // max() guards against 1 - rho*rho rounding to -0 at |rho| == 1
    rho_bar_ = sqrt(max(1.0 - rho * rho, 0.0));
}

Shock_Matrices Correlated_Shocks::generate(int num_paths, int num_steps, mt19937& gen) const {
    Shock_Matrices shocks;
    fill(shocks, num_paths, num_steps, gen);
    return shocks;
}

void Correlated_Shocks::fill(Shock_Matrices& shocks, int num_paths, int num_steps, mt19937& gen) const {
    if (num_paths < 0 || num_steps < 0) {
        throw invalid_argument("Invalid inputs: num_paths and num_steps must be non-negative.");
    }
    normal_distribution<double> dist(0.0, 1.0);
    shocks.dW1.resize(num_paths);
    shocks.dW2.resize(num_paths);
    for (int i = 0; i < num_paths; ++i) {
        vector<double>& w1 = shocks.dW1[i];
        vector<double>& w2 = shocks.dW2[i];
        w1.resize(num_steps);
        w2.resize(num_steps);
        for (int j = 0; j < num_steps; ++j) {
            double z1 = dist(gen);
            double z2 = dist(gen);
            w1[j] = sqrt_dt_ * z1;
            w2[j] = rho_ * w1[j] + rho_bar_ * sqrt_dt_ * z2;
        }
    }
}

double Correlated_Shocks::sample_correlation(const Shock_Matrices& shocks) {
    double n = 0.0;
    double sum1 = 0.0, sum2 = 0.0;
    double sum11 = 0.0, sum22 = 0.0, sum12 = 0.0;
    for (size_t i = 0; i < shocks.dW1.size(); ++i) {
        const vector<double>& w1 = shocks.dW1[i];
        const vector<double>& w2 = shocks.dW2[i];
        for (size_t j = 0; j < w1.size(); ++j) {
            sum1 += w1[j];
            sum2 += w2[j];
            sum11 += w1[j] * w1[j];
            sum22 += w2[j] * w2[j];
            sum12 += w1[j] * w2[j];
            n += 1.0;
        }
    }
    if (n < 2.0) {
        throw invalid_argument("sample_correlation needs at least two increments");
    }
    double cov = sum12 / n - (sum1 / n) * (sum2 / n);
    double var1 = sum11 / n - (sum1 / n) * (sum1 / n);
    double var2 = sum22 / n - (sum2 / n) * (sum2 / n);
    return cov / sqrt(var1 * var2);
}
