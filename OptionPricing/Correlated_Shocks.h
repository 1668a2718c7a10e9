#ifndef CORRELATED_SHOCKS_H
#define CORRELATED_SHOCKS_H

#include <random>
#include <vector>

using namespace std;

// Two num_paths x num_steps matrices of Brownian increments
struct Shock_Matrices {
    vector<vector<double>> dW1; // Drives the variance process
    vector<vector<double>> dW2; // Drives the asset, correlated with dW1
};

// Generates correlated Brownian increments
//   dW1 = sqrt(dt) Z1
//   dW2 = rho dW1 + sqrt(1 - rho^2) sqrt(dt) Z2
class Correlated_Shocks {
public:
    // Throws Invalid_Correlation if |rho| > 1 and std::invalid_argument if dt <= 0
    Correlated_Shocks(double rho, double dt);

    // Allocate and fill a fresh pair of matrices
    Shock_Matrices generate(int num_paths, int num_steps, mt19937& gen) const;

    // Fill shocks in place, resizing as needed, so buffers can be reused across blocks
    void fill(Shock_Matrices& shocks, int num_paths, int num_steps, mt19937& gen) const;

    // Pooled sample correlation of every (dW1, dW2) pair
    static double sample_correlation(const Shock_Matrices& shocks);

    double rho() const { return rho_; }
    double dt() const { return dt_; }

private:
    double rho_;
    double dt_;
    double sqrt_dt_;
    double rho_bar_; // sqrt(1 - rho^2)
};

#endif // CORRELATED_SHOCKS_H
