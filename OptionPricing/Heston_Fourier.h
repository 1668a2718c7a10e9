#include <cmath>
#include <complex>
#include <vector>
#include <string>
#include <stdexcept>
#include <utility>
#include "Pricing_Config.h"

#ifndef HESTON_FOURIER_H
#define HESTON_FOURIER_H

// Strike grid produced by one Carr-Madan FFT run
struct FFT_Result {
    double price = 0.0;          // Call price at the requested strike
    int index = 0;               // Grid index the price was read from
    double strike = 0.0;         // Grid strike at that index
    std::vector<double> strikes; // k[j] = b + j lambda
    std::vector<double> prices;  // Call price at every k[j]

    // Price at the grid point nearest k; throws Grid_Configuration_Error off the grid
    double price_at_strike(double k) const;
};

// Semi-analytic pricing for the normal-dynamics model with square-root variance.
// The characteristic function is that of the terminal asset level (not its log),
// and the Carr-Madan damping is applied directly to the level strike.
class HestonFourier {
private:
    // Model parameters
    ModelParameters params;
    bool debug;   // Flag for debug output

public:
    // Validates params (throws Invalid_Correlation / std::invalid_argument)
    HestonFourier(const ModelParameters& params_, bool debug_ = false);

    // Enable/disable debug mode
    void SetDebug(bool d);

    // E[exp(i phi S_tau)] for complex phi
    std::complex<double> characteristic_function(std::complex<double> phi, double tau) const;

    // psi(u) = exp(-r tau) chf(u - i alpha) / (alpha + i u)^2
    std::complex<double> damped_call_transform(double u, double alpha, double tau) const;

    // Time at which E[exp(alpha S_t)] becomes infinite, +infinity if it never does.
    // The damped transform needs T below it.
    double moment_explosion_time(double alpha) const;

    // [lower, upper] range for the call price at strike k
    std::pair<double, double> price_bounds(double k) const;

    // Simpson weights (eta/3)(3 + (-1)^(j+1) - delta_j0), j = 0..M-1
    static std::vector<double> simpson_weights(int M, double eta);

    // Zero-based index of the grid strike nearest k; throws Grid_Configuration_Error
    // when it falls outside [0, M)
    static int strike_index(const FFTGridConfig& grid, double k);

    // Validates grid, locates strike on it and rejects an alpha whose moment
    // E[exp(alpha S_T)] is infinite; returns the strike index
    int check_grid(const FFTGridConfig& grid, double strike) const;

    // Price the call at grid.k_u
    FFT_Result price_call_fft(const FFTGridConfig& grid) const;

    // Build the grid centred on grid.k_u and read the price at strike.
    // The strike and alpha are checked before any transform work starts:
    // Grid_Configuration_Error("alpha") when T reaches the moment explosion time,
    // Numerical_Instability("fft") when the price falls outside price_bounds.
    FFT_Result price_call_fft(const FFTGridConfig& grid, double strike) const;
};

#endif
