#ifndef CROSS_VALIDATION_H
#define CROSS_VALIDATION_H

#include <nlohmann/json.hpp>
#include "Heston_Fourier.h"
#include "Monte_Carlo.h"
#include "Pricing_Config.h"

using json = nlohmann::json;

// Prices from both routes and their signed difference
struct PricingResult {
    double mc_price = 0.0;
    double fft_price = 0.0;
    double difference = 0.0; // mc_price - fft_price
    MC_Result mc;
    FFT_Result fft;
};

// Runs the Monte Carlo and FFT pricers on the same model and reports the gap.
// No tolerance is applied; acceptance is left to the caller.
class Cross_Validation {
public:
    Cross_Validation(bool debug_ = false);

    void SetDebug(bool d);

    // Every input, including the FFT strike index and the damping bound, is validated before simulation starts
    PricingResult run(const ModelParameters& params, const SimulationConfig& sim, const FFTGridConfig& grid);

private:
    bool debug;
};

// Scalar summary of a result (the strike/price grids are left out)
json to_json(const PricingResult& result);

#endif // CROSS_VALIDATION_H
