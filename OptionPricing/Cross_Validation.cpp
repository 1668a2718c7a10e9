#include <iostream>
#include "Cross_Validation.h"

using namespace std;

Cross_Validation::Cross_Validation(bool debug_) : debug(debug_) {}

void Cross_Validation::SetDebug(bool d) {
    debug = d;
}

PricingResult Cross_Validation::run(const ModelParameters& params, const SimulationConfig& sim, const FFTGridConfig& grid) {
    // Configuration errors surface here, before any path is simulated
    params.validate();
    sim.validate();
    HestonFourier fourier(params, debug);
    int idx = fourier.check_grid(grid, grid.k_u);

    if (debug) {
        cout << "Target strike k_u = " << grid.k_u << " sits at grid index " << idx << " of " << grid.M << endl;
    }
    if (debug && !params.feller_satisfied()) {
        cout << "Feller condition violated (2 kappa theta = " << 2.0 * params.kappa * params.theta
             << " < sigma^2 = " << params.sigma * params.sigma << "), variance paths may be absorbed at zero" << endl;
    }

    Monte_Carlo mc(debug);

    PricingResult result;
    result.mc = mc.call_price(params, sim);
    result.fft = fourier.price_call_fft(grid);
    result.mc_price = result.mc.price;
    result.fft_price = result.fft.price;
    result.difference = result.mc_price - result.fft_price;

    if (debug) {
        cout << "MC = " << result.mc_price << ", FFT = " << result.fft_price
             << ", MC - FFT = " << result.difference << endl;
    }
    return result;
}

json to_json(const PricingResult& result) {
    json j;
    j["mc_price"] = result.mc_price;
    j["fft_price"] = result.fft_price;
    j["difference"] = result.difference;
    j["mc"]["std_error"] = result.mc.std_error;
    j["mc"]["repetition_prices"] = result.mc.repetition_prices;
    j["mc"]["repetition_std_dev"] = result.mc.repetition_std_dev;
    j["mc"]["absorbed_fraction"] = result.mc.absorbed_fraction;
    j["mc"]["reduction"] = reduction_name(result.mc.reduction);
    j["fft"]["index"] = result.fft.index;
    j["fft"]["strike"] = result.fft.strike;
    return j;
}
