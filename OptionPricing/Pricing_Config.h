#ifndef PRICING_CONFIG_H
#define PRICING_CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Parameters of the normal-dynamics model with square-root variance
//   dS = (r - q) dt + sqrt(v) dW2
//   dv = kappa (theta - v) dt + sigma sqrt(v) dW1,   d<W1, W2> = rho dt
struct ModelParameters {
    double S0 = 0.0;    // Initial asset level (may be negative)
    double K = 0.0;     // Strike level
    double T = 1.0;     // Time to maturity
    double r = 0.0;     // Risk-free rate
    double q = 0.0;     // Dividend yield
    double v0 = 0.0;    // Initial variance
    double theta = 0.0; // Long-run variance
    double kappa = 0.0; // Mean reversion speed
    double sigma = 0.0; // Volatility of variance
    double rho = 0.0;   // Correlation between variance and asset shocks

    // Throws Invalid_Correlation for |rho| > 1, std::invalid_argument otherwise
    void validate() const;

    // 2 kappa theta >= sigma^2
    bool feller_satisfied() const;
};

// How the R repetitions of a Monte Carlo run reduce to one price
enum class Reduction {
    Mean,      // average of every repetition
    LastBatch  // keep only the final repetition, discarding the others
};

struct SimulationConfig {
    int num_paths = 100000;
    int num_steps = 100;
    int num_repetitions = 1;
    unsigned int seed = 42;
    Reduction reduction = Reduction::Mean;
    int block_size = 1024; // Paths simulated per unit of parallel work

    double dt(double T) const { return T / num_steps; }

    void validate() const;
};

// Carr-Madan FFT grid
struct FFTGridConfig {
    int M = 4096;       // Grid size
    double eta = 0.25;  // Frequency spacing
    double alpha = 1.5; // Damping factor
    double k_u = 0.0;   // Strike the grid is centred on

    // Strike grid spacing 2 pi / (M eta)
    double lambda() const;
    // First strike on the grid, k_u - lambda M / 2
    double origin() const;

    // Throws Grid_Configuration_Error naming the offending input
    void validate() const;
};

struct RunConfig {
    ModelParameters model;
    SimulationConfig simulation;
    FFTGridConfig fft;
};

// Reduction <-> "mean" / "last"
Reduction parse_reduction(const std::string& name);
std::string reduction_name(Reduction reduction);

// Command-line values: a count in [1, INT_MAX] and a seed in [0, UINT_MAX].
// Both throw std::invalid_argument naming flag on anything else.
int parse_positive_int(const std::string& flag, const std::string& value);
unsigned int parse_seed(const std::string& flag, const std::string& value);

// Overlay the "model", "simulation" and "fft" sections of j onto defaults.
// Keys that are absent keep their default value.
RunConfig run_config_from_json(const json& j, const RunConfig& defaults);

// Read a JSON run file and overlay it onto defaults
RunConfig load_run_config(const std::string& filename, const RunConfig& defaults);

json to_json(const RunConfig& config);

#endif // PRICING_CONFIG_H
