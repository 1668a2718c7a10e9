#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <stdexcept>
#include <string>
#include "Pricing_Config.h"
#include "Pricing_Errors.h"

using namespace std;

// Define M_PI if not already defined
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

void ModelParameters::validate() const {
    // Correlation first: everything downstream needs sqrt(1 - rho^2)
    if (!(abs(rho) <= 1.0)) {
        throw Invalid_Correlation(rho);
    }
    if (!isfinite(S0) || !isfinite(K) || !isfinite(r) || !isfinite(q)) {
        throw invalid_argument("Invalid inputs: S0, K, r and q must be finite.");
    }
    if (!(T > 0.0) || !isfinite(T)) {
        throw invalid_argument("Invalid input: T must be positive.");
    }
    if (!(v0 >= 0.0) || !(theta >= 0.0) || !isfinite(v0) || !isfinite(theta)) {
        throw invalid_argument("Invalid inputs: v0 and theta must be non-negative.");
    }
    if (!(kappa > 0.0) || !isfinite(kappa)) {
        throw invalid_argument("Invalid input: kappa must be positive.");
    }
    // sigma appears as 1 / sigma^2 in the characteristic function
    if (!(sigma > 0.0) || !isfinite(sigma)) {
        throw invalid_argument("Invalid input: sigma must be positive.");
    }
}

bool ModelParameters::feller_satisfied() const {
    return 2.0 * kappa * theta >= sigma * sigma;
}

void SimulationConfig::validate() const {
    if (num_paths <= 0 || num_steps <= 0 || num_repetitions <= 0) {
        throw invalid_argument("Invalid inputs: num_paths, num_steps and num_repetitions must be positive.");
    }
    if (block_size <= 0) {
        throw invalid_argument("Invalid input: block_size must be positive.");
    }
}

double FFTGridConfig::lambda() const {
    return 2.0 * M_PI / (M * eta);
}

double FFTGridConfig::origin() const {
    return k_u - lambda() * M / 2.0;
}

void FFTGridConfig::validate() const {
    if (M < 2) {
        throw Grid_Configuration_Error("M", "grid size must be at least 2, got " + to_string(M));
    }
    if (!(eta > 0.0) || !isfinite(eta)) {
        throw Grid_Configuration_Error("eta", "frequency spacing must be positive and finite");
    }
    if (!(alpha > 0.0) || !isfinite(alpha)) {
        throw Grid_Configuration_Error("alpha", "damping factor must be positive and finite");
    }
    if (!isfinite(k_u)) {
        throw Grid_Configuration_Error("k_u", "target strike must be finite");
    }
}

Reduction parse_reduction(const string& name) {
    if (name == "mean") return Reduction::Mean;
    if (name == "last") return Reduction::LastBatch;
    throw invalid_argument("Unknown repetition reduction '" + name + "' (expected mean or last)");
}

string reduction_name(Reduction reduction) {
    return reduction == Reduction::LastBatch ? "last" : "mean";
}

int parse_positive_int(const string& flag, const string& value) {
    const char* text = value.c_str();
    char* end = nullptr;
    errno = 0;
    long long n = strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || n <= 0 || n > numeric_limits<int>::max()) {
        throw invalid_argument("Option " + flag + " expects an integer in [1, "
                               + to_string(numeric_limits<int>::max()) + "], got '" + value + "'");
    }
    return static_cast<int>(n);
}

unsigned int parse_seed(const string& flag, const string& value) {
    const char* text = value.c_str();
    char* end = nullptr;
    errno = 0;
    long long n = strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || n < 0 || n > numeric_limits<unsigned int>::max()) {
        throw invalid_argument("Option " + flag + " expects an integer in [0, "
                               + to_string(numeric_limits<unsigned int>::max()) + "], got '" + value + "'");
    }
    return static_cast<unsigned int>(n);
}

RunConfig run_config_from_json(const json& j, const RunConfig& defaults) {
    RunConfig config = defaults;
    try {
        if (j.contains("model")) {
            const json& m = j["model"];
            config.model.S0 = m.value("S0", config.model.S0);
            config.model.K = m.value("K", config.model.K);
            config.model.T = m.value("T", config.model.T);
            config.model.r = m.value("r", config.model.r);
            config.model.q = m.value("q", config.model.q);
            config.model.v0 = m.value("v0", config.model.v0);
            config.model.theta = m.value("theta", config.model.theta);
            config.model.kappa = m.value("kappa", config.model.kappa);
            config.model.sigma = m.value("sigma", config.model.sigma);
            config.model.rho = m.value("rho", config.model.rho);
        }
        if (j.contains("simulation")) {
            const json& s = j["simulation"];
            config.simulation.num_paths = s.value("paths", config.simulation.num_paths);
            config.simulation.num_steps = s.value("steps", config.simulation.num_steps);
            config.simulation.num_repetitions = s.value("repetitions", config.simulation.num_repetitions);
            config.simulation.seed = s.value("seed", config.simulation.seed);
            config.simulation.block_size = s.value("block_size", config.simulation.block_size);
            if (s.contains("reduction")) {
                config.simulation.reduction = parse_reduction(s["reduction"].get<string>());
            }
        }
        if (j.contains("fft")) {
            const json& f = j["fft"];
            config.fft.M = f.value("M", config.fft.M);
            config.fft.eta = f.value("eta", config.fft.eta);
            config.fft.alpha = f.value("alpha", config.fft.alpha);
            config.fft.k_u = f.value("k_u", config.fft.k_u);
        }
    } catch (const json::exception& e) {
        throw invalid_argument(string("Malformed run configuration: ") + e.what());
    }
    return config;
}

RunConfig load_run_config(const string& filename, const RunConfig& defaults) {
    ifstream in_file(filename);
    if (!in_file.is_open()) {
        throw invalid_argument("Could not open run configuration " + filename);
    }
    json j;
    try {
        in_file >> j;
    } catch (const json::exception& e) {
        throw invalid_argument("JSON parse error in " + filename + ": " + e.what());
    }
    return run_config_from_json(j, defaults);
}

json to_json(const RunConfig& config) {
    json j;
    j["model"]["S0"] = config.model.S0;
    j["model"]["K"] = config.model.K;
    j["model"]["T"] = config.model.T;
    j["model"]["r"] = config.model.r;
    j["model"]["q"] = config.model.q;
    j["model"]["v0"] = config.model.v0;
    j["model"]["theta"] = config.model.theta;
    j["model"]["kappa"] = config.model.kappa;
    j["model"]["sigma"] = config.model.sigma;
    j["model"]["rho"] = config.model.rho;

    j["simulation"]["paths"] = config.simulation.num_paths;
    j["simulation"]["steps"] = config.simulation.num_steps;
    j["simulation"]["repetitions"] = config.simulation.num_repetitions;
    j["simulation"]["seed"] = config.simulation.seed;
    j["simulation"]["block_size"] = config.simulation.block_size;
    j["simulation"]["reduction"] = reduction_name(config.simulation.reduction);

    j["fft"]["M"] = config.fft.M;
    j["fft"]["eta"] = config.fft.eta;
    j["fft"]["alpha"] = config.fft.alpha;
    j["fft"]["k_u"] = config.fft.k_u;
    return j;
}
