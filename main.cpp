// Include standard C++ libraries for input/output and file handling
#include <iostream>
#include <fstream>
#include <string>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Include pricing engine headers
#include "Pricing_Config.h"
#include "Cross_Validation.h"
#include "Bachelier.h"

// Use standard namespace and JSON alias for convenience
using namespace std;
using json = nlohmann::json;

// Sample run: negative spot with a strike at zero, variance decaying from 0.09
// towards a long-run level that violates the Feller condition
RunConfig sample_run_config() {
    RunConfig config;
    config.model.S0 = -0.001;
    config.model.K = 0.0;
    config.model.T = 1.0;
    config.model.r = 0.0;
    config.model.q = 0.0;
    config.model.v0 = 0.09;
    config.model.theta = 5e-7;
    config.model.kappa = 1.0;
    config.model.sigma = 0.25;
    config.model.rho = -0.9;

    config.simulation.num_paths = 100000;
    config.simulation.num_steps = 100;
    config.simulation.num_repetitions = 1;

    config.fft.M = 120000;
    config.fft.eta = 1.0;
    config.fft.alpha = 30.0;
    config.fft.k_u = 0.0005;
    return config;
}

// Print help message with program usage and options
void printHelp() {
    // Display usage information
    cout << "Usage: ./normal_sv_pricer [options]\n";
    cout << "Options:\n";
    cout << "  --help, -h                Display this help message and exit\n";
    cout << "  --config, -c <file>       JSON run file with model/simulation/fft sections [default: built-in sample]\n";
    cout << "  --paths, -p <n>           Number of Monte Carlo paths\n";
    cout << "  --steps, -n <n>           Number of time steps per path\n";
    cout << "  --repetitions, -R <n>     Number of independent Monte Carlo batches\n";
    cout << "  --reduction <mean|last>   How batches reduce to one price [default: mean]\n";
    cout << "  --seed, -s <n>            Seed of the Monte Carlo generators [default: 42]\n";
    cout << "  --output, -o <file>       Write the run configuration and results as JSON\n";
    cout << "  --debug, -d               Enable debug mode\n";
}

// Main program entry point
int main(int argc, char** argv) {
    RunConfig config = sample_run_config();
    string config_file;
    string output_file;
    bool debug = false;

    try {
        // First pass: the config file has to be applied before flag overrides
        for (int i = 1; i < argc; ++i) {
            string arg = argv[i];
            if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                config_file = argv[++i];
            }
        }
        if (!config_file.empty()) {
            config = load_run_config(config_file, config);
            cout << "Loaded run configuration from " << config_file << endl;
        }

        // Parse command-line arguments
        for (int i = 1; i < argc; ++i) {
            string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                ++i;
            } else if ((arg == "--paths" || arg == "-p") && i + 1 < argc) {
                config.simulation.num_paths = parse_positive_int(arg, argv[++i]);
            } else if ((arg == "--steps" || arg == "-n") && i + 1 < argc) {
                config.simulation.num_steps = parse_positive_int(arg, argv[++i]);
            } else if ((arg == "--repetitions" || arg == "-R") && i + 1 < argc) {
                config.simulation.num_repetitions = parse_positive_int(arg, argv[++i]);
            } else if (arg == "--reduction" && i + 1 < argc) {
                config.simulation.reduction = parse_reduction(argv[++i]);
            } else if ((arg == "--seed" || arg == "-s") && i + 1 < argc) {
                config.simulation.seed = parse_seed(arg, argv[++i]);
            } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--debug" || arg == "-d") {
                debug = true;
            } else {
                cerr << "Unknown option: " << arg << " (see --help)" << endl;
                return 1;
            }
        }

        // Log configuration parameters
        cout << "Paths = " << config.simulation.num_paths << ", Steps = " << config.simulation.num_steps
             << ", Repetitions = " << config.simulation.num_repetitions
             << " (" << reduction_name(config.simulation.reduction) << ")"
             << ", FFT M = " << config.fft.M << ", eta = " << config.fft.eta
             << ", alpha = " << config.fft.alpha << ", k_u = " << config.fft.k_u << endl;

        Cross_Validation validation(debug);
        PricingResult result = validation.run(config.model, config.simulation, config.fft);

        // Deterministic-variance reference from the mean variance path
        Bachelier bachelier;
        double w = Bachelier::integrated_variance(config.model.v0, config.model.theta, config.model.kappa, config.model.T);
        double reference = bachelier.call(config.model.S0, config.model.K, config.model.T, config.model.r, config.model.q, w);

        cout << "Monte Carlo price: " << result.mc_price << " +/- " << result.mc.std_error << endl;
        cout << "FFT price:         " << result.fft_price << " (grid strike " << result.fft.strike << ")" << endl;
        cout << "Difference:        " << result.difference << endl;
        cout << "Bachelier price with mean variance path: " << reference << endl;
        if (result.mc.absorbed_fraction > 0.0) {
            cout << "Share of path-steps with variance absorbed at zero: " << result.mc.absorbed_fraction << endl;
        }

        if (!output_file.empty()) {
            json j;
            j["config"] = to_json(config);
            j["result"] = to_json(result);
            j["result"]["bachelier_reference"] = reference;
            ofstream out_file(output_file);
            if (!out_file.is_open()) {
                cerr << "Error: Could not open " << output_file << " for writing" << endl;
                return 1;
            }
            out_file << j.dump(4);
            cout << "Results saved to " << output_file << endl;
        }
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
    // Return successful execution
    return 0;
}
