#include <cmath>
#include <iostream>
#include <complex>
#include <vector>
#include <string>
#include <stdexcept>
#include <exception>
#include <limits>
#include <utility>
#include <algorithm>
#include <omp.h>
#include <unsupported/Eigen/FFT>
#include "Heston_Fourier.h"
#include "Bachelier.h"
#include "Pricing_Errors.h"

using namespace std;

// Define M_PI if not already defined
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

double FFT_Result::price_at_strike(double k) const {
    if (strikes.size() < 2) {
        throw Grid_Configuration_Error("M", "no strike grid has been computed");
    }
    double b = strikes.front();
    double lambda = strikes[1] - strikes[0];
    double pos = (k - b) / lambda;
    if (!isfinite(pos) || pos < -0.5 || pos >= strikes.size() - 0.5) {
        throw Grid_Configuration_Error("eta", "strike " + to_string(k) + " lies outside the grid ["
                                       + to_string(b) + ", " + to_string(strikes.back())
                                       + "]; lower eta or move k_u");
    }
    size_t idx = static_cast<size_t>(lround(pos));
    if (!isfinite(prices[idx])) {
        throw Numerical_Instability("fft", "price at strike " + to_string(k) + " is not finite");
    }
    return prices[idx];
}

// Constructor stores the validated model parameters
HestonFourier::HestonFourier(const ModelParameters& params_, bool debug_)
    : params(params_), debug(debug_) {
    params.validate();
}

// Sets debug flag for diagnostic output
void HestonFourier::SetDebug(bool d) {
    debug = d;
}

// Characteristic function of the terminal asset level
complex<double> HestonFourier::characteristic_function(complex<double> phi, double tau) const {
    // Input: phi (complex frequency), tau (time to maturity)
    // Output: E[exp(i phi S_tau)] under the affine solution
    //   beta = kappa - i rho sigma phi,  d = sqrt(sigma^2 phi^2 + beta^2)
    //   g    = (beta - d) / (beta + d)
    //   D    = (beta - d)/sigma^2 (1 - e^{-d tau}) / (1 - g e^{-d tau})
    //   C    = i phi (r - q) tau + kappa theta/sigma^2 [(beta - d) tau - 2 ln((1 - g e^{-d tau}) / (1 - g))]
    // Logic: beta - d is formed as -sigma^2 phi^2 / (beta + d) so it does not cancel
    //        for small sigma, and the log is split into two principal logs whose
    //        arguments stay in the right half-plane, keeping the result continuous in phi
    const complex<double> i(0.0, 1.0);
    double sigma2 = params.sigma * params.sigma;
    complex<double> phi2 = phi * phi;

    complex<double> beta = params.kappa - i * params.rho * params.sigma * phi;
    complex<double> d = sqrt(sigma2 * phi2 + beta * beta); // principal branch, Re(d) >= 0
    complex<double> beta_plus_d = beta + d;

    if (abs(beta_plus_d) < 1e-14 * (abs(beta) + abs(d) + 1.0)) {
        throw Numerical_Instability("characteristic_function",
                                    "beta + d vanishes at phi = (" + to_string(phi.real()) + ", " + to_string(phi.imag()) + ")");
    }

    complex<double> beta_minus_d = -sigma2 * phi2 / beta_plus_d;
    complex<double> g = beta_minus_d / beta_plus_d;
    complex<double> e = exp(-d * tau);
    complex<double> one_minus_ge = 1.0 - g * e;

    if (abs(one_minus_ge) < 1e-300 || abs(1.0 - g) < 1e-300) {
        throw Numerical_Instability("characteristic_function",
                                    "pole in D(t) at phi = (" + to_string(phi.real()) + ", " + to_string(phi.imag()) + ")");
    }

    // (beta - d) / sigma^2 without dividing by sigma^2
    complex<double> D = -phi2 / beta_plus_d * (1.0 - e) / one_minus_ge;
    complex<double> log_ratio = log(one_minus_ge) - log(1.0 - g);
    complex<double> C = i * phi * (params.r - params.q) * tau
                      + params.kappa * params.theta * (-phi2 / beta_plus_d * tau - 2.0 * log_ratio / sigma2);

    complex<double> f = exp(C + D * params.v0 + i * phi * params.S0);
    if (!isfinite(f.real()) || !isfinite(f.imag())) {
        throw Numerical_Instability("characteristic_function",
                                    "non-finite value at phi = (" + to_string(phi.real()) + ", " + to_string(phi.imag()) + ")");
    }
    return f;
}

// Fourier transform of the damped call price exp(alpha k) C(k)
complex<double> HestonFourier::damped_call_transform(double u, double alpha, double tau) const {
    // Input: u (frequency), alpha (damping factor), tau (time to maturity)
    // Output: psi(u) = exp(-r tau) chf(u - i alpha) / (alpha + i u)^2
    // Logic: For a call on the level, int exp((alpha + i u) k) (s - k)^+ dk = exp((alpha + i u) s) / (alpha + i u)^2,
    //        so the chf is shifted by the same alpha that appears in the denominator
    const complex<double> i(0.0, 1.0);
    complex<double> z = alpha + i * u;
    complex<double> cf = characteristic_function(complex<double>(u, -alpha), tau);
    return exp(-params.r * tau) * cf / (z * z);
}

// Time at which E[exp(alpha S_t)] becomes infinite
double HestonFourier::moment_explosion_time(double alpha) const {
    // Input: alpha (damping factor)
    // Output: explosion time, +infinity if the moment stays finite for every t
    // Logic: log E[exp(alpha S_t)] is affine in v0 with coefficient B(t) solving
    //          B' = sigma^2/2 B^2 - beta B + alpha^2/2,  B(0) = 0,  beta = kappa - rho sigma alpha
    //        With kappa > 0 and |rho| <= 1, beta^2 >= sigma^2 alpha^2 forces beta > 0 and B
    //        converges. Otherwise B reaches infinity at 2/gamma (pi/2 + atan(beta/gamma)),
    //        gamma^2 = sigma^2 alpha^2 - beta^2
    double beta = params.kappa - params.rho * params.sigma * alpha;
    double gamma2 = params.sigma * params.sigma * alpha * alpha - beta * beta;
    if (gamma2 <= 0.0) {
        return numeric_limits<double>::infinity();
    }
    double gamma = sqrt(gamma2);
    return 2.0 / gamma * (M_PI / 2.0 + atan(beta / gamma));
}

// Model-free range a call price at strike k must fall in
pair<double, double> HestonFourier::price_bounds(double k) const {
    // Lower: exp(-rT) (F - k)^+ by Jensen
    // Upper: exp(-rT) ((F - k)^+ + sqrt(Var S_T)), since (x + y)^+ <= x^+ + |y|
    double discount = exp(-params.r * params.T);
    double forward = params.S0 + (params.r - params.q) * params.T;
    double intrinsic = max(forward - k, 0.0);
    double w = Bachelier::integrated_variance(params.v0, params.theta, params.kappa, params.T);
    return make_pair(discount * intrinsic, discount * (intrinsic + sqrt(w)));
}

// Simpson's rule weights on a uniform grid of spacing eta
vector<double> HestonFourier::simpson_weights(int M, double eta) {
    vector<double> w(M);
    for (int j = 0; j < M; ++j) {
        // (-1)^(j+1) is -1 for even j and +1 for odd j
        double sign = (j % 2 == 0) ? -1.0 : 1.0;
        double delta = (j == 0) ? 1.0 : 0.0;
        w[j] = eta / 3.0 * (3.0 + sign - delta);
    }
    return w;
}

// Recovers the grid index nearest strike k
int HestonFourier::strike_index(const FFTGridConfig& grid, double k) {
    // idx = ((k - b) M eta) / (2 pi) = (k - b) / lambda, rounded, zero-based
    double lambda = grid.lambda();
    if (!isfinite(lambda) || lambda <= 0.0) {
        throw Grid_Configuration_Error("M", "M * eta gives a degenerate strike spacing");
    }
    double pos = (k - grid.origin()) / lambda;
    if (!isfinite(pos)) {
        throw Grid_Configuration_Error("k_u", "strike index for k = " + to_string(k) + " is not finite");
    }
    double idx = round(pos);
    if (idx < 0.0 || idx >= grid.M) {
        throw Grid_Configuration_Error("eta", "strike " + to_string(k) + " maps to index " + to_string(static_cast<long long>(idx))
                                       + " outside [0, " + to_string(grid.M) + "); lower eta, raise M or move k_u");
    }
    return static_cast<int>(idx);
}

// Checks grid inputs that do not need the transform
int HestonFourier::check_grid(const FFTGridConfig& grid, double strike) const {
    grid.validate();
    int idx = strike_index(grid, strike);
    double explosion = moment_explosion_time(grid.alpha);
    if (params.T >= explosion) {
        throw Grid_Configuration_Error("alpha", "alpha = " + to_string(grid.alpha)
                                       + " exceeds the moment explosion bound: E[exp(alpha S_t)] is infinite from t = "
                                       + to_string(explosion) + " <= T = " + to_string(params.T) + "; lower alpha");
    }
    return idx;
}

FFT_Result HestonFourier::price_call_fft(const FFTGridConfig& grid) const {
    return price_call_fft(grid, grid.k_u);
}

// Carr-Madan FFT pricing of the European call
FFT_Result HestonFourier::price_call_fft(const FFTGridConfig& grid, double strike) const {
    // Input: grid (M, eta, alpha, k_u), strike (strike to read the price at)
    // Output: FFT_Result with the price at strike and the full strike/price grids
    // Logic: u[j] = j eta, k[j] = b + j lambda, x[j] = exp(-i b u[j]) psi(u[j]) w[j];
    //        price[j] = exp(-alpha k[j]) / pi * Re(FFT(x))[j]
    int idx = check_grid(grid, strike); // fail fast, before any chf evaluation

    const complex<double> i(0.0, 1.0);
    int M = grid.M;
    double eta = grid.eta;
    double alpha = grid.alpha;
    double lambda = grid.lambda();
    double b = grid.origin();
    double tau = params.T;

    if (debug) {
        cout << "FFT grid: M = " << M << ", eta = " << eta << ", alpha = " << alpha
             << ", lambda = " << lambda << ", b = " << b << ", index = " << idx << endl;
        if ((M & (M - 1)) != 0) {
            cout << "FFT grid: M = " << M << " is not a power of two, using a mixed-radix transform" << endl;
        }
    }

    vector<double> w = simpson_weights(M, eta);
    vector<complex<double>> x(M);

    // chf failures inside the parallel loop are recorded and the first one rethrown after it
    int failed_at = -1;
    exception_ptr failure;

    #pragma omp parallel for schedule(static)
    for (int j = 0; j < M; ++j) {
        double u = j * eta;
        try {
            x[j] = exp(-i * b * u) * damped_call_transform(u, alpha, tau) * w[j];
        } catch (const Numerical_Instability&) {
            #pragma omp critical
            {
                if (failed_at < 0 || j < failed_at) {
                    failed_at = j;
                    failure = current_exception();
                }
            }
        }
    }
    if (failure) {
        if (debug) {
            cout << "FFT grid: characteristic function failed at grid point " << failed_at << endl;
        }
        rethrow_exception(failure);
    }

    Eigen::FFT<double> fft;
    vector<complex<double>> X;
    fft.fwd(X, x);

    FFT_Result result;
    result.strikes.resize(M);
    result.prices.resize(M);
    for (int j = 0; j < M; ++j) {
        double k = b + j * lambda;
        result.strikes[j] = k;
        result.prices[j] = exp(-alpha * k) / M_PI * X[j].real();
    }

    result.index = idx;
    result.strike = result.strikes[idx];
    result.price = result.prices[idx];
    if (!isfinite(result.price)) {
        throw Numerical_Instability("fft", "price at index " + to_string(idx) + " is not finite; check alpha");
    }
    pair<double, double> bounds = price_bounds(result.strike);
    double tolerance = 1e-6 * bounds.second + 1e-12;
    if (result.price < bounds.first - tolerance || result.price > bounds.second + tolerance) {
        throw Numerical_Instability("fft", "price " + to_string(result.price) + " at k = " + to_string(result.strike)
                                    + " lies outside the no-arbitrage range [" + to_string(bounds.first) + ", "
                                    + to_string(bounds.second) + "]; alpha = " + to_string(alpha)
                                    + " is too close to the moment explosion bound or the grid is too coarse");
    }

    if (debug) {
        cout << "FFT price at k = " << result.strike << " (requested " << strike << "): " << result.price << endl;
    }
    return result;
}
