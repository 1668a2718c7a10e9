#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include "Bachelier.h"

using namespace std;

// Default constructor, standard normal N(0, 1)
Bachelier::Bachelier() : standard_normal(0.0, 1.0) {
}

double Bachelier::NormCDF(double x) const {
    return boost::math::cdf(standard_normal, x);
}

double Bachelier::NormPDF(double x) const {
    return boost::math::pdf(standard_normal, x);
}

// Calculates European call option price under normal dynamics
double Bachelier::call(double S, double K, double T, double r, double q, double w) const {
    if (T <= 0 || w < 0) {
        throw invalid_argument("Invalid inputs: T must be positive and w non-negative.");
    }
    double discount = exp(-r * T);
    double forward = S + (r - q) * T;
    // Handle edge case: no variance left, payoff is deterministic
    if (w == 0) {
        return discount * max(forward - K, 0.0);
    }
    double s = sqrt(w);
    double d = (forward - K) / s;
    return discount * ((forward - K) * NormCDF(d) + s * NormPDF(d));
}

double Bachelier::integrated_variance(double v0, double theta, double kappa, double T) {
    if (kappa == 0) {
        return v0 * T;
    }
    return theta * T + (v0 - theta) * (1.0 - exp(-kappa * T)) / kappa;
}
