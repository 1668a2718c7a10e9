#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <algorithm>

#ifndef BACHELIER_H
#define BACHELIER_H

// Closed-form call price for normally distributed terminal levels.
// It is the deterministic-variance limit of the stochastic volatility model.
class Bachelier {
public:
    // Constructor
    Bachelier();

    // Standard normal CDF and density
    double NormCDF(double x) const;
    double NormPDF(double x) const;

    // European call with S_T ~ N(S + (r - q) T, w), discounted at r
    double call(double S, double K, double T, double r, double q, double w) const;

    // Integral over [0, T] of the mean variance path v0 -> theta at speed kappa
    static double integrated_variance(double v0, double theta, double kappa, double T);

private:
    boost::math::normal_distribution<double> standard_normal;
};

#endif
