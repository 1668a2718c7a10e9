#ifndef PRICING_ERRORS_H
#define PRICING_ERRORS_H

#include <stdexcept>
#include <string>

// Correlation outside [-1, 1]: the second shock stream needs sqrt(1 - rho^2)
class Invalid_Correlation : public std::invalid_argument {
public:
    explicit Invalid_Correlation(double rho)
        : std::invalid_argument("Invalid input: rho must be between -1 and 1, got " + std::to_string(rho)),
          rho_(rho) {}

    double rho() const { return rho_; }

private:
    double rho_;
};

// FFT grid that cannot produce a price at the requested strike.
// parameter() names the grid input that has to change (M, eta, alpha or k_u).
class Grid_Configuration_Error : public std::invalid_argument {
public:
    Grid_Configuration_Error(const std::string& parameter, const std::string& message)
        : std::invalid_argument("FFT grid configuration error [" + parameter + "]: " + message),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// A computation produced a value it cannot recover from (overflow, pole, NaN).
// stage() names where it happened.
class Numerical_Instability : public std::runtime_error {
public:
    Numerical_Instability(const std::string& stage, const std::string& message)
        : std::runtime_error("Numerical instability in " + stage + ": " + message),
          stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

#endif // PRICING_ERRORS_H
