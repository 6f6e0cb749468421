#pragma once

namespace pbe {

// Fundamental constants (CODATA 2018, exact SI values where defined).
constexpr double kBoltzmann = 1.380649e-23;      // J/K
constexpr double eCharge    = 1.602176634e-19;   // C
constexpr double epsilon0   = 8.8541878128e-12;  // F/m
constexpr double avogadro   = 6.02214076e23;     // 1/mol
constexpr double pi         = 3.141592653589793238462643383279502884;

constexpr double nm_to_m = 1e-9;

inline double beta(double T) { return 1.0 / (kBoltzmann * T); }

} // namespace pbe
