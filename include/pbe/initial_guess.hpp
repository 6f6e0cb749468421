#pragma once

#include <vector>

namespace pbe {

// Linearized Gouy-Chapman profile used as the starting iterate:
//   psi_i = sigma_hat / eps_avg * exp(-zz_hat_i)
// where eps_avg = 1 / mean(inv_eps) is the average relative permittivity.
// Only a warm start; the relaxation converges from any seed.
std::vector<double> gouy_chapman_guess(double sigma_hat,
                                       const std::vector<double>& inv_eps,
                                       const std::vector<double>& zz_hat);

} // namespace pbe
