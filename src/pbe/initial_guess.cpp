#include <pbe/initial_guess.hpp>

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace pbe {

std::vector<double> gouy_chapman_guess(double sigma_hat,
                                       const std::vector<double>& inv_eps,
                                       const std::vector<double>& zz_hat) {
  if (inv_eps.empty() || inv_eps.size() != zz_hat.size()) {
    throw std::runtime_error("gouy_chapman_guess: inv_eps/zz_hat length mismatch");
  }
  const double mean_inv_eps =
      std::accumulate(inv_eps.begin(), inv_eps.end(), 0.0) / static_cast<double>(inv_eps.size());
  const double eps_avg = 1.0 / mean_inv_eps;

  std::vector<double> psi(zz_hat.size());
  for (std::size_t i = 0; i < zz_hat.size(); ++i) {
    psi[i] = (sigma_hat / eps_avg) * std::exp(-zz_hat[i]);
  }
  return psi;
}

} // namespace pbe
