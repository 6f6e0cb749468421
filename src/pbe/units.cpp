#include <pbe/units.hpp>

#include <pbe/constants.hpp>

#include <cmath>
#include <stdexcept>

namespace pbe {

double ScaledSystem::psi_to_mV() const {
  return 1e3 / (eCharge * beta * static_cast<double>(val_max));
}

double ScaledSystem::sigma_to_e_per_nm2() const {
  // inverse of sigma_hat = sigma sqrt(beta) / sqrt(eps0 c0), with sigma in C/m^2
  return sigma_hat * std::sqrt(epsilon0 * c0) / (eCharge * 1e18 * std::sqrt(beta));
}

ScaledSystem nondimensionalize(const PhysicalParameters& phys,
                               const Grid1D& grid,
                               const std::vector<double>& rho_e_per_nm3) {
  const std::size_t n = grid.n_points();
  if (rho_e_per_nm3.size() != n) {
    throw std::runtime_error("nondimensionalize: rho length mismatch");
  }
  if (!(phys.T > 0.0) || !(phys.c0 > 0.0)) {
    throw std::runtime_error("nondimensionalize: T and c0 must be positive");
  }

  ScaledSystem s;
  s.val_max = phys.valency.max();
  const double z = static_cast<double>(s.val_max);

  s.beta = beta(phys.T);
  s.c0 = avogadro * phys.c0 * 1e3;                          // mol/L -> 1/m^3
  s.c_imp = avogadro * phys.c_imp * 1e-6 / (s.c0 * z);      // nmol/L -> relative

  const double sigma_SI = phys.sigma * eCharge / (nm_to_m * nm_to_m);  // C/m^2

  // The actual screening length also carries sqrt(2/eps); kappa leaves it out.
  s.kappa = eCharge * z * std::sqrt(s.beta * s.c0 / epsilon0);

  s.zz_hat.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    s.zz_hat[i] = grid.z()[i] * nm_to_m * s.kappa;
  }
  s.dz_hat = grid.dz() * nm_to_m * s.kappa;

  s.sigma_hat = sigma_SI * std::sqrt(s.beta) / std::sqrt(epsilon0 * s.c0);

  s.rho_hat.resize(n);
  const double rho_scale = eCharge / (nm_to_m * nm_to_m * nm_to_m);  // e/nm^3 -> C/m^3
  for (std::size_t i = 0; i < n; ++i) {
    s.rho_hat[i] = rho_e_per_nm3[i] * rho_scale / (eCharge * z * s.c0);
  }
  return s;
}

} // namespace pbe
