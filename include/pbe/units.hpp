#pragma once

#include <pbe/grid.hpp>
#include <pbe/types.hpp>

#include <vector>

namespace pbe {

// Dimensionless system: lengths scaled by 1/kappa, potential by kT/(z e),
// charge densities by z e c0.
struct ScaledSystem {
  double beta = 0.0;         // [1/J]
  double kappa = 0.0;        // modified inverse Debye length [1/m]
  double c0 = 0.0;           // bulk concentration [1/m^3]
  double c_imp = 0.0;        // impurity concentration relative to z c0
  int val_max = 1;           // normalization valency z

  double dz_hat = 0.0;
  double sigma_hat = 0.0;
  std::vector<double> zz_hat;   // [N]
  std::vector<double> rho_hat;  // [N]

  double debye_length_nm() const { return 1e9 / kappa; }

  // Dimensionless psi -> potential in mV.
  double psi_to_mV() const;

  // sigma_hat -> surface charge in e/nm^2.
  double sigma_to_e_per_nm2() const;
};

// rho_e_per_nm3 is the external charge density profile in e/nm^3 (length N).
ScaledSystem nondimensionalize(const PhysicalParameters& phys,
                               const Grid1D& grid,
                               const std::vector<double>& rho_e_per_nm3);

} // namespace pbe
