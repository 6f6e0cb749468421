#pragma once

#include <pbe/profile.hpp>
#include <pbe/types.hpp>
#include <pbe/units.hpp>

#include <vector>

namespace pbe {

// Full-domain profiles (length 2N) in physical units.
struct PhysicalProfiles {
  std::vector<double> z;        // [nm]
  std::vector<double> phi;      // [mV]
  std::vector<double> c_cat;    // [1/nm^3]
  std::vector<double> c_an;     // [1/nm^3]
  std::vector<double> imp_cat;  // [1/nm^3]
  std::vector<double> imp_an;   // [1/nm^3]
};

struct ChargeBalance {
  double surface_charge = 0.0;  // imposed sigma recovered from sigma_hat [e/nm^2]
  double ion_charge = 0.0;      // half-domain integral of the net ion charge [e/nm^2]

  // Zero when the ions exactly screen the wall: ion_charge = -surface_charge.
  double mismatch() const { return ion_charge + surface_charge; }
};

// [x, reverse(x)]
std::vector<double> mirror(const std::vector<double>& x);

// [z, z + z.back()]
std::vector<double> mirror_coordinate(const std::vector<double>& z);

// Trapezoidal rule on a (possibly non-uniform) node grid.
double trapezoid(const std::vector<double>& f, const std::vector<double>& z);

// Half-domain ion densities [1/nm^3] for a converged dimensionless psi.
PhysicalProfiles half_domain_profiles(const ScaledSystem& s,
                                      const IonValencies& val,
                                      const ProfileSet& profiles,
                                      const std::vector<double>& z_nm,
                                      const std::vector<double>& psi);

PhysicalProfiles reconstruct(const ScaledSystem& s,
                             const IonValencies& val,
                             const ProfileSet& profiles,
                             const std::vector<double>& z_nm,
                             const std::vector<double>& psi);

// Integrates val_cat c_cat - val_an c_an + imp_cat - imp_an over the half-domain.
ChargeBalance charge_balance(const ScaledSystem& s,
                             const IonValencies& val,
                             const PhysicalProfiles& half);

} // namespace pbe
