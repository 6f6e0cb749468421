#pragma once

#include <pbe/double_layer.hpp>
#include <pbe/relaxation.hpp>

#include <vector>

namespace pbe {

struct VerificationReport {
  bool charge_ok = false;
  double surface_charge = 0.0;    // e/nm^2
  double ion_charge = 0.0;        // e/nm^2
  double charge_rel_error = 0.0;  // |ion + sigma| / |sigma|

  bool flux_ok = false;
  double wall_flux_residual = 0.0;  // dimensionless
  double bulk_flux_residual = 0.0;  // dimensionless

  bool symmetry_ok = false;

  bool all_ok() const { return charge_ok && flux_ok && symmetry_ok; }
};

// Discrete Gauss-law residual at the wall: the one-sided potential slope
// minus the surface-charge field and the half-cell charge term.
double wall_flux_residual(const RelaxationProblem& p, const std::vector<double>& psi);

// Same at the midplane, where the imposed field is zero.
double bulk_flux_residual(const RelaxationProblem& p, const std::vector<double>& psi);

// True if every full-domain array reads the same forwards and backwards.
bool is_mirror_symmetric(const PhysicalProfiles& full);

VerificationReport verify_double_layer(const PbeConfig& cfg, const DoubleLayerSolution& sol);

} // namespace pbe
