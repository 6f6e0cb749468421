#pragma once

#include <pbe/config.hpp>
#include <pbe/grid.hpp>
#include <pbe/profile.hpp>
#include <pbe/reconstruct.hpp>
#include <pbe/relaxation.hpp>
#include <pbe/units.hpp>

#include <string>

namespace pbe {

struct DoubleLayerSolution {
  Grid1D grid;                // half-domain [nm]
  ProfileSet profiles;        // inputs, unchanged by the solve
  ScaledSystem scaled;
  RelaxationResult relax;     // dimensionless psi on the half-domain

  PhysicalProfiles half;      // length N
  PhysicalProfiles full;      // length 2N, mirrored about the midplane
  ChargeBalance charge;

  double wall_potential_mV() const { return half.phi.empty() ? 0.0 : half.phi.front(); }
};

RelaxationOptions relaxation_options(const PbeConfig& cfg);

// Nondimensionalize, seed with Gouy-Chapman, relax, and convert back.
DoubleLayerSolution solve_double_layer(const PbeConfig& cfg,
                                       const Grid1D& grid,
                                       ProfileSet profiles);

// psi.txt, dens_pos.txt, dens_neg.txt, imp_pos.txt, imp_neg.txt,
// residual.txt (if a history was recorded) and results.json.
void write_double_layer_outputs(const PbeConfig& cfg,
                                const DoubleLayerSolution& sol,
                                const std::string& subdir = "");

} // namespace pbe
