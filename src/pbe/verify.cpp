#include <pbe/verify.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pbe {

namespace {

bool palindrome(const std::vector<double>& x) {
  return std::equal(x.begin(), x.begin() + static_cast<std::ptrdiff_t>(x.size() / 2), x.rbegin());
}

} // namespace

double wall_flux_residual(const RelaxationProblem& p, const std::vector<double>& psi) {
  p.validate();
  if (psi.size() != p.size()) throw std::runtime_error("wall_flux_residual: psi length mismatch");
  const std::vector<double>& eps = p.profiles.inv_eps;
  const double rho0 = local_charge_density(p, 0, psi[0]);
  return (psi[0] - psi[1]) / p.dz_hat
       - p.sigma_hat * (eps[1] + 3.0 * eps[0]) / 4.0
       - rho0 * p.dz_hat * eps[0] / 2.0;
}

double bulk_flux_residual(const RelaxationProblem& p, const std::vector<double>& psi) {
  p.validate();
  const std::size_t n = p.size();
  if (psi.size() != n) throw std::runtime_error("bulk_flux_residual: psi length mismatch");
  const double rhoN = local_charge_density(p, n - 1, psi[n - 1]);
  return (psi[n - 1] - psi[n - 2]) / p.dz_hat
       - rhoN * p.dz_hat * p.profiles.inv_eps[n - 1] / 2.0;
}

bool is_mirror_symmetric(const PhysicalProfiles& full) {
  const std::size_t n2 = full.z.size();
  if (n2 % 2 != 0) return false;
  for (const auto* v : {&full.phi, &full.c_cat, &full.c_an, &full.imp_cat, &full.imp_an}) {
    if (v->size() != n2 || !palindrome(*v)) return false;
  }
  // Coordinates are mirrored about the midplane z_mid = z[N-1].
  const std::size_t n = n2 / 2;
  const double z_mid = full.z[n - 1];
  const double scale = std::max(1.0, std::fabs(z_mid));
  for (std::size_t i = 0; i < n2; ++i) {
    double a = full.z[i] - z_mid;
    double b = z_mid - full.z[n2 - 1 - i];
    if (std::fabs(a - b) > 1e-12 * scale) return false;
  }
  return true;
}

VerificationReport verify_double_layer(const PbeConfig& cfg, const DoubleLayerSolution& sol) {
  VerificationReport r;

  // Charge balance: the ions in the half-domain screen the wall.
  r.surface_charge = sol.charge.surface_charge;
  r.ion_charge = sol.charge.ion_charge;
  const double mismatch = std::fabs(sol.charge.mismatch());
  if (std::fabs(r.surface_charge) > 0.0) {
    r.charge_rel_error = mismatch / std::fabs(r.surface_charge);
    r.charge_ok = (r.charge_rel_error <= cfg.charge_rel_tol);
  } else {
    r.charge_rel_error = mismatch;
    r.charge_ok = (mismatch <= 1e-8);
  }

  // Boundary stencils at the fixed point.
  RelaxationProblem p{sol.profiles, sol.scaled.rho_hat, sol.scaled.dz_hat, sol.scaled.sigma_hat,
                      cfg.phys.valency.cation, cfg.phys.valency.anion, sol.scaled.c_imp};
  r.wall_flux_residual = wall_flux_residual(p, sol.relax.psi);
  r.bulk_flux_residual = bulk_flux_residual(p, sol.relax.psi);

  // One sweep may leave a change of up to ~sqrt(N) * rms at a node.
  const double n = static_cast<double>(sol.relax.psi.size());
  const double flux_tol = std::max(1e-8, 10.0 * std::sqrt(n) * cfg.tol / (sol.relax.omega * p.dz_hat));
  r.flux_ok = std::fabs(r.wall_flux_residual) <= flux_tol && std::fabs(r.bulk_flux_residual) <= flux_tol;

  r.symmetry_ok = is_mirror_symmetric(sol.full);
  return r;
}

} // namespace pbe
