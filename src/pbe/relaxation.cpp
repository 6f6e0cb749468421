#include <pbe/relaxation.hpp>

#include <pbe/constants.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace pbe {

void RelaxationProblem::validate() const {
  const std::size_t n = rho_hat.size();
  if (n < 2) throw std::runtime_error("RelaxationProblem: need at least 2 grid points");
  profiles.validate(n);
  if (!(dz_hat > 0.0) || !std::isfinite(dz_hat)) {
    throw std::runtime_error("RelaxationProblem: dz_hat must be positive and finite");
  }
  if (val_cat < 1 || val_an < 1) {
    throw std::runtime_error("RelaxationProblem: valencies must be >= 1");
  }
}

double local_charge_density(const RelaxationProblem& p, std::size_t i, double psi_i) {
  const ProfileSet& pr = p.profiles;
  const double rho_imp = p.c_imp * (std::exp(-psi_i - pr.pmf_imp_cat[i]) -
                                    std::exp(psi_i - pr.pmf_imp_an[i]));
  return std::exp(-p.val_cat * psi_i - pr.pmf_cat[i]) -
         std::exp(p.val_an * psi_i - pr.pmf_an[i]) +
         p.rho_hat[i] + rho_imp;
}

double default_omega(std::size_t n) {
  return 2.0 / (1.0 + std::sqrt(pi / static_cast<double>(n)));
}

double rms_change(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.size() != b.size() || a.size() < 2) {
    throw std::runtime_error("rms_change: size mismatch");
  }
  double s = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const double d = a[i] - b[i];
    s += d * d;
  }
  return std::sqrt(s / static_cast<double>(a.size() - 1));
}

SorStencil::SorStencil(const RelaxationProblem& p) : p_(p), n_(p.size()) {
  p_.validate();

  const std::vector<double>& eps = p_.profiles.inv_eps;
  const double dz2 = p_.dz_hat * p_.dz_hat;

  // Ghost node eliminated with the constant-field condition from the wall charge.
  wall_flux_ = p_.dz_hat * p_.sigma_hat * (eps[1] + 3.0 * eps[0]) / 4.0;

  w_right_.assign(n_, 0.0);
  w_left_.assign(n_, 0.0);
  src_.resize(n_);
  for (std::size_t i = 0; i < n_; ++i) {
    src_[i] = dz2 * eps[i] / 2.0;
  }
  for (std::size_t i = 1; i + 1 < n_; ++i) {
    const double den = 8.0 * eps[i];
    w_right_[i] = (-eps[i + 1] + 4.0 * eps[i] + eps[i - 1]) / den;
    w_left_[i] = (eps[i + 1] + 4.0 * eps[i] - eps[i - 1]) / den;
  }
}

void SorStencil::sweep(double omega, const std::vector<double>& prev, std::vector<double>& next) const {
  if (prev.size() != n_ || next.size() != n_) {
    throw std::runtime_error("SorStencil::sweep: buffer length mismatch");
  }
  const double keep = 1.0 - omega;
  const double* pv = prev.data();
  double* nx = next.data();

  // wall
  {
    const double rho0 = local_charge_density(p_, 0, pv[0]);
    const double psi0 = pv[1] + wall_flux_ + rho0 * src_[0];
    nx[0] = keep * pv[0] + omega * psi0;
  }

  // interior
  for (std::size_t i = 1; i + 1 < n_; ++i) {
    const double rho_i = local_charge_density(p_, i, pv[i]);
    const double psi_i = pv[i + 1] * w_right_[i] + nx[i - 1] * w_left_[i] + rho_i * src_[i];
    nx[i] = keep * pv[i] + omega * psi_i;
  }

  // bulk: no field at the midplane
  {
    const std::size_t k = n_ - 1;
    const double rhoN = local_charge_density(p_, k, pv[k]);
    const double psiN = nx[k - 1] + rhoN * src_[k];
    nx[k] = keep * pv[k] + omega * psiN;
  }
}

const char* to_string(SolveStatus s) {
  switch (s) {
    case SolveStatus::converged: return "converged";
    case SolveStatus::max_iterations_exceeded: return "max_iterations_exceeded";
    case SolveStatus::diverged: return "diverged";
  }
  return "unknown";
}

RelaxationResult solve_relaxation(const RelaxationProblem& p,
                                  std::vector<double> psi_start,
                                  const RelaxationOptions& opt) {
  SorStencil stencil(p);
  const std::size_t n = stencil.size();
  if (psi_start.size() != n) {
    throw std::runtime_error("solve_relaxation: psi_start length mismatch");
  }
  if (!(opt.tol > 0.0)) throw std::runtime_error("solve_relaxation: tol must be positive");
  if (opt.max_iterations < 0) throw std::runtime_error("solve_relaxation: max_iterations must be >= 0");

  RelaxationResult res;
  res.omega = (opt.omega > 0.0) ? opt.omega : default_omega(n);

  // Two owned buffers: after each sweep the newest iterate is moved into prev.
  std::vector<double> prev = std::move(psi_start);
  std::vector<double> next(n, 0.0);

  while (true) {
    stencil.sweep(res.omega, prev, next);
    ++res.iterations;

    res.rms = rms_change(next, prev);
    if (opt.record_history) res.rms_history.push_back(res.rms);
    prev.swap(next);

    if (!std::isfinite(res.rms)) {
      res.status = SolveStatus::diverged;
      break;
    }
    if (res.rms <= opt.tol) {
      res.status = SolveStatus::converged;
      break;
    }
    if (opt.max_iterations > 0 && res.iterations >= opt.max_iterations) {
      res.status = SolveStatus::max_iterations_exceeded;
      break;
    }
  }

  res.psi = std::move(prev);
  return res;
}

} // namespace pbe
