#pragma once

#include <pbe/profile.hpp>

#include <cstddef>
#include <vector>

namespace pbe {

// Discretized dimensionless PBE on the half-domain:
//   psi'' = -inv_eps * rho(psi),  -psi'(0) = sigma_hat * inv_eps(0),  psi'(end) = 0
// with rho(psi) = exp(-z+ psi - pmf+) - exp(z- psi - pmf-) + rho_hat
//               + c_imp (exp(-psi - pmf_imp+) - exp(psi - pmf_imp-)).
// The single-species 1:1 case is val_cat = val_an = 1, c_imp = 0.
struct RelaxationProblem {
  const ProfileSet& profiles;          // inv_eps and the four PMFs
  const std::vector<double>& rho_hat;  // dimensionless external charge
  double dz_hat = 0.0;
  double sigma_hat = 0.0;
  int val_cat = 1;
  int val_an = 1;
  double c_imp = 0.0;

  std::size_t size() const { return rho_hat.size(); }

  // Throws on length mismatch, N < 2 or a non-positive grid spacing.
  // inv_eps > 0 is a precondition and is not checked here.
  void validate() const;
};

// Local dimensionless charge density at node i for potential psi_i.
double local_charge_density(const RelaxationProblem& p, std::size_t i, double psi_i);

// Asymptotic SOR optimum 2 / (1 + sqrt(pi / N)).
double default_omega(std::size_t n);

// sqrt(sum (a-b)^2 / (N-1))
double rms_change(const std::vector<double>& a, const std::vector<double>& b);

// Precomputed stencil weights for one problem. A sweep reads the previous
// iterate from prev and writes the new one into next; the left neighbour is
// taken from next (Gauss-Seidel order), the right one from prev.
class SorStencil {
public:
  explicit SorStencil(const RelaxationProblem& p);

  std::size_t size() const { return n_; }

  void sweep(double omega, const std::vector<double>& prev, std::vector<double>& next) const;

private:
  const RelaxationProblem& p_;
  std::size_t n_ = 0;
  double wall_flux_ = 0.0;          // dz sigma (eps1 + 3 eps0) / 4
  std::vector<double> w_right_;     // weight of psi[i+1]
  std::vector<double> w_left_;      // weight of psi[i-1]
  std::vector<double> src_;         // dz^2 eps[i] / 2
};

enum class SolveStatus {
  converged,
  max_iterations_exceeded,
  diverged,  // sweep difference became inf/NaN
};

const char* to_string(SolveStatus s);

struct RelaxationOptions {
  double omega = 0.0;               // 0 => default_omega(N)
  double tol = 1e-10;
  long max_iterations = 10000000;   // 0 => iterate until converged
  bool record_history = false;
};

struct RelaxationResult {
  SolveStatus status = SolveStatus::max_iterations_exceeded;
  std::vector<double> psi;          // converged or last iterate
  long iterations = 0;
  double rms = 0.0;                 // last sweep-to-sweep RMS difference
  double omega = 0.0;
  std::vector<double> rms_history;  // per sweep, if requested

  bool converged() const { return status == SolveStatus::converged; }
};

RelaxationResult solve_relaxation(const RelaxationProblem& p,
                                  std::vector<double> psi_start,
                                  const RelaxationOptions& opt = {});

} // namespace pbe
