#include <pbe/double_layer.hpp>

#include <pbe/initial_guess.hpp>
#include <pbe/io.hpp>

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pbe {

namespace fs = std::filesystem;

namespace {

std::string fixed2(double v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << v;
  return os.str();
}

std::string num(double v) {
  std::ostringstream os;
  os << std::setprecision(10) << v;
  return os.str();
}

} // namespace

RelaxationOptions relaxation_options(const PbeConfig& cfg) {
  RelaxationOptions opt;
  opt.omega = cfg.omega;
  opt.tol = cfg.tol;
  opt.max_iterations = cfg.max_iter;
  opt.record_history = cfg.verbose;
  return opt;
}

DoubleLayerSolution solve_double_layer(const PbeConfig& cfg,
                                       const Grid1D& grid,
                                       ProfileSet profiles) {
  if (grid.n_points() != cfg.bins) {
    throw std::runtime_error("solve_double_layer: grid does not match configured bins");
  }
  profiles.validate(grid.n_points());

  DoubleLayerSolution sol;
  sol.grid = grid;
  sol.profiles = std::move(profiles);

  sol.scaled = nondimensionalize(cfg.phys, sol.grid, sol.profiles.rho);

  std::vector<double> psi0 =
      gouy_chapman_guess(sol.scaled.sigma_hat, sol.profiles.inv_eps, sol.scaled.zz_hat);

  RelaxationProblem problem{sol.profiles, sol.scaled.rho_hat, sol.scaled.dz_hat, sol.scaled.sigma_hat,
                            cfg.phys.valency.cation, cfg.phys.valency.anion, sol.scaled.c_imp};
  sol.relax = solve_relaxation(problem, std::move(psi0), relaxation_options(cfg));

  sol.half = half_domain_profiles(sol.scaled, cfg.phys.valency, sol.profiles, sol.grid.z(), sol.relax.psi);
  sol.full = reconstruct(sol.scaled, cfg.phys.valency, sol.profiles, sol.grid.z(), sol.relax.psi);
  sol.charge = charge_balance(sol.scaled, cfg.phys.valency, sol.half);
  return sol;
}

void write_double_layer_outputs(const PbeConfig& cfg,
                                const DoubleLayerSolution& sol,
                                const std::string& subdir) {
  fs::path outdir(cfg.output_dir);
  if (!subdir.empty()) outdir /= subdir;
  ensure_dir(outdir.string());

  const std::string dens_head = "density for bulk concentration c_0 = " + fixed2(cfg.phys.c0) + " mol/l\n"
                                "col 1: z-distance [nm]\ncol 2: density [1/nm^3]";
  const std::string imp_head = "impurity density for concentration c_imp = " + fixed2(cfg.phys.c_imp) +
                               " nmol/l\ncol 1: z-distance [nm]\ncol 2: density [1/nm^3]";
  const std::string psi_head = "electrostatic potential for l_debye = " +
                               fixed2(sol.scaled.debye_length_nm()) + " nm\n"
                               "col 1: z-distance [nm]\ncol 2: potential [mV]";

  const auto& f = sol.full;
  write_table((outdir / "dens_pos.txt").string(), {"z", "density"}, {f.z, f.c_cat}, "cation " + dens_head);
  write_table((outdir / "dens_neg.txt").string(), {"z", "density"}, {f.z, f.c_an}, "anion " + dens_head);
  write_table((outdir / "imp_pos.txt").string(), {"z", "density"}, {f.z, f.imp_cat}, "cation " + imp_head);
  write_table((outdir / "imp_neg.txt").string(), {"z", "density"}, {f.z, f.imp_an}, "anion " + imp_head);
  write_table((outdir / "psi.txt").string(), {"z", "potential"}, {f.z, f.phi}, psi_head);

  const bool has_history = !sol.relax.rms_history.empty();
  if (has_history) {
    std::vector<double> sweep(sol.relax.rms_history.size());
    for (std::size_t i = 0; i < sweep.size(); ++i) sweep[i] = static_cast<double>(i + 1);
    write_table((outdir / "residual.txt").string(), {"sweep", "rms"}, {sweep, sol.relax.rms_history},
                "RMS change between successive SOR sweeps");
  }

  ResultsIndex idx;
  idx.config_used = "config_used.ini";
  idx.summary["status"] = to_string(sol.relax.status);
  idx.summary["iterations"] = std::to_string(sol.relax.iterations);
  idx.summary["omega"] = num(sol.relax.omega);
  idx.summary["final_rms"] = num(sol.relax.rms);
  idx.summary["bins"] = std::to_string(sol.grid.n_points());
  idx.summary["kappa_per_m"] = num(sol.scaled.kappa);
  idx.summary["debye_length_nm"] = num(sol.scaled.debye_length_nm());
  idx.summary["dz_hat"] = num(sol.scaled.dz_hat);
  idx.summary["sigma_hat"] = num(sol.scaled.sigma_hat);
  idx.summary["surface_charge_e_per_nm2"] = num(sol.charge.surface_charge);
  idx.summary["ion_charge_e_per_nm2"] = num(sol.charge.ion_charge);
  idx.summary["wall_potential_mV"] = num(sol.wall_potential_mV());

  idx.datasets["psi"] = DatasetMeta{"psi.txt", {"z", "potential"}, "Electrostatic potential [mV]"};
  idx.datasets["dens_pos"] = DatasetMeta{"dens_pos.txt", {"z", "density"}, "Cation density [1/nm^3]"};
  idx.datasets["dens_neg"] = DatasetMeta{"dens_neg.txt", {"z", "density"}, "Anion density [1/nm^3]"};
  idx.datasets["imp_pos"] = DatasetMeta{"imp_pos.txt", {"z", "density"}, "Impurity cation density [1/nm^3]"};
  idx.datasets["imp_neg"] = DatasetMeta{"imp_neg.txt", {"z", "density"}, "Impurity anion density [1/nm^3]"};
  if (has_history) {
    idx.datasets["residual"] = DatasetMeta{"residual.txt", {"sweep", "rms"}, "SOR convergence trace"};
  }

  write_results_json(outdir.string(), idx);
}

} // namespace pbe
