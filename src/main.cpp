#include <pbe/config.hpp>
#include <pbe/double_layer.hpp>
#include <pbe/grid.hpp>
#include <pbe/io.hpp>
#include <pbe/profile.hpp>
#include <pbe/verify.hpp>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef PBE_HAS_OPENMP
#include <omp.h>
#endif

namespace {

void print_usage() {
  std::cout << "pbe_solver: Poisson-Boltzmann double layer between two charged plates\n"
            << "Usage:\n"
            << "  pbe_solver --config <path/to/config.ini> [-v|--verbose] [-o|--out <dir>]\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    const auto start = std::chrono::steady_clock::now();

    std::string cfg_path;
    std::string out_override;
    bool verbose_flag = false;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc) {
        cfg_path = argv[++i];
      } else if ((a == "-o" || a == "--out") && i + 1 < argc) {
        out_override = argv[++i];
      } else if (a == "-v" || a == "--verbose") {
        verbose_flag = true;
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
      }
    }
    if (cfg_path.empty()) {
      print_usage();
      return 2;
    }

    pbe::PbeConfig cfg = pbe::load_config(cfg_path);
    if (!out_override.empty()) cfg.output_dir = out_override;
    if (verbose_flag) cfg.verbose = true;

#ifdef PBE_HAS_OPENMP
    if (cfg.omp_threads > 0) {
      omp_set_num_threads(cfg.omp_threads);
    }
#endif

    // Create output root, copy config
    pbe::ensure_dir(cfg.output_dir);
    pbe::copy_file(cfg_path, (std::filesystem::path(cfg.output_dir) / "config_used.ini").string());

    if (cfg.verbose) {
      const auto& ps = cfg.profiles;
      std::cout << "[config] eps=" << ps.inv_eps.describe() << " rho=" << ps.rho.describe()
                << " pmf_cat=" << ps.pmf_cat.describe() << " pmf_an=" << ps.pmf_an.describe()
                << " pmf_imp_cat=" << ps.pmf_imp_cat.describe()
                << " pmf_imp_an=" << ps.pmf_imp_an.describe() << "\n";
    }

    pbe::Grid1D grid(cfg.bins, 0.5 * cfg.phys.distance);
    pbe::ProfileSet profiles = pbe::load_profiles(cfg.profiles, grid);

    auto sol = pbe::solve_double_layer(cfg, grid, std::move(profiles));
    pbe::write_double_layer_outputs(cfg, sol);

    std::cout << "[solve] " << pbe::to_string(sol.relax.status)
              << " after " << sol.relax.iterations << " sweeps"
              << " (omega=" << sol.relax.omega << ", rms=" << sol.relax.rms << ")\n";

    if (cfg.verbose) {
      const auto& hist = sol.relax.rms_history;
      const std::size_t stride = hist.size() > 20 ? hist.size() / 20 : 1;
      for (std::size_t k = 0; k < hist.size(); k += stride) {
        std::cout << "[solve] sweep " << (k + 1) << " rms " << hist[k] << "\n";
      }
      std::cout << std::fixed << std::setprecision(5)
                << "Surface charge: " << sol.charge.surface_charge << " e/nm^2\n"
                << "Excess System charge: " << sol.charge.ion_charge << " e/nm^2\n"
                << std::defaultfloat;
    }

    if (cfg.verify) {
      auto rep = pbe::verify_double_layer(cfg, sol);
      std::cout << "[verify] charge balance: ions " << rep.ion_charge
                << " vs surface " << rep.surface_charge
                << " rel_err=" << rep.charge_rel_error
                << " (ok=" << (rep.charge_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] flux residual: wall " << rep.wall_flux_residual
                << " bulk " << rep.bulk_flux_residual
                << " (ok=" << (rep.flux_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] mirror symmetry (ok=" << (rep.symmetry_ok ? "true" : "false") << ")\n";
    }

    if (!sol.relax.converged()) {
      std::cerr << "WARNING: relaxation did not converge (" << pbe::to_string(sol.relax.status)
                << "); results are the last iterate\n";
      if (cfg.fail_on_nonconvergence) return 3;
    }

    std::cout << "Done. Output in: " << cfg.output_dir << "\n";
    if (cfg.verbose) {
      const std::chrono::duration<double> dt = std::chrono::steady_clock::now() - start;
      std::cout << "Time: " << std::fixed << std::setprecision(3) << dt.count() << " s\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
