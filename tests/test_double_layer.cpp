#include <catch2/catch.hpp>

#include "test_util.hpp"

#include <pbe/config.hpp>
#include <pbe/double_layer.hpp>
#include <pbe/grid.hpp>
#include <pbe/profile.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace pbe;

namespace {

PbeConfig plate_config(std::size_t bins, double distance, double sigma, double c0) {
  PbeConfig cfg;
  cfg.bins = bins;
  cfg.phys.distance = distance;
  cfg.phys.sigma = sigma;
  cfg.phys.c0 = c0;
  return cfg;
}

std::size_t count_data_lines(const std::string& path) {
  std::ifstream in(path);
  std::string line;
  std::size_t n = 0;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] != '#') ++n;
  }
  return n;
}

} // namespace

TEST_CASE("Ions screen the wall charge in the half-domain", "[double_layer]")
{
  // N = 100, D = 1 nm, sigma = 0.1 e/nm^2, c0 = 0.1 mol/l, uniform permittivity
  PbeConfig cfg = plate_config(100, 1.0, 0.1, 0.1);
  Grid1D grid(cfg.bins, 0.5 * cfg.phys.distance);

  auto sol = solve_double_layer(cfg, grid, ProfileSet::uniform(cfg.bins, 1.0 / 80.0));

  REQUIRE(sol.relax.converged());
  CHECK(sol.charge.surface_charge == Approx(0.1));
  CHECK(sol.charge.ion_charge == Approx(-0.1).epsilon(0.01));
  CHECK(sol.wall_potential_mV() > 0.0);

  // Counter-ions accumulate at the wall, co-ions are depleted.
  CHECK(sol.half.c_an.front() > sol.half.c_an.back());
  CHECK(sol.half.c_cat.front() < sol.half.c_cat.back());
}

TEST_CASE("Asymmetric electrolyte with impurities still balances the wall charge", "[double_layer]")
{
  PbeConfig cfg = plate_config(100, 1.0, 0.1, 0.1);
  cfg.phys.valency = IonValencies{2, 1};
  cfg.phys.c_imp = 1e6;
  Grid1D grid(cfg.bins, 0.5 * cfg.phys.distance);

  auto sol = solve_double_layer(cfg, grid, ProfileSet::uniform(cfg.bins, 1.0 / 80.0));

  REQUIRE(sol.relax.converged());
  CHECK(sol.scaled.val_max == 2);
  CHECK(sol.charge.ion_charge == Approx(-0.1).epsilon(0.01));
  CHECK(sol.half.imp_an.front() > sol.half.imp_an.back());
}

TEST_CASE("Uncharged plates give a flat zero potential", "[double_layer]")
{
  PbeConfig cfg = plate_config(64, 2.0, 0.0, 0.5);
  Grid1D grid(cfg.bins, 0.5 * cfg.phys.distance);

  ProfileSet prof = ProfileSet::uniform(cfg.bins, 1.0 / 80.0);
  for (std::size_t i = 0; i < cfg.bins; ++i) {
    prof.inv_eps[i] = 0.0125 + 0.05 * std::exp(-0.2 * static_cast<double>(i));
  }
  auto sol = solve_double_layer(cfg, grid, prof);

  REQUIRE(sol.relax.converged());
  for (double v : sol.full.phi) CHECK(v == 0.0);
  CHECK(sol.charge.ion_charge == Approx(0.0).margin(1e-12));
  CHECK(sol.profiles.inv_eps == prof.inv_eps);
}

TEST_CASE("Full-domain output is mirrored about the midplane", "[double_layer]")
{
  PbeConfig cfg = plate_config(50, 3.0, -0.05, 0.2);
  Grid1D grid(cfg.bins, 0.5 * cfg.phys.distance);
  ProfileSet prof = ProfileSet::uniform(cfg.bins, 1.0 / 80.0);
  for (std::size_t i = 0; i < cfg.bins; ++i) prof.pmf_cat[i] = 0.5 * std::exp(-static_cast<double>(i));

  auto sol = solve_double_layer(cfg, grid, prof);

  REQUIRE(sol.full.z.size() == 100);
  CHECK(sol.full.z.front() == 0.0);
  CHECK(sol.full.z.back() == Approx(3.0));
  for (std::size_t i = 0; i < 50; ++i) {
    CHECK(sol.full.phi[i] == sol.full.phi[99 - i]);
    CHECK(sol.full.c_cat[i] == sol.full.c_cat[99 - i]);
  }
  CHECK(sol.wall_potential_mV() < 0.0);
}

TEST_CASE("Solve rejects a grid that does not match the configured bins", "[double_layer]")
{
  PbeConfig cfg = plate_config(100, 1.0, 0.1, 0.1);
  Grid1D grid(50, 0.5);
  CHECK_THROWS_AS(solve_double_layer(cfg, grid, ProfileSet::uniform(50, 0.0125)), std::runtime_error);
}

TEST_CASE("Output files carry headers and the full domain", "[double_layer][io]")
{
  pbe_test::TempDir tmp("outputs");
  PbeConfig cfg = plate_config(30, 1.0, 0.1, 0.1);
  cfg.output_dir = tmp.str();
  cfg.verbose = true;  // records the residual trace
  Grid1D grid(cfg.bins, 0.5 * cfg.phys.distance);

  auto sol = solve_double_layer(cfg, grid, ProfileSet::uniform(cfg.bins, 1.0 / 80.0));
  write_double_layer_outputs(cfg, sol);

  for (const char* name : {"psi.txt", "dens_pos.txt", "dens_neg.txt", "imp_pos.txt", "imp_neg.txt"}) {
    const std::string path = tmp.file(name);
    REQUIRE(std::filesystem::exists(path));
    CHECK(count_data_lines(path) == 60);
  }
  CHECK(std::filesystem::exists(tmp.file("residual.txt")));
  CHECK(count_data_lines(tmp.file("residual.txt")) == static_cast<std::size_t>(sol.relax.iterations));
  CHECK(std::filesystem::exists(tmp.file("results.json")));

  std::ifstream psi(tmp.file("psi.txt"));
  std::string first;
  std::getline(psi, first);
  CHECK(first.rfind("# electrostatic potential for l_debye = ", 0) == 0);

  std::ifstream pos(tmp.file("dens_pos.txt"));
  std::getline(pos, first);
  CHECK(first == "# cation density for bulk concentration c_0 = 0.10 mol/l");
}
