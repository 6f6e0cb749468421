#include <catch2/catch.hpp>

#include <pbe/grid.hpp>
#include <pbe/profile.hpp>
#include <pbe/reconstruct.hpp>
#include <pbe/units.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace pbe;

TEST_CASE("Mirroring doubles the half-domain", "[reconstruct]")
{
  CHECK(mirror({1.0, 2.0, 3.0}) == std::vector<double>{1.0, 2.0, 3.0, 3.0, 2.0, 1.0});
  CHECK(mirror_coordinate({0.0, 0.25, 0.5}) ==
        std::vector<double>{0.0, 0.25, 0.5, 0.5, 0.75, 1.0});
  CHECK(mirror({}).empty());
  CHECK(mirror_coordinate({}).empty());
}

TEST_CASE("Trapezoidal rule", "[reconstruct]")
{
  Grid1D grid(11, 1.0);
  CHECK(trapezoid(grid.z(), grid.z()) == Approx(0.5));
  CHECK(trapezoid(std::vector<double>(11, 2.0), grid.z()) == Approx(2.0));
  CHECK_THROWS_AS(trapezoid({1.0}, grid.z()), std::runtime_error);
}

TEST_CASE("Zero potential gives bulk densities", "[reconstruct]")
{
  PhysicalParameters phys;  // 1 mol/l
  Grid1D grid(5, 0.5);
  ProfileSet prof = ProfileSet::uniform(5, 0.0125);
  const std::vector<double> psi(5, 0.0);

  SECTION("1:1 electrolyte")
  {
    const auto s = nondimensionalize(phys, grid, prof.rho);
    const auto half = half_domain_profiles(s, phys.valency, prof, grid.z(), psi);
    for (std::size_t i = 0; i < 5; ++i) {
      CHECK(half.c_cat[i] == Approx(0.602214076));
      CHECK(half.c_an[i] == Approx(0.602214076));
      CHECK(half.imp_cat[i] == 0.0);
      CHECK(half.phi[i] == 0.0);
    }
    const auto cb = charge_balance(s, phys.valency, half);
    CHECK(cb.ion_charge == Approx(0.0).margin(1e-12));
  }

  SECTION("2:1 electrolyte stays electroneutral")
  {
    phys.valency = IonValencies{2, 1};
    const auto s = nondimensionalize(phys, grid, prof.rho);
    const auto half = half_domain_profiles(s, phys.valency, prof, grid.z(), psi);
    CHECK(half.c_cat[0] == Approx(0.602214076));
    CHECK(half.c_an[0] == Approx(2.0 * 0.602214076));
    const auto cb = charge_balance(s, phys.valency, half);
    CHECK(cb.ion_charge == Approx(0.0).margin(1e-12));
  }

  SECTION("impurities scale with their concentration")
  {
    phys.c_imp = 1e6;  // 1 mmol/l
    const auto s = nondimensionalize(phys, grid, prof.rho);
    const auto half = half_domain_profiles(s, phys.valency, prof, grid.z(), psi);
    CHECK(half.imp_cat[2] == Approx(0.602214076e-3));
    CHECK(half.imp_an[2] == Approx(0.602214076e-3));
  }
}

TEST_CASE("Boltzmann factors and potential units", "[reconstruct]")
{
  PhysicalParameters phys;
  phys.valency = IonValencies{2, 1};
  phys.c_imp = 1e6;
  Grid1D grid(3, 0.5);
  ProfileSet prof = ProfileSet::uniform(3, 0.0125);
  prof.pmf_an = {1.0, 0.0, 0.0};
  prof.pmf_imp_cat = {0.0, 2.0, 0.0};
  const std::vector<double> psi{0.5, 0.1, 0.0};

  const auto s = nondimensionalize(phys, grid, prof.rho);
  const auto half = half_domain_profiles(s, phys.valency, prof, grid.z(), psi);
  const double c0_nm = 0.602214076;

  CHECK(half.c_cat[0] == Approx(c0_nm * std::exp(-1.0)));
  CHECK(half.c_an[0] == Approx(2.0 * c0_nm * std::exp(0.5 - 1.0)));
  CHECK(half.imp_cat[1] == Approx(c0_nm * 1e-3 * std::exp(-0.1 - 2.0)));
  CHECK(half.imp_an[1] == Approx(c0_nm * 1e-3 * std::exp(0.1)));
  CHECK(half.phi[0] == Approx(0.5 * s.psi_to_mV()));
}

TEST_CASE("Reconstruction is a pure function", "[reconstruct]")
{
  PhysicalParameters phys;
  Grid1D grid(20, 0.5);
  ProfileSet prof = ProfileSet::uniform(20, 0.0125);
  std::vector<double> psi(20);
  for (std::size_t i = 0; i < psi.size(); ++i) psi[i] = 1.5 * std::exp(-0.3 * static_cast<double>(i));

  const auto s = nondimensionalize(phys, grid, prof.rho);
  const auto a = reconstruct(s, phys.valency, prof, grid.z(), psi);
  const auto b = reconstruct(s, phys.valency, prof, grid.z(), psi);

  REQUIRE(a.z.size() == 40);
  CHECK(a.z == b.z);
  CHECK(a.phi == b.phi);
  CHECK(a.c_cat == b.c_cat);
  CHECK(a.c_an == b.c_an);
  CHECK(a.imp_cat == b.imp_cat);
  CHECK(a.imp_an == b.imp_an);

  // Mirror halves
  for (std::size_t i = 0; i < 20; ++i) {
    CHECK(a.phi[i] == a.phi[39 - i]);
    CHECK(a.c_an[i] == a.c_an[39 - i]);
  }
  CHECK(a.z[20] == Approx(0.5));
  CHECK(a.z[39] == Approx(1.0));
}

TEST_CASE("Reconstruction rejects mismatched arrays", "[reconstruct]")
{
  PhysicalParameters phys;
  Grid1D grid(4, 0.5);
  ProfileSet prof = ProfileSet::uniform(4, 0.0125);
  const auto s = nondimensionalize(phys, grid, prof.rho);
  CHECK_THROWS_AS(reconstruct(s, phys.valency, prof, grid.z(), std::vector<double>(3, 0.0)),
                  std::runtime_error);
}
