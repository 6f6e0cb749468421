#include <catch2/catch.hpp>

#include <pbe/initial_guess.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace pbe;

TEST_CASE("Gouy-Chapman seed uses the average permittivity", "[initial_guess]")
{
  const std::vector<double> zz{0.0, 0.5, 1.0, 2.0};

  SECTION("uniform inverse permittivity")
  {
    const auto psi = gouy_chapman_guess(2.0, std::vector<double>(4, 0.5), zz);
    REQUIRE(psi.size() == 4);
    CHECK(psi[0] == Approx(1.0));
    for (std::size_t i = 0; i < zz.size(); ++i) {
      CHECK(psi[i] == Approx(std::exp(-zz[i])));
    }
  }

  SECTION("varying inverse permittivity enters through its mean")
  {
    const auto psi = gouy_chapman_guess(1.0, {0.1, 0.2, 0.3, 0.4}, zz);
    CHECK(psi[0] == Approx(0.25));
    CHECK(psi[3] == Approx(0.25 * std::exp(-2.0)));
  }

  SECTION("zero surface charge gives a zero seed")
  {
    const auto psi = gouy_chapman_guess(0.0, std::vector<double>(4, 0.0125), zz);
    for (double p : psi) CHECK(p == 0.0);
  }
}

TEST_CASE("Gouy-Chapman seed rejects mismatched inputs", "[initial_guess]")
{
  CHECK_THROWS_AS(gouy_chapman_guess(1.0, {0.5, 0.5}, {0.0, 1.0, 2.0}), std::runtime_error);
  CHECK_THROWS_AS(gouy_chapman_guess(1.0, {}, {}), std::runtime_error);
}
