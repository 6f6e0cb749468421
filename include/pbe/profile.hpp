#pragma once

#include <pbe/config.hpp>
#include <pbe/grid.hpp>
#include <pbe/types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace pbe {

// Per-point input profiles on the half-domain grid. All have one entry per node.
struct ProfileSet {
  std::vector<double> inv_eps;      // inverse relative permittivity, > 0
  std::vector<double> rho;          // fixed external charge [e/nm^3] (rescaled later)
  std::vector<double> pmf_cat;      // [kT]
  std::vector<double> pmf_an;       // [kT]
  std::vector<double> pmf_imp_cat;  // [kT]
  std::vector<double> pmf_imp_an;   // [kT]

  // Uniform profiles: inverse permittivity inv_eps, everything else zero.
  static ProfileSet uniform(std::size_t n, double inv_eps);

  std::size_t size() const { return inv_eps.size(); }

  // Throws unless every profile has exactly n entries.
  void validate(std::size_t n) const;
};

// Expand a source into n values; file profiles must hold exactly n entries.
std::vector<double> load_profile(const ProfileSource& src, std::size_t n, const std::string& name);

ProfileSet load_profiles(const ProfileSources& sources, const Grid1D& grid);

} // namespace pbe
