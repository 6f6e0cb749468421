#include <pbe/profile.hpp>

#include <pbe/io.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace pbe {

namespace {

void require_length(const std::vector<double>& v, std::size_t n, const std::string& name) {
  if (v.size() != n) {
    throw std::runtime_error("Profile '" + name + "' has " + std::to_string(v.size()) +
                             " entries, expected " + std::to_string(n) +
                             " (must match the number of bins)");
  }
}

} // namespace

std::string ProfileSource::describe() const {
  if (constant) {
    std::ostringstream os;
    os << *constant;
    return os.str();
  }
  return path;
}

ProfileSet ProfileSet::uniform(std::size_t n, double inv_eps) {
  ProfileSet p;
  p.inv_eps.assign(n, inv_eps);
  p.rho.assign(n, 0.0);
  p.pmf_cat.assign(n, 0.0);
  p.pmf_an.assign(n, 0.0);
  p.pmf_imp_cat.assign(n, 0.0);
  p.pmf_imp_an.assign(n, 0.0);
  return p;
}

void ProfileSet::validate(std::size_t n) const {
  require_length(inv_eps, n, "eps");
  require_length(rho, n, "rho");
  require_length(pmf_cat, n, "pmf_cat");
  require_length(pmf_an, n, "pmf_an");
  require_length(pmf_imp_cat, n, "pmf_imp_cat");
  require_length(pmf_imp_an, n, "pmf_imp_an");
}

std::vector<double> load_profile(const ProfileSource& src, std::size_t n, const std::string& name) {
  if (src.is_constant()) {
    return std::vector<double>(n, *src.constant);
  }
  if (src.path.empty()) {
    throw std::runtime_error("Profile '" + name + "' has neither a constant nor a file");
  }
  std::vector<double> v = read_profile_column(src.path);
  if (v.size() != n) {
    throw std::runtime_error("Supplied profile '" + name + "' does not have the same length as the "
                             "discretization vector (" + std::to_string(v.size()) + " vs " +
                             std::to_string(n) + "): " + src.path);
  }
  return v;
}

ProfileSet load_profiles(const ProfileSources& sources, const Grid1D& grid) {
  const std::size_t n = grid.n_points();

  ProfileSet p;
  p.inv_eps = load_profile(sources.inv_eps, n, "eps");
  p.rho = load_profile(sources.rho, n, "rho");
  p.pmf_cat = load_profile(sources.pmf_cat, n, "pmf_cat");
  p.pmf_an = load_profile(sources.pmf_an, n, "pmf_an");
  p.pmf_imp_cat = load_profile(sources.pmf_imp_cat, n, "pmf_imp_cat");
  p.pmf_imp_an = load_profile(sources.pmf_imp_an, n, "pmf_imp_an");

  // The stencils divide by the inverse permittivity.
  for (std::size_t i = 0; i < n; ++i) {
    if (!(p.inv_eps[i] > 0.0) || !std::isfinite(p.inv_eps[i])) {
      throw std::runtime_error("Profile 'eps' must be finite and strictly positive (entry " +
                               std::to_string(i) + ")");
    }
  }
  return p;
}

} // namespace pbe
