#include <pbe/reconstruct.hpp>

#include <cmath>
#include <stdexcept>

namespace pbe {

std::vector<double> mirror(const std::vector<double>& x) {
  std::vector<double> out;
  out.reserve(2 * x.size());
  out.insert(out.end(), x.begin(), x.end());
  out.insert(out.end(), x.rbegin(), x.rend());
  return out;
}

std::vector<double> mirror_coordinate(const std::vector<double>& z) {
  if (z.empty()) return {};
  const double z_max = z.back();
  std::vector<double> out;
  out.reserve(2 * z.size());
  out.insert(out.end(), z.begin(), z.end());
  for (double zi : z) out.push_back(zi + z_max);
  return out;
}

double trapezoid(const std::vector<double>& f, const std::vector<double>& z) {
  if (f.size() != z.size()) throw std::runtime_error("trapezoid: size mismatch");
  double s = 0.0;
  for (std::size_t i = 1; i < z.size(); ++i) {
    s += 0.5 * (f[i] + f[i - 1]) * (z[i] - z[i - 1]);
  }
  return s;
}

PhysicalProfiles half_domain_profiles(const ScaledSystem& s,
                                      const IonValencies& val,
                                      const ProfileSet& profiles,
                                      const std::vector<double>& z_nm,
                                      const std::vector<double>& psi) {
  const std::size_t n = psi.size();
  if (z_nm.size() != n) throw std::runtime_error("reconstruct: z/psi length mismatch");
  profiles.validate(n);

  // bulk densities [1/nm^3]
  const double zmax = static_cast<double>(s.val_max);
  const double c_cat0 = 1e-27 * s.c0 * zmax / static_cast<double>(val.cation);
  const double c_an0 = 1e-27 * s.c0 * zmax / static_cast<double>(val.anion);
  const double c_imp0 = 1e-27 * s.c_imp * s.c0 * zmax;
  const double to_mV = s.psi_to_mV();

  PhysicalProfiles h;
  h.z = z_nm;
  h.phi.resize(n);
  h.c_cat.resize(n);
  h.c_an.resize(n);
  h.imp_cat.resize(n);
  h.imp_an.resize(n);

  const long nn = static_cast<long>(n);
#pragma omp parallel for
  for (long k = 0; k < nn; ++k) {
    const std::size_t i = static_cast<std::size_t>(k);
    h.phi[i] = to_mV * psi[i];
    h.c_cat[i] = c_cat0 * std::exp(-val.cation * psi[i] - profiles.pmf_cat[i]);
    h.c_an[i] = c_an0 * std::exp(val.anion * psi[i] - profiles.pmf_an[i]);
    h.imp_cat[i] = c_imp0 * std::exp(-psi[i] - profiles.pmf_imp_cat[i]);
    h.imp_an[i] = c_imp0 * std::exp(psi[i] - profiles.pmf_imp_an[i]);
  }
  return h;
}

PhysicalProfiles reconstruct(const ScaledSystem& s,
                             const IonValencies& val,
                             const ProfileSet& profiles,
                             const std::vector<double>& z_nm,
                             const std::vector<double>& psi) {
  PhysicalProfiles h = half_domain_profiles(s, val, profiles, z_nm, psi);

  PhysicalProfiles full;
  full.z = mirror_coordinate(h.z);
  full.phi = mirror(h.phi);
  full.c_cat = mirror(h.c_cat);
  full.c_an = mirror(h.c_an);
  full.imp_cat = mirror(h.imp_cat);
  full.imp_an = mirror(h.imp_an);
  return full;
}

ChargeBalance charge_balance(const ScaledSystem& s,
                             const IonValencies& val,
                             const PhysicalProfiles& half) {
  const std::size_t n = half.z.size();
  if (half.c_cat.size() != n || half.c_an.size() != n ||
      half.imp_cat.size() != n || half.imp_an.size() != n) {
    throw std::runtime_error("charge_balance: profile length mismatch");
  }
  std::vector<double> q(n);
  for (std::size_t i = 0; i < n; ++i) {
    q[i] = val.cation * half.c_cat[i] - val.anion * half.c_an[i] + half.imp_cat[i] - half.imp_an[i];
  }

  ChargeBalance cb;
  cb.ion_charge = trapezoid(q, half.z);
  cb.surface_charge = s.sigma_to_e_per_nm2();
  return cb;
}

} // namespace pbe
