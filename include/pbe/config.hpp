#pragma once

#include <pbe/types.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace pbe {

// Parsed INI as section->(key->value).
using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

struct ProfileSources {
  ProfileSource inv_eps = ProfileSource::from_constant(1.0 / 80.0);
  ProfileSource rho = ProfileSource::from_constant(0.0);          // [e/nm^3]
  ProfileSource pmf_cat = ProfileSource::from_constant(0.0);      // [kT]
  ProfileSource pmf_an = ProfileSource::from_constant(0.0);       // [kT]
  ProfileSource pmf_imp_cat = ProfileSource::from_constant(0.0);  // [kT], impurity counter-ion
  ProfileSource pmf_imp_an = ProfileSource::from_constant(0.0);   // [kT], impurity co-ion
};

struct PbeConfig {
  // [general]
  std::string output_dir = "out";
  int omp_threads = 0;        // 0 => leave as-is
  bool verbose = false;

  // [system] + [electrolyte]
  PhysicalParameters phys;
  std::size_t bins = 100;

  // [profiles]
  ProfileSources profiles;

  // [solver]
  double tol = 1e-10;
  double omega = 0.0;                 // 0 => 2/(1+sqrt(pi/N))
  long max_iter = 10000000;           // 0 => no cap
  bool fail_on_nonconvergence = false;

  // [verify]
  bool verify = true;
  double charge_rel_tol = 0.05;

  IniMap ini_raw;
};

IniMap parse_ini_file(const std::string& path);
PbeConfig config_from_ini(const IniMap& ini);
PbeConfig load_config(const std::string& ini_path);

// "1" -> {1,1}; "2 1" or "2,1" -> {2,1}. Throws on more than two entries.
IonValencies parse_valencies(const std::string& text);

// Number => constant profile, anything else => file path.
ProfileSource parse_profile_source(const std::string& text);

} // namespace pbe
