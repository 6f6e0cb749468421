#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace pbe {

struct IonValencies {
  int cation = 1;
  int anion = 1;

  // Largest valency; used to normalize kappa, rho_hat and psi.
  int max() const { return std::max(cation, anion); }
};

// A profile is either a constant over the whole domain or a file on disk.
struct ProfileSource {
  std::optional<double> constant;
  std::string path;

  static ProfileSource from_constant(double v) { return ProfileSource{v, ""}; }
  static ProfileSource from_file(std::string p) { return ProfileSource{std::nullopt, std::move(p)}; }

  bool is_constant() const { return constant.has_value(); }
  std::string describe() const;
};

// Physical inputs of one run, in the units users quote them in.
struct PhysicalParameters {
  double T = 300.0;          // [K]
  double distance = 1.0;     // plate separation D [nm]
  double sigma = 0.0;        // surface charge [e/nm^2]
  double c0 = 1.0;           // bulk concentration [mol/L]
  double c_imp = 0.0;        // impurity concentration [nmol/L]
  IonValencies valency;
};

} // namespace pbe
