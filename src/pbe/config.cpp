#include <pbe/config.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace pbe {

namespace {

std::string trim(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  std::size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool parse_bool(const std::string& key, const std::string& v) {
  std::string x = to_lower(trim(v));
  if (x == "1" || x == "true" || x == "yes" || x == "on") return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  throw std::runtime_error(key + ": invalid boolean '" + v + "'");
}

std::optional<double> try_parse_double(const std::string& v) {
  std::string x = trim(v);
  if (x.empty()) return std::nullopt;
  char* end = nullptr;
  double out = std::strtod(x.c_str(), &end);
  if (end == x.c_str() || *end != '\0') return std::nullopt;
  return out;
}

double parse_double(const std::string& key, const std::string& v) {
  auto d = try_parse_double(v);
  if (!d) throw std::runtime_error(key + ": invalid number '" + v + "'");
  return *d;
}

long parse_long(const std::string& key, const std::string& v) {
  std::string x = trim(v);
  char* end = nullptr;
  long out = std::strtol(x.c_str(), &end, 10);
  if (x.empty() || *end != '\0') {
    // accept integral floating notation such as 1e6
    double d = parse_double(key, v);
    if (d != static_cast<double>(static_cast<long>(d))) {
      throw std::runtime_error(key + ": expected an integer, got '" + v + "'");
    }
    return static_cast<long>(d);
  }
  return out;
}

std::optional<std::string> get_str_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto sit = ini.find(sec);
  if (sit == ini.end()) return std::nullopt;
  auto kit = sit->second.find(key);
  if (kit == sit->second.end()) return std::nullopt;
  return trim(kit->second);
}

std::string get_str(const IniMap& ini, const std::string& sec, const std::string& key,
                    const std::string& def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? *v : def;
}

double get_double(const IniMap& ini, const std::string& sec, const std::string& key, double def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_double("[" + sec + "] " + key, *v) : def;
}

long get_long(const IniMap& ini, const std::string& sec, const std::string& key, long def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_long("[" + sec + "] " + key, *v) : def;
}

bool get_bool(const IniMap& ini, const std::string& sec, const std::string& key, bool def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_bool("[" + sec + "] " + key, *v) : def;
}

ProfileSource get_profile(const IniMap& ini, const std::string& key, const ProfileSource& def) {
  auto v = get_str_opt(ini, "profiles", key);
  if (!v) return def;
  if (v->empty()) throw std::runtime_error("[profiles] " + key + ": empty value");
  return parse_profile_source(*v);
}

} // namespace

IonValencies parse_valencies(const std::string& text) {
  std::string s = text;
  std::replace(s.begin(), s.end(), ',', ' ');
  std::stringstream ss(s);

  std::vector<int> vals;
  std::string tok;
  while (ss >> tok) {
    long v = parse_long("valency", tok);
    if (v < 1) throw std::runtime_error("valency: entries must be positive integers, got '" + tok + "'");
    vals.push_back(static_cast<int>(v));
  }

  if (vals.empty()) throw std::runtime_error("valency: empty list");
  if (vals.size() > 2) {
    throw std::runtime_error("valency: list can only have two entries [val_cation, val_anion]");
  }

  IonValencies out;
  out.cation = vals[0];
  out.anion = (vals.size() == 2) ? vals[1] : vals[0];
  return out;
}

ProfileSource parse_profile_source(const std::string& text) {
  std::string x = trim(text);
  if (auto d = try_parse_double(x)) return ProfileSource::from_constant(*d);

  // Allow fractions such as "1/80"; a path only passes if both halves are numbers.
  auto slash = x.find('/');
  if (slash != std::string::npos && x.find('/', slash + 1) == std::string::npos) {
    auto num = try_parse_double(x.substr(0, slash));
    auto den = try_parse_double(x.substr(slash + 1));
    if (num && den) {
      if (*den == 0.0) throw std::runtime_error("profile constant '" + x + "' divides by zero");
      return ProfileSource::from_constant(*num / *den);
    }
  }
  return ProfileSource::from_file(x);
}

IniMap parse_ini_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Cannot open config INI: " + path);
  }

  IniMap ini;
  std::string current = "general"; // default if no section
  ini[current] = IniSection{};

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;

    // Strip comments (# or ;)
    auto cut = line.find_first_of("#;");
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) continue;

    if (line.front() == '[' && line.back() == ']') {
      current = trim(line.substr(1, line.size() - 2));
      if (current.empty()) {
        throw std::runtime_error("INI parse error: empty section at line " + std::to_string(lineno));
      }
      ini[current];
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("INI parse error: expected key=value at line " + std::to_string(lineno));
    }
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) {
      throw std::runtime_error("INI parse error: empty key at line " + std::to_string(lineno));
    }
    ini[current][key] = val;
  }

  return ini;
}

PbeConfig config_from_ini(const IniMap& ini) {
  PbeConfig cfg;
  cfg.ini_raw = ini;

  // general
  cfg.output_dir = get_str(ini, "general", "output_dir", cfg.output_dir);
  cfg.omp_threads = static_cast<int>(get_long(ini, "general", "omp_threads", cfg.omp_threads));
  cfg.verbose = get_bool(ini, "general", "verbose", cfg.verbose);

  // system
  cfg.phys.distance = get_double(ini, "system", "distance", cfg.phys.distance);
  long bins = get_long(ini, "system", "bins", static_cast<long>(cfg.bins));
  if (bins < 2) throw std::runtime_error("[system] bins must be >= 2");
  cfg.bins = static_cast<std::size_t>(bins);
  cfg.phys.T = get_double(ini, "system", "temperature", cfg.phys.T);
  cfg.phys.sigma = get_double(ini, "system", "sigma", cfg.phys.sigma);

  // electrolyte
  if (auto v = get_str_opt(ini, "electrolyte", "valency")) {
    cfg.phys.valency = parse_valencies(*v);
  }
  cfg.phys.c0 = get_double(ini, "electrolyte", "c0", cfg.phys.c0);
  cfg.phys.c_imp = get_double(ini, "electrolyte", "c_imp", cfg.phys.c_imp);

  // profiles
  cfg.profiles.inv_eps = get_profile(ini, "eps", cfg.profiles.inv_eps);
  cfg.profiles.rho = get_profile(ini, "rho", cfg.profiles.rho);
  cfg.profiles.pmf_cat = get_profile(ini, "pmf_cat", cfg.profiles.pmf_cat);
  cfg.profiles.pmf_an = get_profile(ini, "pmf_an", cfg.profiles.pmf_an);
  cfg.profiles.pmf_imp_cat = get_profile(ini, "pmf_imp_cat", cfg.profiles.pmf_imp_cat);
  cfg.profiles.pmf_imp_an = get_profile(ini, "pmf_imp_an", cfg.profiles.pmf_imp_an);

  // solver
  cfg.tol = get_double(ini, "solver", "tol", cfg.tol);
  cfg.omega = get_double(ini, "solver", "omega", cfg.omega);
  cfg.max_iter = get_long(ini, "solver", "max_iter", cfg.max_iter);
  cfg.fail_on_nonconvergence =
      get_bool(ini, "solver", "fail_on_nonconvergence", cfg.fail_on_nonconvergence);

  // verify
  cfg.verify = get_bool(ini, "verify", "enabled", cfg.verify);
  cfg.charge_rel_tol = get_double(ini, "verify", "charge_rel_tol", cfg.charge_rel_tol);

  // basic sanity
  if (!(cfg.phys.T > 0.0)) throw std::runtime_error("[system] temperature must be positive");
  if (!(cfg.phys.distance > 0.0)) throw std::runtime_error("[system] distance must be positive");
  if (!(cfg.phys.c0 > 0.0)) throw std::runtime_error("[electrolyte] c0 must be positive");
  if (cfg.phys.c_imp < 0.0) throw std::runtime_error("[electrolyte] c_imp must be >= 0");
  if (!(cfg.tol > 0.0)) throw std::runtime_error("[solver] tol must be positive");
  if (cfg.omega != 0.0 && !(cfg.omega > 0.0 && cfg.omega < 2.0)) {
    throw std::runtime_error("[solver] omega must be in (0,2), or 0 for the default");
  }
  if (cfg.max_iter < 0) throw std::runtime_error("[solver] max_iter must be >= 0");
  if (!(cfg.charge_rel_tol > 0.0)) throw std::runtime_error("[verify] charge_rel_tol must be positive");
  if (cfg.phys.valency.cation < 1 || cfg.phys.valency.anion < 1) {
    throw std::runtime_error("[electrolyte] valencies must be >= 1");
  }

  return cfg;
}

PbeConfig load_config(const std::string& ini_path) {
  return config_from_ini(parse_ini_file(ini_path));
}

} // namespace pbe
