#pragma once

#include <cstddef>
#include <vector>

namespace pbe {

// Uniform node grid on the half-domain [0, length].
// Node 0 sits on the charged wall, node n_points-1 on the midplane.
class Grid1D {
public:
  Grid1D() = default;
  Grid1D(std::size_t n_points, double length);

  std::size_t n_points() const { return n_points_; }
  double length() const { return length_; }
  double dz() const { return dz_; }

  // Node positions z_i (size n_points), z_0 = 0 and z_{n-1} = length.
  const std::vector<double>& z() const { return z_; }

private:
  std::size_t n_points_ = 0;
  double length_ = 0.0;
  double dz_ = 0.0;
  std::vector<double> z_;
};

} // namespace pbe
