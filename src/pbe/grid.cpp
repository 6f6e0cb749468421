#include <pbe/grid.hpp>

#include <stdexcept>

namespace pbe {

Grid1D::Grid1D(std::size_t n_points, double length)
    : n_points_(n_points), length_(length) {
  if (n_points_ < 2) {
    throw std::runtime_error("Grid1D: need at least 2 points");
  }
  if (!(length_ > 0.0)) {
    throw std::runtime_error("Grid1D: length must be positive");
  }
  dz_ = length_ / static_cast<double>(n_points_ - 1);

  z_.resize(n_points_);
  for (std::size_t i = 0; i < n_points_; ++i) {
    z_[i] = dz_ * static_cast<double>(i);
  }
  // Pin the last node exactly on the midplane.
  z_.back() = length_;
}

} // namespace pbe
