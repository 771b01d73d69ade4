#include "scoring/grid.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace scoring {

Grid::Grid(const proto::GridConfig& config)
    : half_width_(config.half_width()) {
  const size_t n = config.num_points();
  if (n < 3) {
    throw std::invalid_argument("grid needs at least 3 points, got " +
                                std::to_string(n));
  }
  if (!std::isfinite(half_width_) || half_width_ <= 0) {
    throw std::invalid_argument("grid half width must be positive");
  }
  dx_ = 2 * half_width_ / (n - 1);
  dxi_ = 2 * M_PI / (n * dx_);

  positions_.resize(n);
  for (size_t i = 0; i < n; i++) positions_[i] = -half_width_ + i * dx_;
  // Make the grid exactly symmetric.
  positions_.back() = half_width_;

  // Same ordering as fftshift(fftfreq(n, dx)) * 2 pi.
  frequencies_.resize(n);
  const long long first = -static_cast<long long>(n / 2);
  for (size_t i = 0; i < n; i++) {
    frequencies_[i] = (first + static_cast<long long>(i)) * dxi_;
  }
}

}  // namespace scoring
