#ifndef SCORING_GRID_HPP
#define SCORING_GRID_HPP

#include <vector>

#include "proto/evaluation.pb.h"

namespace scoring {

// Sampling of the position domain [-L, L] and of the frequency domain implied
// by a DFT of the same size. Frequencies are angular and stored in centred
// (shifted) order, i.e. from the most negative to the most positive.
class Grid {
 public:
  // Throws std::invalid_argument if the configuration cannot describe a grid.
  explicit Grid(const proto::GridConfig& config);

  size_t Size() const { return positions_.size(); }
  double HalfWidth() const { return half_width_; }
  const std::vector<double>& Positions() const { return positions_; }
  const std::vector<double>& Frequencies() const { return frequencies_; }
  double PositionStep() const { return dx_; }
  double FrequencyStep() const { return dxi_; }

 private:
  double half_width_;
  double dx_;
  double dxi_;
  std::vector<double> positions_;
  std::vector<double> frequencies_;
};

}  // namespace scoring

#endif
