#ifndef SCORING_UNCERTAINTY_HPP
#define SCORING_UNCERTAINTY_HPP

#include <complex>
#include <string>
#include <vector>

#include "scoring/scoring_function.hpp"

namespace scoring {

// Scores a wavefunction by the product of its position variance and of the
// variance of its spectral density, which is bounded below by 1/4 for the
// angular-frequency transform. Registered as "uncertainty".
class UncertaintyScorer : public ScoringFunction {
 public:
  explicit UncertaintyScorer(proto::ScoringConfig config)
      : config_(std::move(config)) {}
  static ScoringFunction* Create(const proto::ScoringConfig& config) {
    return new UncertaintyScorer(config);
  }

  proto::ScoreResult Score(const candidate::Candidate& candidate,
                           const Grid& grid,
                           uint32_t source_lines) const override;

  // Integral of |psi''|^2, using the central second difference.
  static double SmoothnessEnergy(const std::vector<std::complex<double>>& psi,
                                 const Grid& grid);

 private:
  proto::ScoreResult Reject(const std::string& message) const;
  proto::ScoreResult ScoreSamples(std::vector<std::complex<double>> values,
                                  const Grid& grid,
                                  uint32_t source_lines) const;
  double Cap(double variance) const;

  proto::ScoringConfig config_;
};

}  // namespace scoring

#endif
