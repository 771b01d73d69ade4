#include "scoring/uncertainty.hpp"

#include <cmath>
#include <sstream>

#include "glog/logging.h"
#include "scoring/integrate.hpp"
#include "scoring/result.hpp"
#include "scoring/spectral.hpp"

namespace scoring {

namespace {

std::vector<double> SquaredMagnitude(
    const std::vector<std::complex<double>>& values) {
  std::vector<double> density(values.size());
  for (size_t i = 0; i < values.size(); i++) density[i] = std::norm(values[i]);
  return density;
}

// Second moment of a density sampled on points.
double SecondMoment(const std::vector<double>& points,
                    const std::vector<double>& density, double spacing,
                    proto::IntegrationRule rule) {
  std::vector<double> weighted(points.size());
  for (size_t i = 0; i < points.size(); i++) {
    weighted[i] = points[i] * points[i] * density[i];
  }
  return Integrate(weighted, spacing, rule);
}

// A regularizer that cannot be evaluated contributes nothing.
double Penalty(const char* name, double value) {
  if (std::isfinite(value)) return value;
  LOG(WARNING) << "Ignoring non-finite " << name << " penalty";
  return 0;
}

}  // namespace

proto::ScoreResult UncertaintyScorer::Reject(const std::string& message) const {
  VLOG(1) << "Rejecting candidate: " << message;
  return ErrorResult(proto::EVALUATION, message, config_.sentinel_score());
}

double UncertaintyScorer::Cap(double variance) const {
  if (config_.variance_cap() > 0 && variance > config_.variance_cap()) {
    return config_.variance_cap();
  }
  return variance;
}

double UncertaintyScorer::SmoothnessEnergy(
    const std::vector<std::complex<double>>& psi, const Grid& grid) {
  const double dx = grid.PositionStep();
  double energy = 0;
  for (size_t i = 1; i + 1 < psi.size(); i++) {
    energy += std::norm(psi[i + 1] - 2.0 * psi[i] + psi[i - 1]);
  }
  return energy / (dx * dx * dx);
}

proto::ScoreResult UncertaintyScorer::Score(
    const candidate::Candidate& candidate, const Grid& grid,
    uint32_t source_lines) const {
  std::vector<std::complex<double>> values;
  try {
    values = candidate.Evaluate(grid.Positions());
  } catch (const std::exception& exc) {
    return Reject(std::string("candidate raised: ") + exc.what());
  } catch (...) {
    return Reject("candidate raised a non-standard exception");
  }
  try {
    return ScoreSamples(std::move(values), grid, source_lines);
  } catch (const std::exception& exc) {
    return Reject(std::string("scoring failed: ") + exc.what());
  }
}

proto::ScoreResult UncertaintyScorer::ScoreSamples(
    std::vector<std::complex<double>> values, const Grid& grid,
    uint32_t source_lines) const {
  const proto::IntegrationRule rule = config_.integration();

  // Every check must happen before the values are used in any arithmetic.
  if (values.size() != grid.Size()) {
    std::ostringstream msg;
    msg << "shape mismatch: expected " << grid.Size() << " values, got "
        << values.size();
    return Reject(msg.str());
  }
  for (size_t i = 0; i < values.size(); i++) {
    if (!std::isfinite(values[i].real()) || !std::isfinite(values[i].imag())) {
      std::ostringstream msg;
      msg << "non-finite value at x=" << grid.Positions()[i];
      return Reject(msg.str());
    }
    if (config_.max_amplitude() > 0 &&
        std::abs(values[i]) > config_.max_amplitude()) {
      std::ostringstream msg;
      msg << "amplitude exceeds " << config_.max_amplitude()
          << " at x=" << grid.Positions()[i];
      return Reject(msg.str());
    }
  }
  std::vector<double> density = SquaredMagnitude(values);
  const double norm = Integrate(density, grid.PositionStep(), rule);
  if (!std::isfinite(norm) || norm <= config_.norm_floor()) {
    return Reject("near-zero norm");
  }

  const double scale = 1 / std::sqrt(norm);
  for (auto& value : values) value *= scale;
  for (double& d : density) d /= norm;

  proto::ScoreResult result;
  result.set_normalized_norm(Integrate(density, grid.PositionStep(), rule));
  const double position_variance = Cap(
      SecondMoment(grid.Positions(), density, grid.PositionStep(), rule));

  std::vector<double> spectral_density = SquaredMagnitude(
      SpectralTransform(values, grid, config_.spectral_scaling()));
  const double spectral_norm =
      Integrate(spectral_density, grid.FrequencyStep(), rule);
  if (!std::isfinite(spectral_norm) || spectral_norm <= config_.norm_floor()) {
    return Reject("near-zero spectral norm");
  }
  result.set_spectral_norm(spectral_norm);
  for (double& d : spectral_density) d /= spectral_norm;
  const double frequency_variance =
      Cap(SecondMoment(grid.Frequencies(), spectral_density,
                       grid.FrequencyStep(), rule));

  const double product = position_variance * frequency_variance;
  const double bound_distance = std::abs(product - config_.target());
  double score = 0;
  switch (config_.objective()) {
    case proto::PRODUCT:
      score = product;
      if (config_.bound_weight() != 0) {
        score += config_.bound_weight() * bound_distance;
      }
      break;
    case proto::BOUND_DISTANCE:
      score = bound_distance;
      break;
    default:
      return Reject("unknown objective " +
                    proto::Objective_Name(config_.objective()));
  }

  double complexity_penalty = 0;
  if (config_.complexity_weight() != 0) {
    complexity_penalty =
        Penalty("complexity", config_.complexity_weight() *
                                  std::log2(1.0 + source_lines));
  }
  double smoothness_penalty = 0;
  if (config_.smoothness_weight() != 0) {
    smoothness_penalty =
        Penalty("smoothness",
                config_.smoothness_weight() * SmoothnessEnergy(values, grid));
  }

  result.set_error_kind(proto::SUCCESS);
  result.set_combined_score(score + complexity_penalty + smoothness_penalty);
  result.set_position_variance(position_variance);
  result.set_frequency_variance(frequency_variance);
  result.set_uncertainty_product(product);
  result.set_bound_distance(bound_distance);
  result.set_complexity_penalty(complexity_penalty);
  result.set_smoothness_penalty(smoothness_penalty);
  FinalizeResult(config_.sentinel_score(), &result);
  return result;
}

namespace {
ScoringFunction::Register<UncertaintyScorer> r("uncertainty");  // NOLINT
}  // namespace

}  // namespace scoring
