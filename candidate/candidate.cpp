#include "candidate/candidate.hpp"

namespace candidate {

std::vector<std::complex<double>> PointwiseCandidate::Evaluate(
    const std::vector<double>& positions) const {
  std::vector<std::complex<double>> values;
  values.reserve(positions.size());
  for (double x : positions) values.push_back(fn_(x));
  return values;
}

}  // namespace candidate
