#ifndef SCORING_INTEGRATE_HPP
#define SCORING_INTEGRATE_HPP

#include <vector>

#include "proto/evaluation.pb.h"

namespace scoring {

// Integrates samples taken at equally spaced points.
double Integrate(const std::vector<double>& values, double spacing,
                 proto::IntegrationRule rule);

}  // namespace scoring

#endif
