#ifndef EVALUATOR_CONFIG_HPP
#define EVALUATOR_CONFIG_HPP

#include <string>

#include "evaluator/evaluator.hpp"
#include "proto/evaluation.pb.h"

namespace evaluator {

// Builds the options from the command line flags. Throws
// std::invalid_argument if a flag has an unrecognized value, if a timeout is
// not positive, or if the file named by --scoring_config cannot be parsed.
// The temporary directory is made absolute.
EvaluatorOptions OptionsFromFlags();

// Case-insensitive parsing of the enum names, e.g. "simpson" or "SIMPSON".
proto::IntegrationRule ParseIntegrationRule(const std::string& name);
proto::SpectralScaling ParseSpectralScaling(const std::string& name);
proto::Objective ParseObjective(const std::string& name);

// Merges a text-format ScoringConfig on top of config.
void MergeScoringConfig(const std::string& text, proto::ScoringConfig* config);

// The runner executable: the one named by --runner_path, otherwise
// uncertainty_runner next to the current executable, otherwise the one in
// PATH. Empty if none can be found.
std::string FindRunner();

}  // namespace evaluator

#endif
