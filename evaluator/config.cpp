#include "evaluator/config.hpp"

#include <limits.h>
#include <unistd.h>

#include <stdexcept>

#include "absl/strings/ascii.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

#ifndef UNCERTAINTY_SOURCE_DIR
#define UNCERTAINTY_SOURCE_DIR ""
#endif

namespace evaluator {

namespace {
static const constexpr char* kRunnerName = "uncertainty_runner";

template <typename Enum, typename ParseFn>
Enum ParseEnum(const std::string& kind, const std::string& name,
               ParseFn parse) {
  Enum value;
  if (!parse(absl::AsciiStrToUpper(name), &value)) {
    throw std::invalid_argument("unknown " + kind + ": " + name);
  }
  return value;
}

bool IsExecutable(const std::string& path) {
  return access(path.c_str(), X_OK) == 0;
}
}  // namespace

proto::IntegrationRule ParseIntegrationRule(const std::string& name) {
  return ParseEnum<proto::IntegrationRule>("integration rule", name,
                                           &proto::IntegrationRule_Parse);
}

proto::SpectralScaling ParseSpectralScaling(const std::string& name) {
  return ParseEnum<proto::SpectralScaling>("spectral scaling", name,
                                           &proto::SpectralScaling_Parse);
}

proto::Objective ParseObjective(const std::string& name) {
  return ParseEnum<proto::Objective>("objective", name,
                                     &proto::Objective_Parse);
}

void MergeScoringConfig(const std::string& text,
                        proto::ScoringConfig* config) {
  if (!google::protobuf::TextFormat::MergeFromString(text, config)) {
    throw std::invalid_argument("malformed scoring configuration");
  }
}

std::string FindRunner() {
  if (!FLAGS_runner_path.empty()) return FLAGS_runner_path;
  char buf[PATH_MAX] = {};
  ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (len > 0) {
    std::string sibling = util::File::JoinPath(
        util::File::BaseDir(std::string(buf, len)), kRunnerName);
    if (IsExecutable(sibling)) return sibling;
  }
  return util::which(kRunnerName);
}

EvaluatorOptions OptionsFromFlags() {
  EvaluatorOptions options;
  options.runner_path = FindRunner();
  options.temp_directory = util::File::Absolute(FLAGS_temp_directory);
  if (FLAGS_timeout_millis <= 0) {
    throw std::invalid_argument("timeout_millis must be positive");
  }
  options.timeout_millis = FLAGS_timeout_millis;
  if (FLAGS_compile_timeout_millis <= 0) {
    throw std::invalid_argument("compile_timeout_millis must be positive");
  }

  options.compiler.compiler = FLAGS_compiler;
  options.compiler.include_dir = FLAGS_candidate_include_dir.empty()
                                     ? UNCERTAINTY_SOURCE_DIR
                                     : FLAGS_candidate_include_dir;
  options.compiler.timeout_millis = FLAGS_compile_timeout_millis;

  options.grid.set_half_width(FLAGS_grid_half_width);
  if (FLAGS_grid_points < 0) {
    throw std::invalid_argument("negative grid_points");
  }
  options.grid.set_num_points(FLAGS_grid_points);

  proto::ScoringConfig& scoring = options.scoring;
  scoring.set_function(FLAGS_scoring_function);
  scoring.set_integration(ParseIntegrationRule(FLAGS_integration));
  scoring.set_spectral_scaling(ParseSpectralScaling(FLAGS_spectral_scaling));
  scoring.set_objective(ParseObjective(FLAGS_objective));
  scoring.set_target(FLAGS_target);
  scoring.set_bound_weight(FLAGS_bound_weight);
  scoring.set_sentinel_score(FLAGS_sentinel_score);
  scoring.set_norm_floor(FLAGS_norm_floor);
  scoring.set_max_amplitude(FLAGS_max_amplitude);
  scoring.set_variance_cap(FLAGS_variance_cap);
  scoring.set_complexity_weight(FLAGS_complexity_weight);
  scoring.set_smoothness_weight(FLAGS_smoothness_weight);
  if (!FLAGS_scoring_config.empty()) {
    MergeScoringConfig(util::File::Read(FLAGS_scoring_config), &scoring);
  }
  return options;
}

}  // namespace evaluator
