#include "util/flags.hpp"

DEFINE_int64(timeout_millis, 10000,
             "Wall clock limit for the isolated evaluation of a candidate");
DEFINE_int64(compile_timeout_millis, 60000,
             "Wall clock limit for the compilation of a candidate");
DEFINE_string(temp_directory, "/tmp/uncertainty_eval",
              "Where the per-evaluation scratch directories should be created");
DEFINE_string(runner_path, "",
              "Path of the uncertainty_runner executable. If unset, look next "
              "to the current executable and then in PATH");
DEFINE_string(compiler, "", "C++ compiler for candidates. If unset, use c++");
DEFINE_string(candidate_include_dir, "",
              "Folder containing candidate/api.hpp. If unset, use the folder "
              "the project was configured from");

DEFINE_double(grid_half_width, 5.0, "Positions span [-L, L]");
DEFINE_int32(grid_points, 512, "Number of position samples");

DEFINE_string(scoring_function, "uncertainty",
              "Name of the registered scoring function");
DEFINE_string(scoring_config, "",
              "Text-format ScoringConfig merged on top of the scoring flags");
DEFINE_string(integration, "trapezoid", "One of rectangle, trapezoid, simpson");
DEFINE_string(spectral_scaling, "unitary", "One of unitary, raw");
DEFINE_string(objective, "product", "One of product, bound_distance");
DEFINE_double(target, 0.25, "Theoretical lower bound of the product");
DEFINE_double(bound_weight, 0.0,
              "Weight of the distance from the bound in the product objective");
DEFINE_double(sentinel_score, 1e6, "Score assigned to unusable candidates");
DEFINE_double(norm_floor, 1e-15, "Smallest acceptable squared norm");
DEFINE_double(max_amplitude, 1e6,
              "Largest acceptable sample magnitude, non-positive to disable");
DEFINE_double(variance_cap, 0.0,
              "Upper clamp for each variance, non-positive to disable");
DEFINE_double(complexity_weight, 0.0, "Weight of the source size penalty");
DEFINE_double(smoothness_weight, 0.0,
              "Weight of the second derivative energy penalty");
