#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Harness flags
DECLARE_int64(timeout_millis);
DECLARE_int64(compile_timeout_millis);
DECLARE_string(temp_directory);
DECLARE_string(runner_path);
DECLARE_string(compiler);
DECLARE_string(candidate_include_dir);

// Grid flags
DECLARE_double(grid_half_width);
DECLARE_int32(grid_points);

// Scoring flags
DECLARE_string(scoring_function);
DECLARE_string(scoring_config);
DECLARE_string(integration);
DECLARE_string(spectral_scaling);
DECLARE_string(objective);
DECLARE_double(target);
DECLARE_double(bound_weight);
DECLARE_double(sentinel_score);
DECLARE_double(norm_floor);
DECLARE_double(max_amplitude);
DECLARE_double(variance_cap);
DECLARE_double(complexity_weight);
DECLARE_double(smoothness_weight);

#endif
