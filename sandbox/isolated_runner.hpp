#ifndef SANDBOX_ISOLATED_RUNNER_HPP
#define SANDBOX_ISOLATED_RUNNER_HPP

#include <cstdint>
#include <string>

#include "proto/evaluation.pb.h"

namespace sandbox {

// Scores a compiled candidate in a separate process. The runner executable
// is started as "<runner> <request file> <result file>": it must read the
// serialized RunnerRequest, and write a serialized ScoreResult before exiting
// with status 0.
class IsolatedRunner {
 public:
  IsolatedRunner(std::string runner_path, std::string temp_directory,
                 proto::GridConfig grid, proto::ScoringConfig scoring);

  // Never throws for problems of the candidate: timeouts, crashes and
  // malformed results are all reported as results. The request and result
  // files are removed before returning. A non-positive timeout is reported as
  // a PROTOCOL failure without starting the runner.
  proto::ScoreResult Run(const std::string& library, int64_t timeout_millis,
                         uint32_t source_lines) const;

 private:
  proto::ScoreResult Error(proto::ErrorKind kind,
                           const std::string& message) const;

  std::string runner_path_;
  std::string temp_directory_;
  proto::GridConfig grid_;
  proto::ScoringConfig scoring_;
};

}  // namespace sandbox

#endif
