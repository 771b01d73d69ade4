#ifndef EVALUATOR_EVALUATOR_HPP
#define EVALUATOR_EVALUATOR_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "absl/types/variant.h"
#include "candidate/compiler.hpp"
#include "candidate/library.hpp"
#include "proto/evaluation.pb.h"

namespace evaluator {

// Free-form text containing candidate source code, possibly wrapped in prose
// or markdown.
struct SourceText {
  std::string text;
};

// A candidate source file, or an already compiled shared object (.so).
struct SourcePath {
  std::string path;
};

using CandidateInput =
    absl::variant<SourceText, SourcePath,
                  std::shared_ptr<const candidate::Library>>;

struct EvaluatorOptions {
  // The uncertainty_runner executable.
  std::string runner_path;
  // Per-call scratch folders are created inside this folder.
  std::string temp_directory = "/tmp/uncertainty_eval";
  int64_t timeout_millis = 10000;
  candidate::CompilerOptions compiler;
  proto::GridConfig grid;
  proto::ScoringConfig scoring;
};

// Entry point of the harness: turns any candidate input into a scored
// result. Candidates never run in the calling process.
class Evaluator {
 public:
  explicit Evaluator(EvaluatorOptions options) : options_(std::move(options)) {}

  // Never throws. The result always satisfies the result invariant, carries
  // the provenance of the candidate and the wall time of the whole call.
  // A non-positive timeout is a PROTOCOL failure. Safe to call concurrently.
  proto::ScoreResult Evaluate(const CandidateInput& input) const {
    return Evaluate(input, options_.timeout_millis);
  }
  proto::ScoreResult Evaluate(const CandidateInput& input,
                              int64_t timeout_millis) const;

  const EvaluatorOptions& Options() const { return options_; }

 private:
  // A shared object ready to be handed to the runner.
  struct Prepared {
    std::string library;
    uint32_t source_lines = 0;
  };

  proto::ScoreResult EvaluateIn(const std::string& scratch,
                                const CandidateInput& input,
                                int64_t timeout_millis,
                                std::string* provenance) const;
  Prepared FromText(const std::string& scratch, const SourceText& input,
                    std::string* provenance) const;
  Prepared FromPath(const std::string& scratch, const SourcePath& input,
                    std::string* provenance) const;
  Prepared FromLibrary(const candidate::Library& library,
                       std::string* provenance) const;
  Prepared Compile(const std::string& scratch, const std::string& source,
                   const std::string& code) const;

  EvaluatorOptions options_;
};

// Number of lines that contain something other than whitespace.
uint32_t CountSourceLines(const std::string& code);

}  // namespace evaluator

#endif
