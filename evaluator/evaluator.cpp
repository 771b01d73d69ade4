#include "evaluator/evaluator.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "candidate/candidate.hpp"
#include "extractor/extractor.hpp"
#include "glog/logging.h"
#include "sandbox/isolated_runner.hpp"
#include "scoring/result.hpp"
#include "util/file.hpp"

namespace evaluator {

namespace {

// Thrown while preparing a candidate whose text contains no code.
class extraction_error : public std::runtime_error {
 public:
  explicit extraction_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

}  // namespace

uint32_t CountSourceLines(const std::string& code) {
  uint32_t lines = 0;
  for (absl::string_view line : absl::StrSplit(code, '\n')) {
    if (!absl::StripAsciiWhitespace(line).empty()) lines++;
  }
  return lines;
}

proto::ScoreResult Evaluator::Evaluate(const CandidateInput& input,
                                       int64_t timeout_millis) const {
  const auto start = std::chrono::steady_clock::now();
  const double sentinel = options_.scoring.sentinel_score();
  std::string provenance;
  proto::ScoreResult result;
  try {
    if (timeout_millis <= 0) {
      throw std::invalid_argument("invalid timeout: " +
                                  std::to_string(timeout_millis) + "ms");
    }
    const std::string base = util::File::Absolute(options_.temp_directory);
    util::File::MakeDirs(base);
    util::TempDir scratch(base);
    result = EvaluateIn(scratch.Path(), input, timeout_millis, &provenance);
  } catch (extraction_error& e) {
    result = scoring::ErrorResult(proto::EXTRACTION_FAILURE, e.what(),
                                  sentinel);
  } catch (candidate::load_error& e) {
    result = scoring::ErrorResult(proto::LOAD_FAILURE, e.what(), sentinel);
  } catch (std::exception& e) {
    LOG(ERROR) << "Evaluation aborted: " << e.what();
    result = scoring::ErrorResult(
        proto::PROTOCOL, std::string("harness failure: ") + e.what(),
        sentinel);
  }
  result.set_provenance(provenance);
  result.set_wall_time_seconds(
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
          .count());
  scoring::FinalizeResult(sentinel, &result);
  VLOG(1) << provenance << ": " << proto::ErrorKind_Name(result.error_kind())
          << " score " << result.combined_score();
  return result;
}

proto::ScoreResult Evaluator::EvaluateIn(const std::string& scratch,
                                         const CandidateInput& input,
                                         int64_t timeout_millis,
                                         std::string* provenance) const {
  Prepared prepared;
  if (const SourceText* text = absl::get_if<SourceText>(&input)) {
    prepared = FromText(scratch, *text, provenance);
  } else if (const SourcePath* path = absl::get_if<SourcePath>(&input)) {
    prepared = FromPath(scratch, *path, provenance);
  } else {
    const auto& library =
        absl::get<std::shared_ptr<const candidate::Library>>(input);
    if (!library) throw candidate::load_error("null library handle");
    prepared = FromLibrary(*library, provenance);
  }
  sandbox::IsolatedRunner runner(options_.runner_path, scratch, options_.grid,
                                 options_.scoring);
  return runner.Run(prepared.library, timeout_millis, prepared.source_lines);
}

Evaluator::Prepared Evaluator::FromText(const std::string& scratch,
                                        const SourceText& input,
                                        std::string* provenance) const {
  extractor::ExtractedSource extracted = extractor::Extract(input.text);
  *provenance =
      std::string("text:") + extractor::StrategyName(extracted.strategy);
  if (extracted.code.empty()) {
    throw extraction_error("no code found in the candidate text");
  }
  const std::string source = util::File::JoinPath(scratch, "candidate.cpp");
  util::File::Write(source, extracted.code);
  return Compile(scratch, source, extracted.code);
}

Evaluator::Prepared Evaluator::FromPath(const std::string& scratch,
                                        const SourcePath& input,
                                        std::string* provenance) const {
  *provenance = "path:" + input.path;
  if (util::File::Size(input.path) < 0) {
    throw candidate::load_error("candidate file not found: " + input.path);
  }
  if (absl::EndsWith(input.path, ".so")) {
    return Prepared{util::File::Absolute(input.path), 0};
  }
  return Compile(scratch, input.path, util::File::Read(input.path));
}

Evaluator::Prepared Evaluator::FromLibrary(const candidate::Library& library,
                                           std::string* provenance) const {
  *provenance = "library:" + library.Path();
  absl::optional<std::string> backing = library.BackingPath();
  if (!backing) {
    throw candidate::load_error("cannot locate the file backing " +
                                library.Path());
  }
  if (util::File::Size(*backing) < 0) {
    throw candidate::load_error("library is no longer on disk: " + *backing);
  }
  return Prepared{*backing, 0};
}

Evaluator::Prepared Evaluator::Compile(const std::string& scratch,
                                       const std::string& source,
                                       const std::string& code) const {
  const std::string library = util::File::JoinPath(scratch, "candidate.so");
  candidate::Compiler(options_.compiler).Compile(source, library);
  return Prepared{library, CountSourceLines(code)};
}

}  // namespace evaluator
