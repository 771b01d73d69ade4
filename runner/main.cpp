#include <exception>
#include <memory>
#include <string>

#include "candidate/candidate.hpp"
#include "candidate/library.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "proto/evaluation.pb.h"
#include "scoring/grid.hpp"
#include "scoring/result.hpp"
#include "scoring/scoring_function.hpp"
#include "util/file.hpp"

// Usage: uncertainty_runner <request file> <result file>
// Loads the candidate library named in the request and writes its score.
// Problems of the candidate are reported in the result, and the exit status
// is 0 whenever a result could be written.

namespace {

void WriteResult(const std::string& path, const proto::ScoreResult& result) {
  std::string serialized;
  if (!result.SerializeToString(&serialized)) {
    throw std::runtime_error("cannot serialize the result");
  }
  util::File::Write(path, serialized, /*overwrite=*/true);
}

proto::ScoreResult Evaluate(const proto::RunnerRequest& request) {
  const double sentinel = request.scoring().sentinel_score();
  std::shared_ptr<candidate::Library> library;
  std::unique_ptr<candidate::Candidate> bound;
  try {
    library = candidate::Library::Open(request.library());
    bound = library->Bind();
  } catch (candidate::load_error& e) {
    return scoring::ErrorResult(proto::LOAD_FAILURE, e.what(), sentinel);
  }
  VLOG(1) << "Scoring " << request.library() << " through "
          << bound->Describe();

  scoring::Grid grid(request.grid());
  std::unique_ptr<scoring::ScoringFunction> function =
      scoring::ScoringFunction::Create(request.scoring());
  if (!function) {
    return scoring::ErrorResult(
        proto::PROTOCOL,
        "unknown scoring function: " + request.scoring().function(), sentinel);
  }
  proto::ScoreResult result =
      function->Score(*bound, grid, request.source_lines());
  // The candidate must be released before its library is unloaded.
  bound.reset();
  return result;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();
  if (argc != 3) {
    LOG(ERROR) << "Usage: " << argv[0] << " <request file> <result file>";
    return 2;
  }
  const std::string result_path = argv[2];

  proto::RunnerRequest request;
  try {
    if (!request.ParseFromString(util::File::Read(argv[1]))) {
      LOG(ERROR) << "Cannot decode the request " << argv[1];
      return 2;
    }
    WriteResult(result_path, Evaluate(request));
  } catch (std::exception& e) {
    LOG(ERROR) << "Runner failed: " << e.what();
    try {
      WriteResult(result_path,
                  scoring::ErrorResult(proto::CRASH, e.what(),
                                       request.scoring().sentinel_score()));
    } catch (std::exception& inner) {
      LOG(ERROR) << "Cannot write the result: " << inner.what();
    }
    return 1;
  }
  return 0;
}
