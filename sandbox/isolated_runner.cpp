#include "sandbox/isolated_runner.hpp"

#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "scoring/result.hpp"
#include "util/file.hpp"

namespace sandbox {

namespace {
static const constexpr char* kRequestFile = "request.pb";
static const constexpr char* kResultFile = "result.pb";
static const constexpr size_t kMaxStderrBytes = 4096;
}  // namespace

IsolatedRunner::IsolatedRunner(std::string runner_path,
                               std::string temp_directory,
                               proto::GridConfig grid,
                               proto::ScoringConfig scoring)
    : runner_path_(std::move(runner_path)),
      temp_directory_(std::move(temp_directory)),
      grid_(std::move(grid)),
      scoring_(std::move(scoring)) {}

proto::ScoreResult IsolatedRunner::Error(proto::ErrorKind kind,
                                         const std::string& message) const {
  return scoring::ErrorResult(kind, message, scoring_.sentinel_score());
}

proto::ScoreResult IsolatedRunner::Run(const std::string& library,
                                       int64_t timeout_millis,
                                       uint32_t source_lines) const {
  // A zero wall limit would let the runner run forever.
  if (timeout_millis <= 0) {
    return Error(proto::PROTOCOL, "invalid timeout: " +
                                      std::to_string(timeout_millis) + "ms");
  }
  // The runner is started inside the scratch folder, so every path handed to
  // it must be absolute.
  util::TempDir tmp(util::File::Absolute(temp_directory_));
  const std::string request_path =
      util::File::JoinPath(tmp.Path(), kRequestFile);
  const std::string result_path = util::File::JoinPath(tmp.Path(), kResultFile);
  const std::string stderr_path = util::File::JoinPath(tmp.Path(), "stderr");

  proto::RunnerRequest request;
  request.set_library(util::File::Absolute(library));
  *request.mutable_grid() = grid_;
  *request.mutable_scoring() = scoring_;
  request.set_source_lines(source_lines);
  std::string serialized;
  if (!request.SerializeToString(&serialized)) {
    return Error(proto::PROTOCOL, "cannot serialize the runner request");
  }
  util::File::Write(request_path, serialized);

  ExecutionOptions options(tmp.Path(), runner_path_);
  options.SetArgs({request_path.c_str(), result_path.c_str()});
  options.wall_limit_millis = timeout_millis;
  ExecutionOptions::stringcpy(options.stdout_file,
                              util::File::JoinPath(tmp.Path(), "stdout"));
  ExecutionOptions::stringcpy(options.stderr_file, stderr_path);

  std::unique_ptr<Sandbox> sb = Sandbox::Create();
  if (!sb) return Error(proto::CRASH, "no sandbox available");
  ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(options, &info, &error_msg)) {
    return Error(proto::CRASH, "cannot start the runner: " + error_msg);
  }
  VLOG(1) << "Runner for " << library << " finished in "
          << info.wall_time_millis << "ms, status " << info.status_code
          << ", signal " << info.signal;

  // Whatever a killed runner may have written is not trusted.
  if (info.timed_out) {
    return Error(proto::TIMEOUT, "timed out after " +
                                     std::to_string(timeout_millis) + "ms");
  }
  if (info.signal != 0 || info.status_code != 0) {
    std::string message = info.message;
    std::string diagnostics = util::File::Tail(stderr_path, kMaxStderrBytes);
    if (!diagnostics.empty()) message += ": " + diagnostics;
    return Error(proto::CRASH, message);
  }
  if (util::File::Size(result_path) < 0) {
    return Error(proto::PROTOCOL, "no result produced");
  }
  proto::ScoreResult result;
  if (!result.ParseFromString(util::File::Read(result_path))) {
    return Error(proto::PROTOCOL, "cannot decode the result");
  }
  scoring::FinalizeResult(scoring_.sentinel_score(), &result);
  return result;
}

}  // namespace sandbox
