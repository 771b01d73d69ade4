#include "sandbox/isolated_runner.hpp"

#include <dirent.h>

#include <memory>
#include <string>

#include "candidate/compiler.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

const std::string test_tmpdir = "/tmp/uncertainty_eval_testdir";
const double kSentinel = 1e6;

proto::GridConfig Grid() {
  proto::GridConfig grid;
  grid.set_half_width(5);
  grid.set_num_points(512);
  return grid;
}

proto::ScoringConfig Scoring() {
  proto::ScoringConfig scoring;
  scoring.set_function("uncertainty");
  scoring.set_target(0.25);
  scoring.set_sentinel_score(kSentinel);
  scoring.set_norm_floor(1e-15);
  scoring.set_max_amplitude(1e6);
  return scoring;
}

bool IsEmptyDir(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return false;
  int entries = 0;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") entries++;
  }
  closedir(dir);
  return entries == 0;
}

class IsolatedRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::MakeDirs(test_tmpdir);
    tmpdir_.reset(new util::TempDir(test_tmpdir));
  }

  // A runner that uses one of the helper programs instead of the real one.
  sandbox::IsolatedRunner Runner(const std::string& helper) const {
    return sandbox::IsolatedRunner(
        util::File::Absolute("sandbox/test/" + helper), tmpdir_->Path(),
        Grid(), Scoring());
  }

  sandbox::IsolatedRunner RealRunner() const {
    return sandbox::IsolatedRunner(UNCERTAINTY_RUNNER_PATH, tmpdir_->Path(),
                                   Grid(), Scoring());
  }

  std::string CompileCandidate(const std::string& code) const {
    const std::string source =
        util::File::JoinPath(tmpdir_->Path(), "lib/candidate.cpp");
    const std::string library =
        util::File::JoinPath(tmpdir_->Path(), "lib/candidate.so");
    util::File::Write(source, code, /*overwrite=*/true);
    candidate::CompilerOptions options;
    options.include_dir = UNCERTAINTY_SOURCE_DIR;
    candidate::Compiler(options).Compile(source, library);
    return library;
  }

  void ExpectError(const proto::ScoreResult& result, proto::ErrorKind kind) {
    EXPECT_EQ(result.error_kind(), kind);
    EXPECT_EQ(result.combined_score(), kSentinel);
    EXPECT_THAT(result.error_message(), Not(IsEmpty()));
  }

  std::unique_ptr<util::TempDir> tmpdir_;
};

TEST_F(IsolatedRunnerTest, NoResultIsProtocolFailure) {
  proto::ScoreResult result = Runner("no_result").Run("unused.so", 5000, 0);
  ExpectError(result, proto::PROTOCOL);
  EXPECT_EQ(result.error_message(), "no result produced");
}

TEST_F(IsolatedRunnerTest, GarbageResultIsProtocolFailure) {
  proto::ScoreResult result =
      Runner("garbage_result").Run("unused.so", 5000, 0);
  ExpectError(result, proto::PROTOCOL);
}

TEST_F(IsolatedRunnerTest, NonZeroExitIsCrashWithDiagnostics) {
  proto::ScoreResult result = Runner("stderr_crash").Run("unused.so", 5000, 0);
  ExpectError(result, proto::CRASH);
  EXPECT_THAT(result.error_message(), HasSubstr("runner exploded"));
}

TEST_F(IsolatedRunnerTest, SignalIsCrash) {
  proto::ScoreResult result = Runner("signal_arg1").Run("unused.so", 5000, 0);
  ExpectError(result, proto::CRASH);
}

TEST_F(IsolatedRunnerTest, TimeoutIgnoresResultFile) {
  proto::ScoreResult result = Runner("late_result").Run("unused.so", 300, 0);
  ExpectError(result, proto::TIMEOUT);
}

TEST_F(IsolatedRunnerTest, MissingRunnerIsCrash) {
  proto::ScoreResult result =
      Runner("does_not_exist").Run("unused.so", 5000, 0);
  ExpectError(result, proto::CRASH);
  EXPECT_THAT(result.error_message(), HasSubstr("exec"));
}

TEST_F(IsolatedRunnerTest, ScratchIsRemovedOnEveryPath) {
  Runner("no_result").Run("unused.so", 5000, 0);
  Runner("garbage_result").Run("unused.so", 5000, 0);
  Runner("stderr_crash").Run("unused.so", 5000, 0);
  Runner("late_result").Run("unused.so", 200, 0);
  EXPECT_TRUE(IsEmptyDir(tmpdir_->Path()));
}

TEST_F(IsolatedRunnerTest, NonPositiveTimeoutIsProtocolFailure) {
  for (int64_t timeout_millis : {int64_t{0}, int64_t{-1}}) {
    proto::ScoreResult result =
        Runner("busywait_arg1").Run("unused.so", timeout_millis, 0);
    ExpectError(result, proto::PROTOCOL);
    EXPECT_THAT(result.error_message(), HasSubstr("invalid timeout"));
  }
  EXPECT_TRUE(IsEmptyDir(tmpdir_->Path()));
}

TEST_F(IsolatedRunnerTest, ScoresGaussian) {
  std::string library = CompileCandidate(R"(
std::complex<double> wavefunction_at(double x) { return std::exp(-x * x); }
)");
  proto::ScoreResult result = RealRunner().Run(library, 10000, 1);
  ASSERT_EQ(result.error_kind(), proto::SUCCESS) << result.error_message();
  EXPECT_NEAR(result.combined_score(), 0.25, 1e-3);
  EXPECT_TRUE(result.error_message().empty());
}

TEST_F(IsolatedRunnerTest, RelativeScratchDirectory) {
  std::string library = CompileCandidate(R"(
std::complex<double> wavefunction_at(double x) { return std::exp(-x * x); }
)");
  // Tests run from the build folder, so this path stays relative.
  util::File::MakeDirs("relative_runner_scratch");
  util::TempDir relative("relative_runner_scratch");
  sandbox::IsolatedRunner runner(UNCERTAINTY_RUNNER_PATH, relative.Path(),
                                 Grid(), Scoring());
  proto::ScoreResult result = runner.Run(library, 10000, 1);
  ASSERT_EQ(result.error_kind(), proto::SUCCESS) << result.error_message();
  EXPECT_NEAR(result.combined_score(), 0.25, 1e-3);
  EXPECT_TRUE(IsEmptyDir(relative.Path()));
}

TEST_F(IsolatedRunnerTest, MissingLibraryIsLoadFailure) {
  proto::ScoreResult result = RealRunner().Run(
      util::File::JoinPath(tmpdir_->Path(), "missing.so"), 10000, 0);
  ExpectError(result, proto::LOAD_FAILURE);
}

TEST_F(IsolatedRunnerTest, MissingEntryPointIsLoadFailure) {
  std::string library = CompileCandidate("int unrelated() { return 1; }\n");
  proto::ScoreResult result = RealRunner().Run(library, 10000, 0);
  ExpectError(result, proto::LOAD_FAILURE);
  EXPECT_THAT(result.error_message(), HasSubstr("missing required entry"));
}

TEST_F(IsolatedRunnerTest, SegfaultIsCrash) {
  std::string library = CompileCandidate(R"(
std::complex<double> wavefunction_at(double x) {
  volatile int* p = nullptr;
  return *p + x;
}
)");
  proto::ScoreResult result = RealRunner().Run(library, 10000, 0);
  ExpectError(result, proto::CRASH);
}

}  // namespace
