#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using ::testing::StartsWith;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/uncertainty_eval_testdir";

// True if pid no longer runs. A killed process that nobody reaped yet is a
// zombie, which counts as dead.
bool IsDead(pid_t pid) {
  if (kill(pid, 0) == -1 && errno == ESRCH) return true;
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string pid_field, comm, state;
  if (!(stat >> pid_field >> comm >> state)) return true;
  return state == "Z";
}

TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("foo", "bar");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "foo");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST(UnixTest, TestReturnArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "return_arg1");
  options.SetArgs({"15"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.timed_out);
  EXPECT_EQ(info.message, "Non-zero return code");
}

TEST(UnixTest, TestSignalArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "signal_arg1");
  options.SetArgs({"6"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.timed_out);
}

TEST(UnixTest, TestWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"0.1"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 500);
  EXPECT_LE(info.cpu_time_millis, 50);
}

TEST(UnixTest, TestBusyWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "busywait_arg1");
  options.SetArgs({"0.1"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 70);
  EXPECT_GE(info.wall_time_millis, 70);
}

TEST(UnixTest, TestWallLimitKillsBusyLoop) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "busywait_arg1");
  options.SetArgs({"-1"});
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.timed_out);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_EQ(info.message, "Wall limit exceeded");
  EXPECT_GE(info.wall_time_millis, 200);
  EXPECT_LE(info.wall_time_millis, 1000);
}

TEST(UnixTest, TestWallLimitKillsProcessGroup) {
  util::File::MakeDirs(test_tmpdir);
  util::TempDir tmp(test_tmpdir);
  const std::string pid_file = util::File::JoinPath(tmp.Path(), "pid");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "spawn_sleeper");
  options.SetArgs({pid_file.c_str()});
  options.wall_limit_millis = 300;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.timed_out);
  pid_t grandchild = atoi(util::File::Read(pid_file).c_str());
  ASSERT_GT(grandchild, 0);
  bool gone = false;
  for (int i = 0; i < 100 && !gone; i++) {
    gone = IsDead(grandchild);
    if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  EXPECT_TRUE(gone);
}

TEST(UnixTest, TestRedirection) {
  util::File::MakeDirs(test_tmpdir);
  util::TempDir tmp(test_tmpdir);
  const std::string out = util::File::JoinPath(tmp.Path(), "out");
  const std::string err = util::File::JoinPath(tmp.Path(), "err");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "echo_args");
  options.SetArgs({"first", "second"});
  ExecutionOptions::stringcpy(options.stdout_file, out);
  ExecutionOptions::stringcpy(options.stderr_file, err);
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Read(out), "first\nsecond\n");
  EXPECT_EQ(util::File::Read(err), "err\n");
}

TEST(UnixTest, TestTooManyArgs) {
  ExecutionOptions options("sandbox/test", "echo_args");
  std::vector<std::string> args(ExecutionOptions::narg, "x");
  EXPECT_THROW(options.SetArgs(args), std::runtime_error);  // NOLINT
}

}  // namespace
