#include "candidate/compiler.hpp"

#include <stdexcept>
#include <vector>

#include "candidate/candidate.hpp"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace candidate {

namespace {
static const constexpr size_t kMaxDiagnosticsBytes = 4096;
}  // namespace

Compiler::Compiler(CompilerOptions options) : options_(std::move(options)) {
  if (options_.compiler.empty()) options_.compiler = util::which("c++");
}

void Compiler::Compile(const std::string& source,
                       const std::string& output) const {
  if (options_.compiler.empty()) {
    throw load_error("Cannot compile " + source + ": compiler not found");
  }
  if (options_.timeout_millis <= 0) {
    throw std::invalid_argument("compile timeout must be positive");
  }
  const std::string source_path = util::File::Absolute(source);
  const std::string output_path = util::File::Absolute(output);
  const std::string work_dir = util::File::BaseDir(output_path);
  const std::string stderr_path =
      util::File::JoinPath(work_dir, "compile.stderr");

  std::vector<std::string> args = {"-O2", "-std=c++14", "-shared", "-fPIC",
                                   "-w"};
  if (!options_.include_dir.empty()) {
    args.push_back("-I" + options_.include_dir);
  }
  args.insert(args.end(), {"-include", "candidate/api.hpp", "-o", output_path,
                           source_path});

  sandbox::ExecutionOptions exec_options(work_dir, options_.compiler);
  exec_options.SetArgs(args);
  exec_options.wall_limit_millis = options_.timeout_millis;
  sandbox::ExecutionOptions::stringcpy(exec_options.stderr_file, stderr_path);
  sandbox::ExecutionOptions::stringcpy(
      exec_options.stdout_file,
      util::File::JoinPath(work_dir, "compile.stdout"));

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw load_error("Cannot compile " + source + ": no sandbox");
  sandbox::ExecutionInfo info;
  std::string error_msg;
  VLOG(1) << "Compiling " << source_path << " into " << output_path;
  if (!sb->Execute(exec_options, &info, &error_msg)) {
    throw load_error("Cannot run the compiler: " + error_msg);
  }
  if (info.timed_out) {
    throw load_error("Compilation of " + source + " timed out after " +
                     std::to_string(info.wall_time_millis) + "ms");
  }
  if (info.signal != 0 || info.status_code != 0) {
    throw load_error("Compilation failed (" + info.message + "):\n" +
                     util::File::Tail(stderr_path, kMaxDiagnosticsBytes));
  }
}

}  // namespace candidate
