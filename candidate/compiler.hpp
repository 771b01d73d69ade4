#ifndef CANDIDATE_COMPILER_HPP
#define CANDIDATE_COMPILER_HPP

#include <cstdint>
#include <string>

namespace candidate {

struct CompilerOptions {
  // Compiler executable. If empty, c++ is looked up in PATH.
  std::string compiler;
  // Folder that contains candidate/api.hpp.
  std::string include_dir;
  int64_t timeout_millis = 60000;
};

// Turns candidate source files into shared objects that the runner can load.
// The compiler runs in the sandbox, so a pathological source cannot hang the
// caller.
class Compiler {
 public:
  explicit Compiler(CompilerOptions options);

  // Compiles source into the shared object output. Throws load_error carrying
  // the compiler diagnostics on failure, and std::invalid_argument if the
  // timeout is not positive.
  void Compile(const std::string& source, const std::string& output) const;

 private:
  CompilerOptions options_;
};

}  // namespace candidate

#endif
