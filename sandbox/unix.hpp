#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The child runs in its own session, so that
// a timeout can kill everything it spawned.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, possibly killing it if it exceeds
  // the provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace sandbox
#endif
