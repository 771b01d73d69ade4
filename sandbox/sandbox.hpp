#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <cstring>
#include <functional>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox. All the strings are stored
// in fixed-size buffers, so that the child process never has to allocate
// between fork and exec.
struct ExecutionOptions {
  static const constexpr size_t str_len = 1024;
  static const constexpr size_t narg = 24;

  // Optional values
  int64_t wall_limit_millis = 0;

  char stdin_file[str_len] = {};
  char stdout_file[str_len] = {};
  char stderr_file[str_len] = {};
  char args[narg][str_len] = {};

  // Required values
  char root[str_len] = {};
  char executable[str_len] = {};
  ExecutionOptions(const std::string& root_, const std::string& executable_) {
    stringcpy(root, root_);
    stringcpy(executable, executable_);
    strncpy(&args[0][0], executable, str_len);
  }
  template <typename T>
  void SetArgs(const T& a_) {
    size_t i = 1;
    for (const std::string& s : a_) {
      if (i >= narg) throw std::runtime_error("Too many arguments");
      stringcpy(&args[i++][0], s);
    }
  }
  void SetArgs(const std::initializer_list<const char*>& a_) {
    size_t i = 1;
    for (const char* s : a_) {
      if (i >= narg) throw std::runtime_error("Too many arguments");
      stringcpy(&args[i++][0], s);
    }
  }

  static void stringcpy(char* dst, const std::string& s) {
    if (s.size() >= str_len) throw std::runtime_error("string too long");
    strncpy(dst, s.c_str(), str_len - 1);
  }
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was killed because it exceeded the wall limit.
  bool timed_out = false;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that sandbox is: negative if the sandbox
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // A single instance must not be used from more than one thread at a time.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    return ExecuteInternal(options, info, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
