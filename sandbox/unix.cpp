#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // Created close-on-exec atomically, so that concurrent forks from other
  // threads do not inherit it.
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 3);
    strncat(buf, err, kStrErrorBufSize);
    ssize_t len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (options_->stdin_file[0]) {
    stdin_fd = open(options_->stdin_file, O_RDONLY | O_CLOEXEC);
    if (stdin_fd == -1) die("open", errno);
  }
  if (options_->stdout_file[0]) {
    stdout_fd =
        open(options_->stdout_file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
             S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (options_->stderr_file[0]) {
    stderr_fd =
        open(options_->stderr_file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
             S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (chdir(options_->root) == -1) {
    die("chdir", errno);
  }

  decltype(options_->args) args = {};
  memcpy(args, options_->args, sizeof(args));
  char* argsp[ExecutionOptions::narg + 1] = {};
  size_t narg = 0;
  for (size_t i = 0; i < ExecutionOptions::narg; i++) {
    if (!args[i][0]) break;
    argsp[narg++] = &args[i][0];
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  if (stdin_fd != -1) {
    DUP(stdin, STDIN_FILENO);
  } else if (close(STDIN_FILENO) == -1) {
    die("close", errno);
  }
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Crashing candidates should not leave core files behind.
  struct rlimit rlim {};
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  execv(options_->executable, argsp);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= static_cast<ssize_t>(sizeof(error))) {
      error_len = sizeof(error) - 1;
    }
    ssize_t got = read(pipe_fds_[0], error, error_len);
    close(pipe_fds_[0]);
    *error_msg = got > 0 ? std::string(error, got) : "child setup failed";
    int child_status = 0;
    waitpid(child_pid_, &child_status, 0);
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // wait4 is used instead of waitpid + getrusage(RUSAGE_CHILDREN) because the
  // latter also accounts for children reaped by other threads.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (!options_->wall_limit_millis ||
         elapsed_millis() < options_->wall_limit_millis) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      kill(-child_pid_, SIGKILL);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    info->timed_out = true;
    VLOG(1) << "Killing process group " << child_pid_ << " after "
            << elapsed_millis() << "ms";
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "kill: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    int ret = 0;
    do {
      ret = wait4(child_pid_, &child_status, 0, &rusage);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->timed_out) {
    info->message = "Wall limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
