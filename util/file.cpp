#include "util/file.hpp"

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <memory>
#include <sstream>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
#ifdef __APPLE__
  *tmp = path + ".";
  do {
    *tmp += 'a' + rand() % 26;
    int fd = open(tmp->c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);
    if (fd == -1 && errno == EEXIST) continue;
    return fd;
  } while (true);
#else
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp->c_str()), &free};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
#endif
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  return remove(src.c_str()) != -1 ? 0 : errno;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  int error = OsAtomicMove(temp_file, path, overwrite);
  if (error != 0) remove(temp_file.c_str());
  return error;
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) throw file_not_found("Read " + path);
  std::stringstream buffer;
  buffer << fin.rdbuf();
  if (fin.bad()) {
    throw std::system_error(EIO, std::system_category(), "Read " + path);
  }
  return buffer.str();
}

std::string File::Tail(const std::string& path, size_t max_bytes) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return "";
  std::streamoff size = fin.tellg();
  std::streamoff start = 0;
  if (size > static_cast<std::streamoff>(max_bytes)) start = size - max_bytes;
  fin.seekg(start);
  std::string data(static_cast<size_t>(size - start), '\0');
  fin.read(&data[0], data.size());
  data.resize(static_cast<size_t>(fin.gcount()));
  return data;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) throw file_exists("Write " + path);
  int err = OsWrite(path, contents, overwrite);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

std::string File::Absolute(const std::string& path) {
  if (!path.empty() && strchr(kPathSeparators, path[0])) return path;
  char buf[PATH_MAX] = {};
  if (getcwd(buf, sizeof(buf)) == nullptr) {
    throw std::system_error(errno, std::system_category(), "getcwd");
  }
  return JoinPath(buf, path);
}

TempDir::TempDir(const std::string& base) {
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
}

TempDir::TempDir(TempDir&& other) noexcept
    : path_(std::move(other.path_)), keep_(other.keep_) {
  other.keep_ = true;
}

void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Unable to remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
