#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Reads the whole file specified by path. Throws file_not_found if the file
  // does not exist.
  static std::string Read(const std::string& path);

  // Reads at most max_bytes from the end of the file. Returns an empty string
  // if the file cannot be read.
  static std::string Tail(const std::string& path, size_t max_bytes);

  // Writes contents to path. The data is first written to a temporary file in
  // the same folder and then moved in place, so readers never observe a
  // partially written file.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Makes a relative path absolute with respect to the working directory.
  static std::string Absolute(const std::string& path);
};

// A uniquely-named directory that is removed, with all its contents, when the
// object goes out of scope.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&& other) noexcept;
  TempDir& operator=(TempDir&&) = delete;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
