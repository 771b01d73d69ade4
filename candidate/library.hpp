#ifndef CANDIDATE_LIBRARY_HPP
#define CANDIDATE_LIBRARY_HPP

#include <memory>
#include <string>

#include "absl/types/optional.h"
#include "candidate/candidate.hpp"

namespace candidate {

// A candidate unit loaded as a shared object. The library stays loaded as
// long as the object is alive, so candidates bound from it must not outlive
// it.
class Library {
 public:
  // Throws load_error if the shared object cannot be loaded.
  static std::shared_ptr<Library> Open(const std::string& path);

  // Binds the first entry point the library exposes, in the order array,
  // pointwise, parametric. Throws load_error if there is none.
  std::unique_ptr<Candidate> Bind() const;

  // The file the library was actually loaded from, as reported by the dynamic
  // loader for one of its entry points. Empty if the library exposes no entry
  // point.
  absl::optional<std::string> BackingPath() const;

  const std::string& Path() const { return path_; }

  ~Library();
  Library(const Library&) = delete;
  Library& operator=(const Library&) = delete;
  Library(Library&&) = delete;
  Library& operator=(Library&&) = delete;

 private:
  Library(void* handle, std::string path)
      : handle_(handle), path_(std::move(path)) {}
  void* Symbol(const char* name) const;

  void* handle_;
  std::string path_;
};

}  // namespace candidate

#endif
