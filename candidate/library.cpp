#include "candidate/library.hpp"

#include <dlfcn.h>

#include "absl/memory/memory.h"
#include "candidate/families.hpp"
#include "glog/logging.h"

namespace candidate {

std::shared_ptr<Library> Library::Open(const std::string& path) {
  dlerror();
  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    const char* error = dlerror();
    throw load_error("dlopen: " + std::string(error ? error : path));
  }
  VLOG(1) << "Loaded candidate library " << path;
  return std::shared_ptr<Library>(new Library(handle, path));
}

Library::~Library() {
  if (dlclose(handle_) != 0) {
    const char* error = dlerror();
    LOG(WARNING) << "dlclose " << path_ << ": " << (error ? error : "failed");
  }
}

void* Library::Symbol(const char* name) const {
  dlerror();
  void* symbol = dlsym(handle_, name);
  if (dlerror() != nullptr) return nullptr;
  return symbol;
}

std::unique_ptr<Candidate> Library::Bind() const {
  if (void* fn = Symbol(kArrayEntryPoint)) {
    return absl::make_unique<ArrayCandidate>(reinterpret_cast<ArrayFn>(fn));
  }
  if (void* fn = Symbol(kPointwiseEntryPoint)) {
    return absl::make_unique<PointwiseCandidate>(
        reinterpret_cast<PointwiseFn>(fn));
  }
  if (void* fn = Symbol(kParametricEntryPoint)) {
    const char* params = reinterpret_cast<ParamsFn>(fn)();
    if (params == nullptr) {
      throw load_error(std::string(kParametricEntryPoint) +
                       " returned a null string");
    }
    return ParametricCandidate::FromText(params);
  }
  throw load_error(std::string("missing required entry point: expected ") +
                   kArrayEntryPoint + ", " + kPointwiseEntryPoint + " or " +
                   kParametricEntryPoint);
}

absl::optional<std::string> Library::BackingPath() const {
  for (const char* name :
       {kArrayEntryPoint, kPointwiseEntryPoint, kParametricEntryPoint}) {
    void* symbol = Symbol(name);
    if (symbol == nullptr) continue;
    Dl_info info{};
    if (dladdr(symbol, &info) != 0 && info.dli_fname != nullptr) {
      return std::string(info.dli_fname);
    }
  }
  return absl::nullopt;
}

}  // namespace candidate
