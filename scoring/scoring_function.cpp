#include "scoring/scoring_function.hpp"

#include "glog/logging.h"

namespace scoring {

ScoringFunction::store_t* ScoringFunction::Functions_() {
  static store_t* functions = new store_t;
  return functions;
}

void ScoringFunction::Register_(const std::string& name, create_t create) {
  CHECK(Functions_()->emplace(name, create).second)
      << "Scoring function " << name << " registered twice";
}

std::unique_ptr<ScoringFunction> ScoringFunction::Create(
    const proto::ScoringConfig& config) {
  auto it = Functions_()->find(config.function());
  if (it == Functions_()->end()) {
    LOG(ERROR) << "Unknown scoring function \"" << config.function() << "\"";
    return nullptr;
  }
  return std::unique_ptr<ScoringFunction>(it->second(config));
}

}  // namespace scoring
