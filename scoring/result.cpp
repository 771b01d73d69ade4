#include "scoring/result.hpp"

#include <cmath>

namespace scoring {

proto::ScoreResult ErrorResult(proto::ErrorKind kind,
                               const std::string& message, double sentinel) {
  proto::ScoreResult result;
  result.set_error_kind(kind);
  result.set_error_message(message);
  FinalizeResult(sentinel, &result);
  return result;
}

void FinalizeResult(double sentinel, proto::ScoreResult* result) {
  if (result->error_kind() != proto::SUCCESS) {
    result->set_combined_score(sentinel);
    if (result->error_message().empty()) {
      result->set_error_message(proto::ErrorKind_Name(result->error_kind()));
    }
    return;
  }
  result->clear_error_message();
  double score = result->combined_score();
  if (!std::isfinite(score) || score > sentinel) score = sentinel;
  result->set_combined_score(score);
}

}  // namespace scoring
