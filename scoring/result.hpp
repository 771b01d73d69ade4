#ifndef SCORING_RESULT_HPP
#define SCORING_RESULT_HPP

#include <string>

#include "proto/evaluation.pb.h"

namespace scoring {

// A failed result: the sentinel score and a populated error descriptor.
proto::ScoreResult ErrorResult(proto::ErrorKind kind,
                               const std::string& message, double sentinel);

// Enforces the result invariant: a successful result has a finite score no
// larger than the sentinel and no error message, a failed one has the
// sentinel score and a non-empty message.
void FinalizeResult(double sentinel, proto::ScoreResult* result);

}  // namespace scoring

#endif
