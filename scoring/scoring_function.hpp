#ifndef SCORING_SCORING_FUNCTION_HPP
#define SCORING_SCORING_FUNCTION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "candidate/candidate.hpp"
#include "proto/evaluation.pb.h"
#include "scoring/grid.hpp"

namespace scoring {

// A scoring function turns a candidate into a ScoreResult. Lower scores are
// better. Implementations must not throw: any problem with the candidate is
// reported as an EVALUATION result.
// Implementations register themselves under a name by creating a global
// object of type ScoringFunction::Register<Impl>, and must define a static
// Create(const proto::ScoringConfig&) function. Registering is not
// thread-safe and should be done before any threads are created.
class ScoringFunction {
 public:
  using create_t =
      std::function<ScoringFunction*(const proto::ScoringConfig& config)>;

  // Returns nullptr if no function is registered under config.function().
  static std::unique_ptr<ScoringFunction> Create(
      const proto::ScoringConfig& config);

  virtual proto::ScoreResult Score(const candidate::Candidate& candidate,
                                   const Grid& grid,
                                   uint32_t source_lines) const = 0;

  virtual ~ScoringFunction() = default;
  ScoringFunction() = default;
  ScoringFunction(const ScoringFunction&) = delete;
  ScoringFunction(ScoringFunction&&) = delete;
  ScoringFunction& operator=(const ScoringFunction&) = delete;
  ScoringFunction& operator=(ScoringFunction&&) = delete;

  template <typename T>
  class Register {
   public:
    explicit Register(const std::string& name) {
      ScoringFunction::Register_(name, &T::Create);
    }
  };

 private:
  using store_t = std::unordered_map<std::string, create_t>;
  static store_t* Functions_();
  static void Register_(const std::string& name, create_t create);
  template <typename T>
  friend class Register;
};

}  // namespace scoring

#endif
