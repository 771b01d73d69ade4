#ifndef CANDIDATE_FAMILIES_HPP
#define CANDIDATE_FAMILIES_HPP

#include <map>
#include <memory>
#include <string>

#include "candidate/candidate.hpp"

namespace candidate {

// A member of one of the analytic families, fully resolved: every parameter
// of the family has a value.
struct FamilyParams {
  std::string type;
  std::map<std::string, double> values;
};

// Parses "type=<family> key=value ...". Tokens may be separated by spaces,
// commas or newlines. Parameters that are not given take the family default,
// and a missing type selects the gaussian family. Throws load_error on an
// unknown family or key, or on a malformed value.
FamilyParams ParseFamilyParams(const std::string& text);

class ParametricCandidate : public Candidate {
 public:
  explicit ParametricCandidate(FamilyParams params)
      : params_(std::move(params)) {}
  static std::unique_ptr<ParametricCandidate> FromText(
      const std::string& text) {
    return std::unique_ptr<ParametricCandidate>(
        new ParametricCandidate(ParseFamilyParams(text)));
  }

  std::vector<std::complex<double>> Evaluate(
      const std::vector<double>& positions) const override;
  std::string Describe() const override;

  const FamilyParams& Params() const { return params_; }

 private:
  FamilyParams params_;
};

}  // namespace candidate

#endif
