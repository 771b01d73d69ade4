#ifndef CANDIDATE_CANDIDATE_HPP
#define CANDIDATE_CANDIDATE_HPP

#include <complex>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace candidate {

// Names of the entry points a candidate unit may expose, in resolution order.
static const constexpr char* kArrayEntryPoint = "get_wavefunction";
static const constexpr char* kPointwiseEntryPoint = "wavefunction_at";
static const constexpr char* kParametricEntryPoint = "candidate_params";

using ArrayFn = std::vector<std::complex<double>> (*)(
    const std::vector<double>&);
using PointwiseFn = std::complex<double> (*)(double);
using ParamsFn = const char* (*)();

// Raised when a candidate cannot be located, compiled or bound to an entry
// point.
class load_error : public std::runtime_error {
 public:
  explicit load_error(const std::string& msg) : std::runtime_error(msg) {}
};

// The capability every candidate is reduced to: something that maps the
// position samples to complex samples. Evaluate may throw whatever the
// candidate throws.
class Candidate {
 public:
  virtual std::vector<std::complex<double>> Evaluate(
      const std::vector<double>& positions) const = 0;
  // Human readable description of the entry point that was bound.
  virtual std::string Describe() const = 0;

  Candidate() = default;
  virtual ~Candidate() = default;
  Candidate(const Candidate&) = delete;
  Candidate& operator=(const Candidate&) = delete;
  Candidate(Candidate&&) = delete;
  Candidate& operator=(Candidate&&) = delete;
};

class ArrayCandidate : public Candidate {
 public:
  explicit ArrayCandidate(ArrayFn fn) : fn_(fn) {}
  std::vector<std::complex<double>> Evaluate(
      const std::vector<double>& positions) const override {
    return fn_(positions);
  }
  std::string Describe() const override { return kArrayEntryPoint; }

 private:
  ArrayFn fn_;
};

class PointwiseCandidate : public Candidate {
 public:
  explicit PointwiseCandidate(PointwiseFn fn) : fn_(fn) {}
  std::vector<std::complex<double>> Evaluate(
      const std::vector<double>& positions) const override;
  std::string Describe() const override { return kPointwiseEntryPoint; }

 private:
  PointwiseFn fn_;
};

}  // namespace candidate

#endif
