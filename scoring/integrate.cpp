#include "scoring/integrate.hpp"

#include <stdexcept>

namespace scoring {

namespace {

double Rectangle(const std::vector<double>& v, size_t end, double h) {
  double sum = 0;
  for (size_t i = 0; i < end; i++) sum += v[i];
  return sum * h;
}

double Trapezoid(const std::vector<double>& v, size_t begin, size_t end,
                 double h) {
  if (end - begin < 2) return 0;
  double sum = 0.5 * (v[begin] + v[end - 1]);
  for (size_t i = begin + 1; i + 1 < end; i++) sum += v[i];
  return sum * h;
}

// Composite Simpson rule over [0, end), end - 1 must be even.
double Simpson(const std::vector<double>& v, size_t end, double h) {
  double sum = v[0] + v[end - 1];
  for (size_t i = 1; i + 1 < end; i++) sum += (i % 2 ? 4 : 2) * v[i];
  return sum * h / 3;
}

}  // namespace

double Integrate(const std::vector<double>& values, double spacing,
                 proto::IntegrationRule rule) {
  const size_t n = values.size();
  switch (rule) {
    case proto::RECTANGLE:
      return Rectangle(values, n, spacing);
    case proto::TRAPEZOID:
      return Trapezoid(values, 0, n, spacing);
    case proto::SIMPSON:
      if (n < 3) return Trapezoid(values, 0, n, spacing);
      if (n % 2 == 1) return Simpson(values, n, spacing);
      // Odd number of intervals: the last one uses the trapezoid rule.
      return Simpson(values, n - 1, spacing) +
             Trapezoid(values, n - 2, n, spacing);
    default:
      throw std::invalid_argument("unknown integration rule " +
                                  proto::IntegrationRule_Name(rule));
  }
}

}  // namespace scoring
