#include "candidate/families.hpp"

#include <cmath>
#include <functional>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace candidate {

namespace {

using Values = std::map<std::string, double>;

struct Family {
  Values defaults;
  std::function<double(double, const Values&)> fn;
};

const std::map<std::string, Family>& Families() {
  static const std::map<std::string, Family>* families =
      new std::map<std::string, Family>{
          {"gaussian",
           {{{"a", 1.0}},
            [](double x, const Values& v) {
              return std::exp(-v.at("a") * x * x);
            }}},
          {"supergauss",
           {{{"a", 1.0}, {"p", 4.0}},
            [](double x, const Values& v) {
              return std::exp(-std::pow(std::abs(x) / v.at("a"), v.at("p")));
            }}},
          {"lorentz",
           {{{"b", 1.0}},
            [](double x, const Values& v) {
              double t = x / v.at("b");
              return 1.0 / (1.0 + t * t);
            }}},
          {"mixed",
           {{{"a", 1.0}, {"r", 0.5}},
            [](double x, const Values& v) {
              double r = v.at("r");
              return (1 - r) * std::exp(-v.at("a") * x * x) +
                     r / (1.0 + x * x);
            }}},
      };
  return *families;
}

}  // namespace

FamilyParams ParseFamilyParams(const std::string& text) {
  std::string type = "gaussian";
  Values given;
  const std::vector<absl::string_view> tokens =
      absl::StrSplit(text, absl::ByAnyChar(" ,\t\r\n"), absl::SkipEmpty());
  for (absl::string_view token : tokens) {
    std::pair<std::string, std::string> kv =
        absl::StrSplit(token, absl::MaxSplits('=', 1));
    std::string key = absl::AsciiStrToLower(kv.first);
    if (kv.second.empty()) {
      throw load_error(absl::StrCat("expected key=value, got \"", token, "\""));
    }
    if (key == "type") {
      type = absl::AsciiStrToLower(kv.second);
      continue;
    }
    double value = 0;
    if (!absl::SimpleAtod(kv.second, &value) || !std::isfinite(value)) {
      throw load_error(absl::StrCat("invalid value for ", key, ": \"",
                                    kv.second, "\""));
    }
    given[key] = value;
  }

  auto family = Families().find(type);
  if (family == Families().end()) {
    throw load_error("unknown family \"" + type + "\"");
  }
  FamilyParams params{type, family->second.defaults};
  for (const auto& kv : given) {
    if (params.values.count(kv.first) == 0) {
      throw load_error(absl::StrCat("family ", type, " has no parameter \"",
                                    kv.first, "\""));
    }
    params.values[kv.first] = kv.second;
  }
  return params;
}

std::vector<std::complex<double>> ParametricCandidate::Evaluate(
    const std::vector<double>& positions) const {
  const Family& family = Families().at(params_.type);
  std::vector<std::complex<double>> values;
  values.reserve(positions.size());
  for (double x : positions) values.emplace_back(family.fn(x, params_.values));
  return values;
}

std::string ParametricCandidate::Describe() const {
  std::string description = absl::StrCat(kParametricEntryPoint, " type=",
                                         params_.type);
  for (const auto& kv : params_.values) {
    absl::StrAppend(&description, " ", kv.first, "=", kv.second);
  }
  return description;
}

}  // namespace candidate
