#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "evaluator/config.hpp"
#include "evaluator/evaluator.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"

DEFINE_bool(inline, false, "Treat the arguments as candidate source text");
DEFINE_bool(read_stdin, false, "Read a single candidate from standard input");

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Scores uncertainty-product candidates.\n"
      "  uncertainty_eval [flags] <candidate.cpp|candidate.so>...\n"
      "  uncertainty_eval [flags] --inline '<source text>'...\n"
      "  uncertainty_eval [flags] --read_stdin < answer.md");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::vector<evaluator::CandidateInput> inputs;
  if (FLAGS_read_stdin) {
    if (argc != 1) {
      LOG(ERROR) << "--read_stdin does not take arguments";
      return 2;
    }
    std::string text{std::istreambuf_iterator<char>(std::cin),
                     std::istreambuf_iterator<char>()};
    inputs.emplace_back(evaluator::SourceText{text});
  } else {
    for (int i = 1; i < argc; i++) {
      if (FLAGS_inline) {
        inputs.emplace_back(evaluator::SourceText{argv[i]});
      } else {
        inputs.emplace_back(evaluator::SourcePath{argv[i]});
      }
    }
  }
  if (inputs.empty()) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "main");
    return 2;
  }

  evaluator::EvaluatorOptions options;
  try {
    options = evaluator::OptionsFromFlags();
  } catch (std::exception& e) {
    LOG(ERROR) << "Invalid configuration: " << e.what();
    return 2;
  }
  if (options.runner_path.empty()) {
    LOG(ERROR) << "Cannot find uncertainty_runner, use --runner_path";
    return 2;
  }

  evaluator::Evaluator evaluator(options);
  for (const evaluator::CandidateInput& input : inputs) {
    std::string text;
    google::protobuf::TextFormat::PrintToString(evaluator.Evaluate(input),
                                                &text);
    std::cout << text << "---" << std::endl;
  }
  return 0;
}
