#ifndef EXTRACTOR_EXTRACTOR_HPP
#define EXTRACTOR_EXTRACTOR_HPP

#include <string>

namespace extractor {

struct ExtractedSource {
  enum Strategy { FENCED_BLOCK, CODE_START, VERBATIM };

  std::string code;
  Strategy strategy = VERBATIM;
};

const char* StrategyName(ExtractedSource::Strategy strategy);

// Best-effort extraction of candidate source code from free-form text, such
// as a model answer that wraps the code in markdown. In order:
//  - the body of the first fenced code block (``` with an optional language
//    tag), trimmed;
//  - the text from the first line that starts, at column 0, like C++ code
//    (preprocessor directive, declaration keyword or function signature);
//  - the whole input, trimmed.
// Never throws on malformed input.
ExtractedSource Extract(const std::string& raw);

}  // namespace extractor

#endif
