#include "extractor/extractor.hpp"

#include <algorithm>
#include <regex>

#include "absl/strings/ascii.h"
#include "absl/strings/string_view.h"

namespace extractor {

namespace {

static const constexpr char kFence = '`';
static const constexpr char* kFenceRun = "```";
// Only the beginning of a line is matched against the code patterns.
static const constexpr size_t kMaxMatchLength = 200;

// Empty, or a single word such as cpp, c++ or objective-c.
bool IsLanguageTag(absl::string_view tag) {
  for (char c : tag) {
    if (!absl::ascii_isalnum(c) && c != '_' && c != '+' && c != '#' &&
        c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

// A fence opens a block only if the rest of its line is a language tag, so
// that backticks quoted in prose are skipped.
bool FindFencedBlock(const std::string& raw, std::string* body) {
  size_t open = raw.find(kFenceRun);
  while (open != std::string::npos) {
    size_t run_end = open;
    while (run_end < raw.size() && raw[run_end] == kFence) run_end++;
    size_t line_end = raw.find('\n', run_end);
    if (line_end == std::string::npos) return false;
    absl::string_view tag = absl::StripAsciiWhitespace(
        absl::string_view(raw).substr(run_end, line_end - run_end));
    if (IsLanguageTag(tag)) {
      const std::string fence(run_end - open, kFence);
      size_t close = raw.find(fence, line_end + 1);
      if (close != std::string::npos) {
        *body = std::string(absl::StripAsciiWhitespace(
            absl::string_view(raw).substr(line_end + 1, close - line_end - 1)));
        return true;
      }
    }
    open = raw.find(kFenceRun, run_end);
  }
  return false;
}

bool LooksLikeCodeStart(const std::string& line) {
  static const std::regex* keyword = new std::regex(
      R"(^(#\s*(include|define|pragma|if|ifdef|ifndef)\b|import\s+[\w.<"]|)"
      R"(from\s+[\w.]+\s+import\b|)"
      R"((using|namespace|extern|static|inline|struct|class|typedef|)"
      R"(constexpr|const)\b|template\s*<))");
  static const std::regex* signature = new std::regex(
      R"(^(std::[\w:<>,\s*&]+|(void|int|double|float|bool|char|auto|long|)"
      R"(short|unsigned|signed|size_t)\b[\w:<>,\s*&]*)\s+[*&]*)"
      R"([A-Za-z_]\w*\s*\()");
  if (line.empty() || absl::ascii_isspace(line[0])) return false;
  return std::regex_search(line, *keyword) ||
         std::regex_search(line, *signature);
}

bool FindCodeStart(const std::string& raw, std::string* code) {
  size_t line_start = 0;
  while (line_start < raw.size()) {
    size_t line_end = raw.find('\n', line_start);
    if (line_end == std::string::npos) line_end = raw.size();
    size_t prefix = std::min(line_end - line_start, kMaxMatchLength);
    if (LooksLikeCodeStart(raw.substr(line_start, prefix))) {
      *code = std::string(absl::StripAsciiWhitespace(
          absl::string_view(raw).substr(line_start)));
      return true;
    }
    line_start = line_end + 1;
  }
  return false;
}

}  // namespace

const char* StrategyName(ExtractedSource::Strategy strategy) {
  switch (strategy) {
    case ExtractedSource::FENCED_BLOCK:
      return "fenced_block";
    case ExtractedSource::CODE_START:
      return "code_start";
    case ExtractedSource::VERBATIM:
      return "verbatim";
  }
  return "unknown";
}

ExtractedSource Extract(const std::string& raw) {
  ExtractedSource source;
  if (FindFencedBlock(raw, &source.code)) {
    source.strategy = ExtractedSource::FENCED_BLOCK;
    return source;
  }
  try {
    if (FindCodeStart(raw, &source.code)) {
      source.strategy = ExtractedSource::CODE_START;
      return source;
    }
  } catch (const std::regex_error&) {
    // Pathological lines degrade to returning the input.
  }
  source.code = std::string(absl::StripAsciiWhitespace(raw));
  source.strategy = ExtractedSource::VERBATIM;
  return source;
}

}  // namespace extractor
