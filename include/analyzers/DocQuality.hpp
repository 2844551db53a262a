#pragma once
#include <string>
#include <vector>

namespace mcc {

enum class DocVerdict {
  Appropriate,        // single-line, long enough
  Comprehensive,      // multi-line, enough signals
  TooBrief,
  MissingDescription,
  MissingSections
};

struct DocAssessment {
  DocVerdict verdict = DocVerdict::TooBrief;
  size_t lineCount = 0;       // physical lines spanned, delimiters included
  std::string description;    // leading paragraph
  bool hasParams = false;
  bool hasReturns = false;
  bool hasRaises = false;     // informational only

  bool acceptable() const {
    return verdict == DocVerdict::Appropriate || verdict == DocVerdict::Comprehensive;
  }
};

constexpr size_t kMinDocChars = 10;
constexpr size_t kLongDescriptionChars = 50;

// Assesses the docstring whose opening """ is on line `start`.
DocAssessment assessDocstring(const std::vector<std::string>& lines, size_t start);

const char* docVerdictName(DocVerdict v);

} // namespace mcc
