#include "analyzers/DocQuality.hpp"
#include "llvm/ADT/StringRef.h"

namespace mcc {

namespace {

const llvm::StringRef kTriple = "\"\"\"";

bool isSectionMarker(llvm::StringRef t) {
  return t.endswith(":") && !t.contains(' ') && t.size() > 1;
}

} // namespace

const char* docVerdictName(DocVerdict v) {
  switch (v) {
  case DocVerdict::Appropriate:        return "appropriate";
  case DocVerdict::Comprehensive:      return "comprehensive";
  case DocVerdict::TooBrief:           return "too brief";
  case DocVerdict::MissingDescription: return "missing description";
  case DocVerdict::MissingSections:    return "missing sections";
  }
  return "unknown";
}

DocAssessment assessDocstring(const std::vector<std::string>& lines, size_t start) {
  DocAssessment a;
  if (start >= lines.size()) return a;

  llvm::StringRef first(lines[start]);
  size_t open = first.find(kTriple);
  if (open == llvm::StringRef::npos) return a;
  llvm::StringRef rest = first.substr(open + kTriple.size());

  size_t close = rest.find(kTriple);
  if (close != llvm::StringRef::npos) {
    a.lineCount = 1;
    a.description = rest.substr(0, close).trim().str();
    a.verdict = a.description.size() > kMinDocChars ? DocVerdict::Appropriate
                                                    : DocVerdict::TooBrief;
    return a;
  }

  std::vector<std::string> content;
  content.push_back(rest.trim().str());
  size_t j = start + 1;
  for (; j < lines.size(); ++j) {
    llvm::StringRef l(lines[j]);
    size_t end = l.find(kTriple);
    if (end != llvm::StringRef::npos) {
      content.push_back(l.substr(0, end).trim().str());
      break;
    }
    content.push_back(l.trim().str());
  }
  a.lineCount = (j < lines.size() ? j : lines.size() - 1) - start + 1;

  size_t totalChars = 0;
  bool inDescription = true;
  for (const auto& c : content) {
    llvm::StringRef t(c);
    totalChars += t.size();
    if (t.startswith("Args:") || t.startswith("Arguments:") || t.startswith("Parameters:"))
      a.hasParams = true;
    if (t.startswith("Returns:") || t.startswith("Return:") || t.startswith("Yields:"))
      a.hasReturns = true;
    if (t.startswith("Raises:"))
      a.hasRaises = true;

    if (!inDescription) continue;
    if (isSectionMarker(t)) { inDescription = false; continue; }
    if (t.empty()) {
      if (!a.description.empty()) inDescription = false;
      continue;
    }
    if (!a.description.empty()) a.description += ' ';
    a.description += c;
  }

  bool hasDescription = a.description.size() >= kMinDocChars;
  int signals = (hasDescription ? 1 : 0) + (a.hasParams ? 1 : 0) + (a.hasReturns ? 1 : 0);

  if (signals >= 2 || a.description.size() > kLongDescriptionChars ||
      (a.lineCount > 3 && hasDescription))
    a.verdict = DocVerdict::Comprehensive;
  else if (totalChars < kMinDocChars)
    a.verdict = DocVerdict::TooBrief;
  else if (!hasDescription)
    a.verdict = DocVerdict::MissingDescription;
  else
    a.verdict = DocVerdict::MissingSections;
  return a;
}

} // namespace mcc
