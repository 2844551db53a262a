#include "source/LineClassifier.hpp"

namespace mcc {

namespace {

const llvm::StringRef kTriple = "\"\"\"";

// Line index holding the closer of the literal opened at (line, col), or
// lines.size() when the literal never closes.
size_t findCloser(const std::vector<std::string>& lines, size_t line, size_t col) {
  llvm::StringRef first(lines[line]);
  if (first.find(kTriple, col + kTriple.size()) != llvm::StringRef::npos) return line;
  for (size_t j = line + 1; j < lines.size(); ++j) {
    if (llvm::StringRef(lines[j]).contains(kTriple)) return j;
  }
  return lines.size();
}

} // namespace

unsigned countTripleQuotes(llvm::StringRef line) {
  unsigned n = 0;
  size_t pos = line.find(kTriple);
  while (pos != llvm::StringRef::npos) {
    ++n;
    pos = line.find(kTriple, pos + kTriple.size());
  }
  return n;
}

size_t variableLiteralOpener(llvm::StringRef line) {
  size_t open = line.find(kTriple);
  if (open == llvm::StringRef::npos) return llvm::StringRef::npos;
  for (size_t k = 0; k < open; ++k) {
    if (line[k] != '=') continue;
    char prev = k ? line[k - 1] : ' ';
    char next = k + 1 < line.size() ? line[k + 1] : ' ';
    if (next == '=' || prev == '=' || prev == '!' || prev == '<' || prev == '>')
      continue;
    return open;
  }
  return llvm::StringRef::npos;
}

LineClassifier::LineClassifier(const std::vector<std::string>& lines, bool checkDocstringCode)
  : checkDocstringCode_(checkDocstringCode),
    varLiteral_(lines.size(), false),
    docBlock_(lines.size(), false),
    varCloseEnd_(lines.size(), 0),
    docCloseEnd_(lines.size(), 0)
{
  const size_t none = lines.size();
  size_t opener = none, closer = none;
  unsigned triples = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (opener != none && i > opener && i < closer) varLiteral_[i] = true;

    size_t first = llvm::StringRef(lines[i]).find(kTriple);
    if (first != llvm::StringRef::npos) {
      unsigned end = (unsigned)(first + kTriple.size());
      if (opener != none && i > opener && i == closer) varCloseEnd_[i] = end;
      if (triples % 2 == 1) docCloseEnd_[i] = end;
    }

    triples += countTripleQuotes(lines[i]);
    docBlock_[i] = (triples % 2) == 1;

    // becomes the nearest prior opener for the lines after it
    size_t col = variableLiteralOpener(lines[i]);
    if (col != llvm::StringRef::npos) {
      opener = i;
      closer = findCloser(lines, i, col);
    }
  }
}

bool LineClassifier::isExcluded(size_t i) const {
  if (i >= varLiteral_.size()) return false;
  return inVariableLiteral(i) || (!checkDocstringCode_ && inDocBlock(i));
}

unsigned LineClassifier::excludedPrefix(size_t i) const {
  if (i >= varCloseEnd_.size()) return 0;
  if (varCloseEnd_[i]) return varCloseEnd_[i];
  return checkDocstringCode_ ? 0 : docCloseEnd_[i];
}

bool LineClassifier::inVariableLiteral(size_t i) const {
  return i < varLiteral_.size() && varLiteral_[i];
}

bool LineClassifier::inDocBlock(size_t i) const {
  return i < docBlock_.size() && docBlock_[i];
}

bool isExcluded(const std::vector<std::string>& lines, size_t i, bool checkDocstringCode) {
  if (i >= lines.size()) return false;

  for (size_t k = i; k-- > 0;) {
    size_t col = variableLiteralOpener(lines[k]);
    if (col == llvm::StringRef::npos) continue;
    if (i < findCloser(lines, k, col)) return true;
    break;
  }

  if (checkDocstringCode) return false;
  unsigned triples = 0;
  for (size_t k = 0; k <= i; ++k) triples += countTripleQuotes(lines[k]);
  return (triples % 2) == 1;
}

} // namespace mcc
