#pragma once
#include "llvm/ADT/StringRef.h"
#include <cstddef>
#include <string>
#include <vector>

namespace mcc {

// Number of """ delimiters on a line.
unsigned countTripleQuotes(llvm::StringRef line);

// Column of the """ that opens a variable-assigned literal (`x = """...`),
// or npos when the line does not assign one.
size_t variableLiteralOpener(llvm::StringRef line);

// Decides per line whether content sits inside a variable-assigned
// triple-quoted literal (always excluded) or inside a documentation block
// (excluded unless checkDocstringCode). Results are computed once for the
// whole file and are equivalent to the per-line backward/forward scans.
class LineClassifier {
public:
  LineClassifier(const std::vector<std::string>& lines, bool checkDocstringCode);

  bool isExcluded(size_t i) const;
  bool inVariableLiteral(size_t i) const;
  bool inDocBlock(size_t i) const;

  // Column just past the """ that closes an excluded literal on line i;
  // everything before it is literal content. 0 when the line closes none.
  unsigned excludedPrefix(size_t i) const;

private:
  bool checkDocstringCode_;
  std::vector<bool> varLiteral_;
  std::vector<bool> docBlock_;
  std::vector<unsigned> varCloseEnd_;
  std::vector<unsigned> docCloseEnd_;
};

// Stateless form of the same contract, for one line.
bool isExcluded(const std::vector<std::string>& lines, size_t i,
                bool checkDocstringCode = false);

} // namespace mcc
