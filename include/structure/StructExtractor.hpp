#pragma once
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>
#include <vector>

namespace mcc {

struct StructInfo {
  std::string name;
  bool hasCopyTrait = false;
  bool hasMoveTrait = false;
  std::vector<std::string> traits;  // as declared, in order
  size_t headerLine = 0;
};

// Lines [begin, end) of a block body; the header spans headerLine..headerEnd.
struct BlockSpan {
  size_t headerLine = 0;
  size_t headerEnd = 0;
  size_t begin = 0;
  size_t end = 0;
  unsigned headerIndent = 0;

  bool empty() const { return begin >= end; }
};

// `struct Name(...)` at line i, or nothing.
std::optional<StructInfo> parseStructHeader(const std::vector<std::string>& lines, size_t i);

// Name declared by `fn name(` / `def name(` on the line, or "".
std::string functionName(llvm::StringRef line);

// Line holding the block-opening ':' of the header starting at i, found
// after all bracket groups opened on the header are balanced; npos if
// the header never opens a block.
size_t findHeaderEnd(const std::vector<std::string>& lines, size_t i);

// Header text from line i through its block-opening ':' joined on one line.
std::string headerText(const std::vector<std::string>& lines, size_t i);

// Body of the block whose header starts at line i: every following line
// indented deeper than the header, up to the first non-blank, non-comment
// line at or below the header's indentation. Trailing blank lines are
// not part of the body.
std::optional<BlockSpan> extractBody(const std::vector<std::string>& lines, size_t i);

} // namespace mcc
