#pragma once
#include "source/LineClassifier.hpp"
#include "source/Tokenizer.hpp"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace mcc {

// A scanned file split into lines, with per-line tokens, code views and
// exclusion flags. Detectors never look at raw text directly.
class SourceFile {
public:
  SourceFile(std::string path, std::string text, bool checkDocstringCode);

  const std::string& path() const { return path_; }
  const std::string& text() const { return text_; }
  const std::vector<std::string>& lines() const { return lines_; }
  size_t lineCount() const { return lines_.size(); }

  llvm::StringRef line(size_t i) const { return lines_[i]; }
  const std::string& code(size_t i) const { return code_[i]; }
  const std::vector<Token>& tokens(size_t i) const { return tokens_[i]; }
  bool isExcluded(size_t i) const { return classifier_.isExcluded(i); }
  bool inDocBlock(size_t i) const { return classifier_.inDocBlock(i); }
  unsigned excludedPrefix(size_t i) const { return classifier_.excludedPrefix(i); }

  // Byte offset of the first character of line i (i == lineCount() is EOF).
  unsigned offsetOf(size_t i) const { return offsets_[i]; }

  // True when any non-excluded line holds identifier `name`.
  bool mentions(llvm::StringRef name) const;

private:
  std::string path_;
  std::string text_;
  std::vector<unsigned> offsets_;   // filled while lines_ is built
  std::vector<std::string> lines_;
  std::vector<std::vector<Token>> tokens_;
  std::vector<std::string> code_;
  LineClassifier classifier_;
};

std::vector<std::string> splitLines(const std::string& text, std::vector<unsigned>* offsets = nullptr);

} // namespace mcc
