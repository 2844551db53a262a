#include "source/SourceFile.hpp"

namespace mcc {

std::vector<std::string> splitLines(const std::string& text, std::vector<unsigned>* offsets) {
  std::vector<std::string> lines;
  if (offsets) offsets->clear();
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    size_t end = nl == std::string::npos ? text.size() : nl;
    size_t len = end - start;
    if (len && text[end - 1] == '\r') --len;
    lines.push_back(text.substr(start, len));
    if (offsets) offsets->push_back((unsigned)start);
    if (nl == std::string::npos) { start = text.size(); break; }
    start = nl + 1;
  }
  if (offsets) offsets->push_back((unsigned)text.size());
  return lines;
}

SourceFile::SourceFile(std::string path, std::string text, bool checkDocstringCode)
  : path_(std::move(path)),
    text_(std::move(text)),
    lines_(splitLines(text_, &offsets_)),
    classifier_(lines_, checkDocstringCode)
{
  tokens_.reserve(lines_.size());
  code_.reserve(lines_.size());
  for (size_t i = 0; i < lines_.size(); ++i) {
    tokens_.push_back(tokenizeClosingLine(lines_[i], classifier_.excludedPrefix(i)));
    code_.push_back(codeView(tokens_.back(), lines_[i]));
  }
}

bool SourceFile::mentions(llvm::StringRef name) const {
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (isExcluded(i)) continue;
    for (const auto& t : tokens_[i]) {
      if (t.isIdent(name)) return true;
    }
  }
  return false;
}

} // namespace mcc
