#include "DetectorSupport.hpp"

namespace mcc {
namespace detail {

std::vector<Token> codeTokens(const SourceFile& file, size_t i) {
  std::vector<Token> toks = file.tokens(i);
  if (!toks.empty() && toks.back().kind == TokenKind::Comment) toks.pop_back();
  return toks;
}

bool startsWith(const SourceFile& file, size_t i, llvm::StringRef kw) {
  const auto& toks = file.tokens(i);
  return !toks.empty() && toks.front().isIdent(kw);
}

std::vector<BlockSpan> loopBodies(const SourceFile& file) {
  std::vector<BlockSpan> out;
  for (size_t i = 0; i < file.lineCount(); ++i) {
    if (file.isExcluded(i)) continue;
    if (!startsWith(file, i, "for") && !startsWith(file, i, "while")) continue;
    if (auto body = extractBody(file.lines(), i)) out.push_back(*body);
  }
  return out;
}

std::vector<FunctionSpan> functionBodies(const SourceFile& file) {
  std::vector<FunctionSpan> out;
  for (size_t i = 0; i < file.lineCount(); ++i) {
    if (file.isExcluded(i) || file.excludedPrefix(i)) continue;
    std::string name = functionName(file.line(i));
    if (name.empty()) continue;
    if (auto body = extractBody(file.lines(), i)) out.push_back({name, *body});
  }
  return out;
}

bool inAnySpan(const std::vector<BlockSpan>& spans, size_t line) {
  for (const auto& s : spans) {
    if (line >= s.begin && line < s.end) return true;
  }
  return false;
}

bool isKernelIndicator(llvm::StringRef ident) {
  return ident == "thread_idx" || ident == "block_idx" || ident == "block_dim" ||
         ident == "global_idx" || ident == "grid_dim";
}

bool spanMentions(const SourceFile& file, size_t begin, size_t end, llvm::StringRef name) {
  for (size_t j = begin; j < end && j < file.lineCount(); ++j) {
    if (file.isExcluded(j)) continue;
    for (const auto& t : file.tokens(j)) {
      if (t.isIdent(name)) return true;
    }
  }
  return false;
}

} // namespace detail
} // namespace mcc
