#include "structure/StructExtractor.hpp"
#include "source/LineClassifier.hpp"
#include "source/Tokenizer.hpp"

namespace mcc {

namespace {

// First significant token index, skipping nothing but whitespace.
bool startsWithKeyword(const std::vector<Token>& toks, llvm::StringRef kw) {
  return !toks.empty() && toks.front().isIdent(kw);
}

} // namespace

size_t findHeaderEnd(const std::vector<std::string>& lines, size_t i) {
  int depth = 0;
  for (size_t j = i; j < lines.size(); ++j) {
    for (const auto& t : tokenizeLine(lines[j])) {
      if (t.kind != TokenKind::Punct) continue;
      if (t.text == "(" || t.text == "[" || t.text == "{") ++depth;
      else if (t.text == ")" || t.text == "]" || t.text == "}") { if (depth > 0) --depth; }
      else if (t.text == ":" && depth == 0) return j;
    }
    if (depth == 0) break;  // header closed without opening a block
  }
  return std::string::npos;
}

std::string headerText(const std::vector<std::string>& lines, size_t i) {
  size_t end = findHeaderEnd(lines, i);
  if (end == std::string::npos) end = i;
  std::string out;
  for (size_t j = i; j <= end && j < lines.size(); ++j) {
    if (j != i) out += ' ';
    out += codeView(tokenizeLine(lines[j]), lines[j]);
  }
  return llvm::StringRef(out).trim().str();
}

std::optional<StructInfo> parseStructHeader(const std::vector<std::string>& lines, size_t i) {
  if (i >= lines.size()) return std::nullopt;
  auto first = tokenizeLine(lines[i]);
  if (!startsWithKeyword(first, "struct") || first.size() < 2 ||
      first[1].kind != TokenKind::Identifier)
    return std::nullopt;

  StructInfo info;
  info.name = first[1].text;
  info.headerLine = i;

  auto toks = tokenizeLine(headerText(lines, i));
  size_t k = 2;
  // skip compile-time parameters: struct Foo[T: AnyType](...)
  if (k < toks.size() && toks[k].isPunct("[")) {
    int depth = 0;
    for (; k < toks.size(); ++k) {
      if (toks[k].isPunct("[")) ++depth;
      else if (toks[k].isPunct("]") && --depth == 0) { ++k; break; }
    }
  }
  if (k < toks.size() && toks[k].isPunct("(")) {
    int depth = 0;
    std::string current;
    for (; k < toks.size(); ++k) {
      const auto& t = toks[k];
      if (t.isPunct("(") || t.isPunct("[")) { if (depth++ == 0) continue; }
      if (t.isPunct(")") || t.isPunct("]")) {
        if (--depth == 0) break;
        continue;
      }
      // `Copyable & Movable` lists two traits as one entry
      if (depth == 1 && (t.isPunct(",") || t.isPunct("&"))) {
        if (!current.empty()) info.traits.push_back(current);
        current.clear();
        continue;
      }
      if (depth == 1 && t.kind == TokenKind::Identifier && current.empty())
        current = t.text;
    }
    if (!current.empty()) info.traits.push_back(current);
  }

  for (const auto& t : info.traits) {
    if (t == "Copyable") info.hasCopyTrait = true;
    if (t == "Movable") info.hasMoveTrait = true;
  }
  return info;
}

std::string functionName(llvm::StringRef line) {
  auto toks = tokenizeLine(line);
  if (toks.size() < 3) return "";
  if (!(toks[0].isIdent("fn") || toks[0].isIdent("def"))) return "";
  if (toks[1].kind != TokenKind::Identifier) return "";
  if (!(toks[2].isPunct("(") || toks[2].isPunct("["))) return "";
  return toks[1].text;
}

std::optional<BlockSpan> extractBody(const std::vector<std::string>& lines, size_t i) {
  size_t headerEnd = findHeaderEnd(lines, i);
  if (headerEnd == std::string::npos) return std::nullopt;

  BlockSpan span;
  span.headerLine = i;
  span.headerEnd = headerEnd;
  span.headerIndent = indentOf(lines[i]);
  span.begin = headerEnd + 1;

  bool inString = false;
  size_t j = span.begin;
  for (; j < lines.size(); ++j) {
    llvm::StringRef l(lines[j]);
    if (!inString && !isBlankOrComment(l) && indentOf(l) <= span.headerIndent) break;
    if (countTripleQuotes(l) % 2) inString = !inString;
  }
  span.end = j;
  while (span.end > span.begin) {
    llvm::StringRef last(lines[span.end - 1]);
    if (!isBlankOrComment(last) || (!last.trim().empty() && indentOf(last) > span.headerIndent))
      break;
    --span.end;
  }
  return span;
}

} // namespace mcc
