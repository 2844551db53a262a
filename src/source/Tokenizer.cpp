#include "source/Tokenizer.hpp"
#include <cctype>
#include <cstring>

namespace mcc {

namespace {

bool isIdentStart(char c) { return std::isalpha((unsigned char)c) || c == '_'; }
bool isIdentChar(char c)  { return std::isalnum((unsigned char)c) || c == '_'; }
bool isStringPrefix(char c) {
  return c == 'r' || c == 'R' || c == 'b' || c == 'B' || c == 'f' || c == 'F';
}

// Longest first.
const char* const kOperators[] = {
  "//=", "**=", ">>=", "<<=", "...",
  "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=",
  "->", "**", "//", "<<", ">>", ":="};

} // namespace

std::vector<Token> tokenizeLine(llvm::StringRef line) {
  std::vector<Token> out;
  size_t i = 0, n = line.size();
  while (i < n) {
    char c = line[i];
    if (c == ' ' || c == '\t' || c == '\r') { ++i; continue; }

    Token t;
    t.column = (unsigned)i;

    if (c == '#') {
      t.kind = TokenKind::Comment;
      t.text = line.substr(i).str();
      out.push_back(std::move(t));
      break;
    }

    // String literal, with an optional r/b/f prefix.
    size_t q = i;
    while (q < n && q - i < 2 && isStringPrefix(line[q])) ++q;
    if (q < n && (line[q] == '"' || line[q] == '\'')) {
      char quote = line[q];
      std::string delim(3, quote);
      bool triple = line.substr(q).startswith(delim);
      size_t j = q + (triple ? 3 : 1);
      bool closed = false;
      while (j < n) {
        if (line[j] == '\\') { j += 2; continue; }
        if (triple ? line.substr(j).startswith(delim) : line[j] == quote) {
          j += triple ? 3 : 1;
          closed = true;
          break;
        }
        ++j;
      }
      if (j > n) j = n;
      t.kind = TokenKind::String;
      t.text = line.substr(i, j - i).str();
      t.unterminated = !closed;
      out.push_back(std::move(t));
      i = j;
      continue;
    }

    if (isIdentStart(c)) {
      size_t j = i + 1;
      while (j < n && isIdentChar(line[j])) ++j;
      t.kind = TokenKind::Identifier;
      t.text = line.substr(i, j - i).str();
      out.push_back(std::move(t));
      i = j;
      continue;
    }

    if (std::isdigit((unsigned char)c)) {
      size_t j = i + 1;
      while (j < n && (isIdentChar(line[j]) || line[j] == '.')) ++j;
      t.kind = TokenKind::Number;
      t.text = line.substr(i, j - i).str();
      out.push_back(std::move(t));
      i = j;
      continue;
    }

    t.kind = TokenKind::Punct;
    size_t len = 1;
    for (const char* op : kOperators) {
      if (line.substr(i).startswith(op)) { len = std::strlen(op); break; }
    }
    t.text = line.substr(i, len).str();
    out.push_back(std::move(t));
    i += len;
  }
  return out;
}

std::vector<Token> tokenizeClosingLine(llvm::StringRef line, size_t closeEnd) {
  if (closeEnd == 0 || closeEnd > line.size()) return tokenizeLine(line);

  Token head;
  head.kind = TokenKind::String;
  head.continued = true;
  size_t start = 0;
  while (start < closeEnd && (line[start] == ' ' || line[start] == '\t')) ++start;
  head.column = (unsigned)start;
  head.text = line.slice(start, closeEnd).str();

  std::vector<Token> out;
  out.push_back(std::move(head));
  for (auto& t : tokenizeLine(line.substr(closeEnd))) {
    t.column += (unsigned)closeEnd;
    out.push_back(std::move(t));
  }
  return out;
}

llvm::StringRef stringContents(const Token& tok) {
  llvm::StringRef s(tok.text);
  if (tok.continued) return s.size() >= 3 ? s.drop_back(3) : s;
  s = s.ltrim("rRbBfF");
  if (s.startswith("\"\"\"") || s.startswith("'''")) {
    s = s.drop_front(3);
    if (!tok.unterminated && s.size() >= 3) s = s.drop_back(3);
    return s;
  }
  if (s.empty()) return s;
  s = s.drop_front(1);
  if (!tok.unterminated && !s.empty()) s = s.drop_back(1);
  return s;
}

std::string codeView(const std::vector<Token>& tokens, llvm::StringRef line) {
  std::string out;
  out.reserve(line.size());
  size_t pos = 0;
  for (const auto& t : tokens) {
    out.append(line.data() + pos, t.column - pos);
    pos = t.column + t.text.size();
    if (t.kind == TokenKind::Comment) break;
    if (t.kind != TokenKind::String) {
      out += t.text;
      continue;
    }
    llvm::StringRef body = stringContents(t);
    size_t open = (size_t)(body.data() - t.text.data());
    out += t.text.substr(0, open);
    if (!t.unterminated) out += t.text.substr(open + body.size());
  }
  if (pos < line.size() && (tokens.empty() || tokens.back().kind != TokenKind::Comment))
    out.append(line.data() + pos, line.size() - pos);
  return llvm::StringRef(out).rtrim().str();
}

unsigned indentOf(llvm::StringRef line) {
  unsigned n = 0;
  for (char c : line) {
    if (c == ' ') ++n;
    else if (c == '\t') n += 4;
    else break;
  }
  return n;
}

bool isBlankOrComment(llvm::StringRef line) {
  llvm::StringRef t = line.trim();
  return t.empty() || t.startswith("#");
}

} // namespace mcc
