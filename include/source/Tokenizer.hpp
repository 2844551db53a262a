#pragma once
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace mcc {

enum class TokenKind { Identifier, Number, String, Comment, Punct };

struct Token {
  TokenKind   kind = TokenKind::Punct;
  std::string text;
  unsigned    column = 0;   // 0-based byte column
  bool        unterminated = false; // string runs past end of line
  bool        continued = false;    // string opened on an earlier line

  bool is(TokenKind k, llvm::StringRef t) const { return kind == k && text == t; }
  bool isIdent(llvm::StringRef t) const { return is(TokenKind::Identifier, t); }
  bool isPunct(llvm::StringRef t) const { return is(TokenKind::Punct, t); }
};

// Single-line lexer. Multi-character operators (==, +=, ->, ...) are kept
// as one Punct token; triple-quoted strings left open run to end of line.
std::vector<Token> tokenizeLine(llvm::StringRef line);

// Tokenizes a line whose first `closeEnd` bytes finish a triple-quoted
// literal opened on an earlier line. That part becomes one continued String
// token; only the text after the closing delimiter is lexed as code.
std::vector<Token> tokenizeClosingLine(llvm::StringRef line, size_t closeEnd);

// The line with comments dropped and string contents blanked ("" / """""").
std::string codeView(const std::vector<Token>& tokens, llvm::StringRef line);

// String token text without its quotes / prefix.
llvm::StringRef stringContents(const Token& tok);

unsigned indentOf(llvm::StringRef line);
bool isBlankOrComment(llvm::StringRef line);

} // namespace mcc
