#pragma once
// Shared helpers for the detector implementations.

#include "analyzers/Analyzer.hpp"
#include "source/SourceFile.hpp"
#include "structure/StructExtractor.hpp"
#include <string>
#include <vector>

namespace mcc {
namespace detail {

// Tokens of line i without a trailing comment.
std::vector<Token> codeTokens(const SourceFile& file, size_t i);

// True when line i begins with identifier `kw`.
bool startsWith(const SourceFile& file, size_t i, llvm::StringRef kw);

// Bodies of every `for` / `while` loop in the file that is not excluded.
std::vector<BlockSpan> loopBodies(const SourceFile& file);

// Bodies of every `fn` / `def` in the file, paired with their name.
struct FunctionSpan {
  std::string name;
  BlockSpan span;
};
std::vector<FunctionSpan> functionBodies(const SourceFile& file);

bool inAnySpan(const std::vector<BlockSpan>& spans, size_t line);

// Identifiers whose presence marks GPU kernel code.
bool isKernelIndicator(llvm::StringRef ident);

// True when any token in lines [begin, end) is identifier `name`.
bool spanMentions(const SourceFile& file, size_t begin, size_t end, llvm::StringRef name);

} // namespace detail
} // namespace mcc
