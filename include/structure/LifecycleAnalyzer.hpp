#pragma once
#include "structure/StructExtractor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mcc {

struct LifecycleAnalysis {
  bool trivialCopy = false;
  bool trivialMove = false;
  bool needsCustomCopy = false;
  bool needsCustomMove = false;
  std::optional<size_t> copyMethodOffset;  // from the struct header line
  std::optional<size_t> moveMethodOffset;
};

enum class LifecycleKind { Copy, Move };

// Field names declared with `var name:` directly in the struct body.
std::vector<std::string> structFields(const std::vector<std::string>& lines, const BlockSpan& body);

// Name of the source argument in a __copyinit__/__moveinit__ header,
// "existing" when it cannot be read.
std::string sourceArgument(const std::string& header);

// True when every statement of the method body is `self.f = src.f`
// (`self.f = src.f^` for moves) and, when fields are known, every field
// is assigned exactly once.
bool isTrivialLifecycleBody(const std::vector<std::string>& lines, const BlockSpan& method,
                            LifecycleKind kind, const std::vector<std::string>& fields);

// Locates __copyinit__ / __moveinit__ in a struct body and classifies them.
LifecycleAnalysis analyzeLifecycle(const std::vector<std::string>& lines, const BlockSpan& body);

} // namespace mcc
