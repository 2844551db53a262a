#pragma once
#include <string>
#include <vector>

namespace mcc {

enum class Severity { Error, Warning, Suggestion, Observation };

enum class Category {
  ImportPattern,
  StructPattern,
  VariableDeclaration,
  GpuPattern,
  Documentation,
  ErrorHandling,
  Performance,
  MemoryManagement,
  TraitUsage,
  FileAccess
};

const char* severityName(Severity s);
const char* categoryName(Category c);

struct FixIt {
  std::string file;
  unsigned    offset = 0;     // byte offset in file
  unsigned    length = 0;     // bytes to replace
  std::string replacement;    // replacement text
  std::string note;           // human-friendly description
};

struct Violation {
  std::string id;             // eg. "RELATIVE_IMPORT", "MISSING_FN_DOC"
  Category    category = Category::StructPattern;
  Severity    severity = Severity::Warning;
  std::string file;
  unsigned    line = 0;       // 1-based
  std::string description;
  std::string suggestion;
  std::vector<FixIt> fixes;   // zero or more low-risk rewrites
};

// Shorthand used by every detector; line is 0-based and stored 1-based.
Violation makeViolation(const std::string& id, Category c, Severity s,
                        const std::string& file, size_t line,
                        std::string description, std::string suggestion);

} // namespace mcc
