#include "analyzers/Violation.hpp"

namespace mcc {

const char* severityName(Severity s) {
  switch (s) {
  case Severity::Error:       return "error";
  case Severity::Warning:     return "warning";
  case Severity::Suggestion:  return "suggestion";
  case Severity::Observation: return "observation";
  }
  return "unknown";
}

const char* categoryName(Category c) {
  switch (c) {
  case Category::ImportPattern:       return "import pattern";
  case Category::StructPattern:       return "struct pattern";
  case Category::VariableDeclaration: return "variable declaration";
  case Category::GpuPattern:          return "GPU pattern";
  case Category::Documentation:       return "documentation";
  case Category::ErrorHandling:       return "error handling";
  case Category::Performance:         return "performance";
  case Category::MemoryManagement:    return "memory management";
  case Category::TraitUsage:          return "trait usage";
  case Category::FileAccess:          return "file access";
  }
  return "unknown";
}

Violation makeViolation(const std::string& id, Category c, Severity s,
                        const std::string& file, size_t line,
                        std::string description, std::string suggestion) {
  Violation v;
  v.id = id;
  v.category = c;
  v.severity = s;
  v.file = file;
  v.line = (unsigned)line + 1;
  v.description = std::move(description);
  v.suggestion = std::move(suggestion);
  return v;
}

} // namespace mcc
