#include "DetectorSupport.hpp"
#include "structure/LifecycleAnalyzer.hpp"
#include "structure/TraitAdvisor.hpp"
#include <cctype>

namespace mcc {

namespace {

bool isPascalCase(const std::string& name) {
  llvm::StringRef n(name);
  n = n.ltrim('_');
  if (n.empty() || !std::isupper((unsigned char)n.front())) return false;
  for (char c : n) {
    if (!std::isalnum((unsigned char)c)) return false;
  }
  return true;
}

class StructDetector final : public Detector {
public:
  const char* name() const override { return "structs"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i)) continue;

      auto toks = detail::codeTokens(file, i);
      if (toks.size() == 2 && toks[0].isPunct("@") && toks[1].isIdent("value")) {
        out.push_back(makeViolation("DEPRECATED_VALUE_DECORATOR", Category::StructPattern,
            Severity::Warning, file.path(), i,
            "The @value decorator is deprecated",
            "Use @fieldwise_init and declare Copyable / Movable explicitly"));
        continue;
      }

      // a declaration never starts inside a literal closed on this line
      if (file.excludedPrefix(i)) continue;
      auto info = parseStructHeader(file.lines(), i);
      if (!info) continue;

      if (!isPascalCase(info->name)) {
        out.push_back(makeViolation("STRUCT_NAMING", Category::StructPattern,
            Severity::Warning, file.path(), i,
            "Struct name '" + info->name + "' is not PascalCase",
            "Rename the struct using PascalCase"));
      }

      auto body = extractBody(file.lines(), i);
      if (!body || body->empty()) continue;
      LifecycleAnalysis lifecycle = analyzeLifecycle(file.lines(), *body);
      for (auto& v : traitViolations(file, *info, lifecycle)) out.push_back(std::move(v));
    }
    return out;
  }
};

} // namespace

std::unique_ptr<Detector> makeStructDetector() { return std::make_unique<StructDetector>(); }

} // namespace mcc
