#include "DetectorSupport.hpp"

namespace mcc {

namespace {

bool matchesAt(const std::vector<Token>& toks, size_t k,
               std::initializer_list<llvm::StringRef> texts) {
  for (llvm::StringRef t : texts) {
    if (k >= toks.size() || toks[k].text != t) return false;
    ++k;
  }
  return true;
}

class PerformanceDetector final : public Detector {
public:
  const char* name() const override { return "performance"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    const auto loops = detail::loopBodies(file);

    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i)) continue;
      auto toks = detail::codeTokens(file, i);
      if (toks.empty()) continue;

      if (toks[0].isIdent("for")) {
        for (size_t k = 1; k < toks.size(); ++k) {
          if (!matchesAt(toks, k, {"in", "range", "(", "len", "("})) continue;
          out.push_back(makeViolation("RANGE_LEN_LOOP", Category::Performance,
              Severity::Observation, file.path(), i,
              "Loop indexes through range(len(...))",
              "Iterate over the collection directly when the index is not needed"));
          break;
        }
      }

      if (!detail::inAnySpan(loops, i)) continue;

      for (size_t k = 0; k < toks.size(); ++k) {
        if (matchesAt(toks, k, {"Python", ".", "import_module", "("})) {
          out.push_back(makeViolation("PY_IMPORT_IN_LOOP", Category::Performance,
              Severity::Warning, file.path(), i,
              "Python module imported inside a loop",
              "Import the module once before the loop"));
          break;
        }
      }

      for (size_t k = 0; k < toks.size(); ++k) {
        if (!toks[k].isPunct("+=")) continue;
        bool literal = false;
        for (size_t m = k + 1; m < toks.size(); ++m)
          literal = literal || toks[m].kind == TokenKind::String;
        if (!literal) break;
        out.push_back(makeViolation("STRING_CONCAT_IN_LOOP", Category::Performance,
            Severity::Observation, file.path(), i,
            "String built by repeated concatenation inside a loop",
            "Collect the pieces in a List and join them once"));
        break;
      }
    }
    return out;
  }
};

} // namespace

std::unique_ptr<Detector> makePerformanceDetector() {
  return std::make_unique<PerformanceDetector>();
}

} // namespace mcc
