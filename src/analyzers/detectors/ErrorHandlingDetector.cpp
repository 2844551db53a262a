#include "DetectorSupport.hpp"

namespace mcc {

namespace {

class ErrorHandlingDetector final : public Detector {
public:
  const char* name() const override { return "errors"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i)) continue;
      auto toks = detail::codeTokens(file, i);
      if (toks.empty()) continue;

      if (toks[0].isIdent("except") && toks.size() >= 2 && toks[1].isPunct(":")) {
        out.push_back(makeViolation("BARE_EXCEPT", Category::ErrorHandling,
            Severity::Warning, file.path(), i,
            "Bare 'except:' hides the error that was raised",
            "Bind the error with 'except e:' and handle or re-raise it"));
      }

      for (size_t k = 0; k + 2 < toks.size(); ++k) {
        if (!toks[k].isIdent("Error") || !toks[k + 1].isPunct("(")) continue;
        if (k > 0 && toks[k - 1].isPunct(".")) continue;
        bool empty = toks[k + 2].isPunct(")") ||
                     (toks[k + 2].kind == TokenKind::String &&
                      stringContents(toks[k + 2]).trim().empty() &&
                      k + 3 < toks.size() && toks[k + 3].isPunct(")"));
        if (!empty) continue;
        out.push_back(makeViolation("ERROR_WITHOUT_MESSAGE", Category::ErrorHandling,
            Severity::Suggestion, file.path(), i,
            "Error is constructed without a descriptive message",
            "Pass a message that says what failed and why"));
        break;
      }
    }
    return out;
  }
};

} // namespace

std::unique_ptr<Detector> makeErrorHandlingDetector() {
  return std::make_unique<ErrorHandlingDetector>();
}

} // namespace mcc
