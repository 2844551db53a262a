#include "DetectorSupport.hpp"

namespace mcc {

namespace {

const char* const kLetMarker = "  # TODO: verify mutability (was let)";

class VariableDetector final : public Detector {
public:
  const char* name() const override { return "variables"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i)) continue;
      auto toks = detail::codeTokens(file, i);
      if (toks.empty()) continue;

      if (toks[0].isIdent("let") && toks.size() > 1 &&
          (toks[1].kind == TokenKind::Identifier || toks[1].isPunct("("))) {
        Violation v = makeViolation("LET_BINDING", Category::VariableDeclaration,
            Severity::Error, file.path(), i,
            "'let' bindings are no longer supported",
            "Declare the binding with 'var'");
        llvm::StringRef line = file.line(i);
        llvm::StringRef rest = line.substr(toks[0].column + 3);
        FixIt fx;
        fx.file = file.path();
        fx.offset = file.offsetOf(i) + toks[0].column;
        fx.length = (unsigned)(line.size() - toks[0].column);
        fx.replacement = "var" + rest.rtrim().str() + kLetMarker;
        fx.note = "Replace let with var";
        v.fixes.push_back(std::move(fx));
        out.push_back(std::move(v));
      }

      if (!file.excludedPrefix(i) && !functionName(file.line(i)).empty()) checkConventions(file, i, out);
    }
    return out;
  }

private:
  static void checkConventions(const SourceFile& file, size_t i, std::vector<Violation>& out) {
    size_t end = findHeaderEnd(file.lines(), i);
    if (end == std::string::npos) end = i;
    for (size_t j = i; j <= end; ++j) {
      for (const auto& t : detail::codeTokens(file, j)) {
        const char* current = t.isIdent("inout") ? "mut"
                            : t.isIdent("borrowed") ? "read" : nullptr;
        if (!current) continue;
        out.push_back(makeViolation("DEPRECATED_ARG_CONVENTION", Category::VariableDeclaration,
            Severity::Warning, file.path(), j,
            "Argument convention '" + t.text + "' is deprecated",
            std::string("Use '") + current + "' instead"));
      }
    }
  }
};

} // namespace

std::unique_ptr<Detector> makeVariableDetector() { return std::make_unique<VariableDetector>(); }

} // namespace mcc
