#include "DetectorSupport.hpp"
#include <set>

namespace mcc {

namespace {

const std::set<std::string> kStdlibModules = {
  "algorithm", "benchmark", "bit", "buffer", "builtin", "collections", "compile",
  "complex", "gpu", "hashlib", "io", "logger", "math", "memory", "os", "pathlib",
  "python", "random", "runtime", "stat", "subprocess", "sys", "tempfile", "testing",
  "time", "utils"};

struct Replacement { const char* retired; const char* current; };

const Replacement kPlatformNames[] = {
  {"has_nvidia_gpu",   "has_nvidia_gpu_accelerator"},
  {"has_amd_gpu",      "has_amd_gpu_accelerator"},
  {"has_gpu",          "has_accelerator"},
  {"is_gpu_available", "has_accelerator"},
};

class ImportDetector final : public Detector {
public:
  const char* name() const override { return "imports"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    size_t firstLocal = std::string::npos;

    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i)) continue;
      auto toks = detail::codeTokens(file, i);
      if (toks.size() < 2) continue;
      bool isFrom = toks[0].isIdent("from");
      if (!isFrom && !toks[0].isIdent("import")) continue;

      if (isFrom && (toks[1].isPunct(".") || toks[1].isPunct("..."))) {
        checkRelative(file, i, toks, out);
        if (firstLocal == std::string::npos) firstLocal = i;
        continue;
      }
      if (toks[1].kind != TokenKind::Identifier) continue;

      const std::string& root = toks[1].text;
      if (kStdlibModules.count(root)) {
        if (firstLocal != std::string::npos) {
          out.push_back(makeViolation("STDLIB_IMPORT_ORDER", Category::ImportPattern,
              Severity::Warning, file.path(), i,
              "Standard library import '" + root + "' follows the project import on line " +
                  std::to_string(firstLocal + 1),
              "Group standard library imports before project imports"));
        }
      } else if (firstLocal == std::string::npos) {
        firstLocal = i;
      }

      if (isFrom && root == "sys") checkPlatformNames(file, i, toks, out);
    }
    return out;
  }

private:
  static void checkRelative(const SourceFile& file, size_t i, const std::vector<Token>& toks,
                            std::vector<Violation>& out) {
    size_t k = 1;
    std::string dots;
    while (k < toks.size() && (toks[k].isPunct(".") || toks[k].isPunct("..."))) {
      dots += toks[k].text;
      ++k;
    }
    std::string module;
    for (; k < toks.size() && !toks[k].isIdent("import"); ++k) module += toks[k].text;

    Violation v = makeViolation("RELATIVE_IMPORT", Category::ImportPattern, Severity::Error,
        file.path(), i,
        "Relative import 'from " + dots + module + "' is not allowed",
        module.empty() ? std::string("Import the package by its absolute name")
                       : "Use the absolute import 'from " + module + " import ...'");
    if (!module.empty()) {
      FixIt fx;
      fx.file = file.path();
      fx.offset = file.offsetOf(i) + toks[1].column;
      fx.length = (unsigned)dots.size();
      fx.note = "Rewrite as absolute import";
      v.fixes.push_back(std::move(fx));
    }
    out.push_back(std::move(v));
  }

  static void checkPlatformNames(const SourceFile& file, size_t i, const std::vector<Token>& toks,
                                 std::vector<Violation>& out) {
    bool afterImport = false;
    for (const auto& t : toks) {
      if (t.isIdent("import")) { afterImport = true; continue; }
      if (!afterImport || t.kind != TokenKind::Identifier) continue;
      for (const auto& r : kPlatformNames) {
        if (t.text != r.retired) continue;
        out.push_back(makeViolation("DEPRECATED_PLATFORM_IMPORT", Category::ImportPattern,
            Severity::Error, file.path(), i,
            std::string("Platform detection name '") + r.retired + "' has been removed",
            std::string("Import '") + r.current + "' instead"));
      }
    }
  }
};

} // namespace

std::unique_ptr<Detector> makeImportDetector() { return std::make_unique<ImportDetector>(); }

} // namespace mcc
