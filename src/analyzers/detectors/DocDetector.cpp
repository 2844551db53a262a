#include "DetectorSupport.hpp"
#include "analyzers/DocQuality.hpp"
#include "refactor/DocStubEngine.hpp"

namespace mcc {

namespace {

class DocDetector final : public Detector {
  std::unique_ptr<DocStubEngine> stubs_{makeHeuristicDocStubs()};

public:
  const char* name() const override { return "docs"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    const auto& lines = file.lines();

    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i) || file.excludedPrefix(i)) continue;

      auto info = parseStructHeader(lines, i);
      std::string fnName = info ? std::string() : functionName(file.line(i));
      if (!info && fnName.empty()) continue;

      size_t headerEnd = findHeaderEnd(lines, i);
      if (headerEnd == std::string::npos) continue;
      // `fn f(): ...` and other one-line bodies carry no docstring
      if (!llvm::StringRef(file.code(headerEnd)).endswith(":")) continue;

      unsigned headerIndent = indentOf(file.line(i));
      size_t j = headerEnd + 1;
      while (j < lines.size() && file.line(j).trim().empty()) ++j;

      bool bodyFollows = j < lines.size() && indentOf(file.line(j)) > headerIndent;
      if (bodyFollows && file.line(j).trim().startswith("\"\"\"")) {
        checkQuality(file, j, info ? "struct '" + info->name + "'" : "function '" + fnName + "'", out);
        continue;
      }

      unsigned bodyIndent = bodyFollows ? indentOf(file.line(j)) : headerIndent + 4;
      FixIt fx;
      fx.file = file.path();
      fx.offset = file.offsetOf(headerEnd + 1);
      fx.note = "Insert placeholder docstring";
      // header on the last line with no newline after it
      std::string lead = headerEnd + 1 == lines.size() &&
                         !llvm::StringRef(file.text()).endswith("\n") ? "\n" : "";

      if (info) {
        Violation v = makeViolation("MISSING_STRUCT_DOC", Category::Documentation,
            Severity::Error, file.path(), i,
            "Struct '" + info->name + "' has no docstring",
            "Add a docstring describing the struct and its fields");
        if (auto doc = stubs_->docForStruct(info->name, bodyIndent)) {
          fx.replacement = lead + *doc;
          v.fixes.push_back(std::move(fx));
        }
        out.push_back(std::move(v));
      } else {
        Violation v = makeViolation("MISSING_FN_DOC", Category::Documentation,
            Severity::Warning, file.path(), i,
            "Function '" + fnName + "' has no docstring",
            "Add a docstring with Args: and Returns: sections");
        if (auto doc = stubs_->docForSignature(headerText(lines, i), bodyIndent)) {
          fx.replacement = lead + *doc;
          v.fixes.push_back(std::move(fx));
        }
        out.push_back(std::move(v));
      }
    }
    return out;
  }

private:
  static void checkQuality(const SourceFile& file, size_t docLine, const std::string& owner,
                           std::vector<Violation>& out) {
    DocAssessment a = assessDocstring(file.lines(), docLine);
    if (a.acceptable()) return;

    const char* id = "DOC_MISSING_SECTIONS";
    std::string suggestion = "Add Args: and Returns: sections";
    if (a.verdict == DocVerdict::TooBrief) {
      id = "DOC_TOO_BRIEF";
      suggestion = "Expand the docstring to say what the declaration does";
    } else if (a.verdict == DocVerdict::MissingDescription) {
      id = "DOC_MISSING_DESCRIPTION";
      suggestion = "Start the docstring with a one-sentence summary";
    }
    out.push_back(makeViolation(id, Category::Documentation, Severity::Suggestion,
        file.path(), docLine,
        "Docstring of " + owner + " is " + docVerdictName(a.verdict), suggestion));
  }
};

} // namespace

std::unique_ptr<Detector> makeDocDetector() { return std::make_unique<DocDetector>(); }

} // namespace mcc
