#include "DetectorSupport.hpp"

namespace mcc {

namespace {

struct PointerParam {
  std::string name;
  bool owned = false;
};

// Parameters of the header whose type mentions UnsafePointer.
std::vector<PointerParam> pointerParams(const std::string& header) {
  std::vector<PointerParam> out;
  auto toks = tokenizeLine(header);
  std::vector<std::vector<Token>> params;
  int depth = 0;
  bool inArgs = false;
  for (const auto& t : toks) {
    if (t.isPunct("(") || t.isPunct("[")) {
      if (depth++ == 0 && t.isPunct("(") && !inArgs) {
        inArgs = true;
        params.emplace_back();
        continue;
      }
    } else if (t.isPunct(")") || t.isPunct("]")) {
      if (--depth == 0 && inArgs) break;
    } else if (inArgs && depth == 1 && t.isPunct(",")) {
      params.emplace_back();
      continue;
    }
    if (inArgs && depth >= 1) params.back().push_back(t);
  }

  for (const auto& p : params) {
    if (p.empty()) continue;
    bool pointer = false;
    for (const auto& t : p) pointer = pointer || t.isIdent("UnsafePointer");
    if (!pointer) continue;
    PointerParam pp;
    pp.owned = p[0].isIdent("owned");
    for (size_t k = 0; k + 1 < p.size(); ++k) {
      if (p[k + 1].isPunct(":") && p[k].kind == TokenKind::Identifier) { pp.name = p[k].text; break; }
    }
    out.push_back(pp);
  }
  return out;
}

bool callsFree(const SourceFile& file, const BlockSpan& body, llvm::StringRef receiver = "") {
  for (size_t j = body.begin; j < body.end; ++j) {
    if (file.isExcluded(j)) continue;
    const auto& toks = file.tokens(j);
    for (size_t k = 1; k + 1 < toks.size(); ++k) {
      if (!toks[k].isIdent("free") || !toks[k - 1].isPunct(".") || !toks[k + 1].isPunct("("))
        continue;
      if (receiver.empty() || (k >= 2 && toks[k - 2].isIdent(receiver))) return true;
    }
  }
  return false;
}

// The pointer leaves the function: returned, stored on self, or freed.
bool escapes(const SourceFile& file, const BlockSpan& body, size_t from, const std::string& name) {
  if (callsFree(file, body, name)) return true;
  for (size_t j = from + 1; j < body.end; ++j) {
    if (file.isExcluded(j)) continue;
    auto toks = detail::codeTokens(file, j);
    if (toks.empty()) continue;
    bool mentions = false;
    for (const auto& t : toks) mentions = mentions || t.isIdent(name);
    if (!mentions) continue;
    if (toks[0].isIdent("return")) return true;
    if (toks[0].isIdent("self") && toks.size() > 1 && toks[1].isPunct(".")) return true;
  }
  return false;
}

class MemoryDetector final : public Detector {
public:
  const char* name() const override { return "memory"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    for (const auto& fn : detail::functionBodies(file)) {
      const BlockSpan& body = fn.span;
      if (isKernel(file, body)) continue;

      bool freed = callsFree(file, body);
      for (const auto& p : pointerParams(headerText(file.lines(), body.headerLine))) {
        if (!p.owned || freed) continue;
        out.push_back(makeViolation("POSSIBLE_LEAK", Category::MemoryManagement,
            Severity::Warning, file.path(), body.headerLine,
            "Function '" + fn.name + "' takes ownership of pointer '" + p.name +
                "' but never frees memory",
            "Call free() on the pointer or take it by reference instead of owned"));
      }

      for (size_t j = body.begin; j < body.end; ++j) {
        if (file.isExcluded(j)) continue;
        auto toks = detail::codeTokens(file, j);
        if (toks.size() < 4 || !toks[0].isIdent("var") || toks[1].kind != TokenKind::Identifier)
          continue;
        bool alloc = false;
        for (size_t k = 1; k + 1 < toks.size(); ++k)
          alloc = alloc || (toks[k].isIdent("alloc") && toks[k - 1].isPunct(".") &&
                            toks[k + 1].isPunct("("));
        if (!alloc || escapes(file, body, j, toks[1].text)) continue;
        out.push_back(makeViolation("ALLOC_WITHOUT_FREE", Category::MemoryManagement,
            Severity::Observation, file.path(), j,
            "Pointer '" + toks[1].text + "' is allocated but never freed, returned or stored",
            "Free the allocation before the function returns"));
      }
    }
    return out;
  }

private:
  static bool isKernel(const SourceFile& file, const BlockSpan& body) {
    for (size_t j = body.begin; j < body.end; ++j) {
      if (file.isExcluded(j)) continue;
      for (const auto& t : file.tokens(j)) {
        if (t.kind == TokenKind::Identifier && detail::isKernelIndicator(t.text)) return true;
      }
    }
    return false;
  }
};

} // namespace

std::unique_ptr<Detector> makeMemoryDetector() { return std::make_unique<MemoryDetector>(); }

} // namespace mcc
