#include "refactor/DocStubEngine.hpp"
#include "source/Tokenizer.hpp"
#include <vector>

namespace mcc {

namespace {

bool isConvention(const std::string& s) {
  return s == "owned" || s == "read" || s == "mut" || s == "inout" || s == "borrowed" ||
         s == "var" || s == "deinit" || s == "ref" || s == "out";
}

class HeuristicDocStubs final : public DocStubEngine {
public:
  std::optional<std::string>
  docForSignature(const std::string& sig, unsigned indent) override {
    auto toks = tokenizeLine(sig);
    if (toks.size() < 2) return std::nullopt;
    const std::string name = toks[1].text;

    // skip compile-time parameters: fn name[T: AnyType](...)
    size_t i = 2;
    if (i < toks.size() && toks[i].isPunct("[")) {
      int d = 0;
      for (; i < toks.size(); ++i) {
        if (toks[i].isPunct("[")) ++d;
        else if (toks[i].isPunct("]") && --d == 0) { ++i; break; }
      }
    }

    // argument names at the top level of the (...) list
    std::vector<std::string> args;
    if (i < toks.size() && toks[i].isPunct("(")) {
      int depth = 1;
      bool expectName = true;
      for (++i; i < toks.size() && depth > 0; ++i) {
        const auto& t = toks[i];
        if (t.isPunct("(") || t.isPunct("[") || t.isPunct("{")) { ++depth; continue; }
        if (t.isPunct(")") || t.isPunct("]") || t.isPunct("}")) { --depth; continue; }
        if (depth == 1 && t.isPunct(",")) { expectName = true; continue; }
        if (depth == 1 && expectName && t.kind == TokenKind::Identifier && !isConvention(t.text)) {
          if (t.text != "self") args.push_back(t.text);
          expectName = false;
        }
      }
    }

    bool returns = false;
    for (; i < toks.size(); ++i) {
      if (toks[i].isPunct("->")) {
        returns = i + 1 < toks.size() && !toks[i + 1].isIdent("None");
        break;
      }
    }

    std::string pad(indent, ' ');
    std::string out;
    out += pad + "\"\"\"TODO: Describe " + name + ".\n";
    if (!args.empty()) {
      out += "\n" + pad + "Args:\n";
      for (const auto& a : args) out += pad + "    " + a + ": TODO.\n";
    }
    if (returns) {
      out += "\n" + pad + "Returns:\n" + pad + "    TODO.\n";
    }
    out += pad + "\"\"\"\n";
    return out;
  }

  std::optional<std::string>
  docForStruct(const std::string& name, unsigned indent) override {
    if (name.empty()) return std::nullopt;
    return std::string(indent, ' ') + "\"\"\"TODO: Describe the " + name + " struct.\"\"\"\n";
  }
};

} // namespace

DocStubEngine* makeHeuristicDocStubs() { return new HeuristicDocStubs(); }

} // namespace mcc
