#include "structure/LifecycleAnalyzer.hpp"
#include "source/LineClassifier.hpp"
#include "source/Tokenizer.hpp"
#include <algorithm>
#include <set>

namespace mcc {

namespace {

const char* const kConventions[] = {
  "owned", "read", "mut", "inout", "borrowed", "var", "deinit", "ref", "out"};

bool isConvention(const std::string& s) {
  return std::find(std::begin(kConventions), std::end(kConventions), s) != std::end(kConventions);
}

std::vector<Token> significant(const std::string& line) {
  auto toks = tokenizeLine(line);
  if (!toks.empty() && toks.back().kind == TokenKind::Comment) toks.pop_back();
  return toks;
}

// Calls fn(index) for each body line that is code: outside any docstring
// and not blank or a comment.
template <typename Fn>
void forEachCodeLine(const std::vector<std::string>& lines, const BlockSpan& span, Fn fn) {
  bool inString = false;
  for (size_t j = span.begin; j < span.end && j < lines.size(); ++j) {
    unsigned triples = countTripleQuotes(lines[j]);
    bool docLine = inString || triples > 0;
    if (triples % 2) inString = !inString;
    if (docLine || isBlankOrComment(lines[j])) continue;
    if (!fn(j)) return;
  }
}

} // namespace

std::vector<std::string> structFields(const std::vector<std::string>& lines, const BlockSpan& body) {
  std::vector<std::string> fields;
  int level = -1;
  forEachCodeLine(lines, body, [&](size_t j) {
    int indent = (int)indentOf(lines[j]);
    if (level < 0) level = indent;
    if (indent != level) return true;
    auto toks = significant(lines[j]);
    if (toks.size() >= 3 && toks[0].isIdent("var") &&
        toks[1].kind == TokenKind::Identifier && toks[2].isPunct(":"))
      fields.push_back(toks[1].text);
    return true;
  });
  return fields;
}

std::string sourceArgument(const std::string& header) {
  auto toks = tokenizeLine(header);
  std::vector<std::vector<Token>> params;
  int depth = 0;
  for (const auto& t : toks) {
    if (t.isPunct("(") || t.isPunct("[")) {
      if (depth++ == 0 && t.isPunct("(")) { params.emplace_back(); continue; }
    } else if (t.isPunct(")") || t.isPunct("]")) {
      if (--depth == 0) {
        if (t.isPunct(")")) break;
        continue;
      }
    } else if (depth == 1 && t.isPunct(",")) {
      params.emplace_back();
      continue;
    }
    if (depth >= 1 && !params.empty()) params.back().push_back(t);
  }
  if (params.size() < 2) return "existing";
  const auto& last = params.back();
  for (size_t k = 0; k + 1 < last.size(); ++k) {
    if (last[k].kind != TokenKind::Identifier || isConvention(last[k].text)) continue;
    if (last[k + 1].isPunct(":")) return last[k].text;
    break;
  }
  return "existing";
}

bool isTrivialLifecycleBody(const std::vector<std::string>& lines, const BlockSpan& method,
                            LifecycleKind kind, const std::vector<std::string>& fields) {
  const std::string src = sourceArgument(headerText(lines, method.headerLine));
  std::set<std::string> assigned;
  bool trivial = true;

  forEachCodeLine(lines, method, [&](size_t j) {
    auto t = significant(lines[j]);
    size_t want = kind == LifecycleKind::Move ? 8 : 7;
    bool ok = t.size() == want &&
              t[0].isIdent("self") && t[1].isPunct(".") && t[2].kind == TokenKind::Identifier &&
              t[3].isPunct("=") &&
              t[4].isIdent(src) && t[5].isPunct(".") && t[6].isIdent(t[2].text) &&
              (kind == LifecycleKind::Copy || t[7].isPunct("^"));
    if (!ok || !assigned.insert(t[2].text).second) {
      trivial = false;
      return false;
    }
    return true;
  });

  if (!trivial || assigned.empty()) return false;
  if (fields.empty()) return true;
  return assigned == std::set<std::string>(fields.begin(), fields.end());
}

LifecycleAnalysis analyzeLifecycle(const std::vector<std::string>& lines, const BlockSpan& body) {
  LifecycleAnalysis out;
  const auto fields = structFields(lines, body);

  forEachCodeLine(lines, body, [&](size_t j) {
    auto toks = significant(lines[j]);
    if (toks.size() < 2 || !toks[0].isIdent("fn")) return true;

    bool copy = toks[1].isIdent("__copyinit__");
    bool move = toks[1].isIdent("__moveinit__");
    if ((copy && out.copyMethodOffset) || (move && out.moveMethodOffset) || (!copy && !move))
      return true;

    auto method = extractBody(lines, j);
    bool trivial = method && isTrivialLifecycleBody(
        lines, *method, copy ? LifecycleKind::Copy : LifecycleKind::Move, fields);
    if (copy) {
      out.copyMethodOffset = j - body.headerLine;
      out.trivialCopy = trivial;
      out.needsCustomCopy = !trivial;
    } else {
      out.moveMethodOffset = j - body.headerLine;
      out.trivialMove = trivial;
      out.needsCustomMove = !trivial;
    }
    return true;
  });
  return out;
}

} // namespace mcc
