#include "structure/TraitAdvisor.hpp"
#include "source/SourceFile.hpp"

namespace mcc {

TraitRecommendation recommendTraits(bool hasCopyTrait, bool hasMoveTrait,
                                    bool trivialCopy, bool trivialMove) {
  TraitRecommendation r;
  if (hasCopyTrait && hasMoveTrait) {
    r.removeCopyMethod = trivialCopy;
    r.removeMoveMethod = trivialMove;
  } else if (hasCopyTrait) {
    r.removeCopyMethod = trivialCopy;
    if (trivialMove) { r.addMoveTrait = true; r.removeMoveMethod = true; }
  } else if (hasMoveTrait) {
    r.removeMoveMethod = trivialMove;
    if (trivialCopy) { r.addCopyTrait = true; r.removeCopyMethod = true; }
  } else {
    r.addCopyTrait = r.removeCopyMethod = trivialCopy;
    r.addMoveTrait = r.removeMoveMethod = trivialMove;
  }
  return r;
}

namespace {

// Fix-it adding `traits` to the struct header: appended inside an existing
// trait list, or as a new `(...)` after the name and parameters.
FixIt traitInsertion(const SourceFile& file, const StructInfo& info, const std::string& traits) {
  FixIt fx;
  fx.file = file.path();
  fx.note = "Declare " + traits;

  size_t end = findHeaderEnd(file.lines(), info.headerLine);
  if (end == std::string::npos) end = info.headerLine;

  int depth = 0;
  bool seenName = false, inList = false, inParams = false;
  unsigned insertAt = 0;
  bool haveInsert = false;
  for (size_t j = info.headerLine; j <= end; ++j) {
    for (const auto& t : file.tokens(j)) {
      unsigned off = file.offsetOf(j) + t.column;
      if (!seenName) {
        if (t.isIdent(info.name)) {
          seenName = true;
          insertAt = off + (unsigned)t.text.size();
          haveInsert = true;
        }
        continue;
      }
      if (t.isPunct("[") || t.isPunct("(")) {
        if (depth++ == 0) {
          inParams = t.isPunct("[");
          inList = t.isPunct("(");
        }
        continue;
      }
      if (t.isPunct("]") || t.isPunct(")")) {
        if (--depth == 0) {
          if (inList) {
            fx.offset = off;
            fx.replacement = (info.traits.empty() ? "" : ", ") + traits;
            return fx;
          }
          if (inParams) insertAt = off + 1;
          inParams = false;
        }
        continue;
      }
      if (depth == 0 && t.isPunct(":")) break;
    }
  }
  fx.offset = haveInsert ? insertAt : file.offsetOf(info.headerLine);
  fx.replacement = "(" + traits + ")";
  return fx;
}

// Fix-it deleting a lifecycle method, with its decorators.
FixIt methodRemoval(const SourceFile& file, size_t methodLine, const std::string& method) {
  FixIt fx;
  fx.file = file.path();
  fx.note = "Remove trivial " + method;

  size_t first = methodLine;
  while (first > 0 && file.line(first - 1).trim().startswith("@") &&
         indentOf(file.line(first - 1)) == indentOf(file.line(methodLine)))
    --first;

  size_t last = methodLine + 1;
  if (auto body = extractBody(file.lines(), methodLine)) last = body->end;

  fx.offset = file.offsetOf(first);
  fx.length = file.offsetOf(last) - fx.offset;
  return fx;
}

Violation traitViolation(const SourceFile& file, const std::string& id, size_t line,
                         std::string description, std::string suggestion) {
  return makeViolation(id, Category::TraitUsage, Severity::Suggestion, file.path(), line,
                       std::move(description), std::move(suggestion));
}

} // namespace

std::vector<Violation> traitViolations(const SourceFile& file, const StructInfo& info,
                                       const LifecycleAnalysis& lifecycle) {
  std::vector<Violation> out;
  TraitRecommendation r = recommendTraits(info.hasCopyTrait, info.hasMoveTrait,
                                          lifecycle.trivialCopy, lifecycle.trivialMove);
  if (r.empty()) return out;

  const std::string& name = info.name;
  size_t copyLine = info.headerLine + lifecycle.copyMethodOffset.value_or(0);
  size_t moveLine = info.headerLine + lifecycle.moveMethodOffset.value_or(0);

  // methods made redundant by a trait the struct already declares
  if (r.removeCopyMethod && !r.addCopyTrait) {
    Violation v = traitViolation(file, "TRAIT_REDUNDANT_COPYINIT", copyLine,
        "Struct '" + name + "' declares Copyable and its __copyinit__ only copies fields",
        "Remove the trivial __copyinit__; Copyable already synthesizes it");
    v.fixes.push_back(methodRemoval(file, copyLine, "__copyinit__"));
    out.push_back(std::move(v));
  }
  if (r.removeMoveMethod && !r.addMoveTrait) {
    Violation v = traitViolation(file, "TRAIT_REDUNDANT_MOVEINIT", moveLine,
        "Struct '" + name + "' declares Movable and its __moveinit__ only transfers fields",
        "Remove the trivial __moveinit__; Movable already synthesizes it");
    v.fixes.push_back(methodRemoval(file, moveLine, "__moveinit__"));
    out.push_back(std::move(v));
  }

  if (r.addCopyTrait && r.addMoveTrait) {
    Violation v = traitViolation(file, "TRAIT_ADD_COPYABLE_MOVABLE", info.headerLine,
        "Struct '" + name + "' hand-writes trivial __copyinit__ and __moveinit__",
        "Declare Copyable and Movable and remove both trivial methods");
    v.fixes.push_back(traitInsertion(file, info, "Copyable, Movable"));
    v.fixes.push_back(methodRemoval(file, copyLine, "__copyinit__"));
    v.fixes.push_back(methodRemoval(file, moveLine, "__moveinit__"));
    out.push_back(std::move(v));
  } else if (r.addCopyTrait) {
    Violation v = traitViolation(file, "TRAIT_ADD_COPYABLE", copyLine,
        "Struct '" + name + "' hand-writes a trivial __copyinit__ without declaring Copyable",
        "Add Copyable to the trait list and remove the trivial __copyinit__");
    v.fixes.push_back(traitInsertion(file, info, "Copyable"));
    v.fixes.push_back(methodRemoval(file, copyLine, "__copyinit__"));
    out.push_back(std::move(v));
  } else if (r.addMoveTrait) {
    Violation v = traitViolation(file, "TRAIT_ADD_MOVABLE", moveLine,
        "Struct '" + name + "' hand-writes a trivial __moveinit__ without declaring Movable",
        "Add Movable to the trait list and remove the trivial __moveinit__");
    v.fixes.push_back(traitInsertion(file, info, "Movable"));
    v.fixes.push_back(methodRemoval(file, moveLine, "__moveinit__"));
    out.push_back(std::move(v));
  }
  return out;
}

} // namespace mcc
