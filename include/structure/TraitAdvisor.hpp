#pragma once
#include "analyzers/Violation.hpp"
#include "structure/LifecycleAnalyzer.hpp"
#include "structure/StructExtractor.hpp"
#include <string>
#include <vector>

namespace mcc {

class SourceFile; // fwd-decl

struct TraitRecommendation {
  bool addCopyTrait = false;
  bool addMoveTrait = false;
  bool removeCopyMethod = false;
  bool removeMoveMethod = false;

  bool empty() const {
    return !addCopyTrait && !addMoveTrait && !removeCopyMethod && !removeMoveMethod;
  }
  bool operator==(const TraitRecommendation& o) const {
    return addCopyTrait == o.addCopyTrait && addMoveTrait == o.addMoveTrait &&
           removeCopyMethod == o.removeCopyMethod && removeMoveMethod == o.removeMoveMethod;
  }
};

// Trait/method correspondence. Traits are only ever added on the strength of
// a trivial method; a declared trait is never suggested for removal.
TraitRecommendation recommendTraits(bool hasCopyTrait, bool hasMoveTrait,
                                    bool trivialCopy, bool trivialMove);

// Suggestion-severity violations (with fix-its) for one struct.
std::vector<Violation> traitViolations(const SourceFile& file, const StructInfo& info,
                                       const LifecycleAnalysis& lifecycle);

} // namespace mcc
