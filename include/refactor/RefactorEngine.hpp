#pragma once
#include "analyzers/Violation.hpp"
#include <string>
#include <vector>

namespace mcc {

class Validator; // fwd-decl

struct FixOptions {
  bool apply = false;         // --enable-auto-fix; otherwise only plan
  bool backup = true;         // write <file>.backup before rewriting
  bool keepBackups = false;
  bool autoCleanup = false;   // drop the backup after a validated fix
  int retentionDays = 7;
};

enum class FixStatus { NothingToFix, Planned, Applied, RolledBack, Failed };

struct FixOutcome {
  FixStatus status = FixStatus::NothingToFix;
  std::vector<FixIt> fixes;   // accepted fixes, in file order
  size_t skipped = 0;         // dropped because they overlapped
  std::string backupPath;     // empty when no backup file was written
  std::string message;
};

const char* fixStatusName(FixStatus s);

// Read -> Backup -> Transform -> Write -> Validate -> (Rollback | Cleanup).
// Offsets/lengths are byte-based in original file content.
class RefactorEngine {
public:
  RefactorEngine(FixOptions opts, Validator* validator);

  FixOutcome fixFile(const std::string& path, const std::vector<Violation>& violations) const;

  // Drops fixes overlapping an earlier one; result is sorted by offset.
  static std::vector<FixIt> selectFixes(std::vector<FixIt> fixes, size_t* skipped);

  // Applies sorted, non-overlapping fixes to `content` from the end backwards.
  static bool applyFixes(std::string& content, const std::vector<FixIt>& fixes, std::string* error);

private:
  FixOptions opts_;
  Validator* validator_;
};

} // namespace mcc
