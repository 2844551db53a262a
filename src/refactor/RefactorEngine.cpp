#include "refactor/RefactorEngine.hpp"
#include "analyzers/ComplianceChecker.hpp"
#include "refactor/BackupManager.hpp"
#include "refactor/Validator.hpp"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <fstream>

namespace mcc {

static bool writeFile(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs << data;
  ofs.flush();
  return (bool)ofs;
}

const char* fixStatusName(FixStatus s) {
  switch (s) {
  case FixStatus::NothingToFix: return "nothing to fix";
  case FixStatus::Planned:      return "planned";
  case FixStatus::Applied:      return "applied";
  case FixStatus::RolledBack:   return "rolled back";
  case FixStatus::Failed:       return "failed";
  }
  return "unknown";
}

RefactorEngine::RefactorEngine(FixOptions opts, Validator* validator)
  : opts_(opts), validator_(validator) {}

std::vector<FixIt> RefactorEngine::selectFixes(std::vector<FixIt> fixes, size_t* skipped) {
  // wider edits first at equal offsets so a deletion wins over an insertion inside it
  std::stable_sort(fixes.begin(), fixes.end(), [](const FixIt& a, const FixIt& b) {
    if (a.offset != b.offset) return a.offset < b.offset;
    return a.length > b.length;
  });

  std::vector<FixIt> out;
  size_t dropped = 0;
  unsigned coveredTo = 0;
  bool any = false;
  for (auto& f : fixes) {
    bool overlaps = any && (f.offset < coveredTo ||
                            (f.offset == out.back().offset && f.length == 0 &&
                             out.back().length == 0));
    if (overlaps) { ++dropped; continue; }
    coveredTo = std::max(coveredTo, f.offset + f.length);
    out.push_back(std::move(f));
    any = true;
  }
  if (skipped) *skipped = dropped;
  return out;
}

bool RefactorEngine::applyFixes(std::string& content, const std::vector<FixIt>& fixes,
                                std::string* error) {
  // apply from highest offset → lowest to keep offsets valid
  for (auto it = fixes.rbegin(); it != fixes.rend(); ++it) {
    if ((size_t)it->offset + it->length > content.size()) {
      if (error) *error = "Out-of-range fix in " + it->file;
      return false;
    }
    content.replace(it->offset, it->length, it->replacement);
  }
  return true;
}

FixOutcome RefactorEngine::fixFile(const std::string& path,
                                   const std::vector<Violation>& violations) const {
  FixOutcome out;

  std::string original, err;
  if (!readSourceFile(path, original, &err)) {
    out.status = FixStatus::Failed;
    out.message = "Failed to read " + path + ": " + err;
    return out;
  }

  std::vector<FixIt> candidates;
  for (const auto& v : violations) {
    for (const auto& f : v.fixes) {
      if (f.file == path) candidates.push_back(f);
    }
  }
  out.fixes = selectFixes(std::move(candidates), &out.skipped);
  if (out.fixes.empty()) {
    out.message = "No automatic fixes available";
    return out;
  }
  if (!opts_.apply) {
    out.status = FixStatus::Planned;
    out.message = std::to_string(out.fixes.size()) + " fix(es) available; rerun with --enable-auto-fix";
    return out;
  }

  if (opts_.backup) {
    if (!BackupManager::createBackup(path, &err)) {
      out.status = FixStatus::Failed;
      out.message = err + "; file left unchanged";
      return out;
    }
    out.backupPath = BackupManager::backupPathFor(path);
  }

  std::string content = original;
  if (!applyFixes(content, out.fixes, &err)) {
    out.status = FixStatus::Failed;
    out.message = err + "; file left unchanged";
    return out;
  }

  // Without a backup file the original bytes held here are the rollback path.
  auto rollback = [&](std::string* rbErr) {
    if (opts_.backup) return BackupManager::restoreBackup(path, rbErr);
    if (writeFile(path, original)) return true;
    if (rbErr) *rbErr = "Failed to rewrite original content of " + path;
    return false;
  };

  if (!writeFile(path, content)) {
    std::string rbErr;
    bool restored = rollback(&rbErr);
    out.status = restored ? FixStatus::RolledBack : FixStatus::Failed;
    out.message = "Failed to write " + path + (restored ? "; original restored" : "; " + rbErr);
    return out;
  }

  std::string why;
  if (validator_ && !validator_->validate(path, &why)) {
    std::string rbErr;
    if (rollback(&rbErr)) {
      out.status = FixStatus::RolledBack;
      out.message = "Validation failed (" + why + "); original restored";
    } else {
      out.status = FixStatus::Failed;
      out.message = "Validation failed (" + why + ") and rollback failed: " + rbErr +
                    (out.backupPath.empty() ? std::string()
                                            : "; restore manually from " + out.backupPath);
    }
    return out;
  }

  out.status = FixStatus::Applied;
  out.message = "Applied " + std::to_string(out.fixes.size()) + " fix(es)";
  if (opts_.backup && opts_.autoCleanup && !opts_.keepBackups) {
    if (BackupManager::removeBackup(path, &err)) {
      out.backupPath.clear();
    } else {
      llvm::WithColor::warning() << err << "\n";
    }
  }
  return out;
}

} // namespace mcc
