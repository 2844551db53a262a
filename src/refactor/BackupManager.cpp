#include "refactor/BackupManager.hpp"
#include "analyzers/ComplianceChecker.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
namespace mcc {

std::string BackupManager::backupPathFor(const std::string& path) {
  return path + ".backup";
}

bool BackupManager::createBackup(const std::string& path, std::string* error) {
  const std::string backup = backupPathFor(path);
  std::error_code ec;
  fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error) *error = "Failed to back up " + path + ": " + ec.message();
    return false;
  }

  std::string original, copy, err;
  if (!readSourceFile(path, original, &err) || !readSourceFile(backup, copy, &err)) {
    if (error) *error = "Failed to verify backup of " + path + ": " + err;
    return false;
  }
  if (original != copy) {
    if (error) *error = "Backup " + backup + " does not match " + path;
    return false;
  }
  return true;
}

bool BackupManager::restoreBackup(const std::string& path, std::string* error) {
  std::error_code ec;
  fs::copy_file(backupPathFor(path), path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error) *error = "Failed to restore " + path + " from backup: " + ec.message();
    return false;
  }
  return true;
}

bool BackupManager::removeBackup(const std::string& path, std::string* error) {
  std::error_code ec;
  fs::remove(backupPathFor(path), ec);
  if (ec) {
    if (error) *error = "Failed to remove backup of " + path + ": " + ec.message();
    return false;
  }
  return true;
}

CleanupResult BackupManager::cleanupExpired(const std::string& dir, int retentionDays) {
  CleanupResult result;
  const auto maxAge = std::chrono::hours(24) * (retentionDays < 0 ? 0 : retentionDays);
  const auto now = fs::file_time_type::clock::now();

  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
  if (ec) {
    result.failures.push_back(dir + ": " + ec.message());
    return result;
  }
  while (it != end) {
    const fs::path p = it->path();
    std::error_code fileEc;
    if (it->is_regular_file(fileEc) && p.extension() == ".backup") {
      auto written = fs::last_write_time(p, fileEc);
      if (fileEc) {
        result.failures.push_back(p.string() + ": " + fileEc.message());
      } else if (now - written >= maxAge) {
        if (fs::remove(p, fileEc)) result.removed.push_back(p.string());
        else result.failures.push_back(p.string() + ": " + fileEc.message());
      } else {
        ++result.kept;
      }
    }
    it.increment(ec);
    if (ec) {
      result.failures.push_back(dir + ": " + ec.message());
      break;
    }
  }
  return result;
}

} // namespace mcc
