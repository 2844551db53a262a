#pragma once
#include <string>
#include <vector>

namespace mcc {

struct CleanupResult {
  std::vector<std::string> removed;
  size_t kept = 0;
  std::vector<std::string> failures;
};

// Sibling `<file>.backup` copies taken before a file is rewritten.
class BackupManager {
public:
  static std::string backupPathFor(const std::string& path);

  // Copies the file and reads the copy back; only a verified copy counts.
  static bool createBackup(const std::string& path, std::string* error);
  static bool restoreBackup(const std::string& path, std::string* error);
  static bool removeBackup(const std::string& path, std::string* error);

  // Deletes *.backup files under dir older than retentionDays (0: all).
  static CleanupResult cleanupExpired(const std::string& dir, int retentionDays);
};

} // namespace mcc
