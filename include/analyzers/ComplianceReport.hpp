#pragma once
#include "analyzers/Violation.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace mcc {

// Violations found in one file and the score derived from them.
class ComplianceReport {
public:
  ComplianceReport(std::string file, size_t totalLines);

  void addViolation(Violation v);

  // The file could not be read: one FILE_ACCESS error, score pinned to 0.
  void markFileAccessFailure(const std::string& reason);

  // max(0, 100 - 10*errors - 5*warnings); 100 for an empty file.
  double calculateScore();

  const std::string& file() const { return file_; }
  size_t totalLines() const { return totalLines_; }
  const std::vector<Violation>& violations() const { return violations_; }
  double score() const { return score_; }
  bool fileAccessFailed() const { return accessFailed_; }
  std::chrono::system_clock::time_point createdAt() const { return createdAt_; }

  size_t count(Severity s) const;

private:
  std::string file_;
  size_t totalLines_ = 0;
  std::vector<Violation> violations_;
  double score_ = 100.0;
  bool accessFailed_ = false;
  std::chrono::system_clock::time_point createdAt_;
};

struct ScanSummary {
  size_t files = 0;
  size_t violations = 0;
  size_t errors = 0;
  size_t warnings = 0;
  size_t suggestions = 0;
  size_t observations = 0;
  double averageScore = 100.0;
};

ScanSummary summarize(const std::vector<ComplianceReport>& reports);

} // namespace mcc
