#include "analyzers/ComplianceReport.hpp"
#include <algorithm>

namespace mcc {

ComplianceReport::ComplianceReport(std::string file, size_t totalLines)
  : file_(std::move(file)), totalLines_(totalLines),
    createdAt_(std::chrono::system_clock::now()) {}

void ComplianceReport::addViolation(Violation v) {
  violations_.push_back(std::move(v));
}

void ComplianceReport::markFileAccessFailure(const std::string& reason) {
  accessFailed_ = true;
  addViolation(makeViolation("FILE_ACCESS", Category::FileAccess, Severity::Error, file_, 0,
                             "Cannot read file: " + reason,
                             "Check that the file exists and is readable"));
  score_ = 0.0;
}

size_t ComplianceReport::count(Severity s) const {
  return (size_t)std::count_if(violations_.begin(), violations_.end(),
                               [s](const Violation& v) { return v.severity == s; });
}

double ComplianceReport::calculateScore() {
  if (accessFailed_) return score_ = 0.0;
  if (totalLines_ == 0) return score_ = 100.0;
  double raw = 100.0 - 10.0 * (double)count(Severity::Error)
                     - 5.0 * (double)count(Severity::Warning);
  score_ = std::max(0.0, raw);
  return score_;
}

ScanSummary summarize(const std::vector<ComplianceReport>& reports) {
  ScanSummary s;
  s.files = reports.size();
  double total = 0.0;
  for (const auto& r : reports) {
    s.violations += r.violations().size();
    s.errors += r.count(Severity::Error);
    s.warnings += r.count(Severity::Warning);
    s.suggestions += r.count(Severity::Suggestion);
    s.observations += r.count(Severity::Observation);
    total += r.score();
  }
  if (!reports.empty()) s.averageScore = total / (double)reports.size();
  return s;
}

} // namespace mcc
