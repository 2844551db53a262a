#include "report/ReportWriter.hpp"
#include "llvm/Support/Format.h"

namespace mcc {

void writeSummary(llvm::raw_ostream& os, const ScanSummary& s) {
  os << "== Mojo compliance summary ==\n";
  os << "  files:         " << s.files << "\n";
  os << "  violations:    " << s.violations << "\n";
  os << "  errors:        " << s.errors << "\n";
  os << "  warnings:      " << s.warnings << "\n";
  os << "  suggestions:   " << s.suggestions << "\n";
  os << "  observations:  " << s.observations << "\n";
  os << "  average score: " << llvm::format("%.1f", s.averageScore) << "\n";
}

void writeViolation(llvm::raw_ostream& os, const Violation& v, bool detailed) {
  os << v.file << ":" << v.line << ": " << severityName(v.severity)
     << " [" << v.id << "] (" << categoryName(v.category) << ") " << v.description << "\n";
  if (!detailed) return;
  if (!v.suggestion.empty()) os << "    suggestion: " << v.suggestion << "\n";
  for (const auto& f : v.fixes) {
    os << "    fix: " << f.note << " (offset " << f.offset << ", len " << f.length << ")\n";
  }
}

void writeFileReport(llvm::raw_ostream& os, const ComplianceReport& r, ReportStyle style) {
  if (style == ReportStyle::Brief) {
    for (const auto& v : r.violations()) writeViolation(os, v, false);
    return;
  }
  os << "\n-- " << r.file() << " --\n";
  os << "  lines: " << r.totalLines()
     << "  score: " << llvm::format("%.1f", r.score())
     << "  errors: " << r.count(Severity::Error)
     << "  warnings: " << r.count(Severity::Warning)
     << "  suggestions: " << r.count(Severity::Suggestion)
     << "  observations: " << r.count(Severity::Observation) << "\n";
  if (r.violations().empty()) {
    os << "  no violations\n";
    return;
  }
  for (const auto& v : r.violations()) {
    os << "  ";
    writeViolation(os, v, true);
  }
}

void writeReports(llvm::raw_ostream& os, const std::vector<ComplianceReport>& reports,
                  ReportStyle style) {
  writeSummary(os, summarize(reports));
  if (style == ReportStyle::Brief && !reports.empty()) os << "\n";
  for (const auto& r : reports) writeFileReport(os, r, style);
}

} // namespace mcc
