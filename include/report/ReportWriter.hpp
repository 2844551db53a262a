#pragma once
#include "analyzers/ComplianceReport.hpp"
#include "llvm/Support/raw_ostream.h"
#include <vector>

namespace mcc {

enum class ReportStyle {
  Brief,    // summary block, then one line per violation
  Detailed  // summary block, then a block per file with suggestions and fix-its
};

void writeSummary(llvm::raw_ostream& os, const ScanSummary& summary);
void writeViolation(llvm::raw_ostream& os, const Violation& v, bool detailed);
void writeFileReport(llvm::raw_ostream& os, const ComplianceReport& report, ReportStyle style);
void writeReports(llvm::raw_ostream& os, const std::vector<ComplianceReport>& reports,
                  ReportStyle style);

} // namespace mcc
