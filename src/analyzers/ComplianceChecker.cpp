#include "analyzers/ComplianceChecker.hpp"
#include "source/SourceFile.hpp"
#include "walker/DirectoryWalker.hpp"
#include "llvm/Support/MemoryBuffer.h"
#include <algorithm>

namespace mcc {

bool readSourceFile(const std::string& path, std::string& out, std::string* error) {
  auto buf = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                         /*RequiresNullTerminator=*/false);
  if (!buf) {
    if (error) *error = buf.getError().message();
    return false;
  }
  out = (*buf)->getBuffer().str();
  return true;
}

ComplianceChecker::ComplianceChecker(CheckerOptions opts)
  : opts_(std::move(opts)), detectors_(makeAllDetectors()) {}

ComplianceReport ComplianceChecker::checkFile(const std::string& path) const {
  std::string text, err;
  if (!readSourceFile(path, text, &err)) {
    ComplianceReport report(path, 0);
    report.markFileAccessFailure(err);
    return report;
  }
  return checkSource(path, std::move(text));
}

ComplianceReport ComplianceChecker::checkSource(const std::string& path, std::string text) const {
  SourceFile file(path, std::move(text), opts_.checkDocstringCode);
  ComplianceReport report(path, file.lineCount());

  std::vector<Violation> found;
  for (const auto& d : detectors_) {
    for (auto& v : d->detect(file, opts_)) {
      if (v.severity == Severity::Observation && !opts_.showObservations) continue;
      found.push_back(std::move(v));
    }
  }
  std::stable_sort(found.begin(), found.end(),
                   [](const Violation& a, const Violation& b) { return a.line < b.line; });
  for (auto& v : found) report.addViolation(std::move(v));
  report.calculateScore();
  return report;
}

std::vector<ComplianceReport> ComplianceChecker::scanDirectory(const std::string& dir) const {
  std::vector<ComplianceReport> reports;
  for (const auto& path : discoverSourceFiles(dir, opts_)) reports.push_back(checkFile(path));
  return reports;
}

} // namespace mcc
