#pragma once
#include "analyzers/Analyzer.hpp"
#include "analyzers/ComplianceReport.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcc {

// Runs every detector over a file and scores the result. Files are checked
// one at a time; a file that cannot be read yields a FILE_ACCESS report and
// the scan continues.
class ComplianceChecker {
public:
  explicit ComplianceChecker(CheckerOptions opts);

  ComplianceReport checkFile(const std::string& path) const;
  ComplianceReport checkSource(const std::string& path, std::string text) const;
  std::vector<ComplianceReport> scanDirectory(const std::string& dir) const;

  const CheckerOptions& options() const { return opts_; }

private:
  CheckerOptions opts_;
  std::vector<std::unique_ptr<Detector>> detectors_;
};

// Reads a whole file; false with a reason in `error` when it cannot.
bool readSourceFile(const std::string& path, std::string& out, std::string* error);

} // namespace mcc
