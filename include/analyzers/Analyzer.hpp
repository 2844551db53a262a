#pragma once
#include "analyzers/Violation.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mcc {

struct CheckerOptions {
  bool showObservations = false;
  bool checkDocstringCode = false;  // also check code inside docstrings
  std::set<std::string> excludedDirs{
    ".git", ".hg", ".svn", "__pycache__", ".pixi", ".magic", ".venv", "venv",
    "node_modules", "build", "dist", ".mojo_cache"};
  std::set<std::string> extensions{".mojo", ".\xF0\x9F\x94\xA5"};
};

class SourceFile; // fwd-decl

// One family of pattern checks. Detectors are stateless and independent.
class Detector {
public:
  virtual ~Detector() = default;
  virtual const char* name() const = 0;
  virtual std::vector<Violation> detect(const SourceFile& file,
                                        const CheckerOptions& opts) const = 0;
};

std::unique_ptr<Detector> makeImportDetector();
std::unique_ptr<Detector> makeStructDetector();
std::unique_ptr<Detector> makeVariableDetector();
std::unique_ptr<Detector> makeGpuDetector();
std::unique_ptr<Detector> makeDocDetector();
std::unique_ptr<Detector> makeErrorHandlingDetector();
std::unique_ptr<Detector> makePerformanceDetector();
std::unique_ptr<Detector> makeMemoryDetector();

// All eight families, in report order.
std::vector<std::unique_ptr<Detector>> makeAllDetectors();

} // namespace mcc
