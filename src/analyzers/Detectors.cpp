#include "analyzers/Analyzer.hpp"

namespace mcc {

std::vector<std::unique_ptr<Detector>> makeAllDetectors() {
  std::vector<std::unique_ptr<Detector>> all;
  all.push_back(makeImportDetector());
  all.push_back(makeStructDetector());
  all.push_back(makeVariableDetector());
  all.push_back(makeGpuDetector());
  all.push_back(makeDocDetector());
  all.push_back(makeErrorHandlingDetector());
  all.push_back(makePerformanceDetector());
  all.push_back(makeMemoryDetector());
  return all;
}

} // namespace mcc
