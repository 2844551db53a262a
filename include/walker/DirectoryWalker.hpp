#pragma once
#include "analyzers/Analyzer.hpp"
#include <string>
#include <vector>

namespace mcc {

// Source files under `root` (or `root` itself when it is a file), skipping
// excluded directory names, sorted by path.
std::vector<std::string> discoverSourceFiles(const std::string& root, const CheckerOptions& opts);

// Whether `path` has one of the configured source extensions.
bool isSourceFile(const std::string& path, const CheckerOptions& opts);

} // namespace mcc
