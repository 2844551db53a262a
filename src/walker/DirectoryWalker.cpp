#include "walker/DirectoryWalker.hpp"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;
namespace mcc {

bool isSourceFile(const std::string& path, const CheckerOptions& opts) {
  return opts.extensions.count(fs::path(path).extension().string()) > 0;
}

std::vector<std::string> discoverSourceFiles(const std::string& root, const CheckerOptions& opts) {
  std::vector<std::string> files;
  std::error_code ec;
  fs::file_status st = fs::status(root, ec);
  if (ec || !fs::exists(st)) {
    llvm::WithColor::warning() << "cannot access " << root << ": "
                               << (ec ? ec.message() : "no such file or directory") << "\n";
    return files;
  }
  if (!fs::is_directory(st)) {
    if (isSourceFile(root, opts)) files.push_back(root);
    return files;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
  if (ec) {
    llvm::WithColor::warning() << "cannot read " << root << ": " << ec.message() << "\n";
    return files;
  }
  while (it != end) {
    const auto& path = it->path();
    std::error_code typeEc;
    if (it->is_directory(typeEc)) {
      if (opts.excludedDirs.count(path.filename().string())) it.disable_recursion_pending();
    } else if (it->is_regular_file(typeEc) && isSourceFile(path.string(), opts)) {
      files.push_back(path.string());
    }
    it.increment(ec);
    if (ec) {
      llvm::WithColor::warning() << "stopped walking " << root << ": " << ec.message() << "\n";
      break;
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace mcc
