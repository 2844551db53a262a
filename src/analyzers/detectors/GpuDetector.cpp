#include "DetectorSupport.hpp"

namespace mcc {

namespace {

struct Replacement { const char* retired; const char* current; };

const Replacement kRetiredMethods[] = {
  {"create_buffer",            "enqueue_create_buffer"},
  {"create_buffer_sync",       "enqueue_create_buffer"},
  {"copy_to_device",           "enqueue_copy"},
  {"copy_from_device",         "enqueue_copy"},
  {"enqueue_copy_to_device",   "enqueue_copy"},
  {"enqueue_copy_from_device", "enqueue_copy"},
};

const char* const kSimulationLabels[] = {"SIMULATED", "SIMULATION", "PLACEHOLDER", "MOCK"};

// Search helpers whose argument is a label being looked for, not emitted.
bool isSearchCall(const Token& t) {
  return t.isIdent("find") || t.isIdent("count") || t.isIdent("startswith") ||
         t.isIdent("endswith") || t.isIdent("contains");
}

class GpuDetector final : public Detector {
public:
  const char* name() const override { return "gpu"; }

  std::vector<Violation> detect(const SourceFile& file, const CheckerOptions&) const override {
    std::vector<Violation> out;
    bool hasContext = file.mentions("DeviceContext");
    bool reportedContext = false;

    for (size_t i = 0; i < file.lineCount(); ++i) {
      if (file.isExcluded(i)) continue;
      auto toks = detail::codeTokens(file, i);

      for (size_t k = 0; k < toks.size(); ++k) {
        const Token& t = toks[k];

        if (t.kind == TokenKind::Identifier && k > 0 && toks[k - 1].isPunct(".") &&
            k + 1 < toks.size() && (toks[k + 1].isPunct("(") || toks[k + 1].isPunct("["))) {
          for (const auto& r : kRetiredMethods) {
            if (t.text != r.retired) continue;
            out.push_back(makeViolation("GPU_RETIRED_API", Category::GpuPattern,
                Severity::Error, file.path(), i,
                std::string("DeviceContext method '") + r.retired + "' has been retired",
                std::string("Call '") + r.current + "' instead"));
          }
        }

        if (!hasContext && !reportedContext && t.kind == TokenKind::Identifier &&
            detail::isKernelIndicator(t.text)) {
          reportedContext = true;
          out.push_back(makeViolation("GPU_MISSING_CONTEXT", Category::GpuPattern,
              Severity::Error, file.path(), i,
              "GPU kernel code uses '" + t.text + "' but no DeviceContext is set up",
              "Create a DeviceContext and launch the kernel with enqueue_function"));
        }

        if (t.kind == TokenKind::String && isSimulationLabel(toks, k)) {
          out.push_back(makeViolation("SIMULATION_LABEL", Category::GpuPattern,
              Severity::Warning, file.path(), i,
              "Output is labelled as simulated or placeholder",
              "Run the real GPU path or remove the simulation label"));
          break;
        }
      }
    }
    return out;
  }

private:
  static bool isSimulationLabel(const std::vector<Token>& toks, size_t k) {
    llvm::StringRef body = stringContents(toks[k]);
    bool labelled = false;
    for (const char* label : kSimulationLabels) {
      if (body.contains(label)) { labelled = true; break; }
    }
    if (!labelled) return false;
    if (toks.size() == 1 || toks[k].continued) return false;  // docstring

    // `"SIMULATED" in text` or `text.find("SIMULATED")`: detection, not a label
    if (k + 1 < toks.size() && toks[k + 1].isIdent("in")) return false;
    if (k >= 2 && toks[k - 1].isPunct("(") && isSearchCall(toks[k - 2])) return false;
    for (const auto& t : toks) {
      if (t.isPunct("==") || t.isPunct("!=")) return false;
    }
    return true;
  }
};

} // namespace

std::unique_ptr<Detector> makeGpuDetector() { return std::make_unique<GpuDetector>(); }

} // namespace mcc
