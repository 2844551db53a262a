#include "analyzers/ComplianceChecker.hpp"
#include "refactor/BackupManager.hpp"
#include "refactor/RefactorEngine.hpp"
#include "refactor/Validator.hpp"
#include "report/ReportWriter.hpp"
#include "walker/DirectoryWalker.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>

using namespace mcc;

static llvm::cl::OptionCategory ToolCat("mcc options");

static llvm::cl::SubCommand ScanCmd("scan", "Scan a directory and print every violation");
static llvm::cl::SubCommand ValidateCmd("validate", "Check one file; exit 1 when it has errors");
static llvm::cl::SubCommand FixCmd("fix", "Propose or apply low-risk fixes to one file");
static llvm::cl::SubCommand ReportCmd("report", "Scan a directory and print a detailed report");
static llvm::cl::SubCommand CleanupCmd("cleanup", "Remove expired .backup files under a directory");

static llvm::cl::opt<std::string> ScanPath(
  llvm::cl::Positional, llvm::cl::desc("<dir>"), llvm::cl::Required, llvm::cl::sub(ScanCmd));
static llvm::cl::opt<std::string> ValidatePath(
  llvm::cl::Positional, llvm::cl::desc("<file>"), llvm::cl::Required, llvm::cl::sub(ValidateCmd));
static llvm::cl::opt<std::string> FixPath(
  llvm::cl::Positional, llvm::cl::desc("<file>"), llvm::cl::Required, llvm::cl::sub(FixCmd));
static llvm::cl::opt<std::string> ReportPath(
  llvm::cl::Positional, llvm::cl::desc("<dir>"), llvm::cl::Required, llvm::cl::sub(ReportCmd));
static llvm::cl::opt<std::string> CleanupPath(
  llvm::cl::Positional, llvm::cl::desc("<dir>"), llvm::cl::Required, llvm::cl::sub(CleanupCmd));

static llvm::cl::opt<bool> ShowObservations(
  "show-observations", llvm::cl::desc("Keep observation-level findings in reports"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<bool> CheckDocstringCode(
  "check-docstring-code", llvm::cl::desc("Also check code inside docstrings"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<bool> DisableBackup(
  "disable-backup", llvm::cl::desc("Do not write .backup files when applying fixes"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<bool> KeepBackups(
  "keep-backups", llvm::cl::desc("Never remove backups after a successful fix"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<bool> AutoCleanup(
  "auto-cleanup", llvm::cl::desc("Remove the backup once a fixed file validates"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<int> RetentionDays(
  "retention-days", llvm::cl::desc("Age in days after which cleanup removes backups"),
  llvm::cl::init(7), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<bool> EnableAutoFix(
  "enable-auto-fix", llvm::cl::desc("Write fixes instead of only listing them"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static llvm::cl::opt<bool> Verbose(
  "verbose", llvm::cl::desc("Print progress notes to stderr"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat), llvm::cl::sub(*llvm::cl::AllSubCommands));

static bool isHelpFlag(llvm::StringRef arg) {
  return arg == "-h" || arg == "-help" || arg == "--help" || arg == "--help-hidden" ||
         arg == "-version" || arg == "--version";
}

// The command word and its path come first; flags follow.
static bool checkArgumentOrder(int argc, const char** argv, std::string* error) {
  if (argc < 2 || isHelpFlag(argv[1])) return true;
  llvm::StringRef cmd(argv[1]);
  bool known = llvm::StringSwitch<bool>(cmd)
                 .Cases("scan", "validate", "fix", "report", "cleanup", true)
                 .Default(false);
  if (!known) {
    *error = cmd.startswith("-") ? "the command must come before any flag"
                                 : "unknown command '" + cmd.str() + "'";
    return false;
  }
  if (argc < 3) {
    *error = "'" + cmd.str() + "' needs a path";
    return false;
  }
  llvm::StringRef path(argv[2]);
  if (path.startswith("-") && !isHelpFlag(path)) {
    *error = "the path must come right after '" + cmd.str() + "', before any flag";
    return false;
  }
  return true;
}

static CheckerOptions checkerOptions() {
  CheckerOptions opts;
  opts.showObservations = ShowObservations;
  opts.checkDocstringCode = CheckDocstringCode;
  return opts;
}

static FixOptions fixOptions() {
  FixOptions opts;
  opts.apply = EnableAutoFix;
  opts.backup = !DisableBackup;
  opts.keepBackups = KeepBackups;
  opts.autoCleanup = AutoCleanup;
  opts.retentionDays = RetentionDays;
  return opts;
}

static bool requireDirectory(const std::string& path) {
  if (llvm::sys::fs::is_directory(path)) return true;
  llvm::WithColor::error() << path << " is not a directory\n";
  return false;
}

static int runScan(const std::string& dir, ReportStyle style) {
  if (!requireDirectory(dir)) return 1;
  ComplianceChecker checker(checkerOptions());
  auto files = discoverSourceFiles(dir, checker.options());
  if (Verbose) llvm::WithColor::note() << "found " << files.size() << " source file(s) under " << dir << "\n";

  std::vector<ComplianceReport> reports;
  for (const auto& f : files) {
    if (Verbose) llvm::WithColor::note() << "checking " << f << "\n";
    reports.push_back(checker.checkFile(f));
  }
  writeReports(llvm::outs(), reports, style);
  return 0;
}

static int runValidate(const std::string& path) {
  ComplianceChecker checker(checkerOptions());
  ComplianceReport report = checker.checkFile(path);
  writeReports(llvm::outs(), {report}, ReportStyle::Detailed);
  return report.count(Severity::Error) > 0 ? 1 : 0;
}

static int runFix(const std::string& path) {
  ComplianceChecker checker(checkerOptions());
  ComplianceReport report = checker.checkFile(path);
  if (report.fileAccessFailed()) {
    llvm::WithColor::error() << report.violations().front().description << " (" << path << ")\n";
    return 1;
  }

  FixOptions opts = fixOptions();
  std::unique_ptr<Validator> validator = makeDefaultValidator();
  RefactorEngine engine(opts, validator.get());
  FixOutcome outcome = engine.fixFile(path, report.violations());

  auto& os = llvm::outs();
  for (const auto& f : outcome.fixes) {
    os << path << ": " << (outcome.status == FixStatus::Planned ? "would apply" : "fix")
       << ": " << f.note << " (offset " << f.offset << ", len " << f.length << ")\n";
  }
  if (Verbose && outcome.skipped)
    llvm::WithColor::note() << outcome.skipped << " overlapping fix(es) skipped\n";
  if (Verbose && !outcome.backupPath.empty())
    llvm::WithColor::note() << "backup kept at " << outcome.backupPath << "\n";

  switch (outcome.status) {
  case FixStatus::NothingToFix:
  case FixStatus::Planned:
  case FixStatus::Applied:
    os << path << ": " << fixStatusName(outcome.status) << ": " << outcome.message << "\n";
    return 0;
  case FixStatus::RolledBack:
    llvm::WithColor::error() << path << ": " << outcome.message << "\n";
    return 1;
  case FixStatus::Failed:
    llvm::WithColor::error() << path << ": " << outcome.message << "\n";
    if (!outcome.backupPath.empty())
      llvm::WithColor::note() << "original content is in " << outcome.backupPath << "\n";
    return 1;
  }
  return 1;
}

static int runCleanup(const std::string& dir) {
  if (!requireDirectory(dir)) return 1;
  const FixOptions opts = fixOptions();
  CleanupResult result = BackupManager::cleanupExpired(dir, opts.retentionDays);
  for (const auto& p : result.removed) llvm::outs() << "removed " << p << "\n";
  for (const auto& f : result.failures) llvm::WithColor::warning() << f << "\n";
  llvm::outs() << result.removed.size() << " backup(s) removed, " << result.kept
               << " kept (retention " << opts.retentionDays << " day(s))\n";
  return result.failures.empty() ? 0 : 1;
}

int main(int argc, const char** argv) {
  std::string orderError;
  if (!checkArgumentOrder(argc, argv, &orderError)) {
    llvm::WithColor::error() << orderError << "\n";
    llvm::errs() << "usage: mcc <scan|validate|fix|report|cleanup> <path> [flags]\n";
    return 2;
  }

  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Mojo coding-standard compliance checker\n");

  if (RetentionDays < 0) {
    llvm::WithColor::error() << "--retention-days must not be negative\n";
    return 2;
  }

  if (ScanCmd) return runScan(ScanPath, ReportStyle::Brief);
  if (ReportCmd) return runScan(ReportPath, ReportStyle::Detailed);
  if (ValidateCmd) return runValidate(ValidatePath);
  if (FixCmd) return runFix(FixPath);
  if (CleanupCmd) return runCleanup(CleanupPath);

  llvm::errs() << "usage: mcc <scan|validate|fix|report|cleanup> <path> [flags]\n";
  return 2;
}
