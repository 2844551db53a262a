#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "analyzers/ComplianceChecker.hpp"
#include "refactor/BackupManager.hpp"
#include "refactor/RefactorEngine.hpp"
#include "refactor/Validator.hpp"
#include <chrono>
#include <filesystem>

using namespace mcc;
using mcc::test::TempDir;
using mcc::test::slurp;

namespace fs = std::filesystem;

namespace {

class RejectingValidator final : public Validator {
public:
  int calls = 0;
  bool validate(const std::string&, std::string* error) override {
    ++calls;
    if (error) *error = "build failed";
    return false;
  }
};

FixIt fix(unsigned offset, unsigned length, std::string replacement) {
  FixIt f;
  f.file = "f.mojo";
  f.offset = offset;
  f.length = length;
  f.replacement = std::move(replacement);
  return f;
}

const char* const kSource =
    "from .shapes import Circle\r\n"
    "let radius = 2\r\n";

std::vector<Violation> violationsFor(const std::string& path) {
  ComplianceChecker checker{CheckerOptions()};
  return checker.checkFile(path).violations();
}

} // namespace

TEST(RefactorEngineTest, SelectDropsOverlapsAndSorts) {
  size_t skipped = 0;
  auto kept = RefactorEngine::selectFixes(
      {fix(10, 0, "a"), fix(3, 2, "b"), fix(0, 5, "c"), fix(10, 0, "d"), fix(5, 1, "e")}, &skipped);
  ASSERT_EQ(kept.size(), 3u);
  EXPECT_EQ(kept[0].replacement, "c");
  EXPECT_EQ(kept[1].replacement, "e");
  EXPECT_EQ(kept[2].replacement, "a");
  EXPECT_EQ(skipped, 2u);
}

TEST(RefactorEngineTest, AppliesFromTheEnd) {
  std::string text = "hello world";
  std::string err;
  ASSERT_TRUE(RefactorEngine::applyFixes(text, {fix(0, 5, "HELLO"), fix(6, 5, "there")}, &err));
  EXPECT_EQ(text, "HELLO there");

  std::string shortText = "abc";
  EXPECT_FALSE(RefactorEngine::applyFixes(shortText, {fix(2, 5, "x")}, &err));
  EXPECT_EQ(shortText, "abc");
  EXPECT_FALSE(err.empty());
}

TEST(RefactorEngineTest, DryRunLeavesFileAlone) {
  TempDir dir;
  std::string path = dir.write("shapes.mojo", kSource);
  RefactorEngine engine(FixOptions(), nullptr);

  FixOutcome out = engine.fixFile(path, violationsFor(path));
  EXPECT_EQ(out.status, FixStatus::Planned);
  EXPECT_EQ(out.fixes.size(), 2u);
  EXPECT_EQ(slurp(path), kSource);
  EXPECT_FALSE(fs::exists(BackupManager::backupPathFor(path)));
}

TEST(RefactorEngineTest, AppliesAndKeepsBackup) {
  TempDir dir;
  std::string path = dir.write("shapes.mojo", kSource);
  FixOptions opts;
  opts.apply = true;
  auto validator = makeStructuralValidator();
  RefactorEngine engine(opts, validator.get());

  FixOutcome out = engine.fixFile(path, violationsFor(path));
  EXPECT_EQ(out.status, FixStatus::Applied) << out.message;
  EXPECT_EQ(slurp(path),
            "from shapes import Circle\r\n"
            "var radius = 2  # TODO: verify mutability (was let)\r\n");
  EXPECT_EQ(out.backupPath, BackupManager::backupPathFor(path));
  EXPECT_EQ(slurp(out.backupPath), kSource);
}

TEST(RefactorEngineTest, AutoCleanupRemovesBackupAfterSuccess) {
  TempDir dir;
  std::string path = dir.write("shapes.mojo", kSource);
  FixOptions opts;
  opts.apply = true;
  opts.autoCleanup = true;
  auto validator = makeStructuralValidator();
  RefactorEngine engine(opts, validator.get());

  FixOutcome out = engine.fixFile(path, violationsFor(path));
  EXPECT_EQ(out.status, FixStatus::Applied) << out.message;
  EXPECT_TRUE(out.backupPath.empty());
  EXPECT_FALSE(fs::exists(BackupManager::backupPathFor(path)));

  opts.keepBackups = true;
  std::string other = dir.write("other.mojo", kSource);
  RefactorEngine keeping(opts, validator.get());
  EXPECT_EQ(keeping.fixFile(other, violationsFor(other)).status, FixStatus::Applied);
  EXPECT_TRUE(fs::exists(BackupManager::backupPathFor(other)));
}

TEST(RefactorEngineTest, FailedValidationRestoresOriginalBytes) {
  TempDir dir;
  std::string path = dir.write("shapes.mojo", kSource);
  FixOptions opts;
  opts.apply = true;
  RejectingValidator validator;
  RefactorEngine engine(opts, &validator);

  FixOutcome out = engine.fixFile(path, violationsFor(path));
  EXPECT_EQ(out.status, FixStatus::RolledBack);
  EXPECT_EQ(validator.calls, 1);
  EXPECT_NE(out.message.find("build failed"), std::string::npos);
  EXPECT_EQ(slurp(path), kSource);
}

TEST(RefactorEngineTest, RollbackWithoutBackupFile) {
  TempDir dir;
  std::string path = dir.write("shapes.mojo", kSource);
  FixOptions opts;
  opts.apply = true;
  opts.backup = false;
  RejectingValidator validator;
  RefactorEngine engine(opts, &validator);

  FixOutcome out = engine.fixFile(path, violationsFor(path));
  EXPECT_EQ(out.status, FixStatus::RolledBack);
  EXPECT_TRUE(out.backupPath.empty());
  EXPECT_FALSE(fs::exists(BackupManager::backupPathFor(path)));
  EXPECT_EQ(slurp(path), kSource);
}

TEST(RefactorEngineTest, NothingToFix) {
  TempDir dir;
  std::string path = dir.write("clean.mojo", "from collections import List\n");
  FixOptions opts;
  opts.apply = true;
  RefactorEngine engine(opts, nullptr);
  FixOutcome out = engine.fixFile(path, violationsFor(path));
  EXPECT_EQ(out.status, FixStatus::NothingToFix);
  EXPECT_FALSE(fs::exists(BackupManager::backupPathFor(path)));
}

TEST(RefactorEngineTest, MissingFileFails) {
  RefactorEngine engine(FixOptions(), nullptr);
  FixOutcome out = engine.fixFile("/nonexistent/missing.mojo", {});
  EXPECT_EQ(out.status, FixStatus::Failed);
}

TEST(BackupManagerTest, BackupTransformRollbackRoundTrip) {
  TempDir dir;
  const std::string original("bytes\0with nul\r\nand CRLF", 24);
  std::string path = dir.write("data.mojo", original);

  std::string err;
  ASSERT_TRUE(BackupManager::createBackup(path, &err)) << err;
  dir.write("data.mojo", "rewritten");
  ASSERT_TRUE(BackupManager::restoreBackup(path, &err)) << err;
  EXPECT_EQ(slurp(path), original);

  ASSERT_TRUE(BackupManager::removeBackup(path, &err)) << err;
  EXPECT_FALSE(fs::exists(BackupManager::backupPathFor(path)));
}

TEST(BackupManagerTest, BackupOfMissingFileFails) {
  std::string err;
  EXPECT_FALSE(BackupManager::createBackup("/nonexistent/missing.mojo", &err));
  EXPECT_FALSE(err.empty());
}

TEST(BackupManagerTest, CleanupHonoursRetention) {
  TempDir dir;
  std::string old = dir.write("old.mojo.backup", "o");
  std::string fresh = dir.write("nested/fresh.mojo.backup", "f");
  dir.write("keep.mojo", "k");
  fs::last_write_time(old, fs::file_time_type::clock::now() - std::chrono::hours(24 * 10));

  CleanupResult r = BackupManager::cleanupExpired(dir.path(), 7);
  ASSERT_EQ(r.removed.size(), 1u);
  EXPECT_EQ(r.removed[0], old);
  EXPECT_EQ(r.kept, 1u);
  EXPECT_TRUE(r.failures.empty());
  EXPECT_TRUE(fs::exists(fresh));

  CleanupResult all = BackupManager::cleanupExpired(dir.path(), 0);
  EXPECT_EQ(all.removed.size(), 1u);
  EXPECT_FALSE(fs::exists(fresh));
  EXPECT_TRUE(fs::exists(dir.path() + "/keep.mojo"));
}
