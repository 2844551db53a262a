#include <gtest/gtest.h>
#include "analyzers/ComplianceChecker.hpp"
#include "report/ReportWriter.hpp"
#include "llvm/Support/raw_ostream.h"

using namespace mcc;

namespace {

Violation finding(Severity s) {
  return makeViolation("TEST_RULE", Category::StructPattern, s, "f.mojo", 0, "test", "");
}

} // namespace

TEST(ComplianceReportTest, ScoreFormula) {
  ComplianceReport r("f.mojo", 20);
  for (int i = 0; i < 3; ++i) r.addViolation(finding(Severity::Error));
  for (int i = 0; i < 2; ++i) r.addViolation(finding(Severity::Warning));
  EXPECT_DOUBLE_EQ(r.calculateScore(), 60.0);

  r.addViolation(finding(Severity::Suggestion));
  r.addViolation(finding(Severity::Observation));
  EXPECT_DOUBLE_EQ(r.calculateScore(), 60.0);
}

TEST(ComplianceReportTest, ClampedAtZero) {
  ComplianceReport r("f.mojo", 20);
  for (int i = 0; i < 15; ++i) r.addViolation(finding(Severity::Error));
  EXPECT_DOUBLE_EQ(r.calculateScore(), 0.0);
}

TEST(ComplianceReportTest, ScoreIsBoundedAndMonotonic) {
  ComplianceReport r("f.mojo", 50);
  double previous = r.calculateScore();
  EXPECT_DOUBLE_EQ(previous, 100.0);
  const Severity order[] = {Severity::Warning, Severity::Error, Severity::Suggestion,
                            Severity::Error, Severity::Observation, Severity::Warning};
  for (int round = 0; round < 5; ++round) {
    for (Severity s : order) {
      r.addViolation(finding(s));
      double score = r.calculateScore();
      EXPECT_GE(score, 0.0);
      EXPECT_LE(score, 100.0);
      EXPECT_LE(score, previous);
      if (s == Severity::Suggestion || s == Severity::Observation) EXPECT_DOUBLE_EQ(score, previous);
      previous = score;
    }
  }
}

TEST(ComplianceReportTest, EmptyFileScoresFullMarks) {
  ComplianceChecker checker{CheckerOptions()};
  auto empty = checker.checkSource("empty.mojo", "");
  EXPECT_EQ(empty.totalLines(), 0u);
  EXPECT_DOUBLE_EQ(empty.score(), 100.0);
}

TEST(ComplianceReportTest, CleanFileScoresExactlyHundred) {
  ComplianceChecker checker{CheckerOptions()};
  auto clean = checker.checkSource("clean.mojo",
                                   "from collections import List\n"
                                   "\n"
                                   "fn total(values: List[Int]) -> Int:\n"
                                   "    \"\"\"Adds up every value in the list.\n"
                                   "\n"
                                   "    Args:\n"
                                   "        values: Numbers to add.\n"
                                   "\n"
                                   "    Returns:\n"
                                   "        The sum.\n"
                                   "    \"\"\"\n"
                                   "    var sum = 0\n"
                                   "    for v in values:\n"
                                   "        sum += v[]\n"
                                   "    return sum\n");
  EXPECT_TRUE(clean.violations().empty());
  EXPECT_EQ(clean.score(), 100.0);
}

TEST(ComplianceReportTest, UnreadableFileScoresZero) {
  ComplianceChecker checker{CheckerOptions()};
  auto r = checker.checkFile("/nonexistent/dir/missing.mojo");
  EXPECT_TRUE(r.fileAccessFailed());
  ASSERT_EQ(r.violations().size(), 1u);
  EXPECT_EQ(r.violations()[0].category, Category::FileAccess);
  EXPECT_EQ(r.violations()[0].severity, Severity::Error);
  EXPECT_DOUBLE_EQ(r.score(), 0.0);
  EXPECT_DOUBLE_EQ(r.calculateScore(), 0.0);
}

TEST(ComplianceReportTest, SummaryAveragesScores) {
  ComplianceReport a("a.mojo", 10);
  a.addViolation(finding(Severity::Error));
  a.calculateScore();
  ComplianceReport b("b.mojo", 10);
  b.addViolation(finding(Severity::Warning));
  b.addViolation(finding(Severity::Observation));
  b.calculateScore();

  ScanSummary s = summarize({a, b});
  EXPECT_EQ(s.files, 2u);
  EXPECT_EQ(s.violations, 3u);
  EXPECT_EQ(s.errors, 1u);
  EXPECT_EQ(s.warnings, 1u);
  EXPECT_EQ(s.observations, 1u);
  EXPECT_DOUBLE_EQ(s.averageScore, 92.5);
  EXPECT_DOUBLE_EQ(summarize({}).averageScore, 100.0);
}

TEST(ReportWriterTest, BriefAndDetailedOutput) {
  ComplianceChecker checker{CheckerOptions()};
  std::vector<ComplianceReport> reports = {
    checker.checkSource("imports.mojo", "from .shapes import Circle\n")};

  std::string brief;
  llvm::raw_string_ostream bos(brief);
  writeReports(bos, reports, ReportStyle::Brief);
  bos.flush();
  EXPECT_NE(brief.find("files:         1"), std::string::npos);
  EXPECT_NE(brief.find("average score: 90.0"), std::string::npos);
  EXPECT_NE(brief.find("imports.mojo:1: error [RELATIVE_IMPORT] (import pattern)"),
            std::string::npos);
  EXPECT_EQ(brief.find("suggestion:"), std::string::npos);

  std::string detailed;
  llvm::raw_string_ostream dos(detailed);
  writeReports(dos, reports, ReportStyle::Detailed);
  dos.flush();
  EXPECT_NE(detailed.find("-- imports.mojo --"), std::string::npos);
  EXPECT_NE(detailed.find("suggestion: Use the absolute import"), std::string::npos);
  EXPECT_NE(detailed.find("fix: Rewrite as absolute import"), std::string::npos);
}
