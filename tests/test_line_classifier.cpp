#include <gtest/gtest.h>
#include "source/LineClassifier.hpp"

using namespace mcc;

TEST(LineClassifierTest, CountsTripleQuotes) {
  EXPECT_EQ(countTripleQuotes("\"\"\"one\"\"\""), 2u);
  EXPECT_EQ(countTripleQuotes("    \"\"\"open"), 1u);
  EXPECT_EQ(countTripleQuotes("no quotes"), 0u);
}

TEST(LineClassifierTest, VariableLiteralNeedsAnAssignment) {
  EXPECT_EQ(variableLiteralOpener("var t = \"\"\""), 8u);
  EXPECT_EQ(variableLiteralOpener("t = \"\"\"x"), 4u);
  EXPECT_EQ(variableLiteralOpener("if t == \"\"\""), llvm::StringRef::npos);
  EXPECT_EQ(variableLiteralOpener("ok = x <= \"\"\""), 10u);
  EXPECT_EQ(variableLiteralOpener("    \"\"\"Docstring."), llvm::StringRef::npos);
}

TEST(LineClassifierTest, DocBlockLinesAreExcludedUnlessChecked) {
  std::vector<std::string> lines = {
    "fn f():",
    "    \"\"\"Summary.",
    "    let x = 1",
    "    \"\"\"",
    "    let y = 2",
  };
  LineClassifier skip(lines, false);
  EXPECT_FALSE(skip.isExcluded(0));
  EXPECT_TRUE(skip.inDocBlock(1));
  EXPECT_TRUE(skip.isExcluded(2));
  EXPECT_FALSE(skip.inDocBlock(3));
  EXPECT_FALSE(skip.isExcluded(4));

  LineClassifier check(lines, true);
  EXPECT_FALSE(check.isExcluded(2));
  EXPECT_TRUE(check.inDocBlock(2));
}

TEST(LineClassifierTest, VariableLiteralIsAlwaysExcluded) {
  std::vector<std::string> lines = {
    "var template = \"\"\"",
    "let inside = 1",
    "\"\"\"",
    "let outside = 2",
  };
  for (bool checkDocs : {false, true}) {
    LineClassifier c(lines, checkDocs);
    EXPECT_TRUE(c.inVariableLiteral(1));
    EXPECT_TRUE(c.isExcluded(1));
    EXPECT_FALSE(c.inVariableLiteral(2));
    EXPECT_FALSE(c.isExcluded(3));
  }
}

TEST(LineClassifierTest, LiteralClosedOnItsOwnLineExcludesNothingAfter) {
  std::vector<std::string> lines = {
    "var t = \"\"\"inline\"\"\"",
    "let z = 1",
  };
  LineClassifier c(lines, false);
  EXPECT_FALSE(c.isExcluded(1));
}

TEST(LineClassifierTest, UnclosedLiteralRunsToEndOfFile) {
  std::vector<std::string> lines = {
    "var t = \"\"\"",
    "a",
    "b",
  };
  LineClassifier c(lines, true);
  EXPECT_TRUE(c.inVariableLiteral(1));
  EXPECT_TRUE(c.inVariableLiteral(2));
}

TEST(LineClassifierTest, MatchesStatelessScan) {
  std::vector<std::string> lines = {
    "\"\"\"Module docs.\"\"\"",
    "var sql = \"\"\"",
    "  select 1",
    "\"\"\"",
    "fn g():",
    "    \"\"\"",
    "    Example:",
    "        let q = 3",
    "    \"\"\"",
    "    var help = \"\"\"usage\"\"\"",
    "    let r = 4",
  };
  for (bool checkDocs : {false, true}) {
    LineClassifier c(lines, checkDocs);
    for (size_t i = 0; i < lines.size(); ++i)
      EXPECT_EQ(c.isExcluded(i), isExcluded(lines, i, checkDocs)) << "line " << i;
  }
}

TEST(LineClassifierTest, ClosingLineContentIsExcludedUpToTheDelimiter) {
  std::vector<std::string> lines = {
    "fn f():",
    "    \"\"\"Summary.",
    "    let x = 1 here.\"\"\"",
    "var t = \"\"\"",
    "let y = 2\"\"\" + suffix",
  };
  LineClassifier skip(lines, false);
  EXPECT_FALSE(skip.isExcluded(2));
  EXPECT_EQ(skip.excludedPrefix(2), 22u);
  EXPECT_EQ(skip.excludedPrefix(4), 12u);
  EXPECT_EQ(skip.excludedPrefix(0), 0u);
  EXPECT_EQ(skip.excludedPrefix(1), 0u);

  LineClassifier check(lines, true);
  EXPECT_EQ(check.excludedPrefix(2), 0u);
  EXPECT_EQ(check.excludedPrefix(4), 12u);
}

TEST(LineClassifierTest, LiteralClosedOnItsOpenerHasNoPrefix) {
  std::vector<std::string> lines = {
    "var t = \"\"\"inline\"\"\"",
    "    \"\"\"One-line doc.\"\"\"",
  };
  LineClassifier c(lines, false);
  EXPECT_EQ(c.excludedPrefix(0), 0u);
  EXPECT_EQ(c.excludedPrefix(1), 0u);
}
