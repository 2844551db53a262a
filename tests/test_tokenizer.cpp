#include <gtest/gtest.h>
#include "source/SourceFile.hpp"
#include "source/Tokenizer.hpp"

using namespace mcc;

TEST(TokenizerTest, SplitsIdentifiersPunctuationAndComments) {
  auto toks = tokenizeLine("  fn area(self) -> Float64:  # doc");
  ASSERT_EQ(toks.size(), 9u);
  EXPECT_TRUE(toks[0].isIdent("fn"));
  EXPECT_EQ(toks[0].column, 2u);
  EXPECT_TRUE(toks[1].isIdent("area"));
  EXPECT_TRUE(toks[2].isPunct("("));
  EXPECT_TRUE(toks[5].isPunct("->"));
  EXPECT_TRUE(toks[6].isIdent("Float64"));
  EXPECT_TRUE(toks[7].isPunct(":"));
  EXPECT_EQ(toks[8].kind, TokenKind::Comment);
  EXPECT_EQ(toks[8].text, "# doc");
}

TEST(TokenizerTest, KeepsMultiCharacterOperatorsWhole) {
  auto toks = tokenizeLine("a //= b ** 2 != c");
  ASSERT_EQ(toks.size(), 7u);
  EXPECT_TRUE(toks[1].isPunct("//="));
  EXPECT_TRUE(toks[3].isPunct("**"));
  EXPECT_TRUE(toks[5].isPunct("!="));
}

TEST(TokenizerTest, HashInsideStringIsNotAComment) {
  auto toks = tokenizeLine("var s = \"a # b\"  # trailing");
  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[3].kind, TokenKind::String);
  EXPECT_EQ(toks[3].text, "\"a # b\"");
  EXPECT_EQ(toks[4].kind, TokenKind::Comment);
}

TEST(TokenizerTest, StringPrefixesAndEscapes) {
  auto toks = tokenizeLine(R"(x = r"raw\d" + 'it\'s')");
  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[2].kind, TokenKind::String);
  EXPECT_EQ(stringContents(toks[2]), "raw\\d");
  EXPECT_EQ(toks[4].kind, TokenKind::String);
  EXPECT_FALSE(toks[4].unterminated);
}

TEST(TokenizerTest, OpenTripleQuoteRunsToEndOfLine) {
  auto toks = tokenizeLine("var doc = \"\"\"starts here");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[3].kind, TokenKind::String);
  EXPECT_TRUE(toks[3].unterminated);
  EXPECT_EQ(stringContents(toks[3]), "starts here");
}

TEST(TokenizerTest, CodeViewDropsCommentsAndBlanksStrings) {
  llvm::StringRef line = "print(\"let x = 1\", y)  # let z";
  EXPECT_EQ(codeView(tokenizeLine(line), line), "print(\"\", y)");

  llvm::StringRef open = "doc = \"\"\"text";
  EXPECT_EQ(codeView(tokenizeLine(open), open), "doc = \"\"\"");
}

TEST(TokenizerTest, IndentAndBlankHelpers) {
  EXPECT_EQ(indentOf("    x"), 4u);
  EXPECT_EQ(indentOf("\t  x"), 6u);
  EXPECT_TRUE(isBlankOrComment("   "));
  EXPECT_TRUE(isBlankOrComment("   # note"));
  EXPECT_FALSE(isBlankOrComment("  x = 1"));
}

TEST(SourceFileTest, LinesAndOffsets) {
  std::vector<unsigned> offsets;
  auto lines = splitLines("a\r\nbc\n\nd", &offsets);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[1], "bc");
  EXPECT_EQ(lines[2], "");
  EXPECT_EQ(lines[3], "d");
  ASSERT_EQ(offsets.size(), 5u);
  EXPECT_EQ(offsets[1], 3u);
  EXPECT_EQ(offsets[3], 7u);
  EXPECT_EQ(offsets[4], 8u);

  EXPECT_EQ(splitLines("x\n").size(), 1u);
  EXPECT_TRUE(splitLines("").empty());
}

TEST(SourceFileTest, MentionsIgnoresStringsAndDocstrings) {
  SourceFile file("m.mojo",
                  "\"\"\"\nUses DeviceContext in prose.\n\"\"\"\nprint(\"DeviceContext\")\n",
                  false);
  EXPECT_FALSE(file.mentions("DeviceContext"));
  EXPECT_TRUE(file.mentions("print"));
}

TEST(TokenizerTest, ClosingLineKeepsOnlyTheTailAsCode) {
  llvm::StringRef line = "    let x = 1\"\"\" + tail  # note";
  auto toks = tokenizeClosingLine(line, 16);
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, TokenKind::String);
  EXPECT_TRUE(toks[0].continued);
  EXPECT_EQ(toks[0].column, 4u);
  EXPECT_EQ(stringContents(toks[0]), "let x = 1");
  EXPECT_TRUE(toks[1].isPunct("+"));
  EXPECT_EQ(toks[1].column, 17u);
  EXPECT_TRUE(toks[2].isIdent("tail"));
  EXPECT_EQ(toks[3].kind, TokenKind::Comment);
  EXPECT_EQ(codeView(toks, line), "    \"\"\" + tail");

  EXPECT_EQ(tokenizeClosingLine("x = 1", 0).size(), 3u);
}

TEST(SourceFileTest, ClosingDocLineIsNotCode) {
  SourceFile file("m.mojo", "\"\"\"Notes.\nSee DeviceContext.\"\"\"\nprint(1)\n", false);
  EXPECT_FALSE(file.mentions("DeviceContext"));
  EXPECT_EQ(file.code(1), "\"\"\"");

  SourceFile checked("m.mojo", "\"\"\"Notes.\nSee DeviceContext.\"\"\"\nprint(1)\n", true);
  EXPECT_TRUE(checked.mentions("DeviceContext"));
}
