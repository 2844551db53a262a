#include <gtest/gtest.h>
#include "structure/StructExtractor.hpp"

using namespace mcc;

TEST(StructExtractorTest, ParsesTraitList) {
  std::vector<std::string> lines = {"struct Point(Copyable, Movable):"};
  auto info = parseStructHeader(lines, 0);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->name, "Point");
  EXPECT_TRUE(info->hasCopyTrait);
  EXPECT_TRUE(info->hasMoveTrait);
  EXPECT_EQ(info->traits, (std::vector<std::string>{"Copyable", "Movable"}));
}

TEST(StructExtractorTest, SkipsCompileTimeParameters) {
  std::vector<std::string> lines = {"struct Box[T: AnyType, size: Int](Movable, Sized):"};
  auto info = parseStructHeader(lines, 0);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->name, "Box");
  EXPECT_FALSE(info->hasCopyTrait);
  EXPECT_TRUE(info->hasMoveTrait);
  EXPECT_EQ(info->traits, (std::vector<std::string>{"Movable", "Sized"}));
}

TEST(StructExtractorTest, StructWithoutTraits) {
  std::vector<std::string> lines = {"struct Plain:", "    var x: Int"};
  auto info = parseStructHeader(lines, 0);
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->traits.empty());
  EXPECT_FALSE(info->hasCopyTrait);
  EXPECT_FALSE(parseStructHeader(lines, 1).has_value());
  EXPECT_FALSE(parseStructHeader({"fn main():"}, 0).has_value());
}

TEST(StructExtractorTest, HeaderSpanningLines) {
  std::vector<std::string> lines = {
    "struct Wide(",
    "    Copyable,",
    "    Movable,",
    "):",
    "    var x: Int",
  };
  EXPECT_EQ(findHeaderEnd(lines, 0), 3u);
  auto info = parseStructHeader(lines, 0);
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->hasCopyTrait);
  EXPECT_TRUE(info->hasMoveTrait);

  auto body = extractBody(lines, 0);
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(body->headerEnd, 3u);
  EXPECT_EQ(body->begin, 4u);
  EXPECT_EQ(body->end, 5u);
}

TEST(StructExtractorTest, FunctionNames) {
  EXPECT_EQ(functionName("    fn area(self) -> Float64:"), "area");
  EXPECT_EQ(functionName("def go[T: AnyType](x: T):"), "go");
  EXPECT_EQ(functionName("fn"), "");
  EXPECT_EQ(functionName("var fn_count = 1"), "");
}

TEST(StructExtractorTest, HeaderWithoutBlockHasNoEnd) {
  std::vector<std::string> lines = {"fn declared(a: Int) -> Int", "x = 1"};
  EXPECT_EQ(findHeaderEnd(lines, 0), std::string::npos);
  EXPECT_FALSE(extractBody(lines, 0).has_value());
}

TEST(StructExtractorTest, BodyStopsAtDedentAndDropsTrailingBlanks) {
  std::vector<std::string> lines = {
    "struct S:",
    "    var a: Int",
    "",
    "    fn f(self):",
    "        pass",
    "",
    "fn after():",
  };
  auto body = extractBody(lines, 0);
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(body->begin, 1u);
  EXPECT_EQ(body->end, 5u);
  EXPECT_EQ(body->headerIndent, 0u);
  EXPECT_FALSE(body->empty());
}

TEST(StructExtractorTest, DedentedDocstringTextStaysInBody) {
  std::vector<std::string> lines = {
    "fn g():",
    "    \"\"\"Doc",
    "text at column zero",
    "    \"\"\"",
    "    return",
    "x = 1",
  };
  auto body = extractBody(lines, 0);
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(body->end, 5u);
}

TEST(StructExtractorTest, HeaderTextJoinsContinuationLines) {
  std::vector<std::string> lines = {
    "fn long(a: Int,  # first",
    "        b: Int) -> Int:",
  };
  EXPECT_EQ(headerText(lines, 0), "fn long(a: Int,         b: Int) -> Int:");
}

TEST(StructExtractorTest, TraitCompositionCountsEachTrait) {
  std::vector<std::string> lines = {"struct Cell(Copyable & Movable, Stringable):"};
  auto info = parseStructHeader(lines, 0);
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->hasCopyTrait);
  EXPECT_TRUE(info->hasMoveTrait);
  EXPECT_EQ(info->traits, (std::vector<std::string>{"Copyable", "Movable", "Stringable"}));
}
