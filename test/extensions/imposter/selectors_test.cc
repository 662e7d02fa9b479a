#include "extensions/imposter/selectors.h"

#include "extensions/imposter/errors.h"

#include "gtest/gtest.h"

namespace Imposter {
namespace {

const Json kStore = Json::parse(R"({
  "store": {
    "book": [{"title": "A", "price": 8}, {"title": "B", "price": 12}],
    "name": "corner"
  }
})");

std::optional<Json> jsonpath(const std::string& expression) {
  return JsonPath(expression).select(kStore);
}

TEST(JsonPathTest, ChildAndIndex) {
  EXPECT_EQ(Json("corner"), jsonpath("$.store.name"));
  EXPECT_EQ(Json("B"), jsonpath("$.store.book[1].title"));
  EXPECT_EQ(Json("corner"), jsonpath("$['store'][\"name\"]"));
}

TEST(JsonPathTest, RootIsOptional) { EXPECT_EQ(Json("corner"), jsonpath("store.name")); }

TEST(JsonPathTest, SeveralResultsBecomeSequence) {
  EXPECT_EQ(Json::array({"A", "B"}), jsonpath("$.store.book[*].title"));
  EXPECT_EQ(Json::array({8, 12}), jsonpath("$..price"));
}

TEST(JsonPathTest, NoResult) {
  EXPECT_FALSE(jsonpath("$.missing"));
  EXPECT_FALSE(jsonpath("$.store.book[5]"));
  EXPECT_FALSE(jsonpath("$.store.name.first"));
}

TEST(JsonPathTest, SelectTextRequiresJson) {
  JsonPath path("$.id");
  EXPECT_EQ(Json(7), path.selectText(R"({"id": 7})"));
  EXPECT_FALSE(path.selectText("<id>7</id>"));
  EXPECT_FALSE(path.selectText(""));
}

TEST(JsonPathTest, RejectsMalformedSelectors) {
  EXPECT_THROW(JsonPath("$.store["), PredicateError);
  EXPECT_THROW(JsonPath("$.store[?(@.price)]"), PredicateError);
  EXPECT_THROW(JsonPath("$.store."), PredicateError);
  EXPECT_THROW(JsonPath("$.a[99999999999999999999999]"), PredicateError);
}

const std::string kItems = R"(<root><item id="1">a</item><item id="2">b</item></root>)";

TEST(XPathSelectorTest, NodeSets) {
  EXPECT_EQ(Json::array({"a", "b"}), XPathSelector("//item", {}).select(kItems));
  EXPECT_EQ(Json("b"), XPathSelector("//item[@id='2']", {}).select(kItems));
  EXPECT_EQ(Json("a"), XPathSelector("//item[@id='1']/text()", {}).select(kItems));
  EXPECT_EQ(Json("2"), XPathSelector("//item[2]/@id", {}).select(kItems));
  EXPECT_FALSE(XPathSelector("//missing", {}).select(kItems));
}

TEST(XPathSelectorTest, ScalarResults) {
  EXPECT_EQ(Json("2"), XPathSelector("count(//item)", {}).select(kItems));
  EXPECT_EQ(Json("true"), XPathSelector("boolean(//item)", {}).select(kItems));
  EXPECT_EQ(Json("a"), XPathSelector("string(//item[1])", {}).select(kItems));
  EXPECT_EQ(Json("1.5"), XPathSelector("3 div 2", {}).select(kItems));
}

TEST(XPathSelectorTest, NonFiniteNumbers) {
  EXPECT_EQ(Json("NaN"), XPathSelector("number(//item[1])", {}).select(kItems));
  EXPECT_EQ(Json("Infinity"), XPathSelector("1 div 0", {}).select(kItems));
  EXPECT_EQ(Json("-Infinity"), XPathSelector("-1 div 0", {}).select(kItems));
}

TEST(XPathSelectorTest, Namespaces) {
  const std::string xml = R"(<r xmlns:b="http://example.com/books"><b:title>x</b:title></r>)";
  XPathSelector selector("//bk:title", {{"bk", "http://example.com/books"}});
  EXPECT_EQ(Json("x"), selector.select(xml));
}

TEST(XPathSelectorTest, NotXml) {
  EXPECT_FALSE(XPathSelector("//item", {}).select(R"({"item": 1})"));
  EXPECT_FALSE(XPathSelector("//item", {}).select(""));
}

TEST(XPathSelectorTest, RejectsMalformedExpressions) {
  EXPECT_THROW(XPathSelector("//[", {}), PredicateError);
}

} // namespace
} // namespace Imposter
