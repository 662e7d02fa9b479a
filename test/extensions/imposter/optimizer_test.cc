#include "extensions/imposter/optimizer.h"

#include <algorithm>

#include "gtest/gtest.h"

namespace Imposter {
namespace {

CompiledPredicate compileText(const char* predicates) {
  return compilePredicates(Json::parse(predicates));
}

std::vector<std::string> groupKeys(const CompiledPredicate& compiled) {
  std::vector<std::string> keys;
  for (const auto& group : compiled.groups()) {
    keys.push_back(group.key().toString());
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

TEST(OptimizerTest, GroupsBatchableLeavesByField) {
  auto compiled = compileText(R"([
    {"equals": {"method": "GET", "query": {"Page": "1"}}},
    {"startsWith": {"path": "/api"}},
    {"contains": {"path": "users"}},
    {"matches": {"headers": {"Accept": "json$"}}}
  ])");
  EXPECT_FALSE(compiled.unsatisfiable());
  EXPECT_TRUE(compiled.residual().empty());
  EXPECT_EQ((std::vector<std::string>{"headers.accept", "method", "path", "query.page"}),
            groupKeys(compiled));
}

TEST(OptimizerTest, FlattensAnd) {
  auto compiled = compileText(R"([
    {"and": [{"equals": {"path": "/a"}}, {"and": [{"equals": {"method": "GET"}}]}]}
  ])");
  EXPECT_TRUE(compiled.residual().empty());
  EXPECT_EQ((std::vector<std::string>{"method", "path"}), groupKeys(compiled));
}

TEST(OptimizerTest, AndModifiersAreDropped) {
  auto compiled = compileText(R"([
    {"and": [{"equals": {"path": "/API"}}, {"equals": {"method": "GET"}}],
     "caseSensitive": false}
  ])");
  EXPECT_FALSE(compiled.matches(Request("GET", "/api", {}, "")));
  EXPECT_TRUE(compiled.matches(Request("GET", "/API", {}, "")));
}

TEST(OptimizerTest, ResidualNodes) {
  auto compiled = compileText(R"([
    {"or": [{"equals": {"path": "/a"}}]},
    {"not": {"equals": {"path": "/b"}}},
    {"deepEquals": {"query": {}}},
    {"exists": {"body": false}},
    {"equals": {"path": "/a"}, "except": "x"},
    {"equals": {"body": "1"}, "jsonpath": {"selector": "$.id"}},
    {"equals": {"body": "1"}, "xpath": {"selector": "//id"}},
    {"equals": {"body": {"id": "1"}}},
    {"equals": {"query": {"a": ["1"]}}},
    {"equals": {"query": {}}},
    {"equals": {"query": "a=1"}},
    {"equals": {"unknown": "x"}}
  ])");
  EXPECT_EQ(12u, compiled.residual().size());
  EXPECT_TRUE(compiled.groups().empty());
}

TEST(OptimizerTest, IdenticalTargetsFold) {
  auto compiled = compileText(R"([
    {"equals": {"path": "/a"}},
    {"equals": {"path": "/a"}},
    {"contains": {"path": "a"}},
    {"contains": {"path": "a"}}
  ])");
  EXPECT_TRUE(compiled.residual().empty());
  EXPECT_EQ(1u, compiled.groups().size());
  EXPECT_TRUE(compiled.matches(Request("GET", "/a", {}, "")));
}

TEST(OptimizerTest, DifferentCaseSensitiveEqualsNeverMatch) {
  auto compiled = compileText(R"([{"equals": {"path": "/a"}}, {"equals": {"path": "/b"}}])");
  EXPECT_TRUE(compiled.unsatisfiable());
  EXPECT_FALSE(compiled.matches(Request("GET", "/a", {}, "")));
  EXPECT_FALSE(compiled.matches(Request("GET", "/b", {}, "")));
  EXPECT_FALSE(compiled.matchesReference(Request("GET", "/a", {}, "")));
}

TEST(OptimizerTest, OtherDuplicatesStayExact) {
  auto compiled = compileText(R"([
    {"equals": {"path": "/a"}},
    {"equals": {"path": "/A"}, "caseSensitive": false},
    {"startsWith": {"path": "/"}},
    {"startsWith": {"path": "/a"}}
  ])");
  EXPECT_FALSE(compiled.unsatisfiable());
  EXPECT_EQ(2u, compiled.residual().size());
  EXPECT_TRUE(compiled.matches(Request("GET", "/a", {}, "")));
  EXPECT_FALSE(compiled.matches(Request("GET", "/A", {}, "")));
}

TEST(OptimizerTest, FirstTypeKeyWins) {
  auto compiled = compileText(R"([{"equals": {"path": "/test"}, "contains": {"path": "other"}}])");
  EXPECT_TRUE(compiled.matches(Request("GET", "/test", {}, "")));
}

TEST(OptimizerTest, CompilingTwiceIsDeterministic) {
  const char* predicates = R"([
    {"equals": {"method": "POST"}},
    {"matches": {"body": "\\d+", "path": "^/x"}},
    {"contains": {"headers": {"User-Agent": "curl"}}},
    {"or": [{"equals": {"path": "/x"}}, {"equals": {"path": "/y"}}]}
  ])";
  auto first = compileText(predicates);
  auto second = compileText(predicates);
  ASSERT_EQ(first.groups().size(), second.groups().size());
  for (size_t i = 0; i < first.groups().size(); ++i) {
    EXPECT_EQ(first.groups()[i].key(), second.groups()[i].key());
    EXPECT_EQ(first.groups()[i].cost(), second.groups()[i].cost());
  }
  EXPECT_EQ(first.residual().size(), second.residual().size());
  EXPECT_EQ(first.unsatisfiable(), second.unsatisfiable());
}

TEST(OptimizerTest, EmptyPredicateListMatchesEverything) {
  auto compiled = compilePredicates(Json::array());
  EXPECT_TRUE(compiled.matches(Request("DELETE", "/anything", {}, "")));
}

// Every stub in this corpus must accept exactly the same requests whether it
// goes through the groups or straight through the evaluator.
const char* const kStubCorpus[] = {
    R"([{"equals": {"path": "/a"}}])",
    R"([{"startsWith": {"path": "/"}}])",
    R"([{"equals": {"path": "/A"}, "caseSensitive": false}])",
    R"([{"equals": {"method": "post"}, "caseSensitive": false}, {"contains": {"body": "id"}}])",
    R"([{"equals": {"query": {"a": "1"}}}, {"contains": {"query": {"A": "2"}}}])",
    R"([{"equals": {"query": {"a": "1"}}}, {"equals": {"query": {"a": "2"}}}])",
    R"([{"matches": {"query": {"a": "^1$"}}}, {"matches": {"query": {"a": "^2"}}}])",
    R"([{"matches": {"path": "^/USERS/\\d+$"}, "caseSensitive": false}])",
    R"([{"matches": {"path": "^/users/\\d+$"}}, {"endsWith": {"path": "7"}}])",
    R"([{"equals": {"headers": {"Content-Type": "application/json"}}}])",
    R"([{"contains": {"headers": {"x-multi": "o"}}}, {"equals": {"headers": {"x-multi": "two"}}}])",
    R"([{"equals": {"body": {"id": "7"}}}])",
    R"([{"equals": {"body": "{\"id\":7}"}}])",
    R"([{"exists": {"query": {"a": true}}}, {"startsWith": {"path": "/users"}}])",
    R"([{"deepEquals": {"query": {"a": ["1", "22"]}}}])",
    R"([{"not": {"equals": {"method": "GET"}}}, {"contains": {"path": "users"}}])",
    R"([{"or": [{"equals": {"path": "/a"}}, {"matches": {"query": {"a": "2"}}}]}])",
    R"([{"and": [{"startsWith": {"path": "/users"}}, {"endsWith": {"path": "/7"}}]},
        {"equals": {"method": "GET"}}])",
    R"([{"equals": {"path": "/a"}}, {"equals": {"path": "/b"}}])",
    R"([{"equals": {"path": "/a"}}, {"equals": {"path": "/A"}, "caseSensitive": false}])",
    R"([{"equals": {"body": "7"}, "jsonpath": {"selector": "$.id"}}, {"equals": {"method": "POST"}}])",
    R"([{"equals": {"path": "/users/"}, "except": "\\d+$"}])",
    R"([{"equals": {"form": {"name": "jo bloggs"}}}])",
    R"([{"contains": {"form": {"name": "JO"}}, "caseSensitive": false}])",
    R"([{"equals": {"ip": "10.0.0.1"}}, {"startsWith": {"requestFrom": "10.0.0.1:"}}])",
    R"([{"equals": {"query": {}}}])",
    R"([{"equals": {"nope": "x"}}])",
    R"([{"equals": {"query": {"a": 1}}}])",
    R"([{"matches": {"body": "\"id\"\\s*:\\s*7"}}, {"contains": {"body": "id"}, "caseSensitive": false}])",
    R"([{"equals": {"query": {"": "x"}}}])",
    R"([{"contains": {"query": {"": "foo"}}}])",
    R"([{"contains": {"headers": {"": "host"}}}])",
    R"([{"equals": {"query": "x"}}])",
    R"([{"contains": {"headers": "x"}}])",
};

std::vector<Request> requestCorpus() {
  std::vector<Request> requests;
  requests.emplace_back("GET", "/a", HeaderPairs{}, "");
  requests.emplace_back("GET", "/A", HeaderPairs{}, "");
  requests.emplace_back("GET", "/b?a=1", HeaderPairs{}, "");
  requests.emplace_back("GET", "/users/7?a=1&a=22", HeaderPairs{}, "", "10.0.0.1:4000");
  requests.emplace_back("GET", "/USERS/7?A=2", HeaderPairs{}, "");
  requests.emplace_back("POST", "/users", HeaderPairs{{"Content-Type", "application/json"}},
                        R"({"id":7})", "10.0.0.2:4000");
  requests.emplace_back("post", "/users/7", HeaderPairs{{"X-Multi", "one"}, {"X-Multi", "two"}},
                        R"({"ID": "7"})");
  requests.emplace_back("POST", "/form",
                        HeaderPairs{{"Content-Type", "application/x-www-form-urlencoded"}},
                        "name=Jo+Bloggs&id=7");
  requests.emplace_back("DELETE", "/?a=", HeaderPairs{{"x-multi", "two"}}, "");
  requests.emplace_back("GET", "/users/77", HeaderPairs{}, "<id>7</id>");
  requests.emplace_back("GET", "/?=x", HeaderPairs{}, "");
  requests.emplace_back("GET", "/?foo=1&a=%FF", HeaderPairs{{"Host", "example.com"}}, "");
  requests.emplace_back("GET", "/bytes", HeaderPairs{{"X-Raw", "\xC3\x28"}}, "");
  return requests;
}

TEST(OptimizerTest, AgreesWithReferenceEvaluator) {
  auto requests = requestCorpus();
  for (const char* stub : kStubCorpus) {
    auto compiled = compileText(stub);
    for (const auto& request : requests) {
      EXPECT_EQ(compiled.matchesReference(request), compiled.matches(request))
          << "stub " << stub << " request " << request.method() << " " << request.path()
          << " body " << request.body();
    }
  }
}

TEST(OptimizerTest, CorpusIsNotTrivial) {
  auto requests = requestCorpus();
  size_t matched = 0;
  size_t total = 0;
  for (const char* stub : kStubCorpus) {
    auto compiled = compileText(stub);
    for (const auto& request : requests) {
      matched += compiled.matchesReference(request) ? 1 : 0;
      ++total;
    }
  }
  EXPECT_GT(matched, 0u);
  EXPECT_LT(matched, total);
}

} // namespace
} // namespace Imposter
