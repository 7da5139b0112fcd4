#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "maybe.hpp"
#include "repr.hpp"
#include "result.hpp"
#include "test_values.hpp"

using namespace allusions;
using namespace std::string_literals;

TEST(ReprTest, Maybe) {
    EXPECT_EQ(repr(Some(1)), "Some(1)");
    EXPECT_EQ(repr(Some("a"s)), R"(Some("a"))");
    EXPECT_EQ(repr(Some(1.)), "Some(1.0)");
    EXPECT_EQ(repr(Empty()), "Empty()");
    EXPECT_EQ(repr(Maybe<int>(Empty())), "Empty()");
}

TEST(ReprTest, NestedMaybe) {
    EXPECT_EQ(repr(Some(Some(1))), "Some(Some(1))");
    EXPECT_EQ(repr(Some(Some("a"s))), R"(Some(Some("a")))");
    EXPECT_EQ(repr(Some(Empty())), "Some(Empty())");
    EXPECT_EQ(repr(Some(Maybe<int>(Empty()))), "Some(Empty())");
}

TEST(ReprTest, Result) {
    EXPECT_EQ(repr(Ok(1)), "Ok(1)");
    EXPECT_EQ(repr(Ok(0.2)), "Ok(0.2)");
    EXPECT_EQ(repr(Err("bad"s)), R"(Err("bad"))");
    EXPECT_EQ(repr(Err(ValueError("bad"))), R"(Err(exception("bad")))");
    EXPECT_EQ(repr(Ok(Some(1))), "Ok(Some(1))");
    EXPECT_EQ(repr(Some(Err(Empty()))), "Some(Err(Empty()))");

    const Result<int, std::string> err = Err("x"s);
    EXPECT_EQ(repr(err), R"(Err("x"))");
    EXPECT_EQ(repr(err.ok()), "Empty()");
    EXPECT_EQ(repr(err.err()), R"(Some("x"))");
}

TEST(ReprTest, Scalars) {
    EXPECT_EQ(repr(true), "true");
    EXPECT_EQ(repr(false), "false");
    EXPECT_EQ(repr('c'), "'c'");
    EXPECT_EQ(repr(-1), "-1");
    EXPECT_EQ(repr(-1.), "-1.0");
    EXPECT_EQ(repr(0.), "0.0");
    EXPECT_EQ(repr(1e20), "1e+20");
    EXPECT_EQ(repr(2.5f), "2.5");
    EXPECT_EQ(repr(std::monostate{}), "monostate");
    EXPECT_EQ(repr(nullptr), "nullptr");
    EXPECT_EQ(repr("say \"hi\"\\"), R"("say \"hi\"\\")");
}

TEST(ReprTest, Collections) {
    EXPECT_EQ(repr(std::vector<int>{}), "{}");
    EXPECT_EQ(repr(std::vector<std::vector<int>>{{1}, {2, 3}}), "{{1}, {2, 3}}");
    EXPECT_EQ(repr(std::map<std::string, int>{{"cat", 6}, {"dog", 3}}), R"({("cat", 6), ("dog", 3)})");
    EXPECT_EQ(repr(Some(std::vector<std::string>{"a", "b"})), R"(Some({"a", "b"}))");
}

TEST(ReprTest, VariantRendersActiveAlternative) {
    EXPECT_EQ(repr(Primitive{}), "monostate");
    EXPECT_EQ(repr(Primitive{1}), "1");
    EXPECT_EQ(repr(Primitive{1.}), "1.0");
    EXPECT_EQ(repr(Primitive{"a"s}), R"("a")");
    EXPECT_EQ(repr(Some(Primitive{true})), "Some(true)");
}

TEST(ReprTest, StreamOperatorMatchesRepr) {
    std::ostringstream out;
    out << Some(Some(1)) << " " << Empty() << " " << Ok(2) << " " << Err('e');
    EXPECT_EQ(out.str(), "Some(Some(1)) Empty() Ok(2) Err('e')");
}
