#include "gtest/gtest.h"
#include <gmock/gmock.h> // For EXPECT_THAT and HasSubstr
#include "jsonexplorer++/predicate.h"
#include "jsonexplorer++/exceptions.h"

using namespace jsonexplorer;
using json = nlohmann::json;
using ::testing::HasSubstr;

TEST(PredicateParseTest, NumericComparison) {
    Predicate p = parse_predicate("price < 10");
    EXPECT_EQ(p.field, "price");
    EXPECT_EQ(p.op, CompareOp::LT);
    EXPECT_EQ(p.value, PredicateLiteral(10.0));
}

TEST(PredicateParseTest, TwoCharacterOperatorsWin) {
    EXPECT_EQ(parse_predicate("a <= 1").op, CompareOp::LE);
    EXPECT_EQ(parse_predicate("a >= 1").op, CompareOp::GE);
    EXPECT_EQ(parse_predicate("a == 1").op, CompareOp::EQ);
    EXPECT_EQ(parse_predicate("a != 1").op, CompareOp::NE);
    EXPECT_EQ(parse_predicate("a<1").op, CompareOp::LT);
    EXPECT_EQ(parse_predicate("a>1").op, CompareOp::GT);
}

TEST(PredicateParseTest, Literals) {
    EXPECT_EQ(parse_predicate("name == \"Alice\"").value, PredicateLiteral(std::string("Alice")));
    EXPECT_EQ(parse_predicate("name == 'Bob'").value, PredicateLiteral(std::string("Bob")));
    EXPECT_EQ(parse_predicate("status == active").value, PredicateLiteral(std::string("active")));
    EXPECT_EQ(parse_predicate("active == true").value, PredicateLiteral(true));
    EXPECT_EQ(parse_predicate("active == false").value, PredicateLiteral(false));
    EXPECT_EQ(parse_predicate("deleted == null").value, PredicateLiteral(nullptr));
    EXPECT_EQ(parse_predicate("t > -2.5").value, PredicateLiteral(-2.5));
    EXPECT_EQ(parse_predicate("code == \"42\"").value, PredicateLiteral(std::string("42")));
}

TEST(PredicateParseTest, Errors) {
    EXPECT_THROW(parse_predicate(""), InvalidPredicateException);
    EXPECT_THROW(parse_predicate("price"), InvalidPredicateException);
    EXPECT_THROW(parse_predicate("< 10"), InvalidPredicateException);
    EXPECT_THROW(parse_predicate("price <"), InvalidPredicateException);
    EXPECT_THROW(parse_predicate("price = 10"), InvalidPredicateException);
    EXPECT_THROW(parse_predicate("price <> 10"), InvalidPredicateException);
    EXPECT_THROW(parse_predicate("name == \"open"), InvalidPredicateException);

    try {
        parse_predicate("price = 10");
        FAIL() << "expected InvalidPredicateException";
    } catch (const InvalidPredicateException& e) {
        EXPECT_THAT(e.what(), HasSubstr("unrecognized operator"));
        EXPECT_EQ(e.error_code(), ErrorCode::INVALID_PREDICATE);
    }
}

TEST(PredicateParseTest, ToStringParsesBack) {
    for (const std::string expr : {"price < 10", "name == \"a \\\"q\\\"\"", "ok != true", "x >= 1.5", "v == null"}) {
        Predicate p = parse_predicate(expr);
        EXPECT_EQ(parse_predicate(p.to_string()), p) << expr;
    }
}

TEST(PredicateEvalTest, Numbers) {
    json item = {{"price", 10}};
    EXPECT_TRUE(eval_predicate(item, parse_predicate("price == 10")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("price == 10.0")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("price != 10")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("price <= 10")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("price >= 10")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("price < 10")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("price > 9.5")));
}

TEST(PredicateEvalTest, NumericEqualityUsesEpsilon) {
    json item = {{"total", 0.1 + 0.2}};
    EXPECT_TRUE(eval_predicate(item, parse_predicate("total == 0.3")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("total != 0.3")));
}

TEST(PredicateEvalTest, Strings) {
    json item = {{"name", "Bob"}};
    EXPECT_TRUE(eval_predicate(item, parse_predicate("name == \"Bob\"")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("name != Alice")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("name > Alice")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("name < Carol")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("name < Bob")));
}

TEST(PredicateEvalTest, BoolsOnlySupportEquality) {
    json item = {{"active", true}};
    EXPECT_TRUE(eval_predicate(item, parse_predicate("active == true")));
    EXPECT_TRUE(eval_predicate(item, parse_predicate("active != false")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("active > false")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("active <= true")));
}

TEST(PredicateEvalTest, Null) {
    json with_null = {{"deleted", nullptr}};
    json with_value = {{"deleted", "yes"}};
    EXPECT_TRUE(eval_predicate(with_null, parse_predicate("deleted == null")));
    EXPECT_FALSE(eval_predicate(with_value, parse_predicate("deleted == null")));
    EXPECT_TRUE(eval_predicate(with_value, parse_predicate("deleted != null")));
    EXPECT_FALSE(eval_predicate(with_null, parse_predicate("deleted >= null")));
}

TEST(PredicateEvalTest, MissingFieldAndTypeMismatchNeverMatch) {
    json item = {{"price", "cheap"}};
    EXPECT_FALSE(eval_predicate(item, parse_predicate("price < 10")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("other == 1")));
    EXPECT_FALSE(eval_predicate(item, parse_predicate("other != null")));
    EXPECT_FALSE(eval_predicate(json::array({1, 2}), parse_predicate("price < 10")));
    EXPECT_FALSE(eval_predicate(json(5), parse_predicate("price < 10")));
}

TEST(PredicateEvalTest, DoesNotModifyItem) {
    const json item = {{"price", 5}, {"name", "A"}};
    json copy = item;
    eval_predicate(copy, parse_predicate("price < 10"));
    EXPECT_EQ(copy, item);
}
