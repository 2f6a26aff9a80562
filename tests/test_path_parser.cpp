#include "gtest/gtest.h"
#include "jsonexplorer++/path_parser.h"
#include "jsonexplorer++/exceptions.h"

using namespace jsonexplorer;

// Parses `query` expecting failure and returns the reported error.
static QueryError parse_error(const std::string& query) {
    PathParser parser;
    try {
        parser.parse(query);
    } catch (const QueryParseException& e) {
        return e.error();
    }
    ADD_FAILURE() << "expected '" << query << "' to fail";
    return QueryError{};
}

TEST(PathParserTest, RootOnly) {
    PathParser parser;
    auto elements = parser.parse(".");
    EXPECT_TRUE(elements.empty());
    EXPECT_TRUE(parser.is_valid_query("."));
}

TEST(PathParserTest, SimpleKey) {
    PathParser parser;
    auto elements = parser.parse(".key");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0].type, PathElement::Type::KEY);
    EXPECT_EQ(elements[0].key_name, "key");
}

TEST(PathParserTest, NestedPathWithIndex) {
    PathParser parser;
    auto elements = parser.parse(".store.books[0].author");
    std::vector<PathElement> expected = {
        PathElement::key("store"),
        PathElement::key("books"),
        PathElement::at(0),
        PathElement::key("author"),
    };
    EXPECT_EQ(elements, expected);
}

TEST(PathParserTest, NegativeIndex) {
    PathParser parser;
    auto elements = parser.parse(".items[-1]");
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[1], PathElement::at(-1));
}

TEST(PathParserTest, Slices) {
    PathParser parser;
    EXPECT_EQ(parser.parse(".items[0:5]")[1], PathElement::slice(0, 5));
    EXPECT_EQ(parser.parse(".items[:3]")[1], PathElement::slice(std::nullopt, 3));
    EXPECT_EQ(parser.parse(".items[2:]")[1], PathElement::slice(2, std::nullopt));
    EXPECT_EQ(parser.parse(".items[-2:]")[1], PathElement::slice(-2, std::nullopt));
    EXPECT_EQ(parser.parse(".items[:]")[1], PathElement::slice(std::nullopt, std::nullopt));
}

TEST(PathParserTest, WildcardForms) {
    PathParser parser;
    std::vector<PathElement> expected = {PathElement::key("items"), PathElement::wildcard()};
    EXPECT_EQ(parser.parse(".items[*]"), expected);
    EXPECT_EQ(parser.parse(".items.*"), expected);

    auto root_wildcard = parser.parse(".*");
    ASSERT_EQ(root_wildcard.size(), 1);
    EXPECT_EQ(root_wildcard[0].type, PathElement::Type::WILDCARD);
}

TEST(PathParserTest, QuotedKeyInBrackets) {
    PathParser parser;
    auto elements = parser.parse(".[\"key.with.dots\"]");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0], PathElement::key("key.with.dots"));
}

TEST(PathParserTest, QuotedKeyWithEscapedQuote) {
    PathParser parser;
    auto elements = parser.parse(".obj[\"say \\\"hi\\\"\"]");
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[1], PathElement::key("say \"hi\""));
}

TEST(PathParserTest, FilterPredicate) {
    PathParser parser;
    auto elements = parser.parse(".items[price < 10]");
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[1].type, PathElement::Type::FILTER);
    EXPECT_EQ(elements[1].filter.field, "price");
    EXPECT_EQ(elements[1].filter.op, CompareOp::LT);
    EXPECT_EQ(elements[1].filter.value, PredicateLiteral(10.0));
}

TEST(PathParserTest, FilterFollowedBySegments) {
    PathParser parser;
    auto elements = parser.parse(".items[name == \"a]b\"][0].name");
    ASSERT_EQ(elements.size(), 4);
    EXPECT_EQ(elements[1].filter.value, PredicateLiteral(std::string("a]b")));
    EXPECT_EQ(elements[2], PathElement::at(0));
    EXPECT_EQ(elements[3], PathElement::key("name"));
}

TEST(PathParserTest, TrailingDotIsTolerated) {
    PathParser parser;
    auto elements = parser.parse(".foo.");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0], PathElement::key("foo"));
}

TEST(PathParserTest, DoubleDotCollapses) {
    PathParser parser;
    std::vector<PathElement> expected = {PathElement::key("a"), PathElement::key("b")};
    EXPECT_EQ(parser.parse(".a..b"), expected);
}

TEST(PathParserTest, ComplexPath) {
    PathParser parser;
    std::vector<PathElement> expected = {
        PathElement::key("store"),
        PathElement::key("books"),
        PathElement::at(0),
        PathElement::key("authors"),
        PathElement::wildcard(),
        PathElement::key("name"),
    };
    EXPECT_EQ(parser.parse(".store.books[0].authors[*].name"), expected);
}

TEST(PathParserTest, Errors) {
    EXPECT_EQ(parse_error("").kind, QueryError::Kind::EMPTY);
    EXPECT_EQ(parse_error("foo").kind, QueryError::Kind::MUST_START_WITH_DOT);

    QueryError unclosed = parse_error(".foo[0");
    EXPECT_EQ(unclosed.kind, QueryError::Kind::UNCLOSED_BRACKET);
    EXPECT_EQ(unclosed.pos, 4);

    EXPECT_EQ(parse_error(".foo[").kind, QueryError::Kind::UNCLOSED_BRACKET);
    EXPECT_EQ(parse_error(".foo[*").kind, QueryError::Kind::UNCLOSED_BRACKET);
    EXPECT_EQ(parse_error(".foo[price < 3").kind, QueryError::Kind::UNCLOSED_BRACKET);

    QueryError quote = parse_error(".[\"unclosed");
    EXPECT_EQ(quote.kind, QueryError::Kind::UNCLOSED_QUOTE);
    EXPECT_EQ(quote.pos, 2);

    QueryError index = parse_error(".items[1x]");
    EXPECT_EQ(index.kind, QueryError::Kind::INVALID_INDEX);
    EXPECT_EQ(index.value, "1x");
    EXPECT_EQ(index.pos, 7);

    QueryError slice = parse_error(".items[1:z]");
    EXPECT_EQ(slice.kind, QueryError::Kind::INVALID_INDEX);
    EXPECT_EQ(slice.value, "z");

    QueryError predicate = parse_error(".items[price]");
    EXPECT_EQ(predicate.kind, QueryError::Kind::INVALID_PREDICATE);
    EXPECT_EQ(predicate.expr, "price");
    EXPECT_EQ(predicate.pos, 7);

    QueryError unexpected = parse_error(".a[0]x");
    EXPECT_EQ(unexpected.kind, QueryError::Kind::UNEXPECTED_CHAR);
    EXPECT_EQ(unexpected.ch, 'x');
    EXPECT_EQ(unexpected.pos, 5);
}

TEST(PathParserTest, ErrorMessageCarriesPosition) {
    PathParser parser;
    try {
        parser.parse(".foo[0");
        FAIL() << "expected QueryParseException";
    } catch (const QueryParseException& e) {
        EXPECT_EQ(e.error_code(), ErrorCode::INVALID_QUERY);
        EXPECT_NE(std::string(e.what()).find("unclosed bracket at position 4"), std::string::npos);
    }
}

TEST(PathParserTest, TryParse) {
    PathParser parser;
    EXPECT_TRUE(parser.try_parse(".a.b").has_value());
    EXPECT_FALSE(parser.try_parse("a.b").has_value());
    EXPECT_FALSE(parser.is_valid_query(".a[0"));
}

TEST(PathParserTest, GetLastKeyword) {
    EXPECT_EQ(PathParser::get_last_keyword(".foo.ba"), "ba");
    EXPECT_EQ(PathParser::get_last_keyword(".foo."), "");
    EXPECT_EQ(PathParser::get_last_keyword("."), "");
    EXPECT_EQ(PathParser::get_last_keyword(""), "");
    EXPECT_EQ(PathParser::get_last_keyword(".items[3]"), "3");
    EXPECT_EQ(PathParser::get_last_keyword(".items[pri"), "pri");
    EXPECT_EQ(PathParser::get_last_keyword(".a\\.b"), "a\\.b");
    // Tolerates invalid queries
    EXPECT_EQ(PathParser::get_last_keyword(".a[0]x.y[[z"), "z");
}

TEST(PathParserTest, ToQueryRoundTrip) {
    PathParser parser;
    const std::vector<std::string> queries = {
        ".",
        ".store.books[0].author",
        ".items[-1]",
        ".items[1:3]",
        ".items[:2]",
        ".items[*]",
        ".[\"key.with.dots\"]",
        ".items[price < 10].name",
        ".items[name == \"Bob\"]",
    };
    for (const auto& query : queries) {
        auto elements = parser.parse(query);
        EXPECT_EQ(parser.parse(PathParser::to_query(elements)), elements) << query;
    }
    EXPECT_EQ(PathParser::to_query({PathElement::at(2)}), ".[2]");
}
