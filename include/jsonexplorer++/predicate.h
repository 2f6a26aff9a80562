#pragma once

#include <string>
#include <variant>
#include <cstddef> // For std::nullptr_t
#include <nlohmann/json.hpp>

namespace jsonexplorer {

using json = nlohmann::json;

// Tolerance used for Eq/Ne between a numeric field and a numeric literal.
constexpr double NUMBER_EQUALITY_EPSILON = 1e-9;

enum class CompareOp { EQ, NE, LT, GT, LE, GE };

// Literal on the right-hand side of a filter expression.
// Alternatives in order: null, bool, number, string.
using PredicateLiteral = std::variant<std::nullptr_t, bool, double, std::string>;

// `field op value`, e.g. `price < 10` or `name == "Alice"`.
struct Predicate {
    std::string field;
    CompareOp op = CompareOp::EQ;
    PredicateLiteral value;

    bool operator==(const Predicate& other) const {
        return field == other.field && op == other.op && value == other.value;
    }
    bool operator!=(const Predicate& other) const { return !(*this == other); }

    // Renders the predicate back to expression text accepted by parse_predicate.
    std::string to_string() const;
};

/**
 * Parses a filter expression of the form `field op value`.
 * Operators: ==, !=, <=, >=, <, >. Values: a double-quoted or single-quoted string,
 * true/false, null, a number, or otherwise a bare word taken as a string.
 * Throws InvalidPredicateException for a missing field, missing value or unknown operator.
 */
Predicate parse_predicate(const std::string& expr);

/**
 * Evaluates `predicate` against one element. The element must be an object containing
 * predicate.field; otherwise the result is false. Type mismatches between the field value
 * and the literal yield false. Ordering operators never match bool or null literals.
 */
bool eval_predicate(const json& item, const Predicate& predicate);

std::string to_string(CompareOp op);

} // namespace jsonexplorer
