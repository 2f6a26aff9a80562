#include "jsonexplorer++/predicate.h"
#include "jsonexplorer++/exceptions.h"
#include <cmath>     // For std::fabs, std::floor
#include <stdexcept> // For std::invalid_argument, std::out_of_range

namespace jsonexplorer {

// Basic helper to trim whitespace
static std::string trim(const std::string& str) {
    const std::string WHITESPACE = " \n\r\t\f\v";
    size_t start = str.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(start, (end - start + 1));
}

static bool is_operator_char(char c) {
    return c == '=' || c == '!' || c == '<' || c == '>';
}

// Reads a quoted literal, resolving backslash escapes. `text` starts and ends with `quote`.
static std::string unquote(const std::string& text, char quote) {
    std::string result;
    for (size_t i = 1; i + 1 < text.length(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 2 < text.length()) {
            char next = text[++i];
            switch (next) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                default:  result += next; break; // \" \' \\ and anything else verbatim
            }
        } else if (c == quote) {
            throw InvalidPredicateException("unescaped quote inside string literal " + text);
        } else {
            result += c;
        }
    }
    return result;
}

static bool looks_numeric(const std::string& text) {
    char c = text.front();
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

static PredicateLiteral parse_literal(const std::string& text) {
    if (text.length() >= 2 && (text.front() == '"' || text.front() == '\'')) {
        if (text.back() != text.front()) {
            throw InvalidPredicateException("unterminated string literal " + text);
        }
        return unquote(text, text.front());
    }
    if (text.front() == '"' || text.front() == '\'') {
        throw InvalidPredicateException("unterminated string literal " + text);
    }
    if (text == "true") return true;
    if (text == "false") return false;
    if (text == "null") return nullptr;

    if (looks_numeric(text)) {
        try {
            size_t chars_processed = 0;
            double number = std::stod(text, &chars_processed);
            if (chars_processed == text.length() && std::isfinite(number)) {
                return number;
            }
        } catch (const std::invalid_argument&) {
            // Not a number, fall through to a bare word
        } catch (const std::out_of_range&) {
            throw InvalidPredicateException("number out of range: " + text);
        }
    }
    // Bare words compare as strings: `status == active`
    return text;
}

static std::string format_number(double value) {
    if (std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
        return std::to_string(static_cast<long long>(value));
    }
    return json(value).dump();
}

std::string to_string(CompareOp op) {
    switch (op) {
        case CompareOp::EQ: return "==";
        case CompareOp::NE: return "!=";
        case CompareOp::LT: return "<";
        case CompareOp::GT: return ">";
        case CompareOp::LE: return "<=";
        case CompareOp::GE: return ">=";
    }
    return "?";
}

std::string Predicate::to_string() const {
    std::string literal;
    if (std::holds_alternative<std::nullptr_t>(value)) {
        literal = "null";
    } else if (std::holds_alternative<bool>(value)) {
        literal = std::get<bool>(value) ? "true" : "false";
    } else if (std::holds_alternative<double>(value)) {
        literal = format_number(std::get<double>(value));
    } else {
        literal = "\"";
        for (char c : std::get<std::string>(value)) {
            if (c == '"' || c == '\\') literal += '\\';
            literal += c;
        }
        literal += "\"";
    }
    return field + " " + jsonexplorer::to_string(op) + " " + literal;
}

Predicate parse_predicate(const std::string& expr_in) {
    std::string expr = trim(expr_in);
    if (expr.empty()) {
        throw InvalidPredicateException("empty filter expression");
    }

    size_t op_pos = 0;
    while (op_pos < expr.length() && !is_operator_char(expr[op_pos])) {
        ++op_pos;
    }
    if (op_pos == expr.length()) {
        throw InvalidPredicateException("no comparison operator in '" + expr + "' (expected one of ==, !=, <, >, <=, >=)");
    }

    Predicate predicate;
    predicate.field = trim(expr.substr(0, op_pos));
    if (predicate.field.empty()) {
        throw InvalidPredicateException("missing field name in '" + expr + "'");
    }

    // Two-character operators must be tried before their one-character prefixes.
    std::string two = expr.substr(op_pos, 2);
    size_t op_len = 2;
    if (two == "==") {
        predicate.op = CompareOp::EQ;
    } else if (two == "!=") {
        predicate.op = CompareOp::NE;
    } else if (two == "<=") {
        predicate.op = CompareOp::LE;
    } else if (two == ">=") {
        predicate.op = CompareOp::GE;
    } else if (expr[op_pos] == '<') {
        predicate.op = CompareOp::LT;
        op_len = 1;
    } else if (expr[op_pos] == '>') {
        predicate.op = CompareOp::GT;
        op_len = 1;
    } else {
        throw InvalidPredicateException("unrecognized operator '" + two + "' in '" + expr + "'");
    }

    std::string value_text = trim(expr.substr(op_pos + op_len));
    if (value_text.empty()) {
        throw InvalidPredicateException("missing value after '" + to_string(predicate.op) + "' in '" + expr + "'");
    }
    if (is_operator_char(value_text.front())) {
        throw InvalidPredicateException("unrecognized operator '" + expr.substr(op_pos, op_len + 1) + "' in '" + expr + "'");
    }
    predicate.value = parse_literal(value_text);
    return predicate;
}

template <typename T>
static bool compare_ordered(const T& lhs, const T& rhs, CompareOp op) {
    switch (op) {
        case CompareOp::EQ: return lhs == rhs;
        case CompareOp::NE: return lhs != rhs;
        case CompareOp::LT: return lhs < rhs;
        case CompareOp::GT: return lhs > rhs;
        case CompareOp::LE: return lhs <= rhs;
        case CompareOp::GE: return lhs >= rhs;
    }
    return false;
}

static bool compare_numbers(double lhs, double rhs, CompareOp op) {
    bool equal = std::fabs(lhs - rhs) < NUMBER_EQUALITY_EPSILON;
    switch (op) {
        case CompareOp::EQ: return equal;
        case CompareOp::NE: return !equal;
        default: return compare_ordered(lhs, rhs, op);
    }
}

bool eval_predicate(const json& item, const Predicate& predicate) {
    if (!item.is_object()) {
        return false;
    }
    auto it = item.find(predicate.field);
    if (it == item.end()) {
        return false;
    }
    const json& field_value = *it;

    if (std::holds_alternative<double>(predicate.value)) {
        if (!field_value.is_number()) return false;
        return compare_numbers(field_value.get<double>(), std::get<double>(predicate.value), predicate.op);
    }
    if (std::holds_alternative<std::string>(predicate.value)) {
        if (!field_value.is_string()) return false;
        return compare_ordered(field_value.get_ref<const std::string&>(), std::get<std::string>(predicate.value), predicate.op);
    }
    if (std::holds_alternative<bool>(predicate.value)) {
        if (!field_value.is_boolean()) return false;
        bool equal = field_value.get<bool>() == std::get<bool>(predicate.value);
        if (predicate.op == CompareOp::EQ) return equal;
        if (predicate.op == CompareOp::NE) return !equal;
        return false;
    }
    // null literal
    if (predicate.op == CompareOp::EQ) return field_value.is_null();
    if (predicate.op == CompareOp::NE) return !field_value.is_null();
    return false;
}

} // namespace jsonexplorer
