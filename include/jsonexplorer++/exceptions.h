#pragma once

#include <stdexcept>
#include <string>
#include <optional> // For optional error_code in base exception

namespace jsonexplorer {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_QUERY = 1001,
    PATH_NOT_FOUND = 1002,
    INVALID_PREDICATE = 1003,
    TRANSFORM_FAILED = 2001,
    JSON_PARSING_ERROR = 6001,
    INVALID_ARGUMENT = 6002,
    UNKNOWN_ERROR = 9999
};

// Base exception for the library
class JSONExplorerException : public std::runtime_error {
public:
    explicit JSONExplorerException(const std::string& message, std::optional<ErrorCode> code = std::nullopt)
        : std::runtime_error(message), error_code_(code) {}

    std::optional<ErrorCode> error_code() const { return error_code_; }

private:
    std::optional<ErrorCode> error_code_;
};

// -- Query Related Exceptions --

// Structured description of why a query string failed to parse.
// Only the members relevant to `kind` are meaningful.
struct QueryError {
    enum class Kind {
        EMPTY,
        MUST_START_WITH_DOT,
        UNEXPECTED_CHAR,
        UNCLOSED_BRACKET,
        UNCLOSED_QUOTE,
        INVALID_INDEX,
        INVALID_PREDICATE
    };

    Kind kind = Kind::EMPTY;
    size_t pos = 0;        // byte offset into the query
    char ch = '\0';        // UNEXPECTED_CHAR
    std::string value;     // INVALID_INDEX: the offending substring
    std::string expr;      // INVALID_PREDICATE: the bracket content

    std::string message() const {
        switch (kind) {
            case Kind::EMPTY:
                return "empty query";
            case Kind::MUST_START_WITH_DOT:
                return "query must start with '.'";
            case Kind::UNEXPECTED_CHAR:
                return "unexpected character '" + std::string(1, ch) + "' at position " + std::to_string(pos);
            case Kind::UNCLOSED_BRACKET:
                return "unclosed bracket at position " + std::to_string(pos);
            case Kind::UNCLOSED_QUOTE:
                return "unclosed quote at position " + std::to_string(pos);
            case Kind::INVALID_INDEX:
                return "invalid index '" + value + "' at position " + std::to_string(pos);
            case Kind::INVALID_PREDICATE:
                return "invalid filter expression '" + expr + "' at position " + std::to_string(pos);
        }
        return "unknown query error";
    }

    bool operator==(const QueryError& other) const {
        return kind == other.kind && pos == other.pos && ch == other.ch &&
               value == other.value && expr == other.expr;
    }
};

class QueryParseException : public JSONExplorerException {
public:
    explicit QueryParseException(const QueryError& error)
        : JSONExplorerException("Invalid Query: " + error.message(), ErrorCode::INVALID_QUERY), error_(error) {}

    const QueryError& error() const { return error_; }

private:
    QueryError error_;
};

class PathNotFoundException : public JSONExplorerException {
public:
    explicit PathNotFoundException(const std::string& query)
        : JSONExplorerException("No match for query: " + query, ErrorCode::PATH_NOT_FOUND) {}
};

class InvalidPredicateException : public JSONExplorerException {
public:
    explicit InvalidPredicateException(const std::string& message)
        : JSONExplorerException("Invalid Predicate: " + message, ErrorCode::INVALID_PREDICATE) {}
};


// -- Transform Exceptions --
class TransformException : public JSONExplorerException {
public:
    explicit TransformException(const std::string& message)
        : JSONExplorerException("Transform Error: " + message, ErrorCode::TRANSFORM_FAILED) {}
};


// -- JSON Processing Exceptions --
class JsonParsingException : public JSONExplorerException {
public:
    explicit JsonParsingException(const std::string& message)
        : JSONExplorerException("JSON Parsing Error: " + message, ErrorCode::JSON_PARSING_ERROR) {}
};

class ArgumentInvalidException : public JSONExplorerException {
public:
    explicit ArgumentInvalidException(const std::string& message)
        : JSONExplorerException("Invalid Argument: " + message, ErrorCode::INVALID_ARGUMENT) {}
};

} // namespace jsonexplorer
