#include "jsonexplorer++/path_parser.h"
#include <cctype>    // For std::isdigit, std::isspace
#include <stdexcept> // For std::invalid_argument, std::out_of_range

namespace jsonexplorer {

PathElement PathElement::key(const std::string& name) {
    PathElement elem;
    elem.type = Type::KEY;
    elem.key_name = name;
    return elem;
}

PathElement PathElement::at(long long index) {
    PathElement elem;
    elem.type = Type::INDEX;
    elem.index = index;
    return elem;
}

PathElement PathElement::slice(std::optional<long long> start, std::optional<long long> end) {
    PathElement elem;
    elem.type = Type::SLICE;
    elem.start = start;
    elem.end = end;
    return elem;
}

PathElement PathElement::wildcard() {
    PathElement elem;
    elem.type = Type::WILDCARD;
    return elem;
}

PathElement PathElement::where(const Predicate& predicate) {
    PathElement elem;
    elem.type = Type::FILTER;
    elem.filter = predicate;
    return elem;
}

bool PathElement::operator==(const PathElement& other) const {
    if (type != other.type) return false;
    switch (type) {
        case Type::KEY:      return key_name == other.key_name;
        case Type::INDEX:    return index == other.index;
        case Type::SLICE:    return start == other.start && end == other.end;
        case Type::WILDCARD: return true;
        case Type::FILTER:   return filter == other.filter;
    }
    return false;
}

static QueryError make_error(QueryError::Kind kind, size_t pos) {
    QueryError error;
    error.kind = kind;
    error.pos = pos;
    return error;
}

// Strict signed integer: optional sign followed by digits only.
static bool parse_integer(const std::string& text, long long& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        return false;
    }
    try {
        size_t chars_processed = 0;
        out = std::stoll(text, &chars_processed);
        return chars_processed == text.length();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static std::optional<long long> parse_slice_bound(const std::string& text, size_t pos) {
    if (text.empty()) {
        return std::nullopt;
    }
    long long bound = 0;
    if (!parse_integer(text, bound)) {
        QueryError error = make_error(QueryError::Kind::INVALID_INDEX, pos);
        error.value = text;
        throw QueryParseException(error);
    }
    return bound;
}

// Reads an unbracketed key starting at `i`, up to the next '.' or '['.
static size_t read_key(const std::string& query, size_t i, std::vector<PathElement>& elements) {
    size_t key_start = i;
    while (i < query.length() && query[i] != '.' && query[i] != '[') {
        ++i;
    }
    elements.push_back(PathElement::key(query.substr(key_start, i - key_start)));
    return i;
}

std::vector<PathElement> PathParser::parse(const std::string& query) const {
    if (query.empty()) {
        throw QueryParseException(make_error(QueryError::Kind::EMPTY, 0));
    }
    if (query[0] != '.') {
        throw QueryParseException(make_error(QueryError::Kind::MUST_START_WITH_DOT, 0));
    }

    std::vector<PathElement> elements;
    const size_t len = query.length();
    size_t i = 1; // skip leading '.'

    // First key right after the leading dot
    if (i < len && query[i] != '.' && query[i] != '[') {
        if (query[i] == '*') {
            elements.push_back(PathElement::wildcard());
            ++i;
        } else {
            i = read_key(query, i, elements);
        }
    }

    while (i < len) {
        char c = query[i];
        if (c == '[') {
            i = parse_bracket(query, i, elements);
        } else if (c == '.') {
            ++i;
            if (i >= len) {
                break; // trailing dot: query still being typed
            }
            if (query[i] == '*') {
                elements.push_back(PathElement::wildcard());
                ++i;
            } else if (query[i] == '[' || query[i] == '.') {
                continue; // `.[` handled by the bracket branch, `..` collapses
            } else {
                i = read_key(query, i, elements);
            }
        } else {
            QueryError error = make_error(QueryError::Kind::UNEXPECTED_CHAR, i);
            error.ch = c;
            throw QueryParseException(error);
        }
    }

    return elements;
}

// Parses `[...]` starting at `bracket_pos`. Returns the position after the closing ']'.
size_t PathParser::parse_bracket(const std::string& query, size_t bracket_pos,
                                 std::vector<PathElement>& elements) const {
    const size_t len = query.length();
    size_t i = bracket_pos + 1;

    if (i >= len) {
        throw QueryParseException(make_error(QueryError::Kind::UNCLOSED_BRACKET, bracket_pos));
    }

    char first = query[i];
    if (first == '*') {
        ++i;
        if (i >= len || query[i] != ']') {
            throw QueryParseException(make_error(QueryError::Kind::UNCLOSED_BRACKET, bracket_pos));
        }
        elements.push_back(PathElement::wildcard());
        return i + 1;
    }

    if (first == '"') {
        size_t quote_pos = i;
        ++i;
        std::string key;
        while (i < len && query[i] != '"') {
            if (query[i] == '\\' && i + 1 < len) {
                key += query[i + 1];
                i += 2;
                continue;
            }
            key += query[i];
            ++i;
        }
        if (i >= len) {
            throw QueryParseException(make_error(QueryError::Kind::UNCLOSED_QUOTE, quote_pos));
        }
        ++i; // closing quote
        if (i >= len || query[i] != ']') {
            throw QueryParseException(make_error(QueryError::Kind::UNCLOSED_BRACKET, bracket_pos));
        }
        elements.push_back(PathElement::key(key));
        return i + 1;
    }

    if (std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == ':') {
        size_t content_start = i;
        size_t closing_bracket = query.find(']', i);
        if (closing_bracket == std::string::npos) {
            throw QueryParseException(make_error(QueryError::Kind::UNCLOSED_BRACKET, bracket_pos));
        }
        std::string content = query.substr(content_start, closing_bracket - content_start);

        size_t colon = content.find(':');
        if (colon != std::string::npos) {
            auto start = parse_slice_bound(content.substr(0, colon), content_start);
            auto end = parse_slice_bound(content.substr(colon + 1), content_start);
            elements.push_back(PathElement::slice(start, end));
        } else {
            long long index_val = 0;
            if (!parse_integer(content, index_val)) {
                QueryError error = make_error(QueryError::Kind::INVALID_INDEX, content_start);
                error.value = content;
                throw QueryParseException(error);
            }
            elements.push_back(PathElement::at(index_val));
        }
        return closing_bracket + 1;
    }

    // Anything else is a filter expression. Find the closing ']' outside string literals.
    size_t content_start = i;
    char quote = '\0';
    while (i < len) {
        char c = query[i];
        if (quote != '\0') {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ']') {
            break;
        }
        ++i;
    }
    if (i >= len) {
        throw QueryParseException(make_error(QueryError::Kind::UNCLOSED_BRACKET, bracket_pos));
    }

    std::string content = query.substr(content_start, i - content_start);
    try {
        elements.push_back(PathElement::where(parse_predicate(content)));
    } catch (const InvalidPredicateException&) {
        QueryError error = make_error(QueryError::Kind::INVALID_PREDICATE, content_start);
        error.expr = content;
        throw QueryParseException(error);
    }
    return i + 1;
}

std::optional<std::vector<PathElement>> PathParser::try_parse(const std::string& query) const {
    try {
        return parse(query);
    } catch (const QueryParseException&) {
        return std::nullopt;
    }
}

bool PathParser::is_valid_query(const std::string& query) const {
    return try_parse(query).has_value();
}

std::string PathParser::get_last_keyword(const std::string& query) {
    if (query.empty() || query == ".") {
        return "";
    }

    size_t last_sep = std::string::npos;
    bool in_quote = false;
    for (size_t i = 0; i < query.length(); ++i) {
        char c = query[i];
        bool escaped = i > 0 && query[i - 1] == '\\';
        if (c == '"' && !escaped) {
            in_quote = !in_quote;
        } else if ((c == '.' || c == '[') && !escaped && !in_quote) {
            last_sep = i;
        }
    }

    std::string after = (last_sep == std::string::npos) ? query : query.substr(last_sep + 1);
    size_t keep = after.find_last_not_of(']');
    return keep == std::string::npos ? "" : after.substr(0, keep + 1);
}

std::string PathParser::escape_key_if_needed(const std::string& key_name) {
    bool plain = !key_name.empty() && key_name.find_first_of(".[]\"*\\ \t") == std::string::npos;
    if (plain) {
        return "." + key_name;
    }
    std::string quoted = "[\"";
    for (char c : key_name) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    return quoted + "\"]";
}

std::string PathParser::to_query(const std::vector<PathElement>& path_elements) {
    if (path_elements.empty()) {
        return ".";
    }
    std::string query;
    for (const auto& el : path_elements) {
        switch (el.type) {
            case PathElement::Type::KEY:
                query += escape_key_if_needed(el.key_name);
                break;
            case PathElement::Type::INDEX:
                query += "[" + std::to_string(el.index) + "]";
                break;
            case PathElement::Type::SLICE:
                query += "[" + (el.start ? std::to_string(*el.start) : "") + ":" +
                         (el.end ? std::to_string(*el.end) : "") + "]";
                break;
            case PathElement::Type::WILDCARD:
                query += "[*]";
                break;
            case PathElement::Type::FILTER:
                query += "[" + el.filter.to_string() + "]";
                break;
        }
    }
    // A leading bracket still needs the root dot
    if (query.front() == '[') {
        query = "." + query;
    }
    return query;
}

} // namespace jsonexplorer
