#pragma once

#include "predicate.h"
#include "exceptions.h"
#include <string>
#include <vector>
#include <optional>

namespace jsonexplorer {

class PathParser {
public:
    PathParser() = default;

    // One segment of a compiled query. Only the members relevant to `type` are meaningful.
    struct PathElement {
        enum class Type { KEY, INDEX, SLICE, WILDCARD, FILTER };
        Type type = Type::KEY;
        std::string key_name;                // KEY
        long long index = 0;                 // INDEX, negative counts from the end
        std::optional<long long> start, end; // SLICE, either bound may be open
        Predicate filter;                    // FILTER

        static PathElement key(const std::string& name);
        static PathElement at(long long index);
        static PathElement slice(std::optional<long long> start, std::optional<long long> end);
        static PathElement wildcard();
        static PathElement where(const Predicate& predicate);

        bool operator==(const PathElement& other) const;
        bool operator!=(const PathElement& other) const { return !(*this == other); }
    };

    /**
     * Compiles a query such as `.store.books[0].author` or `.items[price < 10]`.
     * "." alone is the root and yields an empty sequence. A trailing '.' is tolerated
     * so that a query being typed still parses.
     * Throws QueryParseException carrying the QueryError kind and position.
     */
    std::vector<PathElement> parse(const std::string& query) const;

    // Non-throwing variants of parse().
    std::optional<std::vector<PathElement>> try_parse(const std::string& query) const;
    bool is_valid_query(const std::string& query) const;

    // Returns the token currently being typed: the text after the last unescaped
    // '.' or '[', with trailing ']' removed. Works on incomplete or invalid queries.
    // For `.foo.ba` returns "ba", for `.foo.` returns "".
    static std::string get_last_keyword(const std::string& query);

    // Renders segments back to a query string that parse() accepts.
    static std::string to_query(const std::vector<PathElement>& path_elements);
    static std::string escape_key_if_needed(const std::string& key_name);

private:
    size_t parse_bracket(const std::string& query, size_t bracket_pos,
                         std::vector<PathElement>& elements) const;
};

using PathElement = PathParser::PathElement;

} // namespace jsonexplorer
