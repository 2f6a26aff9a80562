#pragma once

#include "common_types.h"
#include "path_parser.h"
#include "json_traverser.h"
#include "json_transformer.h"
#include "schema_inferrer.h"
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace jsonexplorer {

using json = nlohmann::json;

// Path portion and transform chain of a full query such as `.users :pick name,age :sort age`.
struct SplitQuery {
    std::string path;                     // ".users"
    std::optional<std::string> transforms; // ":pick name,age :sort age"
};

/**
 * Evaluates full queries (path plus optional transform chain) against an in-memory document.
 * Stateless apart from its configuration; safe to share between threads.
 */
class JSONQueryEngine {
public:
    explicit JSONQueryEngine(const ExplorerConfig& config = ExplorerConfig());

    // Splits at the first " :" outside a double-quoted string.
    static SplitQuery split_query(const std::string& full_query);

    /**
     * Parses the path, traverses `document` and applies the transform chain, if any.
     * Throws QueryParseException for a malformed path, PathNotFoundException when the
     * path resolves to nothing, TransformException when a command fails.
     */
    json evaluate(const json& document, const std::string& full_query) const;

    // evaluate() that reports every failure as an empty result.
    std::optional<json> try_evaluate(const json& document, const std::string& full_query) const;

    // Traversal only, for callers that need the parent/depth diagnostics.
    TraversalResult resolve(const json& document, const std::string& path) const;

    // Shortcut for evaluate(document, path + " :" + operation), e.g. operation "sum price".
    json aggregate(const json& document, const std::string& path, const std::string& operation) const;

    // Schema of the evaluated result, rendered with SchemaInferrer::format.
    std::string schema(const json& document, const std::string& full_query) const;

    // Keys to suggest for the query being typed, filtered by the keyword in progress.
    std::vector<std::string> suggest_keys(const json& document, const std::string& query) const;

    const ExplorerConfig& config() const { return _config; }

private:
    ExplorerConfig _config;
    PathParser _parser;
    JSONTraverser _traverser;
    JSONTransformer _transformer;
    SchemaInferrer _inferrer;
};

} // namespace jsonexplorer
