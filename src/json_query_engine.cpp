#include "jsonexplorer++/json_query_engine.h"
#include "jsonexplorer++/exceptions.h"

namespace jsonexplorer {

// Basic helper to trim whitespace
static std::string trim(const std::string& str) {
    const std::string WHITESPACE = " \n\r\t\f\v";
    size_t start = str.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(start, (end - start + 1));
}

JSONQueryEngine::JSONQueryEngine(const ExplorerConfig& config)
    : _config(config), _inferrer(config) {}

SplitQuery JSONQueryEngine::split_query(const std::string& full_query) {
    SplitQuery split;
    std::string query = trim(full_query);

    // A bare transform chain applies to the root
    if (!query.empty() && query.front() == ':') {
        split.path = ".";
        split.transforms = query;
        return split;
    }

    std::vector<size_t> breaks = JSONTransformer::find_command_breaks(query);
    if (!breaks.empty()) {
        split.path = trim(query.substr(0, breaks.front()));
        split.transforms = trim(query.substr(breaks.front() + 1));
        return split;
    }

    split.path = query;
    return split;
}

TraversalResult JSONQueryEngine::resolve(const json& document, const std::string& path) const {
    return _traverser.traverse(document, _parser.parse(path));
}

json JSONQueryEngine::evaluate(const json& document, const std::string& full_query) const {
    SplitQuery split = split_query(full_query);

    TraversalResult result = resolve(document, split.path);
    if (!result.value) {
        throw PathNotFoundException(split.path);
    }
    if (!split.transforms) {
        return *result.value;
    }
    return _transformer.apply(*result.value, *split.transforms);
}

std::optional<json> JSONQueryEngine::try_evaluate(const json& document, const std::string& full_query) const {
    try {
        return evaluate(document, full_query);
    } catch (const JSONExplorerException&) {
        return std::nullopt;
    }
}

json JSONQueryEngine::aggregate(const json& document, const std::string& path, const std::string& operation) const {
    std::string command = trim(operation);
    if (command.empty()) {
        throw ArgumentInvalidException("Aggregate operation cannot be empty.");
    }
    if (command.front() != ':') {
        command = ":" + command;
    }
    return evaluate(document, trim(path) + " " + command);
}

std::string JSONQueryEngine::schema(const json& document, const std::string& full_query) const {
    return SchemaInferrer::format(_inferrer.infer(evaluate(document, full_query)));
}

std::vector<std::string> JSONQueryEngine::suggest_keys(const json& document, const std::string& query) const {
    std::string path = split_query(query).path;
    std::vector<PathElement> segments = _parser.try_parse(path).value_or(std::vector<PathElement>{});
    std::string keyword = PathParser::get_last_keyword(path);

    // While a key is being typed, suggest from the container that holds it
    if (!keyword.empty() && !segments.empty()) {
        segments.pop_back();
    }
    TraversalResult container = _traverser.traverse(document, segments);
    const json& source = container.value ? *container.value : document;

    std::vector<std::string> suggestions;
    for (const auto& key : JSONTraverser::available_keys(source)) {
        bool matches = key.compare(0, keyword.length(), keyword) == 0 ||
                       (!key.empty() && key.front() == '[' && key.compare(1, keyword.length(), keyword) == 0);
        if (!matches) {
            continue;
        }
        suggestions.push_back(key);
        if (_config.max_candidates > 0 && suggestions.size() >= _config.max_candidates) {
            break;
        }
    }
    return suggestions;
}

} // namespace jsonexplorer
