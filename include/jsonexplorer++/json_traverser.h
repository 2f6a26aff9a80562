#pragma once

#include "path_parser.h" // Uses PathElement
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace jsonexplorer {

using json = nlohmann::json;

struct TraversalResult {
    std::optional<json> value;  // Resolved node, empty if any segment failed to resolve
    std::optional<json> parent; // Last container reached, used for contextual suggestions
    size_t depth = 0;           // Segments successfully consumed
};

class JSONTraverser {
public:
    /**
     * Walks `root` along `path_elements`.
     * KEY / INDEX failures (missing key, out-of-range index, wrong container type) stop the walk
     * with no value and `parent` set to the container that failed to resolve the segment.
     * SLICE and WILDCARD end the walk immediately after producing their array; any later
     * segments are not evaluated. FILTER keeps matching elements and continues the walk on
     * the filtered array.
     * Never throws.
     */
    TraversalResult traverse(const json& root, const std::vector<PathElement>& path_elements) const;

    /**
     * Keys available below `value` for suggestions: sorted names for an object,
     * "[i]" labels for an array, nothing for a scalar. `limit` of 0 means unlimited.
     */
    static std::vector<std::string> available_keys(const json& value, size_t limit = 0);
};

std::string pretty_print(const json& value, int indent = 2);
std::string compact_print(const json& value);

// One-line summary for a status display: "3 keys", "10 items", "5 chars", the scalar, or "no match".
std::string describe_value(const std::optional<json>& value);

} // namespace jsonexplorer
