#pragma once

#include "exceptions.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace jsonexplorer {

using json = nlohmann::json;

/**
 * Applies a chain of reshaping commands to an already-resolved value, e.g.
 * `:filter price < 10 :sort price :pick name,price`.
 *
 * Commands:
 *   :keys, :values              object -> array of names / values
 *   :count                      array or object -> number
 *   :flatten                    array -> one level of nested arrays spliced in
 *   :pick f1,f2 / :omit f1,f2   object or array of objects -> fields kept / dropped
 *   :sort [field]               array -> stable sort
 *   :uniq                       array -> first occurrence of each distinct value, whole array
 *   :group_by field             array -> object of arrays keyed by the field's value
 *   :filter expr                array -> elements matching `field op value`
 *   :sum/:avg/:min/:max [field] array -> number (avg/min/max of nothing is null)
 *
 * Each command consumes the previous command's output. Any failure aborts the chain
 * with a TransformException naming the command.
 */
class JSONTransformer {
public:
    json apply(const json& value, const std::string& commands) const;

    // Splits a chain at each " :" that is not inside a double-quoted string.
    static std::vector<std::string> split_commands(const std::string& chain);

    /**
     * Offsets of the spaces that separate commands, i.e. each " :" outside a quoted argument.
     * A quote only opens at the start of a token (after whitespace, '[', ',' or an operator);
     * a quote that is never closed is treated as a literal character.
     */
    static std::vector<size_t> find_command_breaks(const std::string& chain);

private:
    json apply_command(const json& value, const std::string& command) const;

    json transform_keys(const json& value) const;
    json transform_values(const json& value) const;
    json transform_count(const json& value) const;
    json transform_flatten(const json& value) const;
    json transform_pick(const json& value, const std::string& args, bool keep) const;
    json transform_sort(const json& value, const std::string& field) const;
    json transform_uniq(const json& value) const;
    json transform_group_by(const json& value, const std::string& field) const;
    json transform_filter(const json& value, const std::string& expr) const;
    json transform_aggregate(const json& value, const std::string& name, const std::string& field) const;
};

} // namespace jsonexplorer
