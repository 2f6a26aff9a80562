#include "jsonexplorer++/json_transformer.h"
#include "jsonexplorer++/predicate.h"
#include <algorithm> // For std::stable_sort, std::find, std::min_element, std::max_element
#include <cmath>     // For std::floor, std::fabs, std::isfinite
#include <unordered_set>

namespace jsonexplorer {

// Basic helper to trim whitespace
static std::string trim(const std::string& str) {
    const std::string WHITESPACE = " \n\r\t\f\v";
    size_t start = str.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(start, (end - start + 1));
}

static std::vector<std::string> split_fields(const std::string& args) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start <= args.length()) {
        size_t comma = args.find(',', start);
        if (comma == std::string::npos) comma = args.length();
        std::string field = trim(args.substr(start, comma - start));
        if (!field.empty()) {
            fields.push_back(field);
        }
        start = comma + 1;
    }
    return fields;
}

// Whole numbers are emitted as integers, everything else as a double.
static json number_to_json(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
        return json(static_cast<long long>(value));
    }
    return json(value);
}

// Field lookup used by :sort and :group_by; non-objects have no fields.
static const json* find_field(const json& item, const std::string& field) {
    if (!item.is_object()) {
        return nullptr;
    }
    auto it = item.find(field);
    return it == item.end() ? nullptr : &(*it);
}

// Ordering for :sort: numbers numerically, strings lexically, anything else by serialized text.
static int compare_values(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) {
        double lhs = a.get<double>();
        double rhs = b.get<double>();
        return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
    }
    return a.dump().compare(b.dump());
}

// A double quote opens a quoted argument only at the start of a token.
static bool opens_quote(const std::string& chain, size_t pos) {
    if (pos == 0) return true;
    char prev = chain[pos - 1];
    return prev == ' ' || prev == '\t' || prev == '[' || prev == ',' ||
           prev == '=' || prev == '!' || prev == '<' || prev == '>';
}

// Offset of the quote closing the argument opened just before `from`, or npos.
static size_t find_closing_quote(const std::string& chain, size_t from) {
    for (size_t i = from; i < chain.length(); ++i) {
        if (chain[i] == '\\') {
            ++i;
        } else if (chain[i] == '"') {
            return i;
        }
    }
    return std::string::npos;
}

std::vector<size_t> JSONTransformer::find_command_breaks(const std::string& chain) {
    std::vector<size_t> breaks;
    bool quotes_enabled = true;
    size_t i = 0;
    while (i < chain.length()) {
        if (chain[i] == '"' && quotes_enabled && opens_quote(chain, i)) {
            size_t close = find_closing_quote(chain, i + 1);
            if (close != std::string::npos) {
                i = close + 1;
                continue;
            }
            // Unterminated: the rest of the chain splits as if unquoted
            quotes_enabled = false;
        } else if (chain[i] == ' ' && i + 1 < chain.length() && chain[i + 1] == ':') {
            breaks.push_back(i);
        }
        ++i;
    }
    return breaks;
}

std::vector<std::string> JSONTransformer::split_commands(const std::string& chain) {
    std::vector<std::string> commands;
    size_t start = 0;
    std::vector<size_t> breaks = find_command_breaks(chain);
    breaks.push_back(chain.length());
    for (size_t end : breaks) {
        std::string command = trim(chain.substr(start, end - start));
        if (!command.empty()) {
            commands.push_back(command);
        }
        start = end + 1;
    }
    return commands;
}

json JSONTransformer::apply(const json& value, const std::string& commands) const {
    std::vector<std::string> chain = split_commands(commands);
    if (chain.empty()) {
        throw TransformException("empty transform chain");
    }

    json current = value;
    for (const auto& command : chain) {
        current = apply_command(current, command);
    }
    return current;
}

json JSONTransformer::apply_command(const json& value, const std::string& command) const {
    std::string name = command;
    std::string args;
    size_t space = command.find(' ');
    if (space != std::string::npos) {
        name = command.substr(0, space);
        args = trim(command.substr(space + 1));
    }

    if (name == ":keys") return transform_keys(value);
    if (name == ":values") return transform_values(value);
    if (name == ":count") return transform_count(value);
    if (name == ":flatten") return transform_flatten(value);
    if (name == ":pick") return transform_pick(value, args, true);
    if (name == ":omit") return transform_pick(value, args, false);
    if (name == ":sort") return transform_sort(value, args);
    if (name == ":uniq") return transform_uniq(value);
    if (name == ":group_by") return transform_group_by(value, args);
    if (name == ":filter") return transform_filter(value, args);
    if (name == ":sum" || name == ":avg" || name == ":min" || name == ":max") {
        return transform_aggregate(value, name, args);
    }
    throw TransformException("unknown transform command: " + name);
}

json JSONTransformer::transform_keys(const json& value) const {
    if (!value.is_object()) {
        throw TransformException(":keys requires an object, got " + std::string(value.type_name()));
    }
    json keys = json::array();
    for (const auto& item : value.items()) {
        keys.push_back(item.key());
    }
    return keys;
}

json JSONTransformer::transform_values(const json& value) const {
    if (!value.is_object()) {
        throw TransformException(":values requires an object, got " + std::string(value.type_name()));
    }
    json values = json::array();
    for (const auto& item : value.items()) {
        values.push_back(item.value());
    }
    return values;
}

json JSONTransformer::transform_count(const json& value) const {
    if (!value.is_array() && !value.is_object()) {
        throw TransformException(":count requires an array or object, got " + std::string(value.type_name()));
    }
    return json(value.size());
}

json JSONTransformer::transform_flatten(const json& value) const {
    if (!value.is_array()) {
        throw TransformException(":flatten requires an array, got " + std::string(value.type_name()));
    }
    json flattened = json::array();
    for (const auto& item : value) {
        if (item.is_array()) {
            for (const auto& inner : item) {
                flattened.push_back(inner);
            }
        } else {
            flattened.push_back(item);
        }
    }
    return flattened;
}

// :pick when `keep` is true, :omit otherwise.
json JSONTransformer::transform_pick(const json& value, const std::string& args, bool keep) const {
    const std::string name = keep ? ":pick" : ":omit";
    std::vector<std::string> fields = split_fields(args);
    if (fields.empty()) {
        throw TransformException(name + " requires field names (e.g., " + name + " name,email)");
    }

    auto project = [&](const json& object) {
        json projected = json::object();
        for (const auto& item : object.items()) {
            bool listed = std::find(fields.begin(), fields.end(), item.key()) != fields.end();
            if (listed == keep) {
                projected[item.key()] = item.value();
            }
        }
        return projected;
    };

    if (value.is_object()) {
        return project(value);
    }
    if (value.is_array()) {
        json result = json::array();
        for (const auto& item : value) {
            result.push_back(item.is_object() ? project(item) : item);
        }
        return result;
    }
    throw TransformException(name + " requires an array of objects or an object, got " + std::string(value.type_name()));
}

json JSONTransformer::transform_sort(const json& value, const std::string& field) const {
    if (!value.is_array()) {
        throw TransformException(":sort requires an array, got " + std::string(value.type_name()));
    }
    std::vector<json> sorted(value.begin(), value.end());
    if (field.empty()) {
        std::stable_sort(sorted.begin(), sorted.end(), [](const json& a, const json& b) {
            return a.dump() < b.dump();
        });
    } else {
        const json null_value;
        std::stable_sort(sorted.begin(), sorted.end(), [&](const json& a, const json& b) {
            const json* a_val = find_field(a, field);
            const json* b_val = find_field(b, field);
            return compare_values(a_val ? *a_val : null_value, b_val ? *b_val : null_value) < 0;
        });
    }
    return json(sorted);
}

json JSONTransformer::transform_uniq(const json& value) const {
    if (!value.is_array()) {
        throw TransformException(":uniq requires an array, got " + std::string(value.type_name()));
    }
    // Object keys serialize in sorted order, so dump() is a canonical form.
    std::unordered_set<std::string> seen;
    json unique = json::array();
    for (const auto& item : value) {
        if (seen.insert(item.dump()).second) {
            unique.push_back(item);
        }
    }
    return unique;
}

json JSONTransformer::transform_group_by(const json& value, const std::string& field) const {
    if (field.empty()) {
        throw TransformException(":group_by requires a field name (e.g., :group_by type)");
    }
    if (!value.is_array()) {
        throw TransformException(":group_by requires an array, got " + std::string(value.type_name()));
    }
    json groups = json::object();
    for (const auto& item : value) {
        const json* key_value = find_field(item, field);
        std::string key = "null";
        if (key_value != nullptr) {
            key = key_value->is_string() ? key_value->get<std::string>() : key_value->dump();
        }
        if (!groups.contains(key)) {
            groups[key] = json::array();
        }
        groups[key].push_back(item);
    }
    return groups;
}

json JSONTransformer::transform_filter(const json& value, const std::string& expr) const {
    if (expr.empty()) {
        throw TransformException(":filter requires an expression (e.g., :filter price < 10)");
    }
    if (!value.is_array()) {
        throw TransformException(":filter requires an array, got " + std::string(value.type_name()));
    }
    Predicate predicate;
    try {
        predicate = parse_predicate(expr);
    } catch (const InvalidPredicateException& e) {
        throw TransformException(":filter " + std::string(e.what()));
    }
    json matches = json::array();
    for (const auto& item : value) {
        if (eval_predicate(item, predicate)) {
            matches.push_back(item);
        }
    }
    return matches;
}

json JSONTransformer::transform_aggregate(const json& value, const std::string& name, const std::string& field) const {
    if (!value.is_array()) {
        throw TransformException(name + " requires an array, got " + std::string(value.type_name()));
    }

    // Non-numeric elements (or elements without the field) are skipped.
    std::vector<double> numbers;
    for (const auto& item : value) {
        const json* candidate = field.empty() ? &item : find_field(item, field);
        if (candidate != nullptr && candidate->is_number()) {
            numbers.push_back(candidate->get<double>());
        }
    }

    if (name == ":sum") {
        double sum = 0.0;
        for (double n : numbers) sum += n;
        return number_to_json(sum);
    }
    if (numbers.empty()) {
        return json(nullptr);
    }
    if (name == ":avg") {
        double sum = 0.0;
        for (double n : numbers) sum += n;
        return number_to_json(sum / static_cast<double>(numbers.size()));
    }
    if (name == ":min") {
        return number_to_json(*std::min_element(numbers.begin(), numbers.end()));
    }
    return number_to_json(*std::max_element(numbers.begin(), numbers.end()));
}

} // namespace jsonexplorer
