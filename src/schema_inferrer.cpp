#include "jsonexplorer++/schema_inferrer.h"
#include <algorithm> // For std::min, std::max
#include <cmath>     // For std::fabs, std::floor
#include <limits>

namespace jsonexplorer {

static std::shared_ptr<const SchemaType> share(SchemaType schema) {
    return std::make_shared<const SchemaType>(std::move(schema));
}

static bool same_schema(const std::shared_ptr<const SchemaType>& a, const std::shared_ptr<const SchemaType>& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

bool FieldSchema::operator==(const FieldSchema& other) const {
    return optional == other.optional && count == other.count && same_schema(schema, other.schema);
}

SchemaType SchemaType::null_type() {
    SchemaType schema;
    schema.kind = Kind::NULL_TYPE;
    return schema;
}

SchemaType SchemaType::bool_type() {
    SchemaType schema;
    schema.kind = Kind::BOOL;
    return schema;
}

SchemaType SchemaType::number_type(double min, double max) {
    SchemaType schema;
    schema.kind = Kind::NUMBER;
    schema.min = min;
    schema.max = max;
    return schema;
}

SchemaType SchemaType::string_type(std::optional<std::string> sample) {
    SchemaType schema;
    schema.kind = Kind::STRING;
    schema.sample = std::move(sample);
    return schema;
}

SchemaType SchemaType::array_type(size_t len_min, size_t len_max, const SchemaType& items) {
    SchemaType schema;
    schema.kind = Kind::ARRAY;
    schema.len_min = len_min;
    schema.len_max = len_max;
    schema.items = share(items);
    return schema;
}

SchemaType SchemaType::object_type(std::map<std::string, FieldSchema> fields) {
    SchemaType schema;
    schema.kind = Kind::OBJECT;
    schema.fields = std::move(fields);
    return schema;
}

SchemaType SchemaType::union_type(std::set<std::string> type_names) {
    SchemaType schema;
    schema.kind = Kind::UNION;
    schema.type_names = std::move(type_names);
    return schema;
}

SchemaType SchemaType::unknown_type() {
    return SchemaType();
}

std::string SchemaType::type_name() const {
    switch (kind) {
        case Kind::NULL_TYPE: return "null";
        case Kind::BOOL:      return "bool";
        case Kind::NUMBER:    return "number";
        case Kind::STRING:    return "string";
        case Kind::ARRAY:     return "array";
        case Kind::OBJECT:    return "object";
        case Kind::UNKNOWN:   return "unknown";
        case Kind::UNION: {
            std::string joined;
            for (const auto& name : type_names) {
                if (!joined.empty()) joined += " | ";
                joined += name;
            }
            return joined;
        }
    }
    return "unknown";
}

bool SchemaType::operator==(const SchemaType& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case Kind::NULL_TYPE:
        case Kind::BOOL:
        case Kind::UNKNOWN:
            return true;
        case Kind::NUMBER:
            return min == other.min && max == other.max;
        case Kind::STRING:
            return sample == other.sample;
        case Kind::ARRAY:
            return len_min == other.len_min && len_max == other.len_max && same_schema(items, other.items);
        case Kind::OBJECT:
            return fields == other.fields;
        case Kind::UNION:
            return type_names == other.type_names;
    }
    return false;
}

// First `max_chars` UTF-8 code points of `text`.
static std::string truncate_chars(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.length(); ++i) {
        bool continuation = (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80;
        if (!continuation) {
            if (chars == max_chars) {
                return text.substr(0, i);
            }
            ++chars;
        }
    }
    return text;
}

SchemaInferrer::SchemaInferrer(const ExplorerConfig& config) : _config(config) {}

SchemaType SchemaInferrer::infer(const json& value) const {
    return infer(value, _config.schema_max_samples);
}

SchemaType SchemaInferrer::infer(const json& value, size_t max_samples) const {
    switch (value.type()) {
        case json::value_t::null:
            return SchemaType::null_type();
        case json::value_t::boolean:
            return SchemaType::bool_type();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: {
            double number = value.get<double>();
            return SchemaType::number_type(number, number);
        }
        case json::value_t::string:
            return SchemaType::string_type(truncate_chars(value.get_ref<const std::string&>(), _config.string_sample_length));
        case json::value_t::array: {
            if (value.empty()) {
                return SchemaType::array_type(0, 0, SchemaType::unknown_type());
            }
            std::optional<SchemaType> merged;
            size_t sampled = 0;
            for (const auto& item : value) {
                if (sampled++ >= max_samples) break;
                SchemaType item_schema = infer(item, max_samples);
                merged = merged ? merge(*merged, item_schema) : item_schema;
            }
            return SchemaType::array_type(value.size(), value.size(),
                                          merged ? *merged : SchemaType::unknown_type());
        }
        case json::value_t::object: {
            std::map<std::string, FieldSchema> fields;
            for (const auto& item : value.items()) {
                FieldSchema field;
                field.schema = share(infer(item.value(), max_samples));
                fields.emplace(item.key(), field);
            }
            return SchemaType::object_type(std::move(fields));
        }
        case json::value_t::binary:
        case json::value_t::discarded:
            return SchemaType::unknown_type();
    }
    return SchemaType::unknown_type();
}

// Member names of a union, or the single type name of anything else.
static void collect_type_names(const SchemaType& schema, std::set<std::string>& names) {
    if (schema.kind == SchemaType::Kind::UNION) {
        names.insert(schema.type_names.begin(), schema.type_names.end());
    } else {
        names.insert(schema.type_name());
    }
}

SchemaType SchemaInferrer::merge(const SchemaType& a, const SchemaType& b) {
    using Kind = SchemaType::Kind;

    if (a.kind != b.kind || a.kind == Kind::UNION) {
        std::set<std::string> names;
        collect_type_names(a, names);
        collect_type_names(b, names);
        return SchemaType::union_type(std::move(names));
    }

    switch (a.kind) {
        case Kind::NULL_TYPE:
        case Kind::BOOL:
        case Kind::UNKNOWN:
        case Kind::UNION:
            return a;
        case Kind::NUMBER:
            return SchemaType::number_type(std::min(a.min, b.min), std::max(a.max, b.max));
        case Kind::STRING:
            return SchemaType::string_type(b.sample);
        case Kind::ARRAY: {
            SchemaType items = (a.items && b.items) ? merge(*a.items, *b.items) : SchemaType::unknown_type();
            return SchemaType::array_type(std::min(a.len_min, b.len_min), std::max(a.len_max, b.len_max), items);
        }
        case Kind::OBJECT: {
            std::map<std::string, FieldSchema> fields = a.fields;
            for (auto& entry : fields) {
                if (b.fields.find(entry.first) == b.fields.end()) {
                    entry.second.optional = true;
                }
            }
            for (const auto& entry : b.fields) {
                auto it = fields.find(entry.first);
                if (it == fields.end()) {
                    FieldSchema field = entry.second;
                    field.optional = true;
                    fields.emplace(entry.first, field);
                    continue;
                }
                FieldSchema& field = it->second;
                field.schema = share(merge(*field.schema, *entry.second.schema));
                field.optional = field.optional || entry.second.optional;
                ++field.count;
            }
            return SchemaType::object_type(std::move(fields));
        }
    }
    return SchemaType::unknown_type();
}

static std::string format_number(double value) {
    if (std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
        return std::to_string(static_cast<long long>(value));
    }
    return json(value).dump();
}

std::string SchemaInferrer::format(const SchemaType& schema, size_t indent) {
    using Kind = SchemaType::Kind;
    const std::string pad(indent * 2, ' ');

    switch (schema.kind) {
        case Kind::NULL_TYPE:
        case Kind::BOOL:
        case Kind::UNION:
        case Kind::UNKNOWN:
            return schema.type_name();
        case Kind::NUMBER:
            if (std::fabs(schema.min - schema.max) < std::numeric_limits<double>::epsilon()) {
                return "number  # " + format_number(schema.min);
            }
            return "number  # " + format_number(schema.min) + ".." + format_number(schema.max);
        case Kind::STRING:
            if (schema.sample) {
                return "string  # \"" + *schema.sample + "\"";
            }
            return "string";
        case Kind::ARRAY: {
            std::string len_info = std::to_string(schema.len_min);
            if (schema.len_min != schema.len_max) {
                len_info += ".." + std::to_string(schema.len_max);
            }
            std::string inner = schema.items ? format(*schema.items, indent + 1) : "unknown";
            return "[" + inner + "]  # array of " + len_info;
        }
        case Kind::OBJECT: {
            if (schema.fields.empty()) {
                return "{}";
            }
            std::string out = "{";
            for (const auto& entry : schema.fields) {
                out += "\n" + pad + "  " + entry.first + (entry.second.optional ? "?" : "") + ": " +
                       format(*entry.second.schema, indent + 1) + ",";
            }
            out += "\n" + pad + "}";
            return out;
        }
    }
    return "unknown";
}

} // namespace jsonexplorer
