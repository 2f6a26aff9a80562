#pragma once

#include "common_types.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace jsonexplorer {

using json = nlohmann::json;

struct SchemaType;

// A field of an object schema.
struct FieldSchema {
    std::shared_ptr<const SchemaType> schema;
    bool optional = false; // absent from at least one merged sample
    size_t count = 1;      // incremented by each merge in which both sides have the field

    bool operator==(const FieldSchema& other) const;
};

// Inferred shape of a JSON value. Only the members relevant to `kind` are meaningful.
// Nested schemas are immutable once built and may be shared between copies.
struct SchemaType {
    enum class Kind { NULL_TYPE, BOOL, NUMBER, STRING, ARRAY, OBJECT, UNION, UNKNOWN };

    Kind kind = Kind::UNKNOWN;
    double min = 0.0, max = 0.0;                // NUMBER
    std::optional<std::string> sample;          // STRING
    size_t len_min = 0, len_max = 0;            // ARRAY
    std::shared_ptr<const SchemaType> items;    // ARRAY
    std::map<std::string, FieldSchema> fields;  // OBJECT, ordered by name
    std::set<std::string> type_names;           // UNION

    static SchemaType null_type();
    static SchemaType bool_type();
    static SchemaType number_type(double min, double max);
    static SchemaType string_type(std::optional<std::string> sample);
    static SchemaType array_type(size_t len_min, size_t len_max, const SchemaType& items);
    static SchemaType object_type(std::map<std::string, FieldSchema> fields);
    static SchemaType union_type(std::set<std::string> type_names);
    static SchemaType unknown_type();

    // "null", "bool", "number", "string", "array", "object", "unknown",
    // or the member names joined with " | " for a union.
    std::string type_name() const;

    bool operator==(const SchemaType& other) const;
    bool operator!=(const SchemaType& other) const { return !(*this == other); }
};

class SchemaInferrer {
public:
    explicit SchemaInferrer(const ExplorerConfig& config = ExplorerConfig());

    // Infers with config.schema_max_samples.
    SchemaType infer(const json& value) const;

    /**
     * Scalars map directly; string samples keep the first config.string_sample_length characters.
     * Arrays sample at most `max_samples` leading elements and fold them with merge();
     * the length range records the real array length. An empty array has UNKNOWN items.
     * Never throws.
     */
    SchemaType infer(const json& value, size_t max_samples) const;

    /**
     * Numbers widen their range, strings keep b's sample, objects union their fields
     * (fields missing on either side become optional), arrays merge items and widen
     * their length range. Differing kinds become a UNION of both type names.
     */
    static SchemaType merge(const SchemaType& a, const SchemaType& b);

    // Indented text rendering, e.g. `{\n  name: string  # "Alice",\n  age?: number  # 25..35,\n}`.
    static std::string format(const SchemaType& schema, size_t indent = 0);

private:
    ExplorerConfig _config;
};

} // namespace jsonexplorer
