#include "jsonexplorer++/common_types.h"
#include "jsonexplorer++/exceptions.h"
#include <fstream>

namespace jsonexplorer {

namespace {

std::size_t read_count(const json& config_json, const char* name, std::size_t current, bool allow_zero) {
    auto it = config_json.find(name);
    if (it == config_json.end()) {
        return current;
    }
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        throw ArgumentInvalidException(std::string("'") + name + "' must be a non-negative integer, got " + it->dump());
    }
    std::size_t value = it->get<std::size_t>();
    if (value == 0 && !allow_zero) {
        throw ArgumentInvalidException(std::string("'") + name + "' must be greater than zero.");
    }
    return value;
}

} // namespace

ExplorerConfig ExplorerConfig::from_json(const json& config_json) {
    if (!config_json.is_object()) {
        throw ArgumentInvalidException("Configuration must be a JSON object.");
    }

    ExplorerConfig config;
    config.schema_max_samples = read_count(config_json, "schema_max_samples", config.schema_max_samples, false);
    config.string_sample_length = read_count(config_json, "string_sample_length", config.string_sample_length, false);
    config.max_candidates = read_count(config_json, "max_candidates", config.max_candidates, true);

    if (auto it = config_json.find("pretty_output"); it != config_json.end()) {
        if (!it->is_boolean()) {
            throw ArgumentInvalidException("'pretty_output' must be a boolean, got " + it->dump());
        }
        config.pretty_output = it->get<bool>();
    }
    if (auto it = config_json.find("indent_width"); it != config_json.end()) {
        if (!it->is_number_integer() || it->get<long long>() < 0 || it->get<long long>() > 16) {
            throw ArgumentInvalidException("'indent_width' must be an integer between 0 and 16, got " + it->dump());
        }
        config.indent_width = it->get<int>();
    }
    return config;
}

json ExplorerConfig::to_json() const {
    return json{
        {"schema_max_samples", schema_max_samples},
        {"string_sample_length", string_sample_length},
        {"pretty_output", pretty_output},
        {"indent_width", indent_width},
        {"max_candidates", max_candidates}
    };
}

ExplorerConfig load_config_file(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw JsonParsingException("Cannot open configuration file '" + file_path + "'");
    }
    json config_json;
    try {
        in >> config_json;
    } catch (const json::parse_error& e) {
        throw JsonParsingException("Configuration file '" + file_path + "': " + e.what());
    }
    return ExplorerConfig::from_json(config_json);
}

} // namespace jsonexplorer
