#pragma once

#include <string>
#include <cstddef> // For std::size_t
#include <nlohmann/json.hpp>

namespace jsonexplorer {

using json = nlohmann::json;

// Settings shared by the engine components and the command-line front end.
struct ExplorerConfig {
    // Schema inference
    std::size_t schema_max_samples = 10;   // Leading array elements sampled per array
    std::size_t string_sample_length = 30; // Characters kept in a string sample

    // Output formatting
    bool pretty_output = true;
    int indent_width = 2;

    // Upper bound on key suggestions returned for a container (0 = unlimited)
    std::size_t max_candidates = 20;

    // Builds a config from a JSON object. Members that are absent keep their defaults.
    // Throws ArgumentInvalidException if a member has the wrong type or an invalid value.
    static ExplorerConfig from_json(const json& config_json);

    json to_json() const;
};

// Reads and parses a JSON configuration file.
// Throws JsonParsingException if the file cannot be read or is not valid JSON.
ExplorerConfig load_config_file(const std::string& file_path);

} // namespace jsonexplorer
