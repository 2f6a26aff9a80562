#include "jsonexplorer++/json_query_engine.h"
#include "jsonexplorer++/common_types.h"
#include "jsonexplorer++/exceptions.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <cstdlib> // For std::getenv

// Alias for convenience
using json = nlohmann::json;

struct CliOptions {
    std::string file;          // empty = stdin
    std::string query = ".";
    bool schema = false;
    bool keys = false;
    bool compact = false;
    bool query_output = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [FILE] [options]\n"
              << "\n"
              << "Evaluates a query against a JSON document and prints the result.\n"
              << "Reads the document from stdin when FILE is omitted.\n"
              << "\n"
              << "Options:\n"
              << "  -Q, --query QUERY    Path and transforms, e.g. '.items[price < 10] :sort price'\n"
              << "  -s, --schema         Print the inferred schema of the result\n"
              << "  -k, --keys           Print key suggestions for the query\n"
              << "  -c, --compact        Print the result on one line\n"
              << "  -q, --query-output   Print the query itself (after validating it)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment:\n"
              << "  JSONEXPLORER_CONFIG  Path to a JSON configuration file\n";
}

// Returns false when the program should exit (help shown or bad arguments).
bool parse_arguments(int argc, char** argv, CliOptions& options, int& exit_code) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return false;
        } else if (arg == "-Q" || arg == "--query") {
            if (i + 1 >= argc) {
                std::cerr << "ERROR: " << arg << " requires a value." << std::endl;
                exit_code = 2;
                return false;
            }
            options.query = argv[++i];
        } else if (arg == "-s" || arg == "--schema") {
            options.schema = true;
        } else if (arg == "-k" || arg == "--keys") {
            options.keys = true;
        } else if (arg == "-c" || arg == "--compact") {
            options.compact = true;
        } else if (arg == "-q" || arg == "--query-output") {
            options.query_output = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "ERROR: Unknown option '" << arg << "'." << std::endl;
            print_usage(argv[0]);
            exit_code = 2;
            return false;
        } else if (options.file.empty()) {
            options.file = (arg == "-") ? "" : arg;
        } else {
            std::cerr << "ERROR: Unexpected argument '" << arg << "'." << std::endl;
            exit_code = 2;
            return false;
        }
    }
    return true;
}

json read_document(const std::string& file) {
    std::string content;
    if (file.empty()) {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(file);
        if (!in) {
            throw jsonexplorer::JsonParsingException("Cannot open '" + file + "'");
        }
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    try {
        return json::parse(content);
    } catch (const json::parse_error& e) {
        throw jsonexplorer::JsonParsingException(std::string(file.empty() ? "<stdin>" : file) + ": " + e.what());
    }
}

int main(int argc, char** argv) {
    CliOptions options;
    int exit_code = 0;
    if (!parse_arguments(argc, argv, options, exit_code)) {
        return exit_code;
    }

    try {
        jsonexplorer::ExplorerConfig config;
        const char* config_env = std::getenv("JSONEXPLORER_CONFIG");
        if (config_env && *config_env) {
            config = jsonexplorer::load_config_file(config_env);
        }

        json document = read_document(options.file);
        jsonexplorer::JSONQueryEngine engine(config);

        if (options.keys) {
            for (const auto& key : engine.suggest_keys(document, options.query)) {
                std::cout << key << "\n";
            }
            return 0;
        }

        if (options.schema) {
            std::cout << engine.schema(document, options.query) << std::endl;
            return 0;
        }

        json result = engine.evaluate(document, options.query);
        if (options.query_output) {
            std::cout << options.query << std::endl;
        } else if (options.compact || !config.pretty_output) {
            std::cout << jsonexplorer::compact_print(result) << std::endl;
        } else {
            std::cout << jsonexplorer::pretty_print(result, config.indent_width) << std::endl;
        }
    } catch (const jsonexplorer::QueryParseException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        // Error positions refer to the path part of the query
        std::cerr << "  " << jsonexplorer::JSONQueryEngine::split_query(options.query).path
                  << "\n  " << std::string(e.error().pos, ' ') << "^" << std::endl;
        return 1;
    } catch (const jsonexplorer::JSONExplorerException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "CRITICAL: A standard C++ exception occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
