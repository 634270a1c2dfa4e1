// File: src/cli/cli_config.cpp
//
// YAML Configuration Implementation for the mmq CLI

#include "cli/cli_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace mmq {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Parse a non-negative count
static size_t ParseCount(const std::string& value) {
    long long count = std::stoll(value);
    if (count < 0) {
        throw std::invalid_argument("must be >= 0");
    }
    return static_cast<size_t>(count);
}

// Apply one "section.key: value" pair; throws std::invalid_argument or
// std::out_of_range on malformed numbers
static void ApplyValue(CliConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "matcher") {
        if (key == "allowed_differences") config.matcher.allowed_differences = std::stoi(value);
        else if (key == "nomatch_multiplier") config.matcher.nomatch_multiplier = std::stof(value);
        else if (key == "threshold") config.matcher.threshold = std::stof(value);
    }
    else if (section == "tokenizer") {
        if (key == "mode") config.tokenizer.mode = ParseTokenizerMode(value);
        else if (key == "lowercase") config.tokenizer.lowercase = ParseBool(value);
    }
    else if (section == "output") {
        if (key == "colors_enabled") config.output.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.output.verbose = ParseBool(value);
        else if (key == "max_results") config.output.max_results = ParseCount(value);
    }
}

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CliConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem != nullptr) {
                std::cerr << ": " << parser.problem << " at line "
                          << (parser.problem_mark.line + 1);
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": \"" << value << "\" ("
                                      << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# mmq CLI Configuration\n\n";

    ss << "matcher:\n";
    ss << "  allowed_differences: " << matcher.allowed_differences << "\n";
    ss << "  nomatch_multiplier: " << matcher.nomatch_multiplier << "\n";
    ss << "  threshold: " << matcher.threshold << "\n\n";

    ss << "tokenizer:\n";
    ss << "  mode: \"" << ToString(tokenizer.mode) << "\"\n";
    ss << "  lowercase: " << (tokenizer.lowercase ? "true" : "false") << "\n\n";

    ss << "output:\n";
    ss << "  colors_enabled: " << (output.colors_enabled ? "true" : "false") << "\n";
    ss << "  verbose: " << (output.verbose ? "true" : "false") << "\n";
    ss << "  max_results: " << output.max_results << "\n";

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate matcher ranges
    if (matcher.allowed_differences < 0) {
        errors.push_back("allowed_differences must be >= 0");
    }
    if (!(matcher.nomatch_multiplier >= 0.0f && matcher.nomatch_multiplier < 1.0f)) {
        errors.push_back("nomatch_multiplier must be >= 0.0 and < 1.0");
    }
    if (!(matcher.threshold >= 0.0f && matcher.threshold <= 1.0f)) {
        errors.push_back("threshold must be between 0.0 and 1.0");
    }

    return errors;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace mmq
