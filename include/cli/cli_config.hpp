// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the mmq command-line tool
// Allows loading matcher, tokenizer and output settings from YAML files

#ifndef MMQ_CLI_CONFIG_HPP
#define MMQ_CLI_CONFIG_HPP

#include "core/types.hpp"
#include "text/tokenizer.hpp"
#include <string>
#include <optional>
#include <vector>

namespace mmq {

/// Configuration structure for the mmq CLI
struct CliConfig {
    // === Matcher Settings ===
    MatcherConfig matcher;

    // === Tokenizer Settings ===
    struct Tokenizer {
        TokenizerMode mode = TokenizerMode::WORDS;
        bool lowercase = true;
    } tokenizer;

    // === Output Settings ===
    struct Output {
        bool colors_enabled = true;
        bool verbose = false;
        size_t max_results = 0;  // 0 = unlimited
    } output;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    /// The tolerance upper bound depends on the pattern and is checked when
    /// the matcher is built
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace mmq

#endif // MMQ_CLI_CONFIG_HPP
