// File: src/cli/mmq_cli.hpp
//
// mmq CLI class definition
// Extracted for testability

#ifndef MMQ_CLI_HPP
#define MMQ_CLI_HPP

#include "cli/cli_config.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace mmq {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* BOLD_RED = "\033[1;31m";
}

/// Command-line front end: tokenizes a pattern and a reference text, runs
/// the matcher and prints one line per result
///
/// Exit codes: 0 at least one result, 1 no result, 2 usage or configuration
/// error.
class MmqCli {
public:
    static constexpr int kExitMatched = 0;
    static constexpr int kExitNoMatch = 1;
    static constexpr int kExitUsage = 2;

    /// Parsed command line
    struct Options {
        CliConfig config;
        std::string pattern_text;
        std::string reference_path;   ///< Empty or "-" reads standard input
        bool show_help = false;
    };

    /// @param out Destination for results
    /// @param err Destination for errors and diagnostics
    MmqCli(std::ostream& out, std::ostream& err);

    /// Parse arguments, read the reference and report matches
    /// @param args Arguments without the program name
    /// @param in Stream used when the reference comes from standard input
    /// @return Exit code
    int Run(const std::vector<std::string>& args, std::istream& in);

    /// Parse arguments; a --config file is applied before the other options
    /// @return Options, or std::nullopt after printing the problem to err
    std::optional<Options> ParseArguments(const std::vector<std::string>& args) const;

    /// Match an already loaded reference text
    /// @return Exit code
    int Execute(const Options& options, const std::string& reference_text) const;

    /// Print usage text
    static void PrintUsage(std::ostream& out);

private:
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace mmq

#endif // MMQ_CLI_HPP
