// File: src/cli/mmq_cli.cpp
//
// Command-line interface for approximate sequence matching
//
// Features:
// - Word or character tokenization of pattern and reference
// - YAML configuration file with command-line overrides
// - Ranked, thresholded results with the matched context
// - Verbose mode streaming the matcher's trace events

#include "cli/mmq_cli.hpp"
#include "core/diagnostics.hpp"
#include "core/matcher.hpp"
#include "text/tokenizer.hpp"
#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace mmq {

namespace {

std::string JoinTokens(const std::vector<std::string>& tokens, size_t begin, size_t end) {
    std::string joined;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) {
            joined += ' ';
        }
        joined += tokens[i];
    }
    return joined;
}

std::string JoinTokens(const std::vector<char>& tokens, size_t begin, size_t end) {
    return std::string(tokens.begin() + static_cast<std::ptrdiff_t>(begin),
                       tokens.begin() + static_cast<std::ptrdiff_t>(end));
}

/// Run one matcher over a tokenized reference and print the results
template<typename Token>
int ReportMatches(const std::vector<Token>& pattern,
                  const std::vector<Token>& reference,
                  const CliConfig& config,
                  std::shared_ptr<DiagnosticsSink> sink,
                  std::ostream& out) {
    Matcher<Token> matcher(pattern, config.matcher, sink);
    auto results = matcher.FindIn(reference);

    if (config.output.max_results > 0 && results.size() > config.output.max_results) {
        results.resize(config.output.max_results);
    }

    for (const auto& result : results) {
        size_t end = result.position + 1;
        size_t begin = end > pattern.size() ? end - pattern.size() : 0;

        const char* color = result.score >= 1.0f ? Color::GREEN : Color::YELLOW;
        if (config.output.colors_enabled) {
            out << color;
        }
        out << result.position << '\t' << std::fixed << std::setprecision(6) << result.score;
        if (config.output.colors_enabled) {
            out << Color::RESET;
        }
        out << '\t' << JoinTokens(reference, begin, end) << "\n";
    }

    return results.empty() ? MmqCli::kExitNoMatch : MmqCli::kExitMatched;
}

// Fetch the value following an option, advancing the cursor
bool NextValue(const std::vector<std::string>& args, size_t& i, std::string& value) {
    if (i + 1 >= args.size()) {
        return false;
    }
    value = args[++i];
    return true;
}

} // anonymous namespace

MmqCli::MmqCli(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {
}

void MmqCli::PrintUsage(std::ostream& out) {
    out << R"(Usage: mmq_cli [options] <pattern-text> [reference-file]

Finds approximate occurrences of <pattern-text> in the reference text
(read from standard input when the file is omitted or "-").

Options:
  --config <file>              Load settings from a YAML file
  --allowed-differences <n>    Pattern tokens that may be missing (default 0)
  --nomatch-multiplier <x>     Score decay per mismatch, in [0, 1) (default 0)
  --threshold <t>              Minimum score reported, in [0, 1] (default 1)
  --words                      Match words (default)
  --chars                      Match characters
  --no-lowercase               Keep letter case
  --max-results <n>            Print at most n results (0 = all)
  --verbose                    Trace matcher internals to stderr
  --no-color                   Plain output
  --help                       Show this text

Output: one line per result, "position<TAB>score<TAB>context", best first.
)";
}

std::optional<MmqCli::Options> MmqCli::ParseArguments(const std::vector<std::string>& args) const {
    Options options;
    options.config = CliConfig::Default();

    // The configuration file provides the base that other options override
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != "--config") {
            continue;
        }
        std::string path;
        if (!NextValue(args, i, path)) {
            err_ << "Error: --config requires a file\n";
            return std::nullopt;
        }
        auto loaded = CliConfig::LoadFromFile(path);
        if (!loaded) {
            err_ << "Error: could not load configuration from " << path << "\n";
            return std::nullopt;
        }
        options.config = *loaded;
    }

    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        try {
            if (arg == "--help" || arg == "-h") {
                options.show_help = true;
            } else if (arg == "--config") {
                ++i;  // Already applied
            } else if (arg == "--allowed-differences") {
                if (!NextValue(args, i, value)) throw std::invalid_argument("missing value");
                options.config.matcher.allowed_differences = std::stoi(value);
            } else if (arg == "--nomatch-multiplier") {
                if (!NextValue(args, i, value)) throw std::invalid_argument("missing value");
                options.config.matcher.nomatch_multiplier = std::stof(value);
            } else if (arg == "--threshold") {
                if (!NextValue(args, i, value)) throw std::invalid_argument("missing value");
                options.config.matcher.threshold = std::stof(value);
            } else if (arg == "--max-results") {
                if (!NextValue(args, i, value)) throw std::invalid_argument("missing value");
                long long count = std::stoll(value);
                if (count < 0) throw std::invalid_argument("must be >= 0");
                options.config.output.max_results = static_cast<size_t>(count);
            } else if (arg == "--words") {
                options.config.tokenizer.mode = TokenizerMode::WORDS;
            } else if (arg == "--chars") {
                options.config.tokenizer.mode = TokenizerMode::CHARACTERS;
            } else if (arg == "--no-lowercase") {
                options.config.tokenizer.lowercase = false;
            } else if (arg == "--verbose") {
                options.config.output.verbose = true;
            } else if (arg == "--no-color") {
                options.config.output.colors_enabled = false;
            } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
                err_ << "Error: unknown option " << arg << "\n";
                return std::nullopt;
            } else {
                positional.push_back(arg);
            }
        } catch (const std::exception& e) {
            err_ << "Error: invalid value for " << arg << " (" << e.what() << ")\n";
            return std::nullopt;
        }
    }

    if (options.show_help) {
        return options;
    }

    if (positional.empty() || positional.size() > 2) {
        err_ << "Error: expected <pattern-text> [reference-file]\n";
        return std::nullopt;
    }

    options.pattern_text = positional[0];
    if (positional.size() == 2) {
        options.reference_path = positional[1];
    }

    if (!options.config.Validate()) {
        for (const auto& error : options.config.GetValidationErrors()) {
            err_ << "Error: " << error << "\n";
        }
        return std::nullopt;
    }

    return options;
}

int MmqCli::Run(const std::vector<std::string>& args, std::istream& in) {
    auto options = ParseArguments(args);
    if (!options) {
        PrintUsage(err_);
        return kExitUsage;
    }

    if (options->show_help) {
        PrintUsage(out_);
        return kExitMatched;
    }

    std::stringstream buffer;
    if (options->reference_path.empty() || options->reference_path == "-") {
        buffer << in.rdbuf();
    } else {
        std::ifstream file(options->reference_path);
        if (!file.is_open()) {
            err_ << "Error: File not found: " << options->reference_path << "\n";
            return kExitUsage;
        }
        buffer << file.rdbuf();
    }

    return Execute(*options, buffer.str());
}

int MmqCli::Execute(const Options& options, const std::string& reference_text) const {
    const CliConfig& config = options.config;

    std::shared_ptr<DiagnosticsSink> sink;
    if (config.output.verbose) {
        sink = std::make_shared<StreamDiagnosticsSink>(err_, DiagnosticLevel::TRACE);
    }

    try {
        if (config.tokenizer.mode == TokenizerMode::CHARACTERS) {
            CharacterTokenizer::Config tokenizer_config;
            tokenizer_config.lowercase = config.tokenizer.lowercase;
            CharacterTokenizer tokenizer(tokenizer_config);

            return ReportMatches(tokenizer.Tokenize(options.pattern_text),
                                 tokenizer.Tokenize(reference_text),
                                 config, sink, out_);
        }

        WordTokenizer::Config tokenizer_config;
        tokenizer_config.lowercase = config.tokenizer.lowercase;
        WordTokenizer tokenizer(tokenizer_config);

        return ReportMatches(tokenizer.Tokenize(options.pattern_text),
                             tokenizer.Tokenize(reference_text),
                             config, sink, out_);
    } catch (const MatchError& e) {
        if (config.output.colors_enabled) {
            err_ << Color::BOLD_RED << "Error: " << Color::RESET;
        } else {
            err_ << "Error: ";
        }
        err_ << e.what() << " [" << ToString(e.code()) << "]\n";
        return kExitUsage;
    }
}

} // namespace mmq
