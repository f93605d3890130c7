#pragma once

#include <string>
#include <vector>

namespace loradeck {

/// Subcommand types for loradeck CLI
enum class Subcommand {
    None,      // No subcommand
    Scan,      // scan [PATH...]
    Classify,  // classify <NAME...>
};

/// Options for scan command
struct ScanCommandOptions {
    std::vector<std::string> paths;  // Empty: use configured lora_sources
    bool json{false};
    bool no_merge{false};       // One card per file, no High/Low grouping
    bool merge_sources{false};  // Merge folder trees of all roots
    std::string search;         // Case-insensitive match on file or version name
    std::string folder;         // Folder path or tree path prefix
};

/// Options for classify command
struct ClassifyOptions {
    std::vector<std::string> names;
    bool json{false};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    ScanCommandOptions scan_options;
    ClassifyOptions classify_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace loradeck
