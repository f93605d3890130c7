#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>

namespace loradeck {

std::string getScanHelpMessage();
std::string getClassifyHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "loradeck " << LORADECK_VERSION << " - LoRA library browser\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    loradeck <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    scan       Scan LoRA folders and list cards (High/Low merged)\n";
    oss << "    classify   Show the variant key and label of file names\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'loradeck <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getScanHelpMessage() {
    std::ostringstream oss;
    oss << "loradeck scan - Scan LoRA folders\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    loradeck scan [PATH...] [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    [PATH...]          Folders to scan (default: configured lora_sources)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --json             Print cards as a JSON array\n";
    oss << "    --no-merge         One card per file\n";
    oss << "    --merge-sources    Merge folder trees of all sources\n";
    oss << "    --search <TEXT>    Only cards whose file or version name contains TEXT\n";
    oss << "    --folder <PATH>    Only cards under PATH (folder or tree path)\n";
    oss << "    -h, --help         Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    LORADECK_CONFIG               Config file path (default: ~/.loradeck/config.json)\n";
    oss << "    LORADECK_LORA_SOURCES         Comma separated source folders\n";
    oss << "    LORADECK_MERGE_SOURCES        Merge folder trees (true|false)\n";
    oss << "    LORADECK_MERGE_VARIANTS       Group High/Low variants (true|false)\n";
    oss << "    LORADECK_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    LORADECK_LOG_DIR              Log directory (default: ~/.loradeck/logs)\n";
    oss << "    LORADECK_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    return oss.str();
}

std::string getClassifyHelpMessage() {
    std::ostringstream oss;
    oss << "loradeck classify - Classify file names\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    loradeck classify <NAME...> [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <NAME...>          File names or paths (e.g., wan22_t2v_high_e100.safetensors)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --json             Print results as a JSON array\n";
    oss << "    -h, --help         Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "loradeck " << LORADECK_VERSION << "\n";
    return oss.str();
}

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

constexpr const char* kScanUsage =
    "loradeck scan [PATH...] [--json] [--no-merge] [--merge-sources] [--search TEXT] "
    "[--folder PATH]";

CliResult usageError(CliResult result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
    return result;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 1;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "scan") == 0) {
        result.subcommand = Subcommand::Scan;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getScanHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--json") == 0) {
                result.scan_options.json = true;
            } else if (std::strcmp(argv[i], "--no-merge") == 0) {
                result.scan_options.no_merge = true;
            } else if (std::strcmp(argv[i], "--merge-sources") == 0) {
                result.scan_options.merge_sources = true;
            } else if (std::strcmp(argv[i], "--search") == 0 && i + 1 < argc) {
                result.scan_options.search = argv[++i];
            } else if (std::strcmp(argv[i], "--folder") == 0 && i + 1 < argc) {
                result.scan_options.folder = argv[++i];
            } else if (std::strcmp(argv[i], "--search") == 0 ||
                       std::strcmp(argv[i], "--folder") == 0) {
                return usageError(result, std::string(argv[i]) + " requires a value",
                                  kScanUsage);
            } else if (argv[i][0] == '-') {
                return usageError(result, std::string("unknown option ") + argv[i], kScanUsage);
            } else {
                result.scan_options.paths.emplace_back(argv[i]);
            }
        }
        return result;
    }

    if (std::strcmp(command, "classify") == 0) {
        result.subcommand = Subcommand::Classify;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getClassifyHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--json") == 0) {
                result.classify_options.json = true;
            } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
                return usageError(result, std::string("unknown option ") + argv[i],
                                  "loradeck classify <NAME...> [--json]");
            } else {
                result.classify_options.names.emplace_back(argv[i]);
            }
        }

        if (result.classify_options.names.empty()) {
            return usageError(result, "at least one name required",
                              "loradeck classify <NAME...> [--json]");
        }
        return result;
    }

    // Check for unknown flags (starting with - or --)
    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Scan: return "scan";
        case Subcommand::Classify: return "classify";
        default: return "unknown";
    }
}

}  // namespace loradeck
