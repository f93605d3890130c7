// CLI command function declarations
#pragma once

#include <ostream>

#include "utils/cli.h"

namespace loradeck {
namespace cli {
namespace commands {

/// Execute the 'scan' command
/// @param options Scan options (paths, output and merge flags)
/// @param out Stream receiving the card table or JSON
/// @return Exit code (0=success, 1=error)
int scan(const ScanCommandOptions& options, std::ostream& out);

/// Execute the 'classify' command
/// @param options Classify options (names, json)
/// @param out Stream receiving the results
/// @return Exit code (0=success)
int classify(const ClassifyOptions& options, std::ostream& out);

}  // namespace commands
}  // namespace cli
}  // namespace loradeck
