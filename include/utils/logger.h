// logger.h - spdlog setup for the loradeck CLI
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace loradeck::logger {

// Case-insensitive; "warning" and "fatal" are accepted. Unknown text maps to info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// LORADECK_LOG_DIR, or ~/.loradeck/logs.
std::string get_log_dir();

// <log dir>/loradeck.jsonl.YYYY-MM-DD for the local date.
std::string get_log_file_path();

// LORADECK_LOG_RETENTION_DAYS when it parses to 1..364, otherwise 7.
int get_retention_days();

// Removes loradeck.jsonl.* files dated before the cutoff. A missing directory is a no-op.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Installs a default logger named "loradeck" over the given sinks, or a stderr
// sink when none are given. An empty pattern keeps each sink's own pattern.
void init(const std::string& level,
          const std::string& pattern,
          std::vector<spdlog::sink_ptr> sinks = {});

// Console: stderr, human-readable, level LORADECK_LOG_LEVEL (default warn) so
// table and JSON output on stdout is never interleaved with log lines.
// File: JSON lines in get_log_file_path(). An unwritable log directory disables
// the file sink with a warning instead of failing the command.
void init_from_env();

}  // namespace loradeck::logger
