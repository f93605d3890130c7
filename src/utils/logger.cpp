#include "utils/logger.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "utils/text.h"

namespace fs = std::filesystem;

namespace loradeck::logger {

namespace {
    inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
        if (localtime_s(result, time) == 0) {
            return result;
        }
        return nullptr;
#else
        return localtime_r(time, result);
#endif
    }

    constexpr const char* LOG_FILE_BASE = "loradeck.jsonl";
    constexpr const char* DEFAULT_DATA_DIR = ".loradeck";
    constexpr const char* LOG_SUBDIR = "logs";
    constexpr int DEFAULT_RETENTION_DAYS = 7;
    constexpr const char* DEFAULT_CONSOLE_LEVEL = "warn";

    constexpr const char* LOG_DIR_ENV = "LORADECK_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "LORADECK_LOG_LEVEL";
    constexpr const char* LOG_RETENTION_DAYS_ENV = "LORADECK_LOG_RETENTION_DAYS";

    std::string format_date(std::chrono::system_clock::time_point tp) {
        auto time_t_value = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_value{};
        safe_localtime(&time_t_value, &tm_value);
        std::ostringstream oss;
        oss << std::put_time(&tm_value, "%Y-%m-%d");
        return oss.str();
    }

    std::string get_home_dir() {
        if (const char* home = std::getenv("HOME")) {
            return home;
        }
        if (const char* userprofile = std::getenv("USERPROFILE")) {
            return userprofile;
        }
        return "/tmp";
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    const std::string lower = to_lower_ascii(trim_ascii(level_text));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        if (!is_blank(env)) return env;
    }
    return (fs::path(get_home_dir()) / DEFAULT_DATA_DIR / LOG_SUBDIR).string();
}

std::string get_log_file_path() {
    std::string filename =
        std::string(LOG_FILE_BASE) + "." + format_date(std::chrono::system_clock::now());
    return (fs::path(get_log_dir()) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(LOG_RETENTION_DAYS_ENV)) {
        try {
            int days = std::stoi(env);
            if (days > 0 && days < 365) {
                return days;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
    }
    return DEFAULT_RETENTION_DAYS;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) {
        return;
    }

    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    const std::string cutoff_str = format_date(cutoff);
    const std::string prefix = std::string(LOG_FILE_BASE) + ".";

    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        std::string filename = entry.path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;

        std::string date_part = filename.substr(prefix.length());
        if (date_part < cutoff_str) {
            fs::remove(entry.path(), entry_ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          std::vector<spdlog::sink_ptr> sinks) {
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("loradeck", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env() {
    std::string level = DEFAULT_CONSOLE_LEVEL;
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        if (!is_blank(env)) level = env;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // stderr sink (human-readable format)
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(stderr_sink);

    // File sink (JSON format for structured logging); stderr only when the
    // log directory is not writable.
    const std::string log_dir = get_log_dir();
    std::string log_path;
    std::string file_error;
    try {
        fs::create_directories(log_dir);
        cleanup_old_logs(log_dir, get_retention_days());
        log_path = get_log_file_path();
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
        file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        sinks.push_back(file_sink);
    } catch (const fs::filesystem_error& ex) {
        file_error = ex.what();
    } catch (const spdlog::spdlog_ex& ex) {
        file_error = ex.what();
    }

    // Preserve per-sink patterns (stderr human-readable, file JSON).
    init(level, "", std::move(sinks));

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled ({}): {}", log_dir, file_error);
    } else {
        spdlog::debug("Logs initialized: {}", log_path);
    }
}

}  // namespace loradeck::logger
