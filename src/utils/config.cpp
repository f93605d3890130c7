#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/json_utils.h"
#include "utils/text.h"

namespace loradeck {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path();
    return home / ".loradeck" / "config.json";
}

// ".SafeTensors" and "safetensors" both become ".safetensors".
std::string normalizeExtension(const std::string& ext) {
    std::string out = to_lower_ascii(trim_ascii(ext));
    if (!out.empty() && out.front() != '.') out.insert(out.begin(), '.');
    return out;
}

std::vector<std::string> parseSources(const nlohmann::json& v) {
    std::vector<std::string> out;
    if (v.is_string()) return split_csv(v.get<std::string>());
    if (!v.is_array()) return out;
    for (const auto& item : v) {
        if (item.is_string()) {
            auto path = trim_ascii(item.get<std::string>());
            if (!path.empty()) out.push_back(std::move(path));
            continue;
        }
        if (!item.is_object()) continue;
        auto enabled = item.find("enabled");
        if (enabled != item.end() && enabled->is_boolean() && !enabled->get<bool>()) continue;
        auto path = find_text(item, {"path"});
        if (path && !is_blank(*path)) out.push_back(trim_ascii(*path));
    }
    return out;
}

void applyJson(const nlohmann::json& j, DeckConfig& cfg) {
    if (j.contains("lora_sources")) {
        cfg.lora_sources = parseSources(j.at("lora_sources"));
    }
    if (j.contains("merge_sources") && j.at("merge_sources").is_boolean()) {
        cfg.merge_sources = j.at("merge_sources").get<bool>();
    }
    if (j.contains("merge_variants") && j.at("merge_variants").is_boolean()) {
        cfg.merge_variants = j.at("merge_variants").get<bool>();
    }
    if (j.contains("model_extensions") && j.at("model_extensions").is_array()) {
        std::vector<std::string> exts;
        for (const auto& item : j.at("model_extensions")) {
            if (!item.is_string()) continue;
            auto ext = normalizeExtension(item.get<std::string>());
            if (!ext.empty()) exts.push_back(std::move(ext));
        }
        if (!exts.empty()) cfg.model_extensions = std::move(exts);
    }
}

}  // namespace

std::pair<DeckConfig, std::string> loadDeckConfigWithLog() {
    DeckConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("LORADECK_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    std::error_code ec;
    if (!cfg_path.empty() && std::filesystem::exists(cfg_path, ec)) {
        std::string error;
        auto j = read_json_file(cfg_path, &error);
        if (j && j->is_object()) {
            applyJson(*j, cfg);
            log << "file=" << cfg_path << " ";
            used_file = true;
        } else {
            if (error.empty()) error = "not a JSON object";
            spdlog::warn("Ignoring config file {}: {}", cfg_path.string(), error);
            log << "file_error=" << cfg_path << " ";
        }
    }

    if (auto v = getEnvValue("LORADECK_LORA_SOURCES")) {
        cfg.lora_sources = split_csv(*v);
        log << "env:LORA_SOURCES=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LORADECK_MERGE_SOURCES")) {
        if (auto flag = parse_bool_flag(*v)) {
            cfg.merge_sources = *flag;
            log << "env:MERGE_SOURCES=" << (*flag ? "true" : "false") << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring LORADECK_MERGE_SOURCES={}: not a boolean", *v);
        }
    }
    if (auto v = getEnvValue("LORADECK_MERGE_VARIANTS")) {
        if (auto flag = parse_bool_flag(*v)) {
            cfg.merge_variants = *flag;
            log << "env:MERGE_VARIANTS=" << (*flag ? "true" : "false") << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring LORADECK_MERGE_VARIANTS={}: not a boolean", *v);
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

DeckConfig loadDeckConfig() {
    auto info = loadDeckConfigWithLog();
    return info.first;
}

}  // namespace loradeck
