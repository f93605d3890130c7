// json_utils.h - helpers for reading loosely-typed JSON sidecars and config files
#pragma once

#include <filesystem>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace loradeck {

// Parse JSON string; returns std::nullopt on error and fills error message if provided.
std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error = nullptr);

// Read and parse a whole file; std::nullopt when unreadable or malformed.
std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path,
                                             std::string* error = nullptr);

// Follow a key path ({"model", "name"}) and return the value as text.
// Strings are returned as-is, numbers are formatted; anything else is nullopt.
std::optional<std::string> find_text(const nlohmann::json& j,
                                     std::initializer_list<const char*> path);

// String items of an array at `key`; non-strings and blanks are skipped.
std::vector<std::string> string_array(const nlohmann::json& j, const char* key);

}  // namespace loradeck
