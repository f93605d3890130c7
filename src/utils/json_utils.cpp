#include "utils/json_utils.h"

#include <cstdint>
#include <fstream>
#include <sstream>

#include "utils/text.h"

namespace loradeck {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        auto j = nlohmann::json::parse(body);
        return j;
    } catch (const std::exception& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path, std::string* error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        if (error) *error = "cannot open " + path.string();
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return parse_json(buffer.str(), error);
}

std::optional<std::string> find_text(const nlohmann::json& j,
                                     std::initializer_list<const char*> path) {
    const nlohmann::json* node = &j;
    for (const char* key : path) {
        if (!node->is_object()) return std::nullopt;
        auto it = node->find(key);
        if (it == node->end()) return std::nullopt;
        node = &(*it);
    }
    if (node->is_string()) return node->get<std::string>();
    if (node->is_number_unsigned()) return std::to_string(node->get<std::uint64_t>());
    if (node->is_number_integer()) return std::to_string(node->get<std::int64_t>());
    if (node->is_number()) return node->dump();
    return std::nullopt;
}

std::vector<std::string> string_array(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object()) return out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (!item.is_string()) continue;
        auto value = item.get<std::string>();
        if (!is_blank(value)) out.push_back(std::move(value));
    }
    return out;
}

}  // namespace loradeck
