#include "utils/text.h"

#include <algorithm>
#include <cctype>

namespace loradeck {

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim_ascii(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool equals_ignore_case(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

bool ends_with_ignore_case(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) return false;
    return equals_ignore_case(value.substr(value.size() - suffix.size()), suffix);
}

size_t find_ignore_case(const std::string& haystack, const std::string& needle, size_t from) {
    if (needle.empty() || haystack.size() < needle.size()) return std::string::npos;
    for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < needle.size(); ++j) {
            if (std::tolower(static_cast<unsigned char>(haystack[i + j])) !=
                std::tolower(static_cast<unsigned char>(needle[j]))) {
                match = false;
                break;
            }
        }
        if (match) return i;
    }
    return std::string::npos;
}

std::vector<std::string> split_csv(const std::string& csv) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : csv) {
        if (c == ',') {
            auto token = trim_ascii(cur);
            if (!token.empty()) out.push_back(token);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    auto token = trim_ascii(cur);
    if (!token.empty()) out.push_back(token);
    return out;
}

std::optional<bool> parse_bool_flag(const std::string& value) {
    const auto lower = to_lower_ascii(trim_ascii(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

}  // namespace loradeck
