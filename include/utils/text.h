// text.h - ASCII string helpers shared by the classifier, config and scanner
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace loradeck {

std::string to_lower_ascii(std::string value);

std::string trim_ascii(const std::string& value);

// True when the value is empty or whitespace only.
bool is_blank(const std::string& value);

bool equals_ignore_case(const std::string& lhs, const std::string& rhs);

bool ends_with_ignore_case(const std::string& value, const std::string& suffix);

// Case-insensitive find starting at `from`; npos when absent.
size_t find_ignore_case(const std::string& haystack, const std::string& needle, size_t from = 0);

// Split on ',' and drop blank items (items are trimmed).
std::vector<std::string> split_csv(const std::string& csv);

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
std::optional<bool> parse_bool_flag(const std::string& value);

}  // namespace loradeck
