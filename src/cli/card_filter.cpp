#include "cli/card_filter.h"

#include <algorithm>

#include "utils/text.h"

namespace loradeck {
namespace cli {

namespace {

bool is_separator(char c) { return c == '/' || c == '\\'; }

std::string trim_trailing_separators(std::string path) {
    while (!path.empty() && is_separator(path.back())) path.pop_back();
    return path;
}

bool has_path_prefix(const std::string& path, const std::string& prefix) {
    if (path.size() < prefix.size()) return false;
    if (!equals_ignore_case(path.substr(0, prefix.size()), prefix)) return false;
    return path.size() == prefix.size() || is_separator(path[prefix.size()]);
}

}  // namespace

bool matches_search(const CardEntry& card, const std::string& search) {
    if (is_blank(search)) return true;
    return find_ignore_case(card.model.safetensor_file_name, search) != std::string::npos ||
           find_ignore_case(card.model.version_name, search) != std::string::npos;
}

bool is_under_folder(const CardEntry& card, const std::string& folder) {
    if (is_blank(folder)) return true;
    const auto prefix = trim_trailing_separators(trim_ascii(folder));
    // "/" names the filesystem root.
    if (prefix.empty()) return card.folder_path.has_value();
    if (card.folder_path && has_path_prefix(*card.folder_path, prefix)) return true;
    return has_path_prefix(card.tree_path, prefix);
}

std::vector<CardEntry> filter_cards(std::vector<CardEntry> cards, const CardFilter& filter) {
    cards.erase(std::remove_if(cards.begin(), cards.end(),
                               [&](const CardEntry& card) {
                                   return !is_under_folder(card, filter.folder) ||
                                          !matches_search(card, filter.search);
                               }),
                cards.end());
    return cards;
}

}  // namespace cli
}  // namespace loradeck
