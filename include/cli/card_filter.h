// card_filter.h - narrows the card list shown by `loradeck scan`
#pragma once

#include <string>
#include <vector>

#include "variants/variant_merger.h"

namespace loradeck {
namespace cli {

struct CardFilter {
    std::string search;  // Blank: no search
    std::string folder;  // Blank: every folder
};

// Case-insensitive substring match on the selected model's file or version name.
bool matches_search(const CardEntry& card, const std::string& search);

// True when the card's folder path or tree path is `folder` or lies below it
// (case-insensitive, whole path segments only).
bool is_under_folder(const CardEntry& card, const std::string& folder);

// Cards passing both filters, in their original order.
std::vector<CardEntry> filter_cards(std::vector<CardEntry> cards, const CardFilter& filter);

}  // namespace cli
}  // namespace loradeck
